#ifndef WEALTHCALC_IO_JSON_WRITER_HPP
#define WEALTHCALC_IO_JSON_WRITER_HPP

#include "../simulation.hpp"
#include <ostream>
#include <string>

namespace wealthcalc {
namespace io {

struct JsonWriteOptions {
    bool pretty_print;
    bool include_paths;         // Write every path (can be large)
    bool include_final_values;  // Write the final value of every path

    JsonWriteOptions();
};

// Currency values are written rounded to cents, returns and probabilities
// to 6 decimals. The result itself keeps full precision.
std::string format_currency(double value);
std::string format_ratio(double value);

// Write a SimulationResult as JSON: run metadata, parameters, statistics,
// withdrawal summary, then optionally final values and paths
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const JsonWriteOptions& options = JsonWriteOptions());

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const JsonWriteOptions& options = JsonWriteOptions());

// Write a failed outcome: {"error": {"kind", "category", "message"}}
void write_simulation_error_json(std::ostream& os, const SimulationError& error,
                                 bool pretty_print = true);

} // namespace io
} // namespace wealthcalc

#endif // WEALTHCALC_IO_JSON_WRITER_HPP
