#ifndef WEALTHCALC_IO_PARQUET_WRITER_HPP
#define WEALTHCALC_IO_PARQUET_WRITER_HPP

#include "../simulation.hpp"
#include <string>

namespace wealthcalc {

class ParquetWriter {
public:
    /**
     * Write the final value of every path to a Parquet file.
     *
     * Output schema:
     *   - simulation_id: uint32 (0-indexed, path order)
     *   - final_value: float64
     *
     * @throws std::runtime_error if the result has no final values or the file
     *         cannot be written
     */
    static void write_final_values(const SimulationResult& result, const std::string& filepath);

    /**
     * Write every path point to a Parquet file (long format).
     *
     * Output schema:
     *   - simulation_id: uint32
     *   - year: uint8
     *   - portfolio_value: float64
     *
     * @throws std::runtime_error if the result holds no paths
     *         (SimulationConfig::store_paths was false) or the file cannot be written
     */
    static void write_paths(const SimulationResult& result, const std::string& filepath);
};

} // namespace wealthcalc

#endif // WEALTHCALC_IO_PARQUET_WRITER_HPP
