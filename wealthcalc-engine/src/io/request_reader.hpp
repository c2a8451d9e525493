#ifndef WEALTHCALC_IO_REQUEST_READER_HPP
#define WEALTHCALC_IO_REQUEST_READER_HPP

#include "../simulation.hpp"
#include "../simulation_request.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace wealthcalc {

/**
 * @brief Exception thrown when a request document cannot be read or parsed
 */
class RequestParseError : public std::runtime_error {
public:
    explicit RequestParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A request plus the run settings found next to it
 */
struct RequestDocument {
    SimulationRequest request;
    SimulationConfig config;
};

/**
 * @brief Builds a request from JSON, using make_default_request() for missing fields
 *
 * Recognised fields: id, asset_classes (array), asset_classes_csv (path),
 * initial_investment, time_horizon, num_simulations, enable_drawdown,
 * annual_drawdown, inflation_rate, tax_settings.
 *
 * @param j Parsed JSON object
 * @param base_path File the JSON came from; relative asset_classes_csv paths
 *                  resolve against its directory (empty = working directory)
 * @throws RequestParseError on wrong types or unreadable asset class CSV
 */
SimulationRequest parse_simulation_request(const nlohmann::json& j,
                                           const std::string& base_path = "");

/**
 * @brief Reads the optional "simulation" block into config
 *
 * Fields: seed, mode ("sequential"|"parallel"), threads, timeout_ms,
 * store_paths, detailed_withdrawals. Missing fields keep their current value.
 *
 * @throws RequestParseError on wrong types or unknown mode
 */
void apply_simulation_block(const nlohmann::json& j, SimulationConfig& config);

/**
 * @brief Parses a full request document from a JSON string
 * @throws RequestParseError if JSON is invalid
 */
RequestDocument parse_request_document(const std::string& json_text,
                                       const std::string& base_path = "");

/**
 * @brief Parses a full request document from a JSON file
 * @throws RequestParseError if the file cannot be read or JSON is invalid
 */
RequestDocument load_request_document(const std::string& file_path);

/**
 * @brief Expands ${VAR} and $VAR references from the environment
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a relative path against the directory of base_file
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_file);

} // namespace wealthcalc

#endif // WEALTHCALC_IO_REQUEST_READER_HPP
