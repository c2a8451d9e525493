#include "request_reader.hpp"
#include "json_codec.hpp"
#include "../defaults.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace wealthcalc {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos < result.size() && result[pos] == '}') {
                pos++;
            } else {
                // Unterminated ${...}: leave the text alone
                pos = start + 1;
                continue;
            }
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_file) {
    fs::path p(path);

    if (p.is_absolute() || base_file.empty()) {
        return path;
    }

    fs::path base_dir = fs::path(base_file).parent_path();
    return (base_dir / p).string();
}

SimulationRequest parse_simulation_request(const json& j, const std::string& base_path) {
    if (!j.is_object()) {
        throw RequestParseError("Simulation request must be a JSON object");
    }

    SimulationRequest request = make_default_request();

    try {
        request.id = j.value("id", request.id);

        if (j.contains("asset_classes") && j.contains("asset_classes_csv")) {
            throw RequestParseError("Use either asset_classes or asset_classes_csv, not both");
        }
        if (j.contains("asset_classes")) {
            request.asset_classes = j["asset_classes"].get<std::vector<AssetClass>>();
        } else if (j.contains("asset_classes_csv")) {
            std::string csv_path = resolve_relative_path(
                expand_environment_variables(j["asset_classes_csv"].get<std::string>()), base_path);
            request.asset_classes = AssetClassSet::load_from_csv(csv_path).assets();
        }

        request.initial_investment = j.value("initial_investment", request.initial_investment);
        request.time_horizon = j.value("time_horizon", request.time_horizon);
        request.num_simulations = j.value("num_simulations", request.num_simulations);
        request.enable_drawdown = j.value("enable_drawdown", request.enable_drawdown);
        request.annual_drawdown = j.value("annual_drawdown", request.annual_drawdown);
        request.inflation_rate = j.value("inflation_rate", request.inflation_rate);

        if (j.contains("tax_settings")) {
            request.tax_settings = j["tax_settings"].get<TaxSettings>();
        }
    } catch (const json::exception& e) {
        throw RequestParseError("Invalid simulation request: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw RequestParseError("Invalid simulation request: " + std::string(e.what()));
    } catch (const RequestParseError&) {
        throw;
    } catch (const std::runtime_error& e) {
        // Asset class CSV could not be read
        throw RequestParseError(e.what());
    }

    return request;
}

void apply_simulation_block(const json& j, SimulationConfig& config) {
    if (!j.contains("simulation")) {
        return;
    }

    const json& sim = j["simulation"];
    if (!sim.is_object()) {
        throw RequestParseError("\"simulation\" must be a JSON object");
    }

    try {
        config.seed = sim.value("seed", config.seed);
        if (sim.contains("mode")) {
            config.mode = execution_mode_from_string(sim["mode"].get<std::string>());
        }
        config.num_threads = sim.value("threads", config.num_threads);
        config.timeout_ms = sim.value("timeout_ms", config.timeout_ms);
        config.store_paths = sim.value("store_paths", config.store_paths);
        config.detailed_withdrawals = sim.value("detailed_withdrawals", config.detailed_withdrawals);
    } catch (const json::exception& e) {
        throw RequestParseError("Invalid simulation block: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw RequestParseError("Invalid simulation block: " + std::string(e.what()));
    }
}

RequestDocument parse_request_document(const std::string& json_text, const std::string& base_path) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw RequestParseError("Failed to parse JSON: " + std::string(e.what()));
    }

    RequestDocument doc;
    doc.request = parse_simulation_request(j, base_path);
    apply_simulation_block(j, doc.config);
    return doc;
}

RequestDocument load_request_document(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw RequestParseError("Failed to open request file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_request_document(buffer.str(), file_path);
}

} // namespace wealthcalc
