#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include "asset_class.hpp"
#include "defaults.hpp"
#include "logger.hpp"
#include "result_history.hpp"
#include "simulation.hpp"
#include "simulation_request.hpp"
#include "io/json_codec.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/request_reader.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE_OR_IO = 1;
constexpr int EXIT_REJECTED = 2;
constexpr int EXIT_CANCELLED = 3;

// Flags left unset keep the value from --request (or the defaults)
struct CLIArgs {
    std::string request_path;
    std::string assets_path;
    std::optional<std::string> id;
    std::optional<double> initial_investment;
    std::optional<int> time_horizon;
    std::optional<int64_t> num_simulations;
    std::optional<double> annual_drawdown;
    std::optional<double> inflation_rate;
    std::optional<std::string> account_type;
    std::optional<double> capital_gains_rate;
    std::optional<double> income_rate;
    std::optional<double> state_rate;
    std::optional<uint64_t> seed;
    std::optional<std::string> mode;
    std::optional<int> threads;
    std::optional<int64_t> timeout_ms;
    bool no_paths = false;
    bool detailed_withdrawals = false;
    std::string output_path;
    bool compact = false;
    std::string parquet_paths;
    std::string parquet_final_values;
    std::string history_file;
    size_t history_size = wealthcalc::ResultHistory::DEFAULT_CAPACITY;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_plain = false;
    bool defaults = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "WealthCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Request options:\n";
    std::cerr << "  --request <path>            JSON request file (missing fields use the defaults)\n";
    std::cerr << "  --assets <path>             CSV file with asset classes\n";
    std::cerr << "                              (name,median_return,std_deviation,min_return,max_return,allocation)\n";
    std::cerr << "  --id <text>                 Request id reported in the output and history\n";
    std::cerr << "  --initial <amount>          Initial investment (default: 5000000)\n";
    std::cerr << "  --horizon <years>           Time horizon, 1-50 years (default: 10)\n";
    std::cerr << "  --simulations <count>       Number of paths, at least 5000 (default: 10000)\n";
    std::cerr << "  --drawdown <amount>         Enable an annual net withdrawal of <amount>\n";
    std::cerr << "  --inflation <rate>          Annual withdrawal indexation (default: 0.03)\n\n";
    std::cerr << "Tax options:\n";
    std::cerr << "  --account-type <type>       taxable, tax_deferred or tax_free (default: taxable)\n";
    std::cerr << "  --capital-gains-rate <r>    Capital gains tax rate (default: 0.15)\n";
    std::cerr << "  --income-rate <r>           Ordinary income tax rate (default: 0.22)\n";
    std::cerr << "  --state-rate <r>            State tax rate (default: 0.0)\n\n";
    std::cerr << "Execution options:\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: 42)\n";
    std::cerr << "  --mode <mode>               sequential or parallel (default: sequential)\n";
    std::cerr << "  --threads <count>           Threads in parallel mode (default: all cores)\n";
    std::cerr << "  --timeout-ms <ms>           Stop the batch after <ms> milliseconds\n";
    std::cerr << "  --no-paths                  Keep only final values (smaller output)\n";
    std::cerr << "  --detailed-withdrawals      Record the per-year withdrawal ledger of each path\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Compact JSON output\n";
    std::cerr << "  --parquet-paths <path>      Write every path to a Parquet file\n";
    std::cerr << "  --parquet-final-values <p>  Write final values to a Parquet file\n";
    std::cerr << "  --history-file <path>       Append the result summary to a history file\n";
    std::cerr << "  --history-size <count>      Entries kept in the history file (default: 10)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to <path>\n";
    std::cerr << "  --log-plain                 Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --defaults                  Print the default asset configuration and exit\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 bad arguments or I/O error,\n";
    std::cerr << "            2 rejected request, 3 cancelled or timed out\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Default portfolio with a withdrawal:\n";
    std::cerr << "     " << program_name << " --drawdown 200000 --horizon 30 --no-paths\n\n";
    std::cerr << "  2. Request file in parallel mode:\n";
    std::cerr << "     " << program_name << " --request examples/retirement_request.json \\\n";
    std::cerr << "         --mode parallel --threads 8 --output result.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--defaults") {
            args.defaults = true;
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--assets" && i + 1 < argc) {
            args.assets_path = argv[++i];
        } else if (arg == "--id" && i + 1 < argc) {
            args.id = argv[++i];
        } else if (arg == "--initial" && i + 1 < argc) {
            args.initial_investment = std::stod(argv[++i]);
        } else if (arg == "--horizon" && i + 1 < argc) {
            args.time_horizon = std::stoi(argv[++i]);
        } else if (arg == "--simulations" && i + 1 < argc) {
            args.num_simulations = std::stoll(argv[++i]);
        } else if (arg == "--drawdown" && i + 1 < argc) {
            args.annual_drawdown = std::stod(argv[++i]);
        } else if (arg == "--inflation" && i + 1 < argc) {
            args.inflation_rate = std::stod(argv[++i]);
        } else if (arg == "--account-type" && i + 1 < argc) {
            args.account_type = argv[++i];
        } else if (arg == "--capital-gains-rate" && i + 1 < argc) {
            args.capital_gains_rate = std::stod(argv[++i]);
        } else if (arg == "--income-rate" && i + 1 < argc) {
            args.income_rate = std::stod(argv[++i]);
        } else if (arg == "--state-rate" && i + 1 < argc) {
            args.state_rate = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = std::stoull(argv[++i]);
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            args.timeout_ms = std::stoll(argv[++i]);
        } else if (arg == "--no-paths") {
            args.no_paths = true;
        } else if (arg == "--detailed-withdrawals") {
            args.detailed_withdrawals = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "--parquet-paths" && i + 1 < argc) {
            args.parquet_paths = argv[++i];
        } else if (arg == "--parquet-final-values" && i + 1 < argc) {
            args.parquet_final_values = argv[++i];
        } else if (arg == "--history-file" && i + 1 < argc) {
            args.history_file = argv[++i];
        } else if (arg == "--history-size" && i + 1 < argc) {
            args.history_size = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-plain") {
            args.log_plain = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.request_path.empty() && !std::ifstream(args.request_path).good()) {
        std::cerr << "Error: Request file not found: " << args.request_path << "\n";
        valid = false;
    }
    if (!args.assets_path.empty() && !std::ifstream(args.assets_path).good()) {
        std::cerr << "Error: Asset class file not found: " << args.assets_path << "\n";
        valid = false;
    }
    if (args.threads && *args.threads < 0) {
        std::cerr << "Error: --threads must not be negative\n";
        valid = false;
    }
    if (args.timeout_ms && *args.timeout_ms < 0) {
        std::cerr << "Error: --timeout-ms must not be negative\n";
        valid = false;
    }
    if (args.history_size == 0) {
        std::cerr << "Error: --history-size must be at least 1\n";
        valid = false;
    }
    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: Unknown log level: " << args.log_level << "\n";
        valid = false;
    }
    if (args.no_paths && !args.parquet_paths.empty()) {
        std::cerr << "Error: --parquet-paths needs the paths, drop --no-paths\n";
        valid = false;
    }

    return valid;
}

void print_defaults() {
    wealthcalc::DefaultAssetConfig defaults = wealthcalc::get_default_asset_classes();
    json j = {
        {"asset_classes", defaults.asset_classes},
        {"initial_investment", defaults.default_initial_investment},
        {"time_horizon", defaults.default_time_horizon},
        {"num_simulations", defaults.default_num_simulations}
    };
    std::cout << j.dump(2) << "\n";
}

// Explicit flags win over the request file
void apply_overrides(const CLIArgs& args, wealthcalc::RequestDocument& doc) {
    wealthcalc::SimulationRequest& request = doc.request;
    wealthcalc::SimulationConfig& config = doc.config;

    if (!args.assets_path.empty()) {
        request.asset_classes = wealthcalc::AssetClassSet::load_from_csv(args.assets_path).assets();
    }
    if (args.id) request.id = *args.id;
    if (args.initial_investment) request.initial_investment = *args.initial_investment;
    if (args.time_horizon) request.time_horizon = *args.time_horizon;
    if (args.num_simulations) request.num_simulations = *args.num_simulations;
    if (args.annual_drawdown) {
        request.enable_drawdown = true;
        request.annual_drawdown = *args.annual_drawdown;
    }
    if (args.inflation_rate) request.inflation_rate = *args.inflation_rate;
    if (args.account_type) {
        request.tax_settings.account_type = wealthcalc::account_type_from_string(*args.account_type);
    }
    if (args.capital_gains_rate) request.tax_settings.capital_gains_tax_rate = *args.capital_gains_rate;
    if (args.income_rate) request.tax_settings.ordinary_income_tax_rate = *args.income_rate;
    if (args.state_rate) request.tax_settings.state_tax_rate = *args.state_rate;

    if (args.seed) config.seed = *args.seed;
    if (args.mode) config.mode = wealthcalc::execution_mode_from_string(*args.mode);
    if (args.threads) config.num_threads = *args.threads;
    if (args.timeout_ms) config.timeout_ms = *args.timeout_ms;
    if (args.no_paths) config.store_paths = false;
    if (args.detailed_withdrawals) config.detailed_withdrawals = true;
}

int exit_code_for(const wealthcalc::SimulationError& error) {
    switch (error.category()) {
        case wealthcalc::ErrorCategory::Validation:
        case wealthcalc::ErrorCategory::Configuration:
            return EXIT_REJECTED;
        case wealthcalc::ErrorCategory::Cancelled:
            return EXIT_CANCELLED;
        case wealthcalc::ErrorCategory::Internal:
        default:
            return EXIT_USAGE_OR_IO;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return EXIT_USAGE_OR_IO;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return EXIT_USAGE_OR_IO;
    }

    if (args.help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    if (args.defaults) {
        print_defaults();
        return EXIT_OK;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_USAGE_OR_IO;
    }

    wealthcalc::LoggerConfig log_config;
    log_config.min_level = wealthcalc::string_to_level(args.log_level);
    log_config.enable_json = !args.log_plain;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    wealthcalc::Logger& logger = wealthcalc::Logger::get_instance();
    logger.configure(log_config);

    try {
        wealthcalc::RequestDocument doc;
        if (!args.request_path.empty()) {
            doc = wealthcalc::load_request_document(args.request_path);
        } else {
            doc.request = wealthcalc::make_default_request();
        }
        apply_overrides(args, doc);

        wealthcalc::SimulationOutcome outcome = wealthcalc::simulate(doc.request, doc.config);

        if (!outcome.ok()) {
            const wealthcalc::SimulationError& error = *outcome.error;
            wealthcalc::io::write_simulation_error_json(std::cout, error, !args.compact);
            logger.flush();
            return exit_code_for(error);
        }

        const wealthcalc::SimulationResult& result = *outcome.result;

        wealthcalc::io::JsonWriteOptions options;
        options.pretty_print = !args.compact;
        options.include_paths = doc.config.store_paths;

        if (args.output_path.empty()) {
            wealthcalc::io::write_simulation_result_json(std::cout, result, options);
        } else {
            wealthcalc::io::write_simulation_result_json(args.output_path, result, options);
            logger.log_info("Output written", {{"path", args.output_path}});
        }

        if (!args.parquet_final_values.empty()) {
            wealthcalc::ParquetWriter::write_final_values(result, args.parquet_final_values);
            logger.log_info("Parquet final values written", {{"path", args.parquet_final_values}});
        }
        if (!args.parquet_paths.empty()) {
            wealthcalc::ParquetWriter::write_paths(result, args.parquet_paths);
            logger.log_info("Parquet paths written", {{"path", args.parquet_paths}});
        }

        if (!args.history_file.empty()) {
            wealthcalc::ResultHistory history(args.history_size, args.history_file);
            history.record(outcome.result);
        }

        logger.flush();
        return EXIT_OK;
    } catch (const std::exception& e) {
        logger.log_error(wealthcalc::LogContext(), e.what());
        logger.flush();
        return EXIT_USAGE_OR_IO;
    }
}
