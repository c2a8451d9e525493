#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

CommandResult run_cli(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "wealthcalc_test_stdout.txt";
    std::string stderr_file = "wealthcalc_test_stderr.txt";

    std::string full_cmd = std::string("\"") + WEALTHCALC_CLI_PATH + "\" " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns different values on different platforms)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

std::string example(const std::string& name) {
    return std::string(WEALTHCALC_EXAMPLES_DIR) + "/" + name;
}

// Small, fast batch
const std::string QUICK = "--simulations 5000 --horizon 5 --no-paths --compact ";

} // anonymous namespace

// ============================================================================
// Usage
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_cli("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--request") != std::string::npos);
    REQUIRE(result.stderr_output.find("--drawdown") != std::string::npos);
    REQUIRE(result.stderr_output.find("--account-type") != std::string::npos);
    REQUIRE(result.stderr_output.find("--mode") != std::string::npos);
    REQUIRE(result.stderr_output.find("--history-file") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_cli("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI unknown option fails", "[cli]") {
    auto result = run_cli("--unknown-option");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
}

TEST_CASE("CLI argument errors", "[cli]") {
    SECTION("Not a number") {
        auto result = run_cli("--horizon ten");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Missing request file") {
        auto result = run_cli("--request nonexistent.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("not found") != std::string::npos);
    }

    SECTION("Unknown log level") {
        auto result = run_cli(QUICK + "--log-level LOUD");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Unknown account type") {
        auto result = run_cli(QUICK + "--account-type roth");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Unknown mode") {
        auto result = run_cli(QUICK + "--mode gpu");
        REQUIRE(result.exit_code == 1);
    }
}

TEST_CASE("CLI prints the default configuration", "[cli]") {
    auto result = run_cli("--defaults");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["asset_classes"].size() == 4);
    REQUIRE(j["asset_classes"][0]["name"] == "Stocks");
    REQUIRE(j["initial_investment"] == 5000000.0);
    REQUIRE(j["time_horizon"] == 10);
    REQUIRE(j["num_simulations"] == 10000);
}

// ============================================================================
// Simulation runs
// ============================================================================

TEST_CASE("CLI simulation runs successfully", "[cli][integration]") {
    auto result = run_cli(QUICK + "--id cli-run");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["id"] == "cli-run");
    REQUIRE(j["mode"] == "sequential");
    REQUIRE(j["seed"] == 42);
    REQUIRE(j["parameters"]["time_horizon"] == 5);
    REQUIRE(j["statistics"]["percentiles"].size() == 7);
    REQUIRE(j["statistics"]["simulation_count"] == 5000);
    REQUIRE(j["final_values"].size() == 5000);
    REQUIRE_FALSE(j.contains("simulation_paths"));

    // Logs go to stderr, the result to stdout
    REQUIRE(result.stderr_output.find("simulation_complete") != std::string::npos);
}

TEST_CASE("CLI with paths", "[cli][integration]") {
    auto result = run_cli("--simulations 5000 --horizon 3 --compact --log-level ERROR");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["simulation_paths"].size() == 5000);
    REQUIRE(j["simulation_paths"][0].size() == 4);
    REQUIRE(j["simulation_paths"][0][0]["portfolio_value"] == 5000000.0);
    REQUIRE(result.stderr_output.empty());
}

TEST_CASE("CLI output to file works", "[cli][integration]") {
    std::string output = "wealthcalc_cli_output.json";
    std::filesystem::remove(output);

    auto result = run_cli(QUICK + "--output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());
    REQUIRE(std::filesystem::exists(output));

    json j = json::parse(read_file(output));
    REQUIRE(j["statistics"]["simulation_count"] == 5000);
    std::filesystem::remove(output);
}

TEST_CASE("CLI seed reproducibility", "[cli][integration]") {
    auto first = run_cli(QUICK + "--seed 7 --drawdown 300000");
    auto second = run_cli(QUICK + "--seed 7 --drawdown 300000");
    auto other = run_cli(QUICK + "--seed 8 --drawdown 300000");
    REQUIRE(first.exit_code == 0);
    REQUIRE(second.exit_code == 0);
    REQUIRE(other.exit_code == 0);

    json a = json::parse(first.stdout_output);
    json b = json::parse(second.stdout_output);
    json c = json::parse(other.stdout_output);
    REQUIRE(a["statistics"] == b["statistics"]);
    REQUIRE(a["final_values"] == b["final_values"]);
    REQUIRE(a["final_values"] != c["final_values"]);
}

TEST_CASE("CLI parallel mode is independent of the thread count", "[cli][integration][parallel]") {
    auto one = run_cli(QUICK + "--mode parallel --threads 1");
    auto three = run_cli(QUICK + "--mode parallel --threads 3");
    REQUIRE(one.exit_code == 0);
    REQUIRE(three.exit_code == 0);

    json a = json::parse(one.stdout_output);
    json b = json::parse(three.stdout_output);
    REQUIRE(a["mode"] == "parallel");
    REQUIRE(a["final_values"] == b["final_values"]);
}

TEST_CASE("CLI request file with overrides", "[cli][integration]") {
    auto result = run_cli("--request " + example("retirement_request.json") + " " + QUICK +
                          "--mode sequential");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["id"] == "retirement-30y");
    REQUIRE(j["seed"] == 2024);
    REQUIRE(j["mode"] == "sequential");
    REQUIRE(j["parameters"]["time_horizon"] == 5);
    REQUIRE(j["parameters"]["asset_classes"].size() == 3);
    REQUIRE(j["parameters"]["tax_settings"]["account_type"] == "tax_deferred");
    REQUIRE(j["withdrawals"]["mean_gross_withdrawn"].get<double>() > 0.0);
}

TEST_CASE("CLI asset classes from CSV", "[cli][integration]") {
    auto result = run_cli(QUICK + "--assets " + example("asset_classes.csv"));
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["parameters"]["asset_classes"][0]["name"] == "US Equity");
}

TEST_CASE("CLI taxes reduce the withdrawal left to the investor", "[cli][integration][tax]") {
    auto result = run_cli(QUICK + "--drawdown 100000 --account-type tax_deferred "
                          "--income-rate 0.22 --state-rate 0 --inflation 0");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    double gross = j["withdrawals"]["mean_gross_withdrawn"].get<double>();
    double net = j["withdrawals"]["mean_net_withdrawn"].get<double>();
    // Five years of 128,205.13 gross for 100,000 net
    REQUIRE_THAT(gross, Catch::Matchers::WithinAbs(5 * 128205.13, 0.1));
    REQUIRE_THAT(net, Catch::Matchers::WithinAbs(500000.0, 0.1));
}

// ============================================================================
// Rejections and cancellation
// ============================================================================

TEST_CASE("CLI validation errors", "[cli]") {
    SECTION("Too few simulations") {
        auto result = run_cli("--simulations 1000 --compact");
        REQUIRE(result.exit_code == 2);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["error"]["kind"] == "TooFewSimulations");
        REQUIRE(j["error"]["category"] == "validation");
    }

    SECTION("Horizon too long") {
        auto result = run_cli("--horizon 60 --compact");
        REQUIRE(result.exit_code == 2);
        REQUIRE(json::parse(result.stdout_output)["error"]["kind"] == "TimeHorizonTooLong");
    }

    SECTION("Horizon too short") {
        auto result = run_cli("--horizon 0 --compact");
        REQUIRE(result.exit_code == 2);
        REQUIRE(json::parse(result.stdout_output)["error"]["kind"] == "TimeHorizonTooShort");
    }

    SECTION("Tax-deferred rate of 100%") {
        auto result = run_cli(QUICK + "--drawdown 100000 --account-type tax_deferred "
                              "--income-rate 0.9 --state-rate 0.1");
        REQUIRE(result.exit_code == 2);
        json j = json::parse(result.stdout_output);
        REQUIRE(j["error"]["kind"] == "TaxRateTooHigh");
        REQUIRE(j["error"]["category"] == "configuration");
    }
}

TEST_CASE("CLI timeout exits with status 3", "[cli][cancel]") {
    auto result = run_cli("--simulations 1000000 --horizon 50 --no-paths --compact --timeout-ms 1");
    REQUIRE(result.exit_code == 3);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["error"]["kind"] == "Cancelled");
    REQUIRE(result.stderr_output.find("simulation_cancelled") != std::string::npos);
}

// ============================================================================
// History and logging
// ============================================================================

TEST_CASE("CLI appends to the history file", "[cli][history]") {
    std::string history = "wealthcalc_cli_history.jsonl";
    std::filesystem::remove(history);

    REQUIRE(run_cli(QUICK + "--id first --history-file " + history).exit_code == 0);
    REQUIRE(run_cli(QUICK + "--id second --history-file " + history).exit_code == 0);
    REQUIRE(run_cli(QUICK + "--id third --history-file " + history + " --history-size 2").exit_code == 0);

    std::istringstream lines(read_file(history));
    std::string line;
    std::vector<std::string> ids;
    while (std::getline(lines, line)) {
        ids.push_back(json::parse(line)["id"].get<std::string>());
    }
    REQUIRE(ids.size() == 2);
    REQUIRE(ids[0] == "third");
    REQUIRE(ids[1] == "second");

    std::filesystem::remove(history);
}

TEST_CASE("CLI plain text logs to a file", "[cli][logging]") {
    std::string log_file = "wealthcalc_cli.log";
    std::filesystem::remove(log_file);

    auto result = run_cli(QUICK + "--log-plain --log-file " + log_file);
    REQUIRE(result.exit_code == 0);

    std::string log = read_file(log_file);
    REQUIRE(log.find("[INFO] Starting simulation batch") != std::string::npos);
    REQUIRE(log.find("[INFO] Simulation batch completed") != std::string::npos);
    REQUIRE(result.stderr_output.find("[INFO]") != std::string::npos);

    std::filesystem::remove(log_file);
}
