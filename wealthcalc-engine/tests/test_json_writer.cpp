#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>
#include "io/json_writer.hpp"

using namespace wealthcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

// Small hand-built result with values that need rounding
SimulationResult create_result() {
    SimulationResult result;
    result.request.id = "writer-test";
    result.request.asset_classes = {AssetClass("Stocks", 0.08, 0.15, -0.40, 0.35, 1.0)};
    result.request.initial_investment = 1000000.0;
    result.request.time_horizon = 2;
    result.request.num_simulations = 2;
    result.request.enable_drawdown = true;
    result.request.annual_drawdown = 50000.0;
    result.request.inflation_rate = 0.03;
    result.seed = 42;
    result.mode = ExecutionMode::Parallel;
    result.threads_used = 4;

    SimulationPath a;
    a.points = {{0, 1000000.0}, {1, 1012345.678}, {2, 1100000.004}};
    SimulationPath b;
    b.points = {{0, 1000000.0}, {1, 0.0}, {2, 0.0}};
    b.final_state = PathState::Depleted;
    b.depletion_year = 1;
    result.paths = {a, b};
    result.final_values = {1100000.004, 0.0};

    for (size_t i = 0; i < result.statistics.percentiles.size(); ++i) {
        result.statistics.percentiles[i].final_value = 123456.789 * static_cast<double>(i + 1);
        result.statistics.percentiles[i].total_return = 0.1234567891;
    }
    result.statistics.probability_of_depletion = 0.5;
    result.statistics.simulation_count = 2;
    result.withdrawals.depleted_paths = 1;
    result.withdrawals.mean_depletion_year = 1.0;
    return result;
}

json write_and_parse(const SimulationResult& result, const io::JsonWriteOptions& options) {
    std::ostringstream oss;
    io::write_simulation_result_json(oss, result, options);
    return json::parse(oss.str());
}

} // anonymous namespace

TEST_CASE("Currency and ratio formatting", "[json_writer]") {
    REQUIRE(io::format_currency(1234.5678) == "1234.57");
    REQUIRE(io::format_currency(0.004) == "0.00");
    REQUIRE(io::format_currency(-0.004) == "0.00");
    REQUIRE(io::format_currency(-12.346) == "-12.35");
    REQUIRE(io::format_ratio(0.1234567891) == "0.123457");
    REQUIRE(io::format_ratio(-1.0) == "-1.000000");
    REQUIRE(io::format_currency(std::numeric_limits<double>::infinity()) == "null");
    REQUIRE(io::format_ratio(std::nan("")) == "null");
}

TEST_CASE("Result JSON is valid and complete", "[json_writer]") {
    json j = write_and_parse(create_result(), io::JsonWriteOptions());

    REQUIRE(j["id"] == "writer-test");
    REQUIRE(j["mode"] == "parallel");
    REQUIRE(j["seed"] == 42);
    REQUIRE(j["threads"] == 4);

    const json& params = j["parameters"];
    REQUIRE(params["asset_classes"].size() == 1);
    REQUIRE(params["asset_classes"][0]["name"] == "Stocks");
    REQUIRE(params["time_horizon"] == 2);
    REQUIRE(params["enable_drawdown"] == true);
    REQUIRE(params["tax_settings"]["account_type"] == "taxable");

    const json& stats = j["statistics"];
    REQUIRE(stats["percentiles"].size() == 7);
    REQUIRE(stats["percentiles"][0]["level"] == 5);
    REQUIRE(stats["percentiles"][6]["level"] == 95);
    REQUIRE_THAT(stats["probability_of_depletion"].get<double>(), WithinRel(0.5, 1e-12));
    REQUIRE(stats["simulation_count"] == 2);

    REQUIRE(j["withdrawals"]["depleted_paths"] == 1);
    REQUIRE(j["final_values"].size() == 2);
    REQUIRE(j["simulation_paths"].size() == 2);
    REQUIRE(j["simulation_paths"][1].size() == 3);
    REQUIRE(j["simulation_paths"][1][2]["year"] == 2);
}

TEST_CASE("Values are rounded only in the output", "[json_writer]") {
    SimulationResult result = create_result();
    std::ostringstream oss;
    io::write_simulation_result_json(oss, result);
    std::string text = oss.str();

    REQUIRE_THAT(text, ContainsSubstring("1012345.68"));
    REQUIRE_THAT(text, ContainsSubstring("1100000.00"));
    REQUIRE_THAT(text, ContainsSubstring("123456.79"));
    REQUIRE_THAT(text, ContainsSubstring("0.123457"));

    // The result keeps full precision
    REQUIRE(result.final_values[0] == 1100000.004);
}

TEST_CASE("Output options drop large sections", "[json_writer]") {
    io::JsonWriteOptions options;
    options.include_paths = false;
    options.include_final_values = false;

    json j = write_and_parse(create_result(), options);

    REQUIRE_FALSE(j.contains("simulation_paths"));
    REQUIRE_FALSE(j.contains("final_values"));
    REQUIRE(j.contains("withdrawals"));

    options.include_final_values = true;
    j = write_and_parse(create_result(), options);
    REQUIRE(j.contains("final_values"));
    REQUIRE_FALSE(j.contains("simulation_paths"));
}

TEST_CASE("Compact output is a single line", "[json_writer]") {
    io::JsonWriteOptions options;
    options.pretty_print = false;

    std::ostringstream oss;
    io::write_simulation_result_json(oss, create_result(), options);
    std::string text = oss.str();

    REQUIRE(text.find('\n') == std::string::npos);
    REQUIRE_NOTHROW(json::parse(text));
}

TEST_CASE("Empty paths and final values still produce valid JSON", "[json_writer]") {
    SimulationResult result = create_result();
    result.paths.clear();
    result.final_values.clear();

    json j = write_and_parse(result, io::JsonWriteOptions());
    REQUIRE(j["simulation_paths"].empty());
    REQUIRE(j["final_values"].empty());
}

TEST_CASE("Result JSON to file", "[json_writer]") {
    std::string path = (std::filesystem::temp_directory_path() / "wealthcalc_writer_test.json").string();
    io::write_simulation_result_json(path, create_result());

    std::ifstream in(path);
    json j = json::parse(in);
    REQUIRE(j["id"] == "writer-test");
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(io::write_simulation_result_json("/nonexistent/dir/out.json", create_result()),
                      std::runtime_error);
}

TEST_CASE("Error JSON carries kind, category and message", "[json_writer][error]") {
    std::ostringstream oss;
    io::write_simulation_error_json(oss,
        SimulationError(SimulationErrorKind::TooFewSimulations, "Minimum 5000 simulations required"),
        false);

    json j = json::parse(oss.str());
    REQUIRE(j["error"]["kind"] == "TooFewSimulations");
    REQUIRE(j["error"]["category"] == "validation");
    REQUIRE(j["error"]["message"] == "Minimum 5000 simulations required");
}
