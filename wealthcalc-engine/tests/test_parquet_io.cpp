#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "defaults.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "io/parquet_writer.hpp"
#include <filesystem>

using namespace wealthcalc;

namespace {

std::shared_ptr<const SimulationResult> run_small_batch(bool store_paths) {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    SimulationRequest request = make_default_request();
    request.num_simulations = MIN_SIMULATIONS;
    request.time_horizon = 5;

    SimulationConfig config;
    config.store_paths = store_paths;
    SimulationOutcome outcome = simulate(request, config);
    REQUIRE(outcome.ok());
    return outcome.result;
}

} // anonymous namespace

#ifdef HAVE_ARROW

TEST_CASE("Parquet I/O - final values export", "[parquet][io]") {
    SECTION("write_final_values requires final values") {
        SimulationResult empty_result;

        REQUIRE_THROWS_WITH(
            ParquetWriter::write_final_values(empty_result, "final_values.parquet"),
            Catch::Matchers::ContainsSubstring("no final values")
        );
    }

    SECTION("write_final_values creates a Parquet file") {
        auto result = run_small_batch(false);
        std::string test_output = "test_final_values.parquet";
        if (std::filesystem::exists(test_output)) {
            std::filesystem::remove(test_output);
        }

        REQUIRE_NOTHROW(ParquetWriter::write_final_values(*result, test_output));
        REQUIRE(std::filesystem::exists(test_output));
        // 5000 doubles do not compress below a few kilobytes
        REQUIRE(std::filesystem::file_size(test_output) > 1000);

        std::filesystem::remove(test_output);
    }
}

TEST_CASE("Parquet I/O - paths export", "[parquet][io]") {
    SECTION("write_paths requires stored paths") {
        auto result = run_small_batch(false);

        REQUIRE_THROWS_WITH(
            ParquetWriter::write_paths(*result, "paths.parquet"),
            Catch::Matchers::ContainsSubstring("store_paths")
        );
    }

    SECTION("write_paths creates a Parquet file") {
        auto result = run_small_batch(true);
        std::string test_output = "test_paths.parquet";
        if (std::filesystem::exists(test_output)) {
            std::filesystem::remove(test_output);
        }

        REQUIRE_NOTHROW(ParquetWriter::write_paths(*result, test_output));
        REQUIRE(std::filesystem::exists(test_output));
        REQUIRE(std::filesystem::file_size(test_output) > 1000);

        std::filesystem::remove(test_output);
    }

    SECTION("Unwritable location throws") {
        auto result = run_small_batch(true);
        REQUIRE_THROWS_AS(ParquetWriter::write_paths(*result, "/nonexistent/dir/paths.parquet"),
                          std::runtime_error);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - Not available without Arrow", "[parquet]") {
    auto result = run_small_batch(true);

    SECTION("write_final_values throws without Arrow") {
        REQUIRE_THROWS_WITH(ParquetWriter::write_final_values(*result, "test.parquet"),
                            Catch::Matchers::ContainsSubstring("Apache Arrow not available"));
    }

    SECTION("write_paths throws without Arrow") {
        REQUIRE_THROWS_AS(ParquetWriter::write_paths(*result, "test.parquet"), std::runtime_error);
    }
}

#endif // HAVE_ARROW
