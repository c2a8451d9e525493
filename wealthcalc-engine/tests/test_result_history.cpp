#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "defaults.hpp"
#include "logger.hpp"
#include "result_history.hpp"

using namespace wealthcalc;
using Catch::Matchers::WithinRel;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const SimulationResult> create_result(const std::string& id, double median) {
    auto result = std::make_shared<SimulationResult>();
    result->request = make_default_request();
    result->request.id = id;
    result->statistics.percentiles[3].final_value = median;
    result->statistics.simulation_count = 10000;
    result->statistics.initial_investment = result->request.initial_investment;
    return result;
}

std::string history_path(const std::string& name) {
    fs::path p = fs::temp_directory_path() / ("wealthcalc_history_" + name + ".jsonl");
    fs::remove(p);
    return p.string();
}

} // anonymous namespace

TEST_CASE("History keeps newest entries first", "[history]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    ResultHistory history;

    REQUIRE(history.capacity() == 10);
    REQUIRE(history.size() == 0);

    history.record(create_result("a", 1.0));
    history.record(create_result("b", 2.0));
    history.record(create_result("c", 3.0));

    auto entries = history.recent();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].id == "c");
    REQUIRE(entries[1].id == "b");
    REQUIRE(entries[2].id == "a");
    REQUIRE(entries[0].statistics.median().final_value == 3.0);
    REQUIRE_FALSE(entries[0].timestamp.empty());

    REQUIRE(history.recent(2).size() == 2);
    REQUIRE(history.recent(2)[1].id == "b");
}

TEST_CASE("History drops the oldest entry past capacity", "[history]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    ResultHistory history(3);

    for (int i = 1; i <= 5; ++i) {
        history.record(create_result("run-" + std::to_string(i), i));
    }

    auto entries = history.recent();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].id == "run-5");
    REQUIRE(entries[2].id == "run-3");
}

TEST_CASE("History generates ids for anonymous requests", "[history]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    ResultHistory history;

    std::string first = history.record(create_result("", 1.0));
    std::string second = history.record(create_result("", 2.0));
    std::string named = history.record(create_result("named", 3.0));

    REQUIRE_FALSE(first.empty());
    REQUIRE(first != second);
    REQUIRE(named == "named");
}

TEST_CASE("History rejects bad arguments", "[history][error]") {
    REQUIRE_THROWS_AS(ResultHistory(0), std::invalid_argument);

    ResultHistory history;
    REQUIRE_THROWS_AS(history.record(nullptr), std::invalid_argument);
}

TEST_CASE("History clear", "[history]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    ResultHistory history;
    history.record(create_result("a", 1.0));
    history.clear();

    REQUIRE(history.size() == 0);
    REQUIRE(history.recent().empty());
}

TEST_CASE("History survives a reload from file", "[history][file]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    std::string path = history_path("reload");

    {
        ResultHistory history(5, path);
        history.record(create_result("first", 4100000.5));
        history.record(create_result("second", 5200000.25));
    }

    REQUIRE(fs::exists(path));

    ResultHistory reloaded(5, path);
    auto entries = reloaded.recent();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].id == "second");
    REQUIRE(entries[1].id == "first");
    REQUIRE(entries[0].statistics.median().final_value == 5200000.25);
    REQUIRE(entries[0].statistics.simulation_count == 10000);
    REQUIRE(entries[0].request.asset_classes == make_default_request().asset_classes);
    REQUIRE(entries[0].request.time_horizon == 10);

    // New records go in front of the loaded ones
    reloaded.record(create_result("third", 1.0));
    ResultHistory again(5, path);
    REQUIRE(again.recent().front().id == "third");
    REQUIRE(again.size() == 3);

    fs::remove(path);
}

TEST_CASE("History file is trimmed to capacity on load", "[history][file]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    std::string path = history_path("trim");

    {
        ResultHistory history(10, path);
        for (int i = 0; i < 6; ++i) {
            history.record(create_result("run-" + std::to_string(i), i));
        }
    }

    ResultHistory smaller(4, path);
    REQUIRE(smaller.size() == 4);
    REQUIRE(smaller.recent().front().id == "run-5");

    fs::remove(path);
}

TEST_CASE("Generated ids continue after a reload", "[history][file]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    std::string path = history_path("generated");

    {
        ResultHistory history(10, path);
        REQUIRE(history.record(create_result("", 1.0)) == "run-1");
        REQUIRE(history.record(create_result("", 2.0)) == "run-2");
    }

    ResultHistory reloaded(10, path);
    REQUIRE(reloaded.record(create_result("", 3.0)) == "run-3");

    fs::remove(path);
}

TEST_CASE("Corrupt history file is reported", "[history][file][error]") {
    std::string path = history_path("corrupt");
    {
        std::ofstream out(path);
        out << "{not json\n";
    }

    REQUIRE_THROWS_AS(ResultHistory(10, path), std::runtime_error);
    fs::remove(path);
}

TEST_CASE("History is safe to record from several threads", "[history][concurrency]") {
    Logger::get_instance().set_min_level(LogLevel::ERROR);
    ResultHistory history(100);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&history, t]() {
            for (int i = 0; i < 10; ++i) {
                history.record(create_result("t" + std::to_string(t) + "-" + std::to_string(i), i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(history.size() == 40);
}
