#include "result_history.hpp"
#include "io/json_codec.hpp"
#include "io/request_reader.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace wealthcalc {

namespace {

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

json entry_to_json(const HistoryEntry& entry) {
    return json{
        {"id", entry.id},
        {"timestamp", entry.timestamp},
        {"request", entry.request},
        {"statistics", entry.statistics}
    };
}

HistoryEntry entry_from_json(const json& j) {
    HistoryEntry entry;
    j.at("id").get_to(entry.id);
    j.at("timestamp").get_to(entry.timestamp);
    entry.request = parse_simulation_request(j.at("request"));
    j.at("statistics").get_to(entry.statistics);
    return entry;
}

} // anonymous namespace

ResultHistory::ResultHistory(size_t capacity, const std::string& file_path)
    : capacity_(capacity)
    , file_path_(file_path)
    , generated_ids_(0)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("ResultHistory capacity must be at least 1");
    }
    if (!file_path_.empty()) {
        load_from_disk();
    }
}

std::string ResultHistory::next_generated_id() {
    return "run-" + std::to_string(++generated_ids_);
}

std::string ResultHistory::record(const std::shared_ptr<const SimulationResult>& result) {
    if (!result) {
        throw std::invalid_argument("Cannot record a null SimulationResult");
    }

    HistoryEntry entry;
    std::string id;
    entry.timestamp = utc_timestamp();
    entry.request = result->request;
    entry.statistics = result->statistics;

    size_t history_size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.id = result->request.id.empty() ? next_generated_id() : result->request.id;
        id = entry.id;

        entries_.push_front(std::move(entry));
        while (entries_.size() > capacity_) {
            entries_.pop_back();
        }

        if (!file_path_.empty()) {
            save_to_disk();
        }
        history_size = entries_.size();
    }

    Logger::get_instance().log_history_recorded(id, history_size, file_path_);
    return id;
}

std::vector<HistoryEntry> ResultHistory::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = (limit == 0 || limit > entries_.size()) ? entries_.size() : limit;
    return std::vector<HistoryEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count));
}

size_t ResultHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResultHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (!file_path_.empty()) {
        save_to_disk();
    }
}

void ResultHistory::load_from_disk() {
    if (!std::filesystem::exists(file_path_)) {
        return;
    }

    std::ifstream file(file_path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open history file: " + file_path_);
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            entries_.push_back(entry_from_json(json::parse(line)));
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid history entry in " + file_path_ + " at line " +
                                     std::to_string(line_number) + ": " + e.what());
        }
        note_generated_id(entries_.back().id);
        if (entries_.size() == capacity_) {
            break;
        }
    }
}

// Generated ids continue after the highest run-N already stored
void ResultHistory::note_generated_id(const std::string& id) {
    const std::string prefix = "run-";
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return;
    }
    const std::string digits = id.substr(prefix.size());
    if (digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 18) {
        return;
    }
    generated_ids_ = std::max(generated_ids_, static_cast<size_t>(std::stoull(digits)));
}

void ResultHistory::save_to_disk() const {
    std::filesystem::path path(file_path_);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(file_path_, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write history file: " + file_path_);
    }
    for (const auto& entry : entries_) {
        file << entry_to_json(entry).dump() << '\n';
    }
    if (!file) {
        throw std::runtime_error("Failed writing history file: " + file_path_);
    }
}

} // namespace wealthcalc
