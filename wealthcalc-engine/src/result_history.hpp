#ifndef WEALTHCALC_RESULT_HISTORY_HPP
#define WEALTHCALC_RESULT_HISTORY_HPP

#include "simulation.hpp"
#include "simulation_request.hpp"
#include "statistics.hpp"
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wealthcalc {

/**
 * Summary of one completed simulation kept in the history
 */
struct HistoryEntry {
    std::string id;                     // Request id, or generated when the request had none
    std::string timestamp;              // ISO 8601 UTC, when recorded
    SimulationRequest request;
    SimulationStatistics statistics;
};

/**
 * Most recent simulation summaries, newest first
 *
 * Features:
 * - Bounded: the oldest entry is dropped once capacity is exceeded
 * - Optional JSON-lines file (one entry per line, newest first), loaded on
 *   construction and rewritten after every record
 * - Thread-safe
 */
class ResultHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10;

    /**
     * Constructor
     * @param capacity Maximum number of entries kept (at least 1)
     * @param file_path History file; empty keeps the history in memory only
     * @throws std::invalid_argument if capacity is 0
     * @throws std::runtime_error if an existing file cannot be parsed
     */
    explicit ResultHistory(size_t capacity = DEFAULT_CAPACITY, const std::string& file_path = "");

    /**
     * Add a completed result
     * @return Id the entry was stored under
     * @throws std::invalid_argument if result is null
     * @throws std::runtime_error if the history file cannot be written
     */
    std::string record(const std::shared_ptr<const SimulationResult>& result);

    /**
     * Newest entries first
     * @param limit Maximum number of entries (0 = all)
     */
    std::vector<HistoryEntry> recent(size_t limit = 0) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    const std::string& file_path() const { return file_path_; }

    /**
     * Remove all entries (and truncate the file when file-backed)
     */
    void clear();

private:
    size_t capacity_;
    std::string file_path_;
    mutable std::mutex mutex_;
    std::deque<HistoryEntry> entries_;
    size_t generated_ids_;

    void load_from_disk();
    void save_to_disk() const;
    std::string next_generated_id();
    void note_generated_id(const std::string& id);
};

} // namespace wealthcalc

#endif // WEALTHCALC_RESULT_HISTORY_HPP
