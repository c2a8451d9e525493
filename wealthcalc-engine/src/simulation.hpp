#ifndef WEALTHCALC_SIMULATION_HPP
#define WEALTHCALC_SIMULATION_HPP

#include "path_simulator.hpp"
#include "simulation_request.hpp"
#include "statistics.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wealthcalc {

enum class ExecutionMode : uint8_t {
    // One random stream consumed across all paths in index order.
    // Byte-identical results for a given seed.
    Sequential = 0,
    // Paths spread over OpenMP threads, each with a stream derived from
    // (seed, path index). Deterministic for a given seed and independent of
    // the thread count, but not identical to Sequential.
    Parallel = 1
};

std::string execution_mode_to_string(ExecutionMode mode);

// Throws std::invalid_argument for anything but "sequential" / "parallel"
ExecutionMode execution_mode_from_string(const std::string& name);

// Cooperative cancellation, checked between paths.
// May be shared with another thread that calls cancel().
class CancellationToken {
public:
    CancellationToken();

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    // Stop once the deadline passes
    void set_deadline(std::chrono::steady_clock::time_point deadline);
    void set_timeout(std::chrono::milliseconds timeout);
    bool deadline_passed() const;

    bool should_stop() const { return is_cancelled() || deadline_passed(); }

private:
    std::atomic<bool> cancelled_;
    bool has_deadline_;
    std::chrono::steady_clock::time_point deadline_;
};

struct SimulationConfig {
    uint64_t seed;                      // Batch seed (default 42)
    ExecutionMode mode;
    int num_threads;                    // Parallel mode only; 0 = OpenMP default
    bool store_paths;                   // If false, only final values are kept
    bool detailed_withdrawals;          // Per-year withdrawal ledger on each path
    int64_t timeout_ms;                 // 0 = no timeout
    CancellationToken* cancellation;    // Optional, not owned

    SimulationConfig();
};

// Averages of the per-path withdrawal totals
struct WithdrawalSummary {
    double mean_gross_withdrawn;
    double mean_tax_paid;
    double mean_net_withdrawn;
    size_t depleted_paths;
    double mean_depletion_year;         // Over depleted paths only, 0 if none

    WithdrawalSummary();
};

struct SimulationResult {
    SimulationRequest request;          // Originating request
    std::vector<SimulationPath> paths;  // Empty when SimulationConfig::store_paths is false
    std::vector<double> final_values;   // One per simulation, in path order
    SimulationStatistics statistics;
    WithdrawalSummary withdrawals;

    uint64_t seed;
    ExecutionMode mode;
    int threads_used;
    double execution_time_ms;

    SimulationResult();
};

// Either a result or the reason there is none
struct SimulationOutcome {
    std::shared_ptr<const SimulationResult> result;
    std::optional<SimulationError> error;

    bool ok() const { return result != nullptr; }

    static SimulationOutcome success(std::shared_ptr<const SimulationResult> result);
    static SimulationOutcome failure(SimulationError error);
};

// Validate the request, simulate num_simulations independent paths and
// aggregate their final values.
//
// Never throws for request problems: validation and configuration errors come
// back as the first error found, before any path is computed. Cancellation and
// timeout are checked between paths and come back as Cancelled. Unexpected
// exceptions come back as Internal.
SimulationOutcome simulate(const SimulationRequest& request,
                           const SimulationConfig& config = SimulationConfig());

} // namespace wealthcalc

#endif // WEALTHCALC_SIMULATION_HPP
