#include "simulation.hpp"
#include "logger.hpp"
#include <mutex>
#include <stdexcept>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace wealthcalc {

// ============================================================================
// Enum helpers
// ============================================================================

std::string execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Sequential: return "sequential";
        case ExecutionMode::Parallel: return "parallel";
    }
    return "sequential";
}

ExecutionMode execution_mode_from_string(const std::string& name) {
    if (name == "sequential") return ExecutionMode::Sequential;
    if (name == "parallel") return ExecutionMode::Parallel;
    throw std::invalid_argument("Unknown execution mode: '" + name +
                                "' (expected sequential or parallel)");
}

// ============================================================================
// CancellationToken Implementation
// ============================================================================

CancellationToken::CancellationToken()
    : cancelled_(false), has_deadline_(false) {}

void CancellationToken::set_deadline(std::chrono::steady_clock::time_point deadline) {
    deadline_ = deadline;
    has_deadline_ = true;
}

void CancellationToken::set_timeout(std::chrono::milliseconds timeout) {
    set_deadline(std::chrono::steady_clock::now() + timeout);
}

bool CancellationToken::deadline_passed() const {
    return has_deadline_ && std::chrono::steady_clock::now() >= deadline_;
}

// ============================================================================
// Config / result types
// ============================================================================

SimulationConfig::SimulationConfig()
    : seed(42),
      mode(ExecutionMode::Sequential),
      num_threads(0),
      store_paths(true),
      detailed_withdrawals(false),
      timeout_ms(0),
      cancellation(nullptr) {}

WithdrawalSummary::WithdrawalSummary()
    : mean_gross_withdrawn(0.0),
      mean_tax_paid(0.0),
      mean_net_withdrawn(0.0),
      depleted_paths(0),
      mean_depletion_year(0.0) {}

SimulationResult::SimulationResult()
    : seed(0),
      mode(ExecutionMode::Sequential),
      threads_used(1),
      execution_time_ms(0.0) {}

SimulationOutcome SimulationOutcome::success(std::shared_ptr<const SimulationResult> result) {
    SimulationOutcome outcome;
    outcome.result = std::move(result);
    return outcome;
}

SimulationOutcome SimulationOutcome::failure(SimulationError error) {
    SimulationOutcome outcome;
    outcome.error = std::move(error);
    return outcome;
}

// ============================================================================
// Orchestration
// ============================================================================

namespace {

// Per-path numbers kept even when full paths are dropped
struct PathTotals {
    double gross;
    double tax;
    double net;
    int depletion_year;
};

WithdrawalSummary summarize_withdrawals(const std::vector<PathTotals>& totals) {
    WithdrawalSummary summary;
    if (totals.empty()) {
        return summary;
    }

    double depletion_year_sum = 0.0;
    for (const PathTotals& t : totals) {
        summary.mean_gross_withdrawn += t.gross;
        summary.mean_tax_paid += t.tax;
        summary.mean_net_withdrawn += t.net;
        if (t.depletion_year > 0) {
            ++summary.depleted_paths;
            depletion_year_sum += t.depletion_year;
        }
    }

    const double n = static_cast<double>(totals.size());
    summary.mean_gross_withdrawn /= n;
    summary.mean_tax_paid /= n;
    summary.mean_net_withdrawn /= n;
    if (summary.depleted_paths > 0) {
        summary.mean_depletion_year = depletion_year_sum / static_cast<double>(summary.depleted_paths);
    }
    return summary;
}

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

SimulationOutcome simulate(const SimulationRequest& request, const SimulationConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    Logger& logger = Logger::get_instance();
    LogContext ctx(request.id, execution_mode_to_string(config.mode));

    // Fail fast: nothing is simulated for an invalid request
    ctx.phase = "validate";
    std::vector<SimulationError> errors = validate_request(request);
    if (!errors.empty()) {
        std::vector<std::pair<std::string, std::string>> logged;
        logged.reserve(errors.size());
        for (const auto& e : errors) {
            logged.emplace_back(error_kind_to_string(e.kind), e.message);
        }
        logger.log_validation_failed(ctx, logged);
        return SimulationOutcome::failure(errors.front());
    }

    CancellationToken timeout_token;
    if (config.timeout_ms > 0) {
        timeout_token.set_timeout(std::chrono::milliseconds(config.timeout_ms));
    }
    auto should_stop = [&]() {
        return timeout_token.should_stop() ||
               (config.cancellation != nullptr && config.cancellation->should_stop());
    };

    const size_t num_paths = static_cast<size_t>(request.num_simulations);

    BatchMetrics metrics;
    metrics.paths_requested = num_paths;

    try {
        auto result = std::make_shared<SimulationResult>();
        result->request = request;
        result->seed = config.seed;
        result->mode = config.mode;

        std::vector<SimulationPath> paths;
        if (config.store_paths) {
            paths.resize(num_paths);
        }
        std::vector<double> final_values(num_paths, 0.0);
        std::vector<PathTotals> totals(num_paths, PathTotals{0.0, 0.0, 0.0, 0});

        PathConfig path_config;
        path_config.detailed_withdrawals = config.detailed_withdrawals;

        // Each index is written by exactly one iteration
        auto record = [&](size_t i, SimulationPath&& path) {
            final_values[i] = path.final_value();
            totals[i] = PathTotals{path.total_gross_withdrawn, path.total_tax_paid,
                                   path.total_net_withdrawn, path.depletion_year};
            if (config.store_paths) {
                paths[i] = std::move(path);
            }
        };

        logger.log_simulation_start(ctx, num_paths, request.time_horizon,
                                    request.asset_classes.size());

        ctx.phase = "simulate";
        size_t completed = 0;
        bool stopped = false;
        std::string internal_error;

        if (config.mode == ExecutionMode::Sequential) {
            ReturnSampler sampler(config.seed);
            for (size_t i = 0; i < num_paths; ++i) {
                if (should_stop()) {
                    stopped = true;
                    break;
                }
                record(i, simulate_path(request, sampler, path_config));
                ++completed;
            }
            result->threads_used = 1;
        } else {
            std::atomic<bool> halt(false);
            std::atomic<bool> cancel_seen(false);
            std::atomic<size_t> done(0);
            std::mutex error_mutex;

            const int64_t count = static_cast<int64_t>(num_paths);
            auto run_path = [&](int64_t i) {
                if (halt.load(std::memory_order_relaxed)) {
                    return;
                }
                if (should_stop()) {
                    cancel_seen.store(true);
                    halt.store(true);
                    return;
                }
                try {
                    ReturnSampler sampler = ReturnSampler::for_path(config.seed, static_cast<uint64_t>(i));
                    record(static_cast<size_t>(i), simulate_path(request, sampler, path_config));
                    done.fetch_add(1, std::memory_order_relaxed);
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (internal_error.empty()) {
                        internal_error = "Path " + std::to_string(i) + " failed: " + e.what();
                    }
                    halt.store(true);
                }
            };

#ifdef HAVE_OPENMP
            int threads = config.num_threads > 0 ? config.num_threads : omp_get_max_threads();
            // Iterations after a halt return immediately, so a stop takes
            // effect within one path per thread
            #pragma omp parallel for schedule(dynamic, 64) num_threads(threads)
            for (int64_t i = 0; i < count; ++i) {
                run_path(i);
            }
            result->threads_used = threads;
#else
            // Same per-path streams on a single thread
            for (int64_t i = 0; i < count; ++i) {
                run_path(i);
                if (halt.load(std::memory_order_relaxed)) {
                    break;
                }
            }
            result->threads_used = 1;
#endif
            completed = done.load();
            stopped = cancel_seen.load();
        }

        metrics.paths_completed = completed;
        metrics.threads = result->threads_used;

        if (!internal_error.empty()) {
            metrics.execution_time_ms = elapsed_ms(start_time);
            logger.log_error(ctx, internal_error);
            return SimulationOutcome::failure(
                SimulationError(SimulationErrorKind::Internal, internal_error));
        }

        if (stopped || completed < num_paths) {
            metrics.execution_time_ms = elapsed_ms(start_time);
            std::string reason = timeout_token.deadline_passed() ? "timeout" : "cancelled";
            logger.log_simulation_cancelled(ctx, metrics, reason);
            std::string message = (reason == "timeout")
                ? "Simulation timed out after " + std::to_string(config.timeout_ms) + " ms"
                : "Simulation cancelled";
            message += " (" + std::to_string(completed) + " of " +
                       std::to_string(num_paths) + " paths completed)";
            return SimulationOutcome::failure(
                SimulationError(SimulationErrorKind::Cancelled, message));
        }

        ctx.phase = "aggregate";
        StatisticsInput stats_input;
        stats_input.initial_investment = request.initial_investment;
        stats_input.time_horizon = request.time_horizon;
        stats_input.drawdown_enabled = request.enable_drawdown;
        stats_input.annual_drawdown = request.annual_drawdown;
        stats_input.inflation_rate = request.inflation_rate;

        result->statistics = calculate_statistics(final_values, stats_input);
        result->withdrawals = summarize_withdrawals(totals);
        result->paths = std::move(paths);
        result->final_values = std::move(final_values);

        result->execution_time_ms = elapsed_ms(start_time);
        metrics.execution_time_ms = result->execution_time_ms;
        logger.log_simulation_complete(ctx, metrics,
                                       result->statistics.median().final_value,
                                       result->statistics.probability_of_depletion);

        return SimulationOutcome::success(std::move(result));

    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        return SimulationOutcome::failure(
            SimulationError(SimulationErrorKind::Internal,
                            std::string("Simulation failed: ") + e.what()));
    }
}

} // namespace wealthcalc
