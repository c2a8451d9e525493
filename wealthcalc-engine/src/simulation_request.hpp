#ifndef WEALTHCALC_SIMULATION_REQUEST_HPP
#define WEALTHCALC_SIMULATION_REQUEST_HPP

#include "asset_class.hpp"
#include "tax.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wealthcalc {

// Request bounds
constexpr int MIN_TIME_HORIZON = 1;
constexpr int MAX_TIME_HORIZON = 50;
constexpr int64_t MIN_SIMULATIONS = 5000;

// Everything the engine needs for one batch. Built once by the caller,
// never modified by the engine.
struct SimulationRequest {
    std::string id;                         // Caller-supplied identifier (may be empty)
    std::vector<AssetClass> asset_classes;
    double initial_investment;
    int time_horizon;                       // Years
    int64_t num_simulations;
    bool enable_drawdown;
    double annual_drawdown;                 // Year-1 net withdrawal
    double inflation_rate;                  // Annual indexation of the withdrawal
    TaxSettings tax_settings;

    SimulationRequest();

    // True when a withdrawal is taken each year
    bool has_withdrawals() const { return enable_drawdown && annual_drawdown > 0.0; }
};

enum class ErrorCategory : uint8_t {
    Validation,     // Request is malformed; caller can fix it
    Configuration,  // Tax settings make the model undefined; caller can fix it
    Cancelled,      // Batch stopped by cancellation or timeout
    Internal        // Unexpected failure inside the engine
};

enum class SimulationErrorKind : uint8_t {
    AllocationSumMismatch,
    TooFewSimulations,
    TimeHorizonTooLong,
    TimeHorizonTooShort,
    NoAssetClasses,
    InvalidInitialInvestment,
    InvalidDrawdown,
    InvalidAssetClass,
    InvalidTaxRate,
    TaxRateTooHigh,
    Cancelled,
    Internal
};

std::string error_kind_to_string(SimulationErrorKind kind);
std::string category_to_string(ErrorCategory category);
ErrorCategory category_of(SimulationErrorKind kind);

struct SimulationError {
    SimulationErrorKind kind;
    std::string message;

    SimulationError(SimulationErrorKind k, std::string msg);

    ErrorCategory category() const { return category_of(kind); }

    // True for errors the caller can fix by changing the request
    bool is_caller_fixable() const {
        return category() == ErrorCategory::Validation ||
               category() == ErrorCategory::Configuration;
    }
};

// Check a request before any simulation work.
// Returns every problem found, in a stable order:
// simulation count, horizon bounds, asset classes and allocation,
// investment and drawdown amounts, then tax configuration.
// Empty result means the request is valid.
std::vector<SimulationError> validate_request(const SimulationRequest& request);

} // namespace wealthcalc

#endif // WEALTHCALC_SIMULATION_REQUEST_HPP
