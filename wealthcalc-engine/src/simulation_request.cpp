#include "simulation_request.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace wealthcalc {

SimulationRequest::SimulationRequest()
    : initial_investment(0.0),
      time_horizon(0),
      num_simulations(0),
      enable_drawdown(false),
      annual_drawdown(0.0),
      inflation_rate(0.0) {}

SimulationError::SimulationError(SimulationErrorKind k, std::string msg)
    : kind(k), message(std::move(msg)) {}

std::string error_kind_to_string(SimulationErrorKind kind) {
    switch (kind) {
        case SimulationErrorKind::AllocationSumMismatch: return "AllocationSumMismatch";
        case SimulationErrorKind::TooFewSimulations: return "TooFewSimulations";
        case SimulationErrorKind::TimeHorizonTooLong: return "TimeHorizonTooLong";
        case SimulationErrorKind::TimeHorizonTooShort: return "TimeHorizonTooShort";
        case SimulationErrorKind::NoAssetClasses: return "NoAssetClasses";
        case SimulationErrorKind::InvalidInitialInvestment: return "InvalidInitialInvestment";
        case SimulationErrorKind::InvalidDrawdown: return "InvalidDrawdown";
        case SimulationErrorKind::InvalidAssetClass: return "InvalidAssetClass";
        case SimulationErrorKind::InvalidTaxRate: return "InvalidTaxRate";
        case SimulationErrorKind::TaxRateTooHigh: return "TaxRateTooHigh";
        case SimulationErrorKind::Cancelled: return "Cancelled";
        case SimulationErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

std::string category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return "validation";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Cancelled: return "cancelled";
        case ErrorCategory::Internal: return "internal";
    }
    return "internal";
}

ErrorCategory category_of(SimulationErrorKind kind) {
    switch (kind) {
        case SimulationErrorKind::InvalidTaxRate:
        case SimulationErrorKind::TaxRateTooHigh:
            return ErrorCategory::Configuration;
        case SimulationErrorKind::Cancelled:
            return ErrorCategory::Cancelled;
        case SimulationErrorKind::Internal:
            return ErrorCategory::Internal;
        default:
            return ErrorCategory::Validation;
    }
}

std::vector<SimulationError> validate_request(const SimulationRequest& request) {
    std::vector<SimulationError> errors;

    if (request.num_simulations < MIN_SIMULATIONS) {
        errors.emplace_back(SimulationErrorKind::TooFewSimulations,
                            "Minimum " + std::to_string(MIN_SIMULATIONS) +
                            " simulations required (got " +
                            std::to_string(request.num_simulations) + ")");
    }

    if (request.time_horizon > MAX_TIME_HORIZON) {
        errors.emplace_back(SimulationErrorKind::TimeHorizonTooLong,
                            "Maximum time horizon is " + std::to_string(MAX_TIME_HORIZON) +
                            " years (got " + std::to_string(request.time_horizon) + ")");
    }

    if (request.time_horizon < MIN_TIME_HORIZON) {
        errors.emplace_back(SimulationErrorKind::TimeHorizonTooShort,
                            "Minimum time horizon is " + std::to_string(MIN_TIME_HORIZON) +
                            " year (got " + std::to_string(request.time_horizon) + ")");
    }

    if (request.asset_classes.empty()) {
        errors.emplace_back(SimulationErrorKind::NoAssetClasses,
                            "At least one asset class is required");
    } else {
        if (!allocation_is_balanced(request.asset_classes)) {
            std::ostringstream oss;
            oss << "Asset allocations must sum to 100% (got "
                << total_allocation(request.asset_classes) * 100.0 << "%)";
            errors.emplace_back(SimulationErrorKind::AllocationSumMismatch, oss.str());
        }

        for (const auto& asset : request.asset_classes) {
            if (asset.std_deviation < 0.0) {
                errors.emplace_back(SimulationErrorKind::InvalidAssetClass,
                                    "Asset class '" + asset.name +
                                    "' has a negative standard deviation");
            }
            if (asset.min_return > asset.max_return) {
                errors.emplace_back(SimulationErrorKind::InvalidAssetClass,
                                    "Asset class '" + asset.name +
                                    "' has min_return above max_return");
            }
            if (asset.allocation < 0.0) {
                errors.emplace_back(SimulationErrorKind::InvalidAssetClass,
                                    "Asset class '" + asset.name +
                                    "' has a negative allocation");
            }
        }
    }

    if (!(request.initial_investment > 0.0) || !std::isfinite(request.initial_investment)) {
        errors.emplace_back(SimulationErrorKind::InvalidInitialInvestment,
                            "Initial investment must be greater than 0");
    }

    if (request.enable_drawdown &&
        (request.annual_drawdown < 0.0 || !std::isfinite(request.annual_drawdown))) {
        errors.emplace_back(SimulationErrorKind::InvalidDrawdown,
                            "Annual drawdown must be non-negative");
    }

    const TaxSettings& tax = request.tax_settings;
    if (tax.capital_gains_tax_rate < 0.0 || tax.ordinary_income_tax_rate < 0.0 ||
        tax.state_tax_rate < 0.0) {
        errors.emplace_back(SimulationErrorKind::InvalidTaxRate,
                            "Tax rates must be non-negative");
    }

    // The gross-up divides by 1 - (ordinary + state); only reached with withdrawals
    if (tax.account_type == AccountType::TaxDeferred && request.has_withdrawals() &&
        tax.ordinary_plus_state() >= 1.0) {
        std::ostringstream oss;
        oss << "Combined ordinary income and state tax rate ("
            << tax.ordinary_plus_state() * 100.0
            << "%) must be below 100% for tax-deferred withdrawals";
        errors.emplace_back(SimulationErrorKind::TaxRateTooHigh, oss.str());
    }

    return errors;
}

} // namespace wealthcalc
