#include "path_simulator.hpp"
#include "tax.hpp"
#include <algorithm>

namespace wealthcalc {

SimulationPath::SimulationPath()
    : final_state(PathState::Active),
      depletion_year(0),
      total_gross_withdrawn(0.0),
      total_tax_paid(0.0),
      total_net_withdrawn(0.0) {}

PathConfig::PathConfig() : detailed_withdrawals(false) {}

namespace {

void fill_depleted(SimulationPath& path, int from_year, int horizon) {
    for (int y = from_year; y <= horizon; ++y) {
        path.points.push_back(PathPoint{y, 0.0});
    }
    path.final_state = PathState::Depleted;
    path.depletion_year = from_year;
}

} // anonymous namespace

SimulationPath simulate_path(const SimulationRequest& request,
                             ReturnSampler& sampler,
                             const PathConfig& config)
{
    const int horizon = request.time_horizon;
    const TaxSettings& tax_settings = request.tax_settings;
    const bool taxable = tax_settings.account_type == AccountType::Taxable;
    const bool withdrawals = request.has_withdrawals();

    SimulationPath path;
    path.points.reserve(static_cast<size_t>(std::max(horizon, 0)) + 1);
    if (config.detailed_withdrawals && withdrawals) {
        path.withdrawals.reserve(static_cast<size_t>(std::max(horizon, 0)));
    }

    double portfolio_value = request.initial_investment;
    double cost_basis = request.initial_investment;
    path.points.push_back(PathPoint{0, portfolio_value});

    for (int year = 1; year <= horizon; ++year) {
        // --- Withdrawal ---
        double gross_withdrawal = 0.0;
        if (withdrawals) {
            double desired_net = inflation_adjusted_drawdown(
                request.annual_drawdown, request.inflation_rate, year);
            gross_withdrawal = gross_up_withdrawal(desired_net, tax_settings);
        }

        if (gross_withdrawal > 0.0) {
            double tax_owed = withdrawal_tax(gross_withdrawal, portfolio_value,
                                             cost_basis, tax_settings);
            double net_withdrawal = gross_withdrawal - tax_owed;

            portfolio_value = std::max(0.0, portfolio_value - gross_withdrawal);

            // Taxable basis shrinks with the share of the portfolio withdrawn.
            // Unrealized growth never enters the basis.
            if (taxable && portfolio_value > 0.0) {
                cost_basis *= portfolio_value / (portfolio_value + gross_withdrawal);
            }

            path.total_gross_withdrawn += gross_withdrawal;
            path.total_tax_paid += tax_owed;
            path.total_net_withdrawn += net_withdrawal;

            if (config.detailed_withdrawals) {
                path.withdrawals.push_back(YearlyWithdrawal{
                    year, gross_withdrawal, tax_owed, net_withdrawal,
                    portfolio_value, cost_basis});
            }
        }

        if (portfolio_value <= 0.0) {
            fill_depleted(path, year, horizon);
            return path;
        }

        // --- Growth ---
        double annual_return = 0.0;
        for (const AssetClass& asset : request.asset_classes) {
            annual_return += sampler.sample(asset) * asset.allocation;
        }

        portfolio_value *= (1.0 + annual_return);

        // A return below -100% cannot take the value negative
        if (portfolio_value <= 0.0) {
            fill_depleted(path, year, horizon);
            return path;
        }

        if (!taxable) {
            cost_basis = portfolio_value;
        }

        path.points.push_back(PathPoint{year, portfolio_value});
    }

    return path;
}

} // namespace wealthcalc
