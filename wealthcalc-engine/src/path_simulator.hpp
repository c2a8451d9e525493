#ifndef WEALTHCALC_PATH_SIMULATOR_HPP
#define WEALTHCALC_PATH_SIMULATOR_HPP

#include "return_sampler.hpp"
#include "simulation_request.hpp"
#include <cstdint>
#include <vector>

namespace wealthcalc {

enum class PathState : uint8_t {
    Active = 0,
    Depleted = 1    // Terminal: the value stays at zero for the rest of the horizon
};

struct PathPoint {
    int year;
    double portfolio_value;
};

// Withdrawal taken at the start of a simulated year
struct YearlyWithdrawal {
    int year;                       // 1-based
    double gross;                   // Amount removed from the portfolio (scheduled)
    double tax;                     // Tax owed on the gross amount
    double net;                     // gross - tax
    double portfolio_value_after;   // Value after the withdrawal, before returns
    double cost_basis_after;        // Cost basis after the withdrawal
};

// One simulated trajectory, years 0..time_horizon
struct SimulationPath {
    std::vector<PathPoint> points;
    PathState final_state;
    int depletion_year;             // Year the path was depleted, 0 if never

    // Totals over the withdrawal years (scheduled amounts)
    double total_gross_withdrawn;
    double total_tax_paid;
    double total_net_withdrawn;

    std::vector<YearlyWithdrawal> withdrawals;  // Only with PathConfig::detailed_withdrawals

    SimulationPath();

    double final_value() const { return points.empty() ? 0.0 : points.back().portfolio_value; }
    bool depleted() const { return final_state == PathState::Depleted; }
};

struct PathConfig {
    bool detailed_withdrawals;      // If true, populate SimulationPath::withdrawals

    PathConfig();
};

// Simulate one path of the request, drawing returns from sampler.
//
// Each year, while the path is active:
//   1. Work out the year's withdrawal: annual_drawdown indexed by inflation,
//      grossed up for tax-deferred accounts
//   2. Compute the tax owed against the pre-withdrawal value and cost basis
//   3. Remove the gross withdrawal (value floored at zero)
//   4. Taxable accounts: shrink cost basis in proportion to the withdrawal
//   5. Zero value: the path is depleted and every remaining year records 0
//   6. Apply the allocation-weighted return of all asset classes;
//      non-taxable accounts re-sync cost basis to the new value
//
// Draws are consumed year by year, asset classes in request order.
// The request must already be valid (see validate_request).
SimulationPath simulate_path(const SimulationRequest& request,
                             ReturnSampler& sampler,
                             const PathConfig& config = PathConfig());

} // namespace wealthcalc

#endif // WEALTHCALC_PATH_SIMULATOR_HPP
