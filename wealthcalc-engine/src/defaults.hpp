#ifndef WEALTHCALC_DEFAULTS_HPP
#define WEALTHCALC_DEFAULTS_HPP

#include "asset_class.hpp"
#include "simulation_request.hpp"
#include <cstdint>
#include <vector>

namespace wealthcalc {

// Suggested starting point for callers. The engine does not depend on it.
struct DefaultAssetConfig {
    std::vector<AssetClass> asset_classes;
    double default_initial_investment;
    int default_time_horizon;
    int64_t default_num_simulations;
};

// Stocks / Bonds / Alternatives / Private Credit at 30/30/20/20,
// $5MM over 10 years, 10,000 simulations
DefaultAssetConfig get_default_asset_classes();

// A valid request built from the defaults: no drawdown, 3% inflation,
// default tax settings
SimulationRequest make_default_request();

} // namespace wealthcalc

#endif // WEALTHCALC_DEFAULTS_HPP
