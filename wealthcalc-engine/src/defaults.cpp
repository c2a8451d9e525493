#include "defaults.hpp"

namespace wealthcalc {

DefaultAssetConfig get_default_asset_classes() {
    DefaultAssetConfig config;
    //                              name            median  std    min    max   alloc
    config.asset_classes.emplace_back("Stocks",         0.08, 0.15, -0.40, 0.35, 0.30);
    config.asset_classes.emplace_back("Bonds",          0.04, 0.08, -0.10, 0.15, 0.30);
    config.asset_classes.emplace_back("Alternatives",   0.10, 0.20, -0.30, 0.50, 0.20);
    config.asset_classes.emplace_back("Private Credit", 0.07, 0.12, -0.15, 0.25, 0.20);
    config.default_initial_investment = 5000000.0;
    config.default_time_horizon = 10;
    config.default_num_simulations = 10000;
    return config;
}

SimulationRequest make_default_request() {
    DefaultAssetConfig defaults = get_default_asset_classes();

    SimulationRequest request;
    request.asset_classes = defaults.asset_classes;
    request.initial_investment = defaults.default_initial_investment;
    request.time_horizon = defaults.default_time_horizon;
    request.num_simulations = defaults.default_num_simulations;
    request.enable_drawdown = false;
    request.annual_drawdown = 0.0;
    request.inflation_rate = 0.03;
    request.tax_settings = TaxSettings();
    return request;
}

} // namespace wealthcalc
