#include "json_codec.hpp"
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace wealthcalc {

void to_json(json& j, const AssetClass& asset) {
    j = json{
        {"name", asset.name},
        {"median_return", asset.median_return},
        {"std_deviation", asset.std_deviation},
        {"min_return", asset.min_return},
        {"max_return", asset.max_return},
        {"allocation", asset.allocation}
    };
}

void from_json(const json& j, AssetClass& asset) {
    j.at("name").get_to(asset.name);
    j.at("median_return").get_to(asset.median_return);
    j.at("std_deviation").get_to(asset.std_deviation);
    j.at("min_return").get_to(asset.min_return);
    j.at("max_return").get_to(asset.max_return);
    j.at("allocation").get_to(asset.allocation);
}

void to_json(json& j, const TaxSettings& tax) {
    j = json{
        {"account_type", account_type_to_string(tax.account_type)},
        {"capital_gains_tax_rate", tax.capital_gains_tax_rate},
        {"ordinary_income_tax_rate", tax.ordinary_income_tax_rate},
        {"state_tax_rate", tax.state_tax_rate}
    };
}

void from_json(const json& j, TaxSettings& tax) {
    TaxSettings defaults;
    tax.account_type = account_type_from_string(
        j.value("account_type", account_type_to_string(defaults.account_type)));
    tax.capital_gains_tax_rate = j.value("capital_gains_tax_rate", defaults.capital_gains_tax_rate);
    tax.ordinary_income_tax_rate = j.value("ordinary_income_tax_rate", defaults.ordinary_income_tax_rate);
    tax.state_tax_rate = j.value("state_tax_rate", defaults.state_tax_rate);
}

void to_json(json& j, const SimulationRequest& request) {
    j = json{
        {"id", request.id},
        {"asset_classes", request.asset_classes},
        {"initial_investment", request.initial_investment},
        {"time_horizon", request.time_horizon},
        {"num_simulations", request.num_simulations},
        {"enable_drawdown", request.enable_drawdown},
        {"annual_drawdown", request.annual_drawdown},
        {"inflation_rate", request.inflation_rate},
        {"tax_settings", request.tax_settings}
    };
}

void to_json(json& j, const PercentileStat& stat) {
    j = json{
        {"level", stat.level},
        {"final_value", stat.final_value},
        {"total_return", stat.total_return},
        {"annualized_return", stat.annualized_return}
    };
}

void from_json(const json& j, PercentileStat& stat) {
    j.at("level").get_to(stat.level);
    j.at("final_value").get_to(stat.final_value);
    j.at("total_return").get_to(stat.total_return);
    j.at("annualized_return").get_to(stat.annualized_return);
}

void to_json(json& j, const SimulationStatistics& stats) {
    j = json{
        {"percentiles", stats.percentiles},
        {"mean_final_value", stats.mean_final_value},
        {"std_final_value", stats.std_final_value},
        {"min_final_value", stats.min_final_value},
        {"max_final_value", stats.max_final_value},
        {"mean_total_return", stats.mean_total_return},
        {"mean_annualized_return", stats.mean_annualized_return},
        {"std_total_return", stats.std_total_return},
        {"min_total_return", stats.min_total_return},
        {"min_annualized_return", stats.min_annualized_return},
        {"max_total_return", stats.max_total_return},
        {"max_annualized_return", stats.max_annualized_return},
        {"probability_of_depletion", stats.probability_of_depletion},
        {"probability_of_maintaining", stats.probability_of_maintaining},
        {"probability_of_doubling", stats.probability_of_doubling},
        {"total_nominal_drawdown", stats.total_nominal_drawdown},
        {"drawdown_enabled", stats.drawdown_enabled},
        {"annual_drawdown", stats.annual_drawdown},
        {"inflation_rate", stats.inflation_rate},
        {"time_horizon", stats.time_horizon},
        {"initial_investment", stats.initial_investment},
        {"simulation_count", stats.simulation_count}
    };
}

void from_json(const json& j, SimulationStatistics& stats) {
    const json& percentiles = j.at("percentiles");
    if (!percentiles.is_array() || percentiles.size() != stats.percentiles.size()) {
        throw std::invalid_argument("statistics.percentiles must hold " +
                                    std::to_string(stats.percentiles.size()) + " entries");
    }
    for (size_t i = 0; i < stats.percentiles.size(); ++i) {
        percentiles[i].get_to(stats.percentiles[i]);
    }

    j.at("mean_final_value").get_to(stats.mean_final_value);
    j.at("std_final_value").get_to(stats.std_final_value);
    j.at("min_final_value").get_to(stats.min_final_value);
    j.at("max_final_value").get_to(stats.max_final_value);
    j.at("mean_total_return").get_to(stats.mean_total_return);
    j.at("mean_annualized_return").get_to(stats.mean_annualized_return);
    j.at("std_total_return").get_to(stats.std_total_return);
    j.at("min_total_return").get_to(stats.min_total_return);
    j.at("min_annualized_return").get_to(stats.min_annualized_return);
    j.at("max_total_return").get_to(stats.max_total_return);
    j.at("max_annualized_return").get_to(stats.max_annualized_return);
    j.at("probability_of_depletion").get_to(stats.probability_of_depletion);
    j.at("probability_of_maintaining").get_to(stats.probability_of_maintaining);
    j.at("probability_of_doubling").get_to(stats.probability_of_doubling);
    j.at("total_nominal_drawdown").get_to(stats.total_nominal_drawdown);
    j.at("drawdown_enabled").get_to(stats.drawdown_enabled);
    j.at("annual_drawdown").get_to(stats.annual_drawdown);
    j.at("inflation_rate").get_to(stats.inflation_rate);
    j.at("time_horizon").get_to(stats.time_horizon);
    j.at("initial_investment").get_to(stats.initial_investment);
    j.at("simulation_count").get_to(stats.simulation_count);
}

} // namespace wealthcalc
