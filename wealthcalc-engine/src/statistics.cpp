#include "statistics.hpp"
#include "tax.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace wealthcalc {

// ============================================================================
// StatisticsInput / SimulationStatistics Implementation
// ============================================================================

StatisticsInput::StatisticsInput()
    : initial_investment(0.0),
      time_horizon(0),
      drawdown_enabled(false),
      annual_drawdown(0.0),
      inflation_rate(0.0) {}

SimulationStatistics::SimulationStatistics()
    : mean_final_value(0.0),
      std_final_value(0.0),
      min_final_value(0.0),
      max_final_value(0.0),
      mean_total_return(0.0),
      mean_annualized_return(0.0),
      std_total_return(0.0),
      min_total_return(0.0),
      min_annualized_return(0.0),
      max_total_return(0.0),
      max_annualized_return(0.0),
      probability_of_depletion(0.0),
      probability_of_maintaining(0.0),
      probability_of_doubling(0.0),
      total_nominal_drawdown(0.0),
      drawdown_enabled(false),
      annual_drawdown(0.0),
      inflation_rate(0.0),
      time_horizon(0),
      initial_investment(0.0),
      simulation_count(0)
{
    for (size_t i = 0; i < PERCENTILE_LEVELS.size(); ++i) {
        percentiles[i] = PercentileStat{PERCENTILE_LEVELS[i], 0.0, 0.0, 0.0};
    }
}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (std::clamp(p, 0.0, 100.0) / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] + (sorted_values[upper_idx] - sorted_values[lower_idx]) * frac;
}

double total_return(double value, double initial_investment) {
    if (initial_investment == 0.0) {
        return 0.0;
    }
    return value / initial_investment - 1.0;
}

double annualized_return(double total_return, int years) {
    if (years <= 0) {
        return 0.0;
    }
    double growth = 1.0 + total_return;
    if (growth <= 0.0) {
        return -1.0;  // Fully lost
    }
    return std::pow(growth, 1.0 / static_cast<double>(years)) - 1.0;
}

double total_nominal_drawdown(double annual_drawdown, double inflation_rate, int years) {
    double total = 0.0;
    for (int year = 1; year <= years; ++year) {
        total += inflation_adjusted_drawdown(annual_drawdown, inflation_rate, year);
    }
    return total;
}

// ============================================================================
// Aggregation
// ============================================================================

SimulationStatistics calculate_statistics(const std::vector<double>& final_values,
                                          const StatisticsInput& input)
{
    SimulationStatistics stats;

    stats.drawdown_enabled = input.drawdown_enabled;
    stats.annual_drawdown = input.annual_drawdown;
    stats.inflation_rate = input.inflation_rate;
    stats.time_horizon = input.time_horizon;
    stats.initial_investment = input.initial_investment;
    stats.simulation_count = final_values.size();

    if (input.drawdown_enabled) {
        stats.total_nominal_drawdown = total_nominal_drawdown(
            input.annual_drawdown, input.inflation_rate, input.time_horizon);
    }

    if (final_values.empty()) {
        return stats;
    }

    const double initial = input.initial_investment;
    const int years = input.time_horizon;

    std::vector<double> sorted = final_values;
    std::sort(sorted.begin(), sorted.end());

    for (size_t i = 0; i < PERCENTILE_LEVELS.size(); ++i) {
        PercentileStat& ps = stats.percentiles[i];
        ps.level = PERCENTILE_LEVELS[i];
        ps.final_value = calculate_percentile(sorted, ps.level);
        ps.total_return = total_return(ps.final_value, initial);
        ps.annualized_return = annualized_return(ps.total_return, years);
    }

    stats.mean_final_value = calculate_mean(final_values);
    stats.std_final_value = calculate_std_dev(final_values, stats.mean_final_value);
    stats.min_final_value = sorted.front();
    stats.max_final_value = sorted.back();

    stats.mean_total_return = total_return(stats.mean_final_value, initial);
    stats.mean_annualized_return = annualized_return(stats.mean_total_return, years);
    stats.std_total_return = initial != 0.0 ? stats.std_final_value / initial : 0.0;
    stats.min_total_return = total_return(stats.min_final_value, initial);
    stats.min_annualized_return = annualized_return(stats.min_total_return, years);
    stats.max_total_return = total_return(stats.max_final_value, initial);
    stats.max_annualized_return = annualized_return(stats.max_total_return, years);

    size_t depleted = 0;
    size_t maintained = 0;
    size_t doubled = 0;
    for (double v : final_values) {
        if (v <= 0.0) ++depleted;
        if (v >= initial) ++maintained;
        if (v >= 2.0 * initial) ++doubled;
    }
    const double n = static_cast<double>(final_values.size());
    stats.probability_of_depletion = static_cast<double>(depleted) / n;
    stats.probability_of_maintaining = static_cast<double>(maintained) / n;
    stats.probability_of_doubling = static_cast<double>(doubled) / n;

    return stats;
}

} // namespace wealthcalc
