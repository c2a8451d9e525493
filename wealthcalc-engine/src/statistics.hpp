#ifndef WEALTHCALC_STATISTICS_HPP
#define WEALTHCALC_STATISTICS_HPP

#include <array>
#include <cstddef>
#include <vector>

namespace wealthcalc {

// Percentile levels reported for final values, in ascending order
constexpr std::array<double, 7> PERCENTILE_LEVELS = {5.0, 10.0, 25.0, 50.0, 75.0, 90.0, 95.0};

// A final-value percentile with its total and annualized return
struct PercentileStat {
    double level;               // 5, 10, ..., 95
    double final_value;
    double total_return;        // final_value / initial_investment - 1
    double annualized_return;   // (1 + total_return)^(1 / horizon) - 1
};

// Inputs the aggregator needs besides the final values
struct StatisticsInput {
    double initial_investment;
    int time_horizon;
    bool drawdown_enabled;
    double annual_drawdown;
    double inflation_rate;

    StatisticsInput();
};

// Summary statistics over the final portfolio values of a batch
struct SimulationStatistics {
    std::array<PercentileStat, PERCENTILE_LEVELS.size()> percentiles;

    // Moments and extremes of the final values
    double mean_final_value;
    double std_final_value;         // Population standard deviation
    double min_final_value;
    double max_final_value;

    double mean_total_return;
    double mean_annualized_return;
    double std_total_return;        // std_final_value / initial_investment
    double min_total_return;
    double min_annualized_return;
    double max_total_return;
    double max_annualized_return;

    // Empirical frequencies over the sample
    double probability_of_depletion;    // value <= 0
    double probability_of_maintaining;  // value >= initial investment
    double probability_of_doubling;     // value >= 2 × initial investment

    // Sum of the scheduled pre-tax withdrawals across the horizon (0 when disabled)
    double total_nominal_drawdown;

    // Pass-through for reporting
    bool drawdown_enabled;
    double annual_drawdown;
    double inflation_rate;
    int time_horizon;
    double initial_investment;
    size_t simulation_count;

    // Convenience accessors
    const PercentileStat& p5() const { return percentiles[0]; }
    const PercentileStat& p10() const { return percentiles[1]; }
    const PercentileStat& p25() const { return percentiles[2]; }
    const PercentileStat& p50() const { return percentiles[3]; }
    const PercentileStat& p75() const { return percentiles[4]; }
    const PercentileStat& p90() const { return percentiles[5]; }
    const PercentileStat& p95() const { return percentiles[6]; }
    const PercentileStat& median() const { return p50(); }

    SimulationStatistics();
};

// Aggregate a batch of final values
SimulationStatistics calculate_statistics(const std::vector<double>& final_values,
                                          const StatisticsInput& input);

// ----------------------------------------------------------------------------
// Building blocks, exposed for reuse and testing
// ----------------------------------------------------------------------------

// Percentile p (0-100) of an ascending sample by linear interpolation between
// the order statistics around rank p/100 × (n - 1). 0 for an empty sample.
double calculate_percentile(const std::vector<double>& sorted_values, double p);

double calculate_mean(const std::vector<double>& values);

// Population standard deviation; 0 for fewer than two values
double calculate_std_dev(const std::vector<double>& values, double mean);

// value / initial_investment - 1, or 0 when initial_investment is 0
double total_return(double value, double initial_investment);

// (1 + total_return)^(1 / years) - 1, or 0 when years <= 0
double annualized_return(double total_return, int years);

// Σ_{y=1..years} annual_drawdown × (1 + inflation)^(y-1)
double total_nominal_drawdown(double annual_drawdown, double inflation_rate, int years);

} // namespace wealthcalc

#endif // WEALTHCALC_STATISTICS_HPP
