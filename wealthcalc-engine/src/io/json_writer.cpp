#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wealthcalc {
namespace io {

JsonWriteOptions::JsonWriteOptions()
    : pretty_print(true), include_paths(true), include_final_values(true) {}

namespace {

std::string format_fixed(double value, int decimals) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    std::string s = oss.str();
    // Avoid "-0.00" for values that round to zero
    if (s[0] == '-' && s.find_first_not_of("-0.") == std::string::npos) {
        s.erase(0, 1);
    }
    return s;
}

std::string quote(const std::string& s) {
    return nlohmann::json(s).dump();
}

// Whitespace for pretty or compact output
struct Layout {
    bool pretty;
    std::string nl() const { return pretty ? "\n" : ""; }
    std::string sp() const { return pretty ? " " : ""; }
    std::string ind(int depth) const { return pretty ? std::string(depth * 2, ' ') : ""; }
};

} // anonymous namespace

std::string format_currency(double value) {
    return format_fixed(value, 2);
}

std::string format_ratio(double value) {
    return format_fixed(value, 6);
}

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const JsonWriteOptions& options) {
    const Layout L{options.pretty_print};
    const SimulationRequest& req = result.request;
    const SimulationStatistics& st = result.statistics;
    const WithdrawalSummary& wd = result.withdrawals;

    auto field = [&](int depth, const std::string& key, const std::string& value, bool last = false) {
        os << L.ind(depth) << quote(key) << ":" << L.sp() << value << (last ? "" : ",") << L.nl();
    };

    os << "{" << L.nl();

    // Run metadata
    field(1, "id", quote(req.id));
    field(1, "mode", quote(execution_mode_to_string(result.mode)));
    field(1, "seed", std::to_string(result.seed));
    field(1, "threads", std::to_string(result.threads_used));
    field(1, "execution_time_ms", format_currency(result.execution_time_ms));

    // Parameters
    os << L.ind(1) << "\"parameters\":" << L.sp() << "{" << L.nl();
    os << L.ind(2) << "\"asset_classes\":" << L.sp() << "[" << L.nl();
    for (size_t i = 0; i < req.asset_classes.size(); ++i) {
        const AssetClass& a = req.asset_classes[i];
        os << L.ind(3) << "{"
           << "\"name\":" << L.sp() << quote(a.name) << "," << L.sp()
           << "\"median_return\":" << L.sp() << format_ratio(a.median_return) << "," << L.sp()
           << "\"std_deviation\":" << L.sp() << format_ratio(a.std_deviation) << "," << L.sp()
           << "\"min_return\":" << L.sp() << format_ratio(a.min_return) << "," << L.sp()
           << "\"max_return\":" << L.sp() << format_ratio(a.max_return) << "," << L.sp()
           << "\"allocation\":" << L.sp() << format_ratio(a.allocation)
           << "}" << (i + 1 < req.asset_classes.size() ? "," : "") << L.nl();
    }
    os << L.ind(2) << "]," << L.nl();
    field(2, "initial_investment", format_currency(req.initial_investment));
    field(2, "time_horizon", std::to_string(req.time_horizon));
    field(2, "num_simulations", std::to_string(req.num_simulations));
    field(2, "enable_drawdown", req.enable_drawdown ? "true" : "false");
    field(2, "annual_drawdown", format_currency(req.annual_drawdown));
    field(2, "inflation_rate", format_ratio(req.inflation_rate));
    os << L.ind(2) << "\"tax_settings\":" << L.sp() << "{" << L.nl();
    field(3, "account_type", quote(account_type_to_string(req.tax_settings.account_type)));
    field(3, "capital_gains_tax_rate", format_ratio(req.tax_settings.capital_gains_tax_rate));
    field(3, "ordinary_income_tax_rate", format_ratio(req.tax_settings.ordinary_income_tax_rate));
    field(3, "state_tax_rate", format_ratio(req.tax_settings.state_tax_rate), true);
    os << L.ind(2) << "}" << L.nl();
    os << L.ind(1) << "}," << L.nl();

    // Statistics
    os << L.ind(1) << "\"statistics\":" << L.sp() << "{" << L.nl();
    os << L.ind(2) << "\"percentiles\":" << L.sp() << "[" << L.nl();
    for (size_t i = 0; i < st.percentiles.size(); ++i) {
        const PercentileStat& p = st.percentiles[i];
        os << L.ind(3) << "{"
           << "\"level\":" << L.sp() << static_cast<int>(p.level) << "," << L.sp()
           << "\"final_value\":" << L.sp() << format_currency(p.final_value) << "," << L.sp()
           << "\"total_return\":" << L.sp() << format_ratio(p.total_return) << "," << L.sp()
           << "\"annualized_return\":" << L.sp() << format_ratio(p.annualized_return)
           << "}" << (i + 1 < st.percentiles.size() ? "," : "") << L.nl();
    }
    os << L.ind(2) << "]," << L.nl();
    field(2, "mean_final_value", format_currency(st.mean_final_value));
    field(2, "std_final_value", format_currency(st.std_final_value));
    field(2, "min_final_value", format_currency(st.min_final_value));
    field(2, "max_final_value", format_currency(st.max_final_value));
    field(2, "mean_total_return", format_ratio(st.mean_total_return));
    field(2, "mean_annualized_return", format_ratio(st.mean_annualized_return));
    field(2, "std_total_return", format_ratio(st.std_total_return));
    field(2, "min_total_return", format_ratio(st.min_total_return));
    field(2, "min_annualized_return", format_ratio(st.min_annualized_return));
    field(2, "max_total_return", format_ratio(st.max_total_return));
    field(2, "max_annualized_return", format_ratio(st.max_annualized_return));
    field(2, "probability_of_depletion", format_ratio(st.probability_of_depletion));
    field(2, "probability_of_maintaining", format_ratio(st.probability_of_maintaining));
    field(2, "probability_of_doubling", format_ratio(st.probability_of_doubling));
    field(2, "total_nominal_drawdown", format_currency(st.total_nominal_drawdown));
    field(2, "drawdown_enabled", st.drawdown_enabled ? "true" : "false");
    field(2, "annual_drawdown", format_currency(st.annual_drawdown));
    field(2, "inflation_rate", format_ratio(st.inflation_rate));
    field(2, "time_horizon", std::to_string(st.time_horizon));
    field(2, "initial_investment", format_currency(st.initial_investment));
    field(2, "simulation_count", std::to_string(st.simulation_count), true);
    os << L.ind(1) << "}," << L.nl();

    // Withdrawal summary
    const bool more = options.include_final_values || options.include_paths;
    os << L.ind(1) << "\"withdrawals\":" << L.sp() << "{" << L.nl();
    field(2, "mean_gross_withdrawn", format_currency(wd.mean_gross_withdrawn));
    field(2, "mean_tax_paid", format_currency(wd.mean_tax_paid));
    field(2, "mean_net_withdrawn", format_currency(wd.mean_net_withdrawn));
    field(2, "depleted_paths", std::to_string(wd.depleted_paths));
    field(2, "mean_depletion_year", format_ratio(wd.mean_depletion_year), true);
    os << L.ind(1) << "}" << (more ? "," : "") << L.nl();

    // Distribution of final values, ten per line
    if (options.include_final_values) {
        os << L.ind(1) << "\"final_values\":" << L.sp() << "[";
        if (!result.final_values.empty()) {
            os << L.nl() << L.ind(2);
            for (size_t i = 0; i < result.final_values.size(); ++i) {
                if (i > 0) {
                    os << ",";
                    if (L.pretty && i % 10 == 0) {
                        os << L.nl() << L.ind(2);
                    } else {
                        os << L.sp();
                    }
                }
                os << format_currency(result.final_values[i]);
            }
            os << L.nl() << L.ind(1);
        }
        os << "]" << (options.include_paths ? "," : "") << L.nl();
    }

    // One line per path: [[year, value], ...]
    if (options.include_paths) {
        os << L.ind(1) << "\"simulation_paths\":" << L.sp() << "[";
        if (!result.paths.empty()) {
            os << L.nl();
            for (size_t i = 0; i < result.paths.size(); ++i) {
                const SimulationPath& path = result.paths[i];
                os << L.ind(2) << "[";
                for (size_t k = 0; k < path.points.size(); ++k) {
                    if (k > 0) os << ",";
                    os << "{\"year\":" << path.points[k].year
                       << ",\"portfolio_value\":" << format_currency(path.points[k].portfolio_value) << "}";
                }
                os << "]" << (i + 1 < result.paths.size() ? "," : "") << L.nl();
            }
            os << L.ind(1);
        }
        os << "]" << L.nl();
    }

    os << "}" << L.nl();
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const JsonWriteOptions& options) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, options);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

void write_simulation_error_json(std::ostream& os, const SimulationError& error,
                                 bool pretty_print) {
    nlohmann::json j = {
        {"error", {
            {"kind", error_kind_to_string(error.kind)},
            {"category", category_to_string(error.category())},
            {"message", error.message}
        }}
    };
    os << j.dump(pretty_print ? 2 : -1) << "\n";
}

} // namespace io
} // namespace wealthcalc
