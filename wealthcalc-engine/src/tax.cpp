#include "tax.hpp"
#include <cmath>

namespace wealthcalc {

std::string account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::Taxable: return "taxable";
        case AccountType::TaxDeferred: return "tax_deferred";
        case AccountType::TaxFree: return "tax_free";
    }
    return "taxable";
}

AccountType account_type_from_string(const std::string& name) {
    if (name == "taxable") return AccountType::Taxable;
    if (name == "tax_deferred") return AccountType::TaxDeferred;
    if (name == "tax_free") return AccountType::TaxFree;
    throw std::invalid_argument("Unknown account type: '" + name +
                                "' (expected taxable, tax_deferred or tax_free)");
}

TaxSettings::TaxSettings()
    : account_type(AccountType::Taxable),
      capital_gains_tax_rate(0.15),
      ordinary_income_tax_rate(0.22),
      state_tax_rate(0.0) {}

TaxSettings::TaxSettings(AccountType type, double capital_gains, double ordinary_income,
                         double state)
    : account_type(type),
      capital_gains_tax_rate(capital_gains),
      ordinary_income_tax_rate(ordinary_income),
      state_tax_rate(state) {}

bool TaxSettings::operator==(const TaxSettings& other) const {
    return account_type == other.account_type &&
           capital_gains_tax_rate == other.capital_gains_tax_rate &&
           ordinary_income_tax_rate == other.ordinary_income_tax_rate &&
           state_tax_rate == other.state_tax_rate;
}

double withdrawal_tax(double gross_withdrawal, double portfolio_value,
                      double cost_basis, const TaxSettings& settings) {
    switch (settings.account_type) {
        case AccountType::TaxFree:
            return 0.0;

        case AccountType::TaxDeferred:
            return gross_withdrawal * settings.ordinary_plus_state();

        case AccountType::Taxable: {
            // No unrealized gain, nothing to tax. Also covers portfolio_value <= 0.
            if (portfolio_value <= cost_basis || portfolio_value <= 0.0) {
                return 0.0;
            }
            double gains_proportion = (portfolio_value - cost_basis) / portfolio_value;
            double taxable_amount = gross_withdrawal * gains_proportion;
            return taxable_amount * settings.capital_gains_plus_state();
        }
    }
    return 0.0;
}

double gross_up_withdrawal(double desired_net, const TaxSettings& settings) {
    if (settings.account_type != AccountType::TaxDeferred) {
        return desired_net;
    }
    double combined = settings.ordinary_plus_state();
    if (combined >= 1.0) {
        throw ConfigurationError(
            "Combined ordinary income and state tax rate must be below 100% "
            "to gross up a tax-deferred withdrawal (got " + std::to_string(combined) + ")");
    }
    return desired_net / (1.0 - combined);
}

double inflation_adjusted_drawdown(double annual_amount, double inflation_rate, int year) {
    if (year <= 1) {
        return annual_amount;
    }
    return annual_amount * std::pow(1.0 + inflation_rate, year - 1);
}

} // namespace wealthcalc
