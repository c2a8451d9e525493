#ifndef WEALTHCALC_TAX_HPP
#define WEALTHCALC_TAX_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wealthcalc {

// Simplified three-bucket account model
enum class AccountType : uint8_t {
    Taxable = 0,      // Withdrawals taxed on the gains share at capital gains rates
    TaxDeferred = 1,  // Withdrawals taxed in full as ordinary income
    TaxFree = 2       // Withdrawals untaxed
};

// "taxable", "tax_deferred", "tax_free"
std::string account_type_to_string(AccountType type);

// Throws std::invalid_argument for an unknown name
AccountType account_type_from_string(const std::string& name);

struct TaxSettings {
    AccountType account_type;
    double capital_gains_tax_rate;
    double ordinary_income_tax_rate;
    double state_tax_rate;

    // Taxable account, 15% capital gains, 22% ordinary income, no state tax
    TaxSettings();
    TaxSettings(AccountType type, double capital_gains, double ordinary_income,
                double state = 0.0);

    // Rate applied to the whole withdrawal of a tax-deferred account
    double ordinary_plus_state() const { return ordinary_income_tax_rate + state_tax_rate; }

    // Rate applied to the gains share of a taxable withdrawal
    double capital_gains_plus_state() const { return capital_gains_tax_rate + state_tax_rate; }

    bool operator==(const TaxSettings& other) const;
};

// Raised when tax settings make the withdrawal gross-up undefined
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Tax owed on a gross withdrawal taken from a portfolio worth portfolio_value
// with the given cost basis (both measured before the withdrawal).
//
// - tax_free:     0
// - tax_deferred: gross × (ordinary + state)
// - taxable:      0 when there is no unrealized gain, otherwise
//                 gross × (value - basis) / value × (capital gains + state)
double withdrawal_tax(double gross_withdrawal, double portfolio_value,
                      double cost_basis, const TaxSettings& settings);

// Gross withdrawal needed for the caller to receive desired_net after tax.
// Only tax-deferred accounts are grossed up: desired_net / (1 - (ordinary + state)).
// Throws ConfigurationError if that combined rate is >= 1.
double gross_up_withdrawal(double desired_net, const TaxSettings& settings);

// Year-y withdrawal target: annual_amount × (1 + inflation)^(y - 1), y >= 1
double inflation_adjusted_drawdown(double annual_amount, double inflation_rate, int year);

} // namespace wealthcalc

#endif // WEALTHCALC_TAX_HPP
