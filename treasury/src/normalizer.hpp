#pragma once

#include "fx_rates.hpp"
#include <string>

// Converts local-currency amounts into the reporting currency.
//
// Lookup order: same currency (identity, no table access), direct pair,
// inverse pair (1 / rate). No implicit cross rates through a third
// currency. Throws MissingRateError when neither pair has a rate dated on
// or before the requested date.
class CurrencyNormalizer {
public:
    CurrencyNormalizer(const FxRateTable& rates, const std::string& reporting_ccy);
    
    double rate(const std::string& from, const std::string& to,
                const std::string& date) const;
    
    double convert(double amount, const std::string& from, const std::string& date) const;
    double convert(double amount, const std::string& from, const std::string& to,
                   const std::string& date) const;
    
    bool has_rate_path(const std::string& from, const std::string& date) const;
    
    const std::string& reporting_currency() const { return reporting_ccy_; }
    
private:
    const FxRateTable& rates_;
    std::string reporting_ccy_;
};
