#include "normalizer.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

CurrencyNormalizer::CurrencyNormalizer(const FxRateTable& rates, const std::string& reporting_ccy)
    : rates_(rates)
    , reporting_ccy_(reporting_ccy)
{}

double CurrencyNormalizer::rate(const std::string& from, const std::string& to,
                                const std::string& date) const {
    if (from == to) {
        return 1.0;
    }
    
    if (auto direct = rates_.lookup(from, to, date)) {
        return *direct;
    }
    
    if (auto inverse = rates_.lookup(to, from, date)) {
        spdlog::debug("Using inverse rate {}/{} for {}/{} on {}", to, from, from, to, date);
        return 1.0 / *inverse;
    }
    
    throw MissingRateError(from + "/" + to, date);
}

double CurrencyNormalizer::convert(double amount, const std::string& from,
                                   const std::string& date) const {
    return convert(amount, from, reporting_ccy_, date);
}

double CurrencyNormalizer::convert(double amount, const std::string& from, const std::string& to,
                                   const std::string& date) const {
    if (from == to) {
        return amount;
    }
    return amount * rate(from, to, date);
}

bool CurrencyNormalizer::has_rate_path(const std::string& from, const std::string& date) const {
    if (from == reporting_ccy_) return true;
    return rates_.lookup(from, reporting_ccy_, date).has_value()
        || rates_.lookup(reporting_ccy_, from, date).has_value();
}
