#include "fx_rates.hpp"
#include <iterator>

bool FxRateTable::add(const FXRate& rate) {
    auto& history = by_pair_[rate.pair()];
    auto [it, inserted] = history.emplace(rate.rate_date, rate.rate);
    if (inserted) {
        count_++;
        return true;
    }
    return it->second == rate.rate;
}

std::optional<double> FxRateTable::lookup(const std::string& base, const std::string& quote,
                                          const std::string& date) const {
    auto pair_it = by_pair_.find(base + "/" + quote);
    if (pair_it == by_pair_.end()) return std::nullopt;
    
    const auto& history = pair_it->second;
    
    // First entry dated after `date`; the one before it is the latest usable
    auto it = history.upper_bound(date);
    if (it == history.begin()) return std::nullopt;
    
    return std::prev(it)->second;
}
