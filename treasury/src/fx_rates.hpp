#pragma once

#include "records.hpp"
#include <map>
#include <string>
#include <optional>

// Rate history per currency pair, keyed by rate date.
class FxRateTable {
public:
    // Returns false when the table already holds a different rate for the
    // same pair and date; the existing rate is kept.
    bool add(const FXRate& rate);
    
    // Latest rate for base/quote dated on or before `date`. Never looks ahead.
    std::optional<double> lookup(const std::string& base, const std::string& quote,
                                 const std::string& date) const;
    
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    
private:
    std::map<std::string, std::map<std::string, double>> by_pair_;
    size_t count_ = 0;
};
