#pragma once

#include <string>
#include <optional>

namespace util {
    std::string current_iso8601();
    std::string to_lower(std::string str);
    std::string redact_dsn(const std::string& dsn);
    
    // Money values are reported with two decimals
    double round2(double value);
    
    bool is_currency_code(const std::string& code);
    
    // Accepts "YYYY-MM-DD" or a longer ISO-8601 timestamp, returns the date part
    std::optional<std::string> iso_date(const std::string& value);
    std::string add_days(const std::string& iso_date, int days);
    
    // Whole decimal number in [1, max]; nullopt for anything else
    std::optional<int> parse_positive_int(const std::string& text, int max);
}
