#pragma once

#include "snapshot.hpp"
#include "normalizer.hpp"
#include <map>
#include <string>
#include <vector>

struct ExcludedBalance {
    CashBalance balance;
    std::string entity_code;
    std::string region;
    std::string reason;
};

// One date's balances converted to the reporting currency
struct NormalizationResult {
    std::string date;
    std::string reporting_ccy;
    std::vector<NormalizedPosition> positions;  // sorted by account_id
    std::vector<ExcludedBalance> excluded;      // no rate path on this date
    int duplicates_ignored = 0;
};

struct EntityBalance {
    std::string entity_code;
    double balance = 0.0;
};

struct GlobalPosition {
    std::string as_of_date;
    std::string reporting_ccy;
    double total_liquidity = 0.0;
    std::map<std::string, double> by_region;
    std::map<std::string, double> by_currency;      // local currency, unconverted
    std::map<std::string, double> by_entity;
    int total_accounts = 0;
    int excluded_records = 0;
    std::string notes;
};

struct RegionalPosition {
    std::string region;
    double total = 0.0;
    int account_count = 0;
    std::map<std::string, double> entities;
    std::map<std::string, double> currencies;       // local currency, unconverted
    std::vector<EntityBalance> top_entities;
};

struct TrendPoint {
    std::string date;
    double total = 0.0;
    std::map<std::string, double> by_region;
    int excluded_records = 0;
};

class LiquidityAggregator {
public:
    explicit LiquidityAggregator(const std::string& reporting_ccy, int top_n = 5);
    
    NormalizationResult normalize(const Snapshot& snapshot) const;
    NormalizationResult normalize(const Snapshot& snapshot, const std::string& date) const;
    
    GlobalPosition global_position(const Snapshot& snapshot) const;
    GlobalPosition global_position(const NormalizationResult& normalized) const;
    
    RegionalPosition regional_position(const NormalizationResult& normalized,
                                       const std::string& region) const;
    
    // Regions with at least one balance on the normalized date, ascending
    std::vector<std::string> regions(const NormalizationResult& normalized) const;
    
    // Signed sum of each entity's converted balances
    std::map<std::string, double> entity_positions(const NormalizationResult& normalized) const;
    
    // Balance descending, ties by entity code ascending
    static std::vector<EntityBalance> top_entities(const std::map<std::string, double>& by_entity,
                                                   int n);
    
    std::vector<TrendPoint> trend(const Snapshot& snapshot, const std::string& from,
                                  const std::string& to) const;
    
private:
    std::string reporting_ccy_;
    int top_n_;
};
