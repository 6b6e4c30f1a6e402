#pragma once

#include "engine_config.hpp"
#include "snapshot.hpp"
#include "aggregator.hpp"
#include "validation.hpp"
#include "pool_optimizer.hpp"
#include "netting.hpp"
#include <string>
#include <vector>

struct AnalyticsSummary {
    std::string as_of_date;
    std::string reporting_ccy;
    double total_liquidity = 0.0;
    int total_accounts = 0;
    int total_cash_pools = 0;
    int active_netting_transactions = 0;
    int data_quality_issues = 0;
    std::map<std::string, double> regional_breakdown;
    std::vector<EntityBalance> top_entities;
};

// Everything one invocation derives from a snapshot. Owned by the caller;
// nothing here is cached between runs.
struct RunResult {
    std::string as_of_date;
    bool empty = false;
    std::string notes;
    
    NormalizationResult normalized;
    GlobalPosition global;
    std::vector<RegionalPosition> regions;
    std::vector<PoolPosition> pools;
    NettingResult netting;
    ValidationReport validation;
    AnalyticsSummary summary;
};

class TreasuryEngine {
public:
    explicit TreasuryEngine(const EngineConfig& config);
    
    // Full pipeline. An empty snapshot yields an empty-but-valid result.
    RunResult run(const Snapshot& snapshot) const;
    
    GlobalPosition global_position(const Snapshot& snapshot) const;
    RegionalPosition regional_position(const Snapshot& snapshot, const std::string& region) const;
    std::vector<PoolPosition> pool_positions(const Snapshot& snapshot) const;
    
    // First active pool of the region by name; throws PoolNotFoundError
    PoolPosition calculate_pool_for_region(const Snapshot& snapshot, const std::string& region) const;
    
    NettingResult netting(const Snapshot& snapshot) const;
    ValidationReport validate(const Snapshot& snapshot) const;
    AnalyticsSummary summary(const Snapshot& snapshot) const;
    std::vector<TrendPoint> trend(const Snapshot& snapshot, const std::string& from,
                                  const std::string& to) const;
    
    const EngineConfig& config() const { return config_; }
    
private:
    EngineConfig config_;
    LiquidityAggregator aggregator_;
    ValidationEngine validator_;
    CashPoolOptimizer optimizer_;
    NettingEngine netting_;
    
    size_t rollup_width() const;
    std::vector<RegionalPosition> regional_positions(const NormalizationResult& normalized) const;
    std::vector<PoolPosition> pool_positions(const Snapshot& snapshot,
                                             const NormalizationResult& normalized) const;
    NettingResult netting(const Snapshot& snapshot, const NormalizationResult& normalized) const;
    AnalyticsSummary summarize(const GlobalPosition& global, const Snapshot& snapshot,
                               const NettingResult& netting, const ValidationReport& validation) const;
};
