#pragma once

#include "snapshot.hpp"
#include "aggregator.hpp"
#include <set>
#include <string>
#include <vector>

struct PoolParticipant {
    std::string account_id;
    std::string entity_code;
    double balance = 0.0;
    double variance = 0.0;      // balance - pool average
    PositionStatus status = PositionStatus::Surplus;
};

// Zero-balancing transfer inside a Physical pool
struct PoolSweep {
    std::string from_account;
    std::string to_account;
    double amount = 0.0;
    std::string scope = "intra_pool";
};

struct PoolPosition {
    std::string pool_name;
    PoolType pool_type = PoolType::Notional;
    std::string region;
    bool active = true;
    
    double total_balance = 0.0;
    double average_balance = 0.0;
    double efficiency = 0.0;                    // [0, 100]
    std::vector<PoolParticipant> participants;  // sorted by account id
    std::vector<std::string> unpriced_accounts; // no balance or no rate on the date
    std::vector<PoolSweep> sweeps;              // Physical pools only
    
    std::string error;                          // set when the configuration is invalid
    
    bool valid() const { return error.empty(); }
    std::string status() const;                 // Active, Inactive, Invalid
};

class CashPoolOptimizer {
public:
    CashPoolOptimizer(double efficiency_epsilon, double sweep_epsilon);
    
    // Throws InvalidPoolConfigurationError for an empty pool, an account
    // listed twice, or an account shared with another active pool.
    static void validate(const CashPool& pool, const std::vector<CashPool>& all_pools);
    
    // Never throws for configuration problems: an invalid pool comes back
    // with `error` set so that other pools still compute.
    PoolPosition calculate(const CashPool& pool, const Snapshot& snapshot,
                           const NormalizationResult& normalized) const;
    
    std::vector<PoolPosition> calculate_all(const Snapshot& snapshot,
                                            const NormalizationResult& normalized) const;
    
    // 100 * (1 - stddev / (mean + epsilon)), clamped to [0, 100]
    static double efficiency(const std::vector<double>& balances, double epsilon);
    
    // Entities owning at least one account of an active Physical pool
    static std::set<std::string> physically_pooled_entities(const Snapshot& snapshot);
    
private:
    double efficiency_epsilon_;
    double sweep_epsilon_;
};
