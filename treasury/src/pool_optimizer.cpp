#include "pool_optimizer.hpp"
#include "netting.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>

std::string PoolPosition::status() const {
    if (!valid()) return "Invalid";
    if (!active || participants.empty()) return "Inactive";
    return "Active";
}

CashPoolOptimizer::CashPoolOptimizer(double efficiency_epsilon, double sweep_epsilon)
    : efficiency_epsilon_(efficiency_epsilon)
    , sweep_epsilon_(sweep_epsilon)
{}

void CashPoolOptimizer::validate(const CashPool& pool, const std::vector<CashPool>& all_pools) {
    if (pool.participant_account_ids.empty()) {
        throw InvalidPoolConfigurationError(pool.pool_name, "no participants");
    }
    
    std::set<std::string> seen;
    for (const auto& account : pool.participant_account_ids) {
        if (!seen.insert(account).second) {
            throw InvalidPoolConfigurationError(pool.pool_name, "account " + account + " listed twice");
        }
    }
    
    for (const auto& other : all_pools) {
        if (!other.active || other.pool_name == pool.pool_name) continue;
        
        for (const auto& account : other.participant_account_ids) {
            if (seen.count(account)) {
                throw InvalidPoolConfigurationError(
                    pool.pool_name, "account " + account + " also in pool " + other.pool_name);
            }
        }
    }
}

double CashPoolOptimizer::efficiency(const std::vector<double>& balances, double epsilon) {
    if (balances.empty()) return 0.0;
    
    double n = static_cast<double>(balances.size());
    double sum = 0.0;
    for (double b : balances) sum += b;
    double mean = sum / n;
    
    double sq = 0.0;
    for (double b : balances) sq += (b - mean) * (b - mean);
    double stddev = std::sqrt(sq / n);
    
    if (stddev == 0.0) return 100.0;
    
    // Dispersion around a non-positive mean has no surplus to concentrate
    double denom = mean + epsilon;
    if (denom <= 0.0) return 0.0;
    
    double score = 100.0 * (1.0 - stddev / denom);
    return std::clamp(score, 0.0, 100.0);
}

PoolPosition CashPoolOptimizer::calculate(const CashPool& pool, const Snapshot& snapshot,
                                          const NormalizationResult& normalized) const {
    PoolPosition pp;
    pp.pool_name = pool.pool_name;
    pp.pool_type = pool.type;
    pp.region = pool.region;
    pp.active = pool.active;
    
    if (!pool.active) {
        return pp;
    }
    
    try {
        validate(pool, snapshot.pools());
    } catch (const InvalidPoolConfigurationError& e) {
        spdlog::warn("{}", e.what());
        pp.error = e.what();
        return pp;
    }
    
    std::map<std::string, const NormalizedPosition*> by_account;
    for (const auto& pos : normalized.positions) {
        by_account[pos.account_id] = &pos;
    }
    
    std::vector<std::string> accounts = pool.participant_account_ids;
    std::sort(accounts.begin(), accounts.end());
    
    std::vector<double> balances;
    for (const auto& account : accounts) {
        auto it = by_account.find(account);
        if (it == by_account.end()) {
            pp.unpriced_accounts.push_back(account);
            continue;
        }
        
        PoolParticipant p;
        p.account_id = account;
        p.entity_code = it->second->entity_code;
        p.balance = it->second->amount_reporting;
        pp.participants.push_back(p);
        
        balances.push_back(p.balance);
        pp.total_balance += p.balance;
    }
    
    if (!pp.unpriced_accounts.empty()) {
        spdlog::warn("Pool {}: {} participants without a usable balance on {}",
                     pool.pool_name, pp.unpriced_accounts.size(), normalized.date);
    }
    
    if (pp.participants.empty()) {
        return pp;
    }
    
    pp.average_balance = pp.total_balance / static_cast<double>(pp.participants.size());
    
    std::map<std::string, double> variances;
    for (auto& p : pp.participants) {
        p.variance = p.balance - pp.average_balance;
        p.status = p.variance >= 0.0 ? PositionStatus::Surplus : PositionStatus::Deficit;
        variances[p.account_id] = p.variance;
    }
    
    pp.efficiency = efficiency(balances, efficiency_epsilon_);
    
    // Notional pools only report; Physical pools also sweep to the average
    if (pool.type == PoolType::Physical) {
        for (const auto& s : NettingEngine::match(variances, sweep_epsilon_)) {
            PoolSweep sweep;
            sweep.from_account = s.from;
            sweep.to_account = s.to;
            sweep.amount = s.amount;
            pp.sweeps.push_back(sweep);
        }
    }
    
    spdlog::debug("Pool {}: total {:.2f}, average {:.2f}, efficiency {:.2f}, {} sweeps",
                  pool.pool_name, pp.total_balance, pp.average_balance, pp.efficiency,
                  pp.sweeps.size());
    
    return pp;
}

std::vector<PoolPosition> CashPoolOptimizer::calculate_all(const Snapshot& snapshot,
                                                           const NormalizationResult& normalized) const {
    std::vector<PoolPosition> positions;
    for (const auto& pool : snapshot.pools()) {
        positions.push_back(calculate(pool, snapshot, normalized));
    }
    return positions;
}

std::set<std::string> CashPoolOptimizer::physically_pooled_entities(const Snapshot& snapshot) {
    std::set<std::string> entities;
    for (const auto& pool : snapshot.pools()) {
        if (!pool.active || pool.type != PoolType::Physical) continue;
        
        for (const auto& account_id : pool.participant_account_ids) {
            if (const BankAccount* account = snapshot.find_account(account_id)) {
                entities.insert(account->entity_code);
            }
        }
    }
    return entities;
}
