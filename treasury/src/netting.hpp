#pragma once

#include "records.hpp"
#include "engine_config.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

// One directed transfer produced by the matcher; `from` holds the surplus
struct Settlement {
    std::string from;
    std::string to;
    double amount = 0.0;
};

struct NettingTransaction {
    std::string from_entity;
    std::string to_entity;
    double amount = 0.0;
    std::string currency;
    std::string date;
    TransactionStatus status = TransactionStatus::Pending;
};

struct NettingResult {
    std::string netting_date;
    std::string currency;
    std::vector<NettingTransaction> transactions;
    std::vector<std::string> excluded_entities;
    
    // Surplus or deficit left over when positions do not sum to the target
    double unmatched_residual = 0.0;
    
    int total_transactions() const { return static_cast<int>(transactions.size()); }
    double total_netted() const;
    std::map<std::string, int> by_status() const;
};

// Multilateral netting of entity positions in a single settlement currency.
//
// Creditors (position > 0) and debtors (position < 0) are each sorted by
// magnitude descending, ties by key ascending. The current creditor is
// matched against the current debtor for min(remaining) and whichever side
// drops to epsilon or below advances. At most C + D - 1 transfers result.
// The loop threads remaining balances through every step and must stay
// sequential.
class NettingEngine {
public:
    NettingEngine(double epsilon, const std::string& settlement_ccy,
                  NettingTarget target = NettingTarget::Zero);
    
    NettingResult run(const std::map<std::string, double>& positions, const std::string& date,
                      const std::set<std::string>& excluded = {}) const;
    
    static std::vector<Settlement> match(const std::map<std::string, double>& positions,
                                         double epsilon);
    
    double epsilon() const { return epsilon_; }
    
private:
    double epsilon_;
    std::string settlement_ccy_;
    NettingTarget target_;
};
