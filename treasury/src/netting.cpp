#include "netting.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

struct Remaining {
    std::string key;
    double amount;      // magnitude
};

void sort_by_magnitude(std::vector<Remaining>& side) {
    std::sort(side.begin(), side.end(),
              [](const Remaining& a, const Remaining& b) {
                  if (a.amount != b.amount) return a.amount > b.amount;
                  return a.key < b.key;
              });
}

} // namespace

double NettingResult::total_netted() const {
    double total = 0.0;
    for (const auto& tx : transactions) {
        total += tx.amount;
    }
    return total;
}

std::map<std::string, int> NettingResult::by_status() const {
    std::map<std::string, int> counts;
    for (const auto& tx : transactions) {
        counts[to_string(tx.status)]++;
    }
    return counts;
}

NettingEngine::NettingEngine(double epsilon, const std::string& settlement_ccy, NettingTarget target)
    : epsilon_(epsilon)
    , settlement_ccy_(settlement_ccy)
    , target_(target)
{}

std::vector<Settlement> NettingEngine::match(const std::map<std::string, double>& positions,
                                             double epsilon) {
    std::vector<Remaining> creditors;
    std::vector<Remaining> debtors;
    
    for (const auto& [key, position] : positions) {
        // Near-flat positions would only produce noise transfers; a
        // non-finite one can never be decremented to zero
        if (!std::isfinite(position) || std::abs(position) <= epsilon) continue;
        
        if (position > 0) {
            creditors.push_back({key, position});
        } else {
            debtors.push_back({key, -position});
        }
    }
    
    sort_by_magnitude(creditors);
    sort_by_magnitude(debtors);
    
    std::vector<Settlement> settlements;
    size_t c = 0;
    size_t d = 0;
    
    while (c < creditors.size() && d < debtors.size()) {
        double amount = std::min(creditors[c].amount, debtors[d].amount);
        settlements.push_back({creditors[c].key, debtors[d].key, amount});
        
        creditors[c].amount -= amount;
        debtors[d].amount -= amount;
        
        if (creditors[c].amount <= epsilon) c++;
        if (debtors[d].amount <= epsilon) d++;
    }
    
    return settlements;
}

NettingResult NettingEngine::run(const std::map<std::string, double>& positions,
                                 const std::string& date,
                                 const std::set<std::string>& excluded) const {
    NettingResult result;
    result.netting_date = date;
    result.currency = settlement_ccy_;
    
    std::map<std::string, double> eligible;
    for (const auto& [entity, position] : positions) {
        if (excluded.count(entity)) {
            result.excluded_entities.push_back(entity);
            continue;
        }
        if (!std::isfinite(position)) {
            spdlog::warn("Netting {}: entity {} has a non-finite position, excluded", date, entity);
            result.excluded_entities.push_back(entity);
            continue;
        }
        eligible[entity] = position;
    }
    
    if (target_ == NettingTarget::Mean && !eligible.empty()) {
        // Running mean stays finite where a plain sum could overflow
        double mean = 0.0;
        double n = 0.0;
        for (const auto& [entity, position] : eligible) {
            n += 1.0;
            mean += position / n - mean / n;
        }
        for (auto& [entity, position] : eligible) position -= mean;
    }
    
    for (const auto& s : match(eligible, epsilon_)) {
        NettingTransaction tx;
        tx.from_entity = s.from;
        tx.to_entity = s.to;
        tx.amount = s.amount;
        tx.currency = settlement_ccy_;
        tx.date = date;
        tx.status = TransactionStatus::Pending;
        result.transactions.push_back(tx);
    }
    
    double net = 0.0;
    for (const auto& [entity, position] : eligible) {
        if (std::abs(position) > epsilon_) net += position;
    }
    result.unmatched_residual = std::abs(net) > epsilon_ ? net : 0.0;
    
    spdlog::info("Netting {}: {} entities, {} excluded, {} transactions, {:.2f} {} netted",
                 date, eligible.size(), result.excluded_entities.size(),
                 result.total_transactions(), result.total_netted(), settlement_ccy_);
    if (result.unmatched_residual != 0.0) {
        spdlog::warn("Netting {} leaves {:.2f} {} unmatched", date, result.unmatched_residual,
                     settlement_ccy_);
    }
    
    return result;
}
