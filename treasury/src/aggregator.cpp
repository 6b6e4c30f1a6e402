#include "aggregator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

LiquidityAggregator::LiquidityAggregator(const std::string& reporting_ccy, int top_n)
    : reporting_ccy_(reporting_ccy)
    , top_n_(top_n)
{}

NormalizationResult LiquidityAggregator::normalize(const Snapshot& snapshot) const {
    return normalize(snapshot, snapshot.as_of_date());
}

NormalizationResult LiquidityAggregator::normalize(const Snapshot& snapshot,
                                                   const std::string& date) const {
    NormalizationResult result;
    result.date = date;
    result.reporting_ccy = reporting_ccy_;
    
    CurrencyNormalizer normalizer(snapshot.rates(), reporting_ccy_);
    
    const std::vector<CashBalance> slice = (date == snapshot.as_of_date())
        ? snapshot.as_of_balances()
        : snapshot.balances_on(date);
    
    // Slice is sorted by account id, so the first balance of a duplicated
    // (account, date) is the one kept
    std::string last_account;
    for (const auto& balance : slice) {
        if (balance.account_id == last_account) {
            result.duplicates_ignored++;
            continue;
        }
        last_account = balance.account_id;
        
        const BankAccount* account = snapshot.find_account(balance.account_id);
        if (!account) continue;
        
        try {
            NormalizedPosition pos;
            pos.account_id = balance.account_id;
            pos.entity_code = account->entity_code;
            pos.region = account->region;
            pos.currency = balance.currency;
            pos.date = balance.date;
            pos.amount_local = balance.amount_local;
            pos.amount_reporting = normalizer.convert(balance.amount_local, balance.currency, date);
            result.positions.push_back(pos);
        } catch (const MissingRateError& e) {
            spdlog::warn("Excluding balance of {}: {}", balance.account_id, e.what());
            result.excluded.push_back({balance, account->entity_code, account->region, e.what()});
        }
    }
    
    if (result.duplicates_ignored > 0) {
        spdlog::warn("Ignored {} duplicate balances on {}", result.duplicates_ignored, date);
    }
    
    return result;
}

GlobalPosition LiquidityAggregator::global_position(const Snapshot& snapshot) const {
    return global_position(normalize(snapshot));
}

GlobalPosition LiquidityAggregator::global_position(const NormalizationResult& normalized) const {
    GlobalPosition gp;
    gp.as_of_date = normalized.date;
    gp.reporting_ccy = normalized.reporting_ccy;
    
    for (const auto& pos : normalized.positions) {
        gp.total_liquidity += pos.amount_reporting;
        gp.by_region[pos.region] += pos.amount_reporting;
        gp.by_entity[pos.entity_code] += pos.amount_reporting;
        gp.by_currency[pos.currency] += pos.amount_local;
    }
    
    // Distribution reporting needs no rate, so excluded balances still count here
    for (const auto& ex : normalized.excluded) {
        gp.by_currency[ex.balance.currency] += ex.balance.amount_local;
    }
    
    gp.total_accounts = static_cast<int>(normalized.positions.size() + normalized.excluded.size());
    gp.excluded_records = static_cast<int>(normalized.excluded.size());
    
    if (gp.excluded_records > 0) {
        gp.notes = "Excludes " + std::to_string(gp.excluded_records)
                 + " balances without an FX rate to " + gp.reporting_ccy + ".";
    }
    
    return gp;
}

RegionalPosition LiquidityAggregator::regional_position(const NormalizationResult& normalized,
                                                        const std::string& region) const {
    RegionalPosition rp;
    rp.region = region;
    
    for (const auto& pos : normalized.positions) {
        if (pos.region != region) continue;
        rp.total += pos.amount_reporting;
        rp.entities[pos.entity_code] += pos.amount_reporting;
        rp.currencies[pos.currency] += pos.amount_local;
        rp.account_count++;
    }
    
    for (const auto& ex : normalized.excluded) {
        if (ex.region != region) continue;
        rp.currencies[ex.balance.currency] += ex.balance.amount_local;
        rp.account_count++;
    }
    
    rp.top_entities = top_entities(rp.entities, top_n_);
    return rp;
}

std::vector<std::string> LiquidityAggregator::regions(const NormalizationResult& normalized) const {
    std::set<std::string> regions;
    for (const auto& pos : normalized.positions) regions.insert(pos.region);
    for (const auto& ex : normalized.excluded) regions.insert(ex.region);
    return std::vector<std::string>(regions.begin(), regions.end());
}

std::map<std::string, double>
LiquidityAggregator::entity_positions(const NormalizationResult& normalized) const {
    std::map<std::string, double> positions;
    for (const auto& pos : normalized.positions) {
        positions[pos.entity_code] += pos.amount_reporting;
    }
    return positions;
}

std::vector<EntityBalance>
LiquidityAggregator::top_entities(const std::map<std::string, double>& by_entity, int n) {
    std::vector<EntityBalance> ranked;
    for (const auto& [code, balance] : by_entity) {
        ranked.push_back({code, balance});
    }
    
    std::sort(ranked.begin(), ranked.end(),
              [](const EntityBalance& a, const EntityBalance& b) {
                  if (a.balance != b.balance) return a.balance > b.balance;
                  return a.entity_code < b.entity_code;
              });
    
    if (n >= 0 && ranked.size() > static_cast<size_t>(n)) {
        ranked.resize(n);
    }
    return ranked;
}

std::vector<TrendPoint> LiquidityAggregator::trend(const Snapshot& snapshot, const std::string& from,
                                                   const std::string& to) const {
    std::vector<TrendPoint> points;
    
    for (const auto& date : snapshot.balance_dates()) {
        if (date < from || date > to) continue;
        
        auto gp = global_position(normalize(snapshot, date));
        
        TrendPoint point;
        point.date = date;
        point.total = gp.total_liquidity;
        point.by_region = gp.by_region;
        point.excluded_records = gp.excluded_records;
        points.push_back(point);
    }
    
    return points;
}
