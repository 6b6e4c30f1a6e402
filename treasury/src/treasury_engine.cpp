#include "treasury_engine.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <system_error>

namespace {

// std::async, or inline on the caller's thread when no thread can be started
template <typename Fn>
auto launch(Fn fn) -> std::future<decltype(fn())> {
    try {
        return std::async(std::launch::async, fn);
    } catch (const std::system_error& e) {
        spdlog::warn("Rollup task runs inline: {}", e.what());
        return std::async(std::launch::deferred, fn);
    }
}

// compute(i) for every index, at most `width` tasks in flight, results in index order
template <typename T, typename Compute>
std::vector<T> batched(size_t count, size_t width, Compute compute) {
    std::vector<T> results;
    results.reserve(count);
    
    for (size_t start = 0; start < count; start += width) {
        size_t end = std::min(count, start + width);
        
        std::vector<std::future<T>> batch;
        for (size_t i = start; i < end; i++) {
            batch.push_back(launch([&compute, i]() { return compute(i); }));
        }
        for (auto& task : batch) {
            results.push_back(task.get());
        }
    }
    return results;
}

} // namespace

TreasuryEngine::TreasuryEngine(const EngineConfig& config)
    : config_(config)
    , aggregator_(config.reporting_ccy, config.top_n_entities)
    , validator_(config.reporting_ccy)
    , optimizer_(config.efficiency_epsilon, config.netting_epsilon)
    , netting_(config.netting_epsilon, config.reporting_ccy, config.netting_target)
{}

RunResult TreasuryEngine::run(const Snapshot& snapshot) const {
    RunResult result;
    result.as_of_date = snapshot.as_of_date();
    
    try {
        snapshot.require_data();
    } catch (const SnapshotEmptyError& e) {
        spdlog::warn("{}", e.what());
        result.empty = true;
        result.notes = "no data for " + snapshot.as_of_date();
        result.normalized.date = snapshot.as_of_date();
        result.normalized.reporting_ccy = config_.reporting_ccy;
        result.global = aggregator_.global_position(result.normalized);
        result.netting.netting_date = snapshot.as_of_date();
        result.netting.currency = config_.reporting_ccy;
        result.validation = validator_.run(snapshot, result.normalized);
        result.summary = summarize(result.global, snapshot, result.netting, result.validation);
        return result;
    }
    
    result.normalized = aggregator_.normalize(snapshot);
    result.global = aggregator_.global_position(result.normalized);
    result.notes = result.global.notes;
    
    // Rollups only read the snapshot and the normalized positions
    if (config_.parallel_rollups) {
        auto regions = launch([this, &result]() {
            return regional_positions(result.normalized);
        });
        auto pools = launch([this, &snapshot, &result]() {
            return pool_positions(snapshot, result.normalized);
        });
        auto validation = launch([this, &snapshot, &result]() {
            return validator_.run(snapshot, result.normalized);
        });
        
        result.netting = netting(snapshot, result.normalized);
        result.regions = regions.get();
        result.pools = pools.get();
        result.validation = validation.get();
    } else {
        result.regions = regional_positions(result.normalized);
        result.pools = pool_positions(snapshot, result.normalized);
        result.netting = netting(snapshot, result.normalized);
        result.validation = validator_.run(snapshot, result.normalized);
    }
    
    result.summary = summarize(result.global, snapshot, result.netting, result.validation);
    
    spdlog::info("Run {}: {:.2f} {} across {} accounts, {} pools, {} netting transactions, {} issues",
                 result.as_of_date, result.global.total_liquidity, config_.reporting_ccy,
                 result.global.total_accounts, result.pools.size(),
                 result.netting.total_transactions(), result.validation.total_issues());
    
    return result;
}

GlobalPosition TreasuryEngine::global_position(const Snapshot& snapshot) const {
    return aggregator_.global_position(snapshot);
}

RegionalPosition TreasuryEngine::regional_position(const Snapshot& snapshot,
                                                   const std::string& region) const {
    return aggregator_.regional_position(aggregator_.normalize(snapshot), region);
}

std::vector<PoolPosition> TreasuryEngine::pool_positions(const Snapshot& snapshot) const {
    return pool_positions(snapshot, aggregator_.normalize(snapshot));
}

PoolPosition TreasuryEngine::calculate_pool_for_region(const Snapshot& snapshot,
                                                       const std::string& region) const {
    // Pools are sorted by name
    for (const auto& pool : snapshot.pools()) {
        if (pool.active && pool.region == region) {
            return optimizer_.calculate(pool, snapshot, aggregator_.normalize(snapshot));
        }
    }
    throw PoolNotFoundError(region);
}

NettingResult TreasuryEngine::netting(const Snapshot& snapshot) const {
    return netting(snapshot, aggregator_.normalize(snapshot));
}

ValidationReport TreasuryEngine::validate(const Snapshot& snapshot) const {
    return validator_.run(snapshot, aggregator_.normalize(snapshot));
}

AnalyticsSummary TreasuryEngine::summary(const Snapshot& snapshot) const {
    return run(snapshot).summary;
}

std::vector<TrendPoint> TreasuryEngine::trend(const Snapshot& snapshot, const std::string& from,
                                              const std::string& to) const {
    return aggregator_.trend(snapshot, from, to);
}

std::vector<RegionalPosition>
TreasuryEngine::regional_positions(const NormalizationResult& normalized) const {
    std::vector<std::string> regions = aggregator_.regions(normalized);
    std::vector<RegionalPosition> positions;
    
    if (!config_.parallel_rollups) {
        for (const auto& region : regions) {
            positions.push_back(aggregator_.regional_position(normalized, region));
        }
        return positions;
    }
    
    return batched<RegionalPosition>(regions.size(), rollup_width(),
                                     [this, &normalized, &regions](size_t i) {
        return aggregator_.regional_position(normalized, regions[i]);
    });
}

std::vector<PoolPosition> TreasuryEngine::pool_positions(const Snapshot& snapshot,
                                                         const NormalizationResult& normalized) const {
    if (!config_.parallel_rollups) {
        return optimizer_.calculate_all(snapshot, normalized);
    }
    
    const auto& pools = snapshot.pools();
    return batched<PoolPosition>(pools.size(), rollup_width(),
                                 [this, &pools, &snapshot, &normalized](size_t i) {
        return optimizer_.calculate(pools[i], snapshot, normalized);
    });
}

size_t TreasuryEngine::rollup_width() const {
    return static_cast<size_t>(std::max(1, config_.rollup_workers));
}

NettingResult TreasuryEngine::netting(const Snapshot& snapshot,
                                      const NormalizationResult& normalized) const {
    std::set<std::string> excluded;
    if (config_.netting_exclude_pooled) {
        excluded = CashPoolOptimizer::physically_pooled_entities(snapshot);
    }
    return netting_.run(aggregator_.entity_positions(normalized), normalized.date, excluded);
}

AnalyticsSummary TreasuryEngine::summarize(const GlobalPosition& global, const Snapshot& snapshot,
                                           const NettingResult& netting,
                                           const ValidationReport& validation) const {
    AnalyticsSummary s;
    s.as_of_date = global.as_of_date;
    s.reporting_ccy = global.reporting_ccy;
    s.total_liquidity = global.total_liquidity;
    s.total_accounts = global.total_accounts;
    s.total_cash_pools = static_cast<int>(snapshot.pools().size());
    s.active_netting_transactions = netting.total_transactions();
    s.data_quality_issues = validation.total_issues();
    s.regional_breakdown = global.by_region;
    s.top_entities = LiquidityAggregator::top_entities(global.by_entity, config_.top_n_entities);
    return s;
}
