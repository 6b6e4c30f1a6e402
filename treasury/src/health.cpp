#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg)
    : redis_(redis), pg_(pg) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    
    return {
        {"ok", redis_ok && pg_ok},
        {"status", pg_ok ? "healthy" : "degraded"},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"timestamp", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && pg_->ping();
}
