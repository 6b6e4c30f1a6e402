#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_lower(val);
    return v == "1" || v == "true" || v == "yes";
}

Config Config::from_env() {
    Config cfg;
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_audit = get_env("STREAM_AUDIT", "treasury.audit");
    
    cfg.pg_dsn = get_env("PG_DSN");
    cfg.persist_audit = get_env_bool("PERSIST_AUDIT", true);
    
    cfg.engine.reporting_ccy = get_env("REPORTING_CCY", "USD");
    cfg.engine.netting_epsilon = get_env_double("NETTING_EPSILON", 0.01);
    cfg.engine.netting_target = util::to_lower(get_env("NETTING_TARGET", "zero")) == "mean"
        ? NettingTarget::Mean
        : NettingTarget::Zero;
    cfg.engine.netting_exclude_pooled = get_env_bool("NETTING_EXCLUDE_POOLED", false);
    cfg.engine.top_n_entities = get_env_int("TOP_N_ENTITIES", 5);
    cfg.engine.efficiency_epsilon = get_env_double("EFFICIENCY_EPSILON", 1e-6);
    cfg.engine.parallel_rollups = get_env_bool("PARALLEL_ROLLUPS", true);
    cfg.engine.rollup_workers = get_env_int("ROLLUP_WORKERS", 8);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "treasury");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (!util::is_currency_code(engine.reporting_ccy)) {
        throw std::runtime_error("REPORTING_CCY must be a three-letter currency code");
    }
    if (engine.netting_epsilon <= 0.0) {
        throw std::runtime_error("NETTING_EPSILON must be positive");
    }
    if (engine.top_n_entities <= 0) {
        throw std::runtime_error("TOP_N_ENTITIES must be positive");
    }
    if (engine.rollup_workers <= 0) {
        throw std::runtime_error("ROLLUP_WORKERS must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Reporting currency: {}", engine.reporting_ccy);
    spdlog::info("  Netting: epsilon={}, target={}, exclude_pooled={}",
                 engine.netting_epsilon,
                 engine.netting_target == NettingTarget::Mean ? "mean" : "zero",
                 engine.netting_exclude_pooled);
    spdlog::info("  Top entities: {}, parallel rollups: {} ({} workers)",
                 engine.top_n_entities, engine.parallel_rollups, engine.rollup_workers);
}
