#include "config.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "health.hpp"
#include "snapshot.hpp"
#include "treasury_engine.hpp"
#include "report_json.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <optional>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

// Ten years of daily points
constexpr int kMaxTrendDays = 3660;

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("treasury", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Snapshot date from ?date=YYYY-MM-DD, else the latest balance date on file
std::string resolve_date(const httplib::Request& req, PostgresStore& pg) {
    if (req.has_param("date")) {
        auto date = util::iso_date(req.get_param_value("date"));
        if (!date) {
            throw std::invalid_argument("date must be YYYY-MM-DD");
        }
        return *date;
    }
    return pg.latest_balance_date().value_or(util::current_iso8601().substr(0, 10));
}

Snapshot load_snapshot(const httplib::Request& req, PostgresStore& pg) {
    std::string date = resolve_date(req, pg);
    return SnapshotBuilder::from_json(pg.load_snapshot_records(date), date);
}

template <typename Handler>
void guarded(const std::string& route, httplib::Response& res, Handler handler) {
    try {
        handler();
    } catch (const std::invalid_argument& e) {
        send_json(res, {{"detail", e.what()}}, 400);
    } catch (const PoolNotFoundError& e) {
        send_json(res, {{"detail", e.what()}}, 404);
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", route, e.what());
        send_json(res, {{"detail", e.what()}}, 500);
    }
}

void register_routes(httplib::Server& server,
                     std::shared_ptr<Config> config,
                     std::shared_ptr<PostgresStore> pg,
                     std::shared_ptr<RedisBus> redis,
                     std::shared_ptr<HealthCheck> health,
                     std::shared_ptr<TreasuryEngine> engine) {
    
    server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
        send_json(res, health->get_status(), health->is_healthy() ? 200 : 503);
    });
    
    server.Get("/api/treasury/liquidity/global-position",
               [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("global-position", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            send_json(res, report::global_position(engine->global_position(snapshot)));
        });
    });
    
    server.Get(R"(/api/treasury/liquidity/by-region/([A-Za-z_]+))",
               [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("by-region", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            std::string region = req.matches[1];
            send_json(res, report::regional_position(engine->regional_position(snapshot, region)));
        });
    });
    
    server.Get("/api/treasury/cash-pool/status",
               [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("cash-pool/status", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            send_json(res, report::pool_status_list(engine->pool_positions(snapshot)));
        });
    });
    
    server.Post(R"(/api/treasury/cash-pool/calculate/([A-Za-z_]+))",
                [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("cash-pool/calculate", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            std::string region = req.matches[1];
            send_json(res, report::pool_calculation(engine->calculate_pool_for_region(snapshot, region)));
        });
    });
    
    server.Post("/api/treasury/netting/run",
                [config, pg, redis, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("netting/run", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            auto result = engine->netting(snapshot);
            
            if (config->persist_audit) {
                pg->save_netting_results(result);
            }
            redis->publish_audit(config->stream_audit, {
                {"event", "netting_run"},
                {"netting_date", result.netting_date},
                {"total_transactions", result.total_transactions()},
                {"total_netted_amount", util::round2(result.total_netted())},
                {"ts", util::current_iso8601()}
            });
            
            send_json(res, report::netting_result(result));
        });
    });
    
    server.Get("/api/treasury/netting/results",
               [pg](const httplib::Request& req, httplib::Response& res) {
        guarded("netting/results", res, [&]() {
            std::optional<std::string> date;
            if (req.has_param("date")) {
                date = util::iso_date(req.get_param_value("date"));
                if (!date) {
                    throw std::invalid_argument("date must be YYYY-MM-DD");
                }
            } else {
                date = pg->latest_netting_date();
            }
            
            NettingResult stored;
            if (date) {
                stored = pg->load_netting_results(*date);
            }
            send_json(res, report::netting_result(stored));
        });
    });
    
    server.Post("/api/treasury/validate",
                [config, pg, redis, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("validate", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            auto current = engine->validate(snapshot);
            auto merged = ValidationEngine::reconcile(pg->load_validation_logs(), current);
            
            if (config->persist_audit) {
                pg->replace_validation_logs(merged);
            }
            redis->publish_audit(config->stream_audit, {
                {"event", "validation_run"},
                {"check_date", current.check_date},
                {"total_issues", current.total_issues()},
                {"ts", util::current_iso8601()}
            });
            
            nlohmann::json body = report::validation_report(current);
            body["resolved"] = nlohmann::json::array();
            for (size_t i = current.issues.size(); i < merged.size(); i++) {
                body["resolved"].push_back(report::validation_issue(merged[i]));
            }
            send_json(res, body);
        });
    });
    
    server.Get("/api/treasury/validation/report",
               [pg](const httplib::Request&, httplib::Response& res) {
        guarded("validation/report", res, [&]() {
            ValidationReport stored;
            stored.issues = pg->load_validation_logs();
            send_json(res, report::validation_report(stored));
        });
    });
    
    server.Get("/api/treasury/analytics/summary",
               [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("analytics/summary", res, [&]() {
            auto snapshot = load_snapshot(req, *pg);
            send_json(res, report::analytics_summary(engine->summary(snapshot)));
        });
    });
    
    server.Get("/api/treasury/analytics/trends",
               [pg, engine](const httplib::Request& req, httplib::Response& res) {
        guarded("analytics/trends", res, [&]() {
            int days = 30;
            if (req.has_param("days")) {
                auto parsed = util::parse_positive_int(req.get_param_value("days"), kMaxTrendDays);
                if (!parsed) {
                    throw std::invalid_argument(
                        fmt::format("days must be a whole number from 1 to {}", kMaxTrendDays));
                }
                days = *parsed;
            }
            
            auto snapshot = load_snapshot(req, *pg);
            std::string to = snapshot.as_of_date();
            std::string from = util::add_days(to, -(days - 1));
            send_json(res, report::trend(engine->trend(snapshot, from, to), from, to));
        });
    });
}

int main() {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Treasury Analytics Service v1.0");
        spdlog::info("==============================================");
        
        config->validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        auto health = std::make_shared<HealthCheck>(redis, pg);
        auto engine = std::make_shared<TreasuryEngine>(config->engine);
        
        pg->init_schema();
        
        httplib::Server server;
        register_routes(server, config, pg, redis, health, engine);
        
        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });
        
        spdlog::info("{} service started", config->service_name);
        
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        
        spdlog::info("Stopping services...");
        server.stop();
        if (http_thread.joinable()) http_thread.join();
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
