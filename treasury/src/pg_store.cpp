#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS entities (
                entity_code TEXT PRIMARY KEY,
                entity_name TEXT,
                country_code TEXT,
                region TEXT
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS bank_accounts (
                account_id TEXT PRIMARY KEY,
                entity_code TEXT NOT NULL,
                currency TEXT NOT NULL,
                region TEXT,
                account_type TEXT,
                active BOOLEAN NOT NULL DEFAULT TRUE
            )
        )");
        
        // No uniqueness on (account_id, balance_date): duplicates are a
        // validation finding, not an import failure
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS cash_balances (
                id BIGSERIAL PRIMARY KEY,
                account_id TEXT NOT NULL,
                balance_date DATE NOT NULL,
                currency TEXT NOT NULL,
                balance_local NUMERIC
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS fx_rates (
                id BIGSERIAL PRIMARY KEY,
                currency_pair TEXT NOT NULL,
                rate NUMERIC,
                rate_date DATE NOT NULL
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS cash_pools (
                pool_name TEXT PRIMARY KEY,
                pool_type TEXT NOT NULL,
                region TEXT,
                header_account TEXT,
                currency TEXT,
                participant_accounts JSONB NOT NULL DEFAULT '[]',
                active BOOLEAN NOT NULL DEFAULT TRUE
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS netting_results (
                id BIGSERIAL PRIMARY KEY,
                netting_date DATE NOT NULL,
                seq INT NOT NULL,
                from_entity TEXT NOT NULL,
                to_entity TEXT NOT NULL,
                amount NUMERIC NOT NULL,
                currency TEXT NOT NULL,
                status TEXT NOT NULL CHECK (status IN ('Pending','Settled','Failed')),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS netting_runs (
                netting_date DATE PRIMARY KEY,
                currency TEXT NOT NULL,
                unmatched_residual NUMERIC NOT NULL DEFAULT 0,
                excluded_entities JSONB NOT NULL DEFAULT '[]'::jsonb,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS validation_logs (
                id BIGSERIAL PRIMARY KEY,
                check_date DATE NOT NULL,
                check_type TEXT NOT NULL,
                severity TEXT NOT NULL,
                description TEXT,
                affected_records INT NOT NULL,
                status TEXT NOT NULL CHECK (status IN ('Open','Resolved'))
            )
        )");
        
        txn.commit();
        spdlog::info("Database schema initialized");
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

nlohmann::json PostgresStore::load_snapshot_records(const std::string& date) {
    nlohmann::json doc = {
        {"accounts", nlohmann::json::array()},
        {"balances", nlohmann::json::array()},
        {"fx_rates", nlohmann::json::array()},
        {"entities", nlohmann::json::array()},
        {"pools", nlohmann::json::array()}
    };
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        for (const auto& row : txn.exec(
                 "SELECT entity_code, entity_name, country_code, region FROM entities "
                 "ORDER BY entity_code")) {
            doc["entities"].push_back({
                {"entity_code", row[0].as<std::string>()},
                {"name", row[1].is_null() ? "" : row[1].as<std::string>()},
                {"country", row[2].is_null() ? "" : row[2].as<std::string>()},
                {"region", row[3].is_null() ? "" : row[3].as<std::string>()}
            });
        }
        
        for (const auto& row : txn.exec(
                 "SELECT account_id, entity_code, currency, region, account_type, active "
                 "FROM bank_accounts ORDER BY account_id")) {
            nlohmann::json account = {
                {"account_id", row[0].as<std::string>()},
                {"entity_code", row[1].as<std::string>()},
                {"currency", row[2].as<std::string>()},
                {"type", row[4].is_null() ? "" : row[4].as<std::string>()},
                {"active", row[5].as<bool>()}
            };
            if (!row[3].is_null()) {
                account["region"] = row[3].as<std::string>();
            }
            doc["accounts"].push_back(account);
        }
        
        for (const auto& row : txn.exec_params(
                 "SELECT account_id, balance_date::text, currency, balance_local::text "
                 "FROM cash_balances WHERE balance_date <= $1::date "
                 "ORDER BY balance_date, account_id, id", date)) {
            nlohmann::json balance = {
                {"account_id", row[0].as<std::string>()},
                {"date", row[1].as<std::string>()},
                {"currency", row[2].as<std::string>()}
            };
            // Left as text so the snapshot builder decides what is numeric
            if (!row[3].is_null()) {
                balance["amount_local"] = row[3].as<std::string>();
            }
            doc["balances"].push_back(balance);
        }
        
        for (const auto& row : txn.exec_params(
                 "SELECT currency_pair, rate::text, rate_date::text FROM fx_rates "
                 "WHERE rate_date <= $1::date ORDER BY rate_date, currency_pair, id", date)) {
            nlohmann::json rate = {
                {"pair", row[0].as<std::string>()},
                {"rate_date", row[2].as<std::string>()}
            };
            if (!row[1].is_null()) {
                rate["rate"] = row[1].as<std::string>();
            }
            doc["fx_rates"].push_back(rate);
        }
        
        for (const auto& row : txn.exec(
                 "SELECT pool_name, pool_type, region, header_account, currency, "
                 "participant_accounts::text, active FROM cash_pools ORDER BY pool_name")) {
            doc["pools"].push_back({
                {"pool_name", row[0].as<std::string>()},
                {"type", row[1].as<std::string>()},
                {"region", row[2].is_null() ? "" : row[2].as<std::string>()},
                {"header_account", row[3].is_null() ? "" : row[3].as<std::string>()},
                {"currency", row[4].is_null() ? "" : row[4].as<std::string>()},
                {"participant_account_ids", nlohmann::json::parse(row[5].as<std::string>())},
                {"active", row[6].as<bool>()}
            });
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load snapshot records for {}: {}", date, e.what());
        throw;
    }
    
    spdlog::debug("Loaded {} accounts, {} balances, {} rates for {}",
                  doc["accounts"].size(), doc["balances"].size(), doc["fx_rates"].size(), date);
    return doc;
}

std::optional<std::string> PostgresStore::latest_balance_date() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec("SELECT MAX(balance_date)::text FROM cash_balances");
        txn.commit();
        
        if (result.empty() || result[0][0].is_null()) {
            return std::nullopt;
        }
        return result[0][0].as<std::string>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to read latest balance date: {}", e.what());
        throw;
    }
}

void PostgresStore::save_netting_results(const NettingResult& result) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec_params("DELETE FROM netting_results WHERE netting_date = $1::date",
                        result.netting_date);
        txn.exec_params(
            "INSERT INTO netting_runs (netting_date, currency, unmatched_residual, excluded_entities) "
            "VALUES ($1::date, $2, $3, $4::jsonb) "
            "ON CONFLICT (netting_date) DO UPDATE SET currency = EXCLUDED.currency, "
            "unmatched_residual = EXCLUDED.unmatched_residual, "
            "excluded_entities = EXCLUDED.excluded_entities, created_at = NOW()",
            result.netting_date,
            result.currency,
            util::round2(result.unmatched_residual),
            nlohmann::json(result.excluded_entities).dump()
        );
        
        int seq = 0;
        for (const auto& tx : result.transactions) {
            txn.exec_params(
                "INSERT INTO netting_results "
                "(netting_date, seq, from_entity, to_entity, amount, currency, status) "
                "VALUES ($1::date, $2, $3, $4, $5, $6, $7)",
                tx.date,
                seq++,
                tx.from_entity,
                tx.to_entity,
                util::round2(tx.amount),
                tx.currency,
                to_string(tx.status)
            );
        }
        
        txn.commit();
        spdlog::info("Saved {} netting transactions for {}", result.transactions.size(),
                     result.netting_date);
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save netting results: {}", e.what());
        throw;
    }
}

NettingResult PostgresStore::load_netting_results(const std::string& date) {
    NettingResult result;
    result.netting_date = date;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto run = txn.exec_params(
            "SELECT currency, unmatched_residual::float8, excluded_entities::text "
            "FROM netting_runs WHERE netting_date = $1::date", date);
        if (!run.empty()) {
            result.currency = run[0][0].as<std::string>();
            result.unmatched_residual = run[0][1].as<double>();
            result.excluded_entities = nlohmann::json::parse(run[0][2].as<std::string>())
                                           .get<std::vector<std::string>>();
        }
        
        auto rows = txn.exec_params(
            "SELECT from_entity, to_entity, amount::float8, currency, status "
            "FROM netting_results WHERE netting_date = $1::date ORDER BY seq", date);
        
        for (const auto& row : rows) {
            NettingTransaction tx;
            tx.from_entity = row[0].as<std::string>();
            tx.to_entity = row[1].as<std::string>();
            tx.amount = row[2].as<double>();
            tx.currency = row[3].as<std::string>();
            tx.date = date;
            
            std::string status = row[4].as<std::string>();
            auto parsed = parse_transaction_status(status);
            if (!parsed) {
                throw std::runtime_error("unknown netting status '" + status + "'");
            }
            tx.status = *parsed;
            
            result.transactions.push_back(tx);
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load netting results for {}: {}", date, e.what());
        throw;
    }
    
    return result;
}

std::optional<std::string> PostgresStore::latest_netting_date() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec("SELECT MAX(netting_date)::text FROM netting_runs");
        txn.commit();
        
        if (result.empty() || result[0][0].is_null()) {
            return std::nullopt;
        }
        return result[0][0].as<std::string>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to read latest netting date: {}", e.what());
        throw;
    }
}

void PostgresStore::replace_validation_logs(const std::vector<ValidationIssue>& issues) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec("DELETE FROM validation_logs");
        
        for (const auto& issue : issues) {
            txn.exec_params(
                "INSERT INTO validation_logs "
                "(check_date, check_type, severity, description, affected_records, status) "
                "VALUES ($1::date, $2, $3, $4, $5, $6)",
                issue.check_date,
                issue.check_type,
                to_string(issue.severity),
                issue.description,
                issue.affected_records,
                to_string(issue.status)
            );
        }
        
        txn.commit();
        spdlog::info("Stored {} validation log entries", issues.size());
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to store validation logs: {}", e.what());
        throw;
    }
}

std::vector<ValidationIssue> PostgresStore::load_validation_logs() {
    std::vector<ValidationIssue> issues;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec(
            "SELECT check_date::text, check_type, severity, description, affected_records, status "
            "FROM validation_logs ORDER BY id");
        
        for (const auto& row : result) {
            ValidationIssue issue;
            issue.check_date = row[0].as<std::string>();
            issue.check_type = row[1].as<std::string>();
            issue.severity = parse_severity(row[2].as<std::string>()).value_or(Severity::Low);
            issue.description = row[3].is_null() ? "" : row[3].as<std::string>();
            issue.affected_records = row[4].as<int>();
            issue.status = parse_issue_status(row[5].as<std::string>()).value_or(IssueStatus::Open);
            issues.push_back(issue);
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load validation logs: {}", e.what());
        throw;
    }
    
    return issues;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
