#pragma once

#include "netting.hpp"
#include "validation.hpp"
#include <string>
#include <vector>
#include <optional>
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>

// Read side of the treasury tables plus the audit tables the service writes.
class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);
    
    void init_schema();
    
    // Snapshot input for `date`: balances and rates dated on or before it
    // (history feeds trends and rate lookups), all reference data.
    // Shape: {"accounts", "balances", "fx_rates", "entities", "pools"}.
    nlohmann::json load_snapshot_records(const std::string& date);
    
    std::optional<std::string> latest_balance_date();
    
    // Replaces the stored run for the same netting date
    void save_netting_results(const NettingResult& result);
    
    // Stored run for `date`, transactions in generation order. An empty
    // result when nothing was stored for that date.
    NettingResult load_netting_results(const std::string& date);
    std::optional<std::string> latest_netting_date();
    
    void replace_validation_logs(const std::vector<ValidationIssue>& issues);
    std::vector<ValidationIssue> load_validation_logs();
    
    bool ping();
    
private:
    std::string dsn_;
    
    pqxx::connection make_connection();
};
