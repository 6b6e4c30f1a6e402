#pragma once

#include "records.hpp"
#include "fx_rates.hpp"
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

struct RejectedRecord {
    std::string kind;       // account, balance, fx_rate, entity, pool
    std::string reason;
};

// Immutable set of input records for one as-of date. Built once by
// SnapshotBuilder and passed by const reference to every engine component.
class Snapshot {
public:
    const std::string& as_of_date() const { return as_of_date_; }
    
    // Sorted by account_id
    const std::vector<BankAccount>& accounts() const { return accounts_; }
    const BankAccount* find_account(const std::string& account_id) const;
    
    // All dates, sorted by (date, account_id, currency, amount)
    const std::vector<CashBalance>& balances() const { return balances_; }
    std::vector<CashBalance> balances_on(const std::string& date) const;
    const std::vector<CashBalance>& as_of_balances() const { return as_of_balances_; }
    std::vector<std::string> balance_dates() const;
    
    const FxRateTable& rates() const { return rates_; }
    
    // Sorted by entity_code
    const std::vector<LegalEntity>& entities() const { return entities_; }
    const LegalEntity* find_entity(const std::string& entity_code) const;
    
    // Sorted by pool_name
    const std::vector<CashPool>& pools() const { return pools_; }
    
    const std::vector<RejectedRecord>& rejected() const { return rejected_; }
    
    bool is_empty() const { return accounts_.empty() || as_of_balances_.empty(); }
    
    // Throws SnapshotEmptyError when there is nothing to compute on
    void require_data() const;
    
private:
    friend class SnapshotBuilder;
    Snapshot() = default;
    
    std::string as_of_date_;
    std::vector<BankAccount> accounts_;
    std::map<std::string, size_t> account_index_;
    std::vector<CashBalance> balances_;
    std::vector<CashBalance> as_of_balances_;
    FxRateTable rates_;
    std::vector<LegalEntity> entities_;
    std::map<std::string, size_t> entity_index_;
    std::vector<CashPool> pools_;
    std::vector<RejectedRecord> rejected_;
};

// Validates records at the boundary. A record that fails validation is
// rejected and remembered; it never reaches the engine.
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(const std::string& as_of_date);
    
    bool add_account(const BankAccount& account);
    bool add_balance(const CashBalance& balance);
    bool add_rate(const FXRate& rate);
    bool add_entity(const LegalEntity& entity);
    bool add_pool(const CashPool& pool);
    
    // JSON-shaped collections from the persistence/import layer
    void add_accounts(const nlohmann::json& records);
    void add_balances(const nlohmann::json& records);
    void add_rates(const nlohmann::json& records);
    void add_entities(const nlohmann::json& records);
    void add_pools(const nlohmann::json& records);
    
    Snapshot build() const;
    
    // Document with "accounts", "balances", "fx_rates", "entities", "pools"
    static Snapshot from_json(const nlohmann::json& doc, const std::string& as_of_date);
    
private:
    std::string as_of_date_;
    std::vector<BankAccount> accounts_;
    std::vector<CashBalance> balances_;
    std::vector<FXRate> rates_;
    std::vector<LegalEntity> entities_;
    std::vector<CashPool> pools_;
    std::vector<RejectedRecord> rejected_;
    
    void reject(const std::string& kind, const std::string& reason);
    
    template <typename Parse, typename Add>
    void add_each(const nlohmann::json& records, const std::string& kind, Parse parse, Add add);
};
