#pragma once

#include <string>
#include <vector>
#include <optional>

// Input records, one snapshot's worth. Immutable once a Snapshot owns them.

struct BankAccount {
    std::string account_id;
    std::string entity_code;
    std::string currency;
    std::string region;
    std::string account_type;   // Operating, Investment, Pool Header, Overdraft, ...
    bool active = true;
    
    // Overdraft and credit lines may legitimately carry a negative balance
    bool is_credit_facility() const;
};

struct CashBalance {
    std::string account_id;
    std::string date;           // YYYY-MM-DD
    std::string currency;
    double amount_local = 0.0;
};

struct FXRate {
    std::string base;           // EUR in EUR/USD
    std::string quote;          // USD in EUR/USD
    double rate = 0.0;          // units of quote per one unit of base
    std::string rate_date;
    
    std::string pair() const { return base + "/" + quote; }
};

struct LegalEntity {
    std::string entity_code;
    std::string name;
    std::string country;
    std::string region;
};

enum class PoolType {
    Physical,   // cash swept to a header account
    Notional    // balances offset for reporting only
};

struct CashPool {
    std::string pool_name;
    PoolType type = PoolType::Notional;
    std::string region;
    std::string header_account;
    std::string currency;
    std::vector<std::string> participant_account_ids;
    bool active = true;
};

// Derived from one CashBalance; never persisted
struct NormalizedPosition {
    std::string account_id;
    std::string entity_code;
    std::string region;
    std::string currency;
    std::string date;
    double amount_local = 0.0;
    double amount_reporting = 0.0;
};

enum class Severity {
    High,
    Medium,
    Low
};

enum class IssueStatus {
    Open,
    Resolved
};

enum class TransactionStatus {
    Pending,
    Settled,
    Failed
};

enum class PositionStatus {
    Surplus,
    Deficit
};

std::string to_string(PoolType type);
std::string to_string(Severity severity);
std::string to_string(IssueStatus status);
std::string to_string(TransactionStatus status);
std::string to_string(PositionStatus status);

std::optional<PoolType> parse_pool_type(const std::string& value);
std::optional<Severity> parse_severity(const std::string& value);
std::optional<IssueStatus> parse_issue_status(const std::string& value);
std::optional<TransactionStatus> parse_transaction_status(const std::string& value);
