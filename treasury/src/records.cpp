#include "records.hpp"
#include "util.hpp"

bool BankAccount::is_credit_facility() const {
    std::string type = util::to_lower(account_type);
    return type == "overdraft" || type == "credit" || type == "credit facility";
}

std::string to_string(PoolType type) {
    switch (type) {
        case PoolType::Physical: return "Physical";
        case PoolType::Notional: return "Notional";
        default: return "UNKNOWN";
    }
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::High: return "High";
        case Severity::Medium: return "Medium";
        case Severity::Low: return "Low";
        default: return "UNKNOWN";
    }
}

std::string to_string(IssueStatus status) {
    switch (status) {
        case IssueStatus::Open: return "Open";
        case IssueStatus::Resolved: return "Resolved";
        default: return "UNKNOWN";
    }
}

std::string to_string(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Pending: return "Pending";
        case TransactionStatus::Settled: return "Settled";
        case TransactionStatus::Failed: return "Failed";
        default: return "UNKNOWN";
    }
}

std::string to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::Surplus: return "Surplus";
        case PositionStatus::Deficit: return "Deficit";
        default: return "UNKNOWN";
    }
}

std::optional<PoolType> parse_pool_type(const std::string& value) {
    std::string v = util::to_lower(value);
    if (v == "physical") return PoolType::Physical;
    if (v == "notional") return PoolType::Notional;
    return std::nullopt;
}

std::optional<Severity> parse_severity(const std::string& value) {
    if (value == "High") return Severity::High;
    if (value == "Medium") return Severity::Medium;
    if (value == "Low") return Severity::Low;
    return std::nullopt;
}

std::optional<IssueStatus> parse_issue_status(const std::string& value) {
    if (value == "Open") return IssueStatus::Open;
    if (value == "Resolved") return IssueStatus::Resolved;
    return std::nullopt;
}

std::optional<TransactionStatus> parse_transaction_status(const std::string& value) {
    if (value == "Pending") return TransactionStatus::Pending;
    if (value == "Settled") return TransactionStatus::Settled;
    if (value == "Failed") return TransactionStatus::Failed;
    return std::nullopt;
}
