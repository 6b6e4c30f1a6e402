#include "validation.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <tuple>

namespace {

ValidationIssue make_issue(const std::string& check_type, Severity severity, int affected,
                           const std::string& description, const std::string& check_date) {
    ValidationIssue issue;
    issue.check_type = check_type;
    issue.severity = severity;
    issue.affected_records = affected;
    issue.description = description;
    issue.check_date = check_date;
    issue.status = IssueStatus::Open;
    return issue;
}

} // namespace

int ValidationReport::total_issues() const {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(),
                                          [](const ValidationIssue& issue) {
                                              return issue.status == IssueStatus::Open;
                                          }));
}

int ValidationReport::resolved_issues() const {
    return static_cast<int>(issues.size()) - total_issues();
}

std::map<std::string, int> ValidationReport::by_severity() const {
    std::map<std::string, int> counts;
    for (const auto& issue : issues) {
        if (issue.status != IssueStatus::Open) continue;
        counts[to_string(issue.severity)]++;
    }
    return counts;
}

std::map<std::string, int> ValidationReport::by_type() const {
    std::map<std::string, int> counts;
    for (const auto& issue : issues) {
        if (issue.status != IssueStatus::Open) continue;
        counts[issue.check_type]++;
    }
    return counts;
}

ValidationEngine::ValidationEngine(const std::string& reporting_ccy)
    : reporting_ccy_(reporting_ccy)
{}

ValidationReport ValidationEngine::run(const Snapshot& snapshot) const {
    LiquidityAggregator aggregator(reporting_ccy_);
    return run(snapshot, aggregator.normalize(snapshot));
}

ValidationReport ValidationEngine::run(const Snapshot& snapshot,
                                       const NormalizationResult& normalized) const {
    ValidationReport report;
    report.check_date = snapshot.as_of_date();
    
    std::optional<ValidationIssue> results[] = {
        check_missing_balances(snapshot),
        check_duplicates(snapshot),
        check_negative_cash(snapshot),
        check_fx_mismatch(snapshot, normalized),
        check_malformed_records(snapshot),
    };
    
    for (auto& issue : results) {
        if (issue) {
            report.issues.push_back(std::move(*issue));
        }
    }
    
    spdlog::info("Validation for {}: {} issues", report.check_date, report.total_issues());
    return report;
}

std::optional<ValidationIssue> ValidationEngine::check_missing_balances(const Snapshot& snapshot) const {
    std::set<std::string> reported;
    for (const auto& b : snapshot.as_of_balances()) {
        reported.insert(b.account_id);
    }
    
    int missing = 0;
    for (const auto& account : snapshot.accounts()) {
        if (account.active && !reported.count(account.account_id)) {
            spdlog::debug("No balance for active account {} on {}", account.account_id,
                          snapshot.as_of_date());
            missing++;
        }
    }
    
    if (missing == 0) return std::nullopt;
    
    return make_issue("missing_balance", Severity::High, missing,
                      fmt::format("Found {} active accounts with no balance on {}",
                                  missing, snapshot.as_of_date()),
                      snapshot.as_of_date());
}

std::optional<ValidationIssue> ValidationEngine::check_duplicates(const Snapshot& snapshot) const {
    std::set<std::tuple<std::string, std::string>> seen;
    int duplicates = 0;
    
    for (const auto& b : snapshot.balances()) {
        if (!seen.emplace(b.account_id, b.date).second) {
            duplicates++;
        }
    }
    
    if (duplicates == 0) return std::nullopt;
    
    return make_issue("duplicate", Severity::High, duplicates,
                      fmt::format("Found {} duplicate account-date combinations", duplicates),
                      snapshot.as_of_date());
}

std::optional<ValidationIssue> ValidationEngine::check_negative_cash(const Snapshot& snapshot) const {
    std::set<std::string> negative;
    
    for (const auto& b : snapshot.as_of_balances()) {
        if (b.amount_local >= 0.0) continue;
        
        const BankAccount* account = snapshot.find_account(b.account_id);
        if (account && account->is_credit_facility()) continue;
        
        negative.insert(b.account_id);
    }
    
    if (negative.empty()) return std::nullopt;
    
    int count = static_cast<int>(negative.size());
    return make_issue("negative_cash", Severity::Medium, count,
                      fmt::format("Found {} accounts with negative balances", count),
                      snapshot.as_of_date());
}

std::optional<ValidationIssue> ValidationEngine::check_fx_mismatch(const Snapshot& snapshot,
                                                                   const NormalizationResult& normalized) const {
    if (normalized.excluded.empty()) return std::nullopt;
    
    std::set<std::string> currencies;
    for (const auto& ex : normalized.excluded) {
        currencies.insert(ex.balance.currency);
    }
    
    std::string list;
    for (const auto& ccy : currencies) {
        if (!list.empty()) list += ", ";
        list += ccy;
    }
    
    int count = static_cast<int>(normalized.excluded.size());
    return make_issue("fx_mismatch", Severity::High, count,
                      fmt::format("Found {} balances with no rate to {} ({})",
                                  count, reporting_ccy_, list),
                      snapshot.as_of_date());
}

std::optional<ValidationIssue> ValidationEngine::check_malformed_records(const Snapshot& snapshot) const {
    if (snapshot.rejected().empty()) return std::nullopt;
    
    int count = static_cast<int>(snapshot.rejected().size());
    return make_issue("malformed_record", Severity::Medium, count,
                      fmt::format("Rejected {} malformed input records", count),
                      snapshot.as_of_date());
}

std::vector<ValidationIssue> ValidationEngine::reconcile(const std::vector<ValidationIssue>& previous,
                                                         const ValidationReport& current) {
    std::vector<ValidationIssue> merged = current.issues;
    
    std::set<std::string> detected;
    for (const auto& issue : current.issues) {
        detected.insert(issue.check_type);
    }
    
    // A condition detected again supersedes its earlier entries; anything
    // else from the previous run is kept, closed if it was still open
    for (const auto& issue : previous) {
        if (detected.count(issue.check_type)) continue;
        
        ValidationIssue carried = issue;
        carried.status = IssueStatus::Resolved;
        merged.push_back(carried);
    }
    
    return merged;
}
