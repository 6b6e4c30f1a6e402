#pragma once

#include "snapshot.hpp"
#include "aggregator.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct ValidationIssue {
    std::string check_type;     // missing_balance, duplicate, negative_cash, fx_mismatch, malformed_record
    Severity severity = Severity::Low;
    int affected_records = 0;
    std::string description;
    std::string check_date;
    IssueStatus status = IssueStatus::Open;
};

// Counts are derived from `issues` on every call, never stored. Only Open
// issues are counted; Resolved ones are history.
struct ValidationReport {
    std::string check_date;
    std::vector<ValidationIssue> issues;
    
    int total_issues() const;
    int resolved_issues() const;
    std::map<std::string, int> by_severity() const;
    std::map<std::string, int> by_type() const;
};

// Data-quality rules over one snapshot. Every rule runs independently of
// what the others find; an unchanged snapshot always yields the same report.
class ValidationEngine {
public:
    explicit ValidationEngine(const std::string& reporting_ccy);
    
    ValidationReport run(const Snapshot& snapshot) const;
    ValidationReport run(const Snapshot& snapshot, const NormalizationResult& normalized) const;
    
    // Current issues first, then every previous entry whose check type the
    // current run no longer detects, as Resolved. Reconciling the result
    // against the same run again returns it unchanged.
    static std::vector<ValidationIssue> reconcile(const std::vector<ValidationIssue>& previous,
                                                  const ValidationReport& current);
    
    std::optional<ValidationIssue> check_missing_balances(const Snapshot& snapshot) const;
    std::optional<ValidationIssue> check_duplicates(const Snapshot& snapshot) const;
    std::optional<ValidationIssue> check_negative_cash(const Snapshot& snapshot) const;
    std::optional<ValidationIssue> check_fx_mismatch(const Snapshot& snapshot,
                                                     const NormalizationResult& normalized) const;
    std::optional<ValidationIssue> check_malformed_records(const Snapshot& snapshot) const;
    
private:
    std::string reporting_ccy_;
};
