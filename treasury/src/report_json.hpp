#pragma once

#include "treasury_engine.hpp"
#include <nlohmann/json.hpp>
#include <vector>

// JSON shapes handed to the reporting/API layer. Money is rounded to cents.
namespace report {
    nlohmann::json global_position(const GlobalPosition& gp);
    nlohmann::json regional_position(const RegionalPosition& rp);
    nlohmann::json pool_status(const PoolPosition& pp);
    nlohmann::json pool_status_list(const std::vector<PoolPosition>& pools);
    nlohmann::json pool_calculation(const PoolPosition& pp);
    nlohmann::json netting_result(const NettingResult& result);
    nlohmann::json validation_issue(const ValidationIssue& issue);
    nlohmann::json validation_report(const ValidationReport& report);
    nlohmann::json analytics_summary(const AnalyticsSummary& summary);
    nlohmann::json trend(const std::vector<TrendPoint>& points, const std::string& from,
                         const std::string& to);
    nlohmann::json run_result(const RunResult& result);
}
