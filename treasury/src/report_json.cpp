#include "report_json.hpp"
#include "util.hpp"

namespace {

nlohmann::json rounded(const std::map<std::string, double>& values) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : values) {
        out[key] = util::round2(value);
    }
    return out;
}

nlohmann::json counts(const std::map<std::string, int>& values) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : values) {
        out[key] = value;
    }
    return out;
}

nlohmann::json entity_list(const std::vector<EntityBalance>& entities) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : entities) {
        out.push_back({{"entity", e.entity_code}, {"balance", util::round2(e.balance)}});
    }
    return out;
}

} // namespace

namespace report {

nlohmann::json global_position(const GlobalPosition& gp) {
    return {
        {"as_of_date", gp.as_of_date},
        {"reporting_ccy", gp.reporting_ccy},
        {"total_liquidity_reporting_ccy", util::round2(gp.total_liquidity)},
        {"by_region", rounded(gp.by_region)},
        {"by_currency", rounded(gp.by_currency)},
        {"total_accounts", gp.total_accounts},
        {"excluded_records", gp.excluded_records},
        {"notes", gp.notes}
    };
}

nlohmann::json regional_position(const RegionalPosition& rp) {
    return {
        {"region", rp.region},
        {"total_reporting_ccy", util::round2(rp.total)},
        {"account_count", rp.account_count},
        {"entities", rounded(rp.entities)},
        {"currencies", rounded(rp.currencies)},
        {"top_entities", entity_list(rp.top_entities)}
    };
}

nlohmann::json pool_status(const PoolPosition& pp) {
    nlohmann::json j = {
        {"pool_name", pp.pool_name},
        {"pool_type", to_string(pp.pool_type)},
        {"region", pp.region},
        {"total_balance_reporting_ccy", util::round2(pp.total_balance)},
        {"participants", static_cast<int>(pp.participants.size())},
        {"efficiency_0_to_100", util::round2(pp.efficiency)},
        {"status", pp.status()}
    };
    if (!pp.valid()) {
        j["error"] = pp.error;
    }
    return j;
}

nlohmann::json pool_status_list(const std::vector<PoolPosition>& pools) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& pp : pools) {
        list.push_back(pool_status(pp));
    }
    return {
        {"pools", list},
        {"total_pools", static_cast<int>(pools.size())}
    };
}

nlohmann::json pool_calculation(const PoolPosition& pp) {
    nlohmann::json participants = nlohmann::json::array();
    for (const auto& p : pp.participants) {
        participants.push_back({
            {"account", p.account_id},
            {"entity", p.entity_code},
            {"balance", util::round2(p.balance)},
            {"variance_from_avg", util::round2(p.variance)},
            {"status", to_string(p.status)}
        });
    }
    
    nlohmann::json sweeps = nlohmann::json::array();
    for (const auto& s : pp.sweeps) {
        sweeps.push_back({
            {"from_account", s.from_account},
            {"to_account", s.to_account},
            {"amount", util::round2(s.amount)},
            {"scope", s.scope}
        });
    }
    
    nlohmann::json j = {
        {"pool_name", pp.pool_name},
        {"pool_type", to_string(pp.pool_type)},
        {"total_pooled", util::round2(pp.total_balance)},
        {"average_balance", util::round2(pp.average_balance)},
        {"efficiency_0_to_100", util::round2(pp.efficiency)},
        {"participants", participants},
        {"unpriced_accounts", pp.unpriced_accounts},
        {"sweeps", sweeps},
        {"status", pp.status()}
    };
    if (!pp.valid()) {
        j["error"] = pp.error;
    }
    return j;
}

nlohmann::json netting_result(const NettingResult& result) {
    nlohmann::json transactions = nlohmann::json::array();
    for (const auto& tx : result.transactions) {
        transactions.push_back({
            {"from_entity", tx.from_entity},
            {"to_entity", tx.to_entity},
            {"amount", util::round2(tx.amount)},
            {"currency", tx.currency},
            {"date", tx.date},
            {"status", to_string(tx.status)}
        });
    }
    
    return {
        {"netting_date", result.netting_date},
        {"total_transactions", result.total_transactions()},
        {"total_netted_amount", util::round2(result.total_netted())},
        {"by_status", counts(result.by_status())},
        {"excluded_entities", result.excluded_entities},
        {"unmatched_residual", util::round2(result.unmatched_residual)},
        {"transactions", transactions}
    };
}

nlohmann::json validation_issue(const ValidationIssue& issue) {
    return {
        {"check_type", issue.check_type},
        {"severity", to_string(issue.severity)},
        {"affected_records", issue.affected_records},
        {"description", issue.description},
        {"check_date", issue.check_date},
        {"status", to_string(issue.status)}
    };
}

nlohmann::json validation_report(const ValidationReport& report) {
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : report.issues) {
        issues.push_back(validation_issue(issue));
    }
    
    return {
        {"total_issues", report.total_issues()},
        {"resolved_issues", report.resolved_issues()},
        {"by_severity", counts(report.by_severity())},
        {"by_type", counts(report.by_type())},
        {"issues", issues}
    };
}

nlohmann::json analytics_summary(const AnalyticsSummary& summary) {
    return {
        {"as_of_date", summary.as_of_date},
        {"total_liquidity_reporting_ccy", util::round2(summary.total_liquidity)},
        {"total_accounts", summary.total_accounts},
        {"total_cash_pools", summary.total_cash_pools},
        {"active_netting_transactions", summary.active_netting_transactions},
        {"data_quality_issues", summary.data_quality_issues},
        {"regional_breakdown", rounded(summary.regional_breakdown)},
        {"top_entities", entity_list(summary.top_entities)}
    };
}

nlohmann::json trend(const std::vector<TrendPoint>& points, const std::string& from,
                     const std::string& to) {
    nlohmann::json series = nlohmann::json::array();
    for (const auto& p : points) {
        series.push_back({
            {"date", p.date},
            {"total_liquidity_reporting_ccy", util::round2(p.total)},
            {"by_region", rounded(p.by_region)},
            {"excluded_records", p.excluded_records}
        });
    }
    
    return {
        {"from", from},
        {"to", to},
        {"trends", series}
    };
}

nlohmann::json run_result(const RunResult& result) {
    nlohmann::json regions = nlohmann::json::array();
    for (const auto& rp : result.regions) {
        regions.push_back(regional_position(rp));
    }
    
    nlohmann::json pools = nlohmann::json::array();
    for (const auto& pp : result.pools) {
        pools.push_back(pool_calculation(pp));
    }
    
    return {
        {"as_of_date", result.as_of_date},
        {"empty", result.empty},
        {"notes", result.notes},
        {"global_position", global_position(result.global)},
        {"regions", regions},
        {"pools", pools},
        {"netting", netting_result(result.netting)},
        {"validation", validation_report(result.validation)},
        {"summary", analytics_summary(result.summary)}
    };
}

} // namespace report
