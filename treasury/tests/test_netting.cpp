#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/netting.hpp"
#include "../src/report_json.hpp"
#include <cmath>
#include <limits>

namespace {

double sum_from(const NettingResult& result, const std::string& entity) {
    double total = 0.0;
    for (const auto& tx : result.transactions) {
        if (tx.from_entity == entity) total += tx.amount;
    }
    return total;
}

double sum_to(const NettingResult& result, const std::string& entity) {
    double total = 0.0;
    for (const auto& tx : result.transactions) {
        if (tx.to_entity == entity) total += tx.amount;
    }
    return total;
}

} // namespace

TEST_CASE("Netting matches creditors against debtors", "[netting]") {
    NettingEngine engine(0.01, "USD");
    
    SECTION("Three-entity book") {
        auto result = engine.run({{"A", 300.0}, {"B", -100.0}, {"C", -200.0}}, "2024-03-01");
        
        REQUIRE(result.total_transactions() == 2);
        REQUIRE(result.total_netted() == Catch::Approx(300.0));
        REQUIRE(sum_from(result, "A") == Catch::Approx(300.0));
        REQUIRE(sum_to(result, "B") == Catch::Approx(100.0));
        REQUIRE(sum_to(result, "C") == Catch::Approx(200.0));
        
        for (const auto& tx : result.transactions) {
            REQUIRE(tx.from_entity == "A");
            REQUIRE(tx.currency == "USD");
            REQUIRE(tx.date == "2024-03-01");
            REQUIRE(tx.status == TransactionStatus::Pending);
        }
        REQUIRE(result.by_status().at("Pending") == 2);
        REQUIRE(result.unmatched_residual == 0.0);
    }
    
    // Debtors are taken by magnitude, so A settles C (200) before B (100)
    // even though B sorts first by name
    SECTION("Largest creditor meets largest debtor first") {
        auto result = engine.run({{"A", 300.0}, {"B", -100.0}, {"C", -200.0}}, "2024-03-01");
        
        REQUIRE(result.transactions[0].to_entity == "C");
        REQUIRE(result.transactions[0].amount == Catch::Approx(200.0));
        REQUIRE(result.transactions[1].to_entity == "B");
        REQUIRE(result.transactions[1].amount == Catch::Approx(100.0));
    }
    
    SECTION("Conservation on a larger book") {
        std::map<std::string, double> positions = {
            {"E01", 1250.75}, {"E02", -830.10}, {"E03", 415.35}, {"E04", -92.00},
            {"E05", -1200.00}, {"E06", 300.00}, {"E07", 156.00}, {"E08", 0.004}
        };
        double creditors = 0.0;
        double debtors = 0.0;
        for (const auto& [entity, position] : positions) {
            if (position > 0.01) creditors += position;
            if (position < -0.01) debtors -= position;
        }
        REQUIRE(creditors == Catch::Approx(debtors));
        
        auto result = engine.run(positions, "2024-03-01");
        
        // At most C + D - 1 transfers
        REQUIRE(result.total_transactions() <= 4 + 3 - 1);
        REQUIRE(result.total_netted() == Catch::Approx(creditors));
        
        for (const auto& [entity, position] : positions) {
            if (std::abs(position) <= 0.01) {
                REQUIRE(sum_from(result, entity) == 0.0);
                REQUIRE(sum_to(result, entity) == 0.0);
            } else if (position > 0) {
                REQUIRE(std::abs(sum_from(result, entity) - position) <= 0.01);
            } else {
                REQUIRE(std::abs(sum_to(result, entity) + position) <= 0.01);
            }
        }
        
        for (const auto& tx : result.transactions) {
            REQUIRE(tx.amount > 0.01);
        }
    }
    
    SECTION("Flat positions produce nothing") {
        auto result = engine.run({{"A", 0.005}, {"B", -0.009}, {"C", 0.0}}, "2024-03-01");
        
        REQUIRE(result.total_transactions() == 0);
        REQUIRE(result.total_netted() == 0.0);
    }
    
    SECTION("Unbalanced book reports the residual") {
        auto result = engine.run({{"A", 500.0}, {"B", -200.0}}, "2024-03-01");
        
        REQUIRE(result.total_transactions() == 1);
        REQUIRE(result.transactions[0].amount == Catch::Approx(200.0));
        REQUIRE(result.unmatched_residual == Catch::Approx(300.0));
    }
    
    SECTION("Excluded entities are left out") {
        auto result = engine.run({{"A", 300.0}, {"B", -100.0}, {"C", -200.0}}, "2024-03-01", {"C"});
        
        REQUIRE(result.excluded_entities == std::vector<std::string>{"C"});
        REQUIRE(result.total_transactions() == 1);
        REQUIRE(result.transactions[0].to_entity == "B");
    }
}

TEST_CASE("Netting to the mean position", "[netting]") {
    NettingEngine engine(0.01, "USD", NettingTarget::Mean);
    
    // Mean 200: A +200, B -100, C -100
    auto result = engine.run({{"A", 400.0}, {"B", 100.0}, {"C", 100.0}}, "2024-03-01");
    
    REQUIRE(result.total_transactions() == 2);
    REQUIRE(result.total_netted() == Catch::Approx(200.0));
    REQUIRE(sum_from(result, "A") == Catch::Approx(200.0));
    REQUIRE(result.transactions[0].to_entity == "B");
    REQUIRE(result.unmatched_residual == 0.0);
}

TEST_CASE("Netting is deterministic", "[netting]") {
    NettingEngine engine(0.01, "EUR");
    std::map<std::string, double> positions = {
        {"A", 100.0}, {"B", 100.0}, {"C", -50.0}, {"D", -50.0}, {"E", -100.0}
    };
    
    auto first = report::netting_result(engine.run(positions, "2024-03-01")).dump();
    for (int i = 0; i < 5; i++) {
        REQUIRE(report::netting_result(engine.run(positions, "2024-03-01")).dump() == first);
    }
    
    // Equal magnitudes break ties by entity code
    auto result = engine.run(positions, "2024-03-01");
    REQUIRE(result.transactions[0].from_entity == "A");
    REQUIRE(result.transactions[0].to_entity == "E");
    REQUIRE(result.transactions[1].from_entity == "B");
    REQUIRE(result.transactions[1].to_entity == "C");
    REQUIRE(result.transactions[2].from_entity == "B");
    REQUIRE(result.transactions[2].to_entity == "D");
}

TEST_CASE("Generic matcher", "[netting]") {
    auto settlements = NettingEngine::match({{"x", 10.0}, {"y", -4.0}, {"z", -6.0}}, 0.01);
    
    REQUIRE(settlements.size() == 2);
    REQUIRE(settlements[0].from == "x");
    REQUIRE(settlements[0].to == "z");
    REQUIRE(settlements[0].amount == Catch::Approx(6.0));
    REQUIRE(settlements[1].to == "y");
}

TEST_CASE("Non-finite positions are excluded, not matched", "[netting]") {
    const double inf = std::numeric_limits<double>::infinity();
    NettingEngine engine(0.01, "USD");
    
    SECTION("Overflowed entities sit out and the rest still settles") {
        auto result = engine.run({{"A", inf}, {"B", -inf}, {"C", 100.0}, {"D", -100.0}},
                                 "2024-03-01");
        
        REQUIRE(result.excluded_entities == std::vector<std::string>{"A", "B"});
        REQUIRE(result.total_transactions() == 1);
        REQUIRE(result.transactions[0].from_entity == "C");
        REQUIRE(result.transactions[0].to_entity == "D");
        REQUIRE(result.unmatched_residual == 0.0);
    }
    
    SECTION("Only non-finite positions") {
        auto result = engine.run({{"A", inf}, {"B", -inf}}, "2024-03-01");
        
        REQUIRE(result.total_transactions() == 0);
        REQUIRE(result.excluded_entities.size() == 2);
    }
    
    SECTION("Matcher skips them directly") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        auto settlements = NettingEngine::match({{"A", inf}, {"B", -inf}, {"C", nan}}, 0.01);
        
        REQUIRE(settlements.empty());
    }
    
    SECTION("Mean target with huge finite positions") {
        NettingEngine to_mean(0.01, "USD", NettingTarget::Mean);
        
        // A plain sum of A and B would already overflow
        auto result = to_mean.run({{"A", 1e308}, {"B", 1e308}, {"C", -1e308}}, "2024-03-01");
        
        REQUIRE(result.excluded_entities.empty());
        REQUIRE(result.total_transactions() == 2);
        for (const auto& tx : result.transactions) {
            REQUIRE(std::isfinite(tx.amount));
        }
    }
}

TEST_CASE("Stored netting run", "[netting]") {
    NettingResult stored;
    stored.netting_date = "2024-03-01";
    stored.currency = "USD";
    for (auto [status, amount] : {std::make_pair(std::string("Settled"), 100.0),
                                  std::make_pair(std::string("Settled"), 50.0),
                                  std::make_pair(std::string("Pending"), 25.0),
                                  std::make_pair(std::string("Failed"), 10.0)}) {
        auto parsed = parse_transaction_status(status);
        REQUIRE(parsed);
        
        NettingTransaction tx;
        tx.from_entity = "A";
        tx.to_entity = "B";
        tx.amount = amount;
        tx.currency = "USD";
        tx.date = stored.netting_date;
        tx.status = *parsed;
        stored.transactions.push_back(tx);
    }
    
    SECTION("Status lifecycle is counted") {
        auto j = report::netting_result(stored);
        
        REQUIRE(j["total_transactions"] == 4);
        REQUIRE(j["total_netted_amount"] == 185.0);
        REQUIRE(j["by_status"]["Settled"] == 2);
        REQUIRE(j["by_status"]["Pending"] == 1);
        REQUIRE(j["by_status"]["Failed"] == 1);
        REQUIRE(j["transactions"][3]["status"] == "Failed");
    }
    
    SECTION("Nothing stored") {
        auto j = report::netting_result(NettingResult{});
        
        REQUIRE(j["total_transactions"] == 0);
        REQUIRE(j["by_status"].empty());
        REQUIRE(j["transactions"].empty());
    }
    
    SECTION("Unknown status text") {
        REQUIRE_FALSE(parse_transaction_status("settled"));
        REQUIRE_FALSE(parse_transaction_status("Cancelled"));
    }
}
