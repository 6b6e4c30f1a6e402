#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/pool_optimizer.hpp"
#include "../src/errors.hpp"

namespace {

CashPool make_pool(const std::string& name, PoolType type, const std::string& region,
                   const std::vector<std::string>& participants) {
    CashPool pool;
    pool.pool_name = name;
    pool.type = type;
    pool.region = region;
    pool.participant_account_ids = participants;
    return pool;
}

Snapshot pool_snapshot(const std::vector<double>& balances, PoolType type) {
    SnapshotBuilder builder("2024-03-01");
    std::vector<std::string> ids;
    for (size_t i = 0; i < balances.size(); i++) {
        std::string id = "P-" + std::to_string(i + 1);
        builder.add_account({id, "CO-" + std::to_string(i + 1), "USD", "APAC", "Operating", true});
        builder.add_balance({id, "2024-03-01", "USD", balances[i]});
        ids.push_back(id);
    }
    builder.add_pool(make_pool("APAC Pool", type, "APAC", ids));
    return builder.build();
}

} // namespace

TEST_CASE("Pool efficiency score", "[pool_optimizer]") {
    SECTION("Identical balances are fully efficient") {
        REQUIRE(CashPoolOptimizer::efficiency({100.0, 100.0, 100.0}, 1e-6) == Catch::Approx(100.0));
    }
    
    SECTION("Dispersion lowers the score but stays in range") {
        double score = CashPoolOptimizer::efficiency({0.0, 100.0, 200.0}, 1e-6);
        
        REQUIRE(score < 100.0);
        REQUIRE(score >= 0.0);
        REQUIRE(score == Catch::Approx(100.0 * (1.0 - 81.6496580927726 / 100.0)).epsilon(1e-6));
    }
    
    SECTION("Extreme dispersion clamps at zero") {
        REQUIRE(CashPoolOptimizer::efficiency({-1000.0, 0.0, 1100.0}, 1e-6) == 0.0);
    }
    
    SECTION("Non-positive mean with dispersion scores zero") {
        REQUIRE(CashPoolOptimizer::efficiency({-100.0, 50.0}, 1e-6) == 0.0);
    }
    
    SECTION("All-zero balances do not divide by zero") {
        REQUIRE(CashPoolOptimizer::efficiency({0.0, 0.0}, 1e-6) == Catch::Approx(100.0));
    }
    
    SECTION("No balances") {
        REQUIRE(CashPoolOptimizer::efficiency({}, 1e-6) == 0.0);
    }
}

TEST_CASE("Pool position", "[pool_optimizer]") {
    CashPoolOptimizer optimizer(1e-6, 0.01);
    LiquidityAggregator aggregator("USD");
    
    SECTION("Variance from average and status") {
        auto snap = pool_snapshot({0.0, 100.0, 200.0}, PoolType::Notional);
        auto pp = optimizer.calculate(snap.pools()[0], snap, aggregator.normalize(snap));
        
        REQUIRE(pp.valid());
        REQUIRE(pp.status() == "Active");
        REQUIRE(pp.total_balance == Catch::Approx(300.0));
        REQUIRE(pp.average_balance == Catch::Approx(100.0));
        REQUIRE(pp.participants.size() == 3);
        REQUIRE(pp.participants[0].variance == Catch::Approx(-100.0));
        REQUIRE(pp.participants[0].status == PositionStatus::Deficit);
        REQUIRE(pp.participants[1].variance == Catch::Approx(0.0));
        REQUIRE(pp.participants[1].status == PositionStatus::Surplus);
        REQUIRE(pp.participants[2].status == PositionStatus::Surplus);
        REQUIRE(pp.efficiency < 100.0);
    }
    
    SECTION("Notional pools move no cash") {
        auto snap = pool_snapshot({0.0, 100.0, 200.0}, PoolType::Notional);
        auto pp = optimizer.calculate(snap.pools()[0], snap, aggregator.normalize(snap));
        
        REQUIRE(pp.sweeps.empty());
    }
    
    SECTION("Physical pools sweep participants to the average") {
        auto snap = pool_snapshot({0.0, 100.0, 200.0}, PoolType::Physical);
        auto pp = optimizer.calculate(snap.pools()[0], snap, aggregator.normalize(snap));
        
        REQUIRE(pp.sweeps.size() == 1);
        REQUIRE(pp.sweeps[0].from_account == "P-3");
        REQUIRE(pp.sweeps[0].to_account == "P-1");
        REQUIRE(pp.sweeps[0].amount == Catch::Approx(100.0));
        REQUIRE(pp.sweeps[0].scope == "intra_pool");
    }
    
    SECTION("Participants without a balance are listed, not averaged") {
        SnapshotBuilder builder("2024-03-01");
        builder.add_account({"P-1", "CO-1", "USD", "APAC", "Operating", true});
        builder.add_account({"P-2", "CO-2", "USD", "APAC", "Operating", true});
        builder.add_account({"P-3", "CO-3", "XYZ", "APAC", "Operating", true});
        builder.add_balance({"P-1", "2024-03-01", "USD", 100.0});
        builder.add_balance({"P-3", "2024-03-01", "XYZ", 100.0});
        builder.add_pool(make_pool("APAC Pool", PoolType::Notional, "APAC", {"P-1", "P-2", "P-3"}));
        auto snap = builder.build();
        
        auto pp = optimizer.calculate(snap.pools()[0], snap, aggregator.normalize(snap));
        
        REQUIRE(pp.participants.size() == 1);
        REQUIRE(pp.unpriced_accounts == std::vector<std::string>{"P-2", "P-3"});
        REQUIRE(pp.average_balance == Catch::Approx(100.0));
    }
    
    SECTION("Inactive pool is not computed") {
        SnapshotBuilder builder("2024-03-01");
        builder.add_account({"P-1", "CO-1", "USD", "APAC", "Operating", true});
        builder.add_balance({"P-1", "2024-03-01", "USD", 100.0});
        CashPool pool = make_pool("Old Pool", PoolType::Physical, "APAC", {"P-1"});
        pool.active = false;
        builder.add_pool(pool);
        auto snap = builder.build();
        
        auto pp = optimizer.calculate(snap.pools()[0], snap, aggregator.normalize(snap));
        
        REQUIRE(pp.status() == "Inactive");
        REQUIRE(pp.participants.empty());
    }
}

TEST_CASE("Pool configuration errors are isolated", "[pool_optimizer]") {
    CashPoolOptimizer optimizer(1e-6, 0.01);
    LiquidityAggregator aggregator("USD");
    
    SnapshotBuilder builder("2024-03-01");
    for (const auto& id : {"A-1", "A-2", "B-1"}) {
        builder.add_account({id, std::string("CO-") + id, "USD", "EMEA", "Operating", true});
        builder.add_balance({id, "2024-03-01", "USD", 100.0});
    }
    builder.add_pool(make_pool("Pool A", PoolType::Physical, "EMEA", {"A-1", "A-2"}));
    builder.add_pool(make_pool("Pool B", PoolType::Notional, "EMEA", {"B-1", "A-2"}));
    builder.add_pool(make_pool("Pool C", PoolType::Notional, "EMEA", {}));
    builder.add_pool(make_pool("Pool D", PoolType::Notional, "APAC", {"B-1"}));
    
    CashPool retired = make_pool("Pool Z", PoolType::Physical, "EMEA", {"A-1"});
    retired.active = false;
    builder.add_pool(retired);
    
    auto snap = builder.build();
    
    SECTION("Validation names the problem") {
        try {
            CashPoolOptimizer::validate(snap.pools()[2], snap.pools());
            FAIL("expected InvalidPoolConfigurationError");
        } catch (const InvalidPoolConfigurationError& e) {
            REQUIRE(e.pool_name() == "Pool C");
        }
        
        CashPool twice = make_pool("Twice", PoolType::Notional, "EMEA", {"X", "X"});
        REQUIRE_THROWS_AS(CashPoolOptimizer::validate(twice, {}), InvalidPoolConfigurationError);
    }
    
    SECTION("Invalid pools are reported, others still compute") {
        auto positions = optimizer.calculate_all(snap, aggregator.normalize(snap));
        
        REQUIRE(positions.size() == 5);
        // Pool A and Pool B share A-2
        REQUIRE(positions[0].status() == "Invalid");
        REQUIRE(positions[0].error.find("A-2") != std::string::npos);
        REQUIRE(positions[1].status() == "Invalid");
        // Pool C is empty
        REQUIRE(positions[2].status() == "Invalid");
        // Pool D shares B-1 with Pool B
        REQUIRE(positions[3].status() == "Invalid");
        // Retired pools take no part in overlap checks
        REQUIRE(positions[4].status() == "Inactive");
    }
    
    SECTION("Physically pooled entities") {
        auto entities = CashPoolOptimizer::physically_pooled_entities(snap);
        
        REQUIRE(entities == std::set<std::string>{"CO-A-1", "CO-A-2"});
    }
}
