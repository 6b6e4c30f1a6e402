#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/normalizer.hpp"
#include "../src/errors.hpp"

namespace {

FXRate make_rate(const std::string& base, const std::string& quote, double rate,
                 const std::string& date) {
    FXRate fx;
    fx.base = base;
    fx.quote = quote;
    fx.rate = rate;
    fx.rate_date = date;
    return fx;
}

} // namespace

TEST_CASE("Currency normalization", "[normalizer]") {
    FxRateTable rates;
    rates.add(make_rate("EUR", "USD", 1.10, "2024-03-01"));
    rates.add(make_rate("EUR", "USD", 1.20, "2024-03-05"));
    rates.add(make_rate("USD", "JPY", 150.0, "2024-03-01"));
    rates.add(make_rate("GBP", "EUR", 1.15, "2024-03-01"));
    
    CurrencyNormalizer normalizer(rates, "USD");
    
    SECTION("Same currency is identity without any rate") {
        FxRateTable empty;
        CurrencyNormalizer bare(empty, "USD");
        
        REQUIRE(bare.convert(1234.56, "USD", "2024-03-01") == 1234.56);
        REQUIRE(bare.rate("XYZ", "XYZ", "1900-01-01") == 1.0);
        REQUIRE(bare.convert(-42.0, "CHF", "CHF", "2024-03-01") == -42.0);
    }
    
    SECTION("Direct pair") {
        REQUIRE(normalizer.convert(500000.0, "EUR", "2024-03-01") == Catch::Approx(550000.0));
    }
    
    SECTION("Inverse pair when direct is absent") {
        REQUIRE(normalizer.rate("JPY", "USD", "2024-03-02") == Catch::Approx(1.0 / 150.0));
        REQUIRE(normalizer.convert(15000.0, "JPY", "2024-03-02") == Catch::Approx(100.0));
    }
    
    SECTION("Latest rate on or before the balance date") {
        REQUIRE(normalizer.rate("EUR", "USD", "2024-03-04") == Catch::Approx(1.10));
        REQUIRE(normalizer.rate("EUR", "USD", "2024-03-05") == Catch::Approx(1.20));
        REQUIRE(normalizer.rate("EUR", "USD", "2024-04-01") == Catch::Approx(1.20));
    }
    
    SECTION("Future-dated rates are never applied") {
        REQUIRE_THROWS_AS(normalizer.rate("EUR", "USD", "2024-02-29"), MissingRateError);
    }
    
    SECTION("Missing rate names the pair and date") {
        try {
            normalizer.convert(1.0, "XYZ", "2024-03-01");
            FAIL("expected MissingRateError");
        } catch (const MissingRateError& e) {
            REQUIRE(e.pair() == "XYZ/USD");
            REQUIRE(e.date() == "2024-03-01");
        }
    }
    
    SECTION("No implicit cross rate through a third currency") {
        // GBP/EUR and EUR/USD exist, GBP/USD does not
        REQUIRE_THROWS_AS(normalizer.convert(100.0, "GBP", "2024-03-01"), MissingRateError);
        REQUIRE_FALSE(normalizer.has_rate_path("GBP", "2024-03-01"));
    }
    
    SECTION("Rate path check") {
        REQUIRE(normalizer.has_rate_path("USD", "2024-03-01"));
        REQUIRE(normalizer.has_rate_path("EUR", "2024-03-01"));
        REQUIRE(normalizer.has_rate_path("JPY", "2024-03-01"));
        REQUIRE_FALSE(normalizer.has_rate_path("EUR", "2024-01-01"));
    }
}

TEST_CASE("FX rate table", "[fx_rates]") {
    FxRateTable rates;
    
    SECTION("Conflicting rate for the same pair and date is refused") {
        REQUIRE(rates.add(make_rate("EUR", "USD", 1.10, "2024-03-01")));
        REQUIRE(rates.add(make_rate("EUR", "USD", 1.10, "2024-03-01")));
        REQUIRE_FALSE(rates.add(make_rate("EUR", "USD", 1.30, "2024-03-01")));
        
        REQUIRE(rates.size() == 1);
        REQUIRE(*rates.lookup("EUR", "USD", "2024-03-01") == Catch::Approx(1.10));
    }
    
    SECTION("Unknown pair") {
        REQUIRE_FALSE(rates.lookup("EUR", "USD", "2024-03-01").has_value());
    }
}
