#include <catch2/catch_test_macros.hpp>
#include "../src/price_resolver.hpp"
#include "fakes.hpp"

TEST_CASE("Price resolver", "[pricing]") {
    auto provider = std::make_shared<FakePriceProvider>();
    provider->set("BTC", "40000");
    PriceResolver resolver(provider, "eur");

    int64_t morning = ts("2024-01-05 08:00:00");
    int64_t evening = ts("2024-01-05 21:30:00");

    SECTION("Reporting currency is always 1 and never fetched") {
        REQUIRE(resolver.reporting_currency() == "EUR");
        REQUIRE(*resolver.resolve("eur", morning) == Decimal(1));
        REQUIRE(provider->calls == 0);
    }

    SECTION("Same asset and day hits the cache") {
        REQUIRE(*resolver.resolve("BTC", morning) == Decimal(40000));
        REQUIRE(*resolver.resolve("btc", evening) == Decimal(40000));
        REQUIRE(provider->calls == 1);
        REQUIRE(provider->last_currency == "EUR");
        REQUIRE(resolver.cache_size() == 1);

        resolver.resolve("BTC", ts("2024-01-06 08:00:00"));
        REQUIRE(provider->calls == 2);
    }

    SECTION("Daily prices are looked up by the start of the UTC day") {
        provider->set_daily("ETH", ts("2024-01-05"), "2100");
        REQUIRE(*resolver.resolve("ETH", evening) == Decimal(2100));
    }

    SECTION("Failures are not cached") {
        REQUIRE_FALSE(resolver.resolve("NOPE", morning).has_value());
        REQUIRE_FALSE(resolver.resolve("NOPE", morning).has_value());
        REQUIRE(provider->calls == 2);
        REQUIRE(resolver.cache_size() == 0);

        provider->set("NOPE", "1.5");
        REQUIRE(*resolver.resolve("NOPE", morning) == Decimal("1.5"));
    }

    SECTION("Provider exceptions become missing prices") {
        provider->fail_with("SOL");
        REQUIRE_FALSE(resolver.resolve("SOL", morning).has_value());
    }

    SECTION("Unknown asset is never requested") {
        REQUIRE_FALSE(resolver.resolve(UNKNOWN_ASSET, morning).has_value());
        REQUIRE_FALSE(resolver.resolve("", morning).has_value());
        REQUIRE(provider->calls == 0);
    }

    SECTION("No provider means no prices") {
        PriceResolver offline(nullptr, "EUR");
        REQUIRE_FALSE(offline.resolve("BTC", morning).has_value());
        REQUIRE(*offline.resolve("EUR", morning) == Decimal(1));
    }
}

TEST_CASE("Price lookup per run", "[pricing]") {
    auto provider = std::make_shared<FakePriceProvider>();
    provider->set("BTC", "40000");
    PriceResolver resolver(provider, "EUR");
    PriceLookup prices(resolver);

    int64_t when = ts("2024-01-05 08:00:00");

    SECTION("Values and missing set") {
        REQUIRE(prices.value_of("BTC", Decimal("0.5"), when) == Decimal(20000));
        REQUIRE(prices.value_of("DOGE", Decimal(100), when) == 0);
        REQUIRE(prices.value_of("SHIB", Decimal(0), when) == 0);

        REQUIRE(prices.missing() == std::set<std::string>{"DOGE"});
        REQUIRE(prices.is_reporting("eur"));
        REQUIRE_FALSE(prices.is_reporting("BTC"));
    }

    SECTION("Lookups share the process cache but not the missing set") {
        prices.price("DOGE", when);
        PriceLookup other(resolver);
        other.price("BTC", when);
        REQUIRE(other.missing().empty());
        REQUIRE(provider->calls == 2);
    }

    SECTION("A failed asset and day is asked once per run") {
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(prices.price("spam", when + i * 60).has_value());
        }
        REQUIRE(provider->calls == 1);
        REQUIRE(prices.missing() == std::set<std::string>{"SPAM"});

        prices.price("SPAM", ts("2024-01-06 08:00:00"));
        REQUIRE(provider->calls == 2);

        PriceLookup next_run(resolver);
        next_run.price("SPAM", when);
        REQUIRE(provider->calls == 3);
    }
}
