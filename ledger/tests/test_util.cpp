#include <catch2/catch_test_macros.hpp>
#include "../src/decimal.hpp"
#include "../src/util.hpp"

TEST_CASE("Timestamp helpers", "[util]") {
    SECTION("Accepted formats") {
        REQUIRE(*util::parse_utc_timestamp("2024-01-01 00:00:00") == 1704067200);
        REQUIRE(*util::parse_utc_timestamp("2024-01-01T00:00:00Z") == 1704067200);
        REQUIRE(*util::parse_utc_timestamp("2024-01-01T00:00:00.123Z") == 1704067200);
        REQUIRE(*util::parse_utc_timestamp("2024-01-01") == 1704067200);
        REQUIRE_FALSE(util::parse_utc_timestamp("01/01/2024").has_value());
        REQUIRE_FALSE(util::parse_utc_timestamp("").has_value());
    }

    SECTION("Dates that do not exist are rejected") {
        REQUIRE_FALSE(util::parse_utc_timestamp("2024-02-30 10:00:00").has_value());
        REQUIRE_FALSE(util::parse_utc_timestamp("2023-02-29").has_value());
        REQUIRE_FALSE(util::parse_utc_timestamp("2024-04-31T00:00:00Z").has_value());
        REQUIRE_FALSE(util::parse_utc_timestamp("2024-01-01 10:00:60").has_value());
        REQUIRE(*util::parse_utc_timestamp("2024-02-29") == 1709164800);
    }

    SECTION("Formatting") {
        REQUIRE(util::format_date(1704067200 + 3600) == "2024-01-01");
        REQUIRE(util::format_datetime(1704067200 + 3661) == "2024-01-01 01:01:01");
        REQUIRE(util::start_of_day(1704067200 + 86399) == 1704067200);
    }
}

TEST_CASE("String helpers", "[util]") {
    REQUIRE(util::split_list("a, b\nc  d,,") == std::vector<std::string>{"a", "b", "c", "d"});
    REQUIRE(util::to_upper("btc") == "BTC");
    REQUIRE(util::abbreviate("bc1qxyzxyzxyz") == "bc1qxyzx...");

    SECTION("Connection strings are redacted") {
        REQUIRE(util::redact_dsn("postgresql://ledger:s3cret@db:5432/ledger") == "postgresql://ledger:***@db:5432/ledger");
        REQUIRE(util::redact_dsn("host=db user=ledger password=s3cret dbname=ledger")
                == "host=db user=ledger password=*** dbname=ledger");
        REQUIRE(util::redact_dsn("postgresql://db/ledger") == "postgresql://db/ledger");
    }
}

TEST_CASE("Decimal helpers", "[util]") {
    REQUIRE(decimal::parse("0.1") + decimal::parse("0.2") == decimal::parse("0.3"));
    REQUIRE(decimal::to_string(decimal::parse("1.50000")) == "1.5");
    REQUIRE(decimal::to_string(decimal::parse("-0")) == "0");
    REQUIRE(decimal::from_base_units("123456789", 8) == decimal::parse("1.23456789"));
    REQUIRE(decimal::from_base_units("-50000", 8) == decimal::parse("-0.0005"));
    REQUIRE_THROWS_AS(decimal::parse("1,5"), std::invalid_argument);
    REQUIRE_THROWS_AS(decimal::parse("nan"), std::invalid_argument);
}
