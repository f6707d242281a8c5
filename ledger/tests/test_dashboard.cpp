#include <catch2/catch_test_macros.hpp>
#include "../src/csv_reader.hpp"
#include "../src/dashboard.hpp"
#include "../src/fifo_engine.hpp"
#include "../src/ledger.hpp"
#include "fakes.hpp"

namespace {
    Session make_session() {
        auto provider = std::make_shared<FakePriceProvider>();
        provider->set("BTC", "30000");
        provider->set("ETH", "2000");
        PriceResolver resolver(provider, "EUR");
        PriceLookup prices(resolver);

        LedgerBuilder builder;
        builder.add_source("csv", {
            trade("b1", "2024-01-10 10:00:00", TxKind::Buy, "BTC", "1", "20000", "EUR", "10", "EUR"),
            trade("s1", "2024-02-10 10:00:00", TxKind::Sell, "BTC", "0.4", "25000"),
            trade("b2", "2024-03-05 10:00:00", TxKind::Buy, "ETH", "2", "1500"),
            trade("s2", "2024-03-20 10:00:00", TxKind::Sell, "ETH", "1", "1800"),
        });

        Session session;
        session.id = "session-1";
        session.status = SessionStatus::Ready;
        session.ledger = builder.build();

        FifoEngine engine(prices);
        session.accounting = engine.run(session.ledger);

        Reporter reporter(prices);
        session.report = reporter.build(session.accounting, ts("2024-04-01 00:00:00"));
        session.warnings = {"bitcoin source bc1qdead... unavailable: timeout"};
        return session;
    }
}

TEST_CASE("Dashboard filters", "[dashboard]") {
    SECTION("Defaults") {
        auto f = DashboardFilters::from_params({});
        REQUIRE(f.granularity == Granularity::Month);
        REQUIRE_FALSE(f.start.has_value());
        REQUIRE_FALSE(f.asset.has_value());
        REQUIRE_FALSE(f.type.has_value());
    }

    SECTION("End date is inclusive") {
        auto f = DashboardFilters::from_params({{"start_date", "2024-02-01"}, {"end_date", "2024-02-29"}});
        REQUIRE(f.in_range(ts("2024-02-01 00:00:00")));
        REQUIRE(f.in_range(ts("2024-02-29 23:59:59")));
        REQUIRE_FALSE(f.in_range(ts("2024-03-01 00:00:00")));
        REQUIRE_FALSE(f.in_range(ts("2024-01-31 23:59:59")));
    }

    SECTION("Asset and type") {
        auto f = DashboardFilters::from_params({{"asset", "btc"}, {"type", "sell"}, {"group_by", "week"}});
        REQUIRE(*f.asset == "BTC");
        REQUIRE(*f.type == TxKind::Sell);
        REQUIRE(f.granularity == Granularity::Week);

        auto all = DashboardFilters::from_params({{"asset", "all"}, {"type", "ALL"}});
        REQUIRE_FALSE(all.asset.has_value());
        REQUIRE_FALSE(all.type.has_value());
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(DashboardFilters::from_params({{"group_by", "hour"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(DashboardFilters::from_params({{"type", "stake"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(DashboardFilters::from_params({{"start_date", "01/02/2024"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(DashboardFilters::from_params({{"start_date", "2024-02-01 10:00:00"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(DashboardFilters::from_params({{"start_date", "2024-03-01"}, {"end_date", "2024-02-01"}}),
                          std::invalid_argument);
    }
}

TEST_CASE("Dashboard payload", "[dashboard]") {
    Session session = make_session();

    SECTION("Unfiltered") {
        auto j = build_dashboard(session, DashboardFilters{});
        REQUIRE(j["sessionId"] == "session-1");
        REQUIRE(j["reportingCurrency"] == "EUR");
        REQUIRE(j["groupBy"] == "month");
        REQUIRE(j["operations"].size() == 4);
        REQUIRE(j["gains"].size() == 2);
        REQUIRE(j["gains"][0]["period"] == "2024-02");
        REQUIRE(j["gains"][1]["period"] == "2024-03");
        REQUIRE(j["holdings"].size() == 2);
        REQUIRE(j["warnings"].size() == 1);
        REQUIRE(j["summary"]["totalInvested"].get<double>() == 23010.0);
        REQUIRE(j["portfolioHistory"].size() == 4);
    }

    SECTION("Asset filter narrows gains, operations and breakdown but not the summary") {
        auto f = DashboardFilters::from_params({{"asset", "ETH"}});
        auto j = build_dashboard(session, f);
        REQUIRE(j["operations"].size() == 2);
        REQUIRE(j["gains"].size() == 1);
        REQUIRE(j["gains"][0]["entries"][0]["asset"] == "ETH");
        REQUIRE(j["assetBreakdown"].size() == 1);
        REQUIRE(j["assetBreakdown"][0]["asset"] == "ETH");
        REQUIRE(j["summary"]["totalInvested"].get<double>() == 23010.0);
    }

    SECTION("Date range") {
        auto f = DashboardFilters::from_params({{"start_date", "2024-02-01"}, {"end_date", "2024-02-29"}});
        auto j = build_dashboard(session, f);
        REQUIRE(j["operations"].size() == 1);
        REQUIRE(j["operations"][0]["id"] == "s1");
        REQUIRE(j["gains"].size() == 1);
    }
}

TEST_CASE("Operations export", "[dashboard]") {
    Session session = make_session();

    auto csv = export_operations_csv(session, DashboardFilters::from_params({{"type", "buy"}}));
    auto table = CsvReader::parse(csv);

    REQUIRE(table.headers == std::vector<std::string>{"date", "asset", "type", "amount", "price", "fee", "total"});
    REQUIRE(table.rows.size() == 2);
    REQUIRE(table.value(table.rows[0], "date") == "2024-01-10 10:00:00");
    REQUIRE(table.value(table.rows[0], "asset") == "BTC");
    REQUIRE(table.value(table.rows[0], "type") == "buy");
    REQUIRE(table.value(table.rows[0], "price") == "20000");
    REQUIRE(table.value(table.rows[0], "fee") == "10");
    REQUIRE(table.value(table.rows[0], "total") == "20000");
    REQUIRE(table.value(table.rows[1], "asset") == "ETH");
}

TEST_CASE("Operations export keeps full precision", "[dashboard]") {
    auto provider = std::make_shared<FakePriceProvider>();
    provider->set("ETH", "2000");
    PriceResolver resolver(provider, "EUR");
    PriceLookup prices(resolver);

    LedgerBuilder builder;
    builder.add_source("ethereum", {
        transfer("d1", "2024-05-01 12:00:00", TxKind::Deposit, "ETH", "1.123456789012345678", "ethereum", "0xwallet"),
    });

    Session session;
    session.id = "session-wei";
    session.ledger = builder.build();
    FifoEngine engine(prices);
    session.accounting = engine.run(session.ledger);

    auto table = CsvReader::parse(export_operations_csv(session, DashboardFilters{}));
    REQUIRE(table.rows.size() == 1);
    REQUIRE(table.value(table.rows[0], "amount") == "1.123456789012345678");
    REQUIRE(decimal::parse(table.value(table.rows[0], "amount")) == session.ledger[0].amount);
    REQUIRE(decimal::parse(table.value(table.rows[0], "total")) == decimal::parse("2246.913578024691356"));
}
