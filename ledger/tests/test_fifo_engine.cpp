#include <catch2/catch_test_macros.hpp>
#include "../src/fifo_engine.hpp"
#include "../src/ledger.hpp"
#include "fakes.hpp"

namespace {
    Decimal gained_quantity(const AccountingResult& result, const std::string& asset, bool synthetic) {
        Decimal total = 0;
        for (const auto& g : result.gains) {
            if (g.asset == asset && g.synthetic == synthetic) total += g.quantity;
        }
        return total;
    }
}

TEST_CASE("FIFO lots and realized gains", "[fifo]") {
    auto provider = std::make_shared<FakePriceProvider>();
    PriceResolver resolver(provider, "EUR");
    PriceLookup prices(resolver);
    FifoEngine engine(prices);

    SECTION("Partial sell against a single lot") {
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "20000"),
            trade("s1", "2024-02-01 10:00:00", TxKind::Sell, "BTC", "0.4", "25000"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.gains.size() == 1);
        const auto& g = result.gains[0];
        REQUIRE(g.quantity == Decimal("0.4"));
        REQUIRE(g.proceeds == Decimal(10000));
        REQUIRE(g.cost_basis == Decimal(8000));
        REQUIRE(g.gain == Decimal(2000));
        REQUIRE(g.lot_id == "b1");
        REQUIRE(g.closing_tx_id == "s1");

        const auto& lots = result.open_lots.at("BTC");
        REQUIRE(lots.size() == 1);
        REQUIRE(lots[0].quantity == Decimal("0.6"));
        REQUIRE(lots[0].unit_cost == Decimal(20000));

        REQUIRE(result.totals.invested == Decimal(20000));
        REQUIRE(result.totals.withdrawn == Decimal(10000));
        REQUIRE(result.totals.realized == Decimal(2000));
        REQUIRE(result.timeline.size() == 2);
        REQUIRE(result.timeline[1].quantities.at("BTC") == Decimal("0.6"));
    }

    SECTION("Oldest lot is consumed first") {
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
            trade("b2", "2024-01-02 10:00:00", TxKind::Buy, "BTC", "1", "200"),
            trade("s1", "2024-01-03 10:00:00", TxKind::Sell, "BTC", "1.5", "300"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.gains.size() == 2);
        REQUIRE(result.gains[0].lot_id == "b1");
        REQUIRE(result.gains[0].quantity == Decimal(1));
        REQUIRE(result.gains[0].proceeds == Decimal(300));
        REQUIRE(result.gains[0].gain == Decimal(200));
        REQUIRE(result.gains[1].lot_id == "b2");
        REQUIRE(result.gains[1].quantity == Decimal("0.5"));
        REQUIRE(result.gains[1].proceeds == Decimal(150));
        REQUIRE(result.gains[1].gain == Decimal(50));

        REQUIRE(result.open_quantity("BTC") == Decimal("0.5"));
        REQUIRE(result.open_cost("BTC") == Decimal(100));
    }

    SECTION("Fees raise the cost basis and reduce proceeds") {
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100", "EUR", "1", "EUR"),
            trade("s1", "2024-01-02 10:00:00", TxKind::Sell, "BTC", "1", "200", "EUR", "2", "EUR"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.totals.invested == Decimal(101));
        REQUIRE(result.gains[0].cost_basis == Decimal(101));
        REQUIRE(result.gains[0].proceeds == Decimal(198));
        REQUIRE(result.gains[0].fees == Decimal(2));
        REQUIRE(result.gains[0].gain == Decimal(97));
        REQUIRE(result.totals.fees == Decimal(3));
        REQUIRE(result.valuations.at("b1").fee_value == Decimal(1));
    }

    SECTION("Fee paid in the bought asset is valued at the trade price") {
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100", "EUR", "0.01", "BTC"),
        };
        auto result = engine.run(ledger);
        REQUIRE(result.valuations.at("b1").fee_value == Decimal(1));
        REQUIRE(result.open_lots.at("BTC")[0].unit_cost == Decimal(101));
        REQUIRE(provider->calls == 0);
    }

    SECTION("Selling more than held closes the rest against a zero-cost lot") {
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
            trade("s1", "2024-01-02 10:00:00", TxKind::Sell, "BTC", "1.5", "100"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.gains.size() == 2);
        const auto& shortfall = result.gains[1];
        REQUIRE(shortfall.synthetic);
        REQUIRE(shortfall.lot_id == "s1#synthetic");
        REQUIRE(shortfall.quantity == Decimal("0.5"));
        REQUIRE(shortfall.cost_basis == 0);
        REQUIRE(shortfall.gain == Decimal(50));
        REQUIRE(shortfall.note == "shortfall");
        REQUIRE(result.open_lots.count("BTC") == 0);
    }

    SECTION("Crypto quote leg is disposed at market value") {
        provider->set("BTC", "20000");
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "20000"),
            trade("b2", "2024-01-02 10:00:00", TxKind::Buy, "ETH", "1", "0.05", "BTC"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.open_lots.at("ETH")[0].unit_cost == Decimal(1000));
        REQUIRE(result.open_quantity("BTC") == Decimal("0.95"));
        REQUIRE(result.gains.size() == 1);
        REQUIRE(result.gains[0].asset == "BTC");
        REQUIRE(result.gains[0].note == "quote leg");
        REQUIRE(result.gains[0].gain == 0);
        // The swap moves value between assets, nothing enters or leaves
        REQUIRE(result.totals.invested == Decimal(20000));
    }

    SECTION("Selling into a crypto quote opens a lot of the quote asset") {
        provider->set("USDT", "0.9");
        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "ETH", "1", "1800"),
            trade("s1", "2024-01-02 10:00:00", TxKind::Sell, "ETH", "1", "2000", "USDT"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.gains[0].proceeds == Decimal(1800));
        REQUIRE(result.gains[0].gain == 0);
        const auto& usdt = result.open_lots.at("USDT");
        REQUIRE(usdt[0].id == "s1#quote");
        REQUIRE(usdt[0].quantity == Decimal(2000));
        REQUIRE(usdt[0].unit_cost == Decimal("0.9"));
        REQUIRE(result.totals.withdrawn == 0);
    }

    SECTION("Wallet deposits, network fees and withdrawals") {
        provider->set("ETH", "2000");
        Ledger ledger = {
            transfer("d1", "2024-01-01 10:00:00", TxKind::Deposit, "ETH", "1", "ethereum", "0x1"),
            transfer("f1", "2024-01-02 10:00:00", TxKind::FeeOnly, "ETH", "0.01", "ethereum", "0x1"),
            transfer("w1", "2024-01-03 10:00:00", TxKind::Withdrawal, "ETH", "0.49", "ethereum", "0x1"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.totals.invested == Decimal(2000));
        REQUIRE(result.gains.size() == 2);
        REQUIRE(result.gains[0].note == "network fee");
        REQUIRE(result.gains[0].proceeds == 0);
        REQUIRE(result.gains[0].gain == Decimal(-20));
        REQUIRE(result.gains[1].proceeds == Decimal(980));
        REQUIRE(result.totals.fees == Decimal(20));
        REQUIRE(result.totals.withdrawn == Decimal(980));
        REQUIRE(result.open_quantity("ETH") == Decimal("0.5"));
        REQUIRE(result.processed.at("fee-only") == 1);
    }

    SECTION("Reporting currency movements are cash, not lots") {
        Ledger ledger = {
            exchange_transfer("c1", "2024-01-01 09:00:00", TxKind::Deposit, "EUR", "1000"),
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "0.01", "50000"),
            exchange_transfer("c2", "2024-01-02 09:00:00", TxKind::Withdrawal, "EUR", "200"),
        };
        auto result = engine.run(ledger);

        REQUIRE(result.open_lots.count("EUR") == 0);
        REQUIRE(result.totals.cash_deposited == Decimal(1000));
        REQUIRE(result.totals.cash_withdrawn == Decimal(200));
        REQUIRE(result.totals.invested == Decimal(500));
        REQUIRE(result.gains.empty());
    }

    SECTION("Internal transfers only move the fee") {
        auto out = exchange_transfer("w1", "2024-01-02 10:00:00", TxKind::Withdrawal, "BTC", "0.5");
        out.fee = Decimal("0.0005");
        out.internal_transfer = true;
        auto in = transfer("d1", "2024-01-02 10:05:00", TxKind::Deposit, "BTC", "0.4995");
        in.internal_transfer = true;

        Ledger ledger = {
            trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
            out,
            in,
        };
        auto result = engine.run(ledger);

        REQUIRE(result.processed.at("internal") == 2);
        REQUIRE(result.gains.size() == 1);
        REQUIRE(result.gains[0].note == "network fee");
        REQUIRE(result.open_quantity("BTC") == Decimal("0.9995"));
        REQUIRE(result.totals.invested == Decimal(100));
        REQUIRE(result.totals.withdrawn == 0);
        REQUIRE(result.valuations.at("d1").total == 0);
    }

    SECTION("Missing prices are flagged and valued at zero") {
        Ledger ledger = {
            transfer("d1", "2024-01-01 10:00:00", TxKind::Deposit, "OBSCURE", "100", "ethereum", "0x1"),
        };
        auto result = engine.run(ledger);
        REQUIRE(prices.missing().count("OBSCURE") == 1);
        REQUIRE(result.open_lots.at("OBSCURE")[0].unit_cost == 0);
        REQUIRE_FALSE(result.valuations.at("d1").unit_price.has_value());
    }
}

TEST_CASE("FIFO invariants", "[fifo]") {
    auto provider = std::make_shared<FakePriceProvider>();
    provider->set("ETH", "2000");
    PriceResolver resolver(provider, "EUR");

    LedgerBuilder builder;
    builder.add_source("csv", {
        trade("b1", "2024-01-01 10:00:00", TxKind::Buy, "ETH", "2", "1500", "EUR", "0.002", "ETH"),
        trade("b2", "2024-01-05 10:00:00", TxKind::Buy, "ETH", "1.25", "1700"),
        trade("s1", "2024-01-09 10:00:00", TxKind::Sell, "ETH", "2.5", "2100", "EUR", "3", "EUR"),
        trade("s2", "2024-01-12 10:00:00", TxKind::Sell, "ETH", "1", "2200"),
    });
    builder.add_source("wallets", {
        transfer("d1", "2024-01-07 10:00:00", TxKind::Deposit, "ETH", "0.3", "ethereum", "0x1"),
        transfer("f1", "2024-01-07 11:00:00", TxKind::FeeOnly, "ETH", "0.001", "ethereum", "0x1"),
    });
    Ledger ledger = builder.build();

    PriceLookup prices(resolver);
    FifoEngine engine(prices);
    auto result = engine.run(ledger);

    SECTION("Quantity is conserved") {
        Decimal acquired = Decimal(2) + Decimal("1.25") + Decimal("0.3");
        Decimal disposed_from_lots = gained_quantity(result, "ETH", false);
        REQUIRE(acquired == disposed_from_lots + result.open_quantity("ETH"));
    }

    SECTION("Lots never grow") {
        for (const auto& [asset, lots] : result.open_lots) {
            for (const auto& lot : lots) {
                REQUIRE(lot.quantity <= lot.original_quantity);
                REQUIRE(lot.quantity > 0);
            }
        }
    }

    SECTION("Realized total equals the sum of gains") {
        Decimal sum = 0;
        for (const auto& g : result.gains) sum += g.gain;
        REQUIRE(sum == result.totals.realized);
    }

    SECTION("Same ledger, same result") {
        PriceLookup again_prices(resolver);
        FifoEngine again(again_prices);
        auto second = again.run(ledger);

        REQUIRE(second.gains.size() == result.gains.size());
        for (size_t i = 0; i < second.gains.size(); i++) {
            REQUIRE(second.gains[i].lot_id == result.gains[i].lot_id);
            REQUIRE(second.gains[i].gain == result.gains[i].gain);
        }
        REQUIRE(second.totals.realized == result.totals.realized);
    }
}
