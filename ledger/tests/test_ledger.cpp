#include <catch2/catch_test_macros.hpp>
#include "../src/ledger.hpp"
#include "fakes.hpp"

TEST_CASE("Ledger ordering and dedup", "[ledger]") {
    SECTION("Sorted by time, exchange before chain, then id") {
        LedgerBuilder builder;
        builder.add_source("wallets", {
            transfer("chain-b", "2024-01-01 10:00:00", TxKind::Deposit, "ETH", "1", "ethereum", "0x1"),
            transfer("chain-a", "2024-01-01 09:00:00", TxKind::Deposit, "ETH", "1", "ethereum", "0x1"),
        });
        builder.add_source("csv", {
            trade("ex-2", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
            trade("ex-1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
        });

        auto ledger = builder.build();
        REQUIRE(ledger.size() == 4);
        REQUIRE(ledger[0].id == "chain-a");
        REQUIRE(ledger[1].id == "ex-1");
        REQUIRE(ledger[2].id == "ex-2");
        REQUIRE(ledger[3].id == "chain-b");
    }

    SECTION("Repeated ids keep the first occurrence") {
        LedgerBuilder builder;
        auto first = trade("dup", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100");
        auto second = trade("dup", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "2", "100");
        builder.add_source("a", {first});
        builder.add_source("b", {second});

        auto ledger = builder.build();
        REQUIRE(ledger.size() == 1);
        REQUIRE(ledger[0].amount == Decimal(1));
        REQUIRE(builder.duplicates_dropped() == 1);
    }

    SECTION("Building twice from the same input gives the same ledger") {
        std::vector<Transaction> input = {
            trade("t2", "2024-01-02 10:00:00", TxKind::Sell, "BTC", "1", "100"),
            trade("t1", "2024-01-01 10:00:00", TxKind::Buy, "BTC", "1", "100"),
        };
        LedgerBuilder a;
        a.add_source("csv", input);
        LedgerBuilder b;
        b.add_source("csv", input);

        auto la = a.build();
        auto lb = b.build();
        REQUIRE(la.size() == lb.size());
        for (size_t i = 0; i < la.size(); i++) {
            REQUIRE(la[i].id == lb[i].id);
        }
    }
}

TEST_CASE("Internal transfer reconciliation", "[ledger]") {
    auto withdrawal = exchange_transfer("binance-cash-000001", "2024-01-01 10:00:00", TxKind::Withdrawal, "BTC", "0.5");

    SECTION("Exchange withdrawal matched with a wallet deposit") {
        LedgerBuilder builder;
        builder.add_source("csv", {withdrawal});
        builder.add_source("wallets", {
            transfer("bitcoin:h1:BTC:bc1q", "2024-01-01 10:10:00", TxKind::Deposit, "BTC", "0.4995")
        });

        auto ledger = builder.build();
        REQUIRE(builder.internal_transfers() == 2);
        REQUIRE(ledger[0].internal_transfer);
        REQUIRE(ledger[1].internal_transfer);
    }

    SECTION("Outside the 15 minute window") {
        Ledger ledger = {
            withdrawal,
            transfer("in", "2024-01-01 10:15:01", TxKind::Deposit, "BTC", "0.5")
        };
        REQUIRE(LedgerBuilder::reconcile_internal_transfers(ledger) == 0);
    }

    SECTION("Amounts too far apart") {
        Ledger ledger = {
            withdrawal,
            transfer("in", "2024-01-01 10:05:00", TxKind::Deposit, "BTC", "0.4")
        };
        REQUIRE(LedgerBuilder::reconcile_internal_transfers(ledger) == 0);
    }

    SECTION("Same location or same direction never matches") {
        Ledger ledger = {
            transfer("out", "2024-01-01 10:00:00", TxKind::Withdrawal, "BTC", "0.5"),
            transfer("in", "2024-01-01 10:01:00", TxKind::Deposit, "BTC", "0.5"),
            transfer("out2", "2024-01-01 10:02:00", TxKind::Withdrawal, "BTC", "0.5", "bitcoin", "bc1qother"),
        };
        // "out" and "in" share a wallet; "out2" pairs with "in" instead.
        REQUIRE(LedgerBuilder::reconcile_internal_transfers(ledger) == 2);
        REQUIRE_FALSE(ledger[0].internal_transfer);
        REQUIRE(ledger[1].internal_transfer);
        REQUIRE(ledger[2].internal_transfer);
    }

    SECTION("Each leg is used once") {
        Ledger ledger = {
            withdrawal,
            transfer("in1", "2024-01-01 10:01:00", TxKind::Deposit, "BTC", "0.5"),
            transfer("in2", "2024-01-01 10:02:00", TxKind::Deposit, "BTC", "0.5", "bitcoin", "bc1qother"),
        };
        REQUIRE(LedgerBuilder::reconcile_internal_transfers(ledger) == 2);
        REQUIRE_FALSE(ledger[2].internal_transfer);
    }

    SECTION("Amount tolerance") {
        REQUIRE(LedgerBuilder::amounts_match(Decimal(100), Decimal(98)));
        REQUIRE_FALSE(LedgerBuilder::amounts_match(Decimal(100), Decimal("97.9")));
    }
}
