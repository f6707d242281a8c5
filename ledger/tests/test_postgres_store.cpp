#include <catch2/catch_test_macros.hpp>
#include "../src/postgres_store.hpp"
#include "fakes.hpp"
#include <cstdlib>
#include <vector>

// Runs against a scratch database named by LEDGER_TEST_PG_DSN; the sessions table is emptied first.
TEST_CASE("Postgres session store", "[sessions][postgres]") {
    const char* dsn = std::getenv("LEDGER_TEST_PG_DSN");
    if (!dsn || !*dsn) {
        WARN("LEDGER_TEST_PG_DSN not set, Postgres store not exercised");
        return;
    }

    PostgresSessionStore store(dsn, 2);
    store.init_schema();
    {
        pqxx::connection conn(dsn);
        pqxx::work txn(conn);
        txn.exec("DELETE FROM sessions");
        txn.commit();
    }

    std::vector<std::string> deleted;
    store.set_hooks({nullptr, [&deleted](const std::string& id) { deleted.push_back(id); }});

    auto make = [](const std::string& id, int64_t created_at) {
        auto session = std::make_shared<Session>();
        session->id = id;
        session->status = SessionStatus::Ready;
        session->created_at = created_at;
        session->ledger = {transfer(id + "-d", "2024-01-01 00:00:00", TxKind::Deposit, "BTC", "0.5")};
        return session;
    };

    SECTION("Oldest rows are evicted past the limit") {
        store.put(make("pg-a", 1700000000));
        store.put(make("pg-b", 1700000100));
        store.put(make("pg-c", 1700000200));

        REQUIRE(store.size() == 2);
        REQUIRE(store.get("pg-a") == nullptr);
        REQUIRE(store.get("pg-c") != nullptr);
        REQUIRE(deleted == std::vector<std::string>{"pg-a"});
    }

    SECTION("Reloaded sessions keep their ledger") {
        store.put(make("pg-x", 1700000000));
        PostgresSessionStore fresh(dsn, 2);
        auto loaded = fresh.get("pg-x");
        REQUIRE(loaded != nullptr);
        REQUIRE(loaded->ledger.size() == 1);
        REQUIRE(loaded->ledger[0].amount == Decimal("0.5"));

        REQUIRE(fresh.remove("pg-x"));
        REQUIRE(fresh.get("pg-x") == nullptr);
    }
}
