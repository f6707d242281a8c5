#include "postgres_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <vector>

PostgresSessionStore::PostgresSessionStore(const std::string& dsn, size_t max_sessions)
    : dsn_(dsn)
    , max_sessions_(max_sessions)
    , cache_(max_sessions)
{
    spdlog::info("PostgresSessionStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresSessionStore::make_connection() const {
    return pqxx::connection(dsn_);
}

void PostgresSessionStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS sessions (
                id TEXT PRIMARY KEY,
                payload JSONB NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresSessionStore::put(SessionPtr session) {
    if (!session) return;

    std::vector<std::string> evicted;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        nlohmann::json payload = *session;
        txn.exec_params(
            "INSERT INTO sessions (id, payload, created_at) "
            "VALUES ($1, $2::jsonb, to_timestamp($3)) "
            "ON CONFLICT (id) DO UPDATE SET payload = EXCLUDED.payload",
            session->id,
            payload.dump(),
            session->created_at
        );

        if (max_sessions_ > 0) {
            auto result = txn.exec_params(
                "DELETE FROM sessions WHERE id IN ("
                "  SELECT id FROM sessions ORDER BY created_at DESC, id DESC OFFSET $1"
                ") RETURNING id",
                static_cast<int64_t>(max_sessions_)
            );
            for (const auto& row : result) {
                evicted.push_back(row[0].as<std::string>());
            }
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save session {}: {}", session->id, e.what());
        throw;
    }

    cache_.put(session);
    notify_created(*session);

    for (const auto& id : evicted) {
        cache_.remove(id);
        spdlog::info("Evicted session {}", id);
        notify_deleted(id);
    }
}

SessionPtr PostgresSessionStore::get(const std::string& id) {
    if (auto cached = cache_.get(id)) {
        return cached;
    }

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT payload::text FROM sessions WHERE id = $1",
            id
        );
        txn.commit();

        if (result.empty()) {
            return nullptr;
        }

        auto payload = nlohmann::json::parse(result[0][0].as<std::string>());
        auto session = std::make_shared<const Session>(payload.get<Session>());
        cache_.put(session);
        return session;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load session {}: {}", id, e.what());
        throw;
    }
}

bool PostgresSessionStore::remove(const std::string& id) {
    bool removed = cache_.remove(id);

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params("DELETE FROM sessions WHERE id = $1", id);
        txn.commit();

        removed = removed || result.affected_rows() > 0;

    } catch (const std::exception& e) {
        spdlog::error("Failed to delete session {}: {}", id, e.what());
        throw;
    }

    if (removed) {
        notify_deleted(id);
    }
    return removed;
}

size_t PostgresSessionStore::size() const {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec("SELECT COUNT(*) FROM sessions");
        txn.commit();
        return result[0][0].as<size_t>();
    } catch (const std::exception& e) {
        spdlog::error("Failed to count sessions: {}", e.what());
        return cache_.size();
    }
}

bool PostgresSessionStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
