#pragma once

#include "session_store.hpp"
#include <string>
#include <pqxx/pqxx>

// Write-through store: sessions live in Postgres, recent ones are also kept in memory.
// Beyond max_sessions the oldest rows are deleted, in the table and the cache alike.
class PostgresSessionStore : public SessionStore {
public:
    explicit PostgresSessionStore(const std::string& dsn, size_t max_sessions = 50);

    void init_schema();

    void put(SessionPtr session) override;
    SessionPtr get(const std::string& id) override;
    bool remove(const std::string& id) override;
    size_t size() const override;

    bool ping();

private:
    std::string dsn_;
    size_t max_sessions_;
    InMemorySessionStore cache_;

    pqxx::connection make_connection() const;
};
