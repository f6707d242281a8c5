#pragma once

#include "job.hpp"
#include "postgres_store.hpp"
#include "redis_bus.hpp"
#include "session_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

// Redis and Postgres are optional; a missing backend reports "disabled".
class HealthCheck {
public:
    HealthCheck(const std::string& service_name,
                std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresSessionStore> pg,
                const SessionStore& sessions,
                const JobRegistry& jobs);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::string service_name_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresSessionStore> pg_;
    const SessionStore& sessions_;
    const JobRegistry& jobs_;
};
