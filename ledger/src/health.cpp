#include "health.hpp"

HealthCheck::HealthCheck(const std::string& service_name,
                         std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresSessionStore> pg,
                         const SessionStore& sessions,
                         const JobRegistry& jobs)
    : service_name_(service_name), redis_(redis), pg_(pg), sessions_(sessions), jobs_(jobs) {}

nlohmann::json HealthCheck::get_status() const {
    bool redis_ok = !redis_ || redis_->ping();
    bool pg_ok = !pg_ || pg_->ping();

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok},
        {"service", service_name_},
        {"redis", redis_ ? nlohmann::json(redis_ok) : nlohmann::json("disabled")},
        {"postgres", pg_ ? nlohmann::json(pg_ok) : nlohmann::json("disabled")},
        {"jobs", jobs_.size()}
    };
    if (pg_ok) {
        status["sessions"] = sessions_.size();
    }

    return status;
}

bool HealthCheck::is_healthy() const {
    return (!redis_ || redis_->ping()) && (!pg_ || pg_->ping());
}
