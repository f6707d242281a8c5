#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, const std::string& audit_stream)
    : audit_stream_(audit_stream)
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Audit events go to Redis stream {}", audit_stream_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::publish_audit(const nlohmann::json& event) {
    try {
        std::unordered_map<std::string, std::string> fields = {
            {"event", event.value("event", "")},
            {"data", event.dump()}
        };
        redis_->xadd(audit_stream_, "*", fields.begin(), fields.end(), STREAM_MAXLEN, true);
    } catch (const std::exception& e) {
        spdlog::warn("Audit event {} dropped: {}", event.value("event", ""), e.what());
    }
}

void RedisBus::session_created(const Session& session) {
    publish_audit({
        {"event", "session_created"},
        {"session_id", session.id},
        {"transactions", session.ledger.size()},
        {"missing_prices", session.report.missing_prices.size()},
        {"ts", util::current_iso8601()}
    });
}

void RedisBus::session_deleted(const std::string& session_id) {
    publish_audit({
        {"event", "session_deleted"},
        {"session_id", session_id},
        {"ts", util::current_iso8601()}
    });
}

SessionHooks RedisBus::session_hooks() {
    SessionHooks hooks;
    hooks.on_created = [this](const Session& session) { session_created(session); };
    hooks.on_deleted = [this](const std::string& id) { session_deleted(id); };
    return hooks;
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
