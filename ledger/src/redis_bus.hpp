#pragma once

#include "session_store.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Session lifecycle audit trail on a capped Redis stream.
class RedisBus {
public:
    static constexpr long long STREAM_MAXLEN = 10000;

    RedisBus(const std::string& redis_url, const std::string& audit_stream);

    // Best effort: failures are logged, never thrown.
    void publish_audit(const nlohmann::json& event);

    void session_created(const Session& session);
    void session_deleted(const std::string& session_id);

    // Hooks that forward store lifecycle events to the audit stream.
    SessionHooks session_hooks();

    const std::string& audit_stream() const { return audit_stream_; }
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string audit_stream_;
};
