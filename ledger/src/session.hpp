#pragma once

#include "fifo_engine.hpp"
#include "reporting.hpp"
#include "transaction.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SessionStatus {
    Building,
    Ready,
    Error
};

std::string status_string(SessionStatus status);
std::optional<SessionStatus> parse_session_status(const std::string& text);

// Everything one analysis produced. Owned exclusively by the session store.
struct Session {
    std::string id;
    SessionStatus status = SessionStatus::Building;
    std::string reporting_currency = "EUR";
    Ledger ledger;
    AccountingResult accounting;
    Report report;
    std::vector<std::string> warnings;
    int64_t created_at = 0;
};

void to_json(nlohmann::json& j, const Session& session);
void from_json(const nlohmann::json& j, Session& session);
