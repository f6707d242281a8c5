#include "session.hpp"
#include "util.hpp"

std::string status_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Building: return "building";
        case SessionStatus::Ready: return "ready";
        case SessionStatus::Error: return "error";
        default: return "unknown";
    }
}

std::optional<SessionStatus> parse_session_status(const std::string& text) {
    std::string s = util::to_lower(util::trim(text));
    if (s == "building") return SessionStatus::Building;
    if (s == "ready") return SessionStatus::Ready;
    if (s == "error") return SessionStatus::Error;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Session& session) {
    j = nlohmann::json{
        {"id", session.id},
        {"status", status_string(session.status)},
        {"reporting_currency", session.reporting_currency},
        {"ledger", session.ledger},
        {"accounting", session.accounting},
        {"report", session.report},
        {"warnings", session.warnings},
        {"created_at", session.created_at}
    };
}

void from_json(const nlohmann::json& j, Session& session) {
    session.id = j.at("id").get<std::string>();
    session.status = parse_session_status(j.value("status", "ready")).value_or(SessionStatus::Error);
    session.reporting_currency = j.value("reporting_currency", "EUR");
    session.ledger = j.at("ledger").get<Ledger>();
    session.accounting = j.at("accounting").get<AccountingResult>();
    session.report = j.at("report").get<Report>();
    session.warnings = j.value("warnings", std::vector<std::string>{});
    session.created_at = j.value("created_at", int64_t(0));
}
