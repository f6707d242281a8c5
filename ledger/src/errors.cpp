#include "errors.hpp"
#include "util.hpp"

MalformedInput::MalformedInput(InputErrorCode code, const std::string& message)
    : LedgerError(message)
    , code_(code)
{}

std::string MalformedInput::code_string() const {
    switch (code_) {
        case InputErrorCode::BadHeaders: return "BadHeaders";
        case InputErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case InputErrorCode::BadRow: return "BadRow";
        case InputErrorCode::UnparsablePair: return "UnparsablePair";
        case InputErrorCode::InvalidSide: return "InvalidSide";
        case InputErrorCode::UnbalancedTrade: return "UnbalancedTrade";
        case InputErrorCode::Empty: return "Empty";
        default: return "Unknown";
    }
}

SourceUnavailable::SourceUnavailable(const std::string& chain, const std::string& address,
                                     const std::string& reason)
    : LedgerError(chain + " source " + util::abbreviate(address) + " unavailable: " + reason)
    , chain_(chain)
    , address_(address)
{}

JobNotFound::JobNotFound(const std::string& job_id)
    : LedgerError("Job not found: " + job_id)
{}

SessionNotFound::SessionNotFound(const std::string& session_id)
    : LedgerError("Session not found: " + session_id)
{}
