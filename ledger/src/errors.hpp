#pragma once

#include <stdexcept>
#include <string>

class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class InputErrorCode {
    BadHeaders,
    UnsupportedFormat,
    BadRow,
    UnparsablePair,
    InvalidSide,
    UnbalancedTrade,
    Empty
};

// Rejected upload. Nothing from the offending input reaches the ledger.
class MalformedInput : public LedgerError {
public:
    MalformedInput(InputErrorCode code, const std::string& message);

    InputErrorCode code() const { return code_; }
    std::string code_string() const;

private:
    InputErrorCode code_;
};

class SourceUnavailable : public LedgerError {
public:
    SourceUnavailable(const std::string& chain, const std::string& address,
                      const std::string& reason);

    const std::string& chain() const { return chain_; }
    const std::string& address() const { return address_; }

private:
    std::string chain_;
    std::string address_;
};

class JobNotFound : public LedgerError {
public:
    explicit JobNotFound(const std::string& job_id);
};

class SessionNotFound : public LedgerError {
public:
    explicit SessionNotFound(const std::string& session_id);
};
