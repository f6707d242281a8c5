#pragma once

#include "decimal.hpp"
#include <cstdint>
#include <string>
#include <optional>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

extern const char* const UNKNOWN_ASSET;

enum class TxKind {
    Buy,
    Sell,
    Deposit,
    Withdrawal,
    FeeOnly
};

std::string kind_string(TxKind kind);
std::optional<TxKind> parse_kind(const std::string& text);
bool is_acquisition(TxKind kind);

// Trade row from an exchange export. Price is in quote_asset units.
struct ExchangeSource {
    std::string exchange;
    std::string pair;
    std::string quote_asset;
    Decimal quote_amount;
};

// Transfer observed on a chain for one of the user's addresses.
struct ChainSource {
    std::string chain;
    std::string address;
    std::string tx_hash;
    std::optional<std::string> counterparty;
};

using TxSource = std::variant<ExchangeSource, ChainSource>;

struct Transaction {
    std::string id;
    int64_t timestamp = 0;
    std::string asset;
    TxKind kind = TxKind::Buy;
    Decimal amount;                 // always positive, direction is the kind
    std::optional<Decimal> price;   // absent for on-chain transfers
    Decimal fee;
    std::string fee_asset = UNKNOWN_ASSET;
    TxSource source;
    nlohmann::json raw = nlohmann::json::object();
    bool internal_transfer = false;

    const ExchangeSource* exchange() const;
    const ChainSource* chain() const;

    std::string location() const;
    std::string source_system() const;
    int source_priority() const;

    // Throws MalformedInput(BadRow) when an invariant is broken.
    void validate() const;
};

using Ledger = std::vector<Transaction>;

void to_json(nlohmann::json& j, const Transaction& tx);
void from_json(const nlohmann::json& j, Transaction& tx);
