#pragma once

#include "decimal.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One balance change of a watched address, already decoded from the chain format.
struct ChainTransfer {
    std::string hash;
    int64_t timestamp = 0;
    std::string asset;
    Decimal amount;              // signed: positive received, negative sent
    Decimal fee;                 // network fee paid by the address
    std::string fee_asset;
    std::optional<std::string> counterparty;
    nlohmann::json raw = nlohmann::json::object();
};

struct TransferPage {
    std::vector<ChainTransfer> transfers;
    std::optional<std::string> next_cursor;
};

class ChainClient {
public:
    virtual ~ChainClient() = default;

    virtual std::string chain() const = 0;
    virtual std::string native_asset() const = 0;

    // Throws on transport or indexer errors.
    virtual TransferPage fetch_page(const std::string& address,
                                    const std::optional<std::string>& cursor) = 0;
};

// Returns nullptr for chains it does not know.
using ChainClientFactory = std::function<std::unique_ptr<ChainClient>(const std::string& chain)>;
