#pragma once

#include "chain_client.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Blockstream/Esplora indexer. Confirmed history comes 25 transactions per page,
// the cursor is the last txid seen.
class BtcClient : public ChainClient {
public:
    static constexpr int PAGE_SIZE = 25;

    explicit BtcClient(const std::string& base_url, int timeout_ms = 15000);
    ~BtcClient() override;

    BtcClient(const BtcClient&) = delete;
    BtcClient& operator=(const BtcClient&) = delete;

    std::string chain() const override { return "bitcoin"; }
    std::string native_asset() const override { return "BTC"; }

    TransferPage fetch_page(const std::string& address,
                            const std::optional<std::string>& cursor) override;

    // Net value change of the address (received - spent). Spends carry the
    // transaction fee separately, so amount + fee equals the balance change.
    static ChainTransfer decode(const std::string& address, const nlohmann::json& tx);

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
