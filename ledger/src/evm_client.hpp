#pragma once

#include "chain_client.hpp"
#include "evm_chains.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Etherscan-style explorer. Native transfers come from txlist, tokens from tokentx.
// Cursor format: "<action>:<page>".
class EvmClient : public ChainClient {
public:
    EvmClient(const EvmChainConfig& config, const std::string& api_key,
              int page_size = 1000, int timeout_ms = 15000);
    ~EvmClient() override;

    EvmClient(const EvmClient&) = delete;
    EvmClient& operator=(const EvmClient&) = delete;

    std::string chain() const override { return config_.chain_id; }
    std::string native_asset() const override { return config_.symbol; }

    TransferPage fetch_page(const std::string& address,
                            const std::optional<std::string>& cursor) override;

    static ChainTransfer decode_native(const EvmChainConfig& config, const std::string& address,
                                       const nlohmann::json& tx);
    static ChainTransfer decode_token(const EvmChainConfig& config, const std::string& address,
                                      const nlohmann::json& tx);

private:
    EvmChainConfig config_;
    std::string api_key_;
    int page_size_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& url);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
