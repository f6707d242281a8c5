#pragma once

#include "price_provider.hpp"
#include <mutex>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class CoinGeckoClient : public PriceProvider {
public:
    explicit CoinGeckoClient(const std::string& base_url, const std::string& api_key = "",
                             int timeout_ms = 15000);
    ~CoinGeckoClient() override;

    CoinGeckoClient(const CoinGeckoClient&) = delete;
    CoinGeckoClient& operator=(const CoinGeckoClient&) = delete;

    std::optional<Decimal> historical_price(const std::string& asset,
                                            int64_t day_start,
                                            const std::string& currency) override;

    // "BTC" -> "bitcoin"; unknown symbols fall back to the lower-cased symbol.
    static std::string coin_id(const std::string& symbol);
    // dd-mm-yyyy as the history endpoint expects.
    static std::string date_param(int64_t day_start);

private:
    std::string base_url_;
    std::string api_key_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex curl_mutex_;

    nlohmann::json make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
