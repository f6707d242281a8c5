#include "cg_client.hpp"
#include "util.hpp"
#include <ctime>
#include <map>
#include <spdlog/spdlog.h>

namespace {
    const std::map<std::string, std::string> SYMBOL_TO_ID = {
        {"BTC", "bitcoin"},
        {"ETH", "ethereum"},
        {"BNB", "binancecoin"},
        {"USDT", "tether"},
        {"BUSD", "binance-usd"},
        {"USDC", "usd-coin"},
        {"FDUSD", "first-digital-usd"},
        {"TUSD", "true-usd"},
        {"DAI", "dai"},
        {"ADA", "cardano"},
        {"XRP", "ripple"},
        {"DOT", "polkadot"},
        {"SOL", "solana"},
        {"MATIC", "matic-network"},
        {"POL", "polygon-ecosystem-token"},
        {"AVAX", "avalanche-2"},
        {"ARB", "arbitrum"},
        {"OP", "optimism"},
        {"LINK", "chainlink"},
        {"UNI", "uniswap"},
        {"DOGE", "dogecoin"},
        {"LTC", "litecoin"},
        {"WETH", "weth"},
        {"WBTC", "wrapped-bitcoin"},
    };
}

CoinGeckoClient::CoinGeckoClient(const std::string& base_url, const std::string& api_key, int timeout_ms)
    : base_url_(base_url)
    , api_key_(api_key)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for CoinGecko");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
}

CoinGeckoClient::~CoinGeckoClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t CoinGeckoClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string CoinGeckoClient::coin_id(const std::string& symbol) {
    std::string upper = util::to_upper(util::trim(symbol));
    auto it = SYMBOL_TO_ID.find(upper);
    if (it != SYMBOL_TO_ID.end()) return it->second;
    return util::to_lower(upper);
}

std::string CoinGeckoClient::date_param(int64_t day_start) {
    std::time_t t = static_cast<std::time_t>(day_start);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%d-%m-%Y", &tm);
    return buf;
}

nlohmann::json CoinGeckoClient::make_request(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(curl_mutex_);

    std::string response_string;
    std::string url = base_url_ + endpoint;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!api_key_.empty()) {
        std::string key_header = "x-cg-demo-api-key: " + api_key_;
        headers = curl_slist_append(headers, key_header.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, NULL);

    if (res != CURLE_OK) {
        spdlog::error("CoinGecko request failed: {}", curl_easy_strerror(res));
        return nlohmann::json{};
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        spdlog::warn("CoinGecko returned HTTP {} for {}", http_code, endpoint);
        return nlohmann::json{};
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse CoinGecko response: {}", e.what());
        return nlohmann::json{};
    }
}

std::optional<Decimal> CoinGeckoClient::historical_price(const std::string& asset,
                                                         int64_t day_start,
                                                         const std::string& currency) {
    std::string cg_id = coin_id(asset);
    std::string vs = util::to_lower(currency);

    std::string endpoint = "/coins/" + cg_id + "/history?date=" + date_param(day_start)
                           + "&localization=false";
    auto response = make_request(endpoint);

    if (response.empty() || !response.contains("market_data")) {
        return std::nullopt;
    }

    const auto& prices = response["market_data"]["current_price"];
    if (!prices.is_object() || !prices.contains(vs) || !prices[vs].is_number()) {
        return std::nullopt;
    }

    Decimal price;
    if (!decimal::try_parse(prices[vs].dump(), price)) {
        return std::nullopt;
    }
    return price;
}
