#include "evm_client.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
    std::string field(const nlohmann::json& tx, const char* key) {
        if (!tx.contains(key) || tx[key].is_null()) return "";
        if (tx[key].is_string()) return tx[key].get<std::string>();
        return tx[key].dump();
    }

    std::string units_or_zero(const std::string& text) {
        return text.empty() ? "0" : text;
    }

    int64_t parse_epoch(const std::string& text) {
        if (text.empty()) return 0;
        try {
            return std::stoll(text);
        } catch (const std::exception&) {
            return 0;
        }
    }

    std::pair<std::string, int> parse_cursor(const std::optional<std::string>& cursor) {
        if (!cursor) return {"txlist", 1};
        auto pos = cursor->find(':');
        if (pos == std::string::npos) {
            throw std::invalid_argument("Bad EVM cursor: " + *cursor);
        }
        return {cursor->substr(0, pos), std::stoi(cursor->substr(pos + 1))};
    }
}

EvmClient::EvmClient(const EvmChainConfig& config, const std::string& api_key,
                     int page_size, int timeout_ms)
    : config_(config)
    , api_key_(api_key)
    , page_size_(page_size)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for " + config_.chain_id);
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
}

EvmClient::~EvmClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t EvmClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json EvmClient::make_request(const std::string& url) {
    std::string response_string;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        spdlog::error("{} explorer request failed: {}", config_.chain_id, curl_easy_strerror(res));
        throw std::runtime_error(fmt::format("{} explorer request failed: {}",
                                             config_.chain_id, curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        throw std::runtime_error(fmt::format("{} explorer returned HTTP {}", config_.chain_id, http_code));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse {} explorer response: {}", config_.chain_id, e.what());
        throw std::runtime_error(config_.chain_id + " explorer response not understood");
    }
}

TransferPage EvmClient::fetch_page(const std::string& address,
                                   const std::optional<std::string>& cursor) {
    auto [action, page] = parse_cursor(cursor);

    std::string url = fmt::format(
        "{}?module=account&action={}&address={}&startblock=0&endblock=99999999"
        "&page={}&offset={}&sort=asc&chain={}&chainid={}&apikey={}",
        config_.base_url, action, address, page, page_size_,
        config_.api_chain, config_.chain_identifier,
        api_key_.empty() ? "YourApiKeyToken" : api_key_);

    auto response = make_request(url);

    TransferPage result;
    std::string status = field(response, "status");
    const auto& rows = response.contains("result") ? response["result"] : nlohmann::json();

    if (status != "1") {
        std::string message = field(response, "message");
        bool no_data = message.find("No transactions") != std::string::npos
                       || (rows.is_array() && rows.empty());
        if (!no_data && action == "txlist") {
            if (rows.is_string()) message += ": " + rows.get<std::string>();
            if (util::to_upper(message).find("API KEY") != std::string::npos) {
                throw std::runtime_error(fmt::format(
                    "{} explorer requires a valid API key (set {})", config_.chain_id, config_.api_key_env));
            }
            throw std::runtime_error(fmt::format("{} API error: {}", config_.chain_id, message));
        }
        // tokentx failures only lose token transfers
        if (!no_data) {
            spdlog::warn("{} token transfers unavailable for {}: {}",
                         config_.chain_id, util::abbreviate(address), message);
        }
    } else if (!rows.is_array()) {
        throw std::runtime_error(config_.chain_id + " API response not understood");
    } else {
        for (const auto& tx : rows) {
            try {
                if (action == "txlist") {
                    result.transfers.push_back(decode_native(config_, address, tx));
                } else {
                    result.transfers.push_back(decode_token(config_, address, tx));
                }
            } catch (const std::exception& e) {
                spdlog::warn("Skipping undecodable {} record: {}", config_.chain_id, e.what());
            }
        }
    }

    bool full_page = status == "1" && rows.is_array() && (int)rows.size() >= page_size_;
    if (full_page) {
        result.next_cursor = fmt::format("{}:{}", action, page + 1);
    } else if (action == "txlist") {
        result.next_cursor = "tokentx:1";
    }

    return result;
}

ChainTransfer EvmClient::decode_native(const EvmChainConfig& config, const std::string& address,
                                       const nlohmann::json& tx) {
    ChainTransfer transfer;
    transfer.hash = field(tx, "hash");
    if (transfer.hash.empty()) {
        throw std::invalid_argument("transaction without hash");
    }
    transfer.timestamp = parse_epoch(field(tx, "timeStamp"));
    transfer.asset = config.symbol;
    transfer.fee_asset = config.symbol;

    std::string self = util::to_lower(address);
    std::string from = util::to_lower(field(tx, "from"));
    std::string to = util::to_lower(field(tx, "to"));
    bool outgoing = from == self;
    bool incoming = to == self;
    bool failed = field(tx, "isError") == "1";

    Decimal value = decimal::from_base_units(units_or_zero(field(tx, "value")), config.decimals);
    if (failed || (incoming && outgoing)) {
        transfer.amount = 0;
    } else if (incoming) {
        transfer.amount = value;
        transfer.counterparty = from;
    } else {
        transfer.amount = -value;
        if (!to.empty()) transfer.counterparty = to;
    }

    // Gas is charged to the sender only.
    if (outgoing) {
        Decimal gas_price = decimal::from_base_units(units_or_zero(field(tx, "gasPrice")), config.decimals);
        Decimal gas_used = decimal::parse(units_or_zero(field(tx, "gasUsed")));
        transfer.fee = gas_price * gas_used;
    }

    transfer.raw = {
        {"hash", transfer.hash},
        {"nonce", field(tx, "nonce")},
        {"blockNumber", field(tx, "blockNumber")},
        {"from", field(tx, "from")},
        {"to", field(tx, "to")},
        {"value", decimal::to_string(value, 18)},
        {"gasPrice", field(tx, "gasPrice")},
        {"gasUsed", field(tx, "gasUsed")},
        {"isError", field(tx, "isError")}
    };
    return transfer;
}

ChainTransfer EvmClient::decode_token(const EvmChainConfig& config, const std::string& address,
                                      const nlohmann::json& tx) {
    ChainTransfer transfer;
    transfer.hash = field(tx, "hash");
    if (transfer.hash.empty()) {
        throw std::invalid_argument("token transfer without hash");
    }
    transfer.timestamp = parse_epoch(field(tx, "timeStamp"));

    std::string symbol = field(tx, "tokenSymbol");
    if (symbol.empty()) symbol = field(tx, "tokenName");
    if (symbol.empty()) symbol = "TOKEN";
    transfer.asset = util::to_upper(util::trim(symbol));
    transfer.fee_asset = config.symbol;

    int decimals = 0;
    std::string decimals_text = field(tx, "tokenDecimal");
    if (!decimals_text.empty()) decimals = std::stoi(decimals_text);

    std::string self = util::to_lower(address);
    std::string from = util::to_lower(field(tx, "from"));
    std::string to = util::to_lower(field(tx, "to"));

    Decimal value = decimal::from_base_units(units_or_zero(field(tx, "value")), decimals);
    if (to == self && from == self) {
        transfer.amount = 0;
    } else if (to == self) {
        transfer.amount = value;
        transfer.counterparty = from;
    } else {
        transfer.amount = -value;
        if (!to.empty()) transfer.counterparty = to;
    }

    transfer.raw = {
        {"hash", transfer.hash},
        {"contractAddress", field(tx, "contractAddress")},
        {"tokenName", field(tx, "tokenName")},
        {"tokenSymbol", field(tx, "tokenSymbol")},
        {"tokenDecimal", decimals_text},
        {"from", field(tx, "from")},
        {"to", field(tx, "to")},
        {"value", decimal::to_string(value, 18)}
    };
    return transfer;
}
