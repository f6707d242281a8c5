#include "btc_client.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {
    const int SATOSHI_DECIMALS = 8;

    int64_t sats(const nlohmann::json& node, const char* key) {
        if (!node.contains(key) || !node[key].is_number_integer()) return 0;
        return node[key].get<int64_t>();
    }

    std::string output_address(const nlohmann::json& node) {
        if (!node.is_object() || !node.contains("scriptpubkey_address")) return "";
        const auto& value = node["scriptpubkey_address"];
        return value.is_string() ? value.get<std::string>() : "";
    }
}

BtcClient::BtcClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Blockstream");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
}

BtcClient::~BtcClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t BtcClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json BtcClient::make_request(const std::string& endpoint) {
    std::string response_string;
    std::string url = base_url_ + endpoint;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        spdlog::error("Blockstream request failed: {}", curl_easy_strerror(res));
        throw std::runtime_error(fmt::format("Blockstream request failed: {}", curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        throw std::runtime_error(fmt::format("Blockstream returned HTTP {}: {}", http_code, response_string));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse Blockstream response: {}", e.what());
        throw std::runtime_error("Blockstream response not understood");
    }
}

TransferPage BtcClient::fetch_page(const std::string& address,
                                   const std::optional<std::string>& cursor) {
    std::string endpoint = "/address/" + address + "/txs/chain";
    if (cursor) {
        endpoint += "/" + *cursor;
    }

    auto response = make_request(endpoint);
    if (!response.is_array()) {
        throw std::runtime_error("Blockstream response not understood");
    }

    TransferPage page;
    std::string last_txid;
    for (const auto& tx : response) {
        if (tx.contains("txid") && tx["txid"].is_string()) {
            last_txid = tx["txid"].get<std::string>();
        }
        try {
            auto transfer = decode(address, tx);
            if (transfer.amount != 0 || transfer.fee != 0) {
                page.transfers.push_back(std::move(transfer));
            }
        } catch (const std::exception& e) {
            spdlog::warn("Skipping undecodable bitcoin transaction: {}", e.what());
        }
    }

    if ((int)response.size() >= PAGE_SIZE && !last_txid.empty()) {
        page.next_cursor = last_txid;
    }
    return page;
}

ChainTransfer BtcClient::decode(const std::string& address, const nlohmann::json& tx) {
    if (!tx.contains("txid") || !tx["txid"].is_string()) {
        throw std::invalid_argument("transaction without txid");
    }

    ChainTransfer transfer;
    transfer.hash = tx["txid"].get<std::string>();
    transfer.asset = "BTC";
    transfer.fee_asset = "BTC";

    const auto& status = tx.contains("status") ? tx["status"] : nlohmann::json::object();
    int64_t block_time = sats(status, "block_time");
    transfer.timestamp = block_time > 0 ? block_time : util::current_timestamp();

    int64_t spent = 0;
    int64_t received = 0;
    std::string source;
    std::string destination;

    if (tx.contains("vin")) {
        for (const auto& vin : tx["vin"]) {
            if (!vin.contains("prevout")) continue;
            const auto& prev = vin["prevout"];
            std::string owner = output_address(prev);
            if (source.empty()) source = owner;
            if (owner == address) spent += sats(prev, "value");
        }
    }
    if (tx.contains("vout")) {
        for (const auto& vout : tx["vout"]) {
            std::string owner = output_address(vout);
            if (owner == address) {
                received += sats(vout, "value");
            } else if (destination.empty() && !owner.empty()) {
                destination = owner;
            }
        }
    }

    int64_t change = received - spent;
    int64_t fee = 0;
    if (change < 0) {
        // The spender pays the whole fee; what left the wallet is the rest.
        fee = std::min(sats(tx, "fee"), -change);
        change += fee;
        if (!destination.empty()) transfer.counterparty = destination;
    } else if (change > 0 && !source.empty()) {
        transfer.counterparty = source;
    }

    transfer.amount = decimal::from_base_units(std::to_string(change), SATOSHI_DECIMALS);
    transfer.fee = decimal::from_base_units(std::to_string(fee), SATOSHI_DECIMALS);

    transfer.raw = {
        {"hash", transfer.hash},
        {"balance_change", decimal::to_string(
            decimal::from_base_units(std::to_string(received - spent), SATOSHI_DECIMALS), 8)},
        {"fee_sats", fee},
        {"block_height", sats(status, "block_height")}
    };
    return transfer;
}
