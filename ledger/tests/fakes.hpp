#pragma once

#include "../src/chain_client.hpp"
#include "../src/price_provider.hpp"
#include "../src/transaction.hpp"
#include "../src/util.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

// Flat price per asset, or per (asset, day) when set_daily was used.
class FakePriceProvider : public PriceProvider {
public:
    void set(const std::string& asset, const std::string& price) {
        std::lock_guard<std::mutex> lock(mutex_);
        flat_[asset] = Decimal(price.c_str());
    }

    void set_daily(const std::string& asset, int64_t day, const std::string& price) {
        std::lock_guard<std::mutex> lock(mutex_);
        daily_[{asset, day}] = Decimal(price.c_str());
    }

    void fail_with(const std::string& asset) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwing_[asset] = true;
    }

    std::optional<Decimal> historical_price(const std::string& asset, int64_t day_start,
                                            const std::string& currency) override {
        calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        last_currency = currency;
        if (throwing_.count(asset)) {
            throw std::runtime_error("rate limited");
        }
        auto daily = daily_.find({asset, day_start});
        if (daily != daily_.end()) return daily->second;
        auto flat = flat_.find(asset);
        if (flat != flat_.end()) return flat->second;
        return std::nullopt;
    }

    std::atomic<int> calls{0};
    std::string last_currency;

private:
    std::mutex mutex_;
    std::map<std::string, Decimal> flat_;
    std::map<std::pair<std::string, int64_t>, Decimal> daily_;
    std::map<std::string, bool> throwing_;
};

// Pages keyed by cursor ("" is the first page). An address listed in
// failing makes fetch_page throw.
struct FakeChainData {
    std::string chain = "ethereum";
    std::string native = "ETH";
    std::map<std::string, std::map<std::string, TransferPage>> pages;
    std::map<std::string, bool> failing;
};

class FakeChainClient : public ChainClient {
public:
    explicit FakeChainClient(std::shared_ptr<const FakeChainData> data)
        : data_(std::move(data)) {}

    std::string chain() const override { return data_->chain; }
    std::string native_asset() const override { return data_->native; }

    TransferPage fetch_page(const std::string& address,
                            const std::optional<std::string>& cursor) override {
        if (data_->failing.count(address)) {
            throw std::runtime_error("indexer returned HTTP 503");
        }
        auto by_address = data_->pages.find(address);
        if (by_address == data_->pages.end()) return {};
        auto page = by_address->second.find(cursor.value_or(""));
        if (page == by_address->second.end()) return {};
        return page->second;
    }

private:
    std::shared_ptr<const FakeChainData> data_;
};

inline ChainClientFactory fake_factory(std::shared_ptr<const FakeChainData> data) {
    return [data](const std::string& chain) -> std::unique_ptr<ChainClient> {
        if (chain != data->chain) return nullptr;
        return std::make_unique<FakeChainClient>(data);
    };
}

inline ChainTransfer make_transfer(const std::string& hash, int64_t ts, const std::string& asset,
                                   const std::string& amount, const std::string& fee = "0",
                                   const std::string& fee_asset = "ETH") {
    ChainTransfer t;
    t.hash = hash;
    t.timestamp = ts;
    t.asset = asset;
    t.amount = Decimal(amount.c_str());
    t.fee = Decimal(fee.c_str());
    t.fee_asset = fee_asset;
    return t;
}

inline int64_t ts(const std::string& text) {
    return *util::parse_utc_timestamp(text);
}

inline Transaction trade(const std::string& id, const std::string& when, TxKind side,
                         const std::string& asset, const std::string& amount,
                         const std::string& price, const std::string& quote = "EUR",
                         const std::string& fee = "0", const std::string& fee_asset = "EUR") {
    Transaction tx;
    tx.id = id;
    tx.timestamp = ts(when);
    tx.asset = asset;
    tx.kind = side;
    tx.amount = Decimal(amount.c_str());
    tx.price = Decimal(price.c_str());
    tx.fee = Decimal(fee.c_str());
    tx.fee_asset = fee_asset;

    ExchangeSource source;
    source.exchange = "binance";
    source.pair = asset + "/" + quote;
    source.quote_asset = quote;
    source.quote_amount = tx.amount * *tx.price;
    tx.source = source;
    return tx;
}

inline Transaction transfer(const std::string& id, const std::string& when, TxKind kind,
                            const std::string& asset, const std::string& amount,
                            const std::string& chain = "bitcoin", const std::string& address = "bc1qwallet") {
    Transaction tx;
    tx.id = id;
    tx.timestamp = ts(when);
    tx.asset = asset;
    tx.kind = kind;
    tx.amount = Decimal(amount.c_str());
    tx.fee_asset = asset;
    tx.source = ChainSource{chain, address, id, std::nullopt};
    return tx;
}

inline Transaction exchange_transfer(const std::string& id, const std::string& when, TxKind kind,
                                     const std::string& asset, const std::string& amount) {
    Transaction tx;
    tx.id = id;
    tx.timestamp = ts(when);
    tx.asset = asset;
    tx.kind = kind;
    tx.amount = Decimal(amount.c_str());
    tx.fee_asset = asset;
    ExchangeSource source;
    source.exchange = "binance";
    tx.source = source;
    return tx;
}
