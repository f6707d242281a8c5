#include "price_resolver.hpp"
#include "transaction.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PriceResolver::PriceResolver(std::shared_ptr<PriceProvider> provider,
                             const std::string& reporting_currency)
    : provider_(std::move(provider))
    , reporting_currency_(util::to_upper(reporting_currency))
{}

std::optional<Decimal> PriceResolver::resolve(const std::string& asset, int64_t timestamp) {
    std::string symbol = util::to_upper(util::trim(asset));
    if (symbol == reporting_currency_) {
        return Decimal(1);
    }
    if (symbol.empty() || symbol == UNKNOWN_ASSET || !provider_) {
        return std::nullopt;
    }

    int64_t day = util::start_of_day(timestamp);
    auto key = std::make_pair(symbol, day);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    // Provider calls can take seconds; other runs keep reading the cache meanwhile.
    std::optional<Decimal> price;
    try {
        price = provider_->historical_price(symbol, day, reporting_currency_);
    } catch (const std::exception& e) {
        spdlog::warn("Price lookup for {} on {} failed: {}", symbol, util::format_date(day), e.what());
        return std::nullopt;
    }

    if (!price) {
        spdlog::debug("No {} price for {} on {}", reporting_currency_, symbol, util::format_date(day));
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(key, *price);
    return price;
}

size_t PriceResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

PriceLookup::PriceLookup(PriceResolver& resolver)
    : resolver_(resolver)
{}

std::optional<Decimal> PriceLookup::price(const std::string& asset, int64_t timestamp) {
    auto key = std::make_pair(util::to_upper(util::trim(asset)), util::start_of_day(timestamp));
    if (unresolved_.count(key)) {
        return std::nullopt;
    }

    auto result = resolver_.resolve(asset, timestamp);
    if (!result) {
        unresolved_.insert(key);
        flag_missing(asset);
    }
    return result;
}

Decimal PriceLookup::value_of(const std::string& asset, const Decimal& amount, int64_t timestamp) {
    if (amount == 0) return Decimal(0);
    auto unit = price(asset, timestamp);
    return unit ? amount * *unit : Decimal(0);
}

void PriceLookup::flag_missing(const std::string& asset) {
    std::string symbol = util::to_upper(util::trim(asset));
    if (symbol.empty()) symbol = UNKNOWN_ASSET;
    missing_.insert(symbol);
}

bool PriceLookup::is_reporting(const std::string& asset) const {
    return util::to_upper(asset) == resolver_.reporting_currency();
}
