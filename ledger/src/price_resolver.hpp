#pragma once

#include "price_provider.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

// Process-wide historical price cache keyed by (asset, UTC day).
// Failed lookups are not cached so a later run can retry them.
class PriceResolver {
public:
    explicit PriceResolver(std::shared_ptr<PriceProvider> provider,
                           const std::string& reporting_currency = "EUR");

    std::optional<Decimal> resolve(const std::string& asset, int64_t timestamp);

    const std::string& reporting_currency() const { return reporting_currency_; }
    size_t cache_size() const;

private:
    std::shared_ptr<PriceProvider> provider_;
    std::string reporting_currency_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, int64_t>, Decimal> cache_;
};

// One analysis run's view of the resolver. Collects the assets it could not price
// and does not ask again for an (asset, day) that already failed in this run.
class PriceLookup {
public:
    explicit PriceLookup(PriceResolver& resolver);

    std::optional<Decimal> price(const std::string& asset, int64_t timestamp);
    // amount x price, or 0 with the asset flagged as missing.
    Decimal value_of(const std::string& asset, const Decimal& amount, int64_t timestamp);

    void flag_missing(const std::string& asset);
    const std::set<std::string>& missing() const { return missing_; }

    const std::string& reporting_currency() const { return resolver_.reporting_currency(); }
    bool is_reporting(const std::string& asset) const;

private:
    PriceResolver& resolver_;
    std::set<std::string> missing_;
    std::set<std::pair<std::string, int64_t>> unresolved_;
};
