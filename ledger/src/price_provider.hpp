#pragma once

#include "decimal.hpp"
#include <cstdint>
#include <optional>
#include <string>

class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    // Unit price of `asset` in `currency` on the UTC day starting at `day_start`.
    // Returns nullopt on transport errors, rate limits or unknown assets.
    virtual std::optional<Decimal> historical_price(const std::string& asset,
                                                    int64_t day_start,
                                                    const std::string& currency) = 0;
};
