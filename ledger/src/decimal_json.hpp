#pragma once

#include "decimal.hpp"
#include <nlohmann/json.hpp>

// Decimals travel as strings so stored sessions reload without rounding.
namespace nlohmann {

template <>
struct adl_serializer<Decimal> {
    static void to_json(json& j, const Decimal& value) {
        j = decimal::to_string(value, decimal::FULL_PLACES);
    }

    static void from_json(const json& j, Decimal& value) {
        if (j.is_string()) {
            value = decimal::parse(j.get<std::string>());
        } else if (j.is_number_integer()) {
            value = Decimal(j.get<int64_t>());
        } else {
            value = Decimal(j.get<double>());
        }
    }
};

} // namespace nlohmann
