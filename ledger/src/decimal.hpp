#pragma once

#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>

// Exact base-10 arithmetic for quantities, prices and cost basis.
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<50>,
    boost::multiprecision::et_off>;

namespace decimal {
    // Places kept when a value is written for storage or export.
    constexpr int FULL_PLACES = 30;

    // Throws std::invalid_argument on anything that is not a plain decimal literal.
    Decimal parse(const std::string& text);
    bool try_parse(const std::string& text, Decimal& out);

    // Fixed notation, trailing zeros trimmed.
    std::string to_string(const Decimal& value, int max_places = 12);
    double to_double(const Decimal& value);

    // Integer base units (wei, satoshi) scaled down by 10^decimals.
    Decimal from_base_units(const std::string& units, int decimals);

    Decimal min(const Decimal& a, const Decimal& b);
}
