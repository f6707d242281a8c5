#include "decimal.hpp"
#include <cctype>
#include <stdexcept>

namespace decimal {

namespace {

bool is_decimal_literal(const std::string& text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) i++;

    size_t digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) { i++; digits++; }
    if (i < text.size() && text[i] == '.') {
        i++;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) { i++; digits++; }
    }
    if (digits == 0) return false;

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        i++;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) i++;
        size_t exp_digits = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) { i++; exp_digits++; }
        if (exp_digits == 0) return false;
    }
    return i == text.size();
}

} // namespace

bool try_parse(const std::string& text, Decimal& out) {
    if (!is_decimal_literal(text)) return false;
    out = Decimal(text.c_str());
    return true;
}

Decimal parse(const std::string& text) {
    Decimal value;
    if (!try_parse(text, value)) {
        throw std::invalid_argument("Not a decimal number: '" + text + "'");
    }
    return value;
}

std::string to_string(const Decimal& value, int max_places) {
    std::string s = value.str(max_places, std::ios_base::fixed);

    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0" || s.empty()) return "0";
    return s;
}

double to_double(const Decimal& value) {
    return value.convert_to<double>();
}

Decimal from_base_units(const std::string& units, int decimals) {
    Decimal value = parse(units.empty() ? "0" : units);
    if (decimals <= 0) return value;
    return value / boost::multiprecision::pow(Decimal(10), decimals);
}

Decimal min(const Decimal& a, const Decimal& b) {
    return a < b ? a : b;
}

} // namespace decimal
