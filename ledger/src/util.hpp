#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <random>

namespace util {
    std::string generate_uuid();
    std::string current_iso8601();
    int64_t current_timestamp();

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    // Splits on commas, whitespace and newlines; drops empty tokens.
    std::vector<std::string> split_list(const std::string& str);
    std::string to_upper(std::string str);
    std::string to_lower(std::string str);

    // Accepts "YYYY-MM-DD HH:MM:SS", ISO-8601 ("T" separator, optional "Z")
    // and "YYYY-MM-DD". Result is UTC epoch seconds.
    std::optional<int64_t> parse_utc_timestamp(const std::string& text);
    std::string format_iso8601(int64_t ts);
    std::string format_date(int64_t ts);
    std::string format_datetime(int64_t ts);
    int64_t start_of_day(int64_t ts);

    std::string abbreviate(const std::string& address);
    // Masks the password in URI or key=value connection strings.
    std::string redact_dsn(const std::string& dsn);
}
