#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);
    return ss.str();
}

std::string current_iso8601() {
    return format_iso8601(current_timestamp());
}

int64_t current_timestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> split_list(const std::string& str) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : str) {
        if (c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<int64_t> parse_utc_timestamp(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();
    std::replace(s.begin(), s.end(), 'T', ' ');

    // Drop fractional seconds
    auto dot = s.find('.');
    if (dot != std::string::npos && dot > 10) s = s.substr(0, dot);

    const char* formats[] = {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d"};
    for (const char* fmt : formats) {
        std::tm tm{};
        std::istringstream ss(s);
        ss >> std::get_time(&tm, fmt);
        if (ss.fail()) continue;

        // Whole input must be consumed
        ss >> std::ws;
        if (!ss.eof()) continue;

        // timegm normalizes out-of-range fields; a date like 02-30 must not become 03-01
        std::tm parsed = tm;
        std::time_t t = timegm(&tm);
        std::tm back{};
        gmtime_r(&t, &back);
        if (back.tm_year != parsed.tm_year || back.tm_mon != parsed.tm_mon || back.tm_mday != parsed.tm_mday ||
            back.tm_hour != parsed.tm_hour || back.tm_min != parsed.tm_min || back.tm_sec != parsed.tm_sec) {
            return std::nullopt;
        }
        return static_cast<int64_t>(t);
    }
    return std::nullopt;
}

std::string format_iso8601(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

std::string format_date(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F");
    return ss.str();
}

std::string format_datetime(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T");
    return ss.str();
}

int64_t start_of_day(int64_t ts) {
    int64_t day = ts / 86400;
    if (ts < 0 && ts % 86400 != 0) day -= 1;
    return day * 86400;
}

std::string abbreviate(const std::string& address) {
    if (address.size() <= 8) return address;
    return address.substr(0, 8) + "...";
}

std::string redact_dsn(const std::string& dsn) {
    std::string out = dsn;

    auto scheme = out.find("://");
    if (scheme != std::string::npos) {
        auto at = out.find('@', scheme + 3);
        auto colon = out.find(':', scheme + 3);
        if (at != std::string::npos && colon != std::string::npos && colon < at) {
            out.replace(colon + 1, at - colon - 1, "***");
        }
        return out;
    }

    auto pos = out.find("password=");
    if (pos != std::string::npos) {
        auto start = pos + 9;
        auto end = out.find(' ', start);
        if (end == std::string::npos) end = out.size();
        out.replace(start, end - start, "***");
    }
    return out;
}

} // namespace util
