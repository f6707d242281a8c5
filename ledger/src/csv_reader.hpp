#pragma once

#include <string>
#include <vector>
#include <optional>
#include <map>

struct CsvRow {
    size_t line;                       // 1-based, for error messages
    std::vector<std::string> fields;
};

struct CsvTable {
    std::vector<std::string> headers;  // trimmed
    std::vector<CsvRow> rows;

    std::optional<size_t> column(const std::string& header) const;
    bool has_columns(const std::vector<std::string>& required) const;
    // Empty string when the row is short or the column is absent.
    std::string value(const CsvRow& row, const std::string& header) const;
};

class CsvReader {
public:
    // RFC 4180 quoting, CRLF or LF line endings, optional UTF-8 BOM.
    // Blank lines are skipped. Throws MalformedInput on an unterminated quote.
    static CsvTable parse(const std::string& content);

    static std::string escape(const std::string& field);
    static std::string join(const std::vector<std::string>& fields);
};
