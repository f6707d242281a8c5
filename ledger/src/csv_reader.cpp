#include "csv_reader.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

std::optional<size_t> CsvTable::column(const std::string& header) const {
    auto it = std::find(headers.begin(), headers.end(), header);
    if (it == headers.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(headers.begin(), it));
}

bool CsvTable::has_columns(const std::vector<std::string>& required) const {
    return std::all_of(required.begin(), required.end(),
                       [this](const std::string& h) { return column(h).has_value(); });
}

std::string CsvTable::value(const CsvRow& row, const std::string& header) const {
    auto idx = column(header);
    if (!idx || *idx >= row.fields.size()) return "";
    return util::trim(row.fields[*idx]);
}

CsvTable CsvReader::parse(const std::string& content) {
    CsvTable table;

    size_t pos = 0;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

    std::vector<std::vector<std::string>> records;
    std::vector<size_t> record_lines;

    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;
    size_t line = 1;
    size_t record_line = 1;

    auto end_record = [&]() {
        fields.push_back(field);
        field.clear();
        bool blank = fields.size() == 1 && util::trim(fields[0]).empty();
        if (!blank) {
            records.push_back(fields);
            record_lines.push_back(record_line);
        }
        fields.clear();
        field_started = false;
    };

    for (; pos < content.size(); ++pos) {
        char c = content[pos];

        if (in_quotes) {
            if (c == '"') {
                if (pos + 1 < content.size() && content[pos + 1] == '"') {
                    field += '"';
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') line++;
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field_started || util::trim(field).empty()) {
                    field.clear();
                    in_quotes = true;
                } else {
                    field += c;
                }
                field_started = true;
                break;
            case ',':
                fields.push_back(field);
                field.clear();
                field_started = false;
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                line++;
                record_line = line;
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw MalformedInput(InputErrorCode::BadRow,
                             "Unterminated quoted field starting on line " + std::to_string(record_line));
    }
    if (!field.empty() || !fields.empty()) {
        end_record();
    }

    if (records.empty()) return table;

    for (const auto& h : records.front()) {
        table.headers.push_back(util::trim(h));
    }
    for (size_t i = 1; i < records.size(); ++i) {
        table.rows.push_back(CsvRow{record_lines[i], records[i]});
    }
    return table;
}

std::string CsvReader::escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvReader::join(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += escape(fields[i]);
    }
    return line;
}
