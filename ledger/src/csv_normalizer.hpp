#pragma once

#include "csv_reader.hpp"
#include "transaction.hpp"
#include <string>
#include <utility>
#include <vector>

extern const std::vector<std::string> TRADE_HISTORY_HEADERS;
extern const std::vector<std::string> ACCOUNT_STATEMENT_HEADERS;

// Turns an exchange CSV export into canonical transactions.
// Any bad header or row rejects the whole file with MalformedInput.
class CsvNormalizer {
public:
    explicit CsvNormalizer(const std::string& exchange = "binance");

    std::vector<Transaction> normalize(const std::string& content) const;

    std::vector<Transaction> normalize_trade_history(const CsvTable& table) const;
    std::vector<Transaction> normalize_account_statement(const CsvTable& table) const;

    // "BTC/EUR" or "BTCEUR" -> {"BTC", "EUR"}; longest known quote suffix wins.
    static std::pair<std::string, std::string> parse_pair(const std::string& raw);
    static TxKind parse_side(const std::string& raw);
    // Numeric prefix of fields like "0.4BTC" or "10000EUR".
    static Decimal parse_quantity(const std::string& raw, const std::string& column);

    static bool is_quote_asset(const std::string& symbol);
    static bool is_fiat_like(const std::string& symbol);

private:
    std::string exchange_;
};
