#include "csv_normalizer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

const std::vector<std::string> TRADE_HISTORY_HEADERS = {
    "Date(UTC)", "Pair", "Side", "Price", "Executed", "Amount", "Fee", "Fee Asset"
};

const std::vector<std::string> ACCOUNT_STATEMENT_HEADERS = {
    "User_ID", "UTC_Time", "Account", "Operation", "Coin", "Change", "Remark"
};

namespace {

const std::vector<std::string> QUOTE_ASSETS = {
    "EUR", "USD", "USDT", "USDC", "BUSD", "FDUSD", "TUSD", "GBP", "TRY", "BRL",
    "BNB", "BTC", "ETH"
};

const std::set<std::string> FIAT_LIKE = {
    "EUR", "USD", "USDT", "BUSD", "USDC", "FDUSD", "TUSD", "GBP", "TRY", "BRL"
};

const std::set<std::string> CASH_OPERATIONS = {"deposit", "withdraw", "airdrop assets"};

MalformedInput row_error(InputErrorCode code, size_t line, const std::string& what) {
    return MalformedInput(code, fmt::format("Line {}: {}", line, what));
}

bool is_fee_operation(const std::string& operation) {
    std::string op = util::to_lower(operation);
    return op.find("fee") != std::string::npos || op.find("commission") != std::string::npos;
}

struct StatementEntry {
    int64_t timestamp;
    size_t line;
    std::string operation;
    std::string coin;
    Decimal change;
};

struct StatementGroup {
    std::string key;
    std::vector<StatementEntry> entries;

    bool fee_only() const {
        return std::all_of(entries.begin(), entries.end(),
                           [](const StatementEntry& e) { return is_fee_operation(e.operation); });
    }

    bool has_positive() const {
        return std::any_of(entries.begin(), entries.end(), [](const StatementEntry& e) {
            return e.change > 0 && !is_fee_operation(e.operation);
        });
    }

    bool has_negative() const {
        return std::any_of(entries.begin(), entries.end(), [](const StatementEntry& e) {
            return e.change < 0 && !is_fee_operation(e.operation);
        });
    }

    bool single_side() const {
        bool pos = has_positive();
        bool neg = has_negative();
        return (pos || neg) && pos != neg;
    }

    std::set<std::string> signature() const {
        std::set<std::string> sig;
        for (const auto& e : entries) {
            if (!is_fee_operation(e.operation)) sig.insert(util::to_lower(e.operation));
        }
        return sig;
    }
};

struct StatementTrade {
    int64_t timestamp;
    size_t line;
    TxKind side;
    std::string base_asset;
    Decimal base_amount;
    std::string quote_asset;
    Decimal quote_amount;
    Decimal fee;
    std::string fee_asset = UNKNOWN_ASSET;
};

// Index of the group that completes a single-sided group, if any.
std::optional<size_t> find_partner(const std::vector<StatementGroup>& groups, size_t current) {
    auto sig = groups[current].signature();
    if (sig.empty()) return std::nullopt;
    bool current_positive = groups[current].has_positive();

    for (size_t i = current + 1; i < groups.size(); ++i) {
        if (groups[i].fee_only()) continue;
        if (groups[i].signature() == sig &&
            groups[i].has_positive() != current_positive &&
            groups[i].single_side()) {
            return i;
        }
        break;
    }
    return std::nullopt;
}

} // namespace

CsvNormalizer::CsvNormalizer(const std::string& exchange) : exchange_(exchange) {}

bool CsvNormalizer::is_quote_asset(const std::string& symbol) {
    return std::find(QUOTE_ASSETS.begin(), QUOTE_ASSETS.end(), symbol) != QUOTE_ASSETS.end();
}

bool CsvNormalizer::is_fiat_like(const std::string& symbol) {
    return FIAT_LIKE.count(symbol) > 0;
}

std::pair<std::string, std::string> CsvNormalizer::parse_pair(const std::string& raw) {
    std::string token = util::to_upper(util::trim(raw));

    auto slash = token.find('/');
    if (slash != std::string::npos) {
        std::string base = util::trim(token.substr(0, slash));
        std::string quote = util::trim(token.substr(slash + 1));
        if (base.empty() || quote.empty()) {
            throw MalformedInput(InputErrorCode::UnparsablePair, "Could not parse trading pair: " + raw);
        }
        return {base, quote};
    }

    // Longest suffix first so "USDT" beats "USD"
    std::string best;
    for (const auto& quote : QUOTE_ASSETS) {
        if (token.size() > quote.size() &&
            token.compare(token.size() - quote.size(), quote.size(), quote) == 0 &&
            quote.size() > best.size()) {
            best = quote;
        }
    }
    if (best.empty()) {
        throw MalformedInput(InputErrorCode::UnparsablePair, "Could not parse trading pair: " + raw);
    }
    return {token.substr(0, token.size() - best.size()), best};
}

TxKind CsvNormalizer::parse_side(const std::string& raw) {
    std::string side = util::to_upper(util::trim(raw));
    if (side == "BUY") return TxKind::Buy;
    if (side == "SELL") return TxKind::Sell;
    throw MalformedInput(InputErrorCode::InvalidSide, "Invalid side: '" + raw + "'");
}

Decimal CsvNormalizer::parse_quantity(const std::string& raw, const std::string& column) {
    std::string text = util::trim(raw);

    size_t end = text.size();
    while (end > 0 && std::isalpha(static_cast<unsigned char>(text[end - 1]))) end--;
    std::string number = util::trim(text.substr(0, end));

    Decimal value;
    if (!decimal::try_parse(number, value)) {
        throw std::invalid_argument("invalid " + column + " '" + raw + "'");
    }
    return value;
}

std::vector<Transaction> CsvNormalizer::normalize(const std::string& content) const {
    if (util::trim(content).empty()) {
        throw MalformedInput(InputErrorCode::Empty, "CSV file is empty");
    }

    auto table = CsvReader::parse(content);

    if (table.has_columns(TRADE_HISTORY_HEADERS)) {
        return normalize_trade_history(table);
    }
    if (table.has_columns(ACCOUNT_STATEMENT_HEADERS)) {
        return normalize_account_statement(table);
    }

    if (table.column("Pair") || table.column("Side")) {
        std::string missing;
        for (const auto& h : TRADE_HISTORY_HEADERS) {
            if (table.column(h)) continue;
            if (!missing.empty()) missing += ", ";
            missing += h;
        }
        throw MalformedInput(InputErrorCode::BadHeaders, "CSV is missing columns: " + missing);
    }
    throw MalformedInput(InputErrorCode::UnsupportedFormat,
                         "CSV headers do not match a supported exchange export");
}

std::vector<Transaction> CsvNormalizer::normalize_trade_history(const CsvTable& table) const {
    std::vector<Transaction> transactions;
    transactions.reserve(table.rows.size());

    for (size_t idx = 0; idx < table.rows.size(); ++idx) {
        const auto& row = table.rows[idx];

        Transaction tx;
        ExchangeSource source;
        source.exchange = exchange_;

        try {
            auto ts = util::parse_utc_timestamp(table.value(row, "Date(UTC)"));
            if (!ts) {
                throw row_error(InputErrorCode::BadRow, row.line,
                                "invalid date '" + table.value(row, "Date(UTC)") + "'");
            }

            auto [base, quote] = parse_pair(table.value(row, "Pair"));
            TxKind side = parse_side(table.value(row, "Side"));

            Decimal price = parse_quantity(table.value(row, "Price"), "Price");
            Decimal executed = parse_quantity(table.value(row, "Executed"), "Executed");

            std::string amount_field = table.value(row, "Amount");
            Decimal quote_amount = amount_field.empty()
                ? price * executed
                : parse_quantity(amount_field, "Amount");

            std::string fee_field = table.value(row, "Fee");
            Decimal fee = fee_field.empty() ? Decimal(0) : parse_quantity(fee_field, "Fee");
            std::string fee_asset = util::to_upper(table.value(row, "Fee Asset"));
            if (fee_asset.empty()) fee_asset = UNKNOWN_ASSET;

            if (executed <= 0) {
                throw row_error(InputErrorCode::BadRow, row.line, "executed quantity must be positive");
            }

            tx.id = fmt::format("{}-{:06d}", exchange_, idx);
            tx.timestamp = *ts;
            tx.asset = base;
            tx.kind = side;
            tx.amount = executed;
            tx.price = price;
            tx.fee = fee;
            tx.fee_asset = fee_asset;

            source.pair = base + "/" + quote;
            source.quote_asset = quote;
            source.quote_amount = quote_amount;
            tx.source = source;

            tx.raw = nlohmann::json::object();
            for (size_t c = 0; c < table.headers.size() && c < row.fields.size(); ++c) {
                tx.raw[table.headers[c]] = util::trim(row.fields[c]);
            }

            tx.validate();

        } catch (const MalformedInput& e) {
            if (std::string(e.what()).rfind("Line ", 0) == 0) throw;
            throw row_error(e.code(), row.line, e.what());
        } catch (const std::invalid_argument& e) {
            throw row_error(InputErrorCode::BadRow, row.line, e.what());
        }

        transactions.push_back(std::move(tx));
    }

    spdlog::info("Normalized {} trades from {} trade history", transactions.size(), exchange_);
    return transactions;
}

std::vector<Transaction> CsvNormalizer::normalize_account_statement(const CsvTable& table) const {
    std::vector<Transaction> transactions;
    std::vector<StatementGroup> groups;
    size_t cash_index = 0;

    auto make_exchange_tx = [this](const std::string& id, int64_t ts, const std::string& asset,
                                   TxKind kind, const Decimal& amount) {
        Transaction tx;
        tx.id = id;
        tx.timestamp = ts;
        tx.asset = asset;
        tx.kind = kind;
        tx.amount = amount;
        tx.fee_asset = asset;
        ExchangeSource source;
        source.exchange = exchange_;
        tx.source = source;
        return tx;
    };

    for (const auto& row : table.rows) {
        std::string time_raw = table.value(row, "UTC_Time");
        if (time_raw.empty()) continue;

        auto ts = util::parse_utc_timestamp(time_raw);
        if (!ts) {
            throw row_error(InputErrorCode::BadRow, row.line, "invalid timestamp '" + time_raw + "'");
        }

        std::string operation = table.value(row, "Operation");
        std::string coin = util::to_upper(table.value(row, "Coin"));
        std::string change_raw = table.value(row, "Change");
        if (coin.empty() || change_raw.empty()) continue;

        Decimal change;
        if (!decimal::try_parse(change_raw, change)) {
            throw row_error(InputErrorCode::BadRow, row.line,
                            "invalid amount for " + coin + ": '" + change_raw + "'");
        }
        if (change == 0) continue;

        if (CASH_OPERATIONS.count(util::to_lower(operation))) {
            auto tx = make_exchange_tx(fmt::format("{}-cash-{:06d}", exchange_, cash_index++), *ts, coin,
                                       change > 0 ? TxKind::Deposit : TxKind::Withdrawal, abs(change));
            tx.raw = {{"operation", operation}, {"line", row.line}};
            transactions.push_back(std::move(tx));
            continue;
        }

        std::string remark = table.value(row, "Remark");
        std::string key = remark.empty() ? "time::" + time_raw : "remark::" + remark;
        if (groups.empty() || groups.back().key != key) {
            groups.push_back(StatementGroup{key, {}});
        }
        groups.back().entries.push_back(StatementEntry{*ts, row.line, operation, coin, change});
    }

    // Pair complementary single-sided groups
    std::vector<std::vector<StatementEntry>> merged;
    for (size_t i = 0; i < groups.size(); ++i) {
        if (!groups[i].fee_only() && groups[i].single_side()) {
            auto partner = find_partner(groups, i);
            if (partner) {
                std::vector<StatementEntry> combined = groups[i].entries;
                for (size_t k = i + 1; k <= *partner; ++k) {
                    combined.insert(combined.end(), groups[k].entries.begin(), groups[k].entries.end());
                }
                std::stable_sort(combined.begin(), combined.end(),
                                 [](const StatementEntry& a, const StatementEntry& b) { return a.line < b.line; });
                merged.push_back(std::move(combined));
                i = *partner;
                continue;
            }
        }
        merged.push_back(groups[i].entries);
    }

    size_t trade_count = 0;
    for (size_t g = 0; g < merged.size(); ++g) {
        std::vector<StatementEntry> positive;
        std::vector<StatementEntry> negative;
        std::map<std::string, Decimal> fees;

        for (const auto& e : merged[g]) {
            if (is_fee_operation(e.operation)) {
                fees[e.coin] += abs(e.change);
            } else if (e.change > 0) {
                positive.push_back(e);
            } else {
                negative.push_back(e);
            }
        }

        std::vector<StatementTrade> trades;
        if (!positive.empty() && !negative.empty()) {
            if (positive.size() != negative.size()) {
                throw row_error(InputErrorCode::UnbalancedTrade, positive.front().line,
                                "unbalanced trade legs at " + util::format_datetime(positive.front().timestamp));
            }
            for (size_t k = 0; k < positive.size(); ++k) {
                const auto& pos = positive[k];
                const auto& neg = negative[k];

                StatementTrade t;
                t.timestamp = pos.timestamp;
                t.line = pos.line;
                if (is_fiat_like(pos.coin) && !is_fiat_like(neg.coin)) {
                    t.side = TxKind::Sell;
                    t.base_asset = neg.coin;
                    t.base_amount = abs(neg.change);
                    t.quote_asset = pos.coin;
                    t.quote_amount = pos.change;
                } else {
                    t.side = TxKind::Buy;
                    t.base_asset = pos.coin;
                    t.base_amount = pos.change;
                    t.quote_asset = neg.coin;
                    t.quote_amount = abs(neg.change);
                }
                trades.push_back(t);
            }
        } else {
            // One-sided balance changes (interest, distributions, conversions out) stay in the ledger
            for (const auto& e : positive) {
                auto tx = make_exchange_tx(fmt::format("{}-stmt-{:05d}-in-{}", exchange_, g, e.line),
                                           e.timestamp, e.coin, TxKind::Deposit, e.change);
                tx.raw = {{"operation", e.operation}, {"line", e.line}};
                transactions.push_back(std::move(tx));
            }
            for (const auto& e : negative) {
                auto tx = make_exchange_tx(fmt::format("{}-stmt-{:05d}-out-{}", exchange_, g, e.line),
                                           e.timestamp, e.coin, TxKind::Withdrawal, abs(e.change));
                tx.raw = {{"operation", e.operation}, {"line", e.line}};
                transactions.push_back(std::move(tx));
            }
        }

        // Spread each fee coin over the legs denominated in it
        for (const auto& [coin, total_fee] : fees) {
            Decimal weight_sum = 0;
            for (const auto& t : trades) {
                if (t.base_asset == coin) weight_sum += t.base_amount;
                else if (t.quote_asset == coin) weight_sum += t.quote_amount;
            }

            if (weight_sum == 0) {
                int64_t ts = merged[g].front().timestamp;
                auto tx = make_exchange_tx(fmt::format("{}-stmt-{:05d}-fee-{}", exchange_, g, coin),
                                           ts, coin, TxKind::FeeOnly, total_fee);
                tx.raw = {{"operation", "fee"}, {"line", merged[g].front().line}};
                transactions.push_back(std::move(tx));
                continue;
            }

            for (auto& t : trades) {
                Decimal weight = t.base_asset == coin ? t.base_amount
                               : t.quote_asset == coin ? t.quote_amount : Decimal(0);
                if (weight == 0) continue;
                if (t.fee_asset != UNKNOWN_ASSET && t.fee_asset != coin) {
                    throw row_error(InputErrorCode::BadRow, t.line,
                                    "multiple fee assets for one trade at " + util::format_datetime(t.timestamp));
                }
                t.fee_asset = coin;
                t.fee += total_fee * weight / weight_sum;
            }
        }

        for (size_t k = 0; k < trades.size(); ++k) {
            const auto& t = trades[k];
            Transaction tx;
            tx.id = fmt::format("{}-stmt-{:05d}-{}", exchange_, g, k);
            tx.timestamp = t.timestamp;
            tx.asset = t.base_asset;
            tx.kind = t.side;
            tx.amount = t.base_amount;
            tx.price = t.quote_amount / t.base_amount;
            tx.fee = t.fee;
            tx.fee_asset = t.fee_asset;

            ExchangeSource source;
            source.exchange = exchange_;
            source.pair = t.base_asset + "/" + t.quote_asset;
            source.quote_asset = t.quote_asset;
            source.quote_amount = t.quote_amount;
            tx.source = source;
            tx.raw = {{"line", t.line}, {"pair", source.pair}};

            tx.validate();
            transactions.push_back(std::move(tx));
            trade_count++;
        }
    }

    if (transactions.empty()) {
        throw MalformedInput(InputErrorCode::Empty, "No operations found in the account statement");
    }

    spdlog::info("Normalized {} transactions ({} trades) from {} account statement",
                 transactions.size(), trade_count, exchange_);
    return transactions;
}
