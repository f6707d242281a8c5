#include "transaction.hpp"
#include "decimal_json.hpp"
#include "errors.hpp"
#include "util.hpp"

const char* const UNKNOWN_ASSET = "UNKNOWN";

std::string kind_string(TxKind kind) {
    switch (kind) {
        case TxKind::Buy: return "buy";
        case TxKind::Sell: return "sell";
        case TxKind::Deposit: return "deposit";
        case TxKind::Withdrawal: return "withdrawal";
        case TxKind::FeeOnly: return "fee-only";
        default: return "unknown";
    }
}

std::optional<TxKind> parse_kind(const std::string& text) {
    std::string k = util::to_lower(util::trim(text));
    if (k == "buy") return TxKind::Buy;
    if (k == "sell") return TxKind::Sell;
    if (k == "deposit") return TxKind::Deposit;
    if (k == "withdrawal" || k == "withdraw") return TxKind::Withdrawal;
    if (k == "fee-only" || k == "fee") return TxKind::FeeOnly;
    return std::nullopt;
}

bool is_acquisition(TxKind kind) {
    return kind == TxKind::Buy || kind == TxKind::Deposit;
}

const ExchangeSource* Transaction::exchange() const {
    return std::get_if<ExchangeSource>(&source);
}

const ChainSource* Transaction::chain() const {
    return std::get_if<ChainSource>(&source);
}

std::string Transaction::location() const {
    if (auto ex = exchange()) return ex->exchange;
    const auto& ch = std::get<ChainSource>(source);
    return ch.chain + ":" + ch.address;
}

std::string Transaction::source_system() const {
    if (auto ex = exchange()) return ex->exchange + "_csv";
    return std::get<ChainSource>(source).chain + "_chain";
}

int Transaction::source_priority() const {
    return exchange() ? 0 : 1;
}

void Transaction::validate() const {
    auto fail = [this](const std::string& what) {
        throw MalformedInput(InputErrorCode::BadRow,
                             "Transaction " + id + ": " + what);
    };

    if (id.empty()) fail("missing id");
    if (asset.empty()) fail("missing asset");
    if (amount <= 0) fail("amount must be positive");
    if (fee < 0) fail("fee must not be negative");
    if (price.has_value() && *price < 0) fail("price must not be negative");

    if (kind == TxKind::Buy || kind == TxKind::Sell) {
        if (!exchange()) fail("trades require an exchange source");
        if (!price.has_value()) fail("trades require a price");
    }
}

void to_json(nlohmann::json& j, const Transaction& tx) {
    j = nlohmann::json{
        {"id", tx.id},
        {"timestamp", tx.timestamp},
        {"asset", tx.asset},
        {"kind", kind_string(tx.kind)},
        {"amount", tx.amount},
        {"price", nullptr},
        {"fee", tx.fee},
        {"fee_asset", tx.fee_asset},
        {"raw", tx.raw},
        {"internal_transfer", tx.internal_transfer}
    };
    if (tx.price.has_value()) j["price"] = *tx.price;

    if (auto ex = tx.exchange()) {
        j["source"] = {
            {"type", "exchange"},
            {"exchange", ex->exchange},
            {"pair", ex->pair},
            {"quote_asset", ex->quote_asset},
            {"quote_amount", ex->quote_amount}
        };
    } else {
        const auto& ch = std::get<ChainSource>(tx.source);
        j["source"] = {
            {"type", "chain"},
            {"chain", ch.chain},
            {"address", ch.address},
            {"tx_hash", ch.tx_hash},
            {"counterparty", nullptr}
        };
        if (ch.counterparty.has_value()) j["source"]["counterparty"] = *ch.counterparty;
    }
}

void from_json(const nlohmann::json& j, Transaction& tx) {
    tx.id = j.at("id").get<std::string>();
    tx.timestamp = j.at("timestamp").get<int64_t>();
    tx.asset = j.at("asset").get<std::string>();

    auto kind = parse_kind(j.at("kind").get<std::string>());
    if (!kind) throw std::runtime_error("Unknown transaction kind in stored session");
    tx.kind = *kind;

    tx.amount = j.at("amount").get<Decimal>();
    if (j.contains("price") && !j["price"].is_null()) {
        tx.price = j["price"].get<Decimal>();
    } else {
        tx.price.reset();
    }
    tx.fee = j.value("fee", nlohmann::json("0")).get<Decimal>();
    tx.fee_asset = j.value("fee_asset", std::string(UNKNOWN_ASSET));
    tx.raw = j.value("raw", nlohmann::json::object());
    tx.internal_transfer = j.value("internal_transfer", false);

    const auto& src = j.at("source");
    if (src.at("type") == "exchange") {
        ExchangeSource ex;
        ex.exchange = src.at("exchange").get<std::string>();
        ex.pair = src.value("pair", "");
        ex.quote_asset = src.value("quote_asset", "");
        ex.quote_amount = src.value("quote_amount", nlohmann::json("0")).get<Decimal>();
        tx.source = ex;
    } else {
        ChainSource ch;
        ch.chain = src.at("chain").get<std::string>();
        ch.address = src.at("address").get<std::string>();
        ch.tx_hash = src.value("tx_hash", "");
        if (src.contains("counterparty") && !src["counterparty"].is_null()) {
            ch.counterparty = src["counterparty"].get<std::string>();
        }
        tx.source = ch;
    }
}
