#include "fifo_engine.hpp"
#include "decimal_json.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Decimal AccountingResult::open_quantity(const std::string& asset) const {
    Decimal total = 0;
    auto it = open_lots.find(asset);
    if (it == open_lots.end()) return total;
    for (const auto& lot : it->second) total += lot.quantity;
    return total;
}

Decimal AccountingResult::open_cost(const std::string& asset) const {
    Decimal total = 0;
    auto it = open_lots.find(asset);
    if (it == open_lots.end()) return total;
    for (const auto& lot : it->second) total += lot.cost_basis();
    return total;
}

std::vector<std::string> AccountingResult::held_assets() const {
    std::vector<std::string> assets;
    for (const auto& [asset, lots] : open_lots) {
        if (!lots.empty()) assets.push_back(asset);
    }
    return assets;
}

FifoEngine::FifoEngine(PriceLookup& prices)
    : prices_(prices)
{}

AccountingResult FifoEngine::run(const Ledger& ledger) {
    AccountingResult result;
    positions_.clear();

    for (const auto& tx : ledger) {
        apply(tx, result);

        PositionPoint point;
        point.timestamp = tx.timestamp;
        point.tx_id = tx.id;
        for (const auto& [asset, qty] : positions_) {
            if (qty > 0) point.quantities[asset] = qty;
        }
        point.invested = result.totals.invested;
        point.withdrawn = result.totals.withdrawn;
        result.timeline.push_back(std::move(point));
    }

    for (const auto& gain : result.gains) {
        result.totals.realized += gain.gain;
    }

    spdlog::info("FIFO run: {} transactions, {} realized entries, {} open assets",
                 ledger.size(), result.gains.size(), result.held_assets().size());
    return result;
}

void FifoEngine::apply(const Transaction& tx, AccountingResult& result) {
    if (tx.internal_transfer) {
        result.processed["internal"]++;
        result.valuations[tx.id] = TxValuation{std::nullopt, Decimal(0), Decimal(0)};
        // A fee taken from the moved asset still leaves the portfolio.
        if (tx.fee > 0 && tx.fee_asset == tx.asset) {
            apply_fee_only(tx, tx.fee, result);
        }
        return;
    }

    result.processed[kind_string(tx.kind)]++;

    switch (tx.kind) {
        case TxKind::Buy: apply_buy(tx, result); break;
        case TxKind::Sell: apply_sell(tx, result); break;
        case TxKind::Deposit: apply_deposit(tx, result); break;
        case TxKind::Withdrawal: apply_withdrawal(tx, result); break;
        case TxKind::FeeOnly: apply_fee_only(tx, tx.amount, result); break;
    }
}

Decimal FifoEngine::quote_quantity(const Transaction& tx) const {
    auto ex = tx.exchange();
    if (ex && ex->quote_amount > 0) return ex->quote_amount;
    return tx.amount * tx.price.value_or(Decimal(0));
}

Decimal FifoEngine::quote_rate(const Transaction& tx) {
    auto ex = tx.exchange();
    if (!ex || prices_.is_reporting(ex->quote_asset)) return Decimal(1);
    return prices_.price(ex->quote_asset, tx.timestamp).value_or(Decimal(0));
}

Decimal FifoEngine::fee_value(const Transaction& tx, const std::optional<Decimal>& unit_price) {
    if (tx.fee == 0) return Decimal(0);
    if (prices_.is_reporting(tx.fee_asset)) return tx.fee;
    if (tx.fee_asset == UNKNOWN_ASSET) {
        prices_.flag_missing(UNKNOWN_ASSET);
        return Decimal(0);
    }
    if (tx.fee_asset == tx.asset && unit_price) {
        return tx.fee * *unit_price;
    }
    return prices_.value_of(tx.fee_asset, tx.fee, tx.timestamp);
}

void FifoEngine::apply_buy(const Transaction& tx, AccountingResult& result) {
    const auto* ex = tx.exchange();
    Decimal rate = quote_rate(tx);
    Decimal unit_price = tx.price.value_or(Decimal(0)) * rate;
    Decimal gross = tx.amount * unit_price;
    Decimal fee = fee_value(tx, unit_price);

    open_lot(result, tx.id, tx.asset, tx.amount, gross + fee, tx.timestamp, tx.id);

    bool quote_is_cash = !ex || prices_.is_reporting(ex->quote_asset);
    if (quote_is_cash) {
        result.totals.invested += gross + fee;
    } else {
        consume(result, tx, ex->quote_asset, quote_quantity(tx), gross, Decimal(0), "quote leg");
    }

    result.totals.fees += fee;
    result.valuations[tx.id] = TxValuation{unit_price, fee, gross};
}

void FifoEngine::apply_sell(const Transaction& tx, AccountingResult& result) {
    const auto* ex = tx.exchange();
    Decimal rate = quote_rate(tx);
    Decimal unit_price = tx.price.value_or(Decimal(0)) * rate;
    Decimal gross = tx.amount * unit_price;
    Decimal fee = fee_value(tx, unit_price);

    consume(result, tx, tx.asset, tx.amount, gross - fee, fee, "");

    bool quote_is_cash = !ex || prices_.is_reporting(ex->quote_asset);
    if (quote_is_cash) {
        result.totals.withdrawn += gross - fee;
    } else {
        Decimal qty = quote_quantity(tx);
        open_lot(result, tx.id + "#quote", ex->quote_asset, qty, qty * rate, tx.timestamp, tx.id);
    }

    result.totals.fees += fee;
    result.valuations[tx.id] = TxValuation{unit_price, fee, gross};
}

void FifoEngine::apply_deposit(const Transaction& tx, AccountingResult& result) {
    if (prices_.is_reporting(tx.asset)) {
        result.totals.cash_deposited += tx.amount;
        Decimal fee = fee_value(tx, Decimal(1));
        result.totals.fees += fee;
        result.valuations[tx.id] = TxValuation{Decimal(1), fee, tx.amount};
        return;
    }

    auto unit_price = prices_.price(tx.asset, tx.timestamp);
    Decimal value = tx.amount * unit_price.value_or(Decimal(0));
    Decimal fee = fee_value(tx, unit_price);

    open_lot(result, tx.id, tx.asset, tx.amount, value + fee, tx.timestamp, tx.id);

    result.totals.invested += value;
    result.totals.fees += fee;
    result.valuations[tx.id] = TxValuation{unit_price, fee, value};
}

void FifoEngine::apply_withdrawal(const Transaction& tx, AccountingResult& result) {
    if (prices_.is_reporting(tx.asset)) {
        result.totals.cash_withdrawn += tx.amount;
        Decimal fee = fee_value(tx, Decimal(1));
        result.totals.fees += fee;
        result.valuations[tx.id] = TxValuation{Decimal(1), fee, tx.amount};
        return;
    }

    auto unit_price = prices_.price(tx.asset, tx.timestamp);
    Decimal value = tx.amount * unit_price.value_or(Decimal(0));
    Decimal fee = fee_value(tx, unit_price);

    consume(result, tx, tx.asset, tx.amount, value - fee, fee, "");

    result.totals.withdrawn += value;
    result.totals.fees += fee;
    result.valuations[tx.id] = TxValuation{unit_price, fee, value};
}

void FifoEngine::apply_fee_only(const Transaction& tx, const Decimal& quantity, AccountingResult& result) {
    if (prices_.is_reporting(tx.asset)) {
        result.totals.fees += quantity;
        if (!tx.internal_transfer) {
            result.valuations[tx.id] = TxValuation{Decimal(1), quantity, quantity};
        }
        return;
    }

    auto unit_price = prices_.price(tx.asset, tx.timestamp);
    Decimal value = quantity * unit_price.value_or(Decimal(0));

    consume(result, tx, tx.asset, quantity, Decimal(0), Decimal(0), "network fee");

    result.totals.fees += value;
    if (!tx.internal_transfer) {
        result.valuations[tx.id] = TxValuation{unit_price, value, value};
    }
}

void FifoEngine::open_lot(AccountingResult& result, const std::string& lot_id, const std::string& asset,
                          const Decimal& quantity, const Decimal& total_cost,
                          int64_t opened_at, const std::string& tx_id) {
    if (quantity <= 0 || prices_.is_reporting(asset)) return;

    Lot lot;
    lot.id = lot_id;
    lot.asset = asset;
    lot.quantity = quantity;
    lot.original_quantity = quantity;
    lot.unit_cost = total_cost / quantity;
    lot.opened_at = opened_at;
    lot.tx_id = tx_id;

    result.open_lots[asset].push_back(std::move(lot));
    positions_[asset] += quantity;
}

Decimal FifoEngine::consume(AccountingResult& result, const Transaction& tx, const std::string& asset,
                            const Decimal& quantity, const Decimal& proceeds, const Decimal& fees,
                            const std::string& note) {
    if (quantity <= 0 || prices_.is_reporting(asset)) return Decimal(0);

    struct Slice {
        std::string lot_id;
        Decimal quantity;
        Decimal cost;
        bool synthetic;
    };
    std::vector<Slice> slices;

    auto& lots = result.open_lots[asset];
    Decimal remaining = quantity;
    while (remaining > 0 && !lots.empty()) {
        Lot& lot = lots.front();
        Decimal take = decimal::min(remaining, lot.quantity);
        slices.push_back({lot.id, take, take * lot.unit_cost, false});
        lot.quantity -= take;
        remaining -= take;
        if (lot.quantity <= 0) lots.pop_front();
    }
    if (lots.empty()) result.open_lots.erase(asset);

    if (remaining > 0) {
        spdlog::warn("{} disposes {} {} more than held; closing against a zero-cost lot",
                     tx.id, decimal::to_string(remaining), asset);
        slices.push_back({tx.id + "#synthetic", remaining, Decimal(0), true});
    }

    positions_[asset] -= quantity - remaining;
    if (positions_[asset] <= 0) positions_.erase(asset);

    Decimal consumed_cost = 0;
    Decimal proceeds_left = proceeds;
    Decimal fees_left = fees;
    for (size_t i = 0; i < slices.size(); i++) {
        const auto& slice = slices[i];
        bool last = i + 1 == slices.size();

        RealizedGain gain;
        gain.asset = asset;
        gain.quantity = slice.quantity;
        gain.proceeds = last ? proceeds_left : proceeds * slice.quantity / quantity;
        gain.fees = last ? fees_left : fees * slice.quantity / quantity;
        gain.cost_basis = slice.cost;
        gain.gain = gain.proceeds - gain.cost_basis;
        gain.closed_at = tx.timestamp;
        gain.closing_tx_id = tx.id;
        gain.closing_kind = tx.kind;
        gain.lot_id = slice.lot_id;
        gain.synthetic = slice.synthetic;
        gain.note = slice.synthetic ? (note.empty() ? "shortfall" : note + ", shortfall") : note;

        proceeds_left -= gain.proceeds;
        fees_left -= gain.fees;
        consumed_cost += slice.cost;
        result.gains.push_back(std::move(gain));
    }

    return consumed_cost;
}

void to_json(nlohmann::json& j, const Lot& lot) {
    j = nlohmann::json{
        {"id", lot.id},
        {"asset", lot.asset},
        {"quantity", lot.quantity},
        {"original_quantity", lot.original_quantity},
        {"unit_cost", lot.unit_cost},
        {"opened_at", lot.opened_at},
        {"tx_id", lot.tx_id},
        {"synthetic", lot.synthetic}
    };
}

void from_json(const nlohmann::json& j, Lot& lot) {
    lot.id = j.at("id").get<std::string>();
    lot.asset = j.at("asset").get<std::string>();
    lot.quantity = j.at("quantity").get<Decimal>();
    lot.original_quantity = j.at("original_quantity").get<Decimal>();
    lot.unit_cost = j.at("unit_cost").get<Decimal>();
    lot.opened_at = j.at("opened_at").get<int64_t>();
    lot.tx_id = j.at("tx_id").get<std::string>();
    lot.synthetic = j.value("synthetic", false);
}

void to_json(nlohmann::json& j, const RealizedGain& gain) {
    j = nlohmann::json{
        {"asset", gain.asset},
        {"quantity", gain.quantity},
        {"proceeds", gain.proceeds},
        {"cost_basis", gain.cost_basis},
        {"fees", gain.fees},
        {"gain", gain.gain},
        {"closed_at", gain.closed_at},
        {"closing_tx_id", gain.closing_tx_id},
        {"closing_kind", kind_string(gain.closing_kind)},
        {"lot_id", gain.lot_id},
        {"synthetic", gain.synthetic},
        {"note", gain.note}
    };
}

void from_json(const nlohmann::json& j, RealizedGain& gain) {
    gain.asset = j.at("asset").get<std::string>();
    gain.quantity = j.at("quantity").get<Decimal>();
    gain.proceeds = j.at("proceeds").get<Decimal>();
    gain.cost_basis = j.at("cost_basis").get<Decimal>();
    gain.fees = j.at("fees").get<Decimal>();
    gain.gain = j.at("gain").get<Decimal>();
    gain.closed_at = j.at("closed_at").get<int64_t>();
    gain.closing_tx_id = j.at("closing_tx_id").get<std::string>();
    gain.closing_kind = parse_kind(j.value("closing_kind", "sell")).value_or(TxKind::Sell);
    gain.lot_id = j.at("lot_id").get<std::string>();
    gain.synthetic = j.value("synthetic", false);
    gain.note = j.value("note", "");
}

void to_json(nlohmann::json& j, const TxValuation& valuation) {
    j = nlohmann::json{
        {"unit_price", nullptr},
        {"fee_value", valuation.fee_value},
        {"total", valuation.total}
    };
    if (valuation.unit_price) j["unit_price"] = *valuation.unit_price;
}

void from_json(const nlohmann::json& j, TxValuation& valuation) {
    if (j.contains("unit_price") && !j["unit_price"].is_null()) {
        valuation.unit_price = j["unit_price"].get<Decimal>();
    } else {
        valuation.unit_price.reset();
    }
    valuation.fee_value = j.at("fee_value").get<Decimal>();
    valuation.total = j.at("total").get<Decimal>();
}

void to_json(nlohmann::json& j, const AccountingTotals& totals) {
    j = nlohmann::json{
        {"invested", totals.invested},
        {"withdrawn", totals.withdrawn},
        {"fees", totals.fees},
        {"realized", totals.realized},
        {"cash_deposited", totals.cash_deposited},
        {"cash_withdrawn", totals.cash_withdrawn}
    };
}

void from_json(const nlohmann::json& j, AccountingTotals& totals) {
    totals.invested = j.at("invested").get<Decimal>();
    totals.withdrawn = j.at("withdrawn").get<Decimal>();
    totals.fees = j.at("fees").get<Decimal>();
    totals.realized = j.at("realized").get<Decimal>();
    totals.cash_deposited = j.value("cash_deposited", nlohmann::json("0")).get<Decimal>();
    totals.cash_withdrawn = j.value("cash_withdrawn", nlohmann::json("0")).get<Decimal>();
}

// The position timeline is only needed while the report is built and is not stored.
void to_json(nlohmann::json& j, const AccountingResult& result) {
    nlohmann::json lots = nlohmann::json::object();
    for (const auto& [asset, queue] : result.open_lots) {
        lots[asset] = nlohmann::json::array();
        for (const auto& lot : queue) lots[asset].push_back(lot);
    }
    j = nlohmann::json{
        {"open_lots", lots},
        {"gains", result.gains},
        {"valuations", result.valuations},
        {"totals", result.totals},
        {"processed", result.processed}
    };
}

void from_json(const nlohmann::json& j, AccountingResult& result) {
    result.open_lots.clear();
    for (const auto& [asset, queue] : j.at("open_lots").items()) {
        auto& lots = result.open_lots[asset];
        for (const auto& lot : queue) lots.push_back(lot.get<Lot>());
    }
    result.gains = j.at("gains").get<std::vector<RealizedGain>>();
    result.valuations = j.at("valuations").get<std::map<std::string, TxValuation>>();
    result.totals = j.at("totals").get<AccountingTotals>();
    result.processed = j.value("processed", std::map<std::string, size_t>{});
    result.timeline.clear();
}
