#pragma once

#include "price_resolver.hpp"
#include "transaction.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Lot {
    std::string id;
    std::string asset;
    Decimal quantity;            // remaining, never increases
    Decimal original_quantity;
    Decimal unit_cost;           // reporting currency, fixed at creation
    int64_t opened_at = 0;
    std::string tx_id;
    bool synthetic = false;

    Decimal cost_basis() const { return quantity * unit_cost; }
};

// One (lot, closing transaction) pair.
struct RealizedGain {
    std::string asset;
    Decimal quantity;
    Decimal proceeds;            // net of the apportioned closing fees
    Decimal cost_basis;
    Decimal fees;
    Decimal gain;
    int64_t closed_at = 0;
    std::string closing_tx_id;
    TxKind closing_kind = TxKind::Sell;
    std::string lot_id;
    bool synthetic = false;
    std::string note;
};

struct PositionPoint {
    int64_t timestamp = 0;
    std::string tx_id;
    std::map<std::string, Decimal> quantities;
    Decimal invested;
    Decimal withdrawn;
};

// Reporting-currency view of a single transaction.
struct TxValuation {
    std::optional<Decimal> unit_price;
    Decimal fee_value;
    Decimal total;
};

struct AccountingTotals {
    Decimal invested;
    Decimal withdrawn;
    Decimal fees;
    Decimal realized;
    Decimal cash_deposited;
    Decimal cash_withdrawn;
};

struct AccountingResult {
    std::map<std::string, std::deque<Lot>> open_lots;
    std::vector<RealizedGain> gains;
    std::vector<PositionPoint> timeline;
    std::map<std::string, TxValuation> valuations;
    AccountingTotals totals;
    std::map<std::string, size_t> processed;

    Decimal open_quantity(const std::string& asset) const;
    Decimal open_cost(const std::string& asset) const;
    std::vector<std::string> held_assets() const;
};

class FifoEngine {
public:
    explicit FifoEngine(PriceLookup& prices);

    // The ledger must already be ordered.
    AccountingResult run(const Ledger& ledger);

private:
    PriceLookup& prices_;
    std::map<std::string, Decimal> positions_;

    void apply(const Transaction& tx, AccountingResult& result);
    void apply_buy(const Transaction& tx, AccountingResult& result);
    void apply_sell(const Transaction& tx, AccountingResult& result);
    void apply_deposit(const Transaction& tx, AccountingResult& result);
    void apply_withdrawal(const Transaction& tx, AccountingResult& result);
    void apply_fee_only(const Transaction& tx, const Decimal& quantity, AccountingResult& result);

    void open_lot(AccountingResult& result, const std::string& lot_id, const std::string& asset,
                  const Decimal& quantity, const Decimal& total_cost,
                  int64_t opened_at, const std::string& tx_id);

    // Consumes FIFO and records one RealizedGain per lot touched. Returns the cost basis consumed.
    Decimal consume(AccountingResult& result, const Transaction& tx, const std::string& asset,
                    const Decimal& quantity, const Decimal& proceeds, const Decimal& fees,
                    const std::string& note);

    Decimal quote_rate(const Transaction& tx);
    Decimal fee_value(const Transaction& tx, const std::optional<Decimal>& unit_price);
    Decimal quote_quantity(const Transaction& tx) const;
};

void to_json(nlohmann::json& j, const Lot& lot);
void from_json(const nlohmann::json& j, Lot& lot);
void to_json(nlohmann::json& j, const RealizedGain& gain);
void from_json(const nlohmann::json& j, RealizedGain& gain);
void to_json(nlohmann::json& j, const TxValuation& valuation);
void from_json(const nlohmann::json& j, TxValuation& valuation);
void to_json(nlohmann::json& j, const AccountingTotals& totals);
void from_json(const nlohmann::json& j, AccountingTotals& totals);
void to_json(nlohmann::json& j, const AccountingResult& result);
void from_json(const nlohmann::json& j, AccountingResult& result);
