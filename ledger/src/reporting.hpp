#pragma once

#include "fifo_engine.hpp"
#include "price_resolver.hpp"
#include "transaction.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class Granularity {
    Day,
    Week,
    Month,
    Year
};

std::string granularity_string(Granularity granularity);
std::optional<Granularity> parse_granularity(const std::string& text);

struct Holding {
    std::string asset;
    Decimal quantity;
    Decimal average_cost;
    Decimal cost_basis;
    std::optional<Decimal> price;
    Decimal value;
    Decimal unrealized;
    bool priced = false;
};

struct Summary {
    Decimal total_invested;
    Decimal total_withdrawn;
    Decimal current_balance;
    Decimal total_fees;
    Decimal realized_gains;
    Decimal unrealized_gains;
    Decimal cash_deposited;
    Decimal cash_withdrawn;
};

struct GainBucket {
    std::string period;
    int64_t start = 0;
    Decimal gain;
    Decimal proceeds;
    Decimal cost_basis;
    Decimal fees;
    std::vector<RealizedGain> entries;
};

struct PortfolioSnapshot {
    int64_t timestamp = 0;
    Decimal total_value;
    std::map<std::string, Decimal> values;
    std::map<std::string, Decimal> quantities;
    Decimal invested;
    Decimal withdrawn;
};

struct LedgerEntry {
    std::string id;
    int64_t timestamp = 0;
    std::string location;
    TxKind kind = TxKind::Deposit;
    Decimal amount;              // signed change of the breakdown's asset
    Decimal fee;
    std::string fee_asset;
    std::string source_system;
    bool internal_transfer = false;
    nlohmann::json raw;
};

struct AssetBreakdown {
    std::string asset;
    Decimal total_in;
    Decimal total_out;
    Decimal net;
    Decimal fees_paid;
    std::vector<LedgerEntry> entries;
};

struct OperationView {
    std::string id;
    int64_t timestamp = 0;
    std::string asset;
    TxKind kind = TxKind::Buy;
    Decimal amount;
    std::optional<Decimal> price;
    Decimal fee;
    Decimal total;
    std::string location;
    bool internal_transfer = false;
};

// Priced state of a finished run. Breakdown and operations are rebuilt from the
// ledger on demand since they need no prices.
struct Report {
    Summary summary;
    std::vector<Holding> holdings;
    std::vector<PortfolioSnapshot> history;
    std::vector<std::string> missing_prices;
    int64_t valued_at = 0;
};

class Reporter {
public:
    explicit Reporter(PriceLookup& prices, size_t max_history_points = 365);

    Report build(const AccountingResult& accounting, int64_t as_of);

    std::vector<Holding> value_holdings(const AccountingResult& accounting, int64_t as_of);
    std::vector<PortfolioSnapshot> build_history(const std::vector<PositionPoint>& timeline);

    static Summary summarize(const AccountingResult& accounting, const std::vector<Holding>& holdings);
    static std::vector<GainBucket> gains_by_period(const std::vector<RealizedGain>& gains,
                                                   Granularity granularity);
    static std::vector<AssetBreakdown> build_breakdown(const Ledger& ledger);
    static std::vector<OperationView> build_operations(const Ledger& ledger,
                                                       const AccountingResult& accounting);

    // One point per distinct timestamp, then last point per day, then evenly
    // thinned down to max_points keeping the final point.
    static std::vector<PositionPoint> sample_timeline(const std::vector<PositionPoint>& timeline,
                                                      size_t max_points);

    static int64_t period_start(int64_t ts, Granularity granularity);
    static std::string period_label(int64_t start, Granularity granularity);

private:
    PriceLookup& prices_;
    size_t max_history_points_;
};

void to_json(nlohmann::json& j, const Holding& holding);
void from_json(const nlohmann::json& j, Holding& holding);
void to_json(nlohmann::json& j, const Summary& summary);
void from_json(const nlohmann::json& j, Summary& summary);
void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot);
void from_json(const nlohmann::json& j, PortfolioSnapshot& snapshot);
void to_json(nlohmann::json& j, const Report& report);
void from_json(const nlohmann::json& j, Report& report);
