#include "reporting.hpp"
#include "decimal_json.hpp"
#include "util.hpp"
#include <algorithm>
#include <ctime>
#include <spdlog/spdlog.h>

namespace {
    const int64_t SECONDS_PER_DAY = 86400;

    int64_t floor_div(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
        return q;
    }

    Decimal quote_quantity(const Transaction& tx) {
        auto ex = tx.exchange();
        if (ex && ex->quote_amount > 0) return ex->quote_amount;
        return tx.amount * tx.price.value_or(Decimal(0));
    }

    LedgerEntry make_entry(const Transaction& tx, const Decimal& signed_amount) {
        LedgerEntry entry;
        entry.id = tx.id;
        entry.timestamp = tx.timestamp;
        entry.location = tx.location();
        entry.kind = tx.kind;
        entry.amount = signed_amount;
        entry.fee = tx.fee;
        entry.fee_asset = tx.fee_asset;
        entry.source_system = tx.source_system();
        entry.internal_transfer = tx.internal_transfer;
        entry.raw = tx.raw;
        return entry;
    }
}

std::string granularity_string(Granularity granularity) {
    switch (granularity) {
        case Granularity::Day: return "day";
        case Granularity::Week: return "week";
        case Granularity::Month: return "month";
        case Granularity::Year: return "year";
        default: return "unknown";
    }
}

std::optional<Granularity> parse_granularity(const std::string& text) {
    std::string g = util::to_lower(util::trim(text));
    if (g == "day" || g == "daily") return Granularity::Day;
    if (g == "week" || g == "weekly") return Granularity::Week;
    if (g == "month" || g == "monthly") return Granularity::Month;
    if (g == "year" || g == "yearly") return Granularity::Year;
    return std::nullopt;
}

Reporter::Reporter(PriceLookup& prices, size_t max_history_points)
    : prices_(prices)
    , max_history_points_(max_history_points > 1 ? max_history_points : 2)
{}

Report Reporter::build(const AccountingResult& accounting, int64_t as_of) {
    Report report;
    report.valued_at = as_of;
    report.holdings = value_holdings(accounting, as_of);
    report.summary = summarize(accounting, report.holdings);
    report.history = build_history(accounting.timeline);

    const auto& missing = prices_.missing();
    report.missing_prices.assign(missing.begin(), missing.end());

    if (!report.missing_prices.empty()) {
        spdlog::warn("{} assets without {} price", report.missing_prices.size(), prices_.reporting_currency());
    }
    return report;
}

std::vector<Holding> Reporter::value_holdings(const AccountingResult& accounting, int64_t as_of) {
    std::vector<Holding> holdings;

    for (const auto& asset : accounting.held_assets()) {
        Holding h;
        h.asset = asset;
        h.quantity = accounting.open_quantity(asset);
        h.cost_basis = accounting.open_cost(asset);
        h.average_cost = h.quantity > 0 ? h.cost_basis / h.quantity : Decimal(0);

        h.price = prices_.price(asset, as_of);
        h.priced = h.price.has_value();
        h.value = h.priced ? h.quantity * *h.price : Decimal(0);
        h.unrealized = h.priced ? h.value - h.cost_basis : Decimal(0);
        holdings.push_back(std::move(h));
    }

    return holdings;
}

Summary Reporter::summarize(const AccountingResult& accounting, const std::vector<Holding>& holdings) {
    Summary s;
    s.total_invested = accounting.totals.invested;
    s.total_withdrawn = accounting.totals.withdrawn;
    s.total_fees = accounting.totals.fees;
    s.cash_deposited = accounting.totals.cash_deposited;
    s.cash_withdrawn = accounting.totals.cash_withdrawn;

    for (const auto& gain : accounting.gains) {
        s.realized_gains += gain.gain;
    }
    for (const auto& h : holdings) {
        s.current_balance += h.value;
        s.unrealized_gains += h.unrealized;
    }
    return s;
}

std::vector<PositionPoint> Reporter::sample_timeline(const std::vector<PositionPoint>& timeline,
                                                     size_t max_points) {
    std::vector<PositionPoint> points;
    for (const auto& point : timeline) {
        if (!points.empty() && points.back().timestamp == point.timestamp) {
            points.back() = point;
        } else {
            points.push_back(point);
        }
    }

    if (points.size() > max_points) {
        std::vector<PositionPoint> daily;
        for (const auto& point : points) {
            if (!daily.empty() && util::start_of_day(daily.back().timestamp) == util::start_of_day(point.timestamp)) {
                daily.back() = point;
            } else {
                daily.push_back(point);
            }
        }
        points = std::move(daily);
    }

    if (points.size() > max_points && max_points > 1) {
        std::vector<PositionPoint> thinned;
        size_t n = points.size();
        for (size_t i = 0; i < max_points; i++) {
            size_t idx = (i * (n - 1) + (max_points - 1) / 2) / (max_points - 1);
            if (thinned.empty() || thinned.back().tx_id != points[idx].tx_id) {
                thinned.push_back(points[idx]);
            }
        }
        if (thinned.back().tx_id != points.back().tx_id) {
            thinned.push_back(points.back());
        }
        points = std::move(thinned);
    }

    return points;
}

std::vector<PortfolioSnapshot> Reporter::build_history(const std::vector<PositionPoint>& timeline) {
    std::vector<PortfolioSnapshot> history;

    for (const auto& point : sample_timeline(timeline, max_history_points_)) {
        PortfolioSnapshot snapshot;
        snapshot.timestamp = point.timestamp;
        snapshot.quantities = point.quantities;
        snapshot.invested = point.invested;
        snapshot.withdrawn = point.withdrawn;

        for (const auto& [asset, qty] : point.quantities) {
            Decimal value = prices_.value_of(asset, qty, point.timestamp);
            snapshot.values[asset] = value;
            snapshot.total_value += value;
        }
        history.push_back(std::move(snapshot));
    }

    return history;
}

int64_t Reporter::period_start(int64_t ts, Granularity granularity) {
    int64_t days = floor_div(ts, SECONDS_PER_DAY);

    switch (granularity) {
        case Granularity::Day:
            return days * SECONDS_PER_DAY;
        case Granularity::Week: {
            // 1970-01-01 was a Thursday
            int64_t weekday = ((days + 3) % 7 + 7) % 7;
            return (days - weekday) * SECONDS_PER_DAY;
        }
        case Granularity::Month:
        case Granularity::Year: {
            std::time_t t = static_cast<std::time_t>(ts);
            std::tm tm{};
            gmtime_r(&t, &tm);
            tm.tm_mday = 1;
            if (granularity == Granularity::Year) tm.tm_mon = 0;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
            return static_cast<int64_t>(timegm(&tm));
        }
    }
    return days * SECONDS_PER_DAY;
}

std::string Reporter::period_label(int64_t start, Granularity granularity) {
    std::string date = util::format_date(start);
    switch (granularity) {
        case Granularity::Month: return date.substr(0, 7);
        case Granularity::Year: return date.substr(0, 4);
        default: return date;
    }
}

std::vector<GainBucket> Reporter::gains_by_period(const std::vector<RealizedGain>& gains,
                                                  Granularity granularity) {
    std::map<int64_t, GainBucket> buckets;

    for (const auto& gain : gains) {
        int64_t start = period_start(gain.closed_at, granularity);
        auto& bucket = buckets[start];
        bucket.start = start;
        bucket.gain += gain.gain;
        bucket.proceeds += gain.proceeds;
        bucket.cost_basis += gain.cost_basis;
        bucket.fees += gain.fees;
        bucket.entries.push_back(gain);
    }

    std::vector<GainBucket> out;
    for (auto& [start, bucket] : buckets) {
        bucket.period = period_label(start, granularity);
        out.push_back(std::move(bucket));
    }
    return out;
}

std::vector<AssetBreakdown> Reporter::build_breakdown(const Ledger& ledger) {
    std::map<std::string, AssetBreakdown> by_asset;
    // Fee quantities the FIFO engine takes out of the lots. Trade fees are not among them.
    std::map<std::string, Decimal> consumed;

    auto add = [&by_asset](const std::string& asset, LedgerEntry entry, bool is_fee) {
        auto& b = by_asset[asset];
        b.asset = asset;
        if (is_fee) {
            b.fees_paid += abs(entry.amount);
        } else if (entry.amount > 0) {
            b.total_in += entry.amount;
        } else {
            b.total_out += -entry.amount;
        }
        b.entries.push_back(std::move(entry));
    };

    for (const auto& tx : ledger) {
        switch (tx.kind) {
            case TxKind::Buy:
            case TxKind::Deposit:
                add(tx.asset, make_entry(tx, tx.amount), false);
                break;
            case TxKind::Sell:
            case TxKind::Withdrawal:
                add(tx.asset, make_entry(tx, -tx.amount), false);
                break;
            case TxKind::FeeOnly:
                add(tx.asset, make_entry(tx, -tx.amount), true);
                consumed[tx.asset] += tx.amount;
                break;
        }

        if (auto ex = tx.exchange()) {
            if (tx.kind == TxKind::Buy) {
                add(ex->quote_asset, make_entry(tx, -quote_quantity(tx)), false);
            } else if (tx.kind == TxKind::Sell) {
                add(ex->quote_asset, make_entry(tx, quote_quantity(tx)), false);
            }
        }

        if (tx.fee > 0 && tx.fee_asset != UNKNOWN_ASSET) {
            auto& b = by_asset[tx.fee_asset];
            b.asset = tx.fee_asset;
            b.fees_paid += tx.fee;
            if (tx.internal_transfer && tx.fee_asset == tx.asset) {
                consumed[tx.asset] += tx.fee;
            }
        }
    }

    std::vector<AssetBreakdown> out;
    for (auto& [asset, b] : by_asset) {
        b.net = b.total_in - b.total_out - consumed[asset];
        out.push_back(std::move(b));
    }
    return out;
}

std::vector<OperationView> Reporter::build_operations(const Ledger& ledger,
                                                      const AccountingResult& accounting) {
    std::vector<OperationView> ops;
    ops.reserve(ledger.size());

    for (const auto& tx : ledger) {
        OperationView op;
        op.id = tx.id;
        op.timestamp = tx.timestamp;
        op.asset = tx.asset;
        op.kind = tx.kind;
        op.amount = tx.amount;
        op.location = tx.location();
        op.internal_transfer = tx.internal_transfer;

        auto it = accounting.valuations.find(tx.id);
        if (it != accounting.valuations.end()) {
            op.price = it->second.unit_price;
            op.fee = it->second.fee_value;
            op.total = it->second.total;
        }
        ops.push_back(std::move(op));
    }
    return ops;
}

void to_json(nlohmann::json& j, const Holding& holding) {
    j = nlohmann::json{
        {"asset", holding.asset},
        {"quantity", holding.quantity},
        {"average_cost", holding.average_cost},
        {"cost_basis", holding.cost_basis},
        {"price", nullptr},
        {"value", holding.value},
        {"unrealized", holding.unrealized},
        {"priced", holding.priced}
    };
    if (holding.price) j["price"] = *holding.price;
}

void from_json(const nlohmann::json& j, Holding& holding) {
    holding.asset = j.at("asset").get<std::string>();
    holding.quantity = j.at("quantity").get<Decimal>();
    holding.average_cost = j.at("average_cost").get<Decimal>();
    holding.cost_basis = j.at("cost_basis").get<Decimal>();
    if (j.contains("price") && !j["price"].is_null()) {
        holding.price = j["price"].get<Decimal>();
    } else {
        holding.price.reset();
    }
    holding.value = j.at("value").get<Decimal>();
    holding.unrealized = j.at("unrealized").get<Decimal>();
    holding.priced = j.value("priced", false);
}

void to_json(nlohmann::json& j, const Summary& summary) {
    j = nlohmann::json{
        {"total_invested", summary.total_invested},
        {"total_withdrawn", summary.total_withdrawn},
        {"current_balance", summary.current_balance},
        {"total_fees", summary.total_fees},
        {"realized_gains", summary.realized_gains},
        {"unrealized_gains", summary.unrealized_gains},
        {"cash_deposited", summary.cash_deposited},
        {"cash_withdrawn", summary.cash_withdrawn}
    };
}

void from_json(const nlohmann::json& j, Summary& summary) {
    summary.total_invested = j.at("total_invested").get<Decimal>();
    summary.total_withdrawn = j.at("total_withdrawn").get<Decimal>();
    summary.current_balance = j.at("current_balance").get<Decimal>();
    summary.total_fees = j.at("total_fees").get<Decimal>();
    summary.realized_gains = j.at("realized_gains").get<Decimal>();
    summary.unrealized_gains = j.at("unrealized_gains").get<Decimal>();
    summary.cash_deposited = j.value("cash_deposited", nlohmann::json("0")).get<Decimal>();
    summary.cash_withdrawn = j.value("cash_withdrawn", nlohmann::json("0")).get<Decimal>();
}

void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot) {
    j = nlohmann::json{
        {"timestamp", snapshot.timestamp},
        {"total_value", snapshot.total_value},
        {"values", snapshot.values},
        {"quantities", snapshot.quantities},
        {"invested", snapshot.invested},
        {"withdrawn", snapshot.withdrawn}
    };
}

void from_json(const nlohmann::json& j, PortfolioSnapshot& snapshot) {
    snapshot.timestamp = j.at("timestamp").get<int64_t>();
    snapshot.total_value = j.at("total_value").get<Decimal>();
    snapshot.values = j.at("values").get<std::map<std::string, Decimal>>();
    snapshot.quantities = j.at("quantities").get<std::map<std::string, Decimal>>();
    snapshot.invested = j.at("invested").get<Decimal>();
    snapshot.withdrawn = j.at("withdrawn").get<Decimal>();
}

void to_json(nlohmann::json& j, const Report& report) {
    j = nlohmann::json{
        {"summary", report.summary},
        {"holdings", report.holdings},
        {"history", report.history},
        {"missing_prices", report.missing_prices},
        {"valued_at", report.valued_at}
    };
}

void from_json(const nlohmann::json& j, Report& report) {
    report.summary = j.at("summary").get<Summary>();
    report.holdings = j.at("holdings").get<std::vector<Holding>>();
    report.history = j.at("history").get<std::vector<PortfolioSnapshot>>();
    report.missing_prices = j.at("missing_prices").get<std::vector<std::string>>();
    report.valued_at = j.value("valued_at", int64_t(0));
}
