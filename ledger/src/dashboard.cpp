#include "dashboard.hpp"
#include "csv_reader.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {
    const int64_t SECONDS_PER_DAY = 86400;

    std::optional<std::string> param(const std::map<std::string, std::string>& params, const std::string& key) {
        auto it = params.find(key);
        if (it == params.end()) return std::nullopt;
        std::string value = util::trim(it->second);
        if (value.empty()) return std::nullopt;
        return value;
    }

    int64_t parse_day(const std::string& text, const std::string& name) {
        auto ts = util::parse_utc_timestamp(text);
        if (!ts || text.size() != 10) {
            throw std::invalid_argument("Invalid " + name + ": '" + text + "' (expected YYYY-MM-DD)");
        }
        return *ts;
    }

    double num(const Decimal& value) {
        return decimal::to_double(value);
    }

    nlohmann::json optional_num(const std::optional<Decimal>& value) {
        if (!value) return nullptr;
        return num(*value);
    }

    nlohmann::json gain_json(const RealizedGain& gain) {
        return {
            {"asset", gain.asset},
            {"quantity", num(gain.quantity)},
            {"proceeds", num(gain.proceeds)},
            {"costBasis", num(gain.cost_basis)},
            {"fees", num(gain.fees)},
            {"gain", num(gain.gain)},
            {"closedAt", util::format_iso8601(gain.closed_at)},
            {"closingTxId", gain.closing_tx_id},
            {"closingType", kind_string(gain.closing_kind)},
            {"lotId", gain.lot_id},
            {"synthetic", gain.synthetic},
            {"note", gain.note}
        };
    }
}

DashboardFilters DashboardFilters::from_params(const std::map<std::string, std::string>& params) {
    DashboardFilters filters;

    if (auto g = param(params, "group_by")) {
        auto granularity = parse_granularity(*g);
        if (!granularity) {
            throw std::invalid_argument("Invalid group_by: '" + *g + "'");
        }
        filters.granularity = *granularity;
    }
    if (auto s = param(params, "start_date")) {
        filters.start = parse_day(*s, "start_date");
    }
    if (auto e = param(params, "end_date")) {
        filters.end = parse_day(*e, "end_date") + SECONDS_PER_DAY;
    }
    if (filters.start && filters.end && *filters.start >= *filters.end) {
        throw std::invalid_argument("start_date is after end_date");
    }
    if (auto a = param(params, "asset")) {
        if (util::to_lower(*a) != "all") filters.asset = util::to_upper(*a);
    }
    if (auto t = param(params, "type")) {
        if (util::to_lower(*t) != "all") {
            auto kind = parse_kind(*t);
            if (!kind) {
                throw std::invalid_argument("Invalid type: '" + *t + "'");
            }
            filters.type = *kind;
        }
    }
    return filters;
}

bool DashboardFilters::in_range(int64_t ts) const {
    if (start && ts < *start) return false;
    if (end && ts >= *end) return false;
    return true;
}

bool DashboardFilters::matches(const Transaction& tx) const {
    if (!in_range(tx.timestamp)) return false;
    if (asset && tx.asset != *asset) return false;
    if (type && tx.kind != *type) return false;
    return true;
}

bool DashboardFilters::matches(const RealizedGain& gain) const {
    if (!in_range(gain.closed_at)) return false;
    if (asset && gain.asset != *asset) return false;
    if (type && gain.closing_kind != *type) return false;
    return true;
}

nlohmann::json build_dashboard(const Session& session, const DashboardFilters& filters) {
    const auto& report = session.report;
    const auto& s = report.summary;

    nlohmann::json summary = {
        {"totalInvested", num(s.total_invested)},
        {"totalWithdrawn", num(s.total_withdrawn)},
        {"currentBalance", num(s.current_balance)},
        {"totalFees", num(s.total_fees)},
        {"realizedGains", num(s.realized_gains)},
        {"unrealizedGains", num(s.unrealized_gains)},
        {"cashDeposited", num(s.cash_deposited)},
        {"cashWithdrawn", num(s.cash_withdrawn)}
    };

    std::vector<RealizedGain> gains;
    for (const auto& gain : session.accounting.gains) {
        if (filters.matches(gain)) gains.push_back(gain);
    }
    nlohmann::json gains_json = nlohmann::json::array();
    for (const auto& bucket : Reporter::gains_by_period(gains, filters.granularity)) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& gain : bucket.entries) entries.push_back(gain_json(gain));
        gains_json.push_back({
            {"period", bucket.period},
            {"gain", num(bucket.gain)},
            {"proceeds", num(bucket.proceeds)},
            {"costBasis", num(bucket.cost_basis)},
            {"fees", num(bucket.fees)},
            {"entries", entries}
        });
    }

    nlohmann::json operations = nlohmann::json::array();
    for (const auto& op : Reporter::build_operations(session.ledger, session.accounting)) {
        if (!filters.in_range(op.timestamp)) continue;
        if (filters.asset && op.asset != *filters.asset) continue;
        if (filters.type && op.kind != *filters.type) continue;
        operations.push_back({
            {"id", op.id},
            {"date", util::format_iso8601(op.timestamp)},
            {"asset", op.asset},
            {"type", kind_string(op.kind)},
            {"amount", num(op.amount)},
            {"price", optional_num(op.price)},
            {"fee", num(op.fee)},
            {"total", num(op.total)},
            {"location", op.location},
            {"internalTransfer", op.internal_transfer}
        });
    }

    nlohmann::json holdings = nlohmann::json::array();
    for (const auto& h : report.holdings) {
        holdings.push_back({
            {"asset", h.asset},
            {"quantity", num(h.quantity)},
            {"averagePrice", num(h.average_cost)},
            {"costBasis", num(h.cost_basis)},
            {"currentPrice", optional_num(h.price)},
            {"currentValue", num(h.value)},
            {"unrealizedGain", num(h.unrealized)},
            {"priced", h.priced}
        });
    }

    nlohmann::json history = nlohmann::json::array();
    for (const auto& snapshot : report.history) {
        nlohmann::json values = nlohmann::json::object();
        for (const auto& [asset, value] : snapshot.values) values[asset] = num(value);
        history.push_back({
            {"timestamp", util::format_iso8601(snapshot.timestamp)},
            {"totalValue", num(snapshot.total_value)},
            {"assetValues", values},
            {"invested", num(snapshot.invested)},
            {"withdrawn", num(snapshot.withdrawn)}
        });
    }

    Ledger scoped;
    for (const auto& tx : session.ledger) {
        if (!filters.in_range(tx.timestamp)) continue;
        if (filters.type && tx.kind != *filters.type) continue;
        scoped.push_back(tx);
    }
    nlohmann::json breakdown = nlohmann::json::array();
    for (const auto& b : Reporter::build_breakdown(scoped)) {
        if (filters.asset && b.asset != *filters.asset) continue;
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& e : b.entries) {
            entries.push_back({
                {"id", e.id},
                {"timestamp", util::format_iso8601(e.timestamp)},
                {"location", e.location},
                {"type", kind_string(e.kind)},
                {"amount", num(e.amount)},
                {"fee", num(e.fee)},
                {"feeAsset", e.fee_asset},
                {"sourceSystem", e.source_system},
                {"internalTransfer", e.internal_transfer},
                {"raw", e.raw}
            });
        }
        breakdown.push_back({
            {"asset", b.asset},
            {"totalIn", num(b.total_in)},
            {"totalOut", num(b.total_out)},
            {"net", num(b.net)},
            {"feesPaid", num(b.fees_paid)},
            {"entries", entries}
        });
    }

    return {
        {"sessionId", session.id},
        {"reportingCurrency", session.reporting_currency},
        {"groupBy", granularity_string(filters.granularity)},
        {"summary", summary},
        {"gains", gains_json},
        {"operations", operations},
        {"holdings", holdings},
        {"portfolioHistory", history},
        {"assetBreakdown", breakdown},
        {"missingPrices", report.missing_prices},
        {"warnings", session.warnings}
    };
}

std::string export_operations_csv(const Session& session, const DashboardFilters& filters) {
    std::string out = CsvReader::join({"date", "asset", "type", "amount", "price", "fee", "total"}) + "\r\n";

    for (const auto& op : Reporter::build_operations(session.ledger, session.accounting)) {
        if (!filters.in_range(op.timestamp)) continue;
        if (filters.asset && op.asset != *filters.asset) continue;
        if (filters.type && op.kind != *filters.type) continue;

        out += CsvReader::join({
            util::format_datetime(op.timestamp),
            op.asset,
            kind_string(op.kind),
            decimal::to_string(op.amount, decimal::FULL_PLACES),
            op.price ? decimal::to_string(*op.price, decimal::FULL_PLACES) : "",
            decimal::to_string(op.fee, decimal::FULL_PLACES),
            decimal::to_string(op.total, decimal::FULL_PLACES)
        }) + "\r\n";
    }
    return out;
}
