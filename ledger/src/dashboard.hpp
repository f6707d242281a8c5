#pragma once

#include "reporting.hpp"
#include "session.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Query filters shared by the dashboard and the CSV export.
// Dates are inclusive UTC days.
struct DashboardFilters {
    Granularity granularity = Granularity::Month;
    std::optional<int64_t> start;
    std::optional<int64_t> end;      // first second after the end day
    std::optional<std::string> asset;
    std::optional<TxKind> type;

    // Throws std::invalid_argument on an unknown group_by/type or a bad date.
    static DashboardFilters from_params(const std::map<std::string, std::string>& params);

    bool in_range(int64_t ts) const;
    bool matches(const Transaction& tx) const;
    bool matches(const RealizedGain& gain) const;
};

nlohmann::json build_dashboard(const Session& session, const DashboardFilters& filters);

// Header: date,asset,type,amount,price,fee,total
std::string export_operations_csv(const Session& session, const DashboardFilters& filters);
