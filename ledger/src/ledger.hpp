#pragma once

#include "transaction.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Merges normalized sources into one deterministic ledger.
class LedgerBuilder {
public:
    static constexpr int64_t TRANSFER_WINDOW_SECONDS = 15 * 60;

    void add_source(const std::string& name, std::vector<Transaction> transactions);

    // Drops repeated ids (first wins), orders by (timestamp, source priority, id)
    // and flags internal transfers.
    Ledger build();

    size_t duplicates_dropped() const { return duplicates_dropped_; }
    size_t internal_transfers() const { return internal_transfers_; }

    static void sort_ledger(Ledger& ledger);
    // Returns the number of transactions flagged.
    static size_t reconcile_internal_transfers(Ledger& ledger);
    static bool amounts_match(const Decimal& a, const Decimal& b);

private:
    std::vector<Transaction> pending_;
    size_t duplicates_dropped_ = 0;
    size_t internal_transfers_ = 0;
};
