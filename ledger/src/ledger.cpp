#include "ledger.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <unordered_set>

void LedgerBuilder::add_source(const std::string& name, std::vector<Transaction> transactions) {
    spdlog::debug("Ledger source {}: {} transactions", name, transactions.size());
    for (auto& tx : transactions) {
        pending_.push_back(std::move(tx));
    }
}

Ledger LedgerBuilder::build() {
    Ledger ledger;
    std::unordered_set<std::string> seen;
    duplicates_dropped_ = 0;

    for (auto& tx : pending_) {
        if (!seen.insert(tx.id).second) {
            duplicates_dropped_++;
            continue;
        }
        tx.internal_transfer = false;
        ledger.push_back(std::move(tx));
    }
    pending_.clear();

    sort_ledger(ledger);
    internal_transfers_ = reconcile_internal_transfers(ledger);

    spdlog::info("Ledger built: {} transactions, {} duplicates dropped, {} internal transfer legs",
                 ledger.size(), duplicates_dropped_, internal_transfers_);
    return ledger;
}

void LedgerBuilder::sort_ledger(Ledger& ledger) {
    std::stable_sort(ledger.begin(), ledger.end(), [](const Transaction& a, const Transaction& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        if (a.source_priority() != b.source_priority()) return a.source_priority() < b.source_priority();
        return a.id < b.id;
    });
}

bool LedgerBuilder::amounts_match(const Decimal& a, const Decimal& b) {
    Decimal diff = abs(a - b);
    Decimal threshold = std::max(a, b) * Decimal("0.02") + Decimal("0.00000001");
    return diff <= threshold;
}

size_t LedgerBuilder::reconcile_internal_transfers(Ledger& ledger) {
    std::vector<size_t> candidates;
    for (size_t i = 0; i < ledger.size(); i++) {
        auto kind = ledger[i].kind;
        if (kind == TxKind::Deposit || kind == TxKind::Withdrawal) {
            candidates.push_back(i);
        }
    }

    size_t flagged = 0;
    for (size_t c = 0; c < candidates.size(); c++) {
        Transaction& tx = ledger[candidates[c]];
        if (tx.internal_transfer) continue;

        for (size_t d = c + 1; d < candidates.size(); d++) {
            Transaction& other = ledger[candidates[d]];
            if (other.timestamp - tx.timestamp > TRANSFER_WINDOW_SECONDS) break;
            if (other.internal_transfer) continue;
            if (other.asset != tx.asset || other.kind == tx.kind) continue;
            if (other.location() == tx.location()) continue;
            if (!amounts_match(tx.amount, other.amount)) continue;

            tx.internal_transfer = true;
            other.internal_transfer = true;
            flagged += 2;
            spdlog::debug("Internal transfer {} <-> {}", tx.id, other.id);
            break;
        }
    }
    return flagged;
}
