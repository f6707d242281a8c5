#include "wallet_normalizer.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <future>
#include <set>
#include <utility>

WalletNormalizer::WalletNormalizer(ChainClientFactory factory, int max_pages)
    : factory_(std::move(factory))
    , max_pages_(max_pages > 0 ? max_pages : 1)
{
}

std::vector<Transaction> WalletNormalizer::import_address(const std::string& chain,
                                                          const std::string& address) const {
    std::unique_ptr<ChainClient> client;
    try {
        client = factory_(chain);
    } catch (const std::exception& e) {
        throw SourceUnavailable(chain, address, e.what());
    }
    if (!client) {
        throw SourceUnavailable(chain, address, "unsupported chain");
    }

    std::vector<ChainTransfer> transfers;
    std::set<std::pair<std::string, std::string>> seen;
    std::optional<std::string> cursor;
    int pages = 0;

    try {
        do {
            auto page = client->fetch_page(address, cursor);
            pages++;
            for (auto& transfer : page.transfers) {
                if (seen.insert({transfer.hash, transfer.asset}).second) {
                    transfers.push_back(std::move(transfer));
                }
            }
            cursor = page.next_cursor;
        } while (cursor && pages < max_pages_);
    } catch (const SourceUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailable(chain, address, e.what());
    }

    if (cursor) {
        spdlog::warn("{} history for {} truncated after {} pages",
                     chain, util::abbreviate(address), pages);
    }

    auto txs = to_transactions(client->chain(), client->native_asset(), address, transfers);
    spdlog::info("Imported {} transactions from {} address {}",
                 txs.size(), chain, util::abbreviate(address));
    return txs;
}

WalletImportResult WalletNormalizer::import(const std::vector<WalletSource>& sources) const {
    WalletImportResult result;

    struct Pending {
        std::string chain;
        std::string address;
        std::future<std::vector<Transaction>> future;
    };
    std::vector<Pending> pending;

    for (const auto& source : sources) {
        std::string chain = util::to_lower(util::trim(source.chain));
        for (const auto& raw_address : source.addresses) {
            std::string address = util::trim(raw_address);
            if (address.empty()) continue;
            pending.push_back({chain, address, std::async(std::launch::async,
                [this, chain, address]() { return import_address(chain, address); })});
        }
    }

    for (auto& p : pending) {
        try {
            auto txs = p.future.get();
            for (auto& tx : txs) {
                result.transactions.push_back(std::move(tx));
            }
        } catch (const SourceUnavailable& e) {
            spdlog::warn("Source unavailable {}:{}: {}", e.chain(), util::abbreviate(e.address()), e.what());
            result.warnings.push_back(e.what());
        }
    }

    return result;
}

std::vector<Transaction> WalletNormalizer::to_transactions(const std::string& chain,
                                                           const std::string& native_asset,
                                                           const std::string& address,
                                                           const std::vector<ChainTransfer>& transfers) {
    std::vector<Transaction> out;

    for (const auto& transfer : transfers) {
        ChainSource source{chain, address, transfer.hash, transfer.counterparty};
        std::string base_id = fmt::format("{}:{}:{}:{}", chain, transfer.hash, transfer.asset, address);

        if (transfer.amount != 0) {
            Transaction tx;
            tx.id = base_id;
            tx.timestamp = transfer.timestamp;
            tx.asset = transfer.asset;
            tx.kind = transfer.amount > 0 ? TxKind::Deposit : TxKind::Withdrawal;
            tx.amount = abs(transfer.amount);
            tx.fee = 0;
            tx.fee_asset = transfer.fee_asset.empty() ? native_asset : transfer.fee_asset;
            tx.source = source;
            tx.raw = transfer.raw;
            out.push_back(std::move(tx));
        }

        if (transfer.fee > 0) {
            Transaction fee_tx;
            fee_tx.id = fmt::format("{}:{}:{}:{}-fee", chain, transfer.hash, native_asset, address);
            fee_tx.timestamp = transfer.timestamp;
            fee_tx.asset = transfer.fee_asset.empty() ? native_asset : transfer.fee_asset;
            fee_tx.kind = TxKind::FeeOnly;
            fee_tx.amount = transfer.fee;
            fee_tx.fee = 0;
            fee_tx.fee_asset = fee_tx.asset;
            fee_tx.source = source;
            fee_tx.raw = {{"hash", transfer.hash}, {"network_fee", decimal::to_string(transfer.fee, 18)}};
            out.push_back(std::move(fee_tx));
        }
    }

    return out;
}
