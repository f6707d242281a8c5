#pragma once

#include "chain_client.hpp"
#include "transaction.hpp"
#include <string>
#include <vector>

struct WalletSource {
    std::string chain;
    std::vector<std::string> addresses;
};

struct WalletImportResult {
    std::vector<Transaction> transactions;
    std::vector<std::string> warnings;
};

// Fetches every (chain, address) pair concurrently and turns the transfers
// into deposit / withdrawal / fee-only transactions.
class WalletNormalizer {
public:
    explicit WalletNormalizer(ChainClientFactory factory, int max_pages = 20);

    // Failing or unknown sources become warnings; the rest still import.
    WalletImportResult import(const std::vector<WalletSource>& sources) const;

    // Throws SourceUnavailable when the indexer cannot be read.
    std::vector<Transaction> import_address(const std::string& chain,
                                            const std::string& address) const;

    static std::vector<Transaction> to_transactions(const std::string& chain,
                                                    const std::string& native_asset,
                                                    const std::string& address,
                                                    const std::vector<ChainTransfer>& transfers);

private:
    ChainClientFactory factory_;
    int max_pages_;
};
