#include "evm_chains.hpp"
#include "util.hpp"

const std::vector<EvmChainConfig>& evm_chains() {
    static const std::vector<EvmChainConfig> chains = {
        {"ethereum", "https://api.etherscan.io/v2/api", "ETH", 18, "ETHERSCAN_API_KEY", "eth", "1"},
        {"arbitrum", "https://api.arbiscan.io/v2/api", "ETH", 18, "ARBISCAN_API_KEY", "arb", "42161"},
        {"base", "https://api.basescan.org/v2/api", "ETH", 18, "BASESCAN_API_KEY", "base", "8453"},
        {"polygon", "https://api.polygonscan.com/v2/api", "MATIC", 18, "POLYGONSCAN_API_KEY", "matic", "137"},
        {"optimism", "https://api-optimistic.etherscan.io/v2/api", "ETH", 18, "OPTIMISTICSCAN_API_KEY", "opt", "10"},
        {"bsc", "https://api.bscscan.com/v2/api", "BNB", 18, "BSCSCAN_API_KEY", "bsc", "56"},
        {"avalanche", "https://api.snowtrace.io/v2/api", "AVAX", 18, "SNOWTRACE_API_KEY", "avax", "43114"},
    };
    return chains;
}

std::optional<EvmChainConfig> find_evm_chain(const std::string& chain_id) {
    std::string id = util::to_lower(util::trim(chain_id));
    for (const auto& cfg : evm_chains()) {
        if (cfg.chain_id == id) return cfg;
    }
    return std::nullopt;
}

bool is_evm_chain(const std::string& chain_id) {
    return find_evm_chain(chain_id).has_value();
}
