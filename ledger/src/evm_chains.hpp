#pragma once

#include <string>
#include <optional>
#include <vector>

struct EvmChainConfig {
    std::string chain_id;
    std::string base_url;
    std::string symbol;
    int decimals;
    std::string api_key_env;
    std::string api_chain;
    std::string chain_identifier;
};

const std::vector<EvmChainConfig>& evm_chains();
std::optional<EvmChainConfig> find_evm_chain(const std::string& chain_id);
bool is_evm_chain(const std::string& chain_id);
