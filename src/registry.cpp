// =============================================================================
// registry.cpp - Chain Registry
// =============================================================================

#include "kald/registry.hpp"
#include "kald/log.hpp"

#include <mutex>

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("registry");
    return j;
}

ChainDescriptor make_chain(const char* id, const char* name, uint64_t network_id,
                           const char* rpc, uint64_t block_time_ms, const char* native) {
    ChainDescriptor desc;
    desc.id = id;
    desc.name = name;
    desc.family = ChainFamily::EVM;
    desc.network_chain_id = network_id;
    desc.rpc_endpoint = rpc;
    desc.native_asset = native;
    desc.block_time_ms = block_time_ms;
    desc.bridge_contract = "0x1234567890123456789012345678901234567890";
    desc.is_testnet = false;
    desc.required_confirmations = 0;
    return desc;
}

} // namespace

const char* to_string(ChainFamily family) {
    switch (family) {
        case ChainFamily::EVM:      return "EVM";
        case ChainFamily::SOLANA:   return "Solana";
        case ChainFamily::COSMOS:   return "Cosmos";
        case ChainFamily::POLKADOT: return "Polkadot";
        case ChainFamily::CARDANO:  return "Cardano";
        case ChainFamily::OTHER:    return "Other";
    }
    return "Other";
}

std::optional<ChainFamily> parse_chain_family(std::string_view text) {
    if (text == "EVM") return ChainFamily::EVM;
    if (text == "Solana") return ChainFamily::SOLANA;
    if (text == "Cosmos") return ChainFamily::COSMOS;
    if (text == "Polkadot") return ChainFamily::POLKADOT;
    if (text == "Cardano") return ChainFamily::CARDANO;
    if (text == "Other") return ChainFamily::OTHER;
    return std::nullopt;
}

// =============================================================================
// Built-in Table
// =============================================================================

std::vector<ChainDescriptor> ChainRegistry::defaults(const std::vector<std::string>& supported) {
    static const std::vector<ChainDescriptor> builtin = {
        make_chain("ethereum", "Ethereum", 1,
                   "https://mainnet.infura.io/v3/YOUR_PROJECT_ID", 12000, "ETH"),
        make_chain("binance-smart-chain", "Binance Smart Chain", 56,
                   "https://bsc-dataseed.binance.org", 3000, "BNB"),
        make_chain("polygon", "Polygon", 137,
                   "https://polygon-rpc.com", 2000, "MATIC"),
        make_chain("avalanche", "Avalanche", 43114,
                   "https://api.avax.network/ext/bc/C/rpc", 2000, "AVAX"),
    };

    std::vector<ChainDescriptor> result;
    for (const auto& id : supported) {
        for (const auto& desc : builtin) {
            if (desc.id == id) {
                result.push_back(desc);
                break;
            }
        }
    }
    return result;
}

// =============================================================================
// Population
// =============================================================================

int32_t ChainRegistry::register_chain(const ChainDescriptor& desc) {
    if (desc.id.empty() || desc.block_time_ms == 0) {
        return errors::INVALID_CHAIN;
    }

    std::unique_lock lock(mutex_);
    if (sealed()) {
        return errors::REGISTRY_SEALED;
    }
    if (chains_.find(desc.id) != chains_.end()) {
        return errors::CHAIN_ALREADY_REGISTERED;
    }

    chains_.emplace(desc.id, desc);
    journal().debug("registered chain {} ({}, block time {} ms)",
                    desc.id, to_string(desc.family), desc.block_time_ms);
    return errors::OK;
}

// =============================================================================
// Lookup
// =============================================================================

std::optional<ChainDescriptor> ChainRegistry::describe(const std::string& chain_id) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(chain_id);
    if (it == chains_.end()) return std::nullopt;
    return it->second;
}

bool ChainRegistry::is_supported(const std::string& chain_id) const {
    std::shared_lock lock(mutex_);
    return chains_.find(chain_id) != chains_.end();
}

std::vector<ChainDescriptor> ChainRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<ChainDescriptor> result;
    result.reserve(chains_.size());
    for (const auto& [id, desc] : chains_) {
        result.push_back(desc);
    }
    return result;
}

size_t ChainRegistry::size() const {
    std::shared_lock lock(mutex_);
    return chains_.size();
}

} // namespace kald
