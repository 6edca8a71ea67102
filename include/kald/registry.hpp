#ifndef KALD_REGISTRY_HPP
#define KALD_REGISTRY_HPP

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <string>
#include <vector>

#include "types.hpp"

namespace kald {

// =============================================================================
// Network Family
// =============================================================================

enum class ChainFamily : uint8_t {
    EVM = 0,        // Account model
    SOLANA = 1,
    COSMOS = 2,
    POLKADOT = 3,
    CARDANO = 4,
    OTHER = 5
};

const char* to_string(ChainFamily family);
std::optional<ChainFamily> parse_chain_family(std::string_view text);

// =============================================================================
// Chain Descriptor
// =============================================================================

struct ChainDescriptor {
    std::string id;                     // e.g. "ethereum"
    std::string name;                   // Display name
    ChainFamily family = ChainFamily::EVM;
    uint64_t network_chain_id = 0;      // EIP-155 id or equivalent
    std::string rpc_endpoint;
    std::string native_asset;           // e.g. "ETH"
    uint64_t block_time_ms = 0;         // Expected block interval
    std::string bridge_contract;        // Bridge contract/address on that chain
    bool is_testnet = false;
    uint32_t required_confirmations = 0;  // 0 = use bridge default
};

// =============================================================================
// ChainRegistry - static table of supported external networks
// =============================================================================

class ChainRegistry {
public:
    ChainRegistry() = default;
    ~ChainRegistry() = default;

    // Non-copyable
    ChainRegistry(const ChainRegistry&) = delete;
    ChainRegistry& operator=(const ChainRegistry&) = delete;

    // Built-in descriptors for the given ids (unknown ids are skipped)
    static std::vector<ChainDescriptor> defaults(const std::vector<std::string>& supported);

    // Startup population. Rejected after seal().
    int32_t register_chain(const ChainDescriptor& desc);

    // Freeze the table; all later access is read-only
    void seal() { sealed_.store(true, std::memory_order_release); }
    bool sealed() const { return sealed_.load(std::memory_order_acquire); }

    std::optional<ChainDescriptor> describe(const std::string& chain_id) const;
    bool is_supported(const std::string& chain_id) const;
    std::vector<ChainDescriptor> list() const;
    size_t size() const;

private:
    std::map<std::string, ChainDescriptor> chains_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> sealed_{false};
};

} // namespace kald

#endif // KALD_REGISTRY_HPP
