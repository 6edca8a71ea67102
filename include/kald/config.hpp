#ifndef KALD_CONFIG_HPP
#define KALD_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "registry.hpp"

namespace kald {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Bridge Configuration (builder-style, loadable from JSON)
// =============================================================================

class BridgeConfig {
public:
    Amount min_transfer_amount = UNIT;                 // 1 token
    Amount max_transfer_amount = amount::from_units(10000);
    Amount bridge_fee = UNIT / 10;                     // 0.1 token
    uint32_t confirmation_blocks = 12;
    uint32_t timeout_blocks = 1000;
    bool credit_net_of_fee = true;

    uint64_t monitor_interval_ms = 30000;
    uint64_t pool_refresh_interval_ms = 60000;
    uint64_t stats_interval_ms = 300000;

    std::string log_level = "info";

    std::vector<std::string> supported_chains = {
        "ethereum", "binance-smart-chain", "polygon", "avalanche"
    };

    // Replace or add descriptors on top of the built-in table
    std::vector<ChainDescriptor> chains;

    BridgeConfig() = default;

    // Load from JSON file
    static BridgeConfig from_file(std::string_view path);

    // Load from JSON string
    static BridgeConfig from_json(std::string_view content);

    // Throws ConfigError when the policy is inconsistent
    void validate() const;

    BridgeConfig& set_transfer_bounds(Amount min, Amount max) {
        min_transfer_amount = min;
        max_transfer_amount = max;
        return *this;
    }

    BridgeConfig& set_bridge_fee(Amount fee) {
        bridge_fee = fee;
        return *this;
    }

    BridgeConfig& set_confirmation_blocks(uint32_t blocks) {
        confirmation_blocks = blocks;
        return *this;
    }

    BridgeConfig& set_timeout_blocks(uint32_t blocks) {
        timeout_blocks = blocks;
        return *this;
    }

    BridgeConfig& enable_net_of_fee_credit(bool enabled = true) {
        credit_net_of_fee = enabled;
        return *this;
    }

    BridgeConfig& set_supported_chains(std::vector<std::string> ids) {
        supported_chains = std::move(ids);
        return *this;
    }

    BridgeConfig& with_chain(ChainDescriptor desc) {
        chains.push_back(std::move(desc));
        return *this;
    }

    BridgeConfig& set_intervals(uint64_t monitor_ms, uint64_t pool_ms, uint64_t stats_ms) {
        monitor_interval_ms = monitor_ms;
        pool_refresh_interval_ms = pool_ms;
        stats_interval_ms = stats_ms;
        return *this;
    }
};

} // namespace kald

#endif // KALD_CONFIG_HPP
