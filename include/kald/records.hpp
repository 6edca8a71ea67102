#ifndef KALD_RECORDS_HPP
#define KALD_RECORDS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"

namespace kald {

// =============================================================================
// Liquidity Pool (per chain, asset)
// =============================================================================

struct LiquidityPool {
    PoolKey key;
    Amount total_liquidity = 0;       // Sum contributed by providers
    Amount available_liquidity = 0;   // Total minus in-flight reservations
    TimestampMs last_updated_ms = 0;

    // Derived: 1 - available/total. Never stored.
    double utilization_rate() const {
        if (total_liquidity == 0) return 0.0;
        return static_cast<double>(total_liquidity - available_liquidity) /
               static_cast<double>(total_liquidity);
    }

    Amount reserved() const { return total_liquidity - available_liquidity; }
};

// =============================================================================
// Bridge Transfer
// =============================================================================

struct BridgeTransfer {
    std::string id;
    std::string source_chain;
    std::string dest_chain;
    std::string from_address;
    std::string to_address;
    std::string asset;
    Amount amount = 0;
    Amount bridge_fee = 0;             // Fixed at initiation
    TransferStatus status = TransferStatus::PENDING;
    TimestampMs created_at_ms = 0;
    TimestampMs completed_at_ms = 0;   // Set on any terminal transition
    std::string source_tx_ref;
    std::optional<std::string> dest_tx_ref;  // Set only on completion
    uint32_t confirmations = 0;
    uint32_t required_confirmations = 0;
    uint64_t timeout_height = 0;       // 0 = height unknown at creation
    TimestampMs timeout_deadline_ms = 0;
    std::string signature;

    PoolKey source_pool() const { return PoolKey{source_chain, asset}; }
    PoolKey dest_pool() const { return PoolKey{dest_chain, asset}; }
};

// =============================================================================
// Settlement Statistics (derived, never a source of truth)
// =============================================================================

struct SettlementStatistics {
    uint64_t total_transfers = 0;      // Terminal transfers observed
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t refunded = 0;
    Amount total_volume = 0;           // Completed amounts
    Amount total_fees = 0;             // Completed fees
    double average_completion_ms = 0.0;
    double success_rate = 0.0;         // completed / total_transfers
    uint64_t active_pools = 0;
    Amount total_liquidity = 0;
    TimestampMs updated_at_ms = 0;
};

} // namespace kald

#endif // KALD_RECORDS_HPP
