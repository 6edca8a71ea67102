#ifndef KALD_LIQUIDITY_HPP
#define KALD_LIQUIDITY_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "records.hpp"
#include "services.hpp"

namespace kald {

// =============================================================================
// LiquidityManager - per (chain, asset) total vs. available liquidity
// =============================================================================
//
// Invariant: 0 <= available_liquidity <= total_liquidity for every pool.
//
// Mutations on one key are serialized by that key's mutex; different keys
// never contend. The key map itself is guarded by a shared mutex and slots
// are never erased, so a slot pointer stays valid once looked up.
//
class LiquidityManager {
public:
    explicit LiquidityManager(IRecordStore* store = nullptr,
                              const IClock* clock = nullptr);
    ~LiquidityManager() = default;

    // Non-copyable
    LiquidityManager(const LiquidityManager&) = delete;
    LiquidityManager& operator=(const LiquidityManager&) = delete;

    // =========================================================================
    // Provider Operations
    // =========================================================================

    // total += amount, available += amount (creates the pool)
    int32_t deposit(const PoolKey& key, Amount amount);

    // Fails INSUFFICIENT_LIQUIDITY if amount > available
    int32_t withdraw(const PoolKey& key, Amount amount);

    // =========================================================================
    // Transfer Operations
    // =========================================================================

    // Earmark for an in-flight outbound transfer: available -= amount
    int32_t reserve(const PoolKey& key, Amount amount);

    // Return a reservation: available += amount, capped at total
    int32_t release(const PoolKey& key, Amount amount);

    // Inbound funds on the destination side: total += amount, available += amount
    int32_t credit(const PoolKey& key, Amount amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<LiquidityPool> get(const PoolKey& key) const;
    std::vector<LiquidityPool> list() const;
    size_t count() const;
    Amount aggregate_liquidity() const;

    // =========================================================================
    // Maintenance
    // =========================================================================

    // Load pool snapshots from the store (startup)
    size_t restore();

    // Stamp every pool and log utilization (pool monitor loop)
    void refresh();

    struct Stats {
        uint64_t total_pools;
        uint64_t reservations;
        uint64_t releases;
        uint64_t credits;
        uint64_t rejected;
    };
    Stats get_stats() const;

private:
    struct PoolSlot {
        std::mutex mutex;
        LiquidityPool pool;
    };

    std::unordered_map<PoolKey, std::unique_ptr<PoolSlot>, PoolKeyHash> slots_;
    mutable std::shared_mutex slots_mutex_;

    IRecordStore* store_;
    const IClock* clock_;

    std::atomic<uint64_t> reservations_{0};
    std::atomic<uint64_t> releases_{0};
    std::atomic<uint64_t> credits_{0};
    std::atomic<uint64_t> rejected_{0};

    PoolSlot* find_slot(const PoolKey& key) const;
    PoolSlot* get_or_create_slot(const PoolKey& key);

    // Caller holds slot->mutex
    void touch_and_persist(PoolSlot& slot);

    TimestampMs now() const;
};

} // namespace kald

#endif // KALD_LIQUIDITY_HPP
