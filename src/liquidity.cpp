// =============================================================================
// liquidity.cpp - Liquidity Pool Manager Implementation
// =============================================================================

#include "kald/liquidity.hpp"
#include "kald/log.hpp"

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("liquidity");
    return j;
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

LiquidityManager::LiquidityManager(IRecordStore* store, const IClock* clock)
    : store_(store)
    , clock_(clock) {}

// =============================================================================
// Slot Lookup
// =============================================================================

LiquidityManager::PoolSlot* LiquidityManager::find_slot(const PoolKey& key) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) return nullptr;
    return it->second.get();
}

LiquidityManager::PoolSlot* LiquidityManager::get_or_create_slot(const PoolKey& key) {
    if (PoolSlot* slot = find_slot(key)) {
        return slot;
    }

    std::unique_lock lock(slots_mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
        return it->second.get();
    }

    auto slot = std::make_unique<PoolSlot>();
    slot->pool.key = key;
    slot->pool.last_updated_ms = now();
    PoolSlot* raw = slot.get();
    slots_.emplace(key, std::move(slot));
    journal().info("created pool {}", key.str());
    return raw;
}

TimestampMs LiquidityManager::now() const {
    return clock_ ? clock_->now_ms() : wall_clock_ms();
}

void LiquidityManager::touch_and_persist(PoolSlot& slot) {
    slot.pool.last_updated_ms = now();
    if (store_ && !store_->put_pool(slot.pool)) {
        journal().warn("failed to persist pool {}", slot.pool.key.str());
    }
}

// =============================================================================
// Provider Operations
// =============================================================================

int32_t LiquidityManager::deposit(const PoolKey& key, Amount amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolSlot* slot = get_or_create_slot(key);
    std::lock_guard<std::mutex> lock(slot->mutex);

    Amount total = 0;
    Amount available = 0;
    if (!amount::checked_add(slot->pool.total_liquidity, amount, total) ||
        !amount::checked_add(slot->pool.available_liquidity, amount, available)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return errors::AMOUNT_OVERFLOW;
    }

    slot->pool.total_liquidity = total;
    slot->pool.available_liquidity = available;
    touch_and_persist(*slot);

    journal().debug("deposit {} into {} (total {}, available {})",
                    amount::to_string(amount), key.str(),
                    amount::to_string(total), amount::to_string(available));
    return errors::OK;
}

int32_t LiquidityManager::withdraw(const PoolKey& key, Amount amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolSlot* slot = find_slot(key);
    if (!slot) {
        return errors::POOL_NOT_FOUND;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (amount > slot->pool.available_liquidity) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    slot->pool.total_liquidity -= amount;
    slot->pool.available_liquidity -= amount;
    touch_and_persist(*slot);

    journal().debug("withdraw {} from {} (total {}, available {})",
                    amount::to_string(amount), key.str(),
                    amount::to_string(slot->pool.total_liquidity),
                    amount::to_string(slot->pool.available_liquidity));
    return errors::OK;
}

// =============================================================================
// Transfer Operations
// =============================================================================

int32_t LiquidityManager::reserve(const PoolKey& key, Amount amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolSlot* slot = find_slot(key);
    if (!slot) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return errors::POOL_NOT_FOUND;
    }

    // Check and decrement under the same lock: two concurrent reservations
    // can never both succeed against less than their sum.
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (amount > slot->pool.available_liquidity) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    slot->pool.available_liquidity -= amount;
    touch_and_persist(*slot);
    reservations_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t LiquidityManager::release(const PoolKey& key, Amount amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolSlot* slot = find_slot(key);
    if (!slot) {
        return errors::POOL_NOT_FOUND;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    LiquidityPool& pool = slot->pool;

    Amount available = 0;
    if (!amount::checked_add(pool.available_liquidity, amount, available) ||
        available > pool.total_liquidity) {
        // More released than was ever reserved. Never let available exceed total.
        journal().error("release of {} on {} exceeds reserved {}; clamping to total",
                        amount::to_string(amount), key.str(),
                        amount::to_string(pool.reserved()));
        available = pool.total_liquidity;
    }

    pool.available_liquidity = available;
    touch_and_persist(*slot);
    releases_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t LiquidityManager::credit(const PoolKey& key, Amount amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolSlot* slot = get_or_create_slot(key);
    std::lock_guard<std::mutex> lock(slot->mutex);

    Amount total = 0;
    Amount available = 0;
    if (!amount::checked_add(slot->pool.total_liquidity, amount, total) ||
        !amount::checked_add(slot->pool.available_liquidity, amount, available)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return errors::AMOUNT_OVERFLOW;
    }

    slot->pool.total_liquidity = total;
    slot->pool.available_liquidity = available;
    touch_and_persist(*slot);
    credits_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<LiquidityPool> LiquidityManager::get(const PoolKey& key) const {
    PoolSlot* slot = find_slot(key);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->pool;
}

std::vector<LiquidityPool> LiquidityManager::list() const {
    std::vector<PoolSlot*> slots;
    {
        std::shared_lock lock(slots_mutex_);
        slots.reserve(slots_.size());
        for (const auto& [key, slot] : slots_) {
            slots.push_back(slot.get());
        }
    }

    // One key lock at a time; never held while the map lock is held
    std::vector<LiquidityPool> result;
    result.reserve(slots.size());
    for (PoolSlot* slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(slot->pool);
    }
    return result;
}

size_t LiquidityManager::count() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

Amount LiquidityManager::aggregate_liquidity() const {
    Amount total = 0;
    for (const auto& pool : list()) {
        if (!amount::checked_add(total, pool.total_liquidity, total)) {
            journal().error("aggregate liquidity overflow");
            break;
        }
    }
    return total;
}

// =============================================================================
// Maintenance
// =============================================================================

size_t LiquidityManager::restore() {
    if (!store_) return 0;

    size_t loaded = 0;
    for (const auto& pool : store_->list_pools()) {
        if (pool.available_liquidity < 0 ||
            pool.available_liquidity > pool.total_liquidity) {
            journal().error("skipping stored pool {}: available {} outside [0, {}]",
                            pool.key.str(), amount::to_string(pool.available_liquidity),
                            amount::to_string(pool.total_liquidity));
            continue;
        }

        PoolSlot* slot = get_or_create_slot(pool.key);
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->pool = pool;
        ++loaded;
    }

    journal().info("loaded {} liquidity pools", loaded);
    return loaded;
}

void LiquidityManager::refresh() {
    std::vector<PoolSlot*> slots;
    {
        std::shared_lock lock(slots_mutex_);
        for (const auto& [key, slot] : slots_) {
            slots.push_back(slot.get());
        }
    }

    for (PoolSlot* slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        touch_and_persist(*slot);
        journal().debug("pool {} utilization {:.4f} (available {} of {})",
                        slot->pool.key.str(), slot->pool.utilization_rate(),
                        amount::to_string(slot->pool.available_liquidity),
                        amount::to_string(slot->pool.total_liquidity));
    }
}

LiquidityManager::Stats LiquidityManager::get_stats() const {
    Stats stats;
    stats.total_pools = count();
    stats.reservations = reservations_.load(std::memory_order_relaxed);
    stats.releases = releases_.load(std::memory_order_relaxed);
    stats.credits = credits_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace kald
