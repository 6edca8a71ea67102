// =============================================================================
// services.cpp - In-process collaborators (memory store, system clock)
// =============================================================================

#include "kald/services.hpp"

namespace kald {

// =============================================================================
// AllowListVerifier
// =============================================================================

bool AllowListVerifier::verify(const std::string&, const std::string& signature,
                               const std::string& claimed_signer) {
    if (signature.empty() || signers_.empty()) {
        return false;
    }
    return signers_.count(claimed_signer) > 0;
}

// =============================================================================
// MemoryStore
// =============================================================================

bool MemoryStore::put_transfer(const BridgeTransfer& transfer) {
    std::unique_lock lock(mutex_);
    transfers_[transfer.id] = transfer;
    return true;
}

std::optional<BridgeTransfer> MemoryStore::find_transfer(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) return std::nullopt;
    return it->second;
}

std::vector<BridgeTransfer> MemoryStore::list_transfers() const {
    std::shared_lock lock(mutex_);
    std::vector<BridgeTransfer> result;
    result.reserve(transfers_.size());
    for (const auto& [id, transfer] : transfers_) {
        result.push_back(transfer);
    }
    return result;
}

bool MemoryStore::put_pool(const LiquidityPool& pool) {
    std::unique_lock lock(mutex_);
    pools_[pool.key] = pool;
    return true;
}

std::optional<LiquidityPool> MemoryStore::find_pool(const PoolKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(key);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::vector<LiquidityPool> MemoryStore::list_pools() const {
    std::shared_lock lock(mutex_);
    std::vector<LiquidityPool> result;
    result.reserve(pools_.size());
    for (const auto& [key, pool] : pools_) {
        result.push_back(pool);
    }
    return result;
}

bool MemoryStore::put_chain(const ChainDescriptor& chain) {
    std::unique_lock lock(mutex_);
    chains_[chain.id] = chain;
    return true;
}

std::optional<ChainDescriptor> MemoryStore::find_chain(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(id);
    if (it == chains_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::put_stats(const SettlementStatistics& stats) {
    std::unique_lock lock(mutex_);
    stats_.push_back(stats);
    return true;
}

std::optional<SettlementStatistics> MemoryStore::latest_stats() const {
    std::shared_lock lock(mutex_);
    if (stats_.empty()) return std::nullopt;
    return stats_.back();
}

size_t MemoryStore::stats_snapshots() const {
    std::shared_lock lock(mutex_);
    return stats_.size();
}

// =============================================================================
// SystemClock
// =============================================================================

std::optional<uint64_t> SystemClock::current_height(const std::string& chain_id) const {
    std::shared_lock lock(mutex_);
    auto it = heights_.find(chain_id);
    if (it == heights_.end()) return std::nullopt;
    return it->second;
}

void SystemClock::set_height(const std::string& chain_id, uint64_t height) {
    std::unique_lock lock(mutex_);
    heights_[chain_id] = height;
}

} // namespace kald
