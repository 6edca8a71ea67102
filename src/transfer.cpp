// =============================================================================
// transfer.cpp - Transfer State Machine Implementation
// =============================================================================

#include "kald/transfer.hpp"
#include "kald/log.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <mutex>

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("transfer");
    return j;
}

// Terminal journal entries kept for statistics consumers
constexpr size_t MAX_TERMINAL_LOG = 100000;

// Sequence suffix of a "bridge_<ms>_<seq>" id, 0 when absent
uint64_t id_sequence(const std::string& id) {
    auto pos = id.rfind('_');
    if (pos == std::string::npos) return 0;
    uint64_t seq = 0;
    auto [ptr, ec] = std::from_chars(id.data() + pos + 1, id.data() + id.size(), seq);
    if (ec != std::errc() || ptr != id.data() + id.size()) return 0;
    return seq;
}

} // namespace

std::string TransferIntent::canonical_message() const {
    return source_chain + ":" + dest_chain + ":" + from_address + ":" + to_address +
           ":" + amount::to_string(amount) + ":" + asset;
}

// =============================================================================
// Constructor
// =============================================================================

TransferMachine::TransferMachine(const BridgeConfig& config,
                                 const ChainRegistry& registry,
                                 LiquidityManager& liquidity,
                                 ISignatureVerifier& verifier,
                                 IDestinationExecutor& executor,
                                 IRecordStore& store,
                                 const IClock& clock)
    : config_(config)
    , registry_(registry)
    , liquidity_(liquidity)
    , verifier_(verifier)
    , executor_(executor)
    , store_(store)
    , clock_(clock) {}

// =============================================================================
// Helpers
// =============================================================================

std::string TransferMachine::next_transfer_id(TimestampMs now_ms) {
    uint64_t seq = id_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return "bridge_" + std::to_string(now_ms) + "_" + std::to_string(seq);
}

uint32_t TransferMachine::required_confirmations(const ChainDescriptor& chain) const {
    if (chain.required_confirmations > 0) {
        return chain.required_confirmations;
    }
    return config_.confirmation_blocks;
}

bool TransferMachine::deadline_elapsed(const BridgeTransfer& transfer, TimestampMs now_ms) const {
    if (now_ms >= transfer.timeout_deadline_ms) {
        return true;
    }
    if (transfer.timeout_height > 0) {
        auto height = clock_.current_height(transfer.source_chain);
        if (height && *height >= transfer.timeout_height) {
            return true;
        }
    }
    return false;
}

bool TransferMachine::persist(const BridgeTransfer& transfer) {
    if (!store_.put_transfer(transfer)) {
        journal().error("failed to persist transfer {} ({})",
                        transfer.id, to_string(transfer.status));
        return false;
    }
    return true;
}

void TransferMachine::record_terminal(const BridgeTransfer& transfer) {
    std::unique_lock lock(terminal_mutex_);
    terminal_log_.push_back(transfer);
    while (terminal_log_.size() > MAX_TERMINAL_LOG) {
        terminal_log_.pop_front();
        ++terminal_base_;
    }
}

// =============================================================================
// Initiate
// =============================================================================

int32_t TransferMachine::initiate(const TransferIntent& intent, BridgeTransfer& out) {
    auto source = registry_.describe(intent.source_chain);
    auto dest = registry_.describe(intent.dest_chain);
    if (!source || !dest) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        journal().warn("rejected transfer {} -> {}: unsupported chain",
                       intent.source_chain, intent.dest_chain);
        return errors::UNSUPPORTED_CHAIN;
    }

    if (intent.amount <= 0 ||
        intent.amount < config_.min_transfer_amount ||
        intent.amount > config_.max_transfer_amount) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        journal().warn("rejected transfer of {}: outside [{}, {}]",
                       amount::to_string(intent.amount),
                       amount::to_string(config_.min_transfer_amount),
                       amount::to_string(config_.max_transfer_amount));
        return errors::AMOUNT_OUT_OF_RANGE;
    }

    if (!verifier_.verify(intent.canonical_message(), intent.signature, intent.from_address)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        journal().warn("rejected transfer from {}: invalid signature", intent.from_address);
        return errors::INVALID_SIGNATURE;
    }

    // Reservation is the last validation step; nothing above has side effects
    PoolKey source_pool{intent.source_chain, intent.asset};
    int32_t rc = liquidity_.reserve(source_pool, intent.amount);
    if (rc != errors::OK) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        journal().warn("rejected transfer of {} on {}: {}",
                       amount::to_string(intent.amount), source_pool.str(),
                       errors::describe(rc));
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    TimestampMs now = clock_.now_ms();

    BridgeTransfer transfer;
    transfer.source_chain = intent.source_chain;
    transfer.dest_chain = intent.dest_chain;
    transfer.from_address = intent.from_address;
    transfer.to_address = intent.to_address;
    transfer.asset = intent.asset;
    transfer.amount = intent.amount;
    transfer.bridge_fee = config_.bridge_fee;
    transfer.status = TransferStatus::PENDING;
    transfer.created_at_ms = now;
    transfer.confirmations = 0;
    transfer.required_confirmations = required_confirmations(*source);
    transfer.timeout_deadline_ms =
        now + source->block_time_ms * static_cast<uint64_t>(config_.timeout_blocks);
    auto height = clock_.current_height(intent.source_chain);
    transfer.timeout_height = height ? *height + config_.timeout_blocks : 0;
    transfer.signature = intent.signature;

    {
        std::unique_lock lock(active_mutex_);

        // Ids already in the index or the store are never reused
        transfer.id = next_transfer_id(now);
        while (active_.count(transfer.id) > 0 || store_.find_transfer(transfer.id)) {
            journal().warn("transfer id {} already taken", transfer.id);
            transfer.id = next_transfer_id(now);
        }

        if (!store_.put_transfer(transfer)) {
            lock.unlock();
            int32_t release_rc = liquidity_.release(source_pool, intent.amount);
            if (release_rc != errors::OK) {
                journal().error("could not return reservation on {}: {}",
                                source_pool.str(), errors::describe(release_rc));
            }
            rejected_.fetch_add(1, std::memory_order_relaxed);
            journal().error("failed to persist new transfer {}", transfer.id);
            return errors::STORE_FAILURE;
        }
        active_.emplace(transfer.id, transfer);
    }
    initiated_.fetch_add(1, std::memory_order_relaxed);

    journal().info("initiated {}: {} {} {} -> {} ({} -> {}), needs {} confirmations",
                   transfer.id, amount::to_string(transfer.amount), transfer.asset,
                   transfer.source_chain, transfer.dest_chain,
                   transfer.from_address, transfer.to_address,
                   transfer.required_confirmations);

    out = transfer;
    return errors::OK;
}

// =============================================================================
// Confirm
// =============================================================================

int32_t TransferMachine::confirm(const std::string& transfer_id,
                                 const std::string& source_tx_ref,
                                 uint32_t confirmations) {
    BridgeTransfer snapshot;
    bool reached_threshold = false;

    {
        std::unique_lock lock(active_mutex_);
        auto it = active_.find(transfer_id);
        if (it == active_.end()) {
            lock.unlock();
            return store_.find_transfer(transfer_id) ? errors::NOT_PENDING
                                                     : errors::TRANSFER_NOT_FOUND;
        }

        if (it->second.status != TransferStatus::PENDING) {
            return errors::NOT_PENDING;
        }

        BridgeTransfer updated = it->second;
        updated.source_tx_ref = source_tx_ref;
        updated.confirmations = confirmations;
        if (confirmations >= updated.required_confirmations) {
            updated.status = TransferStatus::CONFIRMED;
            reached_threshold = true;
        }
        if (!persist(updated)) {
            return errors::STORE_FAILURE;
        }
        it->second = updated;
        snapshot = updated;
    }

    journal().info("transfer {} has {}/{} confirmations ({})",
                   transfer_id, confirmations, snapshot.required_confirmations,
                   to_string(snapshot.status));

    if (reached_threshold) {
        execute_destination(snapshot);
    }
    return errors::OK;
}

void TransferMachine::execute_destination(const BridgeTransfer& snapshot) {
    // The executor is an external call; the index lock is not held across it
    ExecutionResult result;
    try {
        result = executor_.execute(snapshot);
    } catch (const std::exception& e) {
        result = ExecutionResult::failed(e.what());
    }

    switch (result.outcome) {
        case ExecutionOutcome::DEFERRED:
            journal().info("transfer {} confirmed; awaiting destination proof", snapshot.id);
            return;

        case ExecutionOutcome::SUCCEEDED: {
            std::unique_lock lock(active_mutex_);
            auto it = active_.find(snapshot.id);
            if (it == active_.end() || it->second.status != TransferStatus::CONFIRMED) {
                // Settled concurrently through external proof
                journal().debug("transfer {} already settled", snapshot.id);
                return;
            }
            int32_t rc = settle_locked(it->second, result.dest_tx_ref);
            if (rc != errors::OK) {
                journal().error("settlement of {} deferred: {}", snapshot.id,
                                errors::describe(rc));
            }
            return;
        }

        case ExecutionOutcome::FAILED: {
            std::unique_lock lock(active_mutex_);
            auto it = active_.find(snapshot.id);
            if (it == active_.end() || it->second.status != TransferStatus::CONFIRMED) {
                return;
            }
            BridgeTransfer failed = it->second;
            failed.status = TransferStatus::FAILED;
            failed.completed_at_ms = clock_.now_ms();
            if (!persist(failed)) {
                // Stays CONFIRMED; an external proof or a later retry can still settle it
                journal().error("destination execution failed for {}: {}; status not recorded",
                                failed.id, result.reason);
                return;
            }
            BridgeTransfer& transfer = it->second;
            transfer = failed;
            record_terminal(transfer);
            failed_.fetch_add(1, std::memory_order_relaxed);

            // Source funds stay reserved; only an operator can reconcile this
            journal().error("destination execution failed for {} ({} {} to {}): {}; "
                            "manual reconciliation required",
                            transfer.id, amount::to_string(transfer.amount),
                            transfer.asset, transfer.dest_chain, result.reason);
            return;
        }
    }
}

// =============================================================================
// Settlement
// =============================================================================

int32_t TransferMachine::settle_locked(BridgeTransfer& transfer, const std::string& dest_tx_ref) {
    Amount credit_amount = transfer.amount;
    if (config_.credit_net_of_fee) {
        credit_amount = transfer.amount - transfer.bridge_fee;
    }

    // The terminal record is durable before any funds move
    BridgeTransfer settled = transfer;
    settled.dest_tx_ref = dest_tx_ref;
    settled.status = TransferStatus::COMPLETED;
    settled.completed_at_ms = clock_.now_ms();
    if (!persist(settled)) {
        return errors::STORE_FAILURE;
    }

    if (credit_amount > 0) {
        int32_t rc = liquidity_.credit(transfer.dest_pool(), credit_amount);
        if (rc != errors::OK) {
            if (!persist(transfer)) {
                journal().error("transfer {} is stored as completed but was not credited",
                                transfer.id);
            }
            return rc;
        }
    }

    transfer = settled;
    record_terminal(transfer);
    completed_.fetch_add(1, std::memory_order_relaxed);

    journal().info("completed {}: credited {} {} on {} (tx {})",
                   transfer.id, amount::to_string(credit_amount), transfer.asset,
                   transfer.dest_chain, dest_tx_ref);

    std::string id = transfer.id;
    active_.erase(id);
    return errors::OK;
}

int32_t TransferMachine::complete_from_external_proof(const std::string& transfer_id,
                                                      const std::string& dest_tx_ref) {
    std::unique_lock lock(active_mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
        lock.unlock();
        return store_.find_transfer(transfer_id) ? errors::NOT_CONFIRMED
                                                 : errors::TRANSFER_NOT_FOUND;
    }

    if (it->second.status != TransferStatus::CONFIRMED) {
        return errors::NOT_CONFIRMED;
    }

    return settle_locked(it->second, dest_tx_ref);
}

// =============================================================================
// Timeout
// =============================================================================

int32_t TransferMachine::expire(const std::string& transfer_id, TimestampMs now_ms) {
    std::unique_lock lock(active_mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
        lock.unlock();
        return store_.find_transfer(transfer_id) ? errors::NOT_PENDING
                                                 : errors::TRANSFER_NOT_FOUND;
    }

    BridgeTransfer& transfer = it->second;
    if (transfer.status != TransferStatus::PENDING) {
        return errors::NOT_PENDING;
    }
    if (!deadline_elapsed(transfer, now_ms)) {
        return errors::NOT_EXPIRED;
    }

    BridgeTransfer refunded = transfer;
    refunded.status = TransferStatus::REFUNDED;
    refunded.completed_at_ms = now_ms;
    if (!persist(refunded)) {
        return errors::STORE_FAILURE;
    }

    int32_t rc = liquidity_.release(transfer.source_pool(), transfer.amount);
    if (rc != errors::OK) {
        if (!persist(transfer)) {
            journal().error("transfer {} is stored as refunded but was not released",
                            transfer.id);
        }
        return rc;
    }

    transfer = refunded;
    record_terminal(transfer);
    refunded_.fetch_add(1, std::memory_order_relaxed);

    journal().info("refunded {}: released {} {} to {} after timeout",
                   transfer.id, amount::to_string(transfer.amount), transfer.asset,
                   transfer.source_chain);

    active_.erase(it);
    return errors::OK;
}

int32_t TransferMachine::acknowledge_failed(const std::string& transfer_id) {
    std::unique_lock lock(active_mutex_);
    auto it = active_.find(transfer_id);
    if (it == active_.end()) {
        return errors::TRANSFER_NOT_FOUND;
    }
    if (it->second.status != TransferStatus::FAILED) {
        return errors::NOT_FAILED;
    }

    journal().warn("failed transfer {} acknowledged and removed from active index",
                   transfer_id);
    active_.erase(it);
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<BridgeTransfer> TransferMachine::get(const std::string& transfer_id) const {
    {
        std::shared_lock lock(active_mutex_);
        auto it = active_.find(transfer_id);
        if (it != active_.end()) return it->second;
    }
    return store_.find_transfer(transfer_id);
}

std::vector<BridgeTransfer> TransferMachine::list_active() const {
    std::shared_lock lock(active_mutex_);
    std::vector<BridgeTransfer> result;
    result.reserve(active_.size());
    for (const auto& [id, transfer] : active_) {
        result.push_back(transfer);
    }
    return result;
}

std::vector<BridgeTransfer> TransferMachine::list_pending() const {
    std::shared_lock lock(active_mutex_);
    std::vector<BridgeTransfer> result;
    for (const auto& [id, transfer] : active_) {
        if (transfer.status == TransferStatus::PENDING ||
            transfer.status == TransferStatus::CONFIRMED) {
            result.push_back(transfer);
        }
    }
    return result;
}

std::vector<BridgeTransfer> TransferMachine::list_failed() const {
    std::shared_lock lock(active_mutex_);
    std::vector<BridgeTransfer> result;
    for (const auto& [id, transfer] : active_) {
        if (transfer.status == TransferStatus::FAILED) {
            result.push_back(transfer);
        }
    }
    return result;
}

std::vector<std::string> TransferMachine::expired_candidates(TimestampMs now_ms) const {
    std::shared_lock lock(active_mutex_);
    std::vector<std::string> result;
    for (const auto& [id, transfer] : active_) {
        if (transfer.status == TransferStatus::PENDING && deadline_elapsed(transfer, now_ms)) {
            result.push_back(id);
        }
    }
    return result;
}

size_t TransferMachine::active_count() const {
    std::shared_lock lock(active_mutex_);
    return active_.size();
}

std::vector<BridgeTransfer> TransferMachine::terminal_since(uint64_t& cursor) const {
    std::shared_lock lock(terminal_mutex_);
    if (cursor < terminal_base_) {
        cursor = terminal_base_;
    }

    std::vector<BridgeTransfer> result;
    size_t offset = static_cast<size_t>(cursor - terminal_base_);
    for (size_t i = offset; i < terminal_log_.size(); ++i) {
        result.push_back(terminal_log_[i]);
    }
    cursor = terminal_base_ + terminal_log_.size();
    return result;
}

// =============================================================================
// Recovery
// =============================================================================

size_t TransferMachine::restore() {
    size_t loaded = 0;
    uint64_t last_seq = 0;
    std::unique_lock lock(active_mutex_);
    for (auto& transfer : store_.list_transfers()) {
        last_seq = std::max(last_seq, id_sequence(transfer.id));
        if (transfer.status == TransferStatus::PENDING ||
            transfer.status == TransferStatus::CONFIRMED ||
            transfer.status == TransferStatus::FAILED) {
            active_[transfer.id] = std::move(transfer);
            ++loaded;
        }
    }

    // New ids continue after every id already in the store
    uint64_t current = id_counter_.load(std::memory_order_relaxed);
    while (current < last_seq &&
           !id_counter_.compare_exchange_weak(current, last_seq, std::memory_order_relaxed)) {
    }

    journal().info("loaded {} active transfers, next id sequence {}", loaded,
                   id_counter_.load(std::memory_order_relaxed) + 1);
    return loaded;
}

TransferMachine::Stats TransferMachine::get_stats() const {
    Stats stats;
    stats.initiated = initiated_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    stats.completed = completed_.load(std::memory_order_relaxed);
    stats.failed = failed_.load(std::memory_order_relaxed);
    stats.refunded = refunded_.load(std::memory_order_relaxed);
    stats.active = active_count();
    return stats;
}

} // namespace kald
