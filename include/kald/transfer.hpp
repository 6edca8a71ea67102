#ifndef KALD_TRANSFER_HPP
#define KALD_TRANSFER_HPP

#include <atomic>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "records.hpp"
#include "registry.hpp"
#include "liquidity.hpp"
#include "services.hpp"
#include "config.hpp"

namespace kald {

// =============================================================================
// Transfer Intent (caller input to initiate)
// =============================================================================

struct TransferIntent {
    std::string source_chain;
    std::string dest_chain;
    std::string from_address;
    std::string to_address;
    Amount amount = 0;
    std::string asset;
    std::string signature;

    // Message the signature must cover:
    // source:dest:from:to:amount:asset
    std::string canonical_message() const;
};

// =============================================================================
// TransferMachine - lifecycle of bridge transfers
// =============================================================================
//
//   pending --[confirmations >= required]--> confirmed --[exec ok]--> completed
//   pending --[timeout]--> refunded
//   confirmed --[exec failed]--> failed   (manual reconciliation)
//
// Terminal transitions are decided under the index lock after re-reading the
// status, so each transfer reaches exactly one terminal state.
//
class TransferMachine {
public:
    TransferMachine(const BridgeConfig& config,
                    const ChainRegistry& registry,
                    LiquidityManager& liquidity,
                    ISignatureVerifier& verifier,
                    IDestinationExecutor& executor,
                    IRecordStore& store,
                    const IClock& clock);
    ~TransferMachine() = default;

    // Non-copyable
    TransferMachine(const TransferMachine&) = delete;
    TransferMachine& operator=(const TransferMachine&) = delete;

    // =========================================================================
    // Lifecycle Operations
    // =========================================================================

    // Validate, reserve source liquidity, create a pending transfer.
    // No side effects unless OK is returned.
    int32_t initiate(const TransferIntent& intent, BridgeTransfer& out);

    // Record source-side confirmations; crossing the threshold confirms and
    // runs destination execution.
    int32_t confirm(const std::string& transfer_id, const std::string& source_tx_ref,
                    uint32_t confirmations);

    // Relayer-supplied proof of destination completion
    int32_t complete_from_external_proof(const std::string& transfer_id,
                                         const std::string& dest_tx_ref);

    // Refund a pending transfer whose deadline has elapsed.
    // NOT_EXPIRED if it is still within its deadline.
    int32_t expire(const std::string& transfer_id, TimestampMs now_ms);

    // Operator removes a failed transfer from the active index once it has
    // been reconciled externally.
    int32_t acknowledge_failed(const std::string& transfer_id);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<BridgeTransfer> get(const std::string& transfer_id) const;

    // Everything in the active index (pending, confirmed, failed)
    std::vector<BridgeTransfer> list_active() const;

    // Pending and confirmed only
    std::vector<BridgeTransfer> list_pending() const;

    std::vector<BridgeTransfer> list_failed() const;

    // Ids of pending transfers past their deadline at now_ms
    std::vector<std::string> expired_candidates(TimestampMs now_ms) const;

    size_t active_count() const;

    // Terminal transfers recorded after `cursor`; advances cursor
    std::vector<BridgeTransfer> terminal_since(uint64_t& cursor) const;

    // =========================================================================
    // Recovery
    // =========================================================================

    // Reload non-terminal and failed transfers from the store (startup)
    size_t restore();

    struct Stats {
        uint64_t initiated;
        uint64_t rejected;
        uint64_t completed;
        uint64_t failed;
        uint64_t refunded;
        uint64_t active;
    };
    Stats get_stats() const;

private:
    const BridgeConfig& config_;
    const ChainRegistry& registry_;
    LiquidityManager& liquidity_;
    ISignatureVerifier& verifier_;
    IDestinationExecutor& executor_;
    IRecordStore& store_;
    const IClock& clock_;

    // Active index: transfer_id -> record
    std::unordered_map<std::string, BridgeTransfer> active_;
    mutable std::shared_mutex active_mutex_;

    // Append-only journal of terminal transitions
    std::deque<BridgeTransfer> terminal_log_;
    uint64_t terminal_base_{0};  // Sequence number of terminal_log_.front()
    mutable std::shared_mutex terminal_mutex_;

    std::atomic<uint64_t> id_counter_{0};
    std::atomic<uint64_t> initiated_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> refunded_{0};

    std::string next_transfer_id(TimestampMs now_ms);
    uint32_t required_confirmations(const ChainDescriptor& chain) const;

    // Run destination execution for a transfer that just became confirmed
    void execute_destination(const BridgeTransfer& snapshot);

    // Caller holds active_mutex_ exclusively; transfer is CONFIRMED
    int32_t settle_locked(BridgeTransfer& transfer, const std::string& dest_tx_ref);

    // Logs and returns false when the store rejects the write
    bool persist(const BridgeTransfer& transfer);
    void record_terminal(const BridgeTransfer& transfer);

    bool deadline_elapsed(const BridgeTransfer& transfer, TimestampMs now_ms) const;
};

} // namespace kald

#endif // KALD_TRANSFER_HPP
