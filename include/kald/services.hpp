#ifndef KALD_SERVICES_HPP
#define KALD_SERVICES_HPP

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"
#include "records.hpp"
#include "registry.hpp"

namespace kald {

// =============================================================================
// Signature Verifier
// =============================================================================

class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    // Bounded, non-cancellable synchronous check
    virtual bool verify(const std::string& message, const std::string& signature,
                        const std::string& claimed_signer) = 0;
};

// Accepts a non-empty signature from a listed signer. An empty list rejects
// everything.
class AllowListVerifier : public ISignatureVerifier {
public:
    explicit AllowListVerifier(std::set<std::string> signers) : signers_(std::move(signers)) {}

    bool verify(const std::string& message, const std::string& signature,
                const std::string& claimed_signer) override;

    size_t size() const { return signers_.size(); }

private:
    std::set<std::string> signers_;
};

// =============================================================================
// Durable Record Store
// =============================================================================
//
// Read-your-writes for the calling process. put_* is an upsert; it returns
// false when the write could not be made durable.
//
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    virtual bool put_transfer(const BridgeTransfer& transfer) = 0;
    virtual std::optional<BridgeTransfer> find_transfer(const std::string& id) const = 0;
    virtual std::vector<BridgeTransfer> list_transfers() const = 0;

    virtual bool put_pool(const LiquidityPool& pool) = 0;
    virtual std::optional<LiquidityPool> find_pool(const PoolKey& key) const = 0;
    virtual std::vector<LiquidityPool> list_pools() const = 0;

    virtual bool put_chain(const ChainDescriptor& chain) = 0;
    virtual std::optional<ChainDescriptor> find_chain(const std::string& id) const = 0;

    virtual bool put_stats(const SettlementStatistics& stats) = 0;
    virtual std::optional<SettlementStatistics> latest_stats() const = 0;
};

// In-process store
class MemoryStore : public IRecordStore {
public:
    MemoryStore() = default;

    bool put_transfer(const BridgeTransfer& transfer) override;
    std::optional<BridgeTransfer> find_transfer(const std::string& id) const override;
    std::vector<BridgeTransfer> list_transfers() const override;

    bool put_pool(const LiquidityPool& pool) override;
    std::optional<LiquidityPool> find_pool(const PoolKey& key) const override;
    std::vector<LiquidityPool> list_pools() const override;

    bool put_chain(const ChainDescriptor& chain) override;
    std::optional<ChainDescriptor> find_chain(const std::string& id) const override;

    bool put_stats(const SettlementStatistics& stats) override;
    std::optional<SettlementStatistics> latest_stats() const override;

    size_t stats_snapshots() const;

private:
    std::map<std::string, BridgeTransfer> transfers_;
    std::map<PoolKey, LiquidityPool> pools_;
    std::map<std::string, ChainDescriptor> chains_;
    std::vector<SettlementStatistics> stats_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// Clock / Height Source
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    virtual TimestampMs now_ms() const = 0;

    // Latest known block height of an external chain, if tracked
    virtual std::optional<uint64_t> current_height(const std::string& chain_id) const = 0;
};

class SystemClock : public IClock {
public:
    TimestampMs now_ms() const override { return wall_clock_ms(); }

    std::optional<uint64_t> current_height(const std::string& chain_id) const override;

    // Fed by a chain listener; unknown chains report no height
    void set_height(const std::string& chain_id, uint64_t height);

private:
    std::map<std::string, uint64_t> heights_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// Destination Executor
// =============================================================================

enum class ExecutionOutcome : uint8_t {
    SUCCEEDED = 0,   // Destination-side transfer executed
    FAILED = 1,      // Executed and failed; needs manual reconciliation
    DEFERRED = 2     // Left to a relayer; completion arrives as external proof
};

struct ExecutionResult {
    ExecutionOutcome outcome = ExecutionOutcome::DEFERRED;
    std::string dest_tx_ref;
    std::string reason;

    static ExecutionResult succeeded(std::string tx_ref) {
        return ExecutionResult{ExecutionOutcome::SUCCEEDED, std::move(tx_ref), {}};
    }
    static ExecutionResult failed(std::string why) {
        return ExecutionResult{ExecutionOutcome::FAILED, {}, std::move(why)};
    }
    static ExecutionResult deferred() {
        return ExecutionResult{ExecutionOutcome::DEFERRED, {}, {}};
    }
};

class IDestinationExecutor {
public:
    virtual ~IDestinationExecutor() = default;

    virtual ExecutionResult execute(const BridgeTransfer& transfer) = 0;
};

// Default: destination execution is performed out-of-band by a relayer
class DeferredExecutor : public IDestinationExecutor {
public:
    ExecutionResult execute(const BridgeTransfer&) override {
        return ExecutionResult::deferred();
    }
};

} // namespace kald

#endif // KALD_SERVICES_HPP
