#ifndef KALD_BRIDGE_HPP
#define KALD_BRIDGE_HPP

// =============================================================================
// Bridge - Cross-Chain Transfer Engine
//
//   ChainRegistry        supported networks (sealed after load)
//   LiquidityManager     per (chain, asset) pools
//   TransferMachine      pending -> confirmed -> completed / failed / refunded
//   ConfirmationMonitor  timeout refunds
//   StatsAggregator      settlement statistics
//
// =============================================================================

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "records.hpp"
#include "registry.hpp"
#include "liquidity.hpp"
#include "transfer.hpp"
#include "monitor.hpp"
#include "stats.hpp"
#include "services.hpp"

namespace kald {

class Bridge {
public:
    Bridge(BridgeConfig config,
           ISignatureVerifier& verifier,
           IDestinationExecutor& executor,
           IRecordStore& store,
           const IClock& clock);
    ~Bridge();

    // Non-copyable
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    const ChainRegistry& registry() const { return registry_; }
    LiquidityManager& liquidity() { return liquidity_; }
    const LiquidityManager& liquidity() const { return liquidity_; }
    TransferMachine& transfers() { return *transfers_; }
    const TransferMachine& transfers() const { return *transfers_; }
    ConfirmationMonitor& monitor() { return *monitor_; }
    StatsAggregator& stats() { return *stats_; }

    const BridgeConfig& config() const { return config_; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Register chains (built-in table plus config overrides), seal the
    // registry and reload pools, in-flight transfers and statistics from the
    // store. Idempotent.
    void load();

    // Start the monitor, pool refresh and statistics loops (calls load())
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // =========================================================================
    // Transfers
    // =========================================================================

    int32_t initiate(const TransferIntent& intent, BridgeTransfer& out);
    int32_t confirm(const std::string& transfer_id, const std::string& source_tx_ref,
                    uint32_t confirmations);
    int32_t complete_from_external_proof(const std::string& transfer_id,
                                         const std::string& dest_tx_ref);
    int32_t acknowledge_failed(const std::string& transfer_id);

    // =========================================================================
    // Liquidity
    // =========================================================================

    int32_t add_liquidity(const std::string& chain, const std::string& asset,
                          Amount amount, const std::string& provider_id);
    int32_t remove_liquidity(const std::string& chain, const std::string& asset,
                             Amount amount, const std::string& provider_id);

    // =========================================================================
    // Queries
    // =========================================================================

    SettlementStatistics get_stats() const;
    std::vector<BridgeTransfer> list_pending_transfers() const;
    std::optional<BridgeTransfer> get_transfer(const std::string& transfer_id) const;
    std::optional<LiquidityPool> get_pool(const std::string& chain, const std::string& asset) const;
    std::optional<ChainDescriptor> get_chain(const std::string& chain_id) const;

    static constexpr const char* version() { return "1.0.0"; }

private:
    BridgeConfig config_;
    IRecordStore& store_;
    const IClock& clock_;

    ChainRegistry registry_;
    LiquidityManager liquidity_;
    std::unique_ptr<TransferMachine> transfers_;
    std::unique_ptr<ConfirmationMonitor> monitor_;
    std::unique_ptr<StatsAggregator> stats_;
    std::unique_ptr<PeriodicTask> pool_task_;
    std::unique_ptr<PeriodicTask> stats_task_;

    std::atomic<bool> loaded_{false};
    std::atomic<bool> running_{false};

    void register_chains();
};

} // namespace kald

#endif // KALD_BRIDGE_HPP
