// =============================================================================
// bridge.cpp - Bridge Controller
// =============================================================================

#include "kald/bridge.hpp"
#include "kald/log.hpp"

#include <map>

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("bridge");
    return j;
}

} // namespace

Bridge::Bridge(BridgeConfig config,
               ISignatureVerifier& verifier,
               IDestinationExecutor& executor,
               IRecordStore& store,
               const IClock& clock)
    : config_(std::move(config))
    , store_(store)
    , clock_(clock)
    , liquidity_(&store, &clock) {
    config_.validate();

    transfers_ = std::make_unique<TransferMachine>(
        config_, registry_, liquidity_, verifier, executor, store_, clock_);
    monitor_ = std::make_unique<ConfirmationMonitor>(
        *transfers_, clock_, std::chrono::milliseconds(config_.monitor_interval_ms));
    stats_ = std::make_unique<StatsAggregator>(*transfers_, liquidity_, store_, clock_);

    pool_task_ = std::make_unique<PeriodicTask>(
        "pool-refresh", std::chrono::milliseconds(config_.pool_refresh_interval_ms),
        [this] { liquidity_.refresh(); });
    stats_task_ = std::make_unique<PeriodicTask>(
        "stats", std::chrono::milliseconds(config_.stats_interval_ms),
        [this] { stats_->refresh(); });
}

Bridge::~Bridge() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void Bridge::register_chains() {
    std::map<std::string, ChainDescriptor> table;
    for (auto& desc : ChainRegistry::defaults(config_.supported_chains)) {
        table[desc.id] = desc;
    }
    for (const auto& desc : config_.chains) {
        table[desc.id] = desc;  // Overrides replace built-ins
    }

    for (const auto& [id, desc] : table) {
        int32_t rc = registry_.register_chain(desc);
        if (rc != errors::OK) {
            journal().error("cannot register chain {}: {}", id, errors::describe(rc));
            continue;
        }
        if (!store_.put_chain(desc)) {
            journal().warn("failed to persist chain descriptor {}", id);
        }
    }
    registry_.seal();
    journal().info("registered {} chains", registry_.size());
}

void Bridge::load() {
    bool expected = false;
    if (!loaded_.compare_exchange_strong(expected, true)) {
        return;
    }

    register_chains();
    size_t pools = liquidity_.restore();
    size_t transfers = transfers_->restore();
    stats_->restore();

    journal().info("bridge loaded: {} pools, {} in-flight transfers", pools, transfers);
}

void Bridge::start() {
    load();

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    monitor_->start();
    pool_task_->start();
    stats_task_->start();
    journal().info("bridge started (monitor {} ms, pools {} ms, stats {} ms)",
                   config_.monitor_interval_ms, config_.pool_refresh_interval_ms,
                   config_.stats_interval_ms);
}

void Bridge::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    monitor_->stop();
    pool_task_->stop();
    stats_task_->stop();
    journal().info("bridge stopped");
}

// =============================================================================
// Transfers
// =============================================================================

int32_t Bridge::initiate(const TransferIntent& intent, BridgeTransfer& out) {
    return transfers_->initiate(intent, out);
}

int32_t Bridge::confirm(const std::string& transfer_id, const std::string& source_tx_ref,
                        uint32_t confirmations) {
    return transfers_->confirm(transfer_id, source_tx_ref, confirmations);
}

int32_t Bridge::complete_from_external_proof(const std::string& transfer_id,
                                             const std::string& dest_tx_ref) {
    return transfers_->complete_from_external_proof(transfer_id, dest_tx_ref);
}

int32_t Bridge::acknowledge_failed(const std::string& transfer_id) {
    return transfers_->acknowledge_failed(transfer_id);
}

// =============================================================================
// Liquidity
// =============================================================================

int32_t Bridge::add_liquidity(const std::string& chain, const std::string& asset,
                              Amount amount, const std::string& provider_id) {
    if (!registry_.is_supported(chain)) {
        return errors::UNSUPPORTED_CHAIN;
    }

    int32_t rc = liquidity_.deposit(PoolKey{chain, asset}, amount);
    if (rc == errors::OK) {
        journal().info("provider {} added {} {} on {}", provider_id,
                       amount::to_string(amount), asset, chain);
    } else {
        journal().warn("provider {} deposit on {}:{} rejected: {}", provider_id, chain,
                       asset, errors::describe(rc));
    }
    return rc;
}

int32_t Bridge::remove_liquidity(const std::string& chain, const std::string& asset,
                                 Amount amount, const std::string& provider_id) {
    if (!registry_.is_supported(chain)) {
        return errors::UNSUPPORTED_CHAIN;
    }

    int32_t rc = liquidity_.withdraw(PoolKey{chain, asset}, amount);
    if (rc == errors::OK) {
        journal().info("provider {} removed {} {} on {}", provider_id,
                       amount::to_string(amount), asset, chain);
    } else {
        journal().warn("provider {} withdrawal on {}:{} rejected: {}", provider_id, chain,
                       asset, errors::describe(rc));
    }
    return rc;
}

// =============================================================================
// Queries
// =============================================================================

SettlementStatistics Bridge::get_stats() const {
    return stats_->snapshot();
}

std::vector<BridgeTransfer> Bridge::list_pending_transfers() const {
    return transfers_->list_pending();
}

std::optional<BridgeTransfer> Bridge::get_transfer(const std::string& transfer_id) const {
    return transfers_->get(transfer_id);
}

std::optional<LiquidityPool> Bridge::get_pool(const std::string& chain,
                                              const std::string& asset) const {
    return liquidity_.get(PoolKey{chain, asset});
}

std::optional<ChainDescriptor> Bridge::get_chain(const std::string& chain_id) const {
    return registry_.describe(chain_id);
}

} // namespace kald
