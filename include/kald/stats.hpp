#ifndef KALD_STATS_HPP
#define KALD_STATS_HPP

#include <mutex>
#include <shared_mutex>

#include "types.hpp"
#include "records.hpp"
#include "transfer.hpp"
#include "liquidity.hpp"
#include "services.hpp"

namespace kald {

// =============================================================================
// StatsAggregator - periodic settlement statistics
// =============================================================================
//
// Folds terminal transfers published by the state machine into running
// counters. Statistics are derived data and never feed back into transfer or
// pool state.
//
class StatsAggregator {
public:
    StatsAggregator(const TransferMachine& transfers, const LiquidityManager& liquidity,
                    IRecordStore& store, const IClock& clock);
    ~StatsAggregator() = default;

    // Non-copyable
    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    // Consume new terminal transfers, recompute pool totals, persist a
    // snapshot. Returns false if the pass failed; it is retried next cycle.
    bool refresh();

    SettlementStatistics snapshot() const;

    // Seed counters from the last persisted snapshot (startup)
    bool restore();

private:
    const TransferMachine& transfers_;
    const LiquidityManager& liquidity_;
    IRecordStore& store_;
    const IClock& clock_;

    SettlementStatistics current_;
    uint64_t cursor_{0};
    double completion_ms_sum_{0.0};
    uint64_t completion_samples_{0};
    mutable std::shared_mutex mutex_;

    // Caller holds mutex_ exclusively
    void fold(const BridgeTransfer& transfer);
};

} // namespace kald

#endif // KALD_STATS_HPP
