// =============================================================================
// stats.cpp - Settlement statistics aggregation
// =============================================================================

#include "kald/stats.hpp"
#include "kald/log.hpp"

#include <exception>

namespace kald {

namespace {

const Journal& journal() {
    static const Journal j("stats");
    return j;
}

} // namespace

StatsAggregator::StatsAggregator(const TransferMachine& transfers,
                                 const LiquidityManager& liquidity,
                                 IRecordStore& store, const IClock& clock)
    : transfers_(transfers)
    , liquidity_(liquidity)
    , store_(store)
    , clock_(clock) {}

void StatsAggregator::fold(const BridgeTransfer& transfer) {
    switch (transfer.status) {
    case TransferStatus::COMPLETED: {
        ++current_.completed;
        Amount volume = 0;
        Amount fees = 0;
        if (amount::checked_add(current_.total_volume, transfer.amount, volume) &&
            amount::checked_add(current_.total_fees, transfer.bridge_fee, fees)) {
            current_.total_volume = volume;
            current_.total_fees = fees;
        } else {
            journal().error("volume overflow folding {}", transfer.id);
        }
        if (transfer.completed_at_ms >= transfer.created_at_ms) {
            completion_ms_sum_ +=
                static_cast<double>(transfer.completed_at_ms - transfer.created_at_ms);
            ++completion_samples_;
        }
        break;
    }
    case TransferStatus::FAILED:
        ++current_.failed;
        break;
    case TransferStatus::REFUNDED:
        ++current_.refunded;
        break;
    default:
        return;  // Not terminal
    }
    ++current_.total_transfers;
}

bool StatsAggregator::refresh() {
    try {
        std::unique_lock lock(mutex_);

        uint64_t cursor = cursor_;
        auto terminal = transfers_.terminal_since(cursor);

        SettlementStatistics saved = current_;
        double saved_sum = completion_ms_sum_;
        uint64_t saved_samples = completion_samples_;

        for (const auto& transfer : terminal) {
            fold(transfer);
        }

        current_.average_completion_ms =
            completion_samples_ ? completion_ms_sum_ / static_cast<double>(completion_samples_)
                                : 0.0;
        current_.success_rate =
            current_.total_transfers
                ? static_cast<double>(current_.completed) /
                      static_cast<double>(current_.total_transfers)
                : 0.0;
        current_.active_pools = liquidity_.count();
        current_.total_liquidity = liquidity_.aggregate_liquidity();
        current_.updated_at_ms = clock_.now_ms();

        if (!store_.put_stats(current_)) {
            // Roll back so the same transfers are folded again next pass
            current_ = saved;
            completion_ms_sum_ = saved_sum;
            completion_samples_ = saved_samples;
            journal().warn("failed to persist statistics snapshot; retrying next cycle");
            return false;
        }

        cursor_ = cursor;
        journal().debug("stats: {} terminal ({} completed, {} failed, {} refunded), "
                        "{} pools, success rate {:.3f}",
                        current_.total_transfers, current_.completed, current_.failed,
                        current_.refunded, current_.active_pools, current_.success_rate);
        return true;
    } catch (const std::exception& e) {
        journal().error("statistics refresh failed: {}", e.what());
        return false;
    }
}

SettlementStatistics StatsAggregator::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

bool StatsAggregator::restore() {
    auto latest = store_.latest_stats();
    if (!latest) return false;

    std::unique_lock lock(mutex_);
    current_ = *latest;
    completion_samples_ = current_.completed;
    completion_ms_sum_ =
        current_.average_completion_ms * static_cast<double>(completion_samples_);
    journal().info("restored statistics: {} terminal transfers", current_.total_transfers);
    return true;
}

} // namespace kald
