// kaldbridge - Statistics Aggregator tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kald/stats.hpp>

#include "test_support.hpp"

using namespace kald;
using namespace kald::test;
using Catch::Approx;

TEST_CASE("Statistics fold terminal transfers", "[stats]") {
    Harness h;
    REQUIRE(h.liquidity.deposit(PoolKey{"ethereum", "KALD"}, amount::from_units(1000)) == errors::OK);
    StatsAggregator stats(h.machine, h.liquidity, h.store, h.clock);

    SECTION("Empty") {
        REQUIRE(stats.refresh());
        auto snap = stats.snapshot();
        REQUIRE(snap.total_transfers == 0);
        REQUIRE(snap.success_rate == Approx(0.0));
        REQUIRE(snap.active_pools == 1);
        REQUIRE(snap.total_liquidity == amount::from_units(1000));
    }

    SECTION("Mixed outcomes") {
        BridgeTransfer a, b, c, d;
        REQUIRE(h.machine.initiate(h.intent(amount::from_units(100)), a) == errors::OK);
        REQUIRE(h.machine.initiate(h.intent(amount::from_units(200)), b) == errors::OK);
        REQUIRE(h.machine.initiate(h.intent(amount::from_units(50)), c) == errors::OK);
        REQUIRE(h.machine.initiate(h.intent(amount::from_units(10)), d) == errors::OK);

        h.clock.advance(1000);
        REQUIRE(h.machine.confirm(a.id, "0xa", 12) == errors::OK);
        h.clock.advance(2000);
        REQUIRE(h.machine.confirm(b.id, "0xb", 12) == errors::OK);

        h.executor.mode = ScriptedExecutor::Mode::FAIL;
        REQUIRE(h.machine.confirm(c.id, "0xc", 12) == errors::OK);

        REQUIRE(stats.refresh());
        auto snap = stats.snapshot();
        REQUIRE(snap.total_transfers == 3);
        REQUIRE(snap.completed == 2);
        REQUIRE(snap.failed == 1);
        REQUIRE(snap.refunded == 0);
        REQUIRE(snap.total_volume == amount::from_units(300));
        REQUIRE(snap.total_fees == 2 * h.config.bridge_fee);
        REQUIRE(snap.average_completion_ms == Approx(2000.0));
        REQUIRE(snap.success_rate == Approx(2.0 / 3.0));
        REQUIRE(snap.active_pools == 2);
        REQUIRE(snap.updated_at_ms == T0 + 3000);

        // Refund of the pending transfer shows up on the next pass only
        h.clock.set(d.timeout_deadline_ms);
        REQUIRE(h.machine.expire(d.id, h.clock.now_ms()) == errors::OK);
        REQUIRE(stats.snapshot().refunded == 0);

        REQUIRE(stats.refresh());
        snap = stats.snapshot();
        REQUIRE(snap.total_transfers == 4);
        REQUIRE(snap.refunded == 1);
        REQUIRE(snap.success_rate == Approx(0.5));

        // Nothing new: counters are stable
        REQUIRE(stats.refresh());
        REQUIRE(stats.snapshot().total_transfers == 4);
        REQUIRE(h.store.stats_snapshots() == 3);
    }
}

TEST_CASE("Statistics persistence failure is retried", "[stats]") {
    Harness h;
    REQUIRE(h.liquidity.deposit(PoolKey{"ethereum", "KALD"}, amount::from_units(1000)) == errors::OK);
    StatsAggregator stats(h.machine, h.liquidity, h.store, h.clock);

    BridgeTransfer t;
    REQUIRE(h.machine.initiate(h.intent(amount::from_units(100)), t) == errors::OK);
    REQUIRE(h.machine.confirm(t.id, "0xa", 12) == errors::OK);

    h.store.fail_stats = true;
    REQUIRE_FALSE(stats.refresh());
    REQUIRE(stats.snapshot().total_transfers == 0);

    h.store.fail_stats = false;
    REQUIRE(stats.refresh());
    REQUIRE(stats.snapshot().total_transfers == 1);
    REQUIRE(stats.snapshot().completed == 1);

    // Transfer state is untouched by the failed pass
    REQUIRE(h.machine.get(t.id)->status == TransferStatus::COMPLETED);
}

TEST_CASE("Statistics restore from the last snapshot", "[stats]") {
    Harness h;
    REQUIRE(h.liquidity.deposit(PoolKey{"ethereum", "KALD"}, amount::from_units(1000)) == errors::OK);

    {
        StatsAggregator stats(h.machine, h.liquidity, h.store, h.clock);
        BridgeTransfer t;
        REQUIRE(h.machine.initiate(h.intent(amount::from_units(100)), t) == errors::OK);
        h.clock.advance(4000);
        REQUIRE(h.machine.confirm(t.id, "0xa", 12) == errors::OK);
        REQUIRE(stats.refresh());
    }

    StatsAggregator restored(h.machine, h.liquidity, h.store, h.clock);
    REQUIRE(restored.restore());
    auto snap = restored.snapshot();
    REQUIRE(snap.completed == 1);
    REQUIRE(snap.average_completion_ms == Approx(4000.0));
    REQUIRE(snap.total_volume == amount::from_units(100));
}
