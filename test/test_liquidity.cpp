// kaldbridge - Liquidity Pool Manager tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kald/liquidity.hpp>

#include "test_support.hpp"

#include <thread>
#include <vector>

using namespace kald;
using namespace kald::test;
using Catch::Approx;

namespace {

const PoolKey ETH_KALD{"ethereum", "KALD"};
const PoolKey POLY_KALD{"polygon", "KALD"};

} // namespace

TEST_CASE("Liquidity deposit and withdraw", "[liquidity]") {
    MemoryStore store;
    ManualClock clock;
    LiquidityManager liquidity(&store, &clock);

    SECTION("Deposit creates the pool") {
        REQUIRE(liquidity.deposit(ETH_KALD, 1000) == errors::OK);

        auto pool = liquidity.get(ETH_KALD);
        REQUIRE(pool.has_value());
        REQUIRE(pool->total_liquidity == 1000);
        REQUIRE(pool->available_liquidity == 1000);
        REQUIRE(pool->last_updated_ms == T0);
        REQUIRE(pool->utilization_rate() == Approx(0.0));

        // Snapshot persisted
        auto stored = store.find_pool(ETH_KALD);
        REQUIRE(stored.has_value());
        REQUIRE(stored->total_liquidity == 1000);
    }

    SECTION("Non-positive amounts are rejected") {
        REQUIRE(liquidity.deposit(ETH_KALD, 0) == errors::INVALID_AMOUNT);
        REQUIRE(liquidity.deposit(ETH_KALD, -5) == errors::INVALID_AMOUNT);
        REQUIRE_FALSE(liquidity.get(ETH_KALD).has_value());
    }

    SECTION("Withdraw from missing pool") {
        REQUIRE(liquidity.withdraw(ETH_KALD, 10) == errors::POOL_NOT_FOUND);
    }

    SECTION("Withdraw is bounded by available liquidity") {
        REQUIRE(liquidity.deposit(ETH_KALD, 1000) == errors::OK);
        REQUIRE(liquidity.reserve(ETH_KALD, 600) == errors::OK);

        REQUIRE(liquidity.withdraw(ETH_KALD, 500) == errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(liquidity.withdraw(ETH_KALD, 400) == errors::OK);

        auto pool = liquidity.get(ETH_KALD);
        REQUIRE(pool->total_liquidity == 600);
        REQUIRE(pool->available_liquidity == 0);
        REQUIRE(pool->utilization_rate() == Approx(1.0));
    }

    SECTION("Deposit overflow") {
        Amount max = static_cast<Amount>(~U128(0) >> 1);
        REQUIRE(liquidity.deposit(ETH_KALD, max) == errors::OK);
        REQUIRE(liquidity.deposit(ETH_KALD, 1) == errors::AMOUNT_OVERFLOW);
        REQUIRE(liquidity.get(ETH_KALD)->total_liquidity == max);
    }
}

TEST_CASE("Liquidity reservations", "[liquidity]") {
    LiquidityManager liquidity;
    REQUIRE(liquidity.deposit(ETH_KALD, 1000) == errors::OK);

    SECTION("Reserve leaves total unchanged") {
        REQUIRE(liquidity.reserve(ETH_KALD, 100) == errors::OK);
        auto pool = liquidity.get(ETH_KALD);
        REQUIRE(pool->total_liquidity == 1000);
        REQUIRE(pool->available_liquidity == 900);
        REQUIRE(pool->reserved() == 100);
        REQUIRE(pool->utilization_rate() == Approx(0.1));
    }

    SECTION("Reserve beyond available") {
        REQUIRE(liquidity.reserve(ETH_KALD, 1001) == errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(liquidity.get(ETH_KALD)->available_liquidity == 1000);
    }

    SECTION("Reserve against missing pool") {
        REQUIRE(liquidity.reserve(POLY_KALD, 1) == errors::POOL_NOT_FOUND);
    }

    SECTION("Release returns the reservation") {
        REQUIRE(liquidity.reserve(ETH_KALD, 300) == errors::OK);
        REQUIRE(liquidity.release(ETH_KALD, 300) == errors::OK);
        REQUIRE(liquidity.get(ETH_KALD)->available_liquidity == 1000);
    }

    SECTION("Over-release is clamped to total") {
        REQUIRE(liquidity.reserve(ETH_KALD, 100) == errors::OK);
        REQUIRE(liquidity.release(ETH_KALD, 500) == errors::OK);

        auto pool = liquidity.get(ETH_KALD);
        REQUIRE(pool->available_liquidity == 1000);
        REQUIRE(pool->total_liquidity == 1000);
    }

    SECTION("Credit creates the destination pool") {
        REQUIRE(liquidity.credit(POLY_KALD, 250) == errors::OK);
        auto pool = liquidity.get(POLY_KALD);
        REQUIRE(pool.has_value());
        REQUIRE(pool->total_liquidity == 250);
        REQUIRE(pool->available_liquidity == 250);
    }

    SECTION("Aggregates") {
        REQUIRE(liquidity.credit(POLY_KALD, 250) == errors::OK);
        REQUIRE(liquidity.count() == 2);
        REQUIRE(liquidity.aggregate_liquidity() == 1250);
        REQUIRE(liquidity.list().size() == 2);

        auto stats = liquidity.get_stats();
        REQUIRE(stats.total_pools == 2);
        REQUIRE(stats.credits == 1);
    }
}

TEST_CASE("Concurrent reservations never over-reserve", "[liquidity][concurrency]") {
    LiquidityManager liquidity;
    REQUIRE(liquidity.deposit(ETH_KALD, 1000) == errors::OK);

    constexpr int THREADS = 8;
    constexpr int ATTEMPTS = 50;
    std::atomic<int> granted{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < ATTEMPTS; ++i) {
                int32_t rc = liquidity.reserve(ETH_KALD, 7);
                if (rc == errors::OK) {
                    granted.fetch_add(1);
                } else if (rc == errors::INSUFFICIENT_LIQUIDITY) {
                    refused.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    auto pool = liquidity.get(ETH_KALD);
    REQUIRE(granted.load() == 1000 / 7);
    REQUIRE(granted.load() + refused.load() == THREADS * ATTEMPTS);
    REQUIRE(pool->available_liquidity == 1000 - 7 * (1000 / 7));
    REQUIRE(pool->available_liquidity >= 0);
}

TEST_CASE("Conservation under mixed concurrent operations", "[liquidity][concurrency]") {
    LiquidityManager liquidity;
    REQUIRE(liquidity.deposit(ETH_KALD, 10000) == errors::OK);

    std::atomic<bool> violated{false};
    auto check = [&] {
        auto pool = liquidity.get(ETH_KALD);
        if (pool->available_liquidity < 0 ||
            pool->available_liquidity > pool->total_liquidity) {
            violated.store(true);
        }
    };

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                switch ((i + t) % 5) {
                    case 0:
                        if (liquidity.reserve(ETH_KALD, 40) == errors::OK &&
                            liquidity.release(ETH_KALD, 40) != errors::OK) {
                            violated.store(true);
                        }
                        break;
                    case 1: (void)liquidity.deposit(ETH_KALD, 10); break;
                    case 2: (void)liquidity.withdraw(ETH_KALD, 10); break;
                    case 3: (void)liquidity.credit(ETH_KALD, 5); break;
                    case 4: (void)liquidity.reserve(ETH_KALD, 3); break;
                }
                check();
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE_FALSE(violated.load());
}

TEST_CASE("Pools restore from the store", "[liquidity]") {
    MemoryStore store;
    ManualClock clock;

    {
        LiquidityManager first(&store, &clock);
        REQUIRE(first.deposit(ETH_KALD, 1000) == errors::OK);
        REQUIRE(first.reserve(ETH_KALD, 200) == errors::OK);
    }

    // A corrupt record is skipped
    LiquidityPool broken;
    broken.key = POLY_KALD;
    broken.total_liquidity = 10;
    broken.available_liquidity = 20;
    REQUIRE(store.put_pool(broken));

    LiquidityManager restored(&store, &clock);
    REQUIRE(restored.restore() == 1);

    auto pool = restored.get(ETH_KALD);
    REQUIRE(pool.has_value());
    REQUIRE(pool->total_liquidity == 1000);
    REQUIRE(pool->available_liquidity == 800);
    REQUIRE_FALSE(restored.get(POLY_KALD).has_value());
}

TEST_CASE("Pool refresh touches every pool", "[liquidity]") {
    MemoryStore store;
    ManualClock clock;
    LiquidityManager liquidity(&store, &clock);
    REQUIRE(liquidity.deposit(ETH_KALD, 100) == errors::OK);

    clock.advance(60000);
    liquidity.refresh();

    REQUIRE(liquidity.get(ETH_KALD)->last_updated_ms == T0 + 60000);
    REQUIRE(store.find_pool(ETH_KALD)->last_updated_ms == T0 + 60000);
}
