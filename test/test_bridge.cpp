// kaldbridge - Bridge facade tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <kald/bridge.hpp>
#include <kald/json.hpp>

#include "test_support.hpp"

using namespace kald;
using namespace kald::test;
using Catch::Approx;

namespace {

struct BridgeFixture {
    FlakyStore store;
    ManualClock clock;
    MockVerifier verifier;
    ScriptedExecutor executor;

    BridgeConfig make_config() {
        ChainDescriptor kald_chain;
        kald_chain.id = "kald";
        kald_chain.name = "Kald";
        kald_chain.family = ChainFamily::COSMOS;
        kald_chain.block_time_ms = 5000;
        kald_chain.native_asset = "KALD";
        kald_chain.required_confirmations = 2;

        return BridgeConfig().with_chain(kald_chain);
    }

    TransferIntent intent(Amount amount, const std::string& source, const std::string& dest) {
        TransferIntent i;
        i.source_chain = source;
        i.dest_chain = dest;
        i.from_address = "0xsender";
        i.to_address = "kald1recipient";
        i.amount = amount;
        i.asset = "KALD";
        i.signature = "sig";
        return i;
    }
};

} // namespace

TEST_CASE("Bridge loads the chain table", "[bridge]") {
    BridgeFixture f;
    Bridge bridge(f.make_config(), f.verifier, f.executor, f.store, f.clock);
    bridge.load();

    REQUIRE(bridge.registry().sealed());
    REQUIRE(bridge.registry().size() == 5);
    REQUIRE(bridge.get_chain("kald")->required_confirmations == 2);
    REQUIRE(bridge.get_chain("polygon")->block_time_ms == 2000);
    REQUIRE_FALSE(bridge.get_chain("solana").has_value());

    // Descriptors are persisted
    REQUIRE(f.store.find_chain("kald").has_value());
    REQUIRE(f.store.find_chain("ethereum").has_value());

    // Second load is a no-op
    bridge.load();
    REQUIRE(bridge.registry().size() == 5);
}

TEST_CASE("Bridge liquidity operations", "[bridge]") {
    BridgeFixture f;
    Bridge bridge(f.make_config(), f.verifier, f.executor, f.store, f.clock);
    bridge.load();

    REQUIRE(bridge.add_liquidity("ethereum", "KALD", 1000 * UNIT, "lp-1") == errors::OK);
    REQUIRE(bridge.add_liquidity("solana", "KALD", UNIT, "lp-1") == errors::UNSUPPORTED_CHAIN);
    REQUIRE(bridge.remove_liquidity("solana", "KALD", UNIT, "lp-1") == errors::UNSUPPORTED_CHAIN);
    REQUIRE(bridge.remove_liquidity("ethereum", "KALD", 400 * UNIT, "lp-1") == errors::OK);
    REQUIRE(bridge.remove_liquidity("ethereum", "KALD", 601 * UNIT, "lp-1") ==
            errors::INSUFFICIENT_LIQUIDITY);
    REQUIRE(bridge.remove_liquidity("polygon", "KALD", UNIT, "lp-1") == errors::POOL_NOT_FOUND);

    auto pool = bridge.get_pool("ethereum", "KALD");
    REQUIRE(pool.has_value());
    REQUIRE(pool->total_liquidity == 600 * UNIT);
    REQUIRE_FALSE(bridge.get_pool("polygon", "KALD").has_value());
}

TEST_CASE("Bridge end-to-end transfer", "[bridge]") {
    BridgeFixture f;
    f.executor.mode = ScriptedExecutor::Mode::DEFER;
    Bridge bridge(f.make_config(), f.verifier, f.executor, f.store, f.clock);
    bridge.load();
    REQUIRE(bridge.add_liquidity("kald", "KALD", 1000 * UNIT, "lp-1") == errors::OK);

    BridgeTransfer transfer;
    REQUIRE(bridge.initiate(f.intent(100 * UNIT, "kald", "ethereum"), transfer) == errors::OK);
    REQUIRE(transfer.required_confirmations == 2);
    REQUIRE(transfer.timeout_deadline_ms == T0 + 5000ULL * 1000);
    REQUIRE(bridge.list_pending_transfers().size() == 1);
    REQUIRE(bridge.get_pool("kald", "KALD")->available_liquidity == 900 * UNIT);

    REQUIRE(bridge.confirm(transfer.id, "0xsrc", 2) == errors::OK);
    REQUIRE(bridge.get_transfer(transfer.id)->status == TransferStatus::CONFIRMED);

    f.clock.advance(10000);
    REQUIRE(bridge.complete_from_external_proof(transfer.id, "0xdest") == errors::OK);
    REQUIRE(bridge.get_transfer(transfer.id)->status == TransferStatus::COMPLETED);
    REQUIRE(bridge.list_pending_transfers().empty());
    REQUIRE(bridge.confirm(transfer.id, "0xsrc", 3) == errors::NOT_PENDING);

    REQUIRE(bridge.stats().refresh());
    auto stats = bridge.get_stats();
    REQUIRE(stats.completed == 1);
    REQUIRE(stats.total_volume == 100 * UNIT);
    REQUIRE(stats.average_completion_ms == Approx(10000.0));
    REQUIRE(stats.success_rate == Approx(1.0));
}

TEST_CASE("Bridge restarts from the store", "[bridge]") {
    BridgeFixture f;
    f.executor.mode = ScriptedExecutor::Mode::DEFER;
    std::string id;

    {
        Bridge bridge(f.make_config(), f.verifier, f.executor, f.store, f.clock);
        bridge.load();
        REQUIRE(bridge.add_liquidity("ethereum", "KALD", 1000 * UNIT, "lp-1") == errors::OK);

        BridgeTransfer transfer;
        REQUIRE(bridge.initiate(f.intent(100 * UNIT, "ethereum", "kald"), transfer) == errors::OK);
        id = transfer.id;
    }

    Bridge bridge(f.make_config(), f.verifier, f.executor, f.store, f.clock);
    bridge.load();

    REQUIRE(bridge.get_pool("ethereum", "KALD")->available_liquidity == 900 * UNIT);
    REQUIRE(bridge.list_pending_transfers().size() == 1);

    // Timeout after restart returns the reservation
    f.clock.advance(12000ULL * 1000);
    REQUIRE(bridge.monitor().scan() == 1);
    REQUIRE(bridge.get_transfer(id)->status == TransferStatus::REFUNDED);
    REQUIRE(bridge.get_pool("ethereum", "KALD")->available_liquidity == 1000 * UNIT);
}

TEST_CASE("Bridge background loops start and stop", "[bridge]") {
    BridgeFixture f;
    auto config = f.make_config();
    config.set_intervals(5, 5, 5);

    Bridge bridge(config, f.verifier, f.executor, f.store, f.clock);
    bridge.start();
    REQUIRE(bridge.is_running());
    REQUIRE(bridge.registry().sealed());
    REQUIRE(bridge.monitor().is_running());

    bridge.stop();
    REQUIRE_FALSE(bridge.is_running());
    REQUIRE_FALSE(bridge.monitor().is_running());
}

TEST_CASE("Bridge rejects an inconsistent configuration", "[bridge]") {
    BridgeFixture f;
    auto config = f.make_config();
    config.set_bridge_fee(0);
    REQUIRE_THROWS_AS(Bridge(config, f.verifier, f.executor, f.store, f.clock), ConfigError);
}

TEST_CASE("JSON rendering keeps full precision", "[bridge][json]") {
    BridgeTransfer transfer;
    transfer.id = "bridge_1_1";
    transfer.source_chain = "ethereum";
    transfer.dest_chain = "polygon";
    transfer.asset = "KALD";
    transfer.amount = amount::from_units(10000);
    transfer.bridge_fee = UNIT / 10;
    transfer.status = TransferStatus::CONFIRMED;

    nlohmann::json j = transfer;
    REQUIRE(j["amount"] == "10000000000000000000000");
    REQUIRE(j["bridge_fee"] == "100000000000000000");
    REQUIRE(j["status"] == "confirmed");
    REQUIRE(j["dest_tx_ref"].is_null());

    LiquidityPool pool;
    pool.key = PoolKey{"ethereum", "KALD"};
    pool.total_liquidity = 4 * UNIT;
    pool.available_liquidity = 3 * UNIT;

    nlohmann::json p = pool;
    REQUIRE(p["chain"] == "ethereum");
    REQUIRE(p["available_liquidity"] == "3000000000000000000");
    REQUIRE(p["utilization_rate"].get<double>() == Approx(0.25));

    nlohmann::json c = *ChainRegistry::defaults({"avalanche"}).begin();
    REQUIRE(c["network_chain_id"] == 43114);
    REQUIRE(c["family"] == "EVM");
}
