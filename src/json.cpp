// =============================================================================
// json.cpp - JSON rendering of bridge records
// =============================================================================

#include "kald/json.hpp"

namespace kald {

void to_json(nlohmann::json& j, const BridgeTransfer& transfer) {
    j = nlohmann::json{
        {"id", transfer.id},
        {"source_chain", transfer.source_chain},
        {"dest_chain", transfer.dest_chain},
        {"from_address", transfer.from_address},
        {"to_address", transfer.to_address},
        {"asset", transfer.asset},
        {"amount", amount::to_string(transfer.amount)},
        {"bridge_fee", amount::to_string(transfer.bridge_fee)},
        {"status", to_string(transfer.status)},
        {"created_at_ms", transfer.created_at_ms},
        {"source_tx_ref", transfer.source_tx_ref},
        {"confirmations", transfer.confirmations},
        {"required_confirmations", transfer.required_confirmations},
        {"timeout_deadline_ms", transfer.timeout_deadline_ms},
    };

    if (transfer.timeout_height != 0) {
        j["timeout_height"] = transfer.timeout_height;
    }
    if (transfer.completed_at_ms != 0) {
        j["completed_at_ms"] = transfer.completed_at_ms;
    }
    if (transfer.dest_tx_ref) {
        j["dest_tx_ref"] = *transfer.dest_tx_ref;
    } else {
        j["dest_tx_ref"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const LiquidityPool& pool) {
    j = nlohmann::json{
        {"chain", pool.key.chain},
        {"asset", pool.key.asset},
        {"total_liquidity", amount::to_string(pool.total_liquidity)},
        {"available_liquidity", amount::to_string(pool.available_liquidity)},
        {"utilization_rate", pool.utilization_rate()},
        {"last_updated_ms", pool.last_updated_ms},
    };
}

void to_json(nlohmann::json& j, const SettlementStatistics& stats) {
    j = nlohmann::json{
        {"total_transfers", stats.total_transfers},
        {"completed", stats.completed},
        {"failed", stats.failed},
        {"refunded", stats.refunded},
        {"total_volume", amount::to_string(stats.total_volume)},
        {"total_fees", amount::to_string(stats.total_fees)},
        {"average_completion_ms", stats.average_completion_ms},
        {"success_rate", stats.success_rate},
        {"active_pools", stats.active_pools},
        {"total_liquidity", amount::to_string(stats.total_liquidity)},
        {"updated_at_ms", stats.updated_at_ms},
    };
}

void to_json(nlohmann::json& j, const ChainDescriptor& chain) {
    j = nlohmann::json{
        {"id", chain.id},
        {"name", chain.name},
        {"family", to_string(chain.family)},
        {"network_chain_id", chain.network_chain_id},
        {"rpc_endpoint", chain.rpc_endpoint},
        {"native_asset", chain.native_asset},
        {"block_time_ms", chain.block_time_ms},
        {"bridge_contract", chain.bridge_contract},
        {"is_testnet", chain.is_testnet},
        {"required_confirmations", chain.required_confirmations},
    };
}

} // namespace kald
