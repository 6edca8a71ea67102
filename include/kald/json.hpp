#ifndef KALD_JSON_HPP
#define KALD_JSON_HPP

#include <nlohmann/json.hpp>

#include "records.hpp"
#include "registry.hpp"

namespace kald {

// nlohmann adapters (found by ADL). Amounts render as decimal strings so no
// precision is lost above 2^53.

void to_json(nlohmann::json& j, const BridgeTransfer& transfer);
void to_json(nlohmann::json& j, const LiquidityPool& pool);
void to_json(nlohmann::json& j, const SettlementStatistics& stats);
void to_json(nlohmann::json& j, const ChainDescriptor& chain);

} // namespace kald

#endif // KALD_JSON_HPP
