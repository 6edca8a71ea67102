// =============================================================================
// config.cpp - Bridge configuration loading (JSON)
// =============================================================================

#include "kald/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace kald {

namespace {

using nlohmann::json;

// Amounts are decimal strings; plain integers are accepted when they fit
Amount read_amount(const json& doc, const char* key, Amount fallback) {
    auto it = doc.find(key);
    if (it == doc.end()) return fallback;

    if (it->is_string()) {
        auto parsed = amount::parse(it->get<std::string>());
        if (!parsed) {
            throw ConfigError(std::string("invalid amount for '") + key + "': " +
                              it->get<std::string>());
        }
        return *parsed;
    }
    if (it->is_number_integer()) {
        return static_cast<Amount>(it->get<int64_t>());
    }
    throw ConfigError(std::string("'") + key + "' must be a decimal string");
}

template <typename T>
T read_value(const json& doc, const char* key, T fallback) {
    auto it = doc.find(key);
    if (it == doc.end()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

ChainDescriptor read_chain(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("chain entries must be objects");
    }

    ChainDescriptor desc;
    desc.id = read_value<std::string>(doc, "id", "");
    if (desc.id.empty()) {
        throw ConfigError("chain entry is missing 'id'");
    }

    desc.name = read_value<std::string>(doc, "name", desc.id);
    std::string family = read_value<std::string>(doc, "family", "EVM");
    auto parsed = parse_chain_family(family);
    if (!parsed) {
        throw ConfigError("unknown chain family '" + family + "' for " + desc.id);
    }
    desc.family = *parsed;
    desc.network_chain_id = read_value<uint64_t>(doc, "network_chain_id", 0);
    desc.rpc_endpoint = read_value<std::string>(doc, "rpc_endpoint", "");
    desc.native_asset = read_value<std::string>(doc, "native_asset", "");
    desc.block_time_ms = read_value<uint64_t>(doc, "block_time_ms", 0);
    desc.bridge_contract = read_value<std::string>(doc, "bridge_contract", "");
    desc.is_testnet = read_value<bool>(doc, "is_testnet", false);
    desc.required_confirmations = read_value<uint32_t>(doc, "required_confirmations", 0);
    return desc;
}

}  // namespace

BridgeConfig BridgeConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

BridgeConfig BridgeConfig::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }

    if (!doc.is_object()) {
        throw ConfigError("config root must be an object");
    }

    BridgeConfig config;

    config.min_transfer_amount = read_amount(doc, "min_transfer_amount", config.min_transfer_amount);
    config.max_transfer_amount = read_amount(doc, "max_transfer_amount", config.max_transfer_amount);
    config.bridge_fee = read_amount(doc, "bridge_fee", config.bridge_fee);
    config.confirmation_blocks = read_value(doc, "confirmation_blocks", config.confirmation_blocks);
    config.timeout_blocks = read_value(doc, "timeout_blocks", config.timeout_blocks);
    config.credit_net_of_fee = read_value(doc, "credit_net_of_fee", config.credit_net_of_fee);

    config.monitor_interval_ms = read_value(doc, "monitor_interval_ms", config.monitor_interval_ms);
    config.pool_refresh_interval_ms =
        read_value(doc, "pool_refresh_interval_ms", config.pool_refresh_interval_ms);
    config.stats_interval_ms = read_value(doc, "stats_interval_ms", config.stats_interval_ms);

    config.log_level = read_value(doc, "log_level", config.log_level);
    config.supported_chains = read_value(doc, "supported_chains", config.supported_chains);

    auto chains = doc.find("chains");
    if (chains != doc.end()) {
        if (!chains->is_array()) {
            throw ConfigError("'chains' must be an array");
        }
        for (const auto& entry : *chains) {
            config.chains.push_back(read_chain(entry));
        }
    }

    config.validate();
    return config;
}

void BridgeConfig::validate() const {
    if (bridge_fee <= 0) {
        throw ConfigError("bridge_fee must be positive");
    }
    if (bridge_fee >= min_transfer_amount) {
        throw ConfigError("bridge_fee must be below min_transfer_amount");
    }
    if (min_transfer_amount > max_transfer_amount) {
        throw ConfigError("min_transfer_amount exceeds max_transfer_amount");
    }
    if (confirmation_blocks < 1) {
        throw ConfigError("confirmation_blocks must be at least 1");
    }
    if (timeout_blocks < 1) {
        throw ConfigError("timeout_blocks must be at least 1");
    }
    if (monitor_interval_ms == 0 || pool_refresh_interval_ms == 0 || stats_interval_ms == 0) {
        throw ConfigError("loop intervals must be non-zero");
    }
    for (const auto& chain : chains) {
        if (chain.block_time_ms == 0) {
            throw ConfigError("chain " + chain.id + " needs a non-zero block_time_ms");
        }
    }
}

} // namespace kald
