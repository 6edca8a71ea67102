// kald-bridged - cross-chain bridge daemon
//
// Loads a JSON config, starts the background loops and serves line commands
// on stdin. Every reply is a single JSON document on stdout.

#include "kald/bridge.hpp"
#include "kald/json.hpp"
#include "kald/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::set<std::string> signers;
    std::string log_level;
};

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
kald-bridged commands:

  deposit <chain> <asset> <amount> <provider>
  withdraw <chain> <asset> <amount> <provider>
  initiate <source> <dest> <from> <to> <amount> <asset> <signature>
  confirm <transfer_id> <source_tx_ref> <confirmations>
  complete <transfer_id> <dest_tx_ref>
  ack <transfer_id>
  transfer <transfer_id>
  pending
  pool <chain> <asset>
  chain <chain_id>
  stats

  help
  quit / exit

Amounts are integer base units (18 decimals).
)";
}

void print_result(int32_t rc, json payload = nullptr) {
    json out;
    if (rc == kald::errors::OK) {
        out["ok"] = true;
        if (!payload.is_null()) out["result"] = std::move(payload);
    } else {
        out["ok"] = false;
        out["error"] = kald::errors::describe(rc);
        out["code"] = rc;
    }
    std::cout << out.dump() << "\n";
}

void print_error(const std::string& message) {
    std::cout << json{{"ok", false}, {"error", message}}.dump() << "\n";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parse_amount(const std::string& text, kald::Amount& out) {
    auto parsed = kald::amount::parse(text);
    if (!parsed || *parsed <= 0) {
        print_error("invalid amount: " + text);
        return false;
    }
    out = *parsed;
    return true;
}

bool usage(const std::vector<std::string>& parts, size_t n, const char* text) {
    if (parts.size() >= n) return true;
    print_error(std::string("usage: ") + text);
    return false;
}

void run_interactive(kald::Bridge& bridge) {
    std::string line;
    while (std::getline(std::cin, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto parts = split(line);
        std::string cmd = parts[0];
        for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (cmd == "help") {
            print_help();
        } else if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "deposit" || cmd == "withdraw") {
            if (!usage(parts, 5, "deposit|withdraw <chain> <asset> <amount> <provider>")) continue;
            kald::Amount amount = 0;
            if (!parse_amount(parts[3], amount)) continue;
            int32_t rc = cmd == "deposit"
                ? bridge.add_liquidity(parts[1], parts[2], amount, parts[4])
                : bridge.remove_liquidity(parts[1], parts[2], amount, parts[4]);
            auto pool = bridge.get_pool(parts[1], parts[2]);
            print_result(rc, pool ? json(*pool) : json(nullptr));
        } else if (cmd == "initiate") {
            if (!usage(parts, 8, "initiate <source> <dest> <from> <to> <amount> <asset> <signature>")) continue;
            kald::TransferIntent intent;
            intent.source_chain = parts[1];
            intent.dest_chain = parts[2];
            intent.from_address = parts[3];
            intent.to_address = parts[4];
            if (!parse_amount(parts[5], intent.amount)) continue;
            intent.asset = parts[6];
            intent.signature = parts[7];

            kald::BridgeTransfer transfer;
            int32_t rc = bridge.initiate(intent, transfer);
            print_result(rc, rc == kald::errors::OK ? json(transfer) : json(nullptr));
        } else if (cmd == "confirm") {
            if (!usage(parts, 4, "confirm <transfer_id> <source_tx_ref> <confirmations>")) continue;
            uint32_t confirmations = 0;
            try {
                confirmations = static_cast<uint32_t>(std::stoul(parts[3]));
            } catch (const std::exception& e) {
                print_error(std::string("invalid confirmation count: ") + e.what());
                continue;
            }
            int32_t rc = bridge.confirm(parts[1], parts[2], confirmations);
            auto transfer = bridge.get_transfer(parts[1]);
            print_result(rc, transfer ? json(*transfer) : json(nullptr));
        } else if (cmd == "complete") {
            if (!usage(parts, 3, "complete <transfer_id> <dest_tx_ref>")) continue;
            int32_t rc = bridge.complete_from_external_proof(parts[1], parts[2]);
            auto transfer = bridge.get_transfer(parts[1]);
            print_result(rc, transfer ? json(*transfer) : json(nullptr));
        } else if (cmd == "ack") {
            if (!usage(parts, 2, "ack <transfer_id>")) continue;
            print_result(bridge.acknowledge_failed(parts[1]));
        } else if (cmd == "transfer") {
            if (!usage(parts, 2, "transfer <transfer_id>")) continue;
            auto transfer = bridge.get_transfer(parts[1]);
            print_result(transfer ? kald::errors::OK : kald::errors::TRANSFER_NOT_FOUND,
                         transfer ? json(*transfer) : json(nullptr));
        } else if (cmd == "pending") {
            print_result(kald::errors::OK, json(bridge.list_pending_transfers()));
        } else if (cmd == "pool") {
            if (!usage(parts, 3, "pool <chain> <asset>")) continue;
            auto pool = bridge.get_pool(parts[1], parts[2]);
            print_result(pool ? kald::errors::OK : kald::errors::POOL_NOT_FOUND,
                         pool ? json(*pool) : json(nullptr));
        } else if (cmd == "chain") {
            if (!usage(parts, 2, "chain <chain_id>")) continue;
            auto chain = bridge.get_chain(parts[1]);
            print_result(chain ? kald::errors::OK : kald::errors::UNSUPPORTED_CHAIN,
                         chain ? json(*chain) : json(nullptr));
        } else if (cmd == "stats") {
            print_result(kald::errors::OK, json(bridge.get_stats()));
        } else {
            print_error("unknown command: " + cmd + " (try 'help')");
        }
        std::cout.flush();
    }
}

void print_usage(const char* prog) {
    std::cout << "kald-bridged - cross-chain bridge daemon\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     JSON configuration file\n"
              << "  -a, --allow <address>   Accept signatures from address (repeatable)\n"
              << "  -l, --log-level <level> Override log level (trace..fatal, off)\n"
              << "  -h, --help              Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-a" || arg == "--allow") {
            if (i + 1 >= argc) {
                std::cerr << "Missing address argument\n";
                std::exit(1);
            }
            options.signers.insert(argv[++i]);
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }

    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    kald::BridgeConfig config;
    try {
        if (!options.config_path.empty()) {
            config = kald::BridgeConfig::from_file(options.config_path);
        }
    } catch (const kald::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::string level_name = options.log_level.empty() ? config.log_level : options.log_level;
    auto level = kald::parse_log_level(level_name);
    if (!level) {
        std::cerr << "Unknown log level: " << level_name << "\n";
        return 1;
    }
    kald::logging::set_threshold(*level);

    kald::MemoryStore store;
    kald::SystemClock clock;
    kald::DeferredExecutor executor;
    if (options.signers.empty()) {
        std::cerr << "No --allow signers given; every transfer will be rejected\n";
    }
    kald::AllowListVerifier verifier(options.signers);

    kald::Bridge bridge(config, verifier, executor, store, clock);
    bridge.start();

    run_interactive(bridge);

    bridge.stop();
    return 0;
}
