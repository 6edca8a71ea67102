#ifndef KALD_TYPES_HPP
#define KALD_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kald {

// =============================================================================
// Fixed-Point Amounts (18 decimal places, 128-bit)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;
using Amount = I128;

constexpr Amount UNIT = 1000000000000000000LL;  // 1e18 (one whole token)

namespace amount {

// Checked arithmetic for ledger math. Returns false on overflow.
inline bool checked_add(Amount a, Amount b, Amount& out) {
    return !__builtin_add_overflow(a, b, &out);
}

inline bool checked_sub(Amount a, Amount b, Amount& out) {
    return !__builtin_sub_overflow(a, b, &out);
}

inline bool checked_mul(Amount a, Amount b, Amount& out) {
    return !__builtin_mul_overflow(a, b, &out);
}

inline Amount from_units(int64_t whole) {
    return static_cast<Amount>(whole) * UNIT;
}

inline double to_double(Amount v) {
    return static_cast<double>(v) / static_cast<double>(UNIT);
}

// Decimal rendering of the raw integer value (no scaling)
std::string to_string(Amount v);

// Parse a decimal integer string (optional leading '-'). nullopt on
// malformed input or overflow.
std::optional<Amount> parse(std::string_view text);

} // namespace amount

// =============================================================================
// Time
// =============================================================================

// Milliseconds since the Unix epoch
using TimestampMs = uint64_t;

TimestampMs wall_clock_ms();

// =============================================================================
// Pool Key (chain, asset)
// =============================================================================

struct PoolKey {
    std::string chain;
    std::string asset;

    std::string str() const { return chain + ":" + asset; }

    bool operator==(const PoolKey& other) const {
        return chain == other.chain && asset == other.asset;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
    bool operator<(const PoolKey& other) const {
        return chain < other.chain || (chain == other.chain && asset < other.asset);
    }
};

struct PoolKeyHash {
    size_t operator()(const PoolKey& key) const {
        size_t h = std::hash<std::string>{}(key.chain);
        return h * 31 + std::hash<std::string>{}(key.asset);
    }
};

// =============================================================================
// Transfer Status
// =============================================================================

enum class TransferStatus : uint8_t {
    PENDING = 0,
    CONFIRMED = 1,
    COMPLETED = 2,
    FAILED = 3,
    REFUNDED = 4
};

inline bool is_terminal(TransferStatus s) {
    return s == TransferStatus::COMPLETED ||
           s == TransferStatus::FAILED ||
           s == TransferStatus::REFUNDED;
}

const char* to_string(TransferStatus s);
std::optional<TransferStatus> parse_status(std::string_view text);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNSUPPORTED_CHAIN = -1;
constexpr int32_t AMOUNT_OUT_OF_RANGE = -2;
constexpr int32_t INVALID_SIGNATURE = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t NOT_PENDING = -5;
constexpr int32_t NOT_CONFIRMED = -6;
constexpr int32_t POOL_NOT_FOUND = -10;
constexpr int32_t TRANSFER_NOT_FOUND = -11;
constexpr int32_t INVALID_AMOUNT = -12;
constexpr int32_t AMOUNT_OVERFLOW = -13;
constexpr int32_t NOT_EXPIRED = -14;
constexpr int32_t NOT_FAILED = -15;
constexpr int32_t CHAIN_ALREADY_REGISTERED = -20;
constexpr int32_t INVALID_CHAIN = -21;
constexpr int32_t REGISTRY_SEALED = -22;
constexpr int32_t STORE_FAILURE = -30;

const char* describe(int32_t code);
}

} // namespace kald

#endif // KALD_TYPES_HPP
