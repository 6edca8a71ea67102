// =============================================================================
// types.cpp - Amount formatting, status names, error descriptions
// =============================================================================

#include "kald/types.hpp"
#include <algorithm>
#include <chrono>

namespace kald {

namespace amount {

std::string to_string(Amount v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    // Work in unsigned space so INT128_MIN renders correctly
    U128 mag = negative ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);

    std::string digits;
    while (mag > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (negative) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::optional<Amount> parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    size_t i = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        i = 1;
        if (text.size() == 1) return std::nullopt;
    }

    Amount value = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return std::nullopt;
        Amount digit = c - '0';
        if (!checked_mul(value, 10, value)) return std::nullopt;
        if (negative) {
            if (!checked_sub(value, digit, value)) return std::nullopt;
        } else {
            if (!checked_add(value, digit, value)) return std::nullopt;
        }
    }
    return value;
}

} // namespace amount

TimestampMs wall_clock_ms() {
    return static_cast<TimestampMs>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

const char* to_string(TransferStatus s) {
    switch (s) {
        case TransferStatus::PENDING:   return "pending";
        case TransferStatus::CONFIRMED: return "confirmed";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED:    return "failed";
        case TransferStatus::REFUNDED:  return "refunded";
    }
    return "unknown";
}

std::optional<TransferStatus> parse_status(std::string_view text) {
    if (text == "pending") return TransferStatus::PENDING;
    if (text == "confirmed") return TransferStatus::CONFIRMED;
    if (text == "completed") return TransferStatus::COMPLETED;
    if (text == "failed") return TransferStatus::FAILED;
    if (text == "refunded") return TransferStatus::REFUNDED;
    return std::nullopt;
}

namespace errors {

const char* describe(int32_t code) {
    switch (code) {
        case OK:                       return "ok";
        case UNSUPPORTED_CHAIN:        return "unsupported chain";
        case AMOUNT_OUT_OF_RANGE:      return "transfer amount out of range";
        case INVALID_SIGNATURE:        return "invalid signature";
        case INSUFFICIENT_LIQUIDITY:   return "insufficient liquidity";
        case NOT_PENDING:              return "transfer is not pending";
        case NOT_CONFIRMED:            return "transfer is not confirmed";
        case POOL_NOT_FOUND:           return "liquidity pool not found";
        case TRANSFER_NOT_FOUND:       return "transfer not found";
        case INVALID_AMOUNT:           return "amount must be positive";
        case AMOUNT_OVERFLOW:          return "amount overflow";
        case NOT_EXPIRED:              return "transfer has not timed out";
        case NOT_FAILED:               return "transfer is not failed";
        case CHAIN_ALREADY_REGISTERED: return "chain already registered";
        case INVALID_CHAIN:            return "invalid chain descriptor";
        case REGISTRY_SEALED:          return "chain registry is sealed";
        case STORE_FAILURE:            return "record store failure";
        default:                       return "unknown error";
    }
}

} // namespace errors

} // namespace kald
