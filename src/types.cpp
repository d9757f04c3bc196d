// =============================================================================
// types.cpp - Identifier encoding, U128 formatting, error strings
// =============================================================================

#include "fizzdex/types.hpp"

#include <algorithm>
#include <utility>

namespace fizzdex {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Bytes32& b) {
    std::string out;
    out.reserve(b.size() * 2);
    for (uint8_t v : b) {
        out.push_back(HEX_DIGITS[v >> 4]);
        out.push_back(HEX_DIGITS[v & 0x0F]);
    }
    return out;
}

bool from_hex(std::string_view hex, Bytes32& out) {
    std::vector<uint8_t> bytes;
    if (!from_hex(hex, bytes) || bytes.size() != out.size()) return false;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return true;
}

bool from_hex(std::string_view hex, std::vector<uint8_t>& out) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) return false;

    std::vector<uint8_t> parsed(hex.size() / 2);
    for (size_t i = 0; i < parsed.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        parsed[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = std::move(parsed);
    return true;
}

std::string short_hex(const Bytes32& b) {
    return to_hex(b).substr(0, 8);
}

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

const char* error_string(int32_t code) {
    switch (code) {
        case errors::OK:                     return "ok";
        case errors::INVALID_AMOUNT:         return "invalid amount";
        case errors::SLIPPAGE_EXCEEDED:      return "slippage tolerance exceeded";
        case errors::INSUFFICIENT_LIQUIDITY: return "insufficient liquidity";
        case errors::INVALID_ASSET_PAIR:     return "invalid asset pair";
        case errors::ARITHMETIC_OVERFLOW:    return "arithmetic overflow";
        case errors::ARITHMETIC_UNDERFLOW:   return "arithmetic underflow";
        case errors::DIVISION_BY_ZERO:       return "division by zero";
        case errors::CONTRACT_PAUSED:        return "contract is paused";
        case errors::LOCKED:                 return "record is locked (reentrancy protection)";
        case errors::UNAUTHORIZED:           return "unauthorized";
        case errors::FEE_TOO_HIGH:           return "fee too high (max 5%)";
        case errors::NOT_INITIALIZED:        return "market not initialized";
        case errors::ALREADY_EXISTS:         return "already exists";
        case errors::POOL_NOT_FOUND:         return "pool not found";
        case errors::INVALID_TIMELOCK:       return "invalid timelock";
        case errors::INVALID_SECRET:         return "invalid secret/preimage";
        case errors::ALREADY_COMPLETED:      return "swap already completed";
        case errors::ALREADY_REFUNDED:       return "swap already refunded";
        case errors::TIMELOCK_NOT_EXPIRED:   return "timelock has not yet expired";
        case errors::SWAP_NOT_FOUND:         return "swap not found";
        case errors::HASH_UNAVAILABLE:       return "hash digest unavailable";
        case errors::INVALID_NUMBER:         return "invalid number (must be 1-100)";
        case errors::COOLDOWN_ACTIVE:        return "cooldown is still active";
        case errors::NO_REWARDS:             return "no rewards to claim";
        case errors::INSUFFICIENT_BALANCE:   return "insufficient balance";
        default:                             return "unknown error";
    }
}

} // namespace fizzdex
