#ifndef FIZZDEX_TYPES_HPP
#define FIZZDEX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <limits>
#include <vector>

namespace fizzdex {

// =============================================================================
// Identifiers (32-byte ledger keys)
// =============================================================================

using Bytes32 = std::array<uint8_t, 32>;

using Address = Bytes32;   // Account / signer identity
using AssetId = Bytes32;   // Fungible asset (mint) identifier
using Hash256 = Bytes32;   // Digest output, derived record keys

using PoolId = Hash256;
using SwapId = Hash256;

using Timestamp = int64_t; // Unix seconds

inline constexpr Address ZERO_ADDRESS{};

inline bool is_zero(const Bytes32& b) {
    for (auto v : b) if (v != 0) return false;
    return true;
}

// Lowercase hex, 64 chars
std::string to_hex(const Bytes32& b);

// Parses exactly 64 hex chars (optional 0x prefix); false on malformed input
bool from_hex(std::string_view hex, Bytes32& out);

// Any even number of hex chars (optional 0x prefix); false on malformed input
bool from_hex(std::string_view hex, std::vector<uint8_t>& out);

// Short form for log lines: first 8 hex chars
std::string short_hex(const Bytes32& b);

// =============================================================================
// Wide Integers
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

// Decimal rendering for U128 (iostreams have no __int128 support)
std::string u128_to_string(U128 v);

// =============================================================================
// Checked Arithmetic
// Every helper returns false on overflow/underflow and leaves out untouched.
// =============================================================================

namespace checked {

inline bool add(uint64_t a, uint64_t b, uint64_t& out) {
    uint64_t r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool sub(uint64_t a, uint64_t b, uint64_t& out) {
    if (b > a) return false;
    out = a - b;
    return true;
}

inline bool add(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool mul(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_mul_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

inline bool add(int64_t a, int64_t b, int64_t& out) {
    int64_t r;
    if (__builtin_add_overflow(a, b, &r)) return false;
    out = r;
    return true;
}

// Narrowing: fails if v does not fit in 64 bits
inline bool to_u64(U128 v, uint64_t& out) {
    if (v > static_cast<U128>(U64_MAX)) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

} // namespace checked

// =============================================================================
// Fee Constants
// =============================================================================

namespace fees {
constexpr uint16_t BPS_DENOMINATOR = 10000;  // 100%
constexpr uint16_t MAX_FEE_BPS = 500;        // 5% ceiling
constexpr uint16_t DEFAULT_FEE_BPS = 30;     // 0.30%
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Amount / pricing
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t SLIPPAGE_EXCEEDED = -2;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -3;
constexpr int32_t INVALID_ASSET_PAIR = -4;

// Arithmetic
constexpr int32_t ARITHMETIC_OVERFLOW = -10;
constexpr int32_t ARITHMETIC_UNDERFLOW = -11;
constexpr int32_t DIVISION_BY_ZERO = -12;

// Market state / access
constexpr int32_t CONTRACT_PAUSED = -20;
constexpr int32_t LOCKED = -21;
constexpr int32_t UNAUTHORIZED = -22;
constexpr int32_t FEE_TOO_HIGH = -23;
constexpr int32_t NOT_INITIALIZED = -24;
constexpr int32_t ALREADY_EXISTS = -25;
constexpr int32_t POOL_NOT_FOUND = -26;

// Atomic swap
constexpr int32_t INVALID_TIMELOCK = -30;
constexpr int32_t INVALID_SECRET = -31;
constexpr int32_t ALREADY_COMPLETED = -32;
constexpr int32_t ALREADY_REFUNDED = -33;
constexpr int32_t TIMELOCK_NOT_EXPIRED = -34;
constexpr int32_t SWAP_NOT_FOUND = -35;
constexpr int32_t HASH_UNAVAILABLE = -36;

// Reward game
constexpr int32_t INVALID_NUMBER = -40;
constexpr int32_t COOLDOWN_ACTIVE = -41;
constexpr int32_t NO_REWARDS = -42;

// Ledger adapter
constexpr int32_t INSUFFICIENT_BALANCE = -50;
}

const char* error_string(int32_t code);

} // namespace fizzdex

#endif // FIZZDEX_TYPES_HPP
