#ifndef LENDX_TYPES_HPP
#define LENDX_TYPES_HPP

#include <cstdint>
#include <array>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lendx {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Build an address whose last two bytes carry `n` (test and config helper)
constexpr Address from_index(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without the 0x prefix; nullopt on bad length or digit
std::optional<Address> from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;  // 0.5e18
constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// a + b; throws std::overflow_error when the sum leaves I128
inline I128 add(I128 a, I128 b) {
    I128 sum;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw std::overflow_error("x18::add overflow");
    }
    return sum;
}

// floor(a * b / d) through a 256-bit intermediate.
// Operands must be non-negative and d positive; throws std::overflow_error
// when the quotient does not fit in I128.
I128 mul_div(I128 a, I128 b, I128 d);

// floor(a * b * c / (d1 * d2)), single rounding step.
I128 mul_div(I128 a, I128 b, I128 c, I128 d1, I128 d2);

// Exact decimal parse: "1.08" -> 1080000000000000000. Digits past the 18th
// fractional place are truncated. nullopt on malformed input or overflow.
std::optional<I128> parse_decimal(std::string_view text);

// Raw integer formatting of the underlying I128 (no scaling)
std::string to_string(I128 v);
std::optional<I128> parse_int(std::string_view text);

// "1.5" style rendering of an X18 value, trailing zeros dropped
std::string format(I128 v);

} // namespace x18

// =============================================================================
// Asset Identifier (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Account Identifier
// =============================================================================

struct Account {
    Address main;           // Main wallet address
    uint16_t subaccount_id; // Subaccount number (0 = default)

    bool operator==(const Account& other) const {
        return main == other.main && subaccount_id == other.subaccount_id;
    }
    bool operator!=(const Account& other) const { return !(*this == other); }
    bool operator<(const Account& other) const {
        if (main != other.main) return main < other.main;
        return subaccount_id < other.subaccount_id;
    }

    uint64_t hash() const {
        uint64_t h = subaccount_id;
        for (auto b : main) h = h * 31 + b;
        return h;
    }
};

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {
constexpr I128 SCALE = X18_ONE;
constexpr I128 CLOSE_FACTOR_X18 = X18_HALF;                       // 50%
constexpr I128 LIQUIDATION_INCENTIVE_X18 = 1080000000000000000LL; // 108%
constexpr uint64_t SECONDS_PER_YEAR = 31536000;
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t ASSET_NOT_ACTIVE = -2;
constexpr int32_t ASSET_ALREADY_REGISTERED = -3;
constexpr int32_t INVALID_RISK_PARAMETERS = -4;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_COLLATERAL = -11;
constexpr int32_t NO_COLLATERAL_OR_NO_DEBT = -12;
constexpr int32_t MARKET_NOT_FOUND = -14;
constexpr int32_t SELF_LIQUIDATION_DISALLOWED = -15;
constexpr int32_t NOT_LIQUIDATABLE = -16;
constexpr int32_t SEIZE_EXCEEDS_COLLATERAL = -17;
constexpr int32_t INVALID_PRICE = -22;
constexpr int32_t TRANSFER_FAILED = -25;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t PAUSED = -31;
constexpr int32_t ARITHMETIC_OVERFLOW = -35;
constexpr int32_t SNAPSHOT_IO = -50;

const char* to_string(int32_t code);
}

} // namespace lendx

#endif // LENDX_TYPES_HPP
