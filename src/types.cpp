// =============================================================================
// types.cpp - Fixed-point arithmetic, address and error-code helpers
// =============================================================================

#include "lendx/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace lendx {

// =============================================================================
// 256-bit intermediate
// =============================================================================

namespace {

struct U256 {
    U128 hi;
    U128 lo;
};

constexpr U128 LOW64 = (static_cast<U128>(1) << 64) - 1;

U256 mul_wide(U128 a, U128 b) {
    U128 a0 = a & LOW64, a1 = a >> 64;
    U128 b0 = b & LOW64, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & LOW64) + (p10 & LOW64);

    U256 r;
    r.lo = (mid << 64) | (p00 & LOW64);
    r.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
    return r;
}

U256 mul_wide(const U256& x, U128 b) {
    U256 low = mul_wide(x.lo, b);
    U256 high = mul_wide(x.hi, b);
    if (high.hi != 0) {
        throw std::overflow_error("x18: 256-bit product overflow");
    }
    U256 r;
    r.lo = low.lo;
    r.hi = low.hi + high.lo;
    if (r.hi < high.lo) {
        throw std::overflow_error("x18: 256-bit product overflow");
    }
    return r;
}

bool less(const U256& a, const U256& b) {
    return a.hi != b.hi ? a.hi < b.hi : a.lo < b.lo;
}

U256 sub(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    r.hi = a.hi - b.hi - (a.lo < b.lo ? 1 : 0);
    return r;
}

// Restoring long division. Denominators here are products of two I128
// values (< 2^254), so the running remainder never loses its top bit.
U256 div_wide(const U256& n, const U256& d) {
    if (d.hi == 0 && n.hi == 0) {
        return U256{0, n.lo / d.lo};
    }

    U256 q{0, 0};
    U256 r{0, 0};
    for (int i = 255; i >= 0; --i) {
        r.hi = (r.hi << 1) | (r.lo >> 127);
        r.lo <<= 1;
        U128 bit = i >= 128 ? (n.hi >> (i - 128)) & 1 : (n.lo >> i) & 1;
        r.lo |= bit;
        if (!less(r, d)) {
            r = sub(r, d);
            if (i >= 128) q.hi |= static_cast<U128>(1) << (i - 128);
            else q.lo |= static_cast<U128>(1) << i;
        }
    }
    return q;
}

I128 narrow(const U256& q) {
    if (q.hi != 0 || q.lo > static_cast<U128>(I128_MAX)) {
        throw std::overflow_error("x18: result exceeds 128 bits");
    }
    return static_cast<I128>(q.lo);
}

void check_operands(I128 a, I128 b) {
    if (a < 0 || b < 0) {
        throw std::invalid_argument("x18: negative operand");
    }
}

} // namespace

namespace x18 {

I128 mul_div(I128 a, I128 b, I128 d) {
    check_operands(a, b);
    if (d <= 0) {
        throw std::invalid_argument("x18: non-positive divisor");
    }
    U256 p = mul_wide(static_cast<U128>(a), static_cast<U128>(b));
    return narrow(div_wide(p, U256{0, static_cast<U128>(d)}));
}

I128 mul_div(I128 a, I128 b, I128 c, I128 d1, I128 d2) {
    check_operands(a, b);
    check_operands(c, 0);
    if (d1 <= 0 || d2 <= 0) {
        throw std::invalid_argument("x18: non-positive divisor");
    }
    U256 p = mul_wide(mul_wide(static_cast<U128>(a), static_cast<U128>(b)),
                      static_cast<U128>(c));
    U256 den = mul_wide(static_cast<U128>(d1), static_cast<U128>(d2));
    return narrow(div_wide(p, den));
}

std::optional<I128> parse_decimal(std::string_view text) {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    U128 int_part = 0;
    U128 frac_part = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    constexpr U128 limit = static_cast<U128>(I128_MAX);

    for (char c : text) {
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (c == '_') continue;
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;
        U128 digit = static_cast<U128>(c - '0');
        if (!seen_dot) {
            if (int_part > (limit - digit) / 10) return std::nullopt;
            int_part = int_part * 10 + digit;
        } else if (frac_digits < 18) {
            frac_part = frac_part * 10 + digit;
            ++frac_digits;
        }
    }
    if (!seen_digit) return std::nullopt;

    for (int i = frac_digits; i < 18; ++i) frac_part *= 10;

    constexpr U128 one = static_cast<U128>(X18_ONE);
    if (int_part > (limit - frac_part) / one) return std::nullopt;

    I128 value = static_cast<I128>(int_part * one + frac_part);
    return negative ? -value : value;
}

std::string to_string(I128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    U128 u = negative ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
    std::string out;
    while (u > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<I128> parse_int(std::string_view text) {
    if (text.empty()) return std::nullopt;
    bool negative = false;
    if (text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
        if (text.empty()) return std::nullopt;
    }
    constexpr U128 limit = static_cast<U128>(I128_MAX);
    U128 u = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (u > (limit - digit) / 10) return std::nullopt;
        u = u * 10 + digit;
    }
    I128 value = static_cast<I128>(u);
    return negative ? -value : value;
}

std::string format(I128 v) {
    bool negative = v < 0;
    if (negative) v = -v;
    std::string out = to_string(v / X18_ONE);
    I128 frac = v % X18_ONE;
    if (frac != 0) {
        std::string digits = to_string(frac);
        digits.insert(0, 18 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return negative ? "-" + out : out;
}

} // namespace x18

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_AMOUNT: return "invalid amount";
        case ASSET_NOT_ACTIVE: return "asset not active";
        case ASSET_ALREADY_REGISTERED: return "asset already registered";
        case INVALID_RISK_PARAMETERS: return "invalid risk parameters";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case INSUFFICIENT_COLLATERAL: return "insufficient collateral";
        case NO_COLLATERAL_OR_NO_DEBT: return "no collateral or no debt";
        case MARKET_NOT_FOUND: return "market not found";
        case SELF_LIQUIDATION_DISALLOWED: return "self liquidation disallowed";
        case NOT_LIQUIDATABLE: return "not liquidatable";
        case SEIZE_EXCEEDS_COLLATERAL: return "seize exceeds collateral";
        case INVALID_PRICE: return "invalid price";
        case TRANSFER_FAILED: return "transfer failed";
        case REENTRANCY: return "reentrancy";
        case PAUSED: return "paused";
        case ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case SNAPSHOT_IO: return "snapshot io";
        default: return "unknown error";
    }
}

} // namespace errors

} // namespace lendx
