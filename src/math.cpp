// =============================================================================
// math.cpp - Checked 128-bit arithmetic for share conversions
// =============================================================================

#include "backstop/math.hpp"

namespace backstop {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Divide U256 by U128. Requires num.hi < denom so the quotient fits in U128.
inline U128 div_u256_u128(U256 num, U128 denom) {
    if (num.hi == 0) return num.lo / denom;

    // Restoring long division over the low limb; the high limb seeds the
    // remainder since it is already smaller than denom.
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;  // Wraps back into range when carry is set
            quot |= 1;
        }
    }
    return quot;
}

} // namespace

namespace math {

bool add(I128 a, I128 b, I128& out) {
    return !__builtin_add_overflow(a, b, &out);
}

bool sub(I128 a, I128 b, I128& out) {
    I128 r;
    if (__builtin_sub_overflow(a, b, &r) || r < 0) {
        return false;
    }
    out = r;
    return true;
}

bool mul_div_floor(I128 a, I128 b, I128 denom, I128& out) {
    if (a < 0 || b < 0 || denom <= 0) {
        return false;
    }

    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    U128 ud = static_cast<U128>(denom);
    if (product.hi >= ud) {
        return false;  // Quotient needs more than 128 bits
    }

    U128 q = div_u256_u128(product, ud);
    if (q > static_cast<U128>(I128_MAX)) {
        return false;
    }
    out = static_cast<I128>(q);
    return true;
}

} // namespace math

} // namespace backstop
