#ifndef BACKSTOP_MATH_HPP
#define BACKSTOP_MATH_HPP

#include "types.hpp"

namespace backstop {

// =============================================================================
// Checked Arithmetic
// =============================================================================
//
// Every helper reports failure instead of wrapping or saturating. Operands are
// expected to be non-negative amounts; a negative result from sub() is treated
// as underflow.

namespace math {

bool add(I128 a, I128 b, I128& out);
bool sub(I128 a, I128 b, I128& out);

// floor(a * b / denom) with a 256-bit intermediate product.
// Fails if any operand is negative, denom is zero, or the quotient does not
// fit in I128.
bool mul_div_floor(I128 a, I128 b, I128 denom, I128& out);

} // namespace math

} // namespace backstop

#endif // BACKSTOP_MATH_HPP
