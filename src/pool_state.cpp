// =============================================================================
// pool_state.cpp - Share price and checked counter updates
// =============================================================================

#include "backstop/pool_state.hpp"
#include "backstop/math.hpp"

namespace backstop {

// =============================================================================
// Conversions
// =============================================================================

int32_t PoolState::convert_to_shares(I128 tokens, I128& shares_out) const {
    if (tokens < 0) {
        return errors::INVALID_AMOUNT;
    }
    if (total_shares_ == 0) {
        shares_out = tokens;
        return errors::OK;
    }
    // Shares outstanding against an empty balance have no price to mint at
    if (!math::mul_div_floor(tokens, total_shares_, total_tokens_, shares_out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

int32_t PoolState::convert_to_tokens(I128 shares, I128& tokens_out) const {
    if (shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    if (total_shares_ == 0) {
        tokens_out = shares;
        return errors::OK;
    }
    if (!math::mul_div_floor(shares, total_tokens_, total_shares_, tokens_out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

int32_t PoolState::share_price_x18(I128& price_out) const {
    if (total_shares_ == 0) {
        price_out = X18_ONE;
        return errors::OK;
    }
    if (!math::mul_div_floor(total_tokens_, X18_ONE, total_shares_, price_out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

// =============================================================================
// Mutators
// =============================================================================

int32_t PoolState::deposit(I128 tokens, I128 shares) {
    if (tokens < 0 || shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_tokens, new_shares;
    if (!math::add(total_tokens_, tokens, new_tokens) ||
        !math::add(total_shares_, shares, new_shares)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_tokens_ = new_tokens;
    total_shares_ = new_shares;
    return errors::OK;
}

int32_t PoolState::withdraw(I128 tokens, I128 shares) {
    if (tokens < 0 || shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_tokens, new_shares, new_queued;
    if (!math::sub(total_tokens_, tokens, new_tokens) ||
        !math::sub(total_shares_, shares, new_shares) ||
        !math::sub(queued_shares_, shares, new_queued)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_tokens_ = new_tokens;
    total_shares_ = new_shares;
    queued_shares_ = new_queued;
    return errors::OK;
}

int32_t PoolState::queue(I128 shares) {
    if (shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_queued;
    if (!math::add(queued_shares_, shares, new_queued)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    if (new_queued > total_shares_) {
        return errors::INSUFFICIENT_UNQUEUED_SHARES;
    }
    queued_shares_ = new_queued;
    return errors::OK;
}

int32_t PoolState::dequeue(I128 shares) {
    if (shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_queued;
    if (!math::sub(queued_shares_, shares, new_queued)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    queued_shares_ = new_queued;
    return errors::OK;
}

int32_t PoolState::add_tokens(I128 tokens) {
    if (tokens < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_tokens;
    if (!math::add(total_tokens_, tokens, new_tokens)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_tokens_ = new_tokens;
    return errors::OK;
}

int32_t PoolState::remove_tokens(I128 tokens) {
    if (tokens < 0) {
        return errors::INVALID_AMOUNT;
    }
    if (tokens > total_tokens_) {
        return errors::INSUFFICIENT_BACKSTOP_BALANCE;
    }
    total_tokens_ -= tokens;
    return errors::OK;
}

int32_t PoolState::restore(I128 total_shares, I128 total_tokens, I128 queued_shares,
                           PoolState& out) {
    if (total_shares < 0 || total_tokens < 0 || queued_shares < 0 ||
        queued_shares > total_shares) {
        return errors::CORRUPT_STATE;
    }
    out.total_shares_ = total_shares;
    out.total_tokens_ = total_tokens;
    out.queued_shares_ = queued_shares;
    return errors::OK;
}

} // namespace backstop
