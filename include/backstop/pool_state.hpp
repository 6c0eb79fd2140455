#ifndef BACKSTOP_POOL_STATE_HPP
#define BACKSTOP_POOL_STATE_HPP

#include "types.hpp"

namespace backstop {

// =============================================================================
// PoolState - Aggregate backstop counters for one backed pool
// =============================================================================
//
// Invariants maintained by every mutator:
//   0 <= queued_shares <= total_shares
//   total_tokens >= 0
// A mutator that fails leaves the state unchanged.

class PoolState {
public:
    PoolState() = default;

    I128 total_shares() const { return total_shares_; }
    I128 total_tokens() const { return total_tokens_; }
    I128 queued_shares() const { return queued_shares_; }
    I128 unqueued_shares() const { return total_shares_ - queued_shares_; }

    // =========================================================================
    // Conversions (always round down)
    // =========================================================================

    // floor(tokens * total_shares / total_tokens), 1:1 when no shares exist
    int32_t convert_to_shares(I128 tokens, I128& shares_out) const;

    // floor(shares * total_tokens / total_shares), 1:1 when no shares exist
    int32_t convert_to_tokens(I128 shares, I128& tokens_out) const;

    // total_tokens / total_shares scaled by 1e18, X18_ONE when no shares exist
    int32_t share_price_x18(I128& price_out) const;

    // =========================================================================
    // Mutators
    // =========================================================================

    int32_t deposit(I128 tokens, I128 shares);
    int32_t withdraw(I128 tokens, I128 shares);  // burns queued shares
    int32_t queue(I128 shares);
    int32_t dequeue(I128 shares);
    int32_t add_tokens(I128 tokens);
    int32_t remove_tokens(I128 tokens);

    // Rebuild from persisted counters; rejects values that break invariants
    static int32_t restore(I128 total_shares, I128 total_tokens, I128 queued_shares,
                           PoolState& out);

    bool operator==(const PoolState& other) const {
        return total_shares_ == other.total_shares_ &&
               total_tokens_ == other.total_tokens_ &&
               queued_shares_ == other.queued_shares_;
    }

private:
    I128 total_shares_ = 0;
    I128 total_tokens_ = 0;
    I128 queued_shares_ = 0;
};

} // namespace backstop

#endif // BACKSTOP_POOL_STATE_HPP
