#ifndef BACKSTOP_USER_POSITION_HPP
#define BACKSTOP_USER_POSITION_HPP

#include <vector>

#include "types.hpp"

namespace backstop {

// =============================================================================
// Queued-for-withdrawal entry
// =============================================================================

struct Q4W {
    I128 amount;           // Shares pending withdrawal
    Timestamp expiration;  // Withdrawable once now >= expiration

    bool matured(Timestamp now) const { return expiration <= now; }

    bool operator==(const Q4W& other) const {
        return amount == other.amount && expiration == other.expiration;
    }
};

// =============================================================================
// UserPosition - Shares held by one user in one pool, plus its withdrawal queue
// =============================================================================
//
// shares() counts unlocked and queued shares alike; queued shares leave the
// balance only when withdrawn. The queue is ordered by strictly increasing
// expiration, so matured entries always form a prefix and an expiration
// uniquely identifies an entry.

class UserPosition {
public:
    UserPosition() = default;

    I128 shares() const { return shares_; }
    const std::vector<Q4W>& queue() const { return q4w_; }

    I128 queued_shares() const;
    I128 unqueued_shares() const { return shares_ - queued_shares(); }
    I128 matured_shares(Timestamp now) const;

    // A drained position holds nothing and can be dropped from storage
    bool empty() const { return shares_ == 0 && q4w_.empty(); }

    int32_t add_shares(I128 shares);

    // =========================================================================
    // Withdrawal Queue
    // =========================================================================

    // Queue shares to unlock at now + lock_period. Merges into the newest entry
    // while it is still pending (moving its expiration out to the new one),
    // otherwise appends, bounded by max_entries.
    int32_t queue_shares(I128 shares, Timestamp now, uint64_t lock_period,
                         size_t max_entries);

    // Shrink or erase the entry with the given expiration
    int32_t cancel(Timestamp expiration, I128 amount);

    // Cancel queued shares starting from the newest entry
    int32_t dequeue_latest(I128 amount);

    // Consume matured entries oldest-first and burn the shares from the balance
    int32_t withdraw_matured(I128 shares, Timestamp now);

    // Rebuild from persisted data; rejects out-of-order or oversized queues
    static int32_t restore(I128 shares, std::vector<Q4W> queue, size_t max_entries,
                           UserPosition& out);

private:
    I128 shares_ = 0;
    std::vector<Q4W> q4w_;
};

} // namespace backstop

#endif // BACKSTOP_USER_POSITION_HPP
