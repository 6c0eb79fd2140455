// =============================================================================
// user_position.cpp - Per-user share balance and withdrawal queue
// =============================================================================

#include "backstop/user_position.hpp"
#include "backstop/math.hpp"

#include <algorithm>
#include <cstddef>

namespace backstop {

I128 UserPosition::queued_shares() const {
    I128 total = 0;
    for (const auto& entry : q4w_) {
        total += entry.amount;
    }
    return total;
}

I128 UserPosition::matured_shares(Timestamp now) const {
    I128 total = 0;
    for (const auto& entry : q4w_) {
        if (!entry.matured(now)) break;
        total += entry.amount;
    }
    return total;
}

int32_t UserPosition::add_shares(I128 shares) {
    if (shares < 0) {
        return errors::INVALID_AMOUNT;
    }
    I128 new_shares;
    if (!math::add(shares_, shares, new_shares)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    shares_ = new_shares;
    return errors::OK;
}

// =============================================================================
// Withdrawal Queue
// =============================================================================

int32_t UserPosition::queue_shares(I128 shares, Timestamp now, uint64_t lock_period,
                                   size_t max_entries) {
    if (shares <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (shares > unqueued_shares()) {
        return errors::INSUFFICIENT_UNQUEUED_SHARES;
    }

    Timestamp expiration;
    if (__builtin_add_overflow(now, lock_period, &expiration)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    if (!q4w_.empty()) {
        Q4W& newest = q4w_.back();
        if (!newest.matured(now) || expiration <= newest.expiration) {
            // Bounded by shares_, so the sum cannot overflow
            newest.amount += shares;
            newest.expiration = std::max(newest.expiration, expiration);
            return errors::OK;
        }
    }

    if (q4w_.size() >= max_entries) {
        return errors::QUEUE_FULL;
    }

    q4w_.push_back(Q4W{shares, expiration});
    return errors::OK;
}

int32_t UserPosition::cancel(Timestamp expiration, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    auto it = std::lower_bound(q4w_.begin(), q4w_.end(), expiration,
                               [](const Q4W& entry, Timestamp t) { return entry.expiration < t; });
    if (it == q4w_.end() || it->expiration != expiration || amount > it->amount) {
        return errors::ENTRY_NOT_FOUND;
    }

    if (amount == it->amount) {
        q4w_.erase(it);
    } else {
        it->amount -= amount;
    }
    return errors::OK;
}

int32_t UserPosition::dequeue_latest(I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (amount > queued_shares()) {
        return errors::ENTRY_NOT_FOUND;
    }

    I128 remaining = amount;
    while (remaining > 0) {
        Q4W& newest = q4w_.back();
        if (newest.amount <= remaining) {
            remaining -= newest.amount;
            q4w_.pop_back();
        } else {
            newest.amount -= remaining;
            remaining = 0;
        }
    }
    return errors::OK;
}

int32_t UserPosition::withdraw_matured(I128 shares, Timestamp now) {
    if (shares <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (matured_shares(now) < shares) {
        return errors::NOT_MATURED;
    }

    I128 remaining = shares;
    size_t consumed = 0;
    while (remaining > 0) {
        Q4W& oldest = q4w_[consumed];
        if (oldest.amount <= remaining) {
            remaining -= oldest.amount;
            ++consumed;
        } else {
            oldest.amount -= remaining;
            remaining = 0;
        }
    }
    q4w_.erase(q4w_.begin(), q4w_.begin() + static_cast<std::ptrdiff_t>(consumed));

    shares_ -= shares;
    return errors::OK;
}

int32_t UserPosition::restore(I128 shares, std::vector<Q4W> queue, size_t max_entries,
                              UserPosition& out) {
    if (shares < 0 || queue.size() > max_entries) {
        return errors::CORRUPT_STATE;
    }

    I128 queued = 0;
    for (size_t i = 0; i < queue.size(); ++i) {
        if (queue[i].amount <= 0) {
            return errors::CORRUPT_STATE;
        }
        if (i > 0 && queue[i].expiration <= queue[i - 1].expiration) {
            return errors::CORRUPT_STATE;
        }
        if (!math::add(queued, queue[i].amount, queued)) {
            return errors::CORRUPT_STATE;
        }
    }
    if (queued > shares) {
        return errors::CORRUPT_STATE;
    }

    out.shares_ = shares;
    out.q4w_ = std::move(queue);
    return errors::OK;
}

} // namespace backstop
