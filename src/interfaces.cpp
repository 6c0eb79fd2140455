// =============================================================================
// interfaces.cpp - Default clock and in-memory token ledger
// =============================================================================

#include "backstop/interfaces.hpp"
#include "backstop/math.hpp"

#include <chrono>

namespace backstop {

Timestamp SystemClock::now() const {
    Timestamp wall = static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
    Timestamp last = last_.load(std::memory_order_acquire);
    while (wall > last) {
        if (last_.compare_exchange_weak(last, wall, std::memory_order_acq_rel)) {
            return wall;
        }
    }
    return last;
}

// =============================================================================
// InMemoryToken
// =============================================================================

int32_t InMemoryToken::transfer(const Address& from, const Address& to, I128 amount) {
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = balances_.find(from);
    I128 from_balance = (it != balances_.end()) ? it->second : 0;
    if (from_balance < amount) {
        return errors::TRANSFER_FAILED;
    }
    if (from == to) {
        return errors::OK;
    }

    I128 to_balance = 0;
    auto to_it = balances_.find(to);
    if (to_it != balances_.end()) {
        to_balance = to_it->second;
    }
    I128 new_to;
    if (!math::add(to_balance, amount, new_to)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    balances_[from] = from_balance - amount;
    balances_[to] = new_to;
    return errors::OK;
}

int32_t InMemoryToken::mint(const Address& to, I128 amount) {
    if (amount < 0) {
        return errors::INVALID_AMOUNT;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    I128 new_supply;
    if (!math::add(total_supply_, amount, new_supply)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_supply_ = new_supply;
    // Every balance is bounded by the total supply
    balances_[to] += amount;
    return errors::OK;
}

I128 InMemoryToken::balance_of(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : 0;
}

I128 InMemoryToken::total_supply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_supply_;
}

} // namespace backstop
