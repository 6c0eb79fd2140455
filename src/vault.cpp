// =============================================================================
// vault.cpp - BackstopVault share accounting
// =============================================================================

#include "backstop/vault.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace backstop {

namespace {

// Failures are returned to the caller; only the unexpected ones are loud
int32_t log_failure(const char* op, const Address& pool, int32_t code) {
    switch (code) {
        case errors::ARITHMETIC_OVERFLOW:
            spdlog::error("{} pool={} aborted: {}", op, to_hex(pool), error_name(code));
            break;
        case errors::TRANSFER_FAILED:
            spdlog::warn("{} pool={} aborted: {}", op, to_hex(pool), error_name(code));
            break;
        default:
            spdlog::debug("{} pool={} rejected: {}", op, to_hex(pool), error_name(code));
            break;
    }
    return code;
}

inline std::string fmt_amount(I128 v) { return i128_to_string(v); }

} // namespace

// =============================================================================
// Constructor
// =============================================================================

BackstopVault::BackstopVault(BackstopConfig config, ITokenTransfer& token, const IClock& clock)
    : config_(std::move(config))
    , token_(token)
    , clock_(clock)
    , authorizer_(default_authorizer_) {}

BackstopVault::BackstopVault(BackstopConfig config, ITokenTransfer& token, const IClock& clock,
                             const IAuthorizer& authorizer)
    : config_(std::move(config))
    , token_(token)
    , clock_(clock)
    , authorizer_(authorizer) {}

// =============================================================================
// Pool Registry
// =============================================================================

int32_t BackstopVault::register_pool(const Address& caller, const Address& pool) {
    if (!authorizer_.authorize(caller, config_.admin)) {
        return log_failure("register_pool", pool, errors::UNAUTHORIZED);
    }

    int32_t rc = registry_.register_pool(pool);
    if (rc != errors::OK) {
        return log_failure("register_pool", pool, rc);
    }

    spdlog::info("registered backed pool {}", to_hex(pool));
    return errors::OK;
}

bool BackstopVault::is_registered(const Address& pool) const {
    return registry_.is_registered(pool);
}

std::vector<Address> BackstopVault::pools() const {
    return registry_.pools();
}

// =============================================================================
// Deposit
// =============================================================================

DepositResult BackstopVault::deposit(const Address& caller, const Address& pool,
                                     const Address& user, I128 tokens) {
    DepositResult result{errors::OK, 0};

    if (tokens <= 0) {
        result.status = log_failure("deposit", pool, errors::INVALID_AMOUNT);
        return result;
    }
    if (!authorizer_.authorize(caller, user)) {
        result.status = log_failure("deposit", pool, errors::UNAUTHORIZED);
        return result;
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        I128 shares = 0;
        int32_t status = slot.state.convert_to_shares(tokens, shares);
        if (status != errors::OK) return status;

        // Too small to mint a single share at the current price
        if (shares <= 0) return errors::INVALID_AMOUNT;

        PoolState next_state = slot.state;
        status = next_state.deposit(tokens, shares);
        if (status != errors::OK) return status;

        // Reserve the entry before any tokens move
        auto [it, inserted] = slot.users.try_emplace(user);
        UserPosition next_user = it->second;
        status = next_user.add_shares(shares);
        if (status == errors::OK) {
            status = pay(user, config_.backstop_address, tokens);
        }
        if (status != errors::OK) {
            if (inserted) slot.users.erase(it);
            return status;
        }

        slot.state = next_state;
        it->second = std::move(next_user);
        result.shares_minted = shares;
        return errors::OK;
    });

    if (rc != errors::OK) {
        result.status = log_failure("deposit", pool, rc);
        return result;
    }

    spdlog::debug("deposit pool={} user={} tokens={} shares={}", to_hex(pool), to_hex(user),
                  fmt_amount(tokens), fmt_amount(result.shares_minted));
    return result;
}

// =============================================================================
// Withdrawal Queue
// =============================================================================

QueueResult BackstopVault::queue_withdrawal(const Address& caller, const Address& pool,
                                            const Address& user, I128 shares) {
    QueueResult result{errors::OK, Q4W{0, 0}};

    if (shares <= 0) {
        result.status = log_failure("queue_withdrawal", pool, errors::INVALID_AMOUNT);
        return result;
    }
    if (!authorizer_.authorize(caller, user)) {
        result.status = log_failure("queue_withdrawal", pool, errors::UNAUTHORIZED);
        return result;
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        auto it = slot.users.find(user);
        if (it == slot.users.end()) return errors::INSUFFICIENT_UNQUEUED_SHARES;

        UserPosition next_user = it->second;
        int32_t status = next_user.queue_shares(shares, clock_.now(),
                                                config_.lock_period_seconds,
                                                config_.max_q4w_entries);
        if (status != errors::OK) return status;

        PoolState next_state = slot.state;
        status = next_state.queue(shares);
        if (status != errors::OK) return status;

        slot.state = next_state;
        it->second = std::move(next_user);
        result.entry = it->second.queue().back();
        return errors::OK;
    });

    if (rc != errors::OK) {
        result.status = log_failure("queue_withdrawal", pool, rc);
        return result;
    }

    spdlog::debug("queue_withdrawal pool={} user={} shares={} expiration={}", to_hex(pool),
                  to_hex(user), fmt_amount(shares), result.entry.expiration);
    return result;
}

int32_t BackstopVault::cancel_queued_withdrawal(const Address& caller, const Address& pool,
                                                const Address& user, Timestamp expiration,
                                                I128 amount) {
    if (amount <= 0) {
        return log_failure("cancel_queued_withdrawal", pool, errors::INVALID_AMOUNT);
    }
    if (!authorizer_.authorize(caller, user)) {
        return log_failure("cancel_queued_withdrawal", pool, errors::UNAUTHORIZED);
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        auto it = slot.users.find(user);
        if (it == slot.users.end()) return errors::ENTRY_NOT_FOUND;

        UserPosition next_user = it->second;
        int32_t status = next_user.cancel(expiration, amount);
        if (status != errors::OK) return status;

        PoolState next_state = slot.state;
        status = next_state.dequeue(amount);
        if (status != errors::OK) return status;

        slot.state = next_state;
        it->second = std::move(next_user);
        return errors::OK;
    });

    if (rc != errors::OK) {
        return log_failure("cancel_queued_withdrawal", pool, rc);
    }

    spdlog::debug("cancel_queued_withdrawal pool={} user={} expiration={} amount={}",
                  to_hex(pool), to_hex(user), expiration, fmt_amount(amount));
    return errors::OK;
}

int32_t BackstopVault::dequeue_withdrawal(const Address& caller, const Address& pool,
                                          const Address& user, I128 amount) {
    if (amount <= 0) {
        return log_failure("dequeue_withdrawal", pool, errors::INVALID_AMOUNT);
    }
    if (!authorizer_.authorize(caller, user)) {
        return log_failure("dequeue_withdrawal", pool, errors::UNAUTHORIZED);
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        auto it = slot.users.find(user);
        if (it == slot.users.end()) return errors::ENTRY_NOT_FOUND;

        UserPosition next_user = it->second;
        int32_t status = next_user.dequeue_latest(amount);
        if (status != errors::OK) return status;

        PoolState next_state = slot.state;
        status = next_state.dequeue(amount);
        if (status != errors::OK) return status;

        slot.state = next_state;
        it->second = std::move(next_user);
        return errors::OK;
    });

    if (rc != errors::OK) {
        return log_failure("dequeue_withdrawal", pool, rc);
    }

    spdlog::debug("dequeue_withdrawal pool={} user={} amount={}", to_hex(pool), to_hex(user),
                  fmt_amount(amount));
    return errors::OK;
}

// =============================================================================
// Withdraw
// =============================================================================

WithdrawResult BackstopVault::withdraw(const Address& caller, const Address& pool,
                                       const Address& user, I128 shares) {
    WithdrawResult result{errors::OK, 0};

    if (shares <= 0) {
        result.status = log_failure("withdraw", pool, errors::INVALID_AMOUNT);
        return result;
    }
    if (!authorizer_.authorize(caller, user)) {
        result.status = log_failure("withdraw", pool, errors::UNAUTHORIZED);
        return result;
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        auto it = slot.users.find(user);
        if (it == slot.users.end()) return errors::NOT_MATURED;

        UserPosition next_user = it->second;
        int32_t status = next_user.withdraw_matured(shares, clock_.now());
        if (status != errors::OK) return status;

        // Price taken from pre-burn totals
        I128 tokens = 0;
        status = slot.state.convert_to_tokens(shares, tokens);
        if (status != errors::OK) return status;

        PoolState next_state = slot.state;
        status = next_state.withdraw(tokens, shares);
        if (status != errors::OK) return status;

        if (tokens > 0) {
            status = pay(config_.backstop_address, user, tokens);
            if (status != errors::OK) return status;
        }

        slot.state = next_state;
        if (next_user.empty()) {
            slot.users.erase(it);
        } else {
            it->second = std::move(next_user);
        }
        result.tokens_out = tokens;
        return errors::OK;
    });

    if (rc != errors::OK) {
        result.status = log_failure("withdraw", pool, rc);
        return result;
    }

    spdlog::debug("withdraw pool={} user={} shares={} tokens={}", to_hex(pool), to_hex(user),
                  fmt_amount(shares), fmt_amount(result.tokens_out));
    return result;
}

// =============================================================================
// Fund Management
// =============================================================================

int32_t BackstopVault::draw(const Address& caller, const Address& pool, I128 amount,
                            const Address& recipient) {
    if (!is_pool_or_admin(caller, pool)) {
        return log_failure("draw", pool, errors::UNAUTHORIZED);
    }
    if (amount <= 0) {
        return log_failure("draw", pool, errors::INVALID_AMOUNT);
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        PoolState next_state = slot.state;
        int32_t status = next_state.remove_tokens(amount);
        if (status != errors::OK) return status;

        status = pay(config_.backstop_address, recipient, amount);
        if (status != errors::OK) return status;

        slot.state = next_state;
        return errors::OK;
    });

    if (rc != errors::OK) {
        return log_failure("draw", pool, rc);
    }

    spdlog::info("draw pool={} amount={} recipient={}", to_hex(pool), fmt_amount(amount),
                 to_hex(recipient));
    return errors::OK;
}

int32_t BackstopVault::donate(const Address& caller, const Address& pool, I128 amount) {
    if (amount <= 0) {
        return log_failure("donate", pool, errors::INVALID_AMOUNT);
    }
    if (config_.restrict_donate && !is_pool_or_admin(caller, pool)) {
        return log_failure("donate", pool, errors::UNAUTHORIZED);
    }

    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        PoolState next_state = slot.state;
        int32_t status = next_state.add_tokens(amount);
        if (status != errors::OK) return status;

        status = pay(caller, config_.backstop_address, amount);
        if (status != errors::OK) return status;

        slot.state = next_state;
        return errors::OK;
    });

    if (rc != errors::OK) {
        return log_failure("donate", pool, rc);
    }

    spdlog::debug("donate pool={} from={} amount={}", to_hex(pool), to_hex(caller),
                  fmt_amount(amount));
    return errors::OK;
}

// =============================================================================
// Views
// =============================================================================

std::optional<PoolState> BackstopVault::pool_state(const Address& pool) const {
    std::optional<PoolState> out;
    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        out = slot.state;
        return errors::OK;
    });
    if (rc != errors::OK) return std::nullopt;
    return out;
}

PriceResult BackstopVault::share_price_x18(const Address& pool) const {
    PriceResult result{errors::OK, 0};
    result.status = registry_.with_pool(pool, [&](PoolSlot& slot) {
        return slot.state.share_price_x18(result.price_x18);
    });
    if (result.status != errors::OK) result.price_x18 = 0;
    return result;
}

std::optional<UserBalance> BackstopVault::user_balance(const Address& pool,
                                                       const Address& user) const {
    std::optional<UserBalance> out;
    Timestamp now = clock_.now();
    int32_t rc = registry_.with_pool(pool, [&](PoolSlot& slot) {
        UserBalance balance{0, 0, 0, 0, {}};
        auto it = slot.users.find(user);
        if (it != slot.users.end()) {
            const UserPosition& position = it->second;
            balance.shares = position.shares();
            balance.queued_shares = position.queued_shares();
            balance.unqueued_shares = position.unqueued_shares();
            balance.matured_shares = position.matured_shares(now);
            balance.queue = position.queue();
        }
        out = std::move(balance);
        return errors::OK;
    });
    if (rc != errors::OK) return std::nullopt;
    return out;
}

DepositResult BackstopVault::preview_deposit(const Address& pool, I128 tokens) const {
    DepositResult result{errors::OK, 0};
    result.status = registry_.with_pool(pool, [&](PoolSlot& slot) {
        return slot.state.convert_to_shares(tokens, result.shares_minted);
    });
    return result;
}

WithdrawResult BackstopVault::preview_withdraw(const Address& pool, I128 shares) const {
    WithdrawResult result{errors::OK, 0};
    result.status = registry_.with_pool(pool, [&](PoolSlot& slot) {
        return slot.state.convert_to_tokens(shares, result.tokens_out);
    });
    return result;
}

int32_t BackstopVault::verify_pool(const Address& pool) const {
    return registry_.with_pool(pool, [&](PoolSlot& slot) {
        I128 shares = 0;
        I128 queued = 0;
        for (const auto& [address, position] : slot.users) {
            if (position.empty() || position.queued_shares() > position.shares()) {
                return errors::CORRUPT_STATE;
            }
            shares += position.shares();
            queued += position.queued_shares();
        }
        if (shares != slot.state.total_shares() || queued != slot.state.queued_shares()) {
            return errors::CORRUPT_STATE;
        }
        return errors::OK;
    });
}

// =============================================================================
// Internal Helpers
// =============================================================================

bool BackstopVault::is_pool_or_admin(const Address& caller, const Address& pool) const {
    return authorizer_.authorize(caller, pool) || authorizer_.authorize(caller, config_.admin);
}

int32_t BackstopVault::pay(const Address& from, const Address& to, I128 amount) {
    int32_t rc = token_.transfer(from, to, amount);
    if (rc != errors::OK) {
        spdlog::warn("token transfer {} -> {} of {} failed: {}", to_hex(from), to_hex(to),
                     fmt_amount(amount), error_name(rc));
        return errors::TRANSFER_FAILED;
    }
    return errors::OK;
}

} // namespace backstop
