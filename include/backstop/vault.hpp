#ifndef BACKSTOP_VAULT_HPP
#define BACKSTOP_VAULT_HPP

#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"
#include "interfaces.hpp"
#include "registry.hpp"

namespace backstop {

// =============================================================================
// Operation Results
// =============================================================================

struct DepositResult {
    int32_t status;
    I128 shares_minted;
};

struct QueueResult {
    int32_t status;
    Q4W entry;  // Entry holding the request after merge/append
};

struct WithdrawResult {
    int32_t status;
    I128 tokens_out;
};

struct PriceResult {
    int32_t status;
    I128 price_x18;  // Tokens per share, 18 decimals
};

struct UserBalance {
    I128 shares;            // Unlocked + queued
    I128 queued_shares;
    I128 unqueued_shares;
    I128 matured_shares;    // Withdrawable now
    std::vector<Q4W> queue;
};

// =============================================================================
// BackstopVault - Share-accounting vault backing lending pools
// =============================================================================
//
// Every mutating operation is all-or-nothing: new values are computed on
// copies with checked arithmetic, the token transfer runs, and only then is
// the pool's state committed. Operations on one pool are serialized by that
// pool's lock; different pools proceed independently.

class BackstopVault {
public:
    BackstopVault(BackstopConfig config, ITokenTransfer& token, const IClock& clock);
    BackstopVault(BackstopConfig config, ITokenTransfer& token, const IClock& clock,
                  const IAuthorizer& authorizer);
    ~BackstopVault() = default;

    // Non-copyable
    BackstopVault(const BackstopVault&) = delete;
    BackstopVault& operator=(const BackstopVault&) = delete;

    const BackstopConfig& config() const { return config_; }

    // =========================================================================
    // Pool Registry
    // =========================================================================

    // Admin only
    int32_t register_pool(const Address& caller, const Address& pool);
    bool is_registered(const Address& pool) const;
    std::vector<Address> pools() const;

    // =========================================================================
    // Deposit
    // =========================================================================

    // Transfer tokens from user into the backstop and mint shares at the
    // current price (rounded down)
    DepositResult deposit(const Address& caller, const Address& pool,
                          const Address& user, I128 tokens);

    // =========================================================================
    // Withdrawal Queue
    // =========================================================================

    QueueResult queue_withdrawal(const Address& caller, const Address& pool,
                                 const Address& user, I128 shares);

    // Cancel part or all of the entry identified by its expiration
    int32_t cancel_queued_withdrawal(const Address& caller, const Address& pool,
                                     const Address& user, Timestamp expiration,
                                     I128 amount);

    // Cancel queued shares newest entry first
    int32_t dequeue_withdrawal(const Address& caller, const Address& pool,
                               const Address& user, I128 amount);

    // =========================================================================
    // Withdraw
    // =========================================================================

    // Burn matured queued shares (oldest first) and pay out tokens at the
    // pre-burn price (rounded down)
    WithdrawResult withdraw(const Address& caller, const Address& pool,
                            const Address& user, I128 shares);

    // =========================================================================
    // Fund Management
    // =========================================================================

    // Backed pool or admin pulls tokens out without burning shares
    int32_t draw(const Address& caller, const Address& pool, I128 amount,
                 const Address& recipient);

    // Add tokens without minting shares
    int32_t donate(const Address& caller, const Address& pool, I128 amount);

    // =========================================================================
    // Views
    // =========================================================================

    std::optional<PoolState> pool_state(const Address& pool) const;
    // ARITHMETIC_OVERFLOW when the price does not fit in 128 bits; the pool
    // itself still converts and redeems normally
    PriceResult share_price_x18(const Address& pool) const;
    std::optional<UserBalance> user_balance(const Address& pool, const Address& user) const;

    DepositResult preview_deposit(const Address& pool, I128 tokens) const;
    WithdrawResult preview_withdraw(const Address& pool, I128 shares) const;

    // Recompute pool totals from user positions; CORRUPT_STATE on mismatch
    int32_t verify_pool(const Address& pool) const;

    // =========================================================================
    // Persistence
    // =========================================================================

    nlohmann::json snapshot() const;

    // Replace all state; CORRUPT_STATE (nothing replaced) if any invariant fails
    int32_t restore(const nlohmann::json& snapshot);

private:
    BackstopConfig config_;
    ITokenTransfer& token_;
    const IClock& clock_;
    IdentityAuthorizer default_authorizer_;
    const IAuthorizer& authorizer_;

    // Mutable so read-only views can lock pools
    mutable PoolRegistry registry_;

    bool is_pool_or_admin(const Address& caller, const Address& pool) const;
    int32_t pay(const Address& from, const Address& to, I128 amount);
};

} // namespace backstop

#endif // BACKSTOP_VAULT_HPP
