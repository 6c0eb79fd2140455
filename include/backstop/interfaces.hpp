#ifndef BACKSTOP_INTERFACES_HPP
#define BACKSTOP_INTERFACES_HPP

#include <atomic>
#include <mutex>
#include <unordered_map>

#include "types.hpp"

namespace backstop {

// =============================================================================
// Token Transfer Interface
// =============================================================================

// Moves the backstop's underlying token. Returns errors::OK on success; any
// other value aborts the calling operation with errors::TRANSFER_FAILED.
// Called while the affected pool is locked: implementations must not call
// back into the vault for that pool.
class ITokenTransfer {
public:
    virtual ~ITokenTransfer() = default;

    virtual int32_t transfer(const Address& from, const Address& to, I128 amount) = 0;
};

// =============================================================================
// Time Source
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;

    // Seconds since the Unix epoch
    virtual Timestamp now() const = 0;
};

// Wall clock in seconds since the epoch, clamped so it never steps backwards
// when the system time is adjusted
class SystemClock : public IClock {
public:
    Timestamp now() const override;

private:
    mutable std::atomic<Timestamp> last_{0};
};

// Externally driven clock for simulation and tests
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(std::memory_order_acquire); }

    void set(Timestamp t) { now_.store(t, std::memory_order_release); }
    void advance(uint64_t seconds) { now_.fetch_add(seconds, std::memory_order_acq_rel); }

private:
    std::atomic<Timestamp> now_;
};

// =============================================================================
// Caller Authorization
// =============================================================================

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    // May `caller` act on behalf of `account`?
    virtual bool authorize(const Address& caller, const Address& account) const = 0;
};

// Only an account may act for itself
class IdentityAuthorizer : public IAuthorizer {
public:
    bool authorize(const Address& caller, const Address& account) const override {
        return caller == account;
    }
};

// =============================================================================
// InMemoryToken - Balance ledger implementing ITokenTransfer
// =============================================================================

class InMemoryToken : public ITokenTransfer {
public:
    InMemoryToken() = default;

    InMemoryToken(const InMemoryToken&) = delete;
    InMemoryToken& operator=(const InMemoryToken&) = delete;

    int32_t transfer(const Address& from, const Address& to, I128 amount) override;

    int32_t mint(const Address& to, I128 amount);
    I128 balance_of(const Address& account) const;
    I128 total_supply() const;

private:
    std::unordered_map<Address, I128, AddressHash> balances_;
    I128 total_supply_ = 0;
    mutable std::mutex mutex_;
};

} // namespace backstop

#endif // BACKSTOP_INTERFACES_HPP
