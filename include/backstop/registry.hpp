#ifndef BACKSTOP_REGISTRY_HPP
#define BACKSTOP_REGISTRY_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "pool_state.hpp"
#include "user_position.hpp"

namespace backstop {

// =============================================================================
// PoolSlot - Everything the backstop holds for one backed pool
// =============================================================================

struct PoolSlot {
    PoolState state;
    std::unordered_map<Address, UserPosition, AddressHash> users;
    std::mutex mutex;  // Guards state and users
};

using SlotMap = std::unordered_map<Address, std::unique_ptr<PoolSlot>, AddressHash>;

// =============================================================================
// PoolRegistry - Membership of backed pools
// =============================================================================
//
// Lock order: registry (shared for pool access, exclusive for membership
// changes) before slot. Pool access keeps the shared lock for its whole
// duration so that restore() never races an operation in flight.

class PoolRegistry {
public:
    PoolRegistry() = default;

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    int32_t register_pool(const Address& pool);
    bool is_registered(const Address& pool) const;
    std::vector<Address> pools() const;
    size_t size() const;

    // Run fn(PoolSlot&) with the pool locked; POOL_NOT_FOUND if unregistered
    template <typename Fn>
    int32_t with_pool(const Address& pool, Fn&& fn) {
        std::shared_lock registry_lock(mutex_);
        auto it = slots_.find(pool);
        if (it == slots_.end()) {
            return errors::POOL_NOT_FOUND;
        }
        std::lock_guard<std::mutex> pool_lock(it->second->mutex);
        return fn(*it->second);
    }

    // Visit every pool, each locked in turn
    template <typename Fn>
    void for_each(Fn&& fn) const {
        std::shared_lock registry_lock(mutex_);
        for (const auto& [address, slot] : slots_) {
            std::lock_guard<std::mutex> pool_lock(slot->mutex);
            fn(address, static_cast<const PoolSlot&>(*slot));
        }
    }

    // Swap in a complete set of pools
    void replace_all(SlotMap slots);

private:
    SlotMap slots_;
    mutable std::shared_mutex mutex_;
};

} // namespace backstop

#endif // BACKSTOP_REGISTRY_HPP
