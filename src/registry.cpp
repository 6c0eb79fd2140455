// =============================================================================
// registry.cpp - Backed pool membership
// =============================================================================

#include "backstop/registry.hpp"

#include <algorithm>

namespace backstop {

int32_t PoolRegistry::register_pool(const Address& pool) {
    std::unique_lock lock(mutex_);

    if (slots_.find(pool) != slots_.end()) {
        return errors::POOL_ALREADY_REGISTERED;
    }
    slots_.emplace(pool, std::make_unique<PoolSlot>());
    return errors::OK;
}

bool PoolRegistry::is_registered(const Address& pool) const {
    std::shared_lock lock(mutex_);
    return slots_.find(pool) != slots_.end();
}

std::vector<Address> PoolRegistry::pools() const {
    std::vector<Address> out;

    std::shared_lock lock(mutex_);
    out.reserve(slots_.size());
    for (const auto& [address, slot] : slots_) {
        out.push_back(address);
    }
    lock.unlock();

    std::sort(out.begin(), out.end());
    return out;
}

size_t PoolRegistry::size() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

void PoolRegistry::replace_all(SlotMap slots) {
    std::unique_lock lock(mutex_);
    slots_ = std::move(slots);
}

} // namespace backstop
