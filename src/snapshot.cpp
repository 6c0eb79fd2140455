// =============================================================================
// snapshot.cpp - JSON persistence of backstop state
// =============================================================================
//
// Layout:
//   { "pools": { "<pool hex>": {
//       "total_shares": "<dec>", "total_tokens": "<dec>", "queued_shares": "<dec>",
//       "users": { "<user hex>": {
//           "shares": "<dec>",
//           "q4w": [ { "amount": "<dec>", "expiration": <uint> }, ... ] } } } } }
//
// Amounts are decimal strings since they exceed the range of JSON numbers.

#include "backstop/vault.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace backstop {

using json = nlohmann::json;

namespace {

I128 parse_amount(const json& j) {
    auto v = i128_from_string(j.get<std::string>());
    if (!v) {
        throw std::invalid_argument("malformed amount");
    }
    return *v;
}

Timestamp parse_timestamp(const json& j) {
    if (!j.is_number_unsigned()) {
        throw std::invalid_argument("malformed expiration");
    }
    return j.get<Timestamp>();
}

Address parse_key(const std::string& key) {
    auto addr = address_from_hex(key);
    if (!addr) {
        throw std::invalid_argument("malformed address " + key);
    }
    return *addr;
}

json position_to_json(const UserPosition& position) {
    json q4w = json::array();
    for (const auto& entry : position.queue()) {
        q4w.push_back({{"amount", i128_to_string(entry.amount)},
                       {"expiration", entry.expiration}});
    }
    return {{"shares", i128_to_string(position.shares())}, {"q4w", std::move(q4w)}};
}

// Builds one slot; returns CORRUPT_STATE if any invariant fails
int32_t slot_from_json(const json& j, size_t max_q4w_entries, PoolSlot& slot) {
    int32_t rc = PoolState::restore(parse_amount(j.at("total_shares")),
                                    parse_amount(j.at("total_tokens")),
                                    parse_amount(j.at("queued_shares")),
                                    slot.state);
    if (rc != errors::OK) return rc;

    I128 shares_sum = 0;
    I128 queued_sum = 0;
    for (const auto& [key, user_json] : j.at("users").items()) {
        std::vector<Q4W> queue;
        for (const auto& entry : user_json.at("q4w")) {
            queue.push_back(Q4W{parse_amount(entry.at("amount")),
                                parse_timestamp(entry.at("expiration"))});
        }

        UserPosition position;
        rc = UserPosition::restore(parse_amount(user_json.at("shares")), std::move(queue),
                                   max_q4w_entries, position);
        if (rc != errors::OK) return rc;
        if (position.empty()) return errors::CORRUPT_STATE;

        if (__builtin_add_overflow(shares_sum, position.shares(), &shares_sum) ||
            __builtin_add_overflow(queued_sum, position.queued_shares(), &queued_sum)) {
            return errors::CORRUPT_STATE;
        }
        if (!slot.users.emplace(parse_key(key), std::move(position)).second) {
            return errors::CORRUPT_STATE;
        }
    }

    if (shares_sum != slot.state.total_shares() || queued_sum != slot.state.queued_shares()) {
        return errors::CORRUPT_STATE;
    }
    return errors::OK;
}

} // namespace

json BackstopVault::snapshot() const {
    json pools = json::object();

    registry_.for_each([&](const Address& address, const PoolSlot& slot) {
        json users = json::object();
        for (const auto& [user, position] : slot.users) {
            users[to_hex(user)] = position_to_json(position);
        }
        pools[to_hex(address)] = {
            {"total_shares", i128_to_string(slot.state.total_shares())},
            {"total_tokens", i128_to_string(slot.state.total_tokens())},
            {"queued_shares", i128_to_string(slot.state.queued_shares())},
            {"users", std::move(users)},
        };
    });

    return {{"pools", std::move(pools)}};
}

int32_t BackstopVault::restore(const json& snapshot) {
    SlotMap slots;

    try {
        for (const auto& [key, pool_json] : snapshot.at("pools").items()) {
            auto slot = std::make_unique<PoolSlot>();
            int32_t rc = slot_from_json(pool_json, config_.max_q4w_entries, *slot);
            if (rc != errors::OK) {
                spdlog::error("snapshot rejected: pool {} violates backstop invariants", key);
                return rc;
            }
            if (!slots.emplace(parse_key(key), std::move(slot)).second) {
                spdlog::error("snapshot rejected: pool {} listed twice", key);
                return errors::CORRUPT_STATE;
            }
        }
    } catch (const json::exception& e) {
        spdlog::error("snapshot rejected: {}", e.what());
        return errors::CORRUPT_STATE;
    } catch (const std::invalid_argument& e) {
        spdlog::error("snapshot rejected: {}", e.what());
        return errors::CORRUPT_STATE;
    }

    size_t count = slots.size();
    registry_.replace_all(std::move(slots));
    spdlog::info("restored backstop state for {} pools", count);
    return errors::OK;
}

} // namespace backstop
