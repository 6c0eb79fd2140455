#ifndef BACKSTOP_SCENARIO_HPP
#define BACKSTOP_SCENARIO_HPP

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"

namespace backstop {

// =============================================================================
// Scenario Runner
// =============================================================================
//
// Replays a JSON scenario against a fresh vault backed by an InMemoryToken and
// a ManualClock:
//
//   { "start_time": 1700000000,
//     "steps": [ { "op": "register", "caller": "admin", "pool": "pool_a" },
//                { "op": "mint", "to": "alice", "amount": "1000" },
//                { "op": "deposit", "user": "alice", "pool": "pool_a", "amount": 1000 },
//                { "op": "advance", "seconds": 1468800 }, ... ] }
//
// Accounts are 0x-prefixed hex addresses or names; each new name is bound to
// a fresh address. "admin" and "backstop" name the configured addresses.
//
// Returns { "steps": [ per-step status and results ], "snapshot": ...,
//           "accounts": { name: hex }, "token_balances": { name: dec } }.
// Throws std::runtime_error if the scenario itself is malformed (missing or
// mistyped fields, unknown ops); operation failures are reported per step and
// do not stop the run. A "view" whose share price does not fit in 128 bits
// reports ARITHMETIC_OVERFLOW with the pool totals but no share_price_x18.

nlohmann::json run_scenario(const BackstopConfig& config, const nlohmann::json& scenario);

} // namespace backstop

#endif // BACKSTOP_SCENARIO_HPP
