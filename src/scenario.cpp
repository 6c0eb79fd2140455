// =============================================================================
// scenario.cpp - JSON scenario replay over an in-memory token and clock
// =============================================================================

#include "backstop/scenario.hpp"
#include "backstop/vault.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>

namespace backstop {

using json = nlohmann::json;

namespace {

constexpr uint32_t DEFAULT_BACKSTOP_ID = 0xB5;
constexpr uint32_t DEFAULT_ADMIN_ID = 0xAD;
constexpr uint32_t FIRST_NAMED_ID = 0x1000;

// Binds scenario account names to addresses
class AccountBook {
public:
    AccountBook(const Address& admin, const Address& backstop) {
        names_["admin"] = admin;
        names_["backstop"] = backstop;
    }

    Address resolve(const std::string& name) {
        if (auto hex = address_from_hex(name)) {
            return *hex;
        }
        auto it = names_.find(name);
        if (it != names_.end()) {
            return it->second;
        }
        Address addr = address_from_id(next_id_++);
        names_.emplace(name, addr);
        return addr;
    }

    const std::map<std::string, Address>& names() const { return names_; }

private:
    std::map<std::string, Address> names_;
    uint32_t next_id_ = FIRST_NAMED_ID;
};

I128 parse_amount(const json& j) {
    if (j.is_number_unsigned()) {
        return static_cast<I128>(j.get<uint64_t>());
    }
    if (j.is_number_integer()) {
        return static_cast<I128>(j.get<int64_t>());
    }
    if (j.is_string()) {
        if (auto v = i128_from_string(j.get<std::string>())) {
            return *v;
        }
    }
    throw std::runtime_error("Scenario amount must be an integer or decimal string: " + j.dump());
}

uint64_t parse_u64(const json& j, const char* key) {
    if (!j.is_number_unsigned()) {
        throw std::runtime_error(std::string("Scenario field '") + key + "' must be a non-negative integer");
    }
    return j.get<uint64_t>();
}

const json& value(const json& step, const char* key) {
    if (!step.contains(key)) {
        throw std::runtime_error(std::string("Scenario step missing field '") + key + "': " +
                                 step.dump());
    }
    return step.at(key);
}

std::string field(const json& step, const char* key) {
    if (!step.contains(key) || !step.at(key).is_string()) {
        throw std::runtime_error(std::string("Scenario step missing string field '") + key + "': " +
                                 step.dump());
    }
    return step.at(key).get<std::string>();
}

json queue_to_json(const std::vector<Q4W>& queue) {
    json out = json::array();
    for (const auto& entry : queue) {
        out.push_back({{"amount", i128_to_string(entry.amount)},
                       {"expiration", entry.expiration}});
    }
    return out;
}

} // namespace

json run_scenario(const BackstopConfig& base_config, const json& scenario) {
    if (!scenario.is_object() || !scenario.contains("steps") || !scenario.at("steps").is_array()) {
        throw std::runtime_error("Scenario must be an object with a 'steps' array");
    }

    BackstopConfig config = base_config;
    if (is_zero_address(config.backstop_address)) {
        config.backstop_address = address_from_id(DEFAULT_BACKSTOP_ID);
    }
    if (is_zero_address(config.admin)) {
        config.admin = address_from_id(DEFAULT_ADMIN_ID);
    }

    Timestamp start = 0;
    if (scenario.contains("start_time")) {
        start = parse_u64(scenario.at("start_time"), "start_time");
    }

    InMemoryToken token;
    ManualClock clock(start);
    BackstopVault vault(config, token, clock);
    AccountBook accounts(config.admin, config.backstop_address);

    json results = json::array();
    size_t index = 0;

    for (const auto& step : scenario.at("steps")) {
        std::string op = field(step, "op");
        json out = {{"index", index++}, {"op", op}};
        int32_t rc = errors::OK;

        if (op == "register") {
            rc = vault.register_pool(accounts.resolve(field(step, "caller")),
                                     accounts.resolve(field(step, "pool")));
        } else if (op == "mint") {
            rc = token.mint(accounts.resolve(field(step, "to")), parse_amount(value(step, "amount")));
        } else if (op == "deposit") {
            Address user = accounts.resolve(field(step, "user"));
            Address caller = step.contains("caller") ? accounts.resolve(field(step, "caller")) : user;
            auto res = vault.deposit(caller, accounts.resolve(field(step, "pool")), user,
                                     parse_amount(value(step, "amount")));
            rc = res.status;
            out["shares_minted"] = i128_to_string(res.shares_minted);
        } else if (op == "queue") {
            Address user = accounts.resolve(field(step, "user"));
            Address caller = step.contains("caller") ? accounts.resolve(field(step, "caller")) : user;
            auto res = vault.queue_withdrawal(caller, accounts.resolve(field(step, "pool")), user,
                                              parse_amount(value(step, "shares")));
            rc = res.status;
            if (rc == errors::OK) {
                out["entry"] = {{"amount", i128_to_string(res.entry.amount)},
                                {"expiration", res.entry.expiration}};
            }
        } else if (op == "cancel") {
            Address user = accounts.resolve(field(step, "user"));
            Address caller = step.contains("caller") ? accounts.resolve(field(step, "caller")) : user;
            rc = vault.cancel_queued_withdrawal(caller, accounts.resolve(field(step, "pool")), user,
                                                parse_u64(value(step, "expiration"), "expiration"),
                                                parse_amount(value(step, "amount")));
        } else if (op == "dequeue") {
            Address user = accounts.resolve(field(step, "user"));
            Address caller = step.contains("caller") ? accounts.resolve(field(step, "caller")) : user;
            rc = vault.dequeue_withdrawal(caller, accounts.resolve(field(step, "pool")), user,
                                          parse_amount(value(step, "amount")));
        } else if (op == "withdraw") {
            Address user = accounts.resolve(field(step, "user"));
            Address caller = step.contains("caller") ? accounts.resolve(field(step, "caller")) : user;
            auto res = vault.withdraw(caller, accounts.resolve(field(step, "pool")), user,
                                      parse_amount(value(step, "shares")));
            rc = res.status;
            out["tokens_out"] = i128_to_string(res.tokens_out);
        } else if (op == "draw") {
            rc = vault.draw(accounts.resolve(field(step, "caller")),
                            accounts.resolve(field(step, "pool")),
                            parse_amount(value(step, "amount")),
                            accounts.resolve(field(step, "recipient")));
        } else if (op == "donate") {
            rc = vault.donate(accounts.resolve(field(step, "caller")),
                              accounts.resolve(field(step, "pool")),
                              parse_amount(value(step, "amount")));
        } else if (op == "advance") {
            clock.advance(parse_u64(value(step, "seconds"), "seconds"));
            out["now"] = clock.now();
        } else if (op == "view") {
            Address pool = accounts.resolve(field(step, "pool"));
            auto state = vault.pool_state(pool);
            if (!state) {
                rc = errors::POOL_NOT_FOUND;
            } else {
                auto price = vault.share_price_x18(pool);
                rc = price.status;
                out["pool"] = {{"total_shares", i128_to_string(state->total_shares())},
                               {"total_tokens", i128_to_string(state->total_tokens())},
                               {"queued_shares", i128_to_string(state->queued_shares())}};
                if (price.status == errors::OK) {
                    out["pool"]["share_price_x18"] = i128_to_string(price.price_x18);
                }
                if (step.contains("user")) {
                    auto balance = vault.user_balance(pool, accounts.resolve(field(step, "user")));
                    if (balance) {
                        out["user"] = {{"shares", i128_to_string(balance->shares)},
                                       {"queued_shares", i128_to_string(balance->queued_shares)},
                                       {"unqueued_shares", i128_to_string(balance->unqueued_shares)},
                                       {"matured_shares", i128_to_string(balance->matured_shares)},
                                       {"queue", queue_to_json(balance->queue)}};
                    }
                }
            }
        } else {
            throw std::runtime_error("Unknown scenario op: " + op);
        }

        out["status"] = error_name(rc);
        results.push_back(std::move(out));
    }

    json account_map = json::object();
    json balances = json::object();
    for (const auto& [name, address] : accounts.names()) {
        account_map[name] = to_hex(address);
        balances[name] = i128_to_string(token.balance_of(address));
    }

    return {
        {"steps", std::move(results)},
        {"snapshot", vault.snapshot()},
        {"accounts", std::move(account_map)},
        {"token_balances", std::move(balances)},
    };
}

} // namespace backstop
