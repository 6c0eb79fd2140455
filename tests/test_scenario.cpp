// Backstop - Scenario Runner Tests

#include "test_helpers.hpp"

#include <backstop/scenario.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace backstop;
using json = nlohmann::json;

namespace {

BackstopConfig sim_config() {
    BackstopConfig config;
    config.set_log_level("warn");
    return config;
}

}  // namespace

TEST_CASE("Scenario replays deposit, donate, draw and withdraw", "[scenario]") {
    json scenario = R"({
        "start_time": 1700000000,
        "steps": [
            {"op": "register", "caller": "admin", "pool": "pool"},
            {"op": "mint", "to": "alice", "amount": 1000},
            {"op": "mint", "to": "donor", "amount": "1000"},
            {"op": "deposit", "user": "alice", "pool": "pool", "amount": 1000},
            {"op": "donate", "caller": "donor", "pool": "pool", "amount": 1000},
            {"op": "queue", "user": "alice", "pool": "pool", "shares": 500},
            {"op": "withdraw", "user": "alice", "pool": "pool", "shares": 500},
            {"op": "advance", "seconds": 1468800},
            {"op": "withdraw", "user": "alice", "pool": "pool", "shares": 500},
            {"op": "draw", "caller": "admin", "pool": "pool", "amount": 500, "recipient": "treasury"},
            {"op": "view", "pool": "pool", "user": "alice"}
        ]
    })"_json;

    json result = run_scenario(sim_config(), scenario);
    const json& steps = result.at("steps");
    REQUIRE(steps.size() == 11);

    REQUIRE(steps[3].at("status") == "OK");
    REQUIRE(steps[3].at("shares_minted") == "1000");

    REQUIRE(steps[5].at("entry").at("expiration") == 1700000000 + 1468800);
    REQUIRE(steps[6].at("status") == "NOT_MATURED");
    REQUIRE(steps[7].at("now") == 1700000000 + 1468800);

    REQUIRE(steps[8].at("status") == "OK");
    REQUIRE(steps[8].at("tokens_out") == "1000");
    REQUIRE(steps[9].at("status") == "OK");

    const json& view = steps[10];
    REQUIRE(view.at("pool").at("total_shares") == "500");
    REQUIRE(view.at("pool").at("total_tokens") == "500");
    REQUIRE(view.at("pool").at("share_price_x18") == "1000000000000000000");
    REQUIRE(view.at("user").at("shares") == "500");
    REQUIRE(view.at("user").at("queue").empty());

    REQUIRE(result.at("token_balances").at("alice") == "1000");
    REQUIRE(result.at("token_balances").at("treasury") == "500");
    REQUIRE(result.at("token_balances").at("backstop") == "500");
    REQUIRE(result.at("accounts").at("admin").get<std::string>() == to_hex(address_from_id(0xAD)));
}

TEST_CASE("Scenario reports failures per step", "[scenario]") {
    json scenario = R"({
        "steps": [
            {"op": "register", "caller": "mallory", "pool": "pool"},
            {"op": "deposit", "user": "alice", "pool": "pool", "amount": 10},
            {"op": "register", "caller": "admin", "pool": "pool"},
            {"op": "deposit", "user": "alice", "pool": "pool", "amount": 10},
            {"op": "deposit", "caller": "mallory", "user": "alice", "pool": "pool", "amount": 10}
        ]
    })"_json;

    json result = run_scenario(sim_config(), scenario);
    const json& steps = result.at("steps");
    REQUIRE(steps[0].at("status") == "UNAUTHORIZED");
    REQUIRE(steps[1].at("status") == "POOL_NOT_FOUND");
    REQUIRE(steps[2].at("status") == "OK");
    REQUIRE(steps[3].at("status") == "TRANSFER_FAILED");
    REQUIRE(steps[4].at("status") == "UNAUTHORIZED");
    REQUIRE(result.at("snapshot").at("pools").size() == 1);
}

TEST_CASE("Scenario uses configured addresses", "[scenario]") {
    BackstopConfig config = sim_config();
    config.with_admin(address_from_id(0x42));

    json scenario = json::parse(R"({"steps": [
        {"op": "register", "caller": "0x0000000000000000000000000000000000000042", "pool": "p"}
    ]})");

    json result = run_scenario(config, scenario);
    REQUIRE(result.at("steps")[0].at("status") == "OK");
    REQUIRE(result.at("accounts").at("admin").get<std::string>() == to_hex(address_from_id(0x42)));
}

TEST_CASE("Malformed scenarios throw", "[scenario]") {
    REQUIRE_THROWS_AS(run_scenario(sim_config(), json::array()), std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), json{{"steps", 1}}), std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "explode"}]})"_json),
                      std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "mint", "to": "a", "amount": 1.5}]})"_json),
                      std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "advance", "seconds": -1}]})"_json),
                      std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "deposit", "pool": "p", "amount": 1}]})"_json),
                      std::runtime_error);
}

TEST_CASE("Scenario steps missing a numeric field throw", "[scenario]") {
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "mint", "to": "a"}]})"_json),
                      std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [{"op": "advance"}]})"_json),
                      std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [
        {"op": "queue", "user": "a", "pool": "p"}]})"_json), std::runtime_error);
    REQUIRE_THROWS_AS(run_scenario(sim_config(), R"({"steps": [
        {"op": "cancel", "user": "a", "pool": "p", "amount": 1}]})"_json), std::runtime_error);
}

TEST_CASE("Scenario amounts above the signed 64-bit range", "[scenario]") {
    json scenario = R"({
        "steps": [
            {"op": "register", "caller": "admin", "pool": "pool"},
            {"op": "mint", "to": "alice", "amount": 9223372036854775808},
            {"op": "deposit", "user": "alice", "pool": "pool", "amount": 18446744073709551615}
        ]
    })"_json;
    REQUIRE(scenario.at("steps")[1].at("amount").is_number_unsigned());

    json result = run_scenario(sim_config(), scenario);
    const json& steps = result.at("steps");
    REQUIRE(steps[1].at("status") == "OK");
    REQUIRE(result.at("token_balances").at("alice") == "9223372036854775808");

    // More than alice holds, so the transfer fails rather than the amount
    REQUIRE(steps[2].at("status") == "TRANSFER_FAILED");

    scenario["steps"][2]["amount"] = 9223372036854775808ULL;
    result = run_scenario(sim_config(), scenario);
    REQUIRE(result.at("steps")[2].at("status") == "OK");
    REQUIRE(result.at("steps")[2].at("shares_minted") == "9223372036854775808");
    REQUIRE(result.at("token_balances").at("alice") == "0");
}

TEST_CASE("Scenario view reports an unrepresentable price", "[scenario]") {
    json scenario = R"({
        "steps": [
            {"op": "register", "caller": "admin", "pool": "pool"},
            {"op": "mint", "to": "alice", "amount": 1},
            {"op": "mint", "to": "donor", "amount": "200000000000000000000"},
            {"op": "deposit", "user": "alice", "pool": "pool", "amount": 1},
            {"op": "donate", "caller": "donor", "pool": "pool", "amount": "200000000000000000000"},
            {"op": "view", "pool": "pool", "user": "alice"},
            {"op": "view", "pool": "elsewhere"}
        ]
    })"_json;

    json result = run_scenario(sim_config(), scenario);
    const json& view = result.at("steps")[5];
    REQUIRE(view.at("status") == "ARITHMETIC_OVERFLOW");
    REQUIRE(view.at("pool").at("total_shares") == "1");
    REQUIRE(view.at("pool").at("total_tokens") == "200000000000000000001");
    REQUIRE_FALSE(view.at("pool").contains("share_price_x18"));
    REQUIRE(view.at("user").at("shares") == "1");

    REQUIRE(result.at("steps")[6].at("status") == "POOL_NOT_FOUND");
}
