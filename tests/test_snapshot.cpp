// Backstop - Snapshot / Restore Tests

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace backstop;
using namespace backstop::testing;
using json = nlohmann::json;

namespace {

// Two pools, a donation, a draw and queues in several states
void populate(VaultFixture& f) {
    REQUIRE(f.vault.register_pool(ADMIN, POOL_B) == errors::OK);

    f.deposit(ALICE, 1000);
    f.deposit(BOB, 250);
    f.fund(DONOR, 75);
    REQUIRE(f.vault.donate(DONOR, POOL, 75) == errors::OK);
    REQUIRE(f.vault.draw(ADMIN, POOL, 30, TREASURY) == errors::OK);

    REQUIRE(f.vault.queue_withdrawal(ALICE, POOL, ALICE, 100).status == errors::OK);
    f.clock.advance(f.vault.config().lock_period_seconds);
    REQUIRE(f.vault.queue_withdrawal(ALICE, POOL, ALICE, 50).status == errors::OK);

    f.fund(BOB, 40);
    REQUIRE(f.vault.deposit(BOB, POOL_B, BOB, 40).status == errors::OK);
}

}  // namespace

TEST_CASE("Snapshot round trip", "[snapshot]") {
    VaultFixture source;
    populate(source);
    json snap = source.vault.snapshot();

    FlakyToken token;
    ManualClock clock{source.clock.now()};
    BackstopVault restored(test_config(), token, clock);
    REQUIRE(restored.restore(snap) == errors::OK);

    REQUIRE(restored.pools() == source.vault.pools());
    for (const auto& pool : {POOL, POOL_B}) {
        REQUIRE(restored.pool_state(pool) == source.vault.pool_state(pool));
        REQUIRE(restored.verify_pool(pool) == errors::OK);
        for (const auto& user : {ALICE, BOB}) {
            auto a = restored.user_balance(pool, user);
            auto b = source.vault.user_balance(pool, user);
            REQUIRE(a->shares == b->shares);
            REQUIRE(a->queue == b->queue);
            REQUIRE(a->matured_shares == b->matured_shares);
        }
    }
    REQUIRE(restored.snapshot() == snap);
}

TEST_CASE("Snapshot layout", "[snapshot]") {
    VaultFixture f;
    f.deposit(ALICE, 1000);
    auto queued = f.vault.queue_withdrawal(ALICE, POOL, ALICE, 400);
    REQUIRE(queued.status == errors::OK);

    json pool = f.vault.snapshot().at("pools").at(to_hex(POOL));
    REQUIRE(pool.at("total_shares") == "1000");
    REQUIRE(pool.at("total_tokens") == "1000");
    REQUIRE(pool.at("queued_shares") == "400");

    json user = pool.at("users").at(to_hex(ALICE));
    REQUIRE(user.at("shares") == "1000");
    REQUIRE(user.at("q4w").size() == 1);
    REQUIRE(user.at("q4w")[0].at("amount") == "400");
    REQUIRE(user.at("q4w")[0].at("expiration") == queued.entry.expiration);
}

TEST_CASE("Restore rejects inconsistent snapshots", "[snapshot]") {
    VaultFixture f;
    populate(f);
    const json good = f.vault.snapshot();
    const std::string pool_key = to_hex(POOL);
    const std::string alice_key = to_hex(ALICE);

    json bad = good;

    SECTION("Totals disagree with users") {
        bad["pools"][pool_key]["total_shares"] = "1";
    }

    SECTION("Queued exceeds total") {
        bad["pools"][pool_key]["queued_shares"] = "999999";
    }

    SECTION("Malformed amount") {
        bad["pools"][pool_key]["total_tokens"] = "12x";
    }

    SECTION("Negative amount") {
        bad["pools"][pool_key]["total_tokens"] = "-5";
    }

    SECTION("Queue out of order") {
        auto& q4w = bad["pools"][pool_key]["users"][alice_key]["q4w"];
        REQUIRE(q4w.size() == 2);
        std::swap(q4w[0], q4w[1]);
    }

    SECTION("Negative expiration") {
        bad["pools"][pool_key]["users"][alice_key]["q4w"][0]["expiration"] = -1;
    }

    SECTION("Bad address key") {
        json pool = bad["pools"][pool_key];
        bad["pools"].erase(pool_key);
        bad["pools"]["0xnothex"] = pool;
    }

    SECTION("Missing pools") {
        bad = json::object();
    }

    SECTION("Wrong types") {
        bad["pools"][pool_key]["users"] = 7;
    }

    REQUIRE(f.vault.restore(bad) == errors::CORRUPT_STATE);

    // Existing state untouched
    REQUIRE(f.vault.snapshot() == good);
    REQUIRE(f.vault.verify_pool(POOL) == errors::OK);
}

TEST_CASE("Restore replaces all pools", "[snapshot]") {
    VaultFixture f;
    f.deposit(ALICE, 10);

    REQUIRE(f.vault.restore(json{{"pools", json::object()}}) == errors::OK);
    REQUIRE(f.vault.pools().empty());
    REQUIRE_FALSE(f.vault.is_registered(POOL));
    REQUIRE(f.vault.deposit(ALICE, POOL, ALICE, 1).status == errors::POOL_NOT_FOUND);
}

TEST_CASE("Restore rejects queues longer than the configured cap", "[snapshot]") {
    VaultFixture source;
    source.deposit(ALICE, 300);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(source.vault.queue_withdrawal(ALICE, POOL, ALICE, 10).status == errors::OK);
        source.clock.advance(source.vault.config().lock_period_seconds);
    }
    json snap = source.vault.snapshot();
    REQUIRE(snap.at("pools").at(to_hex(POOL)).at("users").at(to_hex(ALICE)).at("q4w").size() == 3);

    FlakyToken token;
    ManualClock clock{source.clock.now()};

    BackstopVault narrow(test_config().set_max_q4w_entries(2), token, clock);
    REQUIRE(narrow.restore(snap) == errors::CORRUPT_STATE);
    REQUIRE(narrow.pools().empty());

    BackstopVault wide(test_config().set_max_q4w_entries(3), token, clock);
    REQUIRE(wide.restore(snap) == errors::OK);
    REQUIRE(wide.verify_pool(POOL) == errors::OK);
}
