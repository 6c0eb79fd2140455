// Backstop - Concurrency Tests

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace backstop;
using namespace backstop::testing;

namespace {

constexpr int ROUNDS = 200;
constexpr I128 DEPOSIT = 10;
constexpr I128 SEED = 100000;

}  // namespace

TEST_CASE("Concurrent operations across pools keep invariants", "[concurrency]") {
    VaultFixture f;
    REQUIRE(f.vault.register_pool(ADMIN, POOL_B) == errors::OK);

    const std::vector<Address> users_a = {address_from_id(0x3001), address_from_id(0x3002)};
    const std::vector<Address> users_b = {address_from_id(0x4001), address_from_id(0x4002)};
    for (const auto& user : users_a) f.fund(user, DEPOSIT * ROUNDS);
    for (const auto& user : users_b) f.fund(user, DEPOSIT * ROUNDS);
    f.fund(DONOR, ROUNDS);

    // Deep pool B so donations never push a deposit below one share
    f.fund(BOB, SEED);
    REQUIRE(f.vault.deposit(BOB, POOL_B, BOB, SEED).status == errors::OK);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    auto churn = [&](Address pool, Address user) {
        for (int i = 0; i < ROUNDS; ++i) {
            if (f.vault.deposit(user, pool, user, DEPOSIT).status != errors::OK) ++failures;
            if (f.vault.queue_withdrawal(user, pool, user, 5).status != errors::OK) ++failures;
            if (f.vault.dequeue_withdrawal(user, pool, user, 5) != errors::OK) ++failures;
        }
    };

    for (const auto& user : users_a) threads.emplace_back(churn, POOL, user);
    for (const auto& user : users_b) threads.emplace_back(churn, POOL_B, user);

    threads.emplace_back([&] {
        for (int i = 0; i < ROUNDS; ++i) {
            if (f.vault.donate(DONOR, POOL_B, 1) != errors::OK) ++failures;
        }
    });

    // Readers run alongside writers
    threads.emplace_back([&] {
        for (int i = 0; i < ROUNDS; ++i) {
            if (f.vault.verify_pool(POOL) != errors::OK) ++failures;
            if (f.vault.share_price_x18(POOL_B).status != errors::OK) ++failures;
            f.vault.snapshot();
        }
    });

    for (auto& t : threads) t.join();

    REQUIRE(failures.load() == 0);
    f.check_invariants(POOL);
    f.check_invariants(POOL_B);

    // Pool A never changed price, so every deposit minted 1:1
    PoolState a = f.state(POOL);
    REQUIRE(a.total_shares() == 2 * DEPOSIT * ROUNDS);
    REQUIRE(a.total_tokens() == 2 * DEPOSIT * ROUNDS);
    REQUIRE(a.queued_shares() == 0);

    PoolState b = f.state(POOL_B);
    REQUIRE(b.total_tokens() == SEED + 2 * DEPOSIT * ROUNDS + ROUNDS);
    REQUIRE(b.queued_shares() == 0);

    // Every token held by the backstop is accounted to exactly one pool
    REQUIRE(f.token.balance_of(BACKSTOP) == a.total_tokens() + b.total_tokens());
}
