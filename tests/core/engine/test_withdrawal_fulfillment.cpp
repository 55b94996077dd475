/*
===============================================================================
 engine::SettlementEngine - Redemption Path Tests
===============================================================================

Scope:
------
request_redeem escrow and sequential fulfill_withdrawals: yield split, fee,
liquidity sourcing and partial progress.

Covered Requirements:
---------------------
W1. request_redeem validation and escrow
W2. Performance fee applies to yield only
W3. Cost basis shrinks proportionally over partial redemptions
W4. Deposit and full redemption round trip without yield
W5. Fee with no recipient stays in the vault
W6. Capital of pending deposits is never used for payouts
W7. A shortfall stops the batch, keeping earlier settlements
W8. Stale slots are dropped; zero batch and empty queue are no-ops
W9. Shares received by transfer carry no cost basis
W10. A settlement that cannot complete stops the batch before paying

===============================================================================
*/

#include <iostream>

#include "common/harness/vault.hpp"

using namespace yieldvault;
using namespace test;


// -----------------------------------------------------------------------------
// W1. request_redeem validation and escrow
// -----------------------------------------------------------------------------
void test_request_redeem_validation() {
    std::cout << "[TEST] W1 request_redeem validation and escrow\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 100, RESERVE);

    TEST_CHECK(h.vault.request_redeem("alice", 0, "alice") == Error::ZeroAmount);
    TEST_CHECK(h.vault.request_redeem("alice", 10, "") == Error::InvalidReceiver);
    TEST_CHECK(h.vault.request_redeem("alice", 10, VAULT) == Error::InvalidReceiver);
    TEST_CHECK(h.vault.request_redeem("alice", 101, "alice") == Error::InsufficientBalance);
    TEST_CHECK(h.vault.request_redeem("bob", 1, "bob") == Error::InsufficientBalance);

    TEST_CHECK(h.vault.request_redeem("alice", 40, "dave") == Error::None);
    TEST_CHECK(h.vault.request_redeem("alice", 10, "alice") == Error::AlreadyPending);

    // Shares sit in escrow, the entitlement is fixed
    TEST_CHECK(h.vault.balance_of("alice") == 60);
    TEST_CHECK(h.vault.balance_of(VAULT) == 40);
    TEST_CHECK(h.vault.total_supply() == 100);
    TEST_CHECK(h.vault.pending_redeem_shares("alice") == 40);
    TEST_CHECK(h.vault.total_requested_assets() == 40);
    TEST_CHECK(h.vault.redeem_queue_length() == 1);
    TEST_CHECK(h.vault.redeem_queue_at(0)->amount == 40);

    const queue::WithdrawalRequest* req = h.vault.withdrawal_request("alice");
    TEST_CHECK(req != nullptr);
    TEST_CHECK(req->assets == 40);
    TEST_CHECK(req->receiver == "dave");

    // Later yield does not change a fixed entitlement
    h.reserve.accrue(VAULT, 100);
    TEST_CHECK(h.vault.withdrawal_request("alice")->assets == 40);

    TEST_CHECK(h.events.back().type == events::EventType::RedeemRequested);
    TEST_CHECK(h.events.back().shares == 40);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W2. Performance fee applies to yield only
// -----------------------------------------------------------------------------
void test_fee_on_yield_only() {
    std::cout << "[TEST] W2 fee on yield only\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 900, RESERVE);
    h.deposit_and_fulfill("bob", 100, RESERVE);
    h.reserve.accrue(VAULT, 100);
    TEST_CHECK(h.vault.total_assets() == 1'100);

    TEST_CHECK(h.vault.request_redeem("bob", 100, "bob") == Error::None);
    TEST_CHECK(h.vault.withdrawal_request("bob")->assets == 110);

    FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 1);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 1);
    TEST_CHECK(r.assets == 110);

    // principal 100, yield 10, fee 10%
    TEST_CHECK(h.asset.balance_of("bob") == 109);
    TEST_CHECK(h.asset.balance_of(TREASURY) == 1);
    TEST_CHECK(h.vault.balance_of("bob") == 0);
    TEST_CHECK(h.vault.balance_of(VAULT) == 0);
    TEST_CHECK(h.vault.total_supply() == 900);
    TEST_CHECK(h.vault.total_requested_assets() == 0);
    TEST_CHECK(h.vault.principal_of("bob").principal == 0);
    TEST_CHECK(h.vault.principal_of("bob").shares == 0);
    TEST_CHECK(h.vault.total_assets() == 990);

    const events::Event& ev = h.events.back();
    TEST_CHECK(ev.type == events::EventType::WithdrawalFulfilled);
    TEST_CHECK(ev.assets == 109);
    TEST_CHECK(ev.fee == 1);
    TEST_CHECK(ev.shares == 100);
    TEST_CHECK(h.count(events::EventType::PoolWithdrawn) == 0);
    TEST_CHECK(h.vault.telemetry().fees_collected_total.load() == 1);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W3. Cost basis shrinks proportionally over partial redemptions
// -----------------------------------------------------------------------------
void test_partial_redemptions() {
    std::cout << "[TEST] W3 partial redemptions\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 100, SHARES);
    h.shares.accrue(50);

    // 50 shares -> 75 gross, 50 principal, 25 yield, fee 2
    TEST_CHECK(h.vault.request_redeem("alice", 50, "alice") == Error::None);
    TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 5).processed == 1);
    TEST_CHECK(h.asset.balance_of("alice") == 73);
    TEST_CHECK(h.vault.principal_of("alice").principal == 50);
    TEST_CHECK(h.vault.principal_of("alice").shares == 50);

    TEST_CHECK(h.vault.request_redeem("alice", 50, "alice") == Error::None);
    TEST_CHECK(h.vault.withdrawal_request("alice")->assets == 75);
    TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 5).processed == 1);
    TEST_CHECK(h.asset.balance_of("alice") == 146);
    TEST_CHECK(h.asset.balance_of(TREASURY) == 4);
    TEST_CHECK(h.vault.principal_of("alice").principal == 0);
    TEST_CHECK(h.vault.total_supply() == 0);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W4. Deposit and full redemption round trip without yield
// -----------------------------------------------------------------------------
void test_round_trip() {
    std::cout << "[TEST] W4 round trip\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 250, RESERVE);
    TEST_CHECK(h.vault.preview_redeem(250) == 250);

    TEST_CHECK(h.vault.request_redeem("alice", 250, "alice") == Error::None);
    FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 5);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 1);

    TEST_CHECK(h.asset.balance_of("alice") == 250);
    TEST_CHECK(h.asset.balance_of(TREASURY) == 0);
    TEST_CHECK(h.vault.total_supply() == 0);
    TEST_CHECK(h.vault.total_assets() == 0);
    TEST_CHECK(h.vault.pool_principal(RESERVE) == 0);
    TEST_CHECK(h.vault.share_price() == config::PRICE_SCALE);

    // Liquidity came out of the reserve
    TEST_CHECK(h.count(events::EventType::WithdrawalFulfilled) == 1);
    TEST_CHECK(h.events.back().fee == 0);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W5. Fee with no recipient stays in the vault
// -----------------------------------------------------------------------------
void test_fee_without_recipient() {
    std::cout << "[TEST] W5 fee without recipient\n";

    VaultHarness h;
    TEST_CHECK(h.vault.set_fee_recipient(ADMIN, "") == Error::None);
    h.deposit_and_fulfill("alice", 900, RESERVE);
    h.deposit_and_fulfill("bob", 100, RESERVE);
    h.reserve.accrue(VAULT, 100);

    TEST_CHECK(h.vault.request_redeem("bob", 100, "bob") == Error::None);
    TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 1).ok());

    TEST_CHECK(h.asset.balance_of("bob") == 109);
    TEST_CHECK(h.vault.idle_balance() == 1);
    TEST_CHECK(h.vault.total_assets() == 991);
    TEST_CHECK(h.vault.telemetry().fees_forgone_total.load() == 1);
    TEST_CHECK(h.vault.telemetry().fees_collected_total.load() == 0);
    TEST_CHECK(h.events.back().fee == 1);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W6. Capital of pending deposits is never used for payouts
// -----------------------------------------------------------------------------
void test_pending_deposits_reserved() {
    std::cout << "[TEST] W6 pending deposit capital is reserved\n";

    {
        VaultHarness h;
        h.deposit_and_fulfill("alice", 100, RESERVE);
        TEST_CHECK(h.deposit("bob", 50) == Error::None);

        TEST_CHECK(h.vault.request_redeem("alice", 40, "alice") == Error::None);
        TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 1).ok());

        // Paid from the reserve, bob's 50 untouched
        TEST_CHECK(h.asset.balance_of("alice") == 40);
        TEST_CHECK(h.vault.idle_balance() == 50);
        TEST_CHECK(h.vault.pool_principal(RESERVE) == 60);
        TEST_CHECK(h.count(events::EventType::PoolWithdrawn) == 0);
        h.check_invariants();
    }
    {
        VaultHarness h;
        h.deposit_and_fulfill("alice", 100, RESERVE);
        TEST_CHECK(h.deposit("bob", 50) == Error::None);
        TEST_CHECK(h.vault.request_redeem("alice", 40, "alice") == Error::None);

        // Reserve gone: idle covers the payout only by eating bob's deposit
        h.reserve.set_failing(true);
        FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 1);
        TEST_CHECK(r.error == Error::InsufficientLiquidity);
        TEST_CHECK(r.processed == 0);
        TEST_CHECK(h.vault.idle_balance() == 50);
        TEST_CHECK(h.asset.balance_of("alice") == 0);
        TEST_CHECK(h.vault.redeem_queue_length() == 1);

        TEST_CHECK(h.vault.cancel_deposit("bob") == Error::None);
        TEST_CHECK(h.asset.balance_of("bob") == 50);
        h.check_invariants();
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W7. A shortfall stops the batch, keeping earlier settlements
// -----------------------------------------------------------------------------
void test_shortfall_stops_batch() {
    std::cout << "[TEST] W7 shortfall stops the batch\n";

    VaultHarness h;
    h.deposit_and_fulfill("user1", 100, RESERVE);
    h.deposit_and_fulfill("user2", 100, SHARES);
    h.deposit_and_fulfill("user3", 100, SHARES);

    for (const char* user : {"user1", "user2", "user3"}) {
        TEST_CHECK(h.vault.request_redeem(user, 100, user) == Error::None);
    }
    h.shares.set_failing(true);

    FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 5);
    TEST_CHECK(r.error == Error::InsufficientLiquidity);
    TEST_CHECK(r.processed == 1);
    TEST_CHECK(r.assets == 100);

    TEST_CHECK(h.asset.balance_of("user1") == 100);
    TEST_CHECK(h.asset.balance_of("user2") == 0);
    TEST_CHECK(h.asset.balance_of("user3") == 0);
    TEST_CHECK(h.vault.redeem_queue_length() == 2);
    TEST_CHECK(h.vault.total_requested_assets() == 200);
    TEST_CHECK(h.vault.balance_of(VAULT) == 200);
    TEST_CHECK(h.vault.telemetry().liquidity_shortfalls_total.load() == 1);

    // Source back: the rest settles
    h.shares.set_failing(false);
    r = h.vault.fulfill_withdrawals(EXECUTOR, 5);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 2);
    TEST_CHECK(h.asset.balance_of("user2") == 100);
    TEST_CHECK(h.asset.balance_of("user3") == 100);
    TEST_CHECK(h.vault.total_supply() == 0);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W8. Stale slots are dropped; zero batch and empty queue are no-ops
// -----------------------------------------------------------------------------
void test_stale_and_noops() {
    std::cout << "[TEST] W8 stale slots and no-ops\n";

    VaultHarness h;
    FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 5);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 0);

    h.deposit_and_fulfill("a", 10, RESERVE);
    h.deposit_and_fulfill("b", 20, RESERVE);
    TEST_CHECK(h.vault.request_redeem("a", 10, "a") == Error::None);
    TEST_CHECK(h.vault.request_redeem("b", 20, "b") == Error::None);

    r = h.vault.fulfill_withdrawals(EXECUTOR, 0);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 0);
    TEST_CHECK(h.vault.redeem_queue_length() == 2);

    TEST_CHECK(h.state.redemptions.erase_request("a"));
    h.state.ledger.release_requested(10);

    r = h.vault.fulfill_withdrawals(EXECUTOR, 1);
    TEST_CHECK(r.ok());
    TEST_CHECK(r.processed == 1);
    TEST_CHECK(h.asset.balance_of("a") == 0);
    TEST_CHECK(h.asset.balance_of("b") == 20);
    TEST_CHECK(h.vault.redeem_queue_length() == 0);
    TEST_CHECK(h.vault.telemetry().stale_entries_total.load() == 1);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W9. Shares received by transfer carry no cost basis
// -----------------------------------------------------------------------------
void test_transferred_shares_have_no_basis() {
    std::cout << "[TEST] W9 transferred shares carry no cost basis\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 100, RESERVE);
    h.reserve.accrue(VAULT, 100);

    TEST_CHECK(h.vault.transfer_shares("alice", "bob", 50) == Error::None);
    TEST_CHECK(h.vault.transfer_shares("alice", VAULT, 1) == Error::InvalidReceiver);
    TEST_CHECK(h.vault.transfer_shares("alice", "bob", 0) == Error::ZeroAmount);
    TEST_CHECK(h.vault.transfer_shares("alice", "bob", 51) == Error::InsufficientBalance);

    // Whole 100 gross treated as principal: no fee
    TEST_CHECK(h.vault.request_redeem("bob", 50, "bob") == Error::None);
    TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 1).ok());
    TEST_CHECK(h.asset.balance_of("bob") == 100);
    TEST_CHECK(h.asset.balance_of(TREASURY) == 0);

    // alice keeps her full basis against her remaining 50 shares
    TEST_CHECK(h.vault.request_redeem("alice", 50, "alice") == Error::None);
    TEST_CHECK(h.vault.fulfill_withdrawals(EXECUTOR, 1).ok());
    TEST_CHECK(h.asset.balance_of("alice") == 95);
    TEST_CHECK(h.asset.balance_of(TREASURY) == 5);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// W10. A settlement that cannot complete stops the batch before paying
// -----------------------------------------------------------------------------
void test_settlement_failure_pays_nothing() {
    std::cout << "[TEST] W10 settlement failure pays nothing\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 100, RESERVE);
    h.deposit_and_fulfill("bob", 100, RESERVE);
    h.reserve.accrue(VAULT, 20);

    TEST_CHECK(h.vault.request_redeem("alice", 40, "alice") == Error::None);
    TEST_CHECK(h.vault.request_redeem("bob", 50, "bob") == Error::None);
    TEST_CHECK(h.vault.balance_of(VAULT) == 90);
    const Amount bob_entitlement = h.vault.withdrawal_request("bob")->assets;

    // Escrow loses bob's shares behind the engine's back
    TEST_CHECK(h.state.ledger.transfer_shares(VAULT, "mallory", 50) == Error::None);

    FulfillResult r = h.vault.fulfill_withdrawals(EXECUTOR, 5);
    TEST_CHECK(r.error == Error::InsufficientBalance);
    TEST_CHECK(r.processed == 1);

    // alice settled in full
    TEST_CHECK(h.vault.withdrawal_request("alice") == nullptr);
    TEST_CHECK(h.asset.balance_of("alice") > 0);
    const Amount treasury_after_alice = h.asset.balance_of(TREASURY);

    // bob received nothing and no fee was taken on his request
    TEST_CHECK(h.asset.balance_of("bob") == 0);
    TEST_CHECK(h.asset.balance_of(TREASURY) == treasury_after_alice);
    TEST_CHECK(h.vault.withdrawal_request("bob") != nullptr);
    TEST_CHECK(h.vault.redeem_queue_length() == 1);
    TEST_CHECK(h.vault.total_requested_assets() == bob_entitlement);
    TEST_CHECK(h.vault.telemetry().withdrawals_fulfilled_total.load() == 1);
    TEST_CHECK(h.count(events::EventType::WithdrawalFulfilled) == 1);

    h.check_invariants();
    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_request_redeem_validation();
    test_fee_on_yield_only();
    test_partial_redemptions();
    test_round_trip();
    test_fee_without_recipient();
    test_pending_deposits_reserved();
    test_shortfall_stops_batch();
    test_stale_and_noops();
    test_transferred_shares_have_no_basis();
    test_settlement_failure_pays_nothing();

    std::cout << "\n[WITHDRAWAL FULFILLMENT TESTS PASSED]\n";
    return 0;
}
