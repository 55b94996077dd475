// ============================================================================
// vault_simulation
//
// One full cycle of the queue-based vault against in-memory yield sources:
//
//   1. users request deposits
//   2. the executor drains the deposit queue into the reserve pool
//   3. half of the allocation is rebalanced into the share pool
//   4. both sources accrue yield
//   5. users request redemption of all their shares
//   6. the executor drains the redeem queue (pulling liquidity from sources)
//
// The status report, telemetry, an optional USD valuation and (optionally)
// the verified event journal are printed at the end.
// ============================================================================

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "yieldvault.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"

#include "common/cli/simulation_params.hpp"

using namespace yieldvault;

namespace {

const Address ADMIN    = "admin";
const Address EXECUTOR = "executor";
const Address GOVERNOR = "governor";
const Address VAULT    = "vault";
const Address RESERVE  = "pool.reserve";
const Address SHARES   = "pool.shares";

[[nodiscard]] bool check(Error e, const char* what) {
    if (e != Error::None) {
        YV_ERROR("[SIM] " << what << " failed: " << e);
        return false;
    }
    return true;
}

[[nodiscard]] std::uint64_t unix_now() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace


int main(int argc, char** argv) {
    const auto params = examples::cli::simulation::configure(argc, argv, "Yield vault simulation");
    params.dump("=== Simulation Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------
    config::VaultConfig cfg;
    cfg.fee_recipient = "treasury";
    cfg.price_id = "USDC/USD";
    if (!params.config_path.empty()) {
        config::Result r = config::load_from_file(params.config_path, cfg);
        if (r != config::Result::Ok) {
            std::cerr << "Invalid configuration: " << config::to_string(r) << std::endl;
            return EXIT_FAILURE;
        }
    }
    std::cout << cfg << "\n";

    std::uint64_t unit = 1;
    for (std::uint8_t i = 0; i < cfg.asset_decimals; ++i) {
        unit *= 10;
    }

    // -------------------------------------------------------------
    // Wiring
    // -------------------------------------------------------------
    token::AssetToken usdc("asset.usdc", "USDC", cfg.asset_decimals);
    access::Roles roles(ADMIN);
    registry::AllowList allow_list(roles);
    sim::ReservePool reserve(RESERVE, usdc);
    sim::SharePool shares(SHARES, usdc);
    sim::PriceFeed feed;

    if (!check(roles.grant(ADMIN, access::Role::Executor, EXECUTOR), "grant executor") ||
        !check(roles.grant(ADMIN, access::Role::Governor, GOVERNOR), "grant governor") ||
        !check(allow_list.set_source(GOVERNOR, RESERVE, source::Handle::reserve_style(reserve)), "list reserve") ||
        !check(allow_list.set_source(GOVERNOR, SHARES, source::Handle::share_style(shares)), "list shares")) {
        return EXIT_FAILURE;
    }

    engine::VaultState state(usdc, allow_list, VAULT);
    engine::SettlementEngine vault(state, usdc, roles, allow_list, cfg);

    events::Journal journal;
    if (!params.journal_path.empty()) {
        events::Status s = journal.open(params.journal_path);
        if (s != events::Status::Ok) {
            std::cerr << "Cannot open journal: " << events::to_string(s) << std::endl;
            return EXIT_FAILURE;
        }
        vault.subscribe(journal.sink());
    }
    vault.subscribe([](const events::Event& ev) {
        YV_DEBUG("[EVENT] " << ev);
    });

    feed.set_price(cfg.price_id, oracle::Price{.price = 99'990'000, .conf = 5'000, .expo = -8, .publish_time = unix_now()});
    if (!check(vault.set_oracle(ADMIN, &feed), "bind oracle")) {
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // 1. Deposits
    // -------------------------------------------------------------
    std::vector<Address> users;
    for (std::uint32_t i = 0; i < params.users; ++i) {
        const Address user = "user" + std::to_string(i + 1);
        const Amount amount = params.deposit * unit;
        if (!check(usdc.mint(user, amount), "faucet")) {
            return EXIT_FAILURE;
        }
        usdc.approve(user, VAULT, amount);
        if (!check(vault.request_deposit(user, amount, user), "request_deposit")) {
            return EXIT_FAILURE;
        }
        users.push_back(user);
    }

    // -------------------------------------------------------------
    // 2. Settle deposits into the reserve pool
    // -------------------------------------------------------------
    ops::DrainResult deposits = ops::drain_deposits(vault, EXECUTOR, RESERVE, params.batch);
    std::cout << "Deposits settled: " << deposits.processed << " in " << deposits.batches << " batches\n";

    // -------------------------------------------------------------
    // 3. Rebalance half into the share pool
    // -------------------------------------------------------------
    const Amount half = vault.pool_principal(RESERVE) / 2;
    if (half > 0 && !check(vault.rebalance(EXECUTOR, RESERVE, SHARES, half), "rebalance")) {
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // 4. Yield
    // -------------------------------------------------------------
    const Amount reserve_yield = lcr::mul_div(vault.state().ledger.source_value(RESERVE), params.yield_bps, config::BPS_DENOMINATOR);
    const Amount share_yield = lcr::mul_div(shares.total_assets(), params.yield_bps, config::BPS_DENOMINATOR);
    reserve.accrue(VAULT, reserve_yield);
    shares.accrue(share_yield);
    std::cout << "Yield accrued: " << lcr::format_units(reserve_yield + share_yield, cfg.asset_decimals) << "\n";
    std::cout << report::capture(vault);

    // -------------------------------------------------------------
    // 5. Redeem everything
    // -------------------------------------------------------------
    for (const Address& user : users) {
        const Amount owned = vault.balance_of(user);
        if (owned > 0 && !check(vault.request_redeem(user, owned, user), "request_redeem")) {
            return EXIT_FAILURE;
        }
    }

    // -------------------------------------------------------------
    // 6. Settle withdrawals
    // -------------------------------------------------------------
    ops::DrainResult withdrawals = ops::drain_withdrawals(vault, EXECUTOR, params.batch);
    std::cout << "Withdrawals settled: " << withdrawals.processed << " in " << withdrawals.batches << " batches";
    if (withdrawals.last_error != Error::None) {
        std::cout << " (stopped: " << withdrawals.last_error << ")";
    }
    std::cout << "\n";

    // -------------------------------------------------------------
    // Results
    // -------------------------------------------------------------
    std::cout << report::capture(vault);
    for (const Address& user : users) {
        std::cout << "  " << user << " balance " << lcr::format_units(usdc.balance_of(user), cfg.asset_decimals) << "\n";
    }
    if (!cfg.fee_recipient.empty()) {
        std::cout << "  " << cfg.fee_recipient << " fees " << lcr::format_units(usdc.balance_of(cfg.fee_recipient), cfg.asset_decimals) << "\n";
    }

    oracle::UsdValuation usd;
    if (Error e = vault.total_assets_usd(unix_now(), usd); e == Error::None) {
        std::cout << "  Remaining assets in USD: " << usd.usd << " (" << usd.price << ")\n";
    } else {
        std::cout << "  USD valuation unavailable: " << e << "\n";
    }

    vault.telemetry().debug_dump(std::cout);

    if (journal.is_open()) {
        journal.close();
        events::ReplayResult replay;
        events::Status s = events::read_journal(params.journal_path, replay);
        std::cout << "\nJournal " << params.journal_path << ": " << events::to_string(s)
                  << ", " << replay.records << " records verified\n";
        if (s != events::Status::Ok) {
            return EXIT_FAILURE;
        }
    }
    return withdrawals.last_error == Error::None ? EXIT_SUCCESS : EXIT_FAILURE;
}
