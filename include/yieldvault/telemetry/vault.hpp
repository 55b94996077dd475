#pragma once

#include <ostream>

#include "lcr/metrics/counter.hpp"
#include "lcr/format.hpp"

namespace yieldvault::telemetry {

// ============================================================================
// Vault Telemetry
//
// Mechanical counters of the request/settlement pipeline. Single writer (the
// engine and the components it owns); read through copy_to() snapshots.
//
// Counters only count. They never feed back into accounting decisions.
// ============================================================================

struct Vault final {
    // ---------------------------------------------------------------------
    // Requests
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 deposit_requests_total;
    lcr::metrics::counter64 deposit_cancellations_total;
    lcr::metrics::counter64 redeem_requests_total;
    lcr::metrics::counter64 rejected_calls_total;

    // ---------------------------------------------------------------------
    // Settlement
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 deposit_batches_total;
    lcr::metrics::counter64 withdrawal_batches_total;
    lcr::metrics::counter64 deposits_fulfilled_total;
    lcr::metrics::counter64 withdrawals_fulfilled_total;
    lcr::metrics::counter64 shares_minted_total;
    lcr::metrics::counter64 shares_burned_total;

    // Deposits left queued because they would mint zero shares
    lcr::metrics::counter64 zero_share_skips_total;

    // Queue entries whose request record was missing
    lcr::metrics::counter64 stale_entries_total;

    // ---------------------------------------------------------------------
    // Fees
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 fees_collected_total;
    lcr::metrics::counter64 fees_forgone_total;

    // ---------------------------------------------------------------------
    // Pools
    // ---------------------------------------------------------------------
    lcr::metrics::counter64 assets_supplied_total;
    lcr::metrics::counter64 assets_withdrawn_total;
    lcr::metrics::counter64 source_failures_total;
    lcr::metrics::counter64 liquidity_shortfalls_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------
    inline void copy_to(Vault& other) const noexcept {
        deposit_requests_total.copy_to(other.deposit_requests_total);
        deposit_cancellations_total.copy_to(other.deposit_cancellations_total);
        redeem_requests_total.copy_to(other.redeem_requests_total);
        rejected_calls_total.copy_to(other.rejected_calls_total);

        deposit_batches_total.copy_to(other.deposit_batches_total);
        withdrawal_batches_total.copy_to(other.withdrawal_batches_total);
        deposits_fulfilled_total.copy_to(other.deposits_fulfilled_total);
        withdrawals_fulfilled_total.copy_to(other.withdrawals_fulfilled_total);
        shares_minted_total.copy_to(other.shares_minted_total);
        shares_burned_total.copy_to(other.shares_burned_total);
        zero_share_skips_total.copy_to(other.zero_share_skips_total);
        stale_entries_total.copy_to(other.stale_entries_total);

        fees_collected_total.copy_to(other.fees_collected_total);
        fees_forgone_total.copy_to(other.fees_forgone_total);

        assets_supplied_total.copy_to(other.assets_supplied_total);
        assets_withdrawn_total.copy_to(other.assets_withdrawn_total);
        source_failures_total.copy_to(other.source_failures_total);
        liquidity_shortfalls_total.copy_to(other.liquidity_shortfalls_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Vault Telemetry ===\n";
        os << "Requests\n";
        os << "  Deposit requests:     " << lcr::format_number_exact(deposit_requests_total.load()) << '\n';
        os << "  Deposit cancels:      " << lcr::format_number_exact(deposit_cancellations_total.load()) << '\n';
        os << "  Redeem requests:      " << lcr::format_number_exact(redeem_requests_total.load()) << '\n';
        os << "  Rejected calls:       " << lcr::format_number_exact(rejected_calls_total.load()) << '\n';

        os << "\nSettlement\n";
        os << "  Deposit batches:      " << lcr::format_number_exact(deposit_batches_total.load()) << '\n';
        os << "  Withdrawal batches:   " << lcr::format_number_exact(withdrawal_batches_total.load()) << '\n';
        os << "  Deposits fulfilled:   " << lcr::format_number_exact(deposits_fulfilled_total.load()) << '\n';
        os << "  Withdrawals settled:  " << lcr::format_number_exact(withdrawals_fulfilled_total.load()) << '\n';
        os << "  Shares minted:        " << lcr::format_number_exact(shares_minted_total.load()) << '\n';
        os << "  Shares burned:        " << lcr::format_number_exact(shares_burned_total.load()) << '\n';
        os << "  Zero-share skips:     " << lcr::format_number_exact(zero_share_skips_total.load()) << '\n';
        os << "  Stale entries:        " << lcr::format_number_exact(stale_entries_total.load()) << '\n';

        os << "\nFees\n";
        os << "  Collected:            " << lcr::format_number_exact(fees_collected_total.load()) << '\n';
        os << "  Forgone:              " << lcr::format_number_exact(fees_forgone_total.load()) << '\n';

        os << "\nPools\n";
        os << "  Assets supplied:      " << lcr::format_number_exact(assets_supplied_total.load()) << '\n';
        os << "  Assets withdrawn:     " << lcr::format_number_exact(assets_withdrawn_total.load()) << '\n';
        os << "  Source failures:      " << lcr::format_number_exact(source_failures_total.load()) << '\n';
        os << "  Liquidity shortfalls: " << lcr::format_number_exact(liquidity_shortfalls_total.load()) << '\n';
    }
};

} // namespace yieldvault::telemetry
