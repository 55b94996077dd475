#pragma once

#include <unordered_map>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "yieldvault/token/asset_token.hpp"
#include "yieldvault/registry/allow_list.hpp"
#include "yieldvault/telemetry/vault.hpp"


namespace yieldvault::ledger {

// ---------------------------------------------------------------------------
// Per-holder cost basis
// ---------------------------------------------------------------------------
// Lifetime principal contributed and shares minted, decremented by the exact
// amounts attributed to each redemption (floored at zero). Used only to split
// a redemption into return of capital and yield.
struct PrincipalRecord {
    Amount principal{0};
    Amount shares{0};
};


/*
===============================================================================
Ledger
===============================================================================

Source of truth for the share supply, the vault's asset valuation and the
per-holder cost basis.

Valuation:
  total_assets()   = idle balance of the vault
                   + sum over the allow-list of the vault's position in each
                     source, valued through the source's own shape
  backing_assets() = total_assets() - pending_deposit_assets()   (floored)
  share_price()    = backing_assets() * PRICE_SCALE / total_supply()
                     or PRICE_SCALE while no share exists

A source whose valuation call throws contributes zero; the failure is logged
and counted, never propagated. Sources are consulted fresh on every call.

Aggregate counters:
  pending_deposit_assets()  sum of live deposit requests' assets
  total_requested_assets()  sum of live withdrawal requests' snapshotted assets

The ledger does not decide anything: the settlement engine drives every
mutation and keeps the aggregates in lockstep with the queues.
===============================================================================
*/
class Ledger {
public:
    Ledger(const token::AssetToken& asset, const registry::AllowList& sources,
           Address self, telemetry::Vault& telemetry);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    [[nodiscard]] inline const Address& self() const noexcept { return self_; }

    // ---------------------------------------------------------------------
    // Valuation
    // ---------------------------------------------------------------------
    [[nodiscard]] Amount idle_balance() const noexcept;
    [[nodiscard]] Amount total_assets() const;
    [[nodiscard]] Amount backing_assets() const;
    [[nodiscard]] std::uint64_t share_price() const;

    // Vault position in one listed source, 0 if unlisted or failing
    [[nodiscard]] Amount source_value(const Address& source) const;

    // ---------------------------------------------------------------------
    // Shares
    // ---------------------------------------------------------------------
    [[nodiscard]] inline Amount total_supply() const noexcept { return total_supply_; }
    [[nodiscard]] Amount balance_of(const Address& holder) const noexcept;

    // AmountOverflow when total supply would not fit; nothing is minted then
    [[nodiscard]] Error mint(const Address& to, Amount shares);
    [[nodiscard]] Error burn(const Address& from, Amount shares);
    [[nodiscard]] Error transfer_shares(const Address& from, const Address& to, Amount shares);

    // ---------------------------------------------------------------------
    // Cost basis
    // ---------------------------------------------------------------------
    [[nodiscard]] PrincipalRecord principal_of(const Address& holder) const noexcept;
    void record_deposit(const Address& holder, Amount assets, Amount shares);
    void record_redemption(const Address& holder, Amount principal, Amount shares);

    // ---------------------------------------------------------------------
    // Aggregate counters
    // ---------------------------------------------------------------------
    [[nodiscard]] inline Amount pending_deposit_assets() const noexcept { return pending_deposit_assets_; }
    [[nodiscard]] inline Amount total_requested_assets() const noexcept { return total_requested_assets_; }

    inline void add_pending_deposit(Amount assets) noexcept { pending_deposit_assets_ += assets; }
    void release_pending_deposit(Amount assets) noexcept;

    inline void add_requested(Amount assets) noexcept { total_requested_assets_ += assets; }
    void release_requested(Amount assets) noexcept;

private:
    [[nodiscard]] Amount value_of_(const Address& source, const source::Handle& handle) const;

private:
    const token::AssetToken& asset_;
    const registry::AllowList& sources_;
    Address self_;
    telemetry::Vault& telemetry_;

    Amount total_supply_{0};
    std::unordered_map<Address, Amount> shares_;
    std::unordered_map<Address, PrincipalRecord> principal_;

    Amount pending_deposit_assets_{0};
    Amount total_requested_assets_{0};
};

} // namespace yieldvault::ledger
