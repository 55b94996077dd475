#pragma once

#include <utility>

#include "yieldvault/core/types.hpp"
#include "yieldvault/token/asset_token.hpp"
#include "yieldvault/registry/allow_list.hpp"
#include "yieldvault/telemetry/vault.hpp"
#include "yieldvault/ledger/ledger.hpp"
#include "yieldvault/pool/allocation_tracker.hpp"
#include "yieldvault/queue/deposit_queue.hpp"
#include "yieldvault/queue/redeem_queue.hpp"


namespace yieldvault::engine {

// ---------------------------------------------------------------------------
// All mutable accounting state of one vault.
//
// Owned by the caller and handed to the SettlementEngine by reference; the
// engine is its single writer. `self` is the vault's own account: it holds
// the idle asset balance and the escrowed shares.
// ---------------------------------------------------------------------------
struct VaultState {
    VaultState(token::AssetToken& asset, const registry::AllowList& sources, Address self_address)
        : self(std::move(self_address))
        , ledger(asset, sources, self, telemetry)
        , tracker(asset, sources, self, telemetry)
    {}

    VaultState(const VaultState&) = delete;
    VaultState& operator=(const VaultState&) = delete;

    Address                 self;
    telemetry::Vault        telemetry;
    ledger::Ledger          ledger;
    pool::AllocationTracker tracker;
    queue::DepositQueue     deposits;
    queue::RedeemQueue      redemptions;
};

} // namespace yieldvault::engine
