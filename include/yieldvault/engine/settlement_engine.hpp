#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "yieldvault/core/reentrancy_guard.hpp"
#include "yieldvault/config/vault_config.hpp"
#include "yieldvault/access/roles.hpp"
#include "yieldvault/registry/allow_list.hpp"
#include "yieldvault/token/asset_token.hpp"
#include "yieldvault/oracle/price_oracle.hpp"
#include "yieldvault/events/event.hpp"
#include "yieldvault/engine/vault_state.hpp"


namespace yieldvault::engine {

// Queue slot as seen from outside: controller plus the request's amount
// (assets for deposits, escrowed shares for redemptions).
struct QueueEntry {
    Address controller;
    Amount  amount{0};
};

/*
===============================================================================
SettlementEngine
===============================================================================

Queue-based vault: requests are admitted immediately and settled later, in
operator-triggered batches.

Request side (any caller)
  request_deposit   assets move into the vault now, shares are deferred
  cancel_deposit    a pending deposit is refunded in full
  request_redeem    shares move to escrow now, their asset value is fixed now,
                    assets are deferred

Settlement side (Executor)
  fulfill_deposits(batch, target)
      Prices the whole batch against one snapshot of (supply, backing):
        shares = supply == 0 ? assets : assets * supply / backing
      Stale entries are dropped without counting. Entries that would mint
      zero shares stay queued and the walk moves past them. The batch total
      goes to `target` with a single supply call; if that call fails the
      whole batch is left untouched.

  fulfill_withdrawals(batch)
      Settles from the head, one request at a time:
        principal = holder shares == 0 ? gross
                                       : holder principal * shares / holder shares
        fee       = max(0, gross - principal) * fee_bps / 10'000
        payout    = gross - fee
      Capital reserved for pending deposits is never used. A shortfall pulls
      from the allow-listed sources; if still short the call stops, keeping
      earlier settlements of the same call.

Ordering
  Both queues remove by swap-with-last, so a walk visits "current array
  order from the head", not strict insertion order.

Guarding
  Every mutating entry point holds the ReentrancyGuard for its whole
  duration, checks the caller's role and the pause flag, and only then
  touches state. Rejections change nothing.
===============================================================================
*/
class SettlementEngine {
public:
    SettlementEngine(VaultState& state, token::AssetToken& asset, const access::Roles& roles,
                     const registry::AllowList& sources, config::VaultConfig cfg = {});

    SettlementEngine(const SettlementEngine&) = delete;
    SettlementEngine& operator=(const SettlementEngine&) = delete;

    // ---------------------------------------------------------------------
    // Requests
    // ---------------------------------------------------------------------
    [[nodiscard]] Error request_deposit(const Address& caller, Amount assets, const Address& receiver);
    [[nodiscard]] Error cancel_deposit(const Address& caller);
    [[nodiscard]] Error request_redeem(const Address& caller, Amount shares, const Address& receiver);
    [[nodiscard]] Error transfer_shares(const Address& caller, const Address& to, Amount shares);

    // ---------------------------------------------------------------------
    // Settlement (Executor)
    // ---------------------------------------------------------------------
    [[nodiscard]] FulfillResult fulfill_deposits(const Address& caller, std::uint32_t batch_size, const Address& target);
    [[nodiscard]] FulfillResult fulfill_withdrawals(const Address& caller, std::uint32_t batch_size);

    // ---------------------------------------------------------------------
    // Manual capital management (Executor)
    // ---------------------------------------------------------------------
    [[nodiscard]] Error supply_to_pool(const Address& caller, const Address& pool, Amount amount);
    [[nodiscard]] Error withdraw_from_pool(const Address& caller, const Address& pool, Amount amount);
    [[nodiscard]] Error rebalance(const Address& caller, const Address& from, const Address& to, Amount amount);

    // ---------------------------------------------------------------------
    // Administration (Admin)
    // ---------------------------------------------------------------------
    [[nodiscard]] Error set_fee_bps(const Address& caller, std::uint64_t fee_bps);
    [[nodiscard]] Error set_fee_recipient(const Address& caller, const Address& recipient);
    [[nodiscard]] Error pause(const Address& caller);
    [[nodiscard]] Error unpause(const Address& caller);
    [[nodiscard]] Error set_oracle(const Address& caller, const oracle::PriceOracle* oracle);
    [[nodiscard]] Error set_price_id(const Address& caller, const std::string& price_id);

    // ---------------------------------------------------------------------
    // Events
    // ---------------------------------------------------------------------
    void subscribe(events::Sink sink);
    [[nodiscard]] inline std::uint64_t last_event_seq() const noexcept { return next_seq_ - 1; }

    // ---------------------------------------------------------------------
    // Valuation views
    // ---------------------------------------------------------------------
    [[nodiscard]] Amount total_assets() const;
    [[nodiscard]] std::uint64_t share_price() const;
    [[nodiscard]] Amount idle_balance() const noexcept;
    [[nodiscard]] Amount total_supply() const noexcept;
    [[nodiscard]] Amount balance_of(const Address& holder) const noexcept;
    [[nodiscard]] Amount pending_deposit_assets() const noexcept;
    [[nodiscard]] Amount total_requested_assets() const noexcept;

    [[nodiscard]] Amount convert_to_shares(Amount assets) const;
    [[nodiscard]] Amount convert_to_assets(Amount shares) const;
    [[nodiscard]] inline Amount preview_deposit(Amount assets) const { return convert_to_shares(assets); }
    [[nodiscard]] inline Amount preview_redeem(Amount shares) const { return convert_to_assets(shares); }

    [[nodiscard]] Error total_assets_usd(std::uint64_t now_s, oracle::UsdValuation& out) const;

    // ---------------------------------------------------------------------
    // Queue and request views
    // ---------------------------------------------------------------------
    [[nodiscard]] std::size_t deposit_queue_length() const noexcept;
    [[nodiscard]] std::optional<QueueEntry> deposit_queue_at(std::size_t index) const;
    [[nodiscard]] const queue::DepositRequest* deposit_request(const Address& controller) const;

    [[nodiscard]] std::size_t redeem_queue_length() const noexcept;
    [[nodiscard]] std::optional<QueueEntry> redeem_queue_at(std::size_t index) const;
    [[nodiscard]] const queue::WithdrawalRequest* withdrawal_request(const Address& controller) const;
    [[nodiscard]] Amount pending_redeem_shares(const Address& controller) const;

    [[nodiscard]] Amount pool_principal(const Address& pool) const noexcept;
    [[nodiscard]] ledger::PrincipalRecord principal_of(const Address& holder) const noexcept;

    // ---------------------------------------------------------------------
    // Configuration and state access
    // ---------------------------------------------------------------------
    [[nodiscard]] inline bool paused() const noexcept { return paused_; }
    [[nodiscard]] inline std::uint64_t fee_bps() const noexcept { return cfg_.fee_bps; }
    [[nodiscard]] inline const Address& fee_recipient() const noexcept { return cfg_.fee_recipient; }
    [[nodiscard]] inline const config::VaultConfig& vault_config() const noexcept { return cfg_; }
    [[nodiscard]] inline const Address& self() const noexcept { return state_.self; }
    [[nodiscard]] inline const VaultState& state() const noexcept { return state_; }
    [[nodiscard]] inline const registry::AllowList& sources() const noexcept { return sources_; }
    [[nodiscard]] inline const token::AssetToken& asset() const noexcept { return asset_; }
    [[nodiscard]] inline const telemetry::Vault& telemetry() const noexcept { return state_.telemetry; }

private:
    // Gate shared by every Executor entry point
    [[nodiscard]] Error check_executor_(const Address& caller) const;
    [[nodiscard]] Error check_admin_(const Address& caller) const;

    // Makes at least `needed` unreserved assets idle, pulling from sources
    [[nodiscard]] Error ensure_liquidity_(Amount needed);

    [[nodiscard]] Error supply_(const Address& caller, const Address& pool, Amount amount);
    [[nodiscard]] Error withdraw_(const Address& caller, const Address& pool, Amount amount, Amount& received);

    Error reject_(Error e, const char* op, const Address& caller);
    FulfillResult reject_batch_(Error e, const char* op, const Address& caller);
    void emit_(events::Event ev);

private:
    VaultState& state_;
    token::AssetToken& asset_;
    const access::Roles& roles_;
    const registry::AllowList& sources_;
    config::VaultConfig cfg_;

    const oracle::PriceOracle* oracle_{nullptr};
    bool paused_{false};

    ReentrancyGuard guard_;
    std::vector<events::Sink> sinks_;
    std::uint64_t next_seq_{1};
};

} // namespace yieldvault::engine
