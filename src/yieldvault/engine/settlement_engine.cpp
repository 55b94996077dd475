#include "yieldvault/engine/settlement_engine.hpp"

#include <unordered_map>
#include <utility>

#include "yieldvault/config/constants.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::engine {

namespace {

// ---------------------------------------------------------------------------
// Copy-free view of a deposit queue walk.
//
// Replays swap-with-last removals on an overlay (slot -> moved identity) so a
// batch can be priced and planned without touching the live queue. Applying
// the recorded removals to the live queue in the same order reproduces the
// same final layout.
// ---------------------------------------------------------------------------
class StagedWalk {
public:
    explicit StagedWalk(const queue::IndexedQueue& order)
        : order_(order)
        , size_(order.size())
    {}

    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }

    [[nodiscard]] const Address& at(std::size_t slot) const {
        auto it = moved_.find(slot);
        return (it == moved_.end()) ? order_.at(slot) : it->second;
    }

    void remove_at(std::size_t slot) {
        const std::size_t last = size_ - 1;
        if (slot != last) {
            Address tail = at(last);
            moved_[slot] = std::move(tail);
        }
        moved_.erase(last);
        --size_;
    }

private:
    const queue::IndexedQueue& order_;
    std::size_t size_;
    std::unordered_map<std::size_t, Address> moved_;
};

struct StagedDeposit {
    Address controller;
    Address receiver;
    Amount  assets{0};
    Amount  shares{0};
};

} // namespace


SettlementEngine::SettlementEngine(VaultState& state, token::AssetToken& asset, const access::Roles& roles,
                                   const registry::AllowList& sources, config::VaultConfig cfg)
    : state_(state)
    , asset_(asset)
    , roles_(roles)
    , sources_(sources)
    , cfg_(std::move(cfg))
{
    YV_INFO("[VAULT] " << cfg_.name << " (" << cfg_.symbol << ") at " << state_.self
            << ", fee " << cfg_.fee_bps << " bps");
}

// ===========================================================================
// Requests
// ===========================================================================

Error SettlementEngine::request_deposit(const Address& caller, Amount assets, const Address& receiver) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                          return reject_(Error::Reentrancy, "request_deposit", caller);
    if (paused_)                                    return reject_(Error::Paused, "request_deposit", caller);
    if (assets == 0)                                return reject_(Error::ZeroAmount, "request_deposit", caller);
    if (receiver.empty() || receiver == state_.self) {
        return reject_(Error::InvalidReceiver, "request_deposit", caller);
    }
    if (state_.deposits.is_pending(caller))         return reject_(Error::AlreadyPending, "request_deposit", caller);
    if (asset_.balance_of(caller) < assets)         return reject_(Error::InsufficientBalance, "request_deposit", caller);
    if (asset_.allowance(caller, state_.self) < assets) {
        return reject_(Error::InsufficientAllowance, "request_deposit", caller);
    }

    Error e = asset_.transfer_from(state_.self, caller, state_.self, assets);
    if (e != Error::None) {
        return reject_(e, "request_deposit", caller);
    }
    e = state_.deposits.enqueue(queue::DepositRequest{
        .controller = caller,
        .receiver = receiver,
        .assets = assets
    });
    if (e != Error::None) {
        // Not reachable after the is_pending() check; undo the pull
        if (asset_.transfer(state_.self, caller, assets) != Error::None) {
            YV_ERROR("[VAULT] Refund of " << assets << " to " << caller << " failed");
        }
        return reject_(e, "request_deposit", caller);
    }
    state_.ledger.add_pending_deposit(assets);
    state_.telemetry.deposit_requests_total.inc();

    YV_DEBUG("[VAULT] Deposit requested by " << caller << ": " << assets << " for " << receiver);
    emit_(events::Event{
        .type = events::EventType::DepositRequested,
        .controller = caller,
        .counterparty = receiver,
        .assets = assets
    });
    return Error::None;
}

Error SettlementEngine::cancel_deposit(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_(Error::Reentrancy, "cancel_deposit", caller);
    }
    const queue::DepositRequest* req = state_.deposits.find(caller);
    if (req == nullptr) {
        return reject_(Error::NoPendingRequest, "cancel_deposit", caller);
    }
    const Amount assets = req->assets;

    Error e = asset_.transfer(state_.self, caller, assets);
    if (e != Error::None) {
        YV_ERROR("[VAULT] Cannot refund " << assets << " to " << caller << ": " << e);
        return reject_(Error::InsufficientLiquidity, "cancel_deposit", caller);
    }
    state_.deposits.erase_request(caller);
    state_.deposits.remove_entry(caller);
    state_.ledger.release_pending_deposit(assets);
    state_.telemetry.deposit_cancellations_total.inc();

    YV_DEBUG("[VAULT] Deposit of " << assets << " cancelled by " << caller);
    emit_(events::Event{
        .type = events::EventType::DepositCancelled,
        .controller = caller,
        .counterparty = caller,
        .assets = assets
    });
    return Error::None;
}

Error SettlementEngine::request_redeem(const Address& caller, Amount shares, const Address& receiver) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                           return reject_(Error::Reentrancy, "request_redeem", caller);
    if (paused_)                                     return reject_(Error::Paused, "request_redeem", caller);
    if (shares == 0)                                 return reject_(Error::ZeroAmount, "request_redeem", caller);
    if (receiver.empty() || receiver == state_.self) {
        return reject_(Error::InvalidReceiver, "request_redeem", caller);
    }
    if (state_.redemptions.is_pending(caller))       return reject_(Error::AlreadyPending, "request_redeem", caller);
    if (state_.ledger.balance_of(caller) < shares)   return reject_(Error::InsufficientBalance, "request_redeem", caller);

    // Entitlement is fixed now, at the current share price
    const Amount assets = convert_to_assets(shares);
    if (assets == 0) {
        return reject_(Error::ZeroAssets, "request_redeem", caller);
    }

    Error e = state_.ledger.transfer_shares(caller, state_.self, shares);
    if (e != Error::None) {
        return reject_(e, "request_redeem", caller);
    }
    e = state_.redemptions.enqueue(queue::WithdrawalRequest{
        .controller = caller,
        .shares = shares,
        .assets = assets,
        .receiver = receiver
    });
    if (e != Error::None) {
        if (state_.ledger.transfer_shares(state_.self, caller, shares) != Error::None) {
            YV_ERROR("[VAULT] Escrow release of " << shares << " shares to " << caller << " failed");
        }
        return reject_(e, "request_redeem", caller);
    }
    state_.ledger.add_requested(assets);
    state_.telemetry.redeem_requests_total.inc();

    YV_DEBUG("[VAULT] Redeem requested by " << caller << ": " << shares << " shares worth " << assets);
    emit_(events::Event{
        .type = events::EventType::RedeemRequested,
        .controller = caller,
        .counterparty = receiver,
        .assets = assets,
        .shares = shares
    });
    return Error::None;
}

Error SettlementEngine::transfer_shares(const Address& caller, const Address& to, Amount shares) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                    return reject_(Error::Reentrancy, "transfer_shares", caller);
    if (shares == 0)                          return reject_(Error::ZeroAmount, "transfer_shares", caller);
    if (to.empty() || to == state_.self)      return reject_(Error::InvalidReceiver, "transfer_shares", caller);

    Error e = state_.ledger.transfer_shares(caller, to, shares);
    if (e != Error::None) {
        return reject_(e, "transfer_shares", caller);
    }
    YV_TRACE("[VAULT] " << caller << " moved " << shares << " shares to " << to);
    return Error::None;
}

// ===========================================================================
// Deposit fulfillment
// ===========================================================================

FulfillResult SettlementEngine::fulfill_deposits(const Address& caller, std::uint32_t batch_size, const Address& target) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_batch_(Error::Reentrancy, "fulfill_deposits", caller);
    }
    if (Error e = check_executor_(caller); e != Error::None) {
        return reject_batch_(e, "fulfill_deposits", caller);
    }
    if (batch_size == 0 || batch_size > config::MAX_DEPOSIT_BATCH) {
        return reject_batch_(Error::InvalidBatchSize, "fulfill_deposits", caller);
    }
    if (!sources_.is_allowed(target)) {
        return reject_batch_(Error::SourceNotAllowed, "fulfill_deposits", caller);
    }

    FulfillResult result;
    if (state_.deposits.empty()) {
        return result;
    }

    // ---- Price snapshot, shared by the whole batch ----
    const Amount supply = state_.ledger.total_supply();
    const Amount backing = state_.ledger.backing_assets();
    if (supply > 0 && backing == 0) {
        YV_ERROR("[VAULT] Cannot price deposits: " << supply << " shares against zero backing");
        return reject_batch_(Error::ZeroBacking, "fulfill_deposits", caller);
    }
    state_.telemetry.deposit_batches_total.inc();

    // ---- Plan the walk ----
    StagedWalk walk(state_.deposits.order());
    std::vector<Address> removals;       // live-queue removals, in walk order
    std::vector<StagedDeposit> staged;
    std::uint64_t stale = 0;
    std::uint64_t skipped = 0;
    Amount minted = 0;                   // shares staged so far

    std::size_t i = 0;
    while (result.processed < batch_size && i < walk.size()) {
        Address controller = walk.at(i);
        const queue::DepositRequest* req = state_.deposits.find(controller);
        if (req == nullptr) {
            walk.remove_at(i);
            removals.push_back(std::move(controller));
            ++stale;
            continue;
        }
        Amount shares = req->assets;
        Amount supply_after = 0;
        if ((supply > 0 && !lcr::checked_mul_div(req->assets, supply, backing, shares)) ||
            !lcr::checked_add(minted, shares, minted) ||
            !lcr::checked_add(supply, minted, supply_after)) {
            YV_ERROR("[VAULT] Deposit of " << req->assets << " by " << controller << " against "
                     << supply << " shares and " << backing << " backing overflows the share supply");
            return reject_batch_(Error::AmountOverflow, "fulfill_deposits", caller);
        }
        if (shares == 0) {
            // Left pending for a later batch
            YV_DEBUG("[VAULT] Deposit of " << req->assets << " by " << controller << " would mint zero shares, kept");
            ++skipped;
            ++i;
            continue;
        }
        walk.remove_at(i);
        staged.push_back(StagedDeposit{
            .controller = controller,
            .receiver = req->receiver,
            .assets = req->assets,
            .shares = shares
        });
        removals.push_back(std::move(controller));
        result.assets += req->assets;
        ++result.processed;
    }

    // ---- One external call for the whole batch ----
    if (result.assets > 0) {
        Error e = state_.tracker.supply(target, result.assets);
        if (e != Error::None) {
            YV_ERROR("[VAULT] Supply of " << result.assets << " to " << target << " failed (" << e
                     << "), batch of " << result.processed << " left queued");
            return reject_batch_(e, "fulfill_deposits", caller);
        }
    }

    // ---- Commit ----
    for (const Address& controller : removals) {
        state_.deposits.erase_request(controller);
        state_.deposits.remove_entry(controller);
    }
    state_.telemetry.stale_entries_total.inc(stale);
    state_.telemetry.zero_share_skips_total.inc(skipped);

    for (const StagedDeposit& d : staged) {
        // Cannot fail: the staged total was checked against the supply above
        if (Error e = state_.ledger.mint(d.receiver, d.shares); e != Error::None) {
            YV_ERROR("[VAULT] Mint of " << d.shares << " shares to " << d.receiver << " failed: " << e);
            result.error = e;
            continue;
        }
        state_.ledger.record_deposit(d.receiver, d.assets, d.shares);
        state_.ledger.release_pending_deposit(d.assets);
        state_.telemetry.deposits_fulfilled_total.inc();
        state_.telemetry.shares_minted_total.inc(d.shares);

        YV_DEBUG("[VAULT] Deposit fulfilled: " << d.controller << " " << d.assets
                 << " -> " << d.shares << " shares to " << d.receiver);
        emit_(events::Event{
            .type = events::EventType::DepositFulfilled,
            .controller = d.controller,
            .counterparty = d.receiver,
            .assets = d.assets,
            .shares = d.shares
        });
    }
    if (result.assets > 0) {
        emit_(events::Event{
            .type = events::EventType::PoolSupplied,
            .controller = caller,
            .counterparty = target,
            .assets = result.assets
        });
    }

    YV_INFO("[VAULT] Deposit batch: " << result.processed << " fulfilled, " << result.assets
            << " supplied to " << target << ", " << skipped << " kept, " << stale << " stale, "
            << state_.deposits.size() << " queued");
    return result;
}

// ===========================================================================
// Withdrawal fulfillment
// ===========================================================================

FulfillResult SettlementEngine::fulfill_withdrawals(const Address& caller, std::uint32_t batch_size) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_batch_(Error::Reentrancy, "fulfill_withdrawals", caller);
    }
    if (Error e = check_executor_(caller); e != Error::None) {
        return reject_batch_(e, "fulfill_withdrawals", caller);
    }

    FulfillResult result;
    if (batch_size == 0 || state_.redemptions.empty()) {
        return result;
    }
    state_.telemetry.withdrawal_batches_total.inc();

    while (result.processed < batch_size && !state_.redemptions.empty()) {
        const Address controller = state_.redemptions.at(0);
        const queue::WithdrawalRequest* found = state_.redemptions.find(controller);
        if (found == nullptr) {
            // Stale slot: drop it and look at whatever moved into the head
            state_.redemptions.remove_entry(controller);
            state_.telemetry.stale_entries_total.inc();
            continue;
        }
        const queue::WithdrawalRequest req = *found;

        // ---- Split into return of capital and yield ----
        const Amount gross = req.assets;
        const ledger::PrincipalRecord basis = state_.ledger.principal_of(controller);
        const Amount principal = (basis.shares == 0)
            ? gross
            : lcr::mul_div(basis.principal, req.shares, basis.shares);
        const Amount yield = lcr::saturating_sub(gross, principal);
        const Amount fee = lcr::mul_div(yield, cfg_.fee_bps, config::BPS_DENOMINATOR);
        const Amount payout = gross - fee;

        // ---- Liquidity ----
        Error e = ensure_liquidity_(gross);
        if (e != Error::None) {
            state_.telemetry.liquidity_shortfalls_total.inc();
            YV_ERROR("[VAULT] Cannot fund withdrawal of " << gross << " for " << controller
                     << ", stopping after " << result.processed << " settled");
            result.error = e;
            break;
        }

        // ---- Settle: checks first, so the transfers cannot run short ----
        if (state_.ledger.balance_of(state_.self) < req.shares) {
            YV_ERROR("[VAULT] Escrow of " << controller << " short of " << req.shares << " shares");
            result.error = Error::InsufficientBalance;
            break;
        }
        if (asset_.balance_of(state_.self) < gross) {
            YV_ERROR("[VAULT] Vault holds " << asset_.balance_of(state_.self) << ", cannot pay " << gross);
            result.error = Error::InsufficientLiquidity;
            break;
        }
        const bool collect_fee = fee > 0 && !cfg_.fee_recipient.empty();
        e = asset_.transfer(state_.self, req.receiver, payout);
        if (e != Error::None) {
            YV_ERROR("[VAULT] Payout of " << payout << " to " << req.receiver << " failed: " << e);
            result.error = e;
            break;
        }
        if (collect_fee) {
            e = asset_.transfer(state_.self, cfg_.fee_recipient, fee);
            if (e != Error::None) {
                YV_ERROR("[VAULT] Fee transfer of " << fee << " to " << cfg_.fee_recipient << " failed: " << e);
                result.error = e;
                break;
            }
            state_.telemetry.fees_collected_total.inc(fee);
        } else if (fee > 0) {
            state_.telemetry.fees_forgone_total.inc(fee);
        }
        e = state_.ledger.burn(state_.self, req.shares);
        if (e != Error::None) {
            // Not reachable after the escrow check above
            YV_ERROR("[VAULT] Burn of " << req.shares << " escrowed shares failed: " << e);
            result.error = e;
            break;
        }

        state_.ledger.record_redemption(controller, principal, req.shares);
        state_.redemptions.erase_request(controller);
        state_.redemptions.remove_entry(controller);
        state_.ledger.release_requested(gross);

        state_.telemetry.withdrawals_fulfilled_total.inc();
        state_.telemetry.shares_burned_total.inc(req.shares);
        result.assets += gross;
        ++result.processed;

        YV_DEBUG("[VAULT] Withdrawal fulfilled: " << controller << " " << req.shares << " shares, gross "
                 << gross << ", principal " << principal << ", fee " << fee << ", payout " << payout
                 << " to " << req.receiver);
        emit_(events::Event{
            .type = events::EventType::WithdrawalFulfilled,
            .controller = controller,
            .counterparty = req.receiver,
            .assets = payout,
            .shares = req.shares,
            .fee = fee
        });
    }

    YV_INFO("[VAULT] Withdrawal batch: " << result.processed << " fulfilled, " << result.assets
            << " released, " << state_.redemptions.size() << " queued"
            << (result.ok() ? "" : " (stopped: insufficient liquidity)"));
    return result;
}

Error SettlementEngine::ensure_liquidity_(Amount needed) {
    const Amount available = lcr::saturating_sub(state_.ledger.idle_balance(), state_.ledger.pending_deposit_assets());
    if (available >= needed) {
        return Error::None;
    }
    const Amount shortfall = needed - available;
    YV_DEBUG("[VAULT] Short of " << shortfall << ", pulling from sources");
    if (!state_.tracker.withdraw_as_needed(shortfall)) {
        YV_WARN("[VAULT] Sources could not cover the full shortfall of " << shortfall);
    }
    // Re-check: sources may deliver more or less than they report
    const Amount after = lcr::saturating_sub(state_.ledger.idle_balance(), state_.ledger.pending_deposit_assets());
    return (after >= needed) ? Error::None : Error::InsufficientLiquidity;
}

// ===========================================================================
// Helpers
// ===========================================================================

Error SettlementEngine::check_executor_(const Address& caller) const {
    if (!roles_.has_role(access::Role::Executor, caller)) {
        return Error::Unauthorized;
    }
    if (paused_) {
        return Error::Paused;
    }
    return Error::None;
}

Error SettlementEngine::check_admin_(const Address& caller) const {
    return roles_.has_role(access::Role::Admin, caller) ? Error::None : Error::Unauthorized;
}

Error SettlementEngine::reject_(Error e, const char* op, const Address& caller) {
    state_.telemetry.rejected_calls_total.inc();
    YV_DEBUG("[VAULT] " << op << " by " << caller << " rejected: " << e);
    return e;
}

FulfillResult SettlementEngine::reject_batch_(Error e, const char* op, const Address& caller) {
    return FulfillResult{.error = reject_(e, op, caller), .processed = 0, .assets = 0};
}

void SettlementEngine::subscribe(events::Sink sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void SettlementEngine::emit_(events::Event ev) {
    ev.seq = next_seq_++;
    for (const auto& sink : sinks_) {
        sink(ev);
    }
}

} // namespace yieldvault::engine
