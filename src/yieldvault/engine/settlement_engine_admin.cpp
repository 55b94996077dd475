#include "yieldvault/engine/settlement_engine.hpp"

#include <exception>

#include "yieldvault/config/constants.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::engine {

// ===========================================================================
// Manual capital management
// ===========================================================================

Error SettlementEngine::supply_to_pool(const Address& caller, const Address& pool, Amount amount) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_(Error::Reentrancy, "supply_to_pool", caller);
    }
    if (Error e = check_executor_(caller); e != Error::None) {
        return reject_(e, "supply_to_pool", caller);
    }
    if (amount == 0) {
        return reject_(Error::ZeroAmount, "supply_to_pool", caller);
    }
    if (!sources_.is_allowed(pool)) {
        return reject_(Error::SourceNotAllowed, "supply_to_pool", caller);
    }
    // Capital of pending deposits is reserved for their own batch
    const Amount available = lcr::saturating_sub(state_.ledger.idle_balance(), state_.ledger.pending_deposit_assets());
    if (amount > available) {
        return reject_(Error::InsufficientLiquidity, "supply_to_pool", caller);
    }
    return supply_(caller, pool, amount);
}

Error SettlementEngine::withdraw_from_pool(const Address& caller, const Address& pool, Amount amount) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_(Error::Reentrancy, "withdraw_from_pool", caller);
    }
    if (Error e = check_executor_(caller); e != Error::None) {
        return reject_(e, "withdraw_from_pool", caller);
    }
    if (amount == 0) {
        return reject_(Error::ZeroAmount, "withdraw_from_pool", caller);
    }
    if (!sources_.is_allowed(pool)) {
        return reject_(Error::SourceNotAllowed, "withdraw_from_pool", caller);
    }
    Amount received = 0;
    return withdraw_(caller, pool, amount, received);
}

Error SettlementEngine::rebalance(const Address& caller, const Address& from, const Address& to, Amount amount) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired()) {
        return reject_(Error::Reentrancy, "rebalance", caller);
    }
    if (Error e = check_executor_(caller); e != Error::None) {
        return reject_(e, "rebalance", caller);
    }
    if (amount == 0) {
        return reject_(Error::ZeroAmount, "rebalance", caller);
    }
    if (!sources_.is_allowed(from) || !sources_.is_allowed(to)) {
        return reject_(Error::SourceNotAllowed, "rebalance", caller);
    }

    Amount received = 0;
    if (Error e = withdraw_(caller, from, amount, received); e != Error::None) {
        return e;
    }
    if (received == 0) {
        YV_WARN("[VAULT] Rebalance " << from << " -> " << to << ": nothing received");
        return Error::None;
    }
    // Only what actually arrived moves on; on failure it stays idle
    if (Error e = supply_(caller, to, received); e != Error::None) {
        YV_ERROR("[VAULT] Rebalance " << from << " -> " << to << ": " << received
                 << " withdrawn but supply failed (" << e << "), kept idle");
        return e;
    }
    YV_INFO("[VAULT] Rebalanced " << received << " from " << from << " to " << to);
    return Error::None;
}

Error SettlementEngine::supply_(const Address& caller, const Address& pool, Amount amount) {
    Error e = state_.tracker.supply(pool, amount);
    if (e != Error::None) {
        return reject_(e, "supply", caller);
    }
    emit_(events::Event{
        .type = events::EventType::PoolSupplied,
        .controller = caller,
        .counterparty = pool,
        .assets = amount
    });
    return Error::None;
}

Error SettlementEngine::withdraw_(const Address& caller, const Address& pool, Amount amount, Amount& received) {
    Error e = state_.tracker.withdraw(pool, amount, received);
    if (e != Error::None) {
        return reject_(e, "withdraw", caller);
    }
    emit_(events::Event{
        .type = events::EventType::PoolWithdrawn,
        .controller = caller,
        .counterparty = pool,
        .assets = received
    });
    return Error::None;
}

// ===========================================================================
// Administration
// ===========================================================================

Error SettlementEngine::set_fee_bps(const Address& caller, std::uint64_t fee_bps) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "set_fee_bps", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "set_fee_bps", caller);
    if (fee_bps > config::MAX_FEE_BPS)                   return reject_(Error::InvalidFee, "set_fee_bps", caller);

    YV_INFO("[VAULT] Fee " << cfg_.fee_bps << " -> " << fee_bps << " bps");
    cfg_.fee_bps = fee_bps;
    return Error::None;
}

Error SettlementEngine::set_fee_recipient(const Address& caller, const Address& recipient) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "set_fee_recipient", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "set_fee_recipient", caller);

    YV_INFO("[VAULT] Fee recipient set to " << (recipient.empty() ? "<none>" : recipient));
    cfg_.fee_recipient = recipient;
    return Error::None;
}

Error SettlementEngine::pause(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "pause", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "pause", caller);

    if (!paused_) {
        paused_ = true;
        YV_WARN("[VAULT] Paused by " << caller);
    }
    return Error::None;
}

Error SettlementEngine::unpause(const Address& caller) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "unpause", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "unpause", caller);

    if (paused_) {
        paused_ = false;
        YV_INFO("[VAULT] Unpaused by " << caller);
    }
    return Error::None;
}

Error SettlementEngine::set_oracle(const Address& caller, const oracle::PriceOracle* oracle) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "set_oracle", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "set_oracle", caller);

    oracle_ = oracle;
    YV_INFO("[VAULT] Oracle " << (oracle_ ? "bound" : "unbound"));
    return Error::None;
}

Error SettlementEngine::set_price_id(const Address& caller, const std::string& price_id) {
    ReentrancyGuard::Scope scope(guard_);
    if (!scope.acquired())                               return reject_(Error::Reentrancy, "set_price_id", caller);
    if (Error e = check_admin_(caller); e != Error::None) return reject_(e, "set_price_id", caller);

    cfg_.price_id = price_id;
    YV_INFO("[VAULT] Price feed set to " << (price_id.empty() ? "<none>" : price_id));
    return Error::None;
}

// ===========================================================================
// Valuation views
// ===========================================================================

Amount SettlementEngine::total_assets() const {
    return state_.ledger.total_assets();
}

std::uint64_t SettlementEngine::share_price() const {
    return state_.ledger.share_price();
}

Amount SettlementEngine::idle_balance() const noexcept {
    return state_.ledger.idle_balance();
}

Amount SettlementEngine::total_supply() const noexcept {
    return state_.ledger.total_supply();
}

Amount SettlementEngine::balance_of(const Address& holder) const noexcept {
    return state_.ledger.balance_of(holder);
}

Amount SettlementEngine::pending_deposit_assets() const noexcept {
    return state_.ledger.pending_deposit_assets();
}

Amount SettlementEngine::total_requested_assets() const noexcept {
    return state_.ledger.total_requested_assets();
}

Amount SettlementEngine::convert_to_shares(Amount assets) const {
    const Amount supply = state_.ledger.total_supply();
    if (supply == 0) {
        return assets;
    }
    const Amount backing = state_.ledger.backing_assets();
    return (backing == 0) ? 0 : lcr::mul_div(assets, supply, backing);
}

Amount SettlementEngine::convert_to_assets(Amount shares) const {
    const Amount supply = state_.ledger.total_supply();
    if (supply == 0) {
        return shares;
    }
    return lcr::mul_div(shares, state_.ledger.backing_assets(), supply);
}

Error SettlementEngine::total_assets_usd(std::uint64_t now_s, oracle::UsdValuation& out) const {
    if (oracle_ == nullptr || cfg_.price_id.empty()) {
        return Error::OracleNotConfigured;
    }
    oracle::Price price;
    try {
        price = oracle_->get_price_no_older_than(cfg_.price_id, cfg_.max_price_age_s, now_s);
    }
    catch (const oracle::StalePriceError& ex) {
        YV_WARN("[VAULT] Stale price for " << cfg_.price_id << ": " << ex.what());
        return Error::StalePrice;
    }
    catch (const std::exception& ex) {
        YV_WARN("[VAULT] No price for " << cfg_.price_id << ": " << ex.what());
        return Error::PriceUnavailable;
    }
    if (price.price <= 0) {
        return Error::PriceUnavailable;
    }
    const Amount assets = state_.ledger.total_assets();
    out = oracle::UsdValuation{
        .assets = assets,
        .price = price,
        .usd = oracle::to_usd(assets, cfg_.asset_decimals, price)
    };
    return Error::None;
}

// ===========================================================================
// Queue and request views
// ===========================================================================

std::size_t SettlementEngine::deposit_queue_length() const noexcept {
    return state_.deposits.size();
}

std::optional<QueueEntry> SettlementEngine::deposit_queue_at(std::size_t index) const {
    if (index >= state_.deposits.size()) {
        return std::nullopt;
    }
    const Address& controller = state_.deposits.at(index);
    const queue::DepositRequest* req = state_.deposits.find(controller);
    return QueueEntry{.controller = controller, .amount = req ? req->assets : 0};
}

const queue::DepositRequest* SettlementEngine::deposit_request(const Address& controller) const {
    return state_.deposits.find(controller);
}

std::size_t SettlementEngine::redeem_queue_length() const noexcept {
    return state_.redemptions.size();
}

std::optional<QueueEntry> SettlementEngine::redeem_queue_at(std::size_t index) const {
    if (index >= state_.redemptions.size()) {
        return std::nullopt;
    }
    const Address& controller = state_.redemptions.at(index);
    const queue::WithdrawalRequest* req = state_.redemptions.find(controller);
    return QueueEntry{.controller = controller, .amount = req ? req->shares : 0};
}

const queue::WithdrawalRequest* SettlementEngine::withdrawal_request(const Address& controller) const {
    return state_.redemptions.find(controller);
}

Amount SettlementEngine::pending_redeem_shares(const Address& controller) const {
    const queue::WithdrawalRequest* req = state_.redemptions.find(controller);
    return req ? req->shares : 0;
}

Amount SettlementEngine::pool_principal(const Address& pool) const noexcept {
    return state_.tracker.principal_of(pool);
}

ledger::PrincipalRecord SettlementEngine::principal_of(const Address& holder) const noexcept {
    return state_.ledger.principal_of(holder);
}

} // namespace yieldvault::engine
