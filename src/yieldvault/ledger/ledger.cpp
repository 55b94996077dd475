#include "yieldvault/ledger/ledger.hpp"

#include <exception>
#include <utility>

#include "yieldvault/config/constants.hpp"
#include "yieldvault/source/position.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::ledger {

Ledger::Ledger(const token::AssetToken& asset, const registry::AllowList& sources,
               Address self, telemetry::Vault& telemetry)
    : asset_(asset)
    , sources_(sources)
    , self_(std::move(self))
    , telemetry_(telemetry)
{}

// -----------------------------------------------------------------------------
// Valuation
// -----------------------------------------------------------------------------

Amount Ledger::idle_balance() const noexcept {
    return asset_.balance_of(self_);
}

Amount Ledger::total_assets() const {
    Amount total = idle_balance();
    for (const Address& source : sources_.list_allowed()) {
        const source::Handle* handle = sources_.handle_of(source);
        if (handle == nullptr) {
            continue;
        }
        total = lcr::saturating_add(total, value_of_(source, *handle));
    }
    return total;
}

Amount Ledger::backing_assets() const {
    return lcr::saturating_sub(total_assets(), pending_deposit_assets_);
}

std::uint64_t Ledger::share_price() const {
    if (total_supply_ == 0) {
        return config::PRICE_SCALE;
    }
    return lcr::mul_div(backing_assets(), config::PRICE_SCALE, total_supply_);
}

Amount Ledger::source_value(const Address& source) const {
    const source::Handle* handle = sources_.handle_of(source);
    if (handle == nullptr) {
        return 0;
    }
    return value_of_(source, *handle);
}

Amount Ledger::value_of_(const Address& source, const source::Handle& handle) const {
    try {
        return source::position_of(handle, asset_, self_);
    }
    catch (const std::exception& ex) {
        telemetry_.source_failures_total.inc();
        YV_WARN("[LEDGER] Valuation of " << source << " failed (" << ex.what() << "), counted as zero");
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Shares
// -----------------------------------------------------------------------------

Amount Ledger::balance_of(const Address& holder) const noexcept {
    auto it = shares_.find(holder);
    return (it == shares_.end()) ? 0 : it->second;
}

Error Ledger::mint(const Address& to, Amount shares) {
    Amount supply = 0;
    if (!lcr::checked_add(total_supply_, shares, supply)) {
        YV_ERROR("[LEDGER] Mint of " << shares << " to " << to << " overflows supply " << total_supply_);
        return Error::AmountOverflow;
    }
    shares_[to] += shares;
    total_supply_ = supply;
    return Error::None;
}

Error Ledger::burn(const Address& from, Amount shares) {
    auto it = shares_.find(from);
    if (it == shares_.end() || it->second < shares) {
        return Error::InsufficientBalance;
    }
    it->second -= shares;
    total_supply_ -= shares;
    return Error::None;
}

Error Ledger::transfer_shares(const Address& from, const Address& to, Amount shares) {
    if (to.empty()) {
        return Error::InvalidReceiver;
    }
    auto it = shares_.find(from);
    if (it == shares_.end() || it->second < shares) {
        return Error::InsufficientBalance;
    }
    it->second -= shares;
    shares_[to] += shares;
    return Error::None;
}

// -----------------------------------------------------------------------------
// Cost basis
// -----------------------------------------------------------------------------

PrincipalRecord Ledger::principal_of(const Address& holder) const noexcept {
    auto it = principal_.find(holder);
    return (it == principal_.end()) ? PrincipalRecord{} : it->second;
}

void Ledger::record_deposit(const Address& holder, Amount assets, Amount shares) {
    PrincipalRecord& rec = principal_[holder];
    rec.principal += assets;
    rec.shares += shares;
}

void Ledger::record_redemption(const Address& holder, Amount principal, Amount shares) {
    PrincipalRecord& rec = principal_[holder];
    rec.principal = lcr::saturating_sub(rec.principal, principal);
    rec.shares = lcr::saturating_sub(rec.shares, shares);
}

// -----------------------------------------------------------------------------
// Aggregate counters
// -----------------------------------------------------------------------------

void Ledger::release_pending_deposit(Amount assets) noexcept {
    pending_deposit_assets_ = lcr::saturating_sub(pending_deposit_assets_, assets);
}

void Ledger::release_requested(Amount assets) noexcept {
    total_requested_assets_ = lcr::saturating_sub(total_requested_assets_, assets);
}

} // namespace yieldvault::ledger
