#include "yieldvault/pool/allocation_tracker.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "yieldvault/config/constants.hpp"
#include "yieldvault/source/position.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::pool {

AllocationTracker::AllocationTracker(token::AssetToken& asset, const registry::AllowList& sources,
                                     Address self, telemetry::Vault& telemetry)
    : asset_(asset)
    , sources_(sources)
    , self_(std::move(self))
    , telemetry_(telemetry)
{}

// -----------------------------------------------------------------------------
// Supply
// -----------------------------------------------------------------------------

Error AllocationTracker::supply(const Address& source, Amount amount) {
    const source::Handle* handle = sources_.handle_of(source);
    if (handle == nullptr) {
        YV_DEBUG("[POOL] Supply to unlisted source " << source << " rejected");
        return Error::SourceNotAllowed;
    }
    if (amount == 0) {
        return Error::ZeroAmount;
    }
    if (!handle->valid()) {
        telemetry_.source_failures_total.inc();
        YV_WARN("[POOL] Source " << source << " implements no known shape");
        return Error::SourceFailure;
    }
    if (asset_.balance_of(self_) < amount) {
        return Error::InsufficientLiquidity;
    }

    asset_.approve(self_, source, amount);
    try {
        switch (handle->kind) {
            case source::Kind::ReserveStyle:
                handle->reserve->supply(self_, asset_.address(), amount, self_, config::RESERVE_REFERRAL_CODE);
                break;
            case source::Kind::ShareStyle:
                (void)handle->share->deposit(self_, amount, self_);
                break;
        }
    }
    catch (const std::exception& ex) {
        asset_.approve(self_, source, 0);
        telemetry_.source_failures_total.inc();
        YV_WARN("[POOL] Supply of " << amount << " to " << source << " failed: " << ex.what());
        return Error::SourceFailure;
    }
    // Leftover allowance is not kept across calls
    asset_.approve(self_, source, 0);

    principal_[source] += amount;
    telemetry_.assets_supplied_total.inc(amount);
    YV_DEBUG("[POOL] Supplied " << amount << " to " << source
             << " (principal " << principal_[source] << ")");
    return Error::None;
}

// -----------------------------------------------------------------------------
// Withdraw
// -----------------------------------------------------------------------------

Error AllocationTracker::withdraw(const Address& source, Amount amount, Amount& received) {
    received = 0;
    const source::Handle* handle = sources_.handle_of(source);
    if (handle == nullptr) {
        YV_DEBUG("[POOL] Withdrawal from unlisted source " << source << " rejected");
        return Error::SourceNotAllowed;
    }
    if (amount == 0) {
        return Error::ZeroAmount;
    }
    if (!handle->valid()) {
        telemetry_.source_failures_total.inc();
        YV_WARN("[POOL] Source " << source << " implements no known shape");
        return Error::SourceFailure;
    }

    const Amount before = asset_.balance_of(self_);
    try {
        switch (handle->kind) {
            case source::Kind::ReserveStyle:
                (void)handle->reserve->withdraw(self_, asset_.address(), amount, self_);
                break;
            case source::Kind::ShareStyle:
                (void)handle->share->withdraw(self_, amount, self_, self_);
                break;
        }
    }
    catch (const std::exception& ex) {
        telemetry_.source_failures_total.inc();
        YV_WARN("[POOL] Withdrawal of " << amount << " from " << source << " failed: " << ex.what());
        return Error::SourceFailure;
    }

    received = lcr::saturating_sub(asset_.balance_of(self_), before);
    Amount& principal = principal_[source];
    principal -= std::min(received, principal);
    telemetry_.assets_withdrawn_total.inc(received);

    if (received != amount) {
        YV_DEBUG("[POOL] " << source << " delivered " << received << " of " << amount << " requested");
    }
    YV_DEBUG("[POOL] Withdrew " << received << " from " << source << " (principal " << principal << ")");
    return Error::None;
}

bool AllocationTracker::withdraw_as_needed(Amount shortfall) {
    Amount remaining = shortfall;
    for (const Address& source : sources_.list_allowed()) {
        if (remaining == 0) {
            break;
        }
        const source::Handle* handle = sources_.handle_of(source);
        if (handle == nullptr) {
            continue;
        }
        const Amount available = position_(source, *handle);
        if (available == 0) {
            continue;
        }
        Amount received = 0;
        if (withdraw(source, std::min(available, remaining), received) != Error::None) {
            continue; // try the next source
        }
        remaining = lcr::saturating_sub(remaining, received);
    }
    if (remaining != 0) {
        YV_WARN("[POOL] Recovered " << (shortfall - remaining) << " of " << shortfall << " needed");
    }
    return remaining == 0;
}

// -----------------------------------------------------------------------------
// Views
// -----------------------------------------------------------------------------

Amount AllocationTracker::principal_of(const Address& source) const noexcept {
    auto it = principal_.find(source);
    return (it == principal_.end()) ? 0 : it->second;
}

Amount AllocationTracker::total_principal() const noexcept {
    Amount total = 0;
    for (const auto& [source, amount] : principal_) {
        total = lcr::saturating_add(total, amount);
    }
    return total;
}

Amount AllocationTracker::position_(const Address& source, const source::Handle& handle) const {
    try {
        return source::position_of(handle, asset_, self_);
    }
    catch (const std::exception& ex) {
        telemetry_.source_failures_total.inc();
        YV_WARN("[POOL] Position of " << source << " unreadable (" << ex.what() << "), skipped");
    }
    return 0;
}

} // namespace yieldvault::pool
