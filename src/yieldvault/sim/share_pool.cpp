#include "yieldvault/sim/share_pool.hpp"

#include <utility>

#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::sim {

SharePool::SharePool(Address address, token::AssetToken& asset)
    : address_(std::move(address))
    , asset_(asset)
{}

void SharePool::check_(const char* op) const {
    if (failing_) {
        throw source::ExternalCallError(address_ + ": " + op + " failed (injected)");
    }
}

Amount SharePool::total_assets() const noexcept {
    return asset_.balance_of(address_);
}

Address SharePool::asset() const {
    check_("asset");
    return asset_.address();
}

Amount SharePool::deposit(const Address& caller, Amount assets, const Address& receiver) {
    check_("deposit");
    const Amount managed = total_assets();
    const Amount shares = (total_shares_ == 0 || managed == 0)
        ? assets
        : lcr::mul_div(assets, total_shares_, managed);
    if (shares == 0) {
        throw source::ExternalCallError(address_ + ": deposit mints zero shares");
    }
    Error e = asset_.transfer_from(address_, caller, address_, assets);
    if (e != Error::None) {
        throw source::ExternalCallError(address_ + ": deposit pull failed: " + std::string(to_string(e)));
    }
    shares_[receiver] += shares;
    total_shares_ += shares;
    YV_TRACE("[SHARES " << address_ << "] deposit " << assets << " -> " << shares << " shares for " << receiver);
    return shares;
}

Amount SharePool::withdraw(const Address& caller, Amount assets, const Address& receiver, const Address& owner) {
    check_("withdraw");
    if (caller != owner) {
        throw source::ExternalCallError(address_ + ": withdraw on behalf of another owner");
    }
    const Amount managed = total_assets();
    if (assets > managed || total_shares_ == 0) {
        throw source::ExternalCallError(address_ + ": withdraw exceeds pool assets");
    }
    // Round shares up so the pool never pays more than it burns
    Amount shares = lcr::mul_div(assets, total_shares_, managed);
    if (lcr::mul_div(shares, managed, total_shares_) < assets) {
        ++shares;
    }
    auto it = shares_.find(owner);
    if (it == shares_.end() || it->second < shares) {
        throw source::ExternalCallError(address_ + ": withdraw exceeds owner shares");
    }
    if (asset_.transfer(address_, receiver, assets) != Error::None) {
        throw source::ExternalCallError(address_ + ": withdraw transfer failed");
    }
    it->second -= shares;
    total_shares_ -= shares;
    YV_TRACE("[SHARES " << address_ << "] withdraw " << assets << " burning " << shares << " shares of " << owner);
    return shares;
}

Amount SharePool::balance_of(const Address& holder) const {
    check_("balance_of");
    auto it = shares_.find(holder);
    return (it == shares_.end()) ? 0 : it->second;
}

Amount SharePool::convert_to_assets(Amount shares) const {
    check_("convert_to_assets");
    if (total_shares_ == 0) {
        return shares;
    }
    return lcr::mul_div(shares, total_assets(), total_shares_);
}

void SharePool::accrue(Amount amount) {
    if (asset_.mint(address_, amount) != Error::None) {
        throw source::ExternalCallError(address_ + ": accrue failed");
    }
    YV_DEBUG("[SHARES " << address_ << "] accrued " << amount);
}

} // namespace yieldvault::sim
