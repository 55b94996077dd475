#include "yieldvault/sim/reserve_pool.hpp"

#include <utility>

#include "yieldvault/config/constants.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/mul_div.hpp"


namespace yieldvault::sim {

ReservePool::ReservePool(Address address, token::AssetToken& asset)
    : address_(std::move(address))
    , asset_(asset)
    , receipt_(address_ + ".receipt", "r" + asset.symbol(), asset.decimals())
{}

void ReservePool::check_(const char* op, const Address& asset) const {
    if (failing_) {
        throw source::ExternalCallError(address_ + ": " + op + " failed (injected)");
    }
    if (asset != asset_.address()) {
        throw source::ExternalCallError(address_ + ": " + op + " of unsupported asset " + asset);
    }
}

void ReservePool::supply(const Address& caller, const Address& asset, Amount amount,
                         const Address& on_behalf_of, std::uint16_t referral_code) {
    check_("supply", asset);
    Error e = asset_.transfer_from(address_, caller, address_, amount);
    if (e != Error::None) {
        throw source::ExternalCallError(address_ + ": supply pull failed: " + std::string(to_string(e)));
    }
    e = receipt_.mint(on_behalf_of, amount);
    if (e != Error::None) {
        throw source::ExternalCallError(address_ + ": receipt mint failed: " + std::string(to_string(e)));
    }
    YV_TRACE("[RESERVE " << address_ << "] supply " << amount << " for " << on_behalf_of
             << " (referral " << referral_code << ")");
}

Amount ReservePool::withdraw(const Address& caller, const Address& asset, Amount amount, const Address& to) {
    check_("withdraw", asset);
    if (receipt_.balance_of(caller) < amount) {
        throw source::ExternalCallError(address_ + ": withdraw exceeds position");
    }
    if (asset_.balance_of(address_) < amount) {
        throw source::ExternalCallError(address_ + ": reserve lacks liquidity");
    }
    const Amount delivered = amount - lcr::mul_div(amount, haircut_bps_, config::BPS_DENOMINATOR);
    if (receipt_.burn(caller, amount) != Error::None ||
        asset_.transfer(address_, to, delivered) != Error::None) {
        throw source::ExternalCallError(address_ + ": withdraw settlement failed");
    }
    YV_TRACE("[RESERVE " << address_ << "] withdraw " << amount << " to " << to << " (delivered " << delivered << ")");
    return amount;
}

source::ReserveData ReservePool::get_reserve_data(const Address& asset) const {
    check_("get_reserve_data", asset);
    return source::ReserveData{.receipt_token = &receipt_, .liquidity_index = liquidity_index_};
}

void ReservePool::accrue(const Address& holder, Amount amount) {
    if (asset_.mint(address_, amount) != Error::None || receipt_.mint(holder, amount) != Error::None) {
        throw source::ExternalCallError(address_ + ": accrue failed");
    }
    YV_DEBUG("[RESERVE " << address_ << "] accrued " << amount << " to " << holder);
}

} // namespace yieldvault::sim
