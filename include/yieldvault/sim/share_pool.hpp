#pragma once

#include <cstdint>
#include <unordered_map>

#include "yieldvault/source/yield_source.hpp"
#include "yieldvault/token/asset_token.hpp"


namespace yieldvault::sim {

/*
===============================================================================
SharePool
===============================================================================

In-memory tokenized vault (share-style source). Its assets are its own asset
balance; shares are issued pro rata:

    deposit:  shares = supply == 0 ? assets : assets * supply / total_assets
    withdraw: shares = ceil(assets * supply / total_assets)

accrue() mints asset straight into the pool, raising every holder's value.
set_failing(true) makes every call throw ExternalCallError.
===============================================================================
*/
class SharePool final : public source::ShareSource {
public:
    SharePool(Address address, token::AssetToken& asset);

    [[nodiscard]] inline const Address& address() const noexcept { return address_; }
    [[nodiscard]] Amount total_assets() const noexcept;
    [[nodiscard]] inline Amount total_shares() const noexcept { return total_shares_; }

    // ---- ShareSource ----
    [[nodiscard]] Address asset() const override;
    Amount deposit(const Address& caller, Amount assets, const Address& receiver) override;
    Amount withdraw(const Address& caller, Amount assets, const Address& receiver, const Address& owner) override;
    [[nodiscard]] Amount balance_of(const Address& holder) const override;
    [[nodiscard]] Amount convert_to_assets(Amount shares) const override;

    // ---- Simulation ----
    void accrue(Amount amount);
    inline void set_failing(bool on) noexcept { failing_ = on; }

private:
    void check_(const char* op) const;

private:
    Address address_;
    token::AssetToken& asset_;
    Amount total_shares_{0};
    std::unordered_map<Address, Amount> shares_;
    bool failing_{false};
};

} // namespace yieldvault::sim
