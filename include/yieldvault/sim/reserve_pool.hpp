#pragma once

#include <cstdint>
#include <string>

#include "yieldvault/source/yield_source.hpp"
#include "yieldvault/token/asset_token.hpp"


namespace yieldvault::sim {

/*
===============================================================================
ReservePool
===============================================================================

In-memory lending reserve (reserve-style source) for one asset.

  supply    pulls the asset from the caller (allowance required) and mints the
            same amount of receipt token to `on_behalf_of`
  withdraw  burns the caller's receipt token and sends the asset to `to`
  accrue    yield: mints receipt token to a holder, backed by freshly minted
            asset held by the pool

Fault injection for tests:
  set_failing(true)          every call throws ExternalCallError
  set_withdraw_haircut(bps)  withdraw delivers less than it reports
===============================================================================
*/
class ReservePool final : public source::ReserveSource {
public:
    ReservePool(Address address, token::AssetToken& asset);

    [[nodiscard]] inline const Address& address() const noexcept { return address_; }
    [[nodiscard]] inline const token::AssetToken& receipt_token() const noexcept { return receipt_; }

    // ---- ReserveSource ----
    void supply(const Address& caller, const Address& asset, Amount amount,
                const Address& on_behalf_of, std::uint16_t referral_code) override;
    Amount withdraw(const Address& caller, const Address& asset, Amount amount, const Address& to) override;
    [[nodiscard]] source::ReserveData get_reserve_data(const Address& asset) const override;

    // ---- Simulation ----
    void accrue(const Address& holder, Amount amount);
    inline void set_failing(bool on) noexcept { failing_ = on; }
    inline void set_withdraw_haircut(std::uint64_t bps) noexcept { haircut_bps_ = bps; }

private:
    void check_(const char* op, const Address& asset) const;

private:
    Address address_;
    token::AssetToken& asset_;
    token::AssetToken receipt_;
    std::uint64_t liquidity_index_{1'000'000'000};
    bool failing_{false};
    std::uint64_t haircut_bps_{0};
};

} // namespace yieldvault::sim
