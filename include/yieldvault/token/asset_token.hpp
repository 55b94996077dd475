#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"


namespace yieldvault::token {

/*
===============================================================================
AssetToken
===============================================================================

In-memory fungible token ledger: balances, allowances and total supply of the
vault's underlying asset (and of receipt tokens issued by reserve-style
sources).

Semantics:
  - transfer()/transfer_from() move balances between addresses; a failed call
    changes nothing and reports why.
  - transfer_from() is authorized by a prior approve(owner, spender, amount)
    and consumes the allowance it uses.
  - mint()/burn() change the total supply. They stand for faucets, yield
    accrual and receipt-token issuance; no access control is applied here.

Zero-amount transfers are accepted as no-ops.
===============================================================================
*/
class AssetToken {
public:
    AssetToken(Address address, std::string symbol, std::uint8_t decimals);

    AssetToken(const AssetToken&) = delete;
    AssetToken& operator=(const AssetToken&) = delete;

    // ---------------------------------------------------------------------
    // Metadata
    // ---------------------------------------------------------------------
    [[nodiscard]] inline const Address& address() const noexcept { return address_; }
    [[nodiscard]] inline const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] inline std::uint8_t decimals() const noexcept { return decimals_; }

    // ---------------------------------------------------------------------
    // Views
    // ---------------------------------------------------------------------
    [[nodiscard]] Amount balance_of(const Address& holder) const noexcept;
    [[nodiscard]] Amount allowance(const Address& owner, const Address& spender) const noexcept;
    [[nodiscard]] inline Amount total_supply() const noexcept { return total_supply_; }

    // ---------------------------------------------------------------------
    // Mutations
    // ---------------------------------------------------------------------
    [[nodiscard]] Error transfer(const Address& from, const Address& to, Amount amount);
    void approve(const Address& owner, const Address& spender, Amount amount);
    [[nodiscard]] Error transfer_from(const Address& spender, const Address& from, const Address& to, Amount amount);

    [[nodiscard]] Error mint(const Address& to, Amount amount);
    [[nodiscard]] Error burn(const Address& from, Amount amount);

private:
    Address address_;
    std::string symbol_;
    std::uint8_t decimals_;

    Amount total_supply_{0};
    std::unordered_map<Address, Amount> balances_;
    std::unordered_map<Address, std::unordered_map<Address, Amount>> allowances_;
};

} // namespace yieldvault::token
