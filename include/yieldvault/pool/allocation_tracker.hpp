#pragma once

#include <unordered_map>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "yieldvault/token/asset_token.hpp"
#include "yieldvault/registry/allow_list.hpp"
#include "yieldvault/telemetry/vault.hpp"


namespace yieldvault::pool {

/*
===============================================================================
AllocationTracker
===============================================================================

Moves capital between the vault and allow-listed yield sources and keeps the
principal believed to sit in each one.

  supply(source, amount)
      Approves the source for `amount`, calls its deposit entry point and
      adds `amount` to the recorded principal. On failure the approval is
      cleared and nothing is recorded.

  withdraw(source, amount, received)
      Calls the source's withdraw entry point and measures what actually
      arrived through the vault's balance delta (a source's return value is
      not trusted). Principal drops by min(received, principal).

  withdraw_as_needed(shortfall)
      Walks the allow-list in order, withdrawing min(position, remaining)
      from each source. Failing sources are skipped. Returns true when the
      whole shortfall was recovered.

Recorded principal is an accounting quantity; it drifts from the live
position as sources accrue yield or lose value.
===============================================================================
*/
class AllocationTracker {
public:
    AllocationTracker(token::AssetToken& asset, const registry::AllowList& sources,
                      Address self, telemetry::Vault& telemetry);

    AllocationTracker(const AllocationTracker&) = delete;
    AllocationTracker& operator=(const AllocationTracker&) = delete;

    [[nodiscard]] Error supply(const Address& source, Amount amount);
    [[nodiscard]] Error withdraw(const Address& source, Amount amount, Amount& received);
    [[nodiscard]] bool withdraw_as_needed(Amount shortfall);

    [[nodiscard]] Amount principal_of(const Address& source) const noexcept;
    [[nodiscard]] Amount total_principal() const noexcept;

private:
    // Vault position in a source, 0 when it cannot be read
    [[nodiscard]] Amount position_(const Address& source, const source::Handle& handle) const;

private:
    token::AssetToken& asset_;
    const registry::AllowList& sources_;
    Address self_;
    telemetry::Vault& telemetry_;

    std::unordered_map<Address, Amount> principal_;
};

} // namespace yieldvault::pool
