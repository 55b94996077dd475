#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "yieldvault/core/types.hpp"

namespace yieldvault::token { class AssetToken; }


/*
===============================================================================
External yield sources
===============================================================================

Capital placed outside the vault goes to one of two source shapes:

  Reserve-style (lending reserve)
    supply(asset, amount, on_behalf_of, referral)  pulls `amount` from the
                                                   caller (needs allowance)
    withdraw(asset, amount, to) -> received
    get_reserve_data(asset) -> receipt token       balance of the receipt
                                                   token is 1:1 redeemable

  Share-style (tokenized vault)
    asset() -> underlying asset address
    deposit(amount, receiver) -> shares            pulls `amount` from the
                                                   caller (needs allowance)
    withdraw(amount, receiver, owner) -> shares burned
    balance_of(holder) -> shares
    convert_to_assets(shares) -> amount

Every call carries the calling address explicitly. A source signals failure
by throwing (ExternalCallError or any std::exception). The vault catches at
the boundary and never lets a source exception escape its own API.

Sources are registered in the allow-list through a Handle: an explicit kind
tag plus a non-owning pointer to the matching interface. Dispatch is by tag
only; a handle whose pointer does not match its tag is treated as a source
that implements neither shape.
===============================================================================
*/
namespace yieldvault::source {

// ---------------------------------------------------------------------------
// Failure reported by an external collaborator
// ---------------------------------------------------------------------------
class ExternalCallError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};


// ===============================================================
// SOURCE KIND
// ===============================================================
enum class Kind : uint8_t {
    ReserveStyle,
    ShareStyle
};

[[nodiscard]] inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::ReserveStyle: return "reserve";
        case Kind::ShareStyle:   return "share";
        default:                 return "unknown";
    }
}


// ---------------------------------------------------------------------------
// Reserve-style source
// ---------------------------------------------------------------------------
struct ReserveData {
    const token::AssetToken* receipt_token{nullptr};  // interest-bearing receipt
    std::uint64_t liquidity_index{0};                 // informational only
};

class ReserveSource {
public:
    virtual ~ReserveSource() = default;

    virtual void supply(const Address& caller, const Address& asset, Amount amount,
                        const Address& on_behalf_of, std::uint16_t referral_code) = 0;

    virtual Amount withdraw(const Address& caller, const Address& asset, Amount amount,
                            const Address& to) = 0;

    [[nodiscard]] virtual ReserveData get_reserve_data(const Address& asset) const = 0;
};


// ---------------------------------------------------------------------------
// Share-style source
// ---------------------------------------------------------------------------
class ShareSource {
public:
    virtual ~ShareSource() = default;

    [[nodiscard]] virtual Address asset() const = 0;

    virtual Amount deposit(const Address& caller, Amount assets, const Address& receiver) = 0;

    virtual Amount withdraw(const Address& caller, Amount assets, const Address& receiver,
                            const Address& owner) = 0;

    [[nodiscard]] virtual Amount balance_of(const Address& holder) const = 0;

    [[nodiscard]] virtual Amount convert_to_assets(Amount shares) const = 0;
};


// ---------------------------------------------------------------------------
// Tagged, non-owning reference to a source
// ---------------------------------------------------------------------------
struct Handle {
    Kind           kind{Kind::ReserveStyle};
    ReserveSource* reserve{nullptr};
    ShareSource*   share{nullptr};

    [[nodiscard]] static inline Handle reserve_style(ReserveSource& s) noexcept {
        return Handle{.kind = Kind::ReserveStyle, .reserve = &s, .share = nullptr};
    }

    [[nodiscard]] static inline Handle share_style(ShareSource& s) noexcept {
        return Handle{.kind = Kind::ShareStyle, .reserve = nullptr, .share = &s};
    }

    // True when the pointer selected by the tag is set
    [[nodiscard]] inline bool valid() const noexcept {
        return (kind == Kind::ReserveStyle) ? reserve != nullptr : share != nullptr;
    }
};

} // namespace yieldvault::source
