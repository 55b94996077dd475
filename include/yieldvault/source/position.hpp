#pragma once

#include "yieldvault/source/yield_source.hpp"
#include "yieldvault/token/asset_token.hpp"


namespace yieldvault::source {

// ---------------------------------------------------------------------------
// Value of `holder`'s position in a source, in units of `asset`.
//
// Dispatches on the handle's tag. Returns 0 for a handle that implements no
// known shape and for a share-style source of a different asset. Exceptions
// thrown by the source propagate to the caller.
// ---------------------------------------------------------------------------
[[nodiscard]] inline Amount position_of(const Handle& handle, const token::AssetToken& asset, const Address& holder) {
    if (!handle.valid()) {
        return 0;
    }
    switch (handle.kind) {
        case Kind::ReserveStyle: {
            const ReserveData data = handle.reserve->get_reserve_data(asset.address());
            return (data.receipt_token == nullptr) ? 0 : data.receipt_token->balance_of(holder);
        }
        case Kind::ShareStyle: {
            if (handle.share->asset() != asset.address()) {
                return 0;
            }
            const Amount shares = handle.share->balance_of(holder);
            return (shares == 0) ? 0 : handle.share->convert_to_assets(shares);
        }
    }
    return 0;
}

} // namespace yieldvault::source
