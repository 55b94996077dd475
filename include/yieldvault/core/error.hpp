#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include "yieldvault/core/types.hpp"


namespace yieldvault {

// ===============================================================
// ERROR CODES
// ===============================================================
//
// Every mutating entry point reports its outcome through Error.
// Error::None means the call was applied; any other value means
// nothing was changed, except for the batch calls documented in
// FulfillResult.
// ===============================================================
enum class Error : uint8_t {
    None,
    ZeroAmount,
    InvalidReceiver,
    InsufficientBalance,
    InsufficientAllowance,
    AlreadyPending,
    NoPendingRequest,
    Unauthorized,
    SourceNotAllowed,
    InvalidBatchSize,
    ZeroBacking,
    InsufficientLiquidity,
    SourceFailure,
    Reentrancy,
    Paused,
    InvalidFee,
    OracleNotConfigured,
    PriceUnavailable,
    StalePrice,
    ZeroAssets,
    AmountOverflow
};

[[nodiscard]] inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:                  return "none";
        case Error::ZeroAmount:            return "zero_amount";
        case Error::InvalidReceiver:       return "invalid_receiver";
        case Error::InsufficientBalance:   return "insufficient_balance";
        case Error::InsufficientAllowance: return "insufficient_allowance";
        case Error::AlreadyPending:        return "already_pending";
        case Error::NoPendingRequest:      return "no_pending_request";
        case Error::Unauthorized:          return "unauthorized";
        case Error::SourceNotAllowed:      return "source_not_allowed";
        case Error::InvalidBatchSize:      return "invalid_batch_size";
        case Error::ZeroBacking:           return "zero_backing";
        case Error::InsufficientLiquidity: return "insufficient_liquidity";
        case Error::SourceFailure:         return "source_failure";
        case Error::Reentrancy:            return "reentrancy";
        case Error::Paused:                return "paused";
        case Error::InvalidFee:            return "invalid_fee";
        case Error::OracleNotConfigured:   return "oracle_not_configured";
        case Error::PriceUnavailable:      return "price_unavailable";
        case Error::StalePrice:            return "stale_price";
        case Error::ZeroAssets:            return "zero_assets";
        case Error::AmountOverflow:        return "amount_overflow";
        default:                           return "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

// ---------------------------------------------------------------
// Outcome of a fulfillment batch.
//
// processed counts the requests settled by this call. When error is
// not None, those settlements remain applied (withdrawals) and the
// failing request plus everything after it is still queued.
// assets is the asset total moved by the settled requests.
// ---------------------------------------------------------------
struct FulfillResult {
    Error         error{Error::None};
    std::uint32_t processed{0};
    Amount        assets{0};

    [[nodiscard]] inline bool ok() const noexcept { return error == Error::None; }
};

} // namespace yieldvault
