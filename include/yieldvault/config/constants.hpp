#pragma once

#include <cstdint>


namespace yieldvault::config {

// Upper bound of a single deposit fulfillment batch.
inline constexpr std::uint32_t MAX_DEPOSIT_BATCH = 5;

// Basis points: 10'000 bps == 100%.
inline constexpr std::uint64_t BPS_DENOMINATOR = 10'000;

// Highest performance fee the admin may configure (50%).
inline constexpr std::uint64_t MAX_FEE_BPS = 5'000;

// Fixed-point factor of share_price().
inline constexpr std::uint64_t PRICE_SCALE = 1'000'000'000'000ULL;

// Default staleness bound for oracle quotes, in seconds.
inline constexpr std::uint64_t DEFAULT_MAX_PRICE_AGE_S = 60;

// Highest asset decimals accepted from configuration.
inline constexpr std::uint8_t MAX_ASSET_DECIMALS = 18;

// Referral code passed to reserve-style sources on supply.
inline constexpr std::uint16_t RESERVE_REFERRAL_CODE = 0;

} // namespace yieldvault::config
