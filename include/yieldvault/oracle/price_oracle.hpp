#pragma once

#include <cmath>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include "yieldvault/core/types.hpp"


namespace yieldvault::oracle {

// ---------------------------------------------------------------------------
// Fixed-point quote: value = price * 10^expo, +/- conf * 10^expo
// ---------------------------------------------------------------------------
struct Price {
    std::int64_t  price{0};
    std::uint64_t conf{0};
    std::int32_t  expo{0};
    std::uint64_t publish_time{0};   // unix seconds
};

inline std::ostream& operator<<(std::ostream& os, const Price& p) {
    return os << p.price << "e" << p.expo << " (+/-" << p.conf << ") @" << p.publish_time;
}

// Freshest quote is older than the requested bound
class StalePriceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No quote for the requested feed
class PriceUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Price feed collaborator. Used for USD reporting only, never for accounting.
// ---------------------------------------------------------------------------
class PriceOracle {
public:
    virtual ~PriceOracle() = default;

    // Throws StalePriceError when now_s - publish_time > max_age_s and
    // PriceUnavailableError (or any std::exception) when there is no quote.
    [[nodiscard]] virtual Price get_price_no_older_than(const std::string& price_id,
                                                        std::uint64_t max_age_s,
                                                        std::uint64_t now_s) const = 0;
};

// ---------------------------------------------------------------------------
// USD valuation of an asset amount
// ---------------------------------------------------------------------------
struct UsdValuation {
    Amount assets{0};
    Price  price{};
    double usd{0.0};
};

[[nodiscard]] inline double to_usd(Amount assets, std::uint8_t asset_decimals, const Price& p) noexcept {
    const double units = static_cast<double>(assets) / std::pow(10.0, asset_decimals);
    return units * static_cast<double>(p.price) * std::pow(10.0, p.expo);
}

} // namespace yieldvault::oracle
