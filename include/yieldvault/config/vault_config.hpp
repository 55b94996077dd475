#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "yieldvault/core/types.hpp"
#include "yieldvault/config/constants.hpp"


namespace yieldvault::config {

// ---------------------------------------------------------------
// Runtime configuration of one vault instance
// ---------------------------------------------------------------
struct VaultConfig {
    std::string   name{"Yield Vault"};
    std::string   symbol{"yvUSD"};
    std::uint8_t  asset_decimals{6};
    std::uint64_t fee_bps{1'000};
    Address       fee_recipient{};     // empty: fees are forgone
    std::uint64_t max_price_age_s{DEFAULT_MAX_PRICE_AGE_S};
    std::string   price_id{};          // empty: no USD valuation
};

inline std::ostream& operator<<(std::ostream& os, const VaultConfig& cfg) {
    os << "VaultConfig{name=" << cfg.name
       << ", symbol=" << cfg.symbol
       << ", asset_decimals=" << static_cast<unsigned>(cfg.asset_decimals)
       << ", fee_bps=" << cfg.fee_bps
       << ", fee_recipient=" << (cfg.fee_recipient.empty() ? "<none>" : cfg.fee_recipient)
       << ", max_price_age_s=" << cfg.max_price_age_s
       << ", price_id=" << (cfg.price_id.empty() ? "<none>" : cfg.price_id)
       << "}";
    return os;
}

} // namespace yieldvault::config
