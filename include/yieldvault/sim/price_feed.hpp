#pragma once

#include <string>
#include <unordered_map>

#include "yieldvault/oracle/price_oracle.hpp"


namespace yieldvault::sim {

// ---------------------------------------------------------------------------
// Static price feed: quotes are pushed by hand and served with the usual
// staleness check.
// ---------------------------------------------------------------------------
class PriceFeed final : public oracle::PriceOracle {
public:
    inline void set_price(const std::string& price_id, const oracle::Price& price) {
        prices_[price_id] = price;
    }

    [[nodiscard]] oracle::Price get_price_no_older_than(const std::string& price_id,
                                                        std::uint64_t max_age_s,
                                                        std::uint64_t now_s) const override {
        auto it = prices_.find(price_id);
        if (it == prices_.end()) {
            throw oracle::PriceUnavailableError("no quote for " + price_id);
        }
        const oracle::Price& p = it->second;
        if (now_s > p.publish_time && now_s - p.publish_time > max_age_s) {
            throw oracle::StalePriceError("quote for " + price_id + " is " +
                                          std::to_string(now_s - p.publish_time) + "s old");
        }
        return p;
    }

private:
    std::unordered_map<std::string, oracle::Price> prices_;
};

} // namespace yieldvault::sim
