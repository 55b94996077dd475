/*
===============================================================================
 oracle::PriceOracle / SettlementEngine::total_assets_usd - Unit Tests
===============================================================================

Covered Requirements:
---------------------
O1. to_usd scales by asset decimals and price exponent
O2. PriceFeed serves fresh quotes and rejects stale or missing ones
O3. total_assets_usd maps oracle failures to error codes
O4. USD reporting never affects accounting

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "common/harness/vault.hpp"

using namespace yieldvault;
using namespace test;

namespace {

constexpr std::uint64_t NOW = 1'700'000'000;

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9 * std::max(1.0, std::fabs(b));
}

oracle::Price usdc_quote(std::uint64_t publish_time) {
    return oracle::Price{.price = 100'020'000, .conf = 5'000, .expo = -8, .publish_time = publish_time};
}

// Feed that fails with a plain runtime error
class BrokenFeed final : public oracle::PriceOracle {
public:
    oracle::Price get_price_no_older_than(const std::string&, std::uint64_t, std::uint64_t) const override {
        throw std::runtime_error("feed offline");
    }
};

} // namespace


// -----------------------------------------------------------------------------
// O1. to_usd scales by asset decimals and price exponent
// -----------------------------------------------------------------------------
void test_to_usd() {
    std::cout << "[TEST] O1 to_usd\n";

    const oracle::Price one{.price = 1, .conf = 0, .expo = 0, .publish_time = 0};
    TEST_CHECK(near(oracle::to_usd(1'000'000, 6, one), 1.0));
    TEST_CHECK(near(oracle::to_usd(2'500'000, 6, usdc_quote(0)), 2.5005));
    TEST_CHECK(near(oracle::to_usd(0, 6, usdc_quote(0)), 0.0));

    const oracle::Price eth{.price = 350'000, .conf = 0, .expo = -2, .publish_time = 0};
    TEST_CHECK(near(oracle::to_usd(500'000'000'000'000'000ull, 18, eth), 1'750.0));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// O2. PriceFeed serves fresh quotes and rejects stale or missing ones
// -----------------------------------------------------------------------------
void test_price_feed() {
    std::cout << "[TEST] O2 price feed staleness\n";

    sim::PriceFeed feed;
    feed.set_price("USDC/USD", usdc_quote(NOW - 60));

    const oracle::Price p = feed.get_price_no_older_than("USDC/USD", 60, NOW);
    TEST_CHECK(p.price == 100'020'000);
    TEST_CHECK(p.expo == -8);

    bool stale = false;
    try {
        (void)feed.get_price_no_older_than("USDC/USD", 59, NOW);
    }
    catch (const oracle::StalePriceError&) {
        stale = true;
    }
    TEST_CHECK(stale);

    bool missing = false;
    try {
        (void)feed.get_price_no_older_than("DAI/USD", 60, NOW);
    }
    catch (const oracle::PriceUnavailableError&) {
        missing = true;
    }
    TEST_CHECK(missing);

    // Quotes published "in the future" are not stale
    feed.set_price("USDC/USD", usdc_quote(NOW + 5));
    TEST_CHECK(feed.get_price_no_older_than("USDC/USD", 0, NOW).publish_time == NOW + 5);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// O3. total_assets_usd maps oracle failures to error codes
// -----------------------------------------------------------------------------
void test_total_assets_usd() {
    std::cout << "[TEST] O3 total_assets_usd\n";

    VaultHarness h;
    h.deposit_and_fulfill("alice", 3'000'000, RESERVE);

    oracle::UsdValuation v;
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::OracleNotConfigured);

    sim::PriceFeed feed;
    TEST_CHECK(h.vault.set_oracle(ADMIN, &feed) == Error::None);
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::OracleNotConfigured);

    TEST_CHECK(h.vault.set_price_id(ADMIN, "USDC/USD") == Error::None);
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::PriceUnavailable);

    feed.set_price("USDC/USD", usdc_quote(NOW - 10));
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::None);
    TEST_CHECK(v.assets == 3'000'000);
    TEST_CHECK(v.price.price == 100'020'000);
    TEST_CHECK(near(v.usd, 3.0006));

    // Default bound is 60 s
    TEST_CHECK(h.vault.total_assets_usd(NOW + 51, v) == Error::StalePrice);

    feed.set_price("USDC/USD", oracle::Price{.price = -1, .conf = 0, .expo = -8, .publish_time = NOW});
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::PriceUnavailable);

    BrokenFeed broken;
    TEST_CHECK(h.vault.set_oracle(ADMIN, &broken) == Error::None);
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::PriceUnavailable);

    TEST_CHECK(h.vault.set_oracle(ADMIN, nullptr) == Error::None);
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::OracleNotConfigured);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// O4. USD reporting never affects accounting
// -----------------------------------------------------------------------------
void test_oracle_independent_of_accounting() {
    std::cout << "[TEST] O4 accounting ignores the oracle\n";

    VaultHarness h;
    sim::PriceFeed feed;
    feed.set_price("USDC/USD", oracle::Price{.price = 50'000'000, .conf = 0, .expo = -8, .publish_time = NOW});
    TEST_CHECK(h.vault.set_oracle(ADMIN, &feed) == Error::None);
    TEST_CHECK(h.vault.set_price_id(ADMIN, "USDC/USD") == Error::None);

    h.deposit_and_fulfill("alice", 1'000'000, RESERVE);
    TEST_CHECK(h.vault.balance_of("alice") == 1'000'000);
    TEST_CHECK(h.vault.share_price() == config::PRICE_SCALE);

    oracle::UsdValuation v;
    TEST_CHECK(h.vault.total_assets_usd(NOW, v) == Error::None);
    TEST_CHECK(near(v.usd, 0.5));

    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_to_usd();
    test_price_feed();
    test_total_assets_usd();
    test_oracle_independent_of_accounting();

    std::cout << "\n[USD VALUATION TESTS PASSED]\n";
    return 0;
}
