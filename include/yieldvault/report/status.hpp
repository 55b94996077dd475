#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "yieldvault/core/types.hpp"
#include "yieldvault/source/yield_source.hpp"
#include "yieldvault/engine/settlement_engine.hpp"


namespace yieldvault::report {

// Recorded principal vs. live position of one listed source
struct SourceLine {
    Address      address;
    source::Kind kind{source::Kind::ReserveStyle};
    Amount       principal{0};
    Amount       value{0};
};

// ---------------------------------------------------------------------------
// Point-in-time snapshot of a vault, for operators and logs
// ---------------------------------------------------------------------------
struct Status {
    std::string   name;
    std::string   symbol;
    std::uint8_t  asset_decimals{0};
    bool          paused{false};
    std::uint64_t fee_bps{0};
    Address       fee_recipient;

    Amount        idle_balance{0};
    Amount        total_assets{0};
    Amount        total_supply{0};
    std::uint64_t share_price{0};
    Amount        pending_deposit_assets{0};
    Amount        total_requested_assets{0};
    std::size_t   deposit_queue_length{0};
    std::size_t   redeem_queue_length{0};

    std::vector<SourceLine> sources;
};

[[nodiscard]] Status capture(const engine::SettlementEngine& vault);

std::ostream& operator<<(std::ostream& os, const Status& s);

} // namespace yieldvault::report
