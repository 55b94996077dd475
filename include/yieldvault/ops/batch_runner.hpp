#pragma once

#include <algorithm>
#include <cstdint>

#include "yieldvault/core/error.hpp"
#include "yieldvault/config/constants.hpp"
#include "yieldvault/engine/settlement_engine.hpp"
#include "lcr/log/logger.hpp"


namespace yieldvault::ops {

// Outcome of draining one queue
struct DrainResult {
    Error         last_error{Error::None};
    std::uint32_t batches{0};
    std::uint32_t processed{0};
    Amount        assets{0};
};

/*
===============================================================================
Batch runner
===============================================================================

Operator loop over the fulfillment entry points:

  - batches of at most `batch_size` (clamped to MAX_DEPOSIT_BATCH)
  - a failing batch is retried once at half its size
  - stops when the queue is empty, when the retry fails too, or when a batch
    neither settles a request nor shrinks the queue (everything left would
    mint zero shares, or cannot be funded)
===============================================================================
*/
namespace detail {

template <typename Fulfill, typename QueueLength>
inline DrainResult drain(const char* label, std::uint32_t batch_size, Fulfill&& fulfill, QueueLength&& queue_length) {
    DrainResult out;
    std::uint32_t batch = std::clamp<std::uint32_t>(batch_size, 1, config::MAX_DEPOSIT_BATCH);

    while (queue_length() > 0) {
        const std::size_t before = queue_length();
        FulfillResult r = fulfill(batch);
        ++out.batches;
        if (!r.ok() && batch > 1) {
            YV_WARN("[OPS] " << label << " batch of " << batch << " failed (" << r.error << "), retrying at " << batch / 2);
            out.processed += r.processed;
            out.assets += r.assets;
            batch /= 2;
            r = fulfill(batch);
            ++out.batches;
        }
        out.processed += r.processed;
        out.assets += r.assets;
        out.last_error = r.error;
        if (!r.ok()) {
            YV_ERROR("[OPS] " << label << " stopped: " << r.error);
            break;
        }
        if (r.processed == 0 && queue_length() >= before) {
            YV_INFO("[OPS] " << label << " made no progress, " << queue_length() << " left queued");
            break;
        }
    }
    YV_INFO("[OPS] " << label << ": " << out.processed << " settled in " << out.batches << " batches");
    return out;
}

} // namespace detail

[[nodiscard]] inline DrainResult drain_deposits(engine::SettlementEngine& vault, const Address& executor,
                                                const Address& target,
                                                std::uint32_t batch_size = config::MAX_DEPOSIT_BATCH) {
    return detail::drain("deposits", batch_size,
        [&](std::uint32_t n) { return vault.fulfill_deposits(executor, n, target); },
        [&]() { return vault.deposit_queue_length(); });
}

[[nodiscard]] inline DrainResult drain_withdrawals(engine::SettlementEngine& vault, const Address& executor,
                                                   std::uint32_t batch_size = config::MAX_DEPOSIT_BATCH) {
    return detail::drain("withdrawals", batch_size,
        [&](std::uint32_t n) { return vault.fulfill_withdrawals(executor, n); },
        [&]() { return vault.redeem_queue_length(); });
}

} // namespace yieldvault::ops
