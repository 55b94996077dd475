#pragma once

#include "yieldvault/core/types.hpp"
#include "yieldvault/queue/request_queue.hpp"


namespace yieldvault::queue {

// Pending deposit. The assets are already held by the vault; shares are
// minted to `receiver` at fulfillment.
struct DepositRequest {
    Address controller;
    Address receiver;
    Amount  assets{0};
};

using DepositQueue = RequestQueue<DepositRequest>;

} // namespace yieldvault::queue
