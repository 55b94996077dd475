#pragma once

#include "yieldvault/core/types.hpp"
#include "yieldvault/queue/request_queue.hpp"


namespace yieldvault::queue {

// Pending withdrawal. `shares` sit in escrow on the vault's own account;
// `assets` is the value fixed at request time and is never recomputed.
struct WithdrawalRequest {
    Address controller;
    Amount  shares{0};
    Amount  assets{0};
    Address receiver;
};

using RedeemQueue = RequestQueue<WithdrawalRequest>;

} // namespace yieldvault::queue
