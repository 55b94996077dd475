#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string_view>

#include "yieldvault/core/types.hpp"


namespace yieldvault::events {

// ===============================================================
// EVENT TYPE
// ===============================================================
enum class EventType : uint8_t {
    DepositRequested    = 1,
    DepositCancelled    = 2,
    DepositFulfilled    = 3,
    RedeemRequested     = 4,
    WithdrawalFulfilled = 5,
    PoolSupplied        = 6,
    PoolWithdrawn       = 7
};

[[nodiscard]] inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::DepositRequested:    return "deposit_requested";
        case EventType::DepositCancelled:    return "deposit_cancelled";
        case EventType::DepositFulfilled:    return "deposit_fulfilled";
        case EventType::RedeemRequested:     return "redeem_requested";
        case EventType::WithdrawalFulfilled: return "withdrawal_fulfilled";
        case EventType::PoolSupplied:        return "pool_supplied";
        case EventType::PoolWithdrawn:       return "pool_withdrawn";
        default:                             return "unknown";
    }
}

[[nodiscard]] inline constexpr bool is_valid(EventType t) noexcept {
    return static_cast<uint8_t>(t) >= static_cast<uint8_t>(EventType::DepositRequested) &&
           static_cast<uint8_t>(t) <= static_cast<uint8_t>(EventType::PoolWithdrawn);
}

// ---------------------------------------------------------------------------
// One state transition of the vault
// ---------------------------------------------------------------------------
//
//  type                 controller      counterparty   assets      shares   fee
//  DepositRequested     depositor       receiver       deposited   -        -
//  DepositCancelled     depositor       depositor      refunded    -        -
//  DepositFulfilled     depositor       receiver       deposited   minted   -
//  RedeemRequested      redeemer        receiver       snapshot    escrowed -
//  WithdrawalFulfilled  redeemer        receiver       payout      burned   fee
//  PoolSupplied         caller          pool           supplied    -        -
//  PoolWithdrawn        caller          pool           received    -        -
//
// seq increases by one for every event the vault emits, starting at 1.
// ---------------------------------------------------------------------------
struct Event {
    std::uint64_t seq{0};
    EventType     type{EventType::DepositRequested};
    Address       controller;
    Address       counterparty;
    Amount        assets{0};
    Amount        shares{0};
    Amount        fee{0};

    bool operator==(const Event&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Event& ev) {
    os << "#" << ev.seq << " " << to_string(ev.type)
       << " controller=" << ev.controller
       << " counterparty=" << ev.counterparty
       << " assets=" << ev.assets;
    if (ev.shares != 0) os << " shares=" << ev.shares;
    if (ev.fee != 0)    os << " fee=" << ev.fee;
    return os;
}

using Sink = std::function<void(const Event&)>;

} // namespace yieldvault::events
