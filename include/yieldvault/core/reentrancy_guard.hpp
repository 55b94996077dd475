#pragma once

#include "lcr/log/logger.hpp"


namespace yieldvault {

/*
===============================================================================
ReentrancyGuard
===============================================================================

Exclusive lock held for the duration of one mutating call.

Every state-mutating entry point opens a Scope before it touches any state.
A Scope opened while another one is alive on the same guard does not acquire
the lock and reports acquired() == false; the caller must bail out with
Error::Reentrancy. The lock is released when the owning Scope is destroyed,
on every exit path.

The guard protects against re-entry through external collaborators (a yield
source calling back into the vault from inside supply()/withdraw()). It is
not a thread synchronization primitive: the engine is single-threaded and
run-to-completion.
===============================================================================
*/
class ReentrancyGuard {
public:
    ReentrancyGuard() = default;
    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard)
            : guard_(guard)
            , acquired_(!guard.locked_)
        {
            if (acquired_) {
                guard_.locked_ = true;
            } else {
                YV_DEBUG("[GUARD] Re-entrant call rejected");
            }
        }

        ~Scope() {
            if (acquired_) {
                guard_.locked_ = false;
            }
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        [[nodiscard]] inline bool acquired() const noexcept { return acquired_; }

    private:
        ReentrancyGuard& guard_;
        bool acquired_;
    };

    [[nodiscard]] inline bool locked() const noexcept { return locked_; }

private:
    bool locked_{false};
};

} // namespace yieldvault
