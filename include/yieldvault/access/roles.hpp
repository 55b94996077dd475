#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "lcr/log/logger.hpp"


namespace yieldvault::access {

// ===============================================================
// ROLES
// ===============================================================
enum class Role : uint8_t {
    Admin,      // fee settings, oracle binding, pause, role management
    Executor,   // fulfillment batches and manual pool operations
    Governor    // allow-list mutation
};

[[nodiscard]] inline constexpr std::string_view to_string(Role r) noexcept {
    switch (r) {
        case Role::Admin:    return "admin";
        case Role::Executor: return "executor";
        case Role::Governor: return "governor";
        default:             return "unknown";
    }
}

// ---------------------------------------------------------------
// Role table. The address passed at construction holds Admin.
// Only an Admin may grant or revoke roles.
// ---------------------------------------------------------------
class Roles {
public:
    explicit Roles(Address admin) {
        holders_[index_(Role::Admin)].insert(std::move(admin));
    }

    Roles(const Roles&) = delete;
    Roles& operator=(const Roles&) = delete;

    [[nodiscard]] inline bool has_role(Role role, const Address& account) const {
        return holders_[index_(role)].contains(account);
    }

    [[nodiscard]] inline Error grant(const Address& caller, Role role, const Address& account) {
        if (!has_role(Role::Admin, caller)) {
            YV_DEBUG("[ROLES] " << caller << " may not grant " << to_string(role));
            return Error::Unauthorized;
        }
        if (account.empty()) {
            return Error::InvalidReceiver;
        }
        holders_[index_(role)].insert(account);
        YV_INFO("[ROLES] Granted " << to_string(role) << " to " << account);
        return Error::None;
    }

    [[nodiscard]] inline Error revoke(const Address& caller, Role role, const Address& account) {
        if (!has_role(Role::Admin, caller)) {
            YV_DEBUG("[ROLES] " << caller << " may not revoke " << to_string(role));
            return Error::Unauthorized;
        }
        holders_[index_(role)].erase(account);
        YV_INFO("[ROLES] Revoked " << to_string(role) << " from " << account);
        return Error::None;
    }

private:
    static constexpr std::size_t ROLE_COUNT = 3;

    [[nodiscard]] static inline constexpr std::size_t index_(Role r) noexcept {
        return static_cast<std::size_t>(r);
    }

    std::unordered_set<Address> holders_[ROLE_COUNT];
};

} // namespace yieldvault::access
