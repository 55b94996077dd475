#pragma once

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <vector>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "yieldvault/access/roles.hpp"
#include "yieldvault/source/yield_source.hpp"
#include "lcr/log/logger.hpp"


namespace yieldvault::registry {

/*
===============================================================================
AllowList
===============================================================================

Governed set of yield sources the vault may move capital into and out of.

  - set_source() registers (or re-binds) an address with its tagged handle
  - remove_source() drops it
  - list_allowed() preserves registration order; re-binding keeps the slot

Mutation requires the Governor role. Handles are non-owning: the caller keeps
every registered source alive for as long as it stays listed.
===============================================================================
*/
class AllowList {
public:
    explicit AllowList(const access::Roles& roles)
        : roles_(roles)
    {}

    AllowList(const AllowList&) = delete;
    AllowList& operator=(const AllowList&) = delete;

    // ---------------------------------------------------------------------
    // Governance
    // ---------------------------------------------------------------------
    [[nodiscard]] Error set_source(const Address& caller, const Address& source, source::Handle handle) {
        if (!roles_.has_role(access::Role::Governor, caller)) {
            YV_DEBUG("[ALLOW] " << caller << " may not list " << source);
            return Error::Unauthorized;
        }
        if (source.empty()) {
            return Error::InvalidReceiver;
        }
        if (!handles_.contains(source)) {
            order_.push_back(source);
        }
        handles_[source] = handle;
        YV_INFO("[ALLOW] Listed " << source << " (" << source::to_string(handle.kind) << ")");
        return Error::None;
    }

    [[nodiscard]] Error remove_source(const Address& caller, const Address& source) {
        if (!roles_.has_role(access::Role::Governor, caller)) {
            YV_DEBUG("[ALLOW] " << caller << " may not delist " << source);
            return Error::Unauthorized;
        }
        if (handles_.erase(source) == 0) {
            return Error::SourceNotAllowed;
        }
        // `source` may refer into order_
        const Address key = source;
        order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
        YV_INFO("[ALLOW] Delisted " << key);
        return Error::None;
    }

    // ---------------------------------------------------------------------
    // Views
    // ---------------------------------------------------------------------
    [[nodiscard]] inline bool is_allowed(const Address& source) const {
        return handles_.contains(source);
    }

    [[nodiscard]] inline std::optional<source::Kind> kind_of(const Address& source) const {
        auto it = handles_.find(source);
        if (it == handles_.end()) {
            return std::nullopt;
        }
        return it->second.kind;
    }

    [[nodiscard]] inline const source::Handle* handle_of(const Address& source) const {
        auto it = handles_.find(source);
        return (it == handles_.end()) ? nullptr : &it->second;
    }

    [[nodiscard]] inline const std::vector<Address>& list_allowed() const noexcept {
        return order_;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return order_.size(); }

private:
    const access::Roles& roles_;
    std::vector<Address> order_;
    std::unordered_map<Address, source::Handle> handles_;
};

} // namespace yieldvault::registry
