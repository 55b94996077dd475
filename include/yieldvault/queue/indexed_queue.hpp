#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "yieldvault/core/types.hpp"


namespace yieldvault::queue {

/*
===============================================================================
IndexedQueue
===============================================================================

Ordered list of pending identities plus a reverse index (identity -> slot).

push_back() appends in O(1). remove() is O(1) by swap-with-last: slot i is
overwritten by the entry at the tail, the moved entry's index is updated to
i, and the list shrinks by one.

Removal therefore reorders the queue: after remove(), the former tail sits in
the vacated slot. Consumers walk "current array order from the head", which
is not strict insertion order once anything has been removed from the middle.

Invariant: for every slot i, index_of(at(i)) == i, and the index holds no
other keys.
===============================================================================
*/
class IndexedQueue {
public:
    IndexedQueue() = default;

    // Appends `id`. Returns false (and does nothing) if already present.
    bool push_back(const Address& id) {
        if (index_.contains(id)) {
            return false;
        }
        index_.emplace(id, entries_.size());
        entries_.push_back(id);
        return true;
    }

    // Removes `id` by swap-with-last. Returns false if absent.
    bool remove(const Address& id) {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return false;
        }
        // `id` may alias a slot of entries_: drop its index before moving
        const std::size_t slot = it->second;
        index_.erase(it);
        const std::size_t last = entries_.size() - 1;
        if (slot != last) {
            entries_[slot] = std::move(entries_[last]);
            index_[entries_[slot]] = slot;
        }
        entries_.pop_back();
        return true;
    }

    [[nodiscard]] inline bool contains(const Address& id) const { return index_.contains(id); }

    [[nodiscard]] inline std::optional<std::size_t> index_of(const Address& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] inline const Address& at(std::size_t slot) const { return entries_.at(slot); }
    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] inline const std::vector<Address>& entries() const noexcept { return entries_; }

    // Verifies the slot <-> index bijection
    [[nodiscard]] bool consistent() const {
        if (index_.size() != entries_.size()) {
            return false;
        }
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            auto it = index_.find(entries_[i]);
            if (it == index_.end() || it->second != i) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<Address> entries_;
    std::unordered_map<Address, std::size_t> index_;
};

} // namespace yieldvault::queue
