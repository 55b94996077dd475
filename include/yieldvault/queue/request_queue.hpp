#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>

#include "yieldvault/core/types.hpp"
#include "yieldvault/core/error.hpp"
#include "yieldvault/queue/indexed_queue.hpp"


namespace yieldvault::queue {

// ---------------------------------------------------------------------------
// RequestQueue
// ---------------------------------------------------------------------------
//
// Request records keyed by controller plus the IndexedQueue that orders them.
// At most one live request per controller.
//
// Records and queue slots are kept by separate primitives: erase_request()
// deletes the record and remove_entry() drops the slot. Settlement runs both;
// a slot whose record is gone is a stale entry and is skipped by the engine.
//
// Request must expose `controller`.
// ---------------------------------------------------------------------------
template <typename Request>
class RequestQueue {
public:
    RequestQueue() = default;
    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    [[nodiscard]] Error enqueue(Request request) {
        if (requests_.contains(request.controller) || order_.contains(request.controller)) {
            return Error::AlreadyPending;
        }
        order_.push_back(request.controller);
        Address key = request.controller;
        requests_.emplace(std::move(key), std::move(request));
        return Error::None;
    }

    [[nodiscard]] inline const Request* find(const Address& controller) const {
        auto it = requests_.find(controller);
        return (it == requests_.end()) ? nullptr : &it->second;
    }

    inline bool erase_request(const Address& controller) {
        return requests_.erase(controller) != 0;
    }

    inline bool remove_entry(const Address& controller) {
        return order_.remove(controller);
    }

    [[nodiscard]] inline bool is_pending(const Address& controller) const {
        return requests_.contains(controller);
    }

    [[nodiscard]] inline const Address& at(std::size_t slot) const { return order_.at(slot); }
    [[nodiscard]] inline std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return order_.empty(); }
    [[nodiscard]] inline std::size_t request_count() const noexcept { return requests_.size(); }
    [[nodiscard]] inline const IndexedQueue& order() const noexcept { return order_; }

private:
    IndexedQueue order_;
    std::unordered_map<Address, Request> requests_;
};

} // namespace yieldvault::queue
