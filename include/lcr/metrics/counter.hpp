#pragma once

#include <string>
#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
//
// No multithreading guarantees: owned by a single writer, read through
// copy_to() snapshots.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned value type");

    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline void copy_to(counter& dst) const noexcept { dst.value_ = value_; }

    [[nodiscard]] inline constexpr T load() const noexcept { return value_; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

    template <typename Collector>
    void collect(const std::string& name, const std::string& help, Collector& collector) const {
        collector.add_counter(load(), name, help);
    }

private:
    T value_{0};
};

// ---------------------------------------------------------------------------
// gauge - instantaneous value that moves both ways
// ---------------------------------------------------------------------------
//
// dec() saturates at zero for unsigned value types instead of wrapping.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct gauge {
    constexpr gauge() noexcept = default;
    constexpr explicit gauge(T initial) noexcept : value_(initial) {}
    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;

    inline void copy_to(gauge& dst) const noexcept { dst.value_ = value_; }

    [[nodiscard]] inline constexpr T load() const noexcept { return value_; }
    inline constexpr void store(T v) noexcept { value_ = v; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void dec(T n = 1) noexcept {
        if constexpr (std::is_unsigned_v<T>) {
            value_ = (n > value_) ? T{0} : static_cast<T>(value_ - n);
        } else {
            value_ -= n;
        }
    }

    template <typename Collector>
    void collect(const std::string& name, const std::string& help, Collector& collector) const {
        collector.add_gauge(load(), name, help);
    }

private:
    T value_{0};
};

using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;
using gauge64   = gauge<uint64_t>;

} // namespace metrics
} // namespace lcr
