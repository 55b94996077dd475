#pragma once

#include <cstdint>
#include <limits>

namespace lcr {

// -----------------------------------------------------------------------------
// Fixed-point helpers for unsigned 64-bit amounts
// -----------------------------------------------------------------------------
//
// mul_div computes floor(a * b / d) through a 128-bit intermediate so the
// product never overflows. Results that do not fit in 64 bits clamp to
// UINT64_MAX. Division by zero yields 0; callers guard their denominators.
// -----------------------------------------------------------------------------

[[nodiscard]] inline constexpr uint64_t mul_div(uint64_t a, uint64_t b, uint64_t d) noexcept {
    if (d == 0) {
        return 0;
    }
    const unsigned __int128 q = (static_cast<unsigned __int128>(a) * b) / d;
    if (q > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(q);
}

// Same as mul_div, but reports a result that does not fit instead of
// clamping it. `out` is left untouched on failure.
[[nodiscard]] inline constexpr bool checked_mul_div(uint64_t a, uint64_t b, uint64_t d, uint64_t& out) noexcept {
    if (d == 0) {
        return false;
    }
    const unsigned __int128 q = (static_cast<unsigned __int128>(a) * b) / d;
    if (q > std::numeric_limits<uint64_t>::max()) {
        return false;
    }
    out = static_cast<uint64_t>(q);
    return true;
}

// a + b, false when the sum wraps
[[nodiscard]] inline constexpr bool checked_add(uint64_t a, uint64_t b, uint64_t& out) noexcept {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        return false;
    }
    out = a + b;
    return true;
}

// a - b, floored at zero
[[nodiscard]] inline constexpr uint64_t saturating_sub(uint64_t a, uint64_t b) noexcept {
    return (b > a) ? 0 : a - b;
}

// a + b, clamped at UINT64_MAX
[[nodiscard]] inline constexpr uint64_t saturating_add(uint64_t a, uint64_t b) noexcept {
    const uint64_t s = a + b;
    return (s < a) ? std::numeric_limits<uint64_t>::max() : s;
}

} // namespace lcr
