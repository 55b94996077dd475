#pragma once

#include <cstdint>
#include <string>


namespace yieldvault {

// Account identity (user, vault, pool or token). Empty means "none".
using Address = std::string;

// Amounts are unsigned integers in the smallest unit of the asset (or share).
using Amount = std::uint64_t;

template <typename>
inline constexpr bool always_false = false;

} // namespace yieldvault
