#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format a fixed-point token amount with the given number of decimals.
// Trailing zeros of the fraction are dropped.
// Examples (decimals = 6):
//   1'500'000   -> "1.5"
//   2'000'000   -> "2"
//   1           -> "0.000001"
inline std::string format_units(uint64_t amount, uint8_t decimals) {
    if (decimals == 0) {
        return format_number_exact(amount);
    }
    uint64_t scale = 1;
    for (uint8_t i = 0; i < decimals && i < 19; ++i) {
        scale *= 10;
    }
    const uint64_t whole = amount / scale;
    const uint64_t frac  = amount % scale;
    if (frac == 0) {
        return format_number_exact(whole);
    }
    std::string f = std::format("{:0{}}", frac, static_cast<int>(decimals));
    while (!f.empty() && f.back() == '0') {
        f.pop_back();
    }
    return std::format("{}.{}", format_number_exact(whole), f);
}


// Format basis points as a percentage
// Example: 1'000 -> "10.00%"
inline std::string format_bps(uint64_t bps) {
    return std::format("{}.{:02}%", bps / 100, bps % 100);
}

} // namespace lcr
