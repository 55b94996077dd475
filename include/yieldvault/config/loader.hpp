#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "yieldvault/config/vault_config.hpp"


namespace yieldvault::config {

// ===============================================================
// LOADER RESULT
// ===============================================================
enum class Result : uint8_t {
    Ok,
    InvalidJson,    // document is not JSON
    InvalidSchema,  // root is not an object, or a known key has the wrong type
    InvalidValue,   // a known key is present but out of range
    IoError         // file could not be read
};

[[nodiscard]] inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "ok";
        case Result::InvalidJson:   return "invalid_json";
        case Result::InvalidSchema: return "invalid_schema";
        case Result::InvalidValue:  return "invalid_value";
        case Result::IoError:       return "io_error";
        default:                    return "unknown";
    }
}

/*
===============================================================================
Vault configuration loader
===============================================================================

Reads a flat JSON object into a VaultConfig. Recognized keys:

    {
      "name":            string,
      "symbol":          string,
      "asset_decimals":  unsigned  (<= 18),
      "fee_bps":         unsigned  (<= MAX_FEE_BPS),
      "fee_recipient":   string    ("" disables fee collection),
      "max_price_age_s": unsigned  (> 0),
      "price_id":        string
    }

Missing keys keep the value already held by `out`, so callers start from a
default-constructed VaultConfig. Unknown keys are ignored. On any failure
`out` is left untouched.
===============================================================================
*/
[[nodiscard]] Result load_from_string(std::string_view json, VaultConfig& out);

[[nodiscard]] Result load_from_file(const std::string& path, VaultConfig& out);

} // namespace yieldvault::config
