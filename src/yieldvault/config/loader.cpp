#include "yieldvault/config/loader.hpp"

#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace yieldvault::config {

namespace {

// ------------------------------------------------------------
// Optional field helpers
//
// Each helper leaves `out` untouched when the key is absent and
// fails with InvalidSchema when it is present with the wrong type.
// ------------------------------------------------------------
[[nodiscard]]
Result parse_string_optional(const simdjson::dom::element& root, const char* key, std::string& out) {
    auto field = root[key];
    if (field.error() == simdjson::NO_SUCH_FIELD) {
        return Result::Ok;
    }
    std::string_view sv;
    if (field.get(sv)) {
        YV_WARN("[CONFIG] Field '" << key << "' must be a string");
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Ok;
}

[[nodiscard]]
Result parse_uint64_optional(const simdjson::dom::element& root, const char* key, std::uint64_t& out) {
    auto field = root[key];
    if (field.error() == simdjson::NO_SUCH_FIELD) {
        return Result::Ok;
    }
    std::uint64_t v = 0;
    if (field.get(v)) {
        YV_WARN("[CONFIG] Field '" << key << "' must be an unsigned integer");
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Ok;
}

[[nodiscard]]
Result parse_root(const simdjson::dom::element& root, VaultConfig& out) {
    if (root.type() != simdjson::dom::element_type::OBJECT) {
        YV_WARN("[CONFIG] Root element must be an object");
        return Result::InvalidSchema;
    }

    // Work on a copy: `out` only changes when the whole document is valid
    VaultConfig cfg = out;
    std::uint64_t decimals = cfg.asset_decimals;

    Result r = Result::Ok;
    if ((r = parse_string_optional(root, "name", cfg.name)) != Result::Ok) return r;
    if ((r = parse_string_optional(root, "symbol", cfg.symbol)) != Result::Ok) return r;
    if ((r = parse_uint64_optional(root, "asset_decimals", decimals)) != Result::Ok) return r;
    if ((r = parse_uint64_optional(root, "fee_bps", cfg.fee_bps)) != Result::Ok) return r;
    if ((r = parse_string_optional(root, "fee_recipient", cfg.fee_recipient)) != Result::Ok) return r;
    if ((r = parse_uint64_optional(root, "max_price_age_s", cfg.max_price_age_s)) != Result::Ok) return r;
    if ((r = parse_string_optional(root, "price_id", cfg.price_id)) != Result::Ok) return r;

    // ---- Range checks ----
    if (decimals > MAX_ASSET_DECIMALS) {
        YV_WARN("[CONFIG] asset_decimals out of range: " << decimals);
        return Result::InvalidValue;
    }
    if (cfg.fee_bps > MAX_FEE_BPS) {
        YV_WARN("[CONFIG] fee_bps above maximum (" << MAX_FEE_BPS << "): " << cfg.fee_bps);
        return Result::InvalidValue;
    }
    if (cfg.max_price_age_s == 0) {
        YV_WARN("[CONFIG] max_price_age_s must be positive");
        return Result::InvalidValue;
    }
    cfg.asset_decimals = static_cast<std::uint8_t>(decimals);

    out = std::move(cfg);
    return Result::Ok;
}

} // namespace


Result load_from_string(std::string_view json, VaultConfig& out) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json);
    simdjson::dom::element root;
    if (auto err = parser.parse(padded).get(root); err) {
        YV_WARN("[CONFIG] JSON parse error: " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    return parse_root(root, out);
}

Result load_from_file(const std::string& path, VaultConfig& out) {
    simdjson::padded_string content;
    if (auto err = simdjson::padded_string::load(path).get(content); err) {
        YV_ERROR("[CONFIG] Cannot read '" << path << "': " << simdjson::error_message(err));
        return Result::IoError;
    }
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (auto err = parser.parse(content).get(root); err) {
        YV_WARN("[CONFIG] JSON parse error in '" << path << "': " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    Result r = parse_root(root, out);
    if (r == Result::Ok) {
        YV_INFO("[CONFIG] Loaded " << path);
    }
    return r;
}

} // namespace yieldvault::config
