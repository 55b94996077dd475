#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <xxhash.h>

#include "yieldvault/events/event.hpp"
#include "lcr/endian.hpp"


namespace yieldvault::events {

// ===============================================================
// JOURNAL STATUS
// ===============================================================
enum class Status : uint8_t {
    Ok,
    IoError,
    Truncated,                 // file ends inside a record
    BadMagic,
    HeaderChecksumMismatch,
    PayloadChecksumMismatch,
    ChainedChecksumMismatch,
    MalformedPayload
};

[[nodiscard]] inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
        case Status::Ok:                      return "ok";
        case Status::IoError:                 return "io_error";
        case Status::Truncated:               return "truncated";
        case Status::BadMagic:                return "bad_magic";
        case Status::HeaderChecksumMismatch:  return "header_checksum_mismatch";
        case Status::PayloadChecksumMismatch: return "payload_checksum_mismatch";
        case Status::ChainedChecksumMismatch: return "chained_checksum_mismatch";
        case Status::MalformedPayload:        return "malformed_payload";
        default:                              return "unknown";
    }
}

// 'YVJ1'
inline constexpr std::uint32_t JOURNAL_MAGIC = 0x314A5659u;

// ---------------------------------------------------------------------------
// Header of a single journal record (32 B), followed by `payload_size` bytes
// ---------------------------------------------------------------------------
struct RecordHeader {
    uint32_t magic_le;
    uint32_t payload_size_le;
    uint64_t payload_checksum_le;   // XXH64 of payload
    uint64_t chained_checksum_le;   // XXH64 of payload seeded with previous chained
    uint64_t checksum_le;           // XXH64 of this header (excluding this field)

    [[nodiscard]] inline uint32_t magic() const noexcept { return lcr::from_le32(magic_le); }
    [[nodiscard]] inline uint32_t payload_size() const noexcept { return lcr::from_le32(payload_size_le); }
    [[nodiscard]] inline uint64_t payload_checksum() const noexcept { return lcr::from_le64(payload_checksum_le); }
    [[nodiscard]] inline uint64_t chained_checksum() const noexcept { return lcr::from_le64(chained_checksum_le); }
    [[nodiscard]] inline uint64_t checksum() const noexcept { return lcr::from_le64(checksum_le); }

    [[nodiscard]] static inline uint64_t compute_checksum(const RecordHeader& header) noexcept {
        return XXH64(&header, offsetof(RecordHeader, checksum_le), 0);
    }

    inline void finalize(uint32_t payload_size, uint64_t payload_checksum, uint64_t chained_checksum) noexcept {
        magic_le = lcr::to_le32(JOURNAL_MAGIC);
        payload_size_le = lcr::to_le32(payload_size);
        payload_checksum_le = lcr::to_le64(payload_checksum);
        chained_checksum_le = lcr::to_le64(chained_checksum);
        checksum_le = lcr::to_le64(compute_checksum(*this));
    }

    [[nodiscard]] inline bool validate_checksum() const noexcept {
        return checksum() == compute_checksum(*this);
    }
};
// ======================================================
// Layout validation (prevent ABI drift)
// ======================================================
static_assert(sizeof(RecordHeader) == 32, "RecordHeader must be 32 bytes");
static_assert(offsetof(RecordHeader, checksum_le) == 24, "checksum_le offset mismatch");
static_assert(std::is_trivially_copyable_v<RecordHeader>, "RecordHeader must be trivially copyable");

// Largest payload accepted on replay
inline constexpr uint32_t MAX_PAYLOAD_SIZE = 64 * 1024;


// Payload encoding of one event (exposed for tests)
[[nodiscard]] std::string encode_payload(const Event& ev);
[[nodiscard]] bool decode_payload(std::string_view payload, Event& out);


/*
===============================================================================
Journal
===============================================================================

Append-only binary file of vault events. Each record is a RecordHeader plus
an encoded Event. The chained checksum of record N is XXH64(payload_N) seeded
with the chained checksum of record N-1 (0 for the first record), so any
edit, removal or reordering of earlier records breaks every later link.

open() replays an existing file to recover the chain tail and refuses to
append to a file that does not verify. Records are flushed on append.
===============================================================================
*/
class Journal {
public:
    Journal() = default;
    ~Journal() { close(); }

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    [[nodiscard]] Status open(const std::string& path);
    [[nodiscard]] Status append(const Event& ev);
    void close();

    [[nodiscard]] inline bool is_open() const noexcept { return out_.is_open(); }
    [[nodiscard]] inline uint64_t records() const noexcept { return records_; }
    [[nodiscard]] inline uint64_t last_chained() const noexcept { return last_chained_; }

    // Subscriber that appends every event; failures are logged
    [[nodiscard]] Sink sink();

private:
    std::string path_;
    std::ofstream out_;
    uint64_t records_{0};
    uint64_t last_chained_{0};
};


// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------
struct ReplayResult {
    std::vector<Event> events;
    uint64_t records{0};        // records verified
    uint64_t last_chained{0};   // chained checksum of the last verified record
    uint64_t bad_offset{0};     // byte offset of the first bad record (if any)
};

// Reads and verifies every record of `path`. Stops at the first bad record;
// `out` then holds everything verified before it. A missing file is IoError.
[[nodiscard]] Status read_journal(const std::string& path, ReplayResult& out);

} // namespace yieldvault::events
