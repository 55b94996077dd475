#include "yieldvault/events/journal.hpp"

#include <filesystem>
#include <limits>

#include "lcr/log/logger.hpp"


namespace yieldvault::events {

namespace {

// seq + type + assets + shares + fee + controller_len + counterparty_len
constexpr std::size_t FIXED_PAYLOAD_SIZE = 8 + 1 + 8 + 8 + 8 + 2 + 2;

constexpr std::size_t MAX_ADDRESS_SIZE = std::numeric_limits<uint16_t>::max();

} // namespace

// -----------------------------------------------------------------------------
// Payload codec
// -----------------------------------------------------------------------------

std::string encode_payload(const Event& ev) {
    std::string buf;
    buf.reserve(FIXED_PAYLOAD_SIZE + ev.controller.size() + ev.counterparty.size());
    lcr::put_le<uint64_t>(buf, ev.seq);
    lcr::put_le<uint8_t>(buf, static_cast<uint8_t>(ev.type));
    lcr::put_le<uint64_t>(buf, ev.assets);
    lcr::put_le<uint64_t>(buf, ev.shares);
    lcr::put_le<uint64_t>(buf, ev.fee);
    lcr::put_le<uint16_t>(buf, static_cast<uint16_t>(ev.controller.size()));
    lcr::put_le<uint16_t>(buf, static_cast<uint16_t>(ev.counterparty.size()));
    buf.append(ev.controller);
    buf.append(ev.counterparty);
    return buf;
}

bool decode_payload(std::string_view payload, Event& out) {
    if (payload.size() < FIXED_PAYLOAD_SIZE) {
        return false;
    }
    const char* p = payload.data();
    Event ev;
    ev.seq = lcr::get_le<uint64_t>(p);                       p += 8;
    ev.type = static_cast<EventType>(lcr::get_le<uint8_t>(p)); p += 1;
    ev.assets = lcr::get_le<uint64_t>(p);                    p += 8;
    ev.shares = lcr::get_le<uint64_t>(p);                    p += 8;
    ev.fee = lcr::get_le<uint64_t>(p);                       p += 8;
    const uint16_t controller_len = lcr::get_le<uint16_t>(p);   p += 2;
    const uint16_t counterparty_len = lcr::get_le<uint16_t>(p); p += 2;

    if (!is_valid(ev.type)) {
        return false;
    }
    if (payload.size() != FIXED_PAYLOAD_SIZE + controller_len + counterparty_len) {
        return false;
    }
    ev.controller.assign(p, controller_len);
    p += controller_len;
    ev.counterparty.assign(p, counterparty_len);
    out = std::move(ev);
    return true;
}

// -----------------------------------------------------------------------------
// Journal
// -----------------------------------------------------------------------------

Status Journal::open(const std::string& path) {
    close();
    records_ = 0;
    last_chained_ = 0;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        ReplayResult replay;
        Status s = read_journal(path, replay);
        if (s != Status::Ok) {
            YV_ERROR("[JOURNAL] Refusing to append to " << path << ": " << to_string(s)
                     << " at offset " << replay.bad_offset);
            return s;
        }
        records_ = replay.records;
        last_chained_ = replay.last_chained;
    }

    out_.open(path, std::ios::binary | std::ios::app);
    if (!out_.is_open()) {
        YV_ERROR("[JOURNAL] Cannot open " << path);
        return Status::IoError;
    }
    path_ = path;
    YV_INFO("[JOURNAL] Opened " << path << " (" << records_ << " records)");
    return Status::Ok;
}

Status Journal::append(const Event& ev) {
    if (!out_.is_open()) {
        return Status::IoError;
    }
    if (ev.controller.size() > MAX_ADDRESS_SIZE || ev.counterparty.size() > MAX_ADDRESS_SIZE) {
        return Status::MalformedPayload;
    }
    const std::string payload = encode_payload(ev);
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        return Status::MalformedPayload;
    }

    const uint64_t payload_checksum = XXH64(payload.data(), payload.size(), 0);
    const uint64_t chained = XXH64(payload.data(), payload.size(), last_chained_);

    RecordHeader header{};
    header.finalize(static_cast<uint32_t>(payload.size()), payload_checksum, chained);

    out_.write(reinterpret_cast<const char*>(&header), sizeof(header));
    out_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out_.flush();
    if (!out_) {
        YV_ERROR("[JOURNAL] Write failed on " << path_);
        return Status::IoError;
    }

    last_chained_ = chained;
    ++records_;
    return Status::Ok;
}

void Journal::close() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
        YV_DEBUG("[JOURNAL] Closed " << path_ << " (" << records_ << " records)");
    }
}

Sink Journal::sink() {
    return [this](const Event& ev) {
        Status s = append(ev);
        if (s != Status::Ok) {
            YV_ERROR("[JOURNAL] Dropped event #" << ev.seq << ": " << to_string(s));
        }
    };
}

// -----------------------------------------------------------------------------
// Replay
// -----------------------------------------------------------------------------

Status read_journal(const std::string& path, ReplayResult& out) {
    out = ReplayResult{};

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Status::IoError;
    }

    uint64_t offset = 0;
    uint64_t prev_chained = 0;
    std::string payload;

    while (true) {
        RecordHeader header{};
        in.read(reinterpret_cast<char*>(&header), sizeof(header));
        const std::streamsize got = in.gcount();
        if (got == 0 && in.eof()) {
            break; // clean end of file
        }
        out.bad_offset = offset;
        if (got != static_cast<std::streamsize>(sizeof(header))) {
            YV_TRACE("[!!] Journal truncated inside header at offset " << offset);
            return Status::Truncated;
        }
        // 1. Header integrity
        if (header.magic() != JOURNAL_MAGIC) {
            YV_TRACE("[!!] Bad journal magic at offset " << offset);
            return Status::BadMagic;
        }
        if (!header.validate_checksum()) {
            YV_TRACE("[!!] Journal header checksum mismatch at offset " << offset);
            return Status::HeaderChecksumMismatch;
        }
        const uint32_t size = header.payload_size();
        if (size > MAX_PAYLOAD_SIZE) {
            return Status::MalformedPayload;
        }
        // 2. Payload
        payload.resize(size);
        in.read(payload.data(), size);
        if (in.gcount() != static_cast<std::streamsize>(size)) {
            YV_TRACE("[!!] Journal truncated inside payload at offset " << offset);
            return Status::Truncated;
        }
        const uint64_t local = XXH64(payload.data(), payload.size(), 0);
        if (local != header.payload_checksum()) {
            YV_TRACE("[!!] Payload checksum mismatch: expected " << header.payload_checksum() << ", computed " << local);
            return Status::PayloadChecksumMismatch;
        }
        const uint64_t chained = XXH64(payload.data(), payload.size(), prev_chained);
        if (chained != header.chained_checksum()) {
            YV_TRACE("[!!] Chained checksum mismatch: expected " << header.chained_checksum() << ", computed " << chained);
            return Status::ChainedChecksumMismatch;
        }
        // 3. Decode
        Event ev;
        if (!decode_payload(payload, ev)) {
            return Status::MalformedPayload;
        }
        out.events.push_back(std::move(ev));
        ++out.records;
        out.last_chained = chained;
        prev_chained = chained;
        offset += sizeof(header) + size;
    }
    out.bad_offset = 0;
    return Status::Ok;
}

} // namespace yieldvault::events
