/*
===============================================================================
 events::Journal - Unit Tests
===============================================================================

Scope:
------
Append-only event journal: record framing, XXH64 integrity and chaining,
replay and the refusal to extend a damaged file.

Covered Requirements:
---------------------
J1. Appended events replay identically
J2. Reopening continues the chain
J3. A corrupted payload stops replay at the damaged record
J4. A truncated tail is reported
J5. Removing a record breaks the chain
J6. Payload decoding rejects malformed input
J7. The journal sink records everything the vault emits

===============================================================================
*/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "common/harness/vault.hpp"

using namespace yieldvault;
using namespace yieldvault::events;

namespace {

std::string temp_path(const char* name) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path.string();
}

std::string read_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_bytes(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

Event make_event(std::uint64_t seq, EventType type, const char* controller, Amount assets) {
    return Event{
        .seq = seq,
        .type = type,
        .controller = controller,
        .counterparty = "pool.reserve",
        .assets = assets,
        .shares = assets / 2,
        .fee = seq
    };
}

std::size_t record_size(const Event& ev) {
    return sizeof(RecordHeader) + encode_payload(ev).size();
}

} // namespace


// -----------------------------------------------------------------------------
// J1. Appended events replay identically
// -----------------------------------------------------------------------------
void test_roundtrip() {
    std::cout << "[TEST] J1 append and replay\n";

    const std::string path = temp_path("yv_journal_roundtrip.bin");
    const Event e1 = make_event(1, EventType::DepositRequested, "alice", 100);
    const Event e2 = make_event(2, EventType::DepositFulfilled, "alice", 100);
    const Event e3 = make_event(3, EventType::PoolSupplied, "executor", 100);
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.is_open());
        TEST_CHECK(journal.append(e1) == Status::Ok);
        TEST_CHECK(journal.append(e2) == Status::Ok);
        TEST_CHECK(journal.append(e3) == Status::Ok);
        TEST_CHECK(journal.records() == 3);
    }

    ReplayResult replay;
    TEST_CHECK(read_journal(path, replay) == Status::Ok);
    TEST_CHECK(replay.records == 3);
    TEST_CHECK(replay.events.size() == 3);
    TEST_CHECK(replay.events[0] == e1);
    TEST_CHECK(replay.events[1] == e2);
    TEST_CHECK(replay.events[2] == e3);
    TEST_CHECK(read_bytes(path).size() == record_size(e1) + record_size(e2) + record_size(e3));

    // Closed journals refuse appends
    Journal closed;
    TEST_CHECK(closed.append(e1) == Status::IoError);

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J2. Reopening continues the chain
// -----------------------------------------------------------------------------
void test_reopen_continues_chain() {
    std::cout << "[TEST] J2 reopen continues the chain\n";

    const std::string path = temp_path("yv_journal_reopen.bin");
    std::uint64_t chained = 0;
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.append(make_event(1, EventType::DepositRequested, "a", 10)) == Status::Ok);
        TEST_CHECK(journal.append(make_event(2, EventType::DepositCancelled, "a", 10)) == Status::Ok);
        chained = journal.last_chained();
        TEST_CHECK(chained != 0);
    }
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.records() == 2);
        TEST_CHECK(journal.last_chained() == chained);
        TEST_CHECK(journal.append(make_event(3, EventType::RedeemRequested, "b", 5)) == Status::Ok);
        TEST_CHECK(journal.last_chained() != chained);
    }

    ReplayResult replay;
    TEST_CHECK(read_journal(path, replay) == Status::Ok);
    TEST_CHECK(replay.records == 3);
    TEST_CHECK(replay.events[2].controller == "b");

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J3. A corrupted payload stops replay at the damaged record
// -----------------------------------------------------------------------------
void test_corrupted_payload() {
    std::cout << "[TEST] J3 corrupted payload\n";

    const std::string path = temp_path("yv_journal_corrupt.bin");
    const Event e1 = make_event(1, EventType::DepositRequested, "alice", 100);
    const Event e2 = make_event(2, EventType::DepositFulfilled, "alice", 100);
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.append(e1) == Status::Ok);
        TEST_CHECK(journal.append(e2) == Status::Ok);
    }

    // Flip the last byte of the second payload
    std::string bytes = read_bytes(path);
    bytes.back() = static_cast<char>(bytes.back() ^ 0x01);
    write_bytes(path, bytes);

    ReplayResult replay;
    TEST_CHECK(read_journal(path, replay) == Status::PayloadChecksumMismatch);
    TEST_CHECK(replay.records == 1);
    TEST_CHECK(replay.events.size() == 1);
    TEST_CHECK(replay.events[0] == e1);
    TEST_CHECK(replay.bad_offset == record_size(e1));

    // Damaged header
    bytes = read_bytes(path);
    bytes[record_size(e1) + 4] = static_cast<char>(bytes[record_size(e1) + 4] ^ 0x10);
    write_bytes(path, bytes);
    TEST_CHECK(read_journal(path, replay) == Status::HeaderChecksumMismatch);

    // Not a journal at all
    write_bytes(path, std::string(64, 'x'));
    TEST_CHECK(read_journal(path, replay) == Status::BadMagic);

    Journal journal;
    TEST_CHECK(journal.open(path) == Status::BadMagic);
    TEST_CHECK(!journal.is_open());

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J4. A truncated tail is reported
// -----------------------------------------------------------------------------
void test_truncated_tail() {
    std::cout << "[TEST] J4 truncated tail\n";

    const std::string path = temp_path("yv_journal_truncated.bin");
    const Event e1 = make_event(1, EventType::PoolSupplied, "executor", 500);
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.append(e1) == Status::Ok);
        TEST_CHECK(journal.append(make_event(2, EventType::PoolWithdrawn, "executor", 200)) == Status::Ok);
    }

    std::string bytes = read_bytes(path);
    write_bytes(path, bytes.substr(0, bytes.size() - 3));

    ReplayResult replay;
    TEST_CHECK(read_journal(path, replay) == Status::Truncated);
    TEST_CHECK(replay.records == 1);

    // Cut inside the second header
    write_bytes(path, bytes.substr(0, record_size(e1) + 10));
    TEST_CHECK(read_journal(path, replay) == Status::Truncated);
    TEST_CHECK(replay.bad_offset == record_size(e1));

    Journal journal;
    TEST_CHECK(journal.open(path) == Status::Truncated);

    TEST_CHECK(read_journal(temp_path("yv_journal_absent.bin"), replay) == Status::IoError);

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J5. Removing a record breaks the chain
// -----------------------------------------------------------------------------
void test_removed_record_breaks_chain() {
    std::cout << "[TEST] J5 removed record breaks the chain\n";

    const std::string path = temp_path("yv_journal_chain.bin");
    const Event e1 = make_event(1, EventType::DepositRequested, "a", 1);
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);
        TEST_CHECK(journal.append(e1) == Status::Ok);
        TEST_CHECK(journal.append(make_event(2, EventType::DepositRequested, "b", 2)) == Status::Ok);
    }

    // Drop the first record: the second is intact but no longer links
    const std::string bytes = read_bytes(path);
    write_bytes(path, bytes.substr(record_size(e1)));

    ReplayResult replay;
    TEST_CHECK(read_journal(path, replay) == Status::ChainedChecksumMismatch);
    TEST_CHECK(replay.records == 0);

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J6. Payload decoding rejects malformed input
// -----------------------------------------------------------------------------
void test_decode_rejects_malformed() {
    std::cout << "[TEST] J6 malformed payloads\n";

    const Event ev = make_event(7, EventType::WithdrawalFulfilled, "carol", 42);
    std::string payload = encode_payload(ev);

    Event out;
    TEST_CHECK(decode_payload(payload, out));
    TEST_CHECK(out == ev);

    TEST_CHECK(!decode_payload(std::string_view(payload).substr(0, 10), out));
    TEST_CHECK(!decode_payload(payload + "z", out));

    // Unknown event type
    std::string bad_type = payload;
    bad_type[8] = static_cast<char>(0);
    TEST_CHECK(!decode_payload(bad_type, out));
    bad_type[8] = static_cast<char>(99);
    TEST_CHECK(!decode_payload(bad_type, out));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// J7. The journal sink records everything the vault emits
// -----------------------------------------------------------------------------
void test_vault_sink() {
    std::cout << "[TEST] J7 vault events through the journal sink\n";

    const std::string path = temp_path("yv_journal_vault.bin");
    {
        Journal journal;
        TEST_CHECK(journal.open(path) == Status::Ok);

        test::VaultHarness h;
        h.vault.subscribe(journal.sink());

        h.deposit_and_fulfill("alice", 100, test::RESERVE);
        TEST_CHECK(h.vault.request_redeem("alice", 100, "alice") == Error::None);
        TEST_CHECK(h.vault.fulfill_withdrawals(test::EXECUTOR, 1).ok());
        TEST_CHECK(journal.records() == h.events.size());

        ReplayResult replay;
        TEST_CHECK(read_journal(path, replay) == Status::Ok);
        TEST_CHECK(replay.events.size() == h.events.size());
        for (std::size_t i = 0; i < h.events.size(); ++i) {
            TEST_CHECK(replay.events[i] == h.events[i]);
        }
    }

    std::filesystem::remove(path);
    std::cout << "[TEST] OK\n";
}


#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_roundtrip();
    test_reopen_continues_chain();
    test_corrupted_payload();
    test_truncated_tail();
    test_removed_record_breaks_chain();
    test_decode_rejects_malformed();
    test_vault_sink();

    std::cout << "\n[JOURNAL TESTS PASSED]\n";
    return 0;
}
