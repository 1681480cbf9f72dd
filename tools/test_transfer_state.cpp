// test_transfer_state.cpp - Unit test for the transfer state machine
//
// Tests:
// 1. Header + exact payload completes one file and returns to IDLE
// 2. Split payload (note1.m4a)
// 3. New header supersedes a partial transfer (x.m4a / y.m4a)
// 4. Reset while receiving never completes the old file
// 5. ACK accounting: N chunks -> N + 1 ACKs
// 6. SYNC_COMPLETE with a short transfer
// 7. PONG while IDLE
// 8. Payload with no header (desync)
// 9. Zero-size file and overflow truncation
// 10. Progress reporting and status forwarding

#include "protocol/transfer_state.hpp"
#include "ramble/logging.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace ramble;
using namespace ramble::protocol;

// Captures everything the state machine emits
struct Recorder {
    int acks = 0;
    int sync_completes = 0;
    int pongs = 0;
    std::vector<CompletedFile> files;
    std::vector<std::string> statuses;
    std::vector<std::string> discarded;
    std::vector<int> progress;

    void attach(TransferStateMachine& sm) {
        sm.setAckCallback([this]() { acks++; });
        sm.setFileCompleteCallback([this](CompletedFile f) { files.push_back(std::move(f)); });
        sm.setStatusCallback([this](const std::string& s) { statuses.push_back(s); });
        sm.setSyncCompleteCallback([this]() { sync_completes++; });
        sm.setPongCallback([this]() { pongs++; });
        sm.setDiscardCallback([this](const std::string& name, uint64_t, uint64_t, const char*) {
            discarded.push_back(name);
        });
        sm.setProgressCallback([this](const std::string&, uint64_t, uint64_t, int percent) {
            progress.push_back(percent);
        });
    }
};

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

static void feed(TransferStateMachine& sm, const Bytes& data) {
    sm.onPayload(data);
}

int main() {
    std::cout << "=== Transfer State Machine Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    // ========================================================================
    // TEST 1: Header + exact payload
    // ========================================================================
    std::cout << "TEST 1: FILE:a.m4a,10 + 10 bytes\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::fileHeader("a.m4a", 10));
        check(sm.getPhase() == TransferPhase::AWAITING_DATA, "header -> AWAITING_DATA");
        check(sm.getState().filename && *sm.getState().filename == "a.m4a" &&
              sm.getState().expected_size && *sm.getState().expected_size == 10,
              "filename and expected size set together");

        Bytes data = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0xFF};
        feed(sm, data);

        check(rec.files.size() == 1, "exactly one CompletedFile");
        check(!rec.files.empty() && rec.files[0].filename == "a.m4a" && rec.files[0].bytes == data,
              "CompletedFile carries name and the 10 bytes");
        check(sm.isIdle(), "back to IDLE");
        check(!sm.getState().filename && !sm.getState().expected_size &&
              sm.getState().bytes_received == 0 && sm.getState().buffer.empty(),
              "transfer fields cleared");
        check(rec.acks == 2, "2 ACKs (header + chunk)");
    }

    // ========================================================================
    // TEST 2: Split payload
    // ========================================================================
    std::cout << "\nTEST 2: note1.m4a in two chunks\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(parseControl("FILE:note1.m4a,5"));
        feed(sm, {1, 2, 3});
        check(rec.files.empty(), "no completion after 3 of 5 bytes");
        check(sm.getState().bytes_received == 3 && sm.getState().buffer.size() == 3,
              "buffer size == bytes_received");

        feed(sm, {4, 5});
        check(rec.files.size() == 1 && rec.files[0].bytes == Bytes({1, 2, 3, 4, 5}),
              "completion with [1,2,3,4,5]");
        check(rec.statuses.size() >= 1 && rec.statuses[0] == "Receiving: note1.m4a",
              "status 'Receiving: note1.m4a'");
    }

    // ========================================================================
    // TEST 3: Superseded transfer
    // ========================================================================
    std::cout << "\nTEST 3: x.m4a superseded by y.m4a\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(parseControl("FILE:x.m4a,4"));
        feed(sm, {1, 2, 3});
        sm.onControl(parseControl("FILE:y.m4a,2"));
        feed(sm, {9, 9});

        check(rec.files.size() == 1 && rec.files[0].filename == "y.m4a" &&
              rec.files[0].bytes == Bytes({9, 9}),
              "only y.m4a completes");
        check(rec.discarded.size() == 1 && rec.discarded[0] == "x.m4a",
              "x.m4a discarded explicitly");
        check(sm.getStats().transfers_discarded == 1, "discard counted");

        // Through the classifier [9,9] would be two TABs and read as control text
        Frame tabs = classify(Bytes{9, 9});
        check(tabs.isControl(), "classifier treats [9,9] as control (known limitation)");
    }

    // ========================================================================
    // TEST 4: Reset while receiving
    // ========================================================================
    std::cout << "\nTEST 4: Reset during partial transfer\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::fileHeader("old.m4a", 100));
        feed(sm, Bytes(60, 0xAA));
        check(sm.getState().hasPartialData(), "partial data present");

        sm.reset("sync restarted");
        check(sm.isIdle(), "reset -> IDLE");
        check(rec.discarded.size() == 1, "partial discarded once");

        // The rest of the old file arrives after the restart
        feed(sm, Bytes(40, 0xAA));
        check(rec.files.empty(), "old file never completes");
        check(sm.getStats().desync_drops == 1, "late chunk counted as desync");

        sm.reset("idle reset");
        check(rec.discarded.size() == 1, "reset while IDLE discards nothing");
    }

    // ========================================================================
    // TEST 5: ACK accounting
    // ========================================================================
    std::cout << "\nTEST 5: N chunks -> N + 1 ACKs\n";
    {
        const size_t sizes[] = {1, 7, 200, 3, 512, 64, 13};
        const size_t n = sizeof(sizes) / sizeof(sizes[0]);
        uint64_t total = 0;
        for (size_t s : sizes) total += s;

        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::fileHeader("acks.m4a", total));
        for (size_t s : sizes) {
            feed(sm, Bytes(s, 0x80));
        }

        check(rec.acks == static_cast<int>(n + 1),
              std::to_string(n) + " chunks -> " + std::to_string(rec.acks) + " ACKs");
        check(rec.files.size() == 1 && rec.files[0].bytes.size() == total, "file complete");

        // A second file restarts the per-file count
        sm.onControl(ControlMessage::fileHeader("next.m4a", 4));
        check(sm.getState().ack_count == 1, "per-file ACK count restarts at header");
    }

    // ========================================================================
    // TEST 6: SYNC_COMPLETE with short transfer
    // ========================================================================
    std::cout << "\nTEST 6: SYNC_COMPLETE before end of file\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::fileHeader("short.m4a", 1000));
        feed(sm, Bytes(300, 0x90));
        sm.onControl(ControlMessage::syncComplete());

        check(rec.files.empty(), "no CompletedFile");
        check(sm.isIdle(), "IDLE");
        check(rec.sync_completes == 1, "sync completion surfaced");
        check(rec.discarded.size() == 1, "short transfer discarded");
    }

    // ========================================================================
    // TEST 7: PONG while IDLE
    // ========================================================================
    std::cout << "\nTEST 7: PONG while IDLE\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onFrame(classify(toBytes("PONG")));
        check(rec.pongs == 1, "PONG surfaced");
        check(rec.acks == 0, "no ACK");
        check(sm.isIdle() && sm.getState().bytes_received == 0, "no state change");
    }

    // ========================================================================
    // TEST 8: Desync
    // ========================================================================
    std::cout << "\nTEST 8: Payload with no header\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        feed(sm, Bytes(150, 0xC3));
        feed(sm, Bytes(20, 0x01));
        check(rec.acks == 0, "no ACK for orphan payload");
        check(sm.getStats().desync_drops == 2, "2 desync drops counted");
        check(rec.files.empty() && sm.isIdle(), "still IDLE, nothing completed");
    }

    // ========================================================================
    // TEST 9: Zero-size file and overflow
    // ========================================================================
    std::cout << "\nTEST 9: Edge sizes\n";
    {
        TransferStateMachine sm;
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::fileHeader("empty.m4a", 0));
        check(rec.files.size() == 1 && rec.files[0].filename == "empty.m4a" &&
              rec.files[0].bytes.empty(),
              "zero-size header completes immediately with empty file");
        check(rec.acks == 1 && sm.isIdle(), "header ACKed, back to IDLE");

        sm.onControl(ControlMessage::fileHeader("over.m4a", 4));
        feed(sm, {1, 2, 3, 4, 5, 6});
        check(rec.files.size() == 2 && rec.files[1].bytes == Bytes({1, 2, 3, 4}),
              "overflow truncated to announced size");
        check(sm.getStats().overflow_bytes == 2, "2 overflow bytes counted");
    }

    // ========================================================================
    // TEST 10: Progress and status
    // ========================================================================
    std::cout << "\nTEST 10: Progress and status forwarding\n";
    {
        TransferStateMachine sm(4096);
        Recorder rec;
        rec.attach(sm);

        sm.onControl(ControlMessage::syncStart());
        check(!rec.statuses.empty() && rec.statuses.back() == "Starting transfer...",
              "SYNC_START -> 'Starting transfer...'");
        check(sm.isIdle(), "SYNC_START leaves state IDLE");

        sm.onControl(ControlMessage::fileHeader("prog.m4a", 10000));
        for (int i = 0; i < 50; i++) {
            feed(sm, Bytes(200, 0xF0));
        }
        // Boundaries crossed at 4096 and 8192, plus completion
        check(rec.progress.size() == 3, "3 progress reports for 10000 bytes");
        check(rec.progress.size() == 3 && rec.progress[0] == 42 && rec.progress[1] == 82 &&
              rec.progress[2] == 100,
              "progress percentages 42, 82, 100");

        size_t before = rec.statuses.size();
        sm.onControl(parseControl("ERROR:SD card missing"));
        sm.onControl(parseControl("STATUS:Battery low"));
        sm.onControl(parseControl("DELETE_COMPLETE"));
        sm.onControl(parseControl(""));
        check(rec.statuses.size() == before + 3, "ERROR, STATUS, unrecognized forwarded; empty ignored");
        check(rec.statuses.size() == before + 3 &&
              rec.statuses[before] == "ERROR:SD card missing" &&
              rec.statuses[before + 1] == "STATUS:Battery low" &&
              rec.statuses[before + 2] == "DELETE_COMPLETE",
              "forwarded text");
        check(rec.acks == 51, "control messages do not ACK");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All transfer state tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
