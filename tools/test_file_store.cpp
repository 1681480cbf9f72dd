// test_file_store.cpp - Unit test for the receive directory + note index
//
// Tests:
// 1. Save writes the exact bytes and registers a note
// 2. Unsafe filenames are refused
// 3. Overwrite replaces content, no .part left behind
// 4. Index tolerates malformed lines
// 5. Unwritable directory reports failure

#include "storage/file_store.hpp"
#include "ramble/logging.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace ramble;
using namespace ramble::storage;
namespace fs = std::filesystem;

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

static Bytes readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int main() {
    std::cout << "=== File Store Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path root = fs::temp_directory_path() / ("ramble_store_test_" + std::to_string(stamp));
    fs::path inbox = root / "inbox";

    // ========================================================================
    // TEST 1: Save
    // ========================================================================
    std::cout << "TEST 1: Save and register\n";
    {
        FileStore store(inbox.string());
        Bytes audio(3000);
        for (size_t i = 0; i < audio.size(); i++) audio[i] = static_cast<uint8_t>(i * 13);

        SaveResult r = store.save("note1.m4a", audio);
        check(r.ok, "save() ok");
        check(r.path == (inbox / "note1.m4a").string(), "path inside receive directory");
        check(readFile(inbox / "note1.m4a") == audio, "file content matches");
        check(!fs::exists(inbox / "note1.m4a.part"), "no .part file left");

        auto notes = store.index().load();
        check(notes.size() == 1, "one note registered");
        check(notes.size() == 1 && notes[0].filename == "note1.m4a" && !notes[0].transcribed &&
              notes[0].audio_path == r.path && notes[0].timestamp > 0,
              "note fields: name, untranscribed, path, timestamp");

        SaveResult empty = store.save("empty.m4a", Bytes{});
        check(empty.ok && fs::file_size(inbox / "empty.m4a") == 0, "empty file saved");
        check(store.index().load().size() == 2, "two notes registered");
    }

    // ========================================================================
    // TEST 2: Unsafe names
    // ========================================================================
    std::cout << "\nTEST 2: Unsafe filenames refused\n";
    {
        FileStore store(inbox.string());
        const char* bad[] = {"", ".", "..", "../escape.m4a", "dir/file.m4a", "back\\slash.m4a"};
        for (const char* name : bad) {
            SaveResult r = store.save(name, Bytes{1, 2, 3});
            check(!r.ok && !r.error.empty(), std::string("refused '") + name + "'");
        }
        std::string with_nul("a\0b.m4a", 7);
        check(!store.save(with_nul, Bytes{1}).ok, "refused name with NUL");
        check(!fs::exists(root / "escape.m4a"), "nothing written outside receive directory");
        check(FileStore::isSafeFilename("2024-01-05 10.15.m4a"), "ordinary name accepted");
    }

    // ========================================================================
    // TEST 3: Overwrite
    // ========================================================================
    std::cout << "\nTEST 3: Overwrite\n";
    {
        FileStore store(inbox.string());
        store.save("dup.m4a", Bytes(100, 0x11));
        SaveResult r = store.save("dup.m4a", Bytes(10, 0x22));
        check(r.ok && readFile(inbox / "dup.m4a") == Bytes(10, 0x22), "second save replaces content");
    }

    // ========================================================================
    // TEST 4: Malformed index lines
    // ========================================================================
    std::cout << "\nTEST 4: Index parsing\n";
    {
        fs::path idx = root / "custom.idx";
        {
            std::ofstream out(idx);
            out << "good.m4a\t1700000000\t1\t/tmp/good.m4a\n";
            out << "garbage line\n";
            out << "bad_ts.m4a\tnotanumber\t0\t/tmp/bad.m4a\n";
            out << "\n";
            out << "other.m4a\t1700000001\t0\t/tmp/other.m4a\n";
        }
        NoteIndex index(idx.string());
        auto notes = index.load();
        check(notes.size() == 2, "2 valid records, malformed skipped");
        check(notes.size() == 2 && notes[0].transcribed && !notes[1].transcribed &&
              notes[1].timestamp == 1700000001,
              "fields parsed");

        FileStore store(inbox.string(), idx.string());
        store.save("third.m4a", Bytes{7, 7, 7});
        check(index.load().size() == 3, "custom index path appended");
    }

    // ========================================================================
    // TEST 5: Unwritable directory
    // ========================================================================
    std::cout << "\nTEST 5: Directory cannot be created\n";
    {
        fs::path blocker = root / "blocker";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        // A regular file in the way of the receive directory
        FileStore store((blocker / "inbox").string());
        SaveResult r = store.save("note.m4a", Bytes{1, 2});
        check(!r.ok && !r.error.empty(), "save fails with a reason");
    }

    std::error_code ec;
    fs::remove_all(root, ec);

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All file store tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
