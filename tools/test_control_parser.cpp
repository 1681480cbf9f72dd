// test_control_parser.cpp - Unit test for control message decoding
//
// Tests:
// 1. Exact-match vocabulary
// 2. FILE headers (well-formed and malformed)
// 3. ERROR / STATUS prefixes
// 4. Unrecognized text and case sensitivity
// 5. describe() reproduces the wire text

#include "protocol/control_message.hpp"
#include "ramble/logging.hpp"
#include <iostream>
#include <string>

using namespace ramble;
using namespace ramble::protocol;

static int pass = 0, fail = 0;

static void expectMessage(const std::string& input, const ControlMessage& expected) {
    ControlMessage got = parseControl(input);
    if (got == expected) {
        std::cout << "  [PASS] '" << input << "' -> " << controlTypeToString(got.type) << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] '" << input << "' -> " << controlTypeToString(got.type)
                  << " '" << got.describe() << "' (expected " << controlTypeToString(expected.type)
                  << " '" << expected.describe() << "')\n";
        fail++;
    }
}

int main() {
    std::cout << "=== Control Parser Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    // ========================================================================
    // TEST 1: Exact matches
    // ========================================================================
    std::cout << "TEST 1: Exact matches\n";
    {
        expectMessage("SYNC_START", ControlMessage::syncStart());
        expectMessage("SYNC_COMPLETE", ControlMessage::syncComplete());
        expectMessage("PONG", ControlMessage::pong());
        expectMessage("  PONG\r\n", ControlMessage::pong());
        expectMessage("SYNC_START\n", ControlMessage::syncStart());
    }

    // ========================================================================
    // TEST 2: FILE headers
    // ========================================================================
    std::cout << "\nTEST 2: FILE headers\n";
    {
        expectMessage("FILE:note1.m4a,4096", ControlMessage::fileHeader("note1.m4a", 4096));
        expectMessage("FILE:a.m4a,10\r\n", ControlMessage::fileHeader("a.m4a", 10));
        expectMessage("FILE:empty.m4a,0", ControlMessage::fileHeader("empty.m4a", 0));
        expectMessage("FILE:my,note.m4a,5", ControlMessage::unrecognized("FILE:my,note.m4a,5"));
        expectMessage("FILE:big.m4a,18446744073709551615",
                      ControlMessage::fileHeader("big.m4a", 18446744073709551615ULL));

        // Malformed: all become UNRECOGNIZED with the trimmed text
        expectMessage("FILE:nocomma", ControlMessage::unrecognized("FILE:nocomma"));
        expectMessage("FILE:,10", ControlMessage::unrecognized("FILE:,10"));
        expectMessage("FILE:a.m4a,", ControlMessage::unrecognized("FILE:a.m4a,"));
        expectMessage("FILE:a.m4a,-5", ControlMessage::unrecognized("FILE:a.m4a,-5"));
        expectMessage("FILE:a.m4a,12ab", ControlMessage::unrecognized("FILE:a.m4a,12ab"));
        expectMessage("FILE:a.m4a,18446744073709551616",
                      ControlMessage::unrecognized("FILE:a.m4a,18446744073709551616"));
    }

    // ========================================================================
    // TEST 3: ERROR / STATUS
    // ========================================================================
    std::cout << "\nTEST 3: ERROR / STATUS prefixes\n";
    {
        expectMessage("ERROR:SD card missing", ControlMessage::error("SD card missing"));
        expectMessage("STATUS:Battery 80%", ControlMessage::status("Battery 80%"));
        expectMessage("ERROR:", ControlMessage::error(""));
        expectMessage("STATUS:", ControlMessage::status(""));
    }

    // ========================================================================
    // TEST 4: Unrecognized
    // ========================================================================
    std::cout << "\nTEST 4: Unrecognized text\n";
    {
        expectMessage("LIST_COMPLETE", ControlMessage::unrecognized("LIST_COMPLETE"));
        expectMessage("DELETE_COMPLETE\r\n", ControlMessage::unrecognized("DELETE_COMPLETE"));
        expectMessage("sync_start", ControlMessage::unrecognized("sync_start"));
        expectMessage("file:a.m4a,10", ControlMessage::unrecognized("file:a.m4a,10"));
        expectMessage("", ControlMessage::unrecognized(""));
        expectMessage(" \t ", ControlMessage::unrecognized(""));
    }

    // ========================================================================
    // TEST 5: describe()
    // ========================================================================
    std::cout << "\nTEST 5: describe()\n";
    {
        const char* wire_texts[] = {
            "SYNC_START", "SYNC_COMPLETE", "PONG", "FILE:x.m4a,123",
            "ERROR:oops", "STATUS:ok", "HELLO",
        };
        int mismatches = 0;
        for (const char* text : wire_texts) {
            std::string described = parseControl(text).describe();
            if (described != text) {
                std::cout << "    '" << text << "' described as '" << described << "'\n";
                mismatches++;
            }
        }
        if (mismatches == 0) {
            std::cout << "  [PASS] describe() matches wire text for all types\n";
            pass++;
        } else {
            std::cout << "  [FAIL] describe() mismatched " << mismatches << " message(s)\n";
            fail++;
        }
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All parser tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
