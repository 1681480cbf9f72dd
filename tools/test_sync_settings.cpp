// test_sync_settings.cpp - Unit test for INI settings
//
// Tests:
// 1. Defaults
// 2. Load: lists, comments, sections, unknown keys, bad numbers
// 3. Save then load preserves every key
// 4. RAMBLE_CONFIG override and missing file
// 5. Conversion to session config

#include "config/sync_settings.hpp"
#include "ramble/logging.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace ramble;
using namespace ramble::config;
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

int main() {
    std::cout << "=== Sync Settings Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path root = fs::temp_directory_path() / ("ramble_settings_test_" + std::to_string(stamp));
    fs::create_directories(root);

    // ========================================================================
    // TEST 1: Defaults
    // ========================================================================
    std::cout << "TEST 1: Defaults\n";
    {
        SyncSettings s;
        check(s.device_names.size() == 2 && s.device_names[0] == "Ramble Device" &&
              s.device_names[1] == "ESP32", "default device names");
        check(s.service_uuid == gatt::SERVICE_UUID && s.command_uuid == gatt::COMMAND_CHAR_UUID &&
              s.data_uuid == gatt::DATA_CHAR_UUID, "default GATT identifiers");
        check(s.progress_interval_bytes == 4096 && s.scan_timeout_ms == 15000, "default numbers");
        check(s.getReceiveDirectory() == SyncSettings::getDefaultReceiveDirectory(),
              "empty receive_directory falls back to default");
    }

    // ========================================================================
    // TEST 2: Load
    // ========================================================================
    std::cout << "\nTEST 2: Load\n";
    {
        fs::path path = root / "load.ini";
        {
            std::ofstream out(path);
            out << "# comment line\n";
            out << "[Device]\n";
            out << "device_names=Pendant, Ramble Mini ,\n";
            out << "device_name_fragments=pendant\n";
            out << "service_uuid=0000ffe0-0000-1000-8000-00805f9b34fb\r\n";
            out << "scan_timeout_ms=abc\n";
            out << "unknown_key=whatever\n";
            out << "no equals sign here\n";
            out << "[Transfer]\n";
            out << "progress_interval_bytes=1024\n";
            out << "[Storage]\n";
            out << "receive_directory=/data/inbox\n";
            out << "[Logging]\n";
            out << "log_level=debug\n";
        }

        SyncSettings s;
        check(s.load(path.string()), "load() ok");
        check(s.device_names.size() == 2 && s.device_names[0] == "Pendant" &&
              s.device_names[1] == "Ramble Mini", "list trimmed, blank entries dropped");
        check(s.device_name_fragments.size() == 1 && s.device_name_fragments[0] == "pendant",
              "fragments replaced");
        check(s.service_uuid == "0000ffe0-0000-1000-8000-00805f9b34fb", "CRLF stripped");
        check(s.scan_timeout_ms == 15000, "bad number keeps default");
        check(s.progress_interval_bytes == 1024, "progress interval loaded");
        check(s.getReceiveDirectory() == "/data/inbox", "receive directory loaded");
        check(stringToLogLevel(s.log_level.c_str()) == LogLevel::DEBUG, "log level parses");
        check(s.command_uuid == gatt::COMMAND_CHAR_UUID, "unset key keeps default");
    }

    // ========================================================================
    // TEST 3: Save / load
    // ========================================================================
    std::cout << "\nTEST 3: Save then load\n";
    {
        SyncSettings a;
        a.device_names = {"Alpha", "Beta"};
        a.device_name_fragments = {"alp"};
        a.data_uuid = "aaaa";
        a.scan_timeout_ms = 3000;
        a.progress_interval_bytes = 512;
        a.receive_directory = "/tmp/rx";
        a.index_file = "/tmp/rx/index.idx";
        a.log_level = "TRACE";
        a.log_file = "/tmp/ramble.log";

        fs::path path = root / "nested" / "dir" / "sync.ini";
        check(a.save(path.string()), "save() creates parent directories");

        SyncSettings b;
        check(b.load(path.string()), "reload ok");
        check(b.device_names == a.device_names && b.device_name_fragments == a.device_name_fragments &&
              b.service_uuid == a.service_uuid && b.command_uuid == a.command_uuid &&
              b.data_uuid == a.data_uuid && b.scan_timeout_ms == a.scan_timeout_ms &&
              b.progress_interval_bytes == a.progress_interval_bytes &&
              b.receive_directory == a.receive_directory && b.index_file == a.index_file &&
              b.log_level == a.log_level && b.log_file == a.log_file,
              "every key round-trips");
    }

    // ========================================================================
    // TEST 4: Default path
    // ========================================================================
    std::cout << "\nTEST 4: Default path\n";
    {
        fs::path path = root / "env.ini";
        setenv("RAMBLE_CONFIG", path.string().c_str(), 1);
        check(SyncSettings::getDefaultPath() == path.string(), "RAMBLE_CONFIG honoured");

        SyncSettings s;
        check(!s.load(), "missing file -> load() false");
        s.scan_timeout_ms = 777;
        check(s.save(), "save() to default path");

        SyncSettings t;
        check(t.load() && t.scan_timeout_ms == 777, "load() from default path");
        unsetenv("RAMBLE_CONFIG");
    }

    // ========================================================================
    // TEST 5: Session config
    // ========================================================================
    std::cout << "\nTEST 5: Conversion to session config\n";
    {
        SyncSettings s;
        s.device_names = {"Pendant"};
        s.service_uuid = "1234";
        s.progress_interval_bytes = 2048;

        session::SessionConfig cfg = s.toSessionConfig(true);
        check(cfg.synchronous && cfg.service_uuid == "1234" && cfg.progress_interval_bytes == 2048,
              "fields carried over");
        check(cfg.filter.exact_names.size() == 1 && cfg.filter.exact_names[0] == "Pendant" &&
              cfg.filter.service_uuid == "1234", "device filter built from settings");
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
        std::cout << "\n[SUCCESS] All settings tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
