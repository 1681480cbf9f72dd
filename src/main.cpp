/**
 * ramble_sync - Recorder file sync CLI
 *
 * Runs the sync engine against the in-process loopback peripheral, or
 * classifies a single data-channel chunk.
 */

#include "config/sync_settings.hpp"
#include "protocol/frame_classifier.hpp"
#include "session/sync_session.hpp"
#include "sim/loopback_peripheral.hpp"
#include "storage/file_store.hpp"
#include "ramble/logging.hpp"
#include "ramble/types.hpp"

#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <atomic>
#include <chrono>

using namespace ramble;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "ramble_sync - Recorder file sync engine\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  info                Show protocol constants and active settings\n";
    std::cerr << "  classify <chunk>    Classify one data-channel chunk:\n";
    std::cerr << "                        classify \"FILE:note1.m4a,4096\"\n";
    std::cerr << "                        classify hex:0006ff10\n";
    std::cerr << "  simulate <dir>      Sync every file in <dir> from the loopback peripheral\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>           Settings file (default: $RAMBLE_CONFIG or ~/.config/ramble/sync.ini)\n";
    std::cerr << "  -o <dir>            Receive directory (overrides settings)\n";
    std::cerr << "  -k <bytes>          Peripheral chunk size (default: 200)\n";
    std::cerr << "  -d                  Send DELETE after a successful sync\n";
    std::cerr << "  -s                  Synchronous mode (no worker threads)\n";
    std::cerr << "  -v                  Debug logging\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " simulate ./recordings -o /tmp/inbox\n";
    std::cerr << "  " << prog << " -s -k 20 simulate ./recordings\n";
    std::cerr << "\n";
}

void printInfo(const config::SyncSettings& settings, const std::string& settings_path) {
    std::cout << "=== Ramble Sync ===\n\n";
    std::cout << "GATT:\n";
    std::cout << "  Service:        " << settings.service_uuid << "\n";
    std::cout << "  Command (W):    " << settings.command_uuid << "\n";
    std::cout << "  Data (N):       " << settings.data_uuid << "\n\n";

    std::cout << "Protocol:\n";
    std::cout << "  Commands:       SYNC, DELETE, PING, ACK (0x06)\n";
    std::cout << "  Control frames: < " << wire::CONTROL_MAX_LENGTH << " bytes, printable ASCII\n";
    std::cout << "  Flow control:   stop-and-wait, 1 ACK per header and per chunk\n\n";

    std::cout << "Settings (" << settings_path << "):\n";
    std::cout << "  Device names:   " << config::joinList(settings.device_names) << "\n";
    std::cout << "  Name fragments: " << config::joinList(settings.device_name_fragments) << "\n";
    std::cout << "  Scan timeout:   " << settings.scan_timeout_ms << " ms\n";
    std::cout << "  Progress every: " << settings.progress_interval_bytes << " bytes\n";
    std::cout << "  Receive dir:    " << settings.getReceiveDirectory() << "\n";
    std::cout << "  Log level:      " << settings.log_level << "\n";
}

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parseChunkArg(const char* arg, Bytes& out) {
    if (strncmp(arg, "hex:", 4) != 0) {
        out = toBytes(arg);
        return true;
    }

    const char* hex = arg + 4;
    size_t len = strlen(hex);
    if (len % 2 != 0) return false;

    out.clear();
    for (size_t i = 0; i < len; i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

// ============================================================================
// classify
// ============================================================================
int runClassify(const char* arg) {
    if (!arg) {
        std::cerr << "classify: missing chunk argument\n";
        return 1;
    }

    Bytes chunk;
    if (!parseChunkArg(arg, chunk)) {
        std::cerr << "classify: bad hex string\n";
        return 1;
    }

    protocol::Frame frame = protocol::classify(chunk);
    std::cout << "Length:  " << chunk.size() << " bytes\n";
    std::cout << "Kind:    " << protocol::frameKindToString(frame.kind) << "\n";
    if (frame.isControl()) {
        std::cout << "Message: " << protocol::controlTypeToString(frame.control.type) << "\n";
        if (frame.control.isFileHeader()) {
            std::cout << "File:    " << frame.control.filename << "\n";
            std::cout << "Size:    " << frame.control.file_size << " bytes\n";
        } else if (!frame.control.text.empty()) {
            std::cout << "Text:    " << frame.control.text << "\n";
        }
    }
    return 0;
}

// ============================================================================
// simulate
// ============================================================================
static void printEvent(const session::SessionEvent& e) {
    using session::SessionEventType;
    switch (e.type) {
        case SessionEventType::STATUS:
            std::cerr << "  [status] " << e.text << "\n";
            break;
        case SessionEventType::PROGRESS:
            std::cerr << "  [progress] " << e.filename << " " << e.bytes_received << "/"
                      << e.expected_size << " (" << e.percent << "%)\n";
            break;
        case SessionEventType::FILE_SAVED:
            std::cout << "Saved " << e.filename << " -> " << e.text << "\n";
            break;
        case SessionEventType::FILE_SAVE_FAILED:
            std::cout << "FAILED " << e.filename << ": " << e.text << "\n";
            break;
        case SessionEventType::TRANSFER_DISCARDED:
            std::cerr << "  [discarded] " << e.filename << " at " << e.bytes_received << "/"
                      << e.expected_size << ": " << e.text << "\n";
            break;
        default:
            std::cerr << "  [" << session::sessionEventTypeToString(e.type) << "]"
                      << (e.text.empty() ? "" : " ") << e.text << "\n";
            break;
    }
}

// Pump until an event of the given type (true) or disconnect/timeout (false)
static bool waitFor(session::SyncSession& sess, session::SessionEventType wanted,
                    const std::string& wanted_status, uint32_t timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (g_running) {
        if (sess.config().synchronous) {
            sess.processPending();
        }

        auto ev = sess.config().synchronous ? sess.pollEvent() : sess.waitEvent(100);
        if (!ev) {
            if (sess.config().synchronous) return false;  // Nothing more will arrive
        } else {
            printEvent(*ev);
            if (ev->type == wanted && (wanted_status.empty() || ev->text == wanted_status)) {
                return true;
            }
            if (ev->type == session::SessionEventType::DISCONNECTED) return false;
            continue;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > static_cast<long long>(timeout_ms)) return false;
    }
    return false;
}

int runSimulate(const char* source_dir, const config::SyncSettings& settings,
                const char* output_dir, size_t chunk_size, bool delete_after, bool synchronous) {
    if (!source_dir) {
        std::cerr << "simulate: missing source directory\n";
        return 1;
    }

    sim::LoopbackPeripheral::Options opts;
    opts.chunk_size = chunk_size;
    if (!settings.device_names.empty()) {
        opts.name = settings.device_names.front();
    }
    sim::LoopbackPeripheral peripheral(opts);
    setLogStationTag("sim");

    std::string error;
    if (!peripheral.loadDirectory(source_dir, error)) {
        std::cerr << "simulate: " << error << "\n";
        return 1;
    }
    std::cerr << "Peripheral holds " << peripheral.fileCount() << " file(s)\n";

    std::string receive_dir = output_dir ? std::string(output_dir) : settings.getReceiveDirectory();
    storage::FileStore store(receive_dir, settings.index_file);

    session::SyncSession sess(peripheral, store, settings.toSessionConfig(synchronous));

    auto device = sess.findDevice();
    for (const auto& e : sess.drainEvents()) printEvent(e);
    if (!device) {
        return 1;
    }

    session::ConnectError err = sess.connect(*device);
    for (const auto& e : sess.drainEvents()) printEvent(e);
    if (err != session::ConnectError::NONE) {
        std::cerr << "Connect failed: " << session::connectErrorToString(err) << "\n";
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    bool ok = sess.startSync() &&
              waitFor(sess, session::SessionEventType::SYNC_COMPLETE, "", 60000);

    if (ok && delete_after) {
        if (sess.requestDelete()) {
            waitFor(sess, session::SessionEventType::STATUS, wire::MSG_DELETE_COMPLETE, 5000);
        }
    }

    // Pending saves finish inside disconnect()
    sess.disconnect();
    for (const auto& e : sess.drainEvents()) printEvent(e);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    session::SessionStats stats = sess.getStats();

    std::cerr << "\n=== Sync Statistics ===\n";
    std::cerr << "  Result:     " << (ok ? "complete" : "incomplete") << "\n";
    std::cerr << "  Time:       " << ms << " ms\n";
    std::cerr << "  Chunks:     " << stats.chunks_received << "\n";
    std::cerr << "  Bytes:      " << stats.bytes_received << "\n";
    std::cerr << "  Files:      " << stats.files_completed << " received, "
              << stats.files_saved << " saved, " << stats.save_failures << " failed\n";
    std::cerr << "  Discarded:  " << stats.transfers_discarded << "\n";
    std::cerr << "  ACKs:       " << stats.acks_sent << " sent, " << stats.ack_failures << " failed\n";
    std::cerr << "  Desync:     " << stats.desync_drops << "\n";
    std::cerr << "  Stale:      " << stats.stale_chunks << " chunks, " << stats.events_dropped << " events dropped\n";

    return (ok && stats.save_failures == 0) ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);

    const char* command = nullptr;
    const char* argument = nullptr;
    const char* config_path = nullptr;
    const char* output_dir = nullptr;
    size_t chunk_size = 200;
    bool delete_after = false;
    bool synchronous = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            int k = std::atoi(argv[++i]);
            chunk_size = k > 0 ? static_cast<size_t>(k) : 200;
        } else if (strcmp(argv[i], "-d") == 0) {
            delete_after = true;
        } else if (strcmp(argv[i], "-s") == 0) {
            synchronous = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (!command && argv[i][0] != '-') {
            command = argv[i];
        } else if (command && !argument) {
            // Chunk text may start with '-'
            argument = argv[i];
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    config::SyncSettings settings;
    std::string settings_path = config_path ? std::string(config_path)
                                            : config::SyncSettings::getDefaultPath();
    if (!settings.load(settings_path)) {
        if (config_path) {
            std::cerr << "Cannot read settings " << settings_path << "\n";
            return 1;
        }
        settings_path += " (not found, defaults)";
    }

    setLogLevel(verbose ? LogLevel::DEBUG : stringToLogLevel(settings.log_level.c_str()));

    FILE* log_file = nullptr;
    if (!settings.log_file.empty()) {
        log_file = std::fopen(settings.log_file.c_str(), "a");
        if (log_file) {
            setLogFile(log_file);
        } else {
            std::cerr << "Cannot open log file " << settings.log_file << ", logging to stderr\n";
        }
    }

    int rc = 0;
    if (strcmp(command, "info") == 0) {
        printInfo(settings, settings_path);
    } else if (strcmp(command, "classify") == 0) {
        rc = runClassify(argument);
    } else if (strcmp(command, "simulate") == 0) {
        rc = runSimulate(argument, settings, output_dir, chunk_size, delete_after, synchronous);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        rc = 1;
    }

    if (log_file) {
        setLogFile(nullptr);
        std::fclose(log_file);
    }
    return rc;
}
