#pragma once

#include "session/sync_session.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ramble {
namespace config {

/**
 * Sync Settings
 *
 * Persisted as a flat INI file:
 *
 *   [Device]
 *   device_names=Ramble Device,ESP32
 *   device_name_fragments=ramble,esp32
 *   service_uuid=...
 *
 * Unknown keys are ignored; a value that does not parse keeps its default.
 */
struct SyncSettings {
    // Device
    std::vector<std::string> device_names = {"Ramble Device", "ESP32"};
    std::vector<std::string> device_name_fragments = {"ramble", "esp32"};
    std::string service_uuid = gatt::SERVICE_UUID;
    std::string command_uuid = gatt::COMMAND_CHAR_UUID;
    std::string data_uuid = gatt::DATA_CHAR_UUID;
    uint32_t scan_timeout_ms = 15000;

    // Transfer
    uint64_t progress_interval_bytes = protocol::TransferStateMachine::DEFAULT_PROGRESS_INTERVAL;

    // Storage (empty = defaults below)
    std::string receive_directory;
    std::string index_file;

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

    // Load/save (empty path = getDefaultPath())
    bool load(const std::string& path = "");
    bool save(const std::string& path = "") const;

    // $RAMBLE_CONFIG, else ~/.config/ramble/sync.ini
    static std::string getDefaultPath();

    // ~/Documents/Ramble
    static std::string getDefaultReceiveDirectory();

    std::string getReceiveDirectory() const;

    transport::DeviceFilter toDeviceFilter() const;
    session::SessionConfig toSessionConfig(bool synchronous) const;
};

// "a, b,c" -> {"a", "b", "c"} (blank entries dropped)
std::vector<std::string> splitList(const std::string& value);
std::string joinList(const std::vector<std::string>& items);

} // namespace config
} // namespace ramble
