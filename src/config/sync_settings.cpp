#include "sync_settings.hpp"
#include "ramble/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace ramble {
namespace config {

std::string SyncSettings::getDefaultPath() {
    // Explicit override (tests, multiple devices)
    const char* config_override = std::getenv("RAMBLE_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\Ramble\\sync.ini";
    }
    return "sync.ini";
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/ramble/sync.ini";
    }
    return "sync.ini";
#endif
}

std::string SyncSettings::getDefaultReceiveDirectory() {
#ifdef _WIN32
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) {
        return std::string(userprofile) + "\\Documents\\Ramble";
    }
    return "Ramble";
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/Documents/Ramble";
    }
    return "Ramble";
#endif
}

std::string SyncSettings::getReceiveDirectory() const {
    if (!receive_directory.empty()) {
        return receive_directory;
    }
    return getDefaultReceiveDirectory();
}

static void ensureDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        LOG_SYNC(WARN, "Settings: Cannot create %s: %s", parent.string().c_str(), ec.message().c_str());
    }
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Strict decimal; false leaves out untouched
static bool parseUnsigned(const std::string& value, uint64_t& out) {
    if (value.empty() || value[0] < '0' || value[0] > '9') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    out = static_cast<uint64_t>(v);
    return true;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(pos, comma - pos));
        if (!item.empty()) items.push_back(item);
        pos = comma + 1;
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ",";
        out += items[i];
    }
    return out;
}

// Save settings to INI file
bool SyncSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_SYNC(ERROR, "Settings: Cannot write %s", filepath.c_str());
        return false;
    }

    file << "[Device]\n";
    file << "device_names=" << joinList(device_names) << "\n";
    file << "device_name_fragments=" << joinList(device_name_fragments) << "\n";
    file << "service_uuid=" << service_uuid << "\n";
    file << "command_uuid=" << command_uuid << "\n";
    file << "data_uuid=" << data_uuid << "\n";
    file << "scan_timeout_ms=" << scan_timeout_ms << "\n";

    file << "\n[Transfer]\n";
    file << "progress_interval_bytes=" << progress_interval_bytes << "\n";

    file << "\n[Storage]\n";
    file << "receive_directory=" << receive_directory << "\n";
    file << "index_file=" << index_file << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << log_level << "\n";
    file << "log_file=" << log_file << "\n";

    file.flush();
    return static_cast<bool>(file);
}

// Load settings from INI file
bool SyncSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        uint64_t number = 0;

        // Device
        if (key == "device_names") {
            device_names = splitList(value);
        } else if (key == "device_name_fragments") {
            device_name_fragments = splitList(value);
        } else if (key == "service_uuid") {
            if (!value.empty()) service_uuid = value;
        } else if (key == "command_uuid") {
            if (!value.empty()) command_uuid = value;
        } else if (key == "data_uuid") {
            if (!value.empty()) data_uuid = value;
        } else if (key == "scan_timeout_ms") {
            if (parseUnsigned(value, number) && number <= UINT32_MAX) {
                scan_timeout_ms = static_cast<uint32_t>(number);
            } else {
                LOG_SYNC(WARN, "Settings: Bad scan_timeout_ms '%s' ignored", value.c_str());
            }
        }
        // Transfer
        else if (key == "progress_interval_bytes") {
            if (parseUnsigned(value, number)) {
                progress_interval_bytes = number;
            } else {
                LOG_SYNC(WARN, "Settings: Bad progress_interval_bytes '%s' ignored", value.c_str());
            }
        }
        // Storage
        else if (key == "receive_directory") {
            receive_directory = value;
        } else if (key == "index_file") {
            index_file = value;
        }
        // Logging
        else if (key == "log_level") {
            if (!value.empty()) log_level = value;
        } else if (key == "log_file") {
            log_file = value;
        }
    }

    return true;
}

transport::DeviceFilter SyncSettings::toDeviceFilter() const {
    transport::DeviceFilter filter;
    filter.exact_names = device_names;
    filter.name_fragments = device_name_fragments;
    filter.service_uuid = service_uuid;
    return filter;
}

session::SessionConfig SyncSettings::toSessionConfig(bool synchronous) const {
    session::SessionConfig cfg;
    cfg.service_uuid = service_uuid;
    cfg.command_uuid = command_uuid;
    cfg.data_uuid = data_uuid;
    cfg.progress_interval_bytes = progress_interval_bytes;
    cfg.scan_timeout_ms = scan_timeout_ms;
    cfg.filter = toDeviceFilter();
    cfg.synchronous = synchronous;
    return cfg;
}

} // namespace config
} // namespace ramble
