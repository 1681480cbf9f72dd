#include "device_filter.hpp"
#include <algorithm>
#include <cctype>

namespace ramble {
namespace transport {

static std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool matchesDevice(const DeviceInfo& device, const DeviceFilter& filter) {
    if (!device.name.empty()) {
        for (const auto& name : filter.exact_names) {
            if (device.name == name) return true;
        }

        std::string lower = toLower(device.name);
        for (const auto& fragment : filter.name_fragments) {
            if (!fragment.empty() && lower.find(toLower(fragment)) != std::string::npos) {
                return true;
            }
        }
    }

    if (!filter.service_uuid.empty()) {
        for (const auto& uuid : device.service_uuids) {
            if (uuidEquals(uuid, filter.service_uuid)) return true;
        }
    }
    return false;
}

std::optional<DeviceInfo> selectDevice(const std::vector<DeviceInfo>& results,
                                       const DeviceFilter& filter) {
    std::optional<DeviceInfo> found;
    for (const auto& device : results) {
        if (matchesDevice(device, filter)) {
            found = device;
        }
    }
    return found;
}

std::string describeDiscovered(const std::vector<DeviceInfo>& results) {
    std::vector<std::string> names;
    for (const auto& device : results) {
        if (device.name.empty()) continue;
        if (std::find(names.begin(), names.end(), device.name) == names.end()) {
            names.push_back(device.name);
        }
    }

    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace transport
} // namespace ramble
