#pragma once

#include "transport.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ramble {
namespace transport {

// Which advertisements count as "our" peripheral
struct DeviceFilter {
    std::vector<std::string> exact_names = {"Ramble Device", "ESP32"};
    std::vector<std::string> name_fragments = {"ramble", "esp32"};   // Case-insensitive
    std::string service_uuid = gatt::SERVICE_UUID;
};

bool matchesDevice(const DeviceInfo& device, const DeviceFilter& filter);

// Last matching advertisement wins, same as the original scan loop which
// kept overwriting its candidate while results streamed in.
std::optional<DeviceInfo> selectDevice(const std::vector<DeviceInfo>& results,
                                       const DeviceFilter& filter);

// "a, b, c" of distinct non-empty names, for the not-found status line
std::string describeDiscovered(const std::vector<DeviceInfo>& results);

} // namespace transport
} // namespace ramble
