#include "transport.hpp"
#include <cctype>

namespace ramble {
namespace transport {

bool uuidEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const ServiceInfo* findService(const std::vector<ServiceInfo>& services, const std::string& uuid) {
    for (const auto& service : services) {
        if (uuidEquals(service.uuid, uuid)) return &service;
    }
    return nullptr;
}

const CharacteristicInfo* findCharacteristic(const ServiceInfo& service, const std::string& uuid) {
    for (const auto& ch : service.characteristics) {
        if (uuidEquals(ch.uuid, uuid)) return &ch;
    }
    return nullptr;
}

const char* writeModeToString(WriteMode mode) {
    switch (mode) {
        case WriteMode::WITH_RESPONSE:    return "with-response";
        case WriteMode::WITHOUT_RESPONSE: return "without-response";
        default: return "unknown";
    }
}

} // namespace transport
} // namespace ramble
