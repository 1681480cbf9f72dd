#pragma once

#include "ramble/types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ramble {
namespace transport {

// Peripheral as seen in a scan result / connect target
struct DeviceInfo {
    std::string id;                         // Platform address or handle
    std::string name;                       // Advertised name (may be empty)
    std::vector<std::string> service_uuids; // Advertised service UUIDs
    int rssi = 0;
};

struct CharacteristicInfo {
    std::string uuid;
    bool can_write = false;
    bool can_write_without_response = false;
    bool can_notify = false;
};

struct ServiceInfo {
    std::string uuid;
    std::vector<CharacteristicInfo> characteristics;
};

enum class WriteMode {
    WITH_RESPONSE,      // Acknowledged by the link layer
    WITHOUT_RESPONSE    // Fire-and-forget (preferred for commands and ACKs)
};

/**
 * Radio link abstraction.
 *
 * One implementation per platform radio stack. The engine only needs a
 * write path to the command characteristic and a notification stream from
 * the data characteristic. Notifications must be delivered in the order
 * the link received them; the callback may run on any thread.
 */
class Transport {
public:
    using NotificationCallback = std::function<void(const Bytes& value)>;
    using LinkLostCallback = std::function<void(const std::string& reason)>;

    virtual ~Transport() = default;

    // Discovery
    virtual std::vector<DeviceInfo> scan(uint32_t timeout_ms) = 0;

    // Connection management
    virtual bool connect(const DeviceInfo& device) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // GATT
    virtual std::vector<ServiceInfo> discoverServices() = 0;
    virtual bool subscribe(const std::string& service_uuid, const std::string& char_uuid,
                           NotificationCallback cb) = 0;
    virtual void unsubscribe(const std::string& service_uuid, const std::string& char_uuid) = 0;
    virtual bool write(const std::string& service_uuid, const std::string& char_uuid,
                       const Bytes& data, WriteMode mode) = 0;

    // Unsolicited link loss (supervision timeout, peripheral reset, ...)
    virtual void setLinkLostCallback(LinkLostCallback cb) = 0;

    // Diagnostics
    virtual std::string lastError() const = 0;
    virtual const char* transportName() const = 0;
};

// Case-insensitive UUID comparison (platforms differ in case)
bool uuidEquals(const std::string& a, const std::string& b);

const ServiceInfo* findService(const std::vector<ServiceInfo>& services, const std::string& uuid);
const CharacteristicInfo* findCharacteristic(const ServiceInfo& service, const std::string& uuid);

const char* writeModeToString(WriteMode mode);

} // namespace transport
} // namespace ramble
