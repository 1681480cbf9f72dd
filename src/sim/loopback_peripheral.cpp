#include "loopback_peripheral.hpp"
#include "ramble/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace ramble {
namespace sim {

LoopbackPeripheral::LoopbackPeripheral()
    : LoopbackPeripheral(Options{})
{
}

LoopbackPeripheral::LoopbackPeripheral(const Options& options)
    : options_(options)
{
    if (options_.chunk_size == 0) options_.chunk_size = 1;
}

// =============================================================================
// DEVICE CONTENT
// =============================================================================

void LoopbackPeripheral::addFile(const std::string& name, Bytes data) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.push_back({name, std::move(data)});
}

bool LoopbackPeripheral::loadDirectory(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        error = "not a directory: " + path;
        return false;
    }

    std::vector<fs::path> paths;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        if (entry.is_regular_file(ec)) {
            paths.push_back(entry.path());
        }
    }
    if (ec) {
        error = "cannot list " + path + ": " + ec.message();
        return false;
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& p : paths) {
        std::ifstream in(p, std::ios::binary);
        if (!in.is_open()) {
            error = "cannot open " + p.string();
            return false;
        }
        Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        LOG_LINK(DEBUG, "Loopback: Loaded %s (%zu bytes)", p.filename().string().c_str(), data.size());
        addFile(p.filename().string(), std::move(data));
    }
    return true;
}

std::vector<std::string> LoopbackPeripheral::fileNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& f : files_) names.push_back(f.name);
    return names;
}

size_t LoopbackPeripheral::fileCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

void LoopbackPeripheral::addAdvertisement(const transport::DeviceInfo& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    extra_adverts_.push_back(device);
}

void LoopbackPeripheral::setAdvertising(bool advertising) {
    std::lock_guard<std::mutex> lock(mutex_);
    advertising_ = advertising;
}

transport::DeviceInfo LoopbackPeripheral::advertisement() const {
    transport::DeviceInfo info;
    info.id = options_.id;
    info.name = options_.name;
    info.service_uuids = {gatt::SERVICE_UUID};
    info.rssi = -48;
    return info;
}

// =============================================================================
// TEST HOOKS
// =============================================================================

void LoopbackPeripheral::injectNotification(const Bytes& value) {
    deliver({value}, "");
}

void LoopbackPeripheral::dropLink(const std::string& reason) {
    LinkLostCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
        send_state_ = SendState::IDLE;
        cb = link_lost_cb_;
    }
    LOG_LINK(INFO, "Loopback: Link dropped (%s)", reason.c_str());
    if (cb) cb(reason);
}

void LoopbackPeripheral::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.fail_writes = fail;
}

std::vector<Bytes> LoopbackPeripheral::writeLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_log_;
}

uint64_t LoopbackPeripheral::getAcksReceived() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acks_received_;
}

uint64_t LoopbackPeripheral::getChunksSent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_sent_;
}

// =============================================================================
// TRANSPORT
// =============================================================================

std::vector<transport::DeviceInfo> LoopbackPeripheral::scan(uint32_t timeout_ms) {
    (void)timeout_ms;
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<transport::DeviceInfo> results = extra_adverts_;
    if (advertising_) {
        results.push_back(advertisement());
    }
    return results;
}

bool LoopbackPeripheral::connect(const transport::DeviceInfo& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (options_.fail_connect) {
        last_error_ = "connection refused";
        return false;
    }
    if (device.id != options_.id) {
        last_error_ = "unknown device " + device.id;
        return false;
    }
    connected_ = true;
    send_state_ = SendState::IDLE;
    last_error_.clear();
    LOG_LINK(INFO, "Loopback: Connected (%s)", device.id.c_str());
    return true;
}

void LoopbackPeripheral::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    notify_cb_ = nullptr;
    send_state_ = SendState::IDLE;
}

bool LoopbackPeripheral::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

std::vector<transport::ServiceInfo> LoopbackPeripheral::discoverServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return {};

    transport::ServiceInfo service;
    service.uuid = gatt::SERVICE_UUID;
    if (!options_.omit_command_characteristic) {
        transport::CharacteristicInfo cmd;
        cmd.uuid = gatt::COMMAND_CHAR_UUID;
        cmd.can_write = true;
        cmd.can_write_without_response = true;
        service.characteristics.push_back(cmd);
    }
    if (!options_.omit_data_characteristic) {
        transport::CharacteristicInfo data;
        data.uuid = gatt::DATA_CHAR_UUID;
        data.can_notify = true;
        service.characteristics.push_back(data);
    }
    return {service};
}

bool LoopbackPeripheral::subscribe(const std::string& service_uuid, const std::string& char_uuid,
                                   NotificationCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || options_.fail_subscribe || options_.omit_data_characteristic ||
        !transport::uuidEquals(service_uuid, gatt::SERVICE_UUID) ||
        !transport::uuidEquals(char_uuid, gatt::DATA_CHAR_UUID)) {
        last_error_ = "subscribe rejected";
        return false;
    }
    notify_cb_ = std::move(cb);
    return true;
}

void LoopbackPeripheral::unsubscribe(const std::string& service_uuid, const std::string& char_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport::uuidEquals(service_uuid, gatt::SERVICE_UUID) &&
        transport::uuidEquals(char_uuid, gatt::DATA_CHAR_UUID)) {
        notify_cb_ = nullptr;
    }
}

bool LoopbackPeripheral::write(const std::string& service_uuid, const std::string& char_uuid,
                               const Bytes& data, transport::WriteMode mode) {
    std::vector<Bytes> out;
    std::string drop_reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            last_error_ = "not connected";
            return false;
        }
        if (options_.fail_writes) {
            last_error_ = "write failed";
            return false;
        }
        if (!transport::uuidEquals(service_uuid, gatt::SERVICE_UUID) ||
            !transport::uuidEquals(char_uuid, gatt::COMMAND_CHAR_UUID)) {
            last_error_ = "write to unknown characteristic " + char_uuid;
            return false;
        }
        LOG_LINK(TRACE, "Loopback: write %zu bytes (%s)", data.size(), transport::writeModeToString(mode));
        write_log_.push_back(data);
        handleCommand(data, out, drop_reason);
    }
    deliver(out, drop_reason);
    return true;
}

void LoopbackPeripheral::setLinkLostCallback(LinkLostCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    link_lost_cb_ = std::move(cb);
}

std::string LoopbackPeripheral::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

// =============================================================================
// FIRMWARE EMULATION
// =============================================================================

void LoopbackPeripheral::handleCommand(const Bytes& data, std::vector<Bytes>& out,
                                       std::string& drop_reason) {
    if (data.size() == 1 && data[0] == wire::ACK_BYTE) {
        handleAck(out, drop_reason);
        return;
    }

    const std::string cmd = toText(data);
    if (cmd == wire::CMD_SYNC) {
        LOG_LINK(INFO, "Loopback: SYNC (%zu files)", files_.size());
        out.push_back(toBytes(wire::MSG_SYNC_START));
        file_index_ = 0;
        offset_ = 0;
        sendHeaderOrFinish(out);
    } else if (cmd == wire::CMD_DELETE) {
        LOG_LINK(INFO, "Loopback: DELETE (%zu files removed)", files_.size());
        files_.clear();
        send_state_ = SendState::IDLE;
        out.push_back(toBytes(wire::MSG_DELETE_COMPLETE));
    } else if (cmd == wire::CMD_PING) {
        out.push_back(toBytes(wire::MSG_PONG));
    } else if (cmd == wire::CMD_TEST) {
        LOG_LINK(INFO, "Loopback: TEST received");
    } else {
        LOG_LINK(WARN, "Loopback: Unknown command '%s'", cmd.c_str());
    }
}

void LoopbackPeripheral::handleAck(std::vector<Bytes>& out, std::string& drop_reason) {
    acks_received_++;

    if (send_state_ == SendState::IDLE || file_index_ >= files_.size()) {
        LOG_LINK(DEBUG, "Loopback: Stray ACK ignored");
        return;
    }

    const StoredFile& file = files_[file_index_];
    if (offset_ < file.data.size()) {
        if (options_.drop_link_after_chunks >= 0 &&
            chunks_sent_ >= static_cast<uint64_t>(options_.drop_link_after_chunks)) {
            connected_ = false;
            send_state_ = SendState::IDLE;
            drop_reason = "peripheral reset";
            return;
        }

        size_t n = std::min(options_.chunk_size, file.data.size() - offset_);
        out.emplace_back(file.data.begin() + static_cast<std::ptrdiff_t>(offset_),
                         file.data.begin() + static_cast<std::ptrdiff_t>(offset_ + n));
        offset_ += n;
        chunks_sent_++;
        send_state_ = SendState::SENDING;
        return;
    }

    // Last chunk acknowledged
    file_index_++;
    offset_ = 0;
    sendHeaderOrFinish(out);
}

void LoopbackPeripheral::sendHeaderOrFinish(std::vector<Bytes>& out) {
    if (file_index_ < files_.size()) {
        const StoredFile& file = files_[file_index_];
        std::string header = std::string(wire::PREFIX_FILE) + file.name + "," +
                             std::to_string(file.data.size());
        out.push_back(toBytes(header));
        send_state_ = SendState::HEADER_SENT;
    } else {
        out.push_back(toBytes(wire::MSG_SYNC_COMPLETE));
        send_state_ = SendState::IDLE;
    }
}

void LoopbackPeripheral::deliver(const std::vector<Bytes>& out, const std::string& drop_reason) {
    NotificationCallback notify;
    LinkLostCallback lost;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notify = notify_cb_;
        lost = link_lost_cb_;
    }

    if (notify) {
        for (const auto& value : out) {
            notify(value);
        }
    }

    if (!drop_reason.empty()) {
        LOG_LINK(INFO, "Loopback: Link dropped (%s)", drop_reason.c_str());
        if (lost) lost(drop_reason);
    }
}

} // namespace sim
} // namespace ramble
