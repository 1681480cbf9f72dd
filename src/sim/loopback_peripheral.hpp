/**
 * LoopbackPeripheral - In-process stand-in for the recorder firmware
 *
 * Implements the Transport interface and answers commands the way the
 * device does:
 *
 *   SYNC   -> SYNC_START, then per file: FILE:<name>,<size> and payload
 *             chunks, one chunk released per ACK (0x06), then SYNC_COMPLETE
 *   DELETE -> removes all stored files, DELETE_COMPLETE
 *   PING   -> PONG
 *
 * Notifications are delivered synchronously from inside write(), on the
 * writing thread, never while the peripheral's own lock is held.
 *
 * Fault injection (Options) covers the failure paths the session has to
 * survive: missing characteristics, rejected connect/subscribe, failed
 * writes and a link that drops mid-transfer.
 */

#pragma once

#include "transport/transport.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ramble {
namespace sim {

class LoopbackPeripheral : public transport::Transport {
public:
    struct Options {
        std::string name = "Ramble Device";
        std::string id = "loopback:00";
        size_t chunk_size = 200;            // Payload bytes per notification

        bool fail_connect = false;
        bool fail_subscribe = false;
        bool fail_writes = false;
        bool omit_command_characteristic = false;
        bool omit_data_characteristic = false;

        // Drop the link instead of sending chunk N+1 (-1 = never)
        int drop_link_after_chunks = -1;
    };

    struct StoredFile {
        std::string name;
        Bytes data;
    };

    LoopbackPeripheral();
    explicit LoopbackPeripheral(const Options& options);

    // --- Device content ---

    void addFile(const std::string& name, Bytes data);

    // Every regular file in the directory, sorted by name
    bool loadDirectory(const std::string& path, std::string& error);

    std::vector<std::string> fileNames() const;
    size_t fileCount() const;

    // Extra advertisements returned by scan() next to our own
    void addAdvertisement(const transport::DeviceInfo& device);
    void setAdvertising(bool advertising);

    // --- Test hooks ---

    // Push an arbitrary notification on the data channel
    void injectNotification(const Bytes& value);

    // Simulate a link loss (supervision timeout)
    void dropLink(const std::string& reason);

    void setFailWrites(bool fail);

    // Every write the central made, in order
    std::vector<Bytes> writeLog() const;
    uint64_t getAcksReceived() const;
    uint64_t getChunksSent() const;

    transport::DeviceInfo advertisement() const;

    // --- Transport ---

    std::vector<transport::DeviceInfo> scan(uint32_t timeout_ms) override;
    bool connect(const transport::DeviceInfo& device) override;
    void disconnect() override;
    bool isConnected() const override;
    std::vector<transport::ServiceInfo> discoverServices() override;
    bool subscribe(const std::string& service_uuid, const std::string& char_uuid,
                   NotificationCallback cb) override;
    void unsubscribe(const std::string& service_uuid, const std::string& char_uuid) override;
    bool write(const std::string& service_uuid, const std::string& char_uuid,
               const Bytes& data, transport::WriteMode mode) override;
    void setLinkLostCallback(LinkLostCallback cb) override;
    std::string lastError() const override;
    const char* transportName() const override { return "loopback"; }

private:
    enum class SendState {
        IDLE,
        HEADER_SENT,    // Waiting for the header ACK
        SENDING         // Waiting for a chunk ACK
    };

    Options options_;
    mutable std::mutex mutex_;

    std::vector<StoredFile> files_;
    std::vector<transport::DeviceInfo> extra_adverts_;
    bool advertising_ = true;

    bool connected_ = false;
    NotificationCallback notify_cb_;
    LinkLostCallback link_lost_cb_;
    std::string last_error_;

    SendState send_state_ = SendState::IDLE;
    size_t file_index_ = 0;
    size_t offset_ = 0;

    std::vector<Bytes> write_log_;
    uint64_t acks_received_ = 0;
    uint64_t chunks_sent_ = 0;

    // Called with mutex_ held; fills the notifications to deliver
    void handleCommand(const Bytes& data, std::vector<Bytes>& out, std::string& drop_reason);
    void handleAck(std::vector<Bytes>& out, std::string& drop_reason);
    void sendHeaderOrFinish(std::vector<Bytes>& out);

    void deliver(const std::vector<Bytes>& out, const std::string& drop_reason);
};

} // namespace sim
} // namespace ramble
