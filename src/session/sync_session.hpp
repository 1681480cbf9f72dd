#pragma once

#include "command_writer.hpp"
#include "session_event.hpp"
#include "protocol/flow_controller.hpp"
#include "protocol/frame_classifier.hpp"
#include "protocol/transfer_state.hpp"
#include "storage/persistence_sink.hpp"
#include "transport/device_filter.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ramble {
namespace session {

enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    LINK_LOST       // Transport dropped the link; disconnect() releases it
};

enum class ConnectError {
    NONE,
    ALREADY_CONNECTED,
    TRANSPORT_FAILED,
    CHARACTERISTICS_NOT_FOUND,
    SUBSCRIBE_FAILED
};

const char* sessionStateToString(SessionState state);
const char* connectErrorToString(ConnectError error);

struct SessionConfig {
    std::string service_uuid = gatt::SERVICE_UUID;
    std::string command_uuid = gatt::COMMAND_CHAR_UUID;
    std::string data_uuid = gatt::DATA_CHAR_UUID;

    uint64_t progress_interval_bytes = protocol::TransferStateMachine::DEFAULT_PROGRESS_INTERVAL;
    uint32_t scan_timeout_ms = 15000;

    transport::DeviceFilter filter;

    // No worker threads: the caller drives processPending()
    bool synchronous = false;
};

struct SessionStats {
    uint64_t chunks_received = 0;       // Raw notifications off the data channel
    uint64_t bytes_received = 0;        // Payload bytes accepted into transfers
    uint64_t files_completed = 0;
    uint64_t files_saved = 0;
    uint64_t save_failures = 0;
    uint64_t transfers_discarded = 0;
    uint64_t acks_sent = 0;
    uint64_t ack_failures = 0;
    uint64_t desync_drops = 0;
    uint64_t overflow_bytes = 0;
    uint64_t stale_chunks = 0;          // Queued before a sync restart, never processed
    uint64_t events_dropped = 0;
};

/**
 * Sync Session
 *
 * Drives one peripheral over a Transport: connect, SYNC, DELETE, PING,
 * disconnect. Inbound notifications are classified and fed to the transfer
 * state machine; completed files go to the persistence sink; everything the
 * host needs to know comes out of the event queue.
 *
 * Threads (normal mode):
 *   RX worker    - sole owner of the state machine, processes chunks in order
 *   Command writer - serializes SYNC/DELETE/PING/ACK writes
 *   Save worker  - calls the persistence sink, drained on disconnect
 *
 * Public operations may be called from any thread. They never block on the
 * radio except connect() and findDevice().
 */
class SyncSession {
public:
    SyncSession(transport::Transport& transport, storage::PersistenceSink& sink,
                const SessionConfig& config = SessionConfig{});
    ~SyncSession();

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    // --- Discovery / Connection ---

    // Scan and pick the peripheral (timeout 0 = configured default)
    std::optional<transport::DeviceInfo> findDevice(uint32_t timeout_ms = 0);

    ConnectError connect(const transport::DeviceInfo& device);
    void disconnect();

    // --- Commands ---

    // Restarts the transfer from scratch; any partial file is discarded
    bool startSync();
    bool requestDelete();

    // PING; the answer arrives later as a PONG event
    bool probe();

    // Writes one ACK byte then "TEST"; true if both were queued
    bool testCommandChannel();

    // Synchronous mode: drain queued chunks and saves. Returns items handled.
    size_t processPending();

    // --- Events ---

    std::optional<SessionEvent> pollEvent() { return events_.tryPop(); }
    std::optional<SessionEvent> waitEvent(uint32_t timeout_ms) { return events_.waitPop(timeout_ms); }
    std::vector<SessionEvent> drainEvents() { return events_.drain(); }

    // --- State ---

    SessionState getState() const { return state_.load(); }
    bool isConnected() const { return state_.load() == SessionState::CONNECTED; }
    SessionStats getStats() const;
    std::string lastStatus() const;
    protocol::TransferState getTransferState() const;
    std::optional<transport::DeviceInfo> connectedDevice() const;

    const SessionConfig& config() const { return config_; }

private:
    // Lives from a successful connect() to disconnect()
    struct LinkContext {
        transport::DeviceInfo device;
        std::chrono::steady_clock::time_point connected_at;
    };

    struct RxItem {
        enum class Kind { CHUNK, LINK_LOST };
        Kind kind = Kind::CHUNK;
        Bytes data;
        std::string reason;
        uint64_t generation = 0;
    };

    transport::Transport& transport_;
    storage::PersistenceSink& sink_;
    SessionConfig config_;

    std::atomic<SessionState> state_{SessionState::DISCONNECTED};
    std::unique_ptr<LinkContext> link_;
    mutable std::mutex lifecycle_mutex_;

    // Touched only by the RX worker (or processPending) under engine_mutex_
    protocol::TransferStateMachine machine_;
    protocol::FlowController flow_;
    mutable std::mutex engine_mutex_;

    CommandWriter writer_;
    EventQueue events_;

    // RX queue
    std::deque<RxItem> rx_queue_;
    std::mutex rx_mutex_;
    std::condition_variable rx_cv_;
    std::thread rx_thread_;
    bool rx_running_ = false;
    uint64_t rx_generation_ = 0;        // Bumped by startSync(), guarded by rx_mutex_

    // Save queue
    std::deque<protocol::CompletedFile> save_queue_;
    std::mutex save_mutex_;
    std::condition_variable save_cv_;
    std::thread save_thread_;
    bool save_running_ = false;

    std::string last_status_;
    mutable std::mutex status_mutex_;

    std::atomic<uint64_t> chunks_in_{0};
    std::atomic<uint64_t> files_saved_{0};
    std::atomic<uint64_t> save_failures_{0};
    std::atomic<uint64_t> stale_chunks_{0};
    std::atomic<bool> disconnect_reported_{false};

    void wireStateMachine();

    void startWorkers();
    void stopWorkers();

    void postRx(RxItem item);
    void restartTransfer(const char* reason);
    void onNotification(const Bytes& value);
    void onLinkLost(const std::string& reason);

    void rxLoop();
    void processRxItem(const RxItem& item);

    void enqueueSave(protocol::CompletedFile file);
    void saveLoop();
    void saveFile(const protocol::CompletedFile& file);

    bool submitCommand(const char* command, CommandWriter::DoneCallback done);
    void setStatus(const std::string& text);
    void reportDisconnected(const std::string& reason);
};

} // namespace session
} // namespace ramble
