#include "sync_session.hpp"
#include "ramble/logging.hpp"
#include <algorithm>
#include <iterator>

namespace ramble {
namespace session {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "DISCONNECTED";
        case SessionState::CONNECTING:   return "CONNECTING";
        case SessionState::CONNECTED:    return "CONNECTED";
        case SessionState::LINK_LOST:    return "LINK_LOST";
        default: return "UNKNOWN";
    }
}

const char* connectErrorToString(ConnectError error) {
    switch (error) {
        case ConnectError::NONE:                      return "NONE";
        case ConnectError::ALREADY_CONNECTED:         return "ALREADY_CONNECTED";
        case ConnectError::TRANSPORT_FAILED:          return "TRANSPORT_FAILED";
        case ConnectError::CHARACTERISTICS_NOT_FOUND: return "CHARACTERISTICS_NOT_FOUND";
        case ConnectError::SUBSCRIBE_FAILED:          return "SUBSCRIBE_FAILED";
        default: return "UNKNOWN";
    }
}

SyncSession::SyncSession(transport::Transport& transport, storage::PersistenceSink& sink,
                         const SessionConfig& config)
    : transport_(transport)
    , sink_(sink)
    , config_(config)
    , machine_(config.progress_interval_bytes)
    , writer_([this](const Bytes& data) {
                  return transport_.write(config_.service_uuid, config_.command_uuid, data,
                                          transport::WriteMode::WITHOUT_RESPONSE);
              },
              config.synchronous)
{
    flow_.setWriteCallback([this](const Bytes& data, protocol::FlowController::WriteDone done) {
        return writer_.submit("ACK", data, std::move(done));
    });
    wireStateMachine();
}

SyncSession::~SyncSession() {
    disconnect();
}

void SyncSession::wireStateMachine() {
    machine_.setAckCallback([this]() {
        // First ACK of a file is the header ACK: per-file numbering restarts
        if (machine_.getState().ack_count == 1) {
            flow_.resetCounter();
        }
        flow_.onDataReceived();
    });

    machine_.setFileCompleteCallback([this](protocol::CompletedFile file) {
        events_.push(SessionEvent::fileReceived(file.filename, file.bytes.size()));
        enqueueSave(std::move(file));
    });

    machine_.setProgressCallback([this](const std::string& filename, uint64_t received,
                                        uint64_t expected, int percent) {
        events_.push(SessionEvent::progress(filename, received, expected, percent));
        setStatus("Receiving: " + std::to_string(percent) + "%");
    });

    machine_.setStatusCallback([this](const std::string& text) {
        setStatus(text);
    });

    machine_.setSyncCompleteCallback([this]() {
        LOG_SYNC(INFO, "Session: Sync complete");
        events_.push(SessionEvent::syncComplete());
        setStatus("Sync complete!");
    });

    machine_.setPongCallback([this]() {
        LOG_SYNC(INFO, "Session: PONG received");
        events_.push(SessionEvent::pong());
        setStatus(wire::MSG_PONG);
    });

    machine_.setDiscardCallback([this](const std::string& filename, uint64_t received,
                                       uint64_t expected, const char* reason) {
        events_.push(SessionEvent::transferDiscarded(filename, received, expected, reason));
    });
}

// =============================================================================
// DISCOVERY
// =============================================================================

std::optional<transport::DeviceInfo> SyncSession::findDevice(uint32_t timeout_ms) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (timeout_ms == 0) timeout_ms = config_.scan_timeout_ms;

    setStatus("Scanning for Ramble Device...");
    LOG_LINK(INFO, "Session: Scanning via %s (%u ms)", transport_.transportName(), timeout_ms);

    std::vector<transport::DeviceInfo> results = transport_.scan(timeout_ms);
    LOG_LINK(DEBUG, "Session: Scan returned %zu advertisement(s)", results.size());

    auto device = transport::selectDevice(results, config_.filter);
    if (device) {
        setStatus("Found " + device->name);
        return device;
    }

    std::string seen = transport::describeDiscovered(results);
    if (seen.empty()) {
        setStatus("Device not found. No BLE devices found");
    } else {
        setStatus("Device not found. Found: " + seen);
    }
    return std::nullopt;
}

// =============================================================================
// CONNECTION
// =============================================================================

ConnectError SyncSession::connect(const transport::DeviceInfo& device) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != SessionState::DISCONNECTED) {
        LOG_SYNC(WARN, "Session: connect() while %s", sessionStateToString(state_.load()));
        return ConnectError::ALREADY_CONNECTED;
    }

    state_ = SessionState::CONNECTING;
    const std::string display = device.name.empty() ? device.id : device.name;
    setStatus("Connecting to " + display + "...");

    if (!transport_.connect(device)) {
        std::string err = transport_.lastError();
        LOG_LINK(ERROR, "Session: Connect to %s failed: %s", display.c_str(), err.c_str());
        setStatus(err.empty() ? "Connection failed" : "Connection failed: " + err);
        state_ = SessionState::DISCONNECTED;
        return ConnectError::TRANSPORT_FAILED;
    }

    setStatus("Discovering services...");
    std::vector<transport::ServiceInfo> services = transport_.discoverServices();

    const transport::ServiceInfo* service = transport::findService(services, config_.service_uuid);
    const transport::CharacteristicInfo* command = nullptr;
    const transport::CharacteristicInfo* data = nullptr;
    if (service) {
        command = transport::findCharacteristic(*service, config_.command_uuid);
        data = transport::findCharacteristic(*service, config_.data_uuid);
    }

    if (!command || !data) {
        LOG_LINK(ERROR, "Session: Missing %s%s%s", !service ? "service " : "",
                 !command ? "command " : "", !data ? "data" : "");
        setStatus("Could not find required characteristics");
        transport_.disconnect();
        state_ = SessionState::DISCONNECTED;
        return ConnectError::CHARACTERISTICS_NOT_FOUND;
    }

    if (!data->can_notify) {
        LOG_LINK(WARN, "Session: Data characteristic does not advertise notify");
    }

    {
        std::lock_guard<std::mutex> rx_lock(rx_mutex_);
        rx_queue_.clear();
    }
    {
        std::lock_guard<std::mutex> engine_lock(engine_mutex_);
        machine_.reset("new connection");
        flow_.resetCounter();
    }
    disconnect_reported_ = false;

    startWorkers();

    transport_.setLinkLostCallback([this](const std::string& reason) { onLinkLost(reason); });

    bool subscribed = transport_.subscribe(config_.service_uuid, config_.data_uuid,
                                           [this](const Bytes& value) { onNotification(value); });
    if (!subscribed) {
        std::string err = transport_.lastError();
        LOG_LINK(ERROR, "Session: Subscribe failed: %s", err.c_str());
        transport_.setLinkLostCallback(nullptr);
        stopWorkers();
        transport_.disconnect();
        setStatus("Could not subscribe to data channel");
        state_ = SessionState::DISCONNECTED;
        return ConnectError::SUBSCRIBE_FAILED;
    }

    link_ = std::make_unique<LinkContext>();
    link_->device = device;
    link_->connected_at = std::chrono::steady_clock::now();

    state_ = SessionState::CONNECTED;
    LOG_SYNC(INFO, "Session: Connected to %s [%s]", display.c_str(), device.id.c_str());
    setStatus("Connected!");
    return ConnectError::NONE;
}

void SyncSession::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ == SessionState::DISCONNECTED) return;

    LOG_SYNC(INFO, "Session: Disconnecting (%s)", sessionStateToString(state_.load()));

    transport_.setLinkLostCallback(nullptr);
    transport_.unsubscribe(config_.service_uuid, config_.data_uuid);

    // Queued chunks are dropped; whatever was in flight can never complete
    stopWorkers();
    {
        std::lock_guard<std::mutex> engine_lock(engine_mutex_);
        machine_.reset("disconnect");
    }

    transport_.disconnect();

    if (link_) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - link_->connected_at).count();
        LOG_SYNC(INFO, "Session: Link to %s closed after %llds",
                 link_->device.name.c_str(), static_cast<long long>(secs));
    }
    link_.reset();

    state_ = SessionState::DISCONNECTED;
    reportDisconnected("disconnect requested");
    setStatus("Disconnected");
}

void SyncSession::startWorkers() {
    writer_.start();

    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        save_running_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(rx_mutex_);
        rx_running_ = true;
    }

    if (config_.synchronous) return;

    save_thread_ = std::thread(&SyncSession::saveLoop, this);
    rx_thread_ = std::thread(&SyncSession::rxLoop, this);
    LOG_SYNC(DEBUG, "Session: Workers started");
}

void SyncSession::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(rx_mutex_);
        rx_running_ = false;
        rx_queue_.clear();
    }
    rx_cv_.notify_all();
    if (rx_thread_.joinable()) rx_thread_.join();

    writer_.stop();

    // Completed files are still saved
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        save_running_ = false;
    }
    save_cv_.notify_all();
    if (save_thread_.joinable()) {
        save_thread_.join();
    } else {
        // Synchronous mode: flush what processPending() has not reached
        while (true) {
            protocol::CompletedFile file;
            {
                std::lock_guard<std::mutex> lock(save_mutex_);
                if (save_queue_.empty()) break;
                file = std::move(save_queue_.front());
                save_queue_.pop_front();
            }
            saveFile(file);
        }
    }
}

// =============================================================================
// COMMANDS
// =============================================================================

bool SyncSession::submitCommand(const char* command, CommandWriter::DoneCallback done) {
    LOG_SYNC(INFO, "Session: Sending %s", command);
    return writer_.submit(command, toBytes(command), std::move(done));
}

bool SyncSession::startSync() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != SessionState::CONNECTED) {
        setStatus("Not connected");
        return false;
    }

    setStatus("Starting sync...");

    // Before SYNC goes out: nothing of the old transfer may reach the machine
    restartTransfer("sync restarted");

    bool queued = submitCommand(wire::CMD_SYNC, [this](bool ok) {
        if (ok) {
            setStatus("Syncing files...");
            events_.push(SessionEvent::syncStarted());
        } else {
            setStatus("Sync command failed");
        }
    });

    if (!queued) {
        setStatus("Sync command failed");
    }
    return queued;
}

bool SyncSession::requestDelete() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != SessionState::CONNECTED) {
        setStatus("Not connected");
        return false;
    }

    bool queued = submitCommand(wire::CMD_DELETE, [this](bool ok) {
        setStatus(ok ? "Delete command sent" : "Delete command failed");
    });
    if (!queued) {
        setStatus("Delete command failed");
    }
    return queued;
}

bool SyncSession::probe() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != SessionState::CONNECTED) {
        setStatus("Not connected");
        return false;
    }

    bool queued = submitCommand(wire::CMD_PING, [this](bool ok) {
        if (!ok) LOG_SYNC(WARN, "Session: PING write failed");
        setStatus(ok ? "Ping sent" : "Ping failed");
    });
    if (!queued) {
        setStatus("Ping failed");
    }
    return queued;
}

bool SyncSession::testCommandChannel() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != SessionState::CONNECTED) {
        setStatus("Not connected");
        return false;
    }

    LOG_SYNC(INFO, "Session: Testing command channel");
    bool ack_queued = writer_.submit("TEST-ACK", Bytes{wire::ACK_BYTE}, [](bool ok) {
        LOG_SYNC(INFO, "Session: Test ACK write %s", ok ? "ok" : "FAILED");
    });
    bool text_queued = submitCommand(wire::CMD_TEST, [](bool ok) {
        LOG_SYNC(INFO, "Session: Test text write %s", ok ? "ok" : "FAILED");
    });

    return ack_queued && text_queued;
}

// =============================================================================
// RX PATH
// =============================================================================

void SyncSession::postRx(RxItem item) {
    {
        std::lock_guard<std::mutex> lock(rx_mutex_);
        item.generation = rx_generation_;
        rx_queue_.push_back(std::move(item));
    }
    rx_cv_.notify_one();
}

void SyncSession::restartTransfer(const char* reason) {
    // Lock order engine -> rx, same as a chunk whose ACK write delivers the next one
    std::lock_guard<std::mutex> engine_lock(engine_mutex_);

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> rx_lock(rx_mutex_);
        rx_generation_++;
        auto it = std::remove_if(rx_queue_.begin(), rx_queue_.end(),
                                 [](const RxItem& item) { return item.kind == RxItem::Kind::CHUNK; });
        dropped = static_cast<size_t>(std::distance(it, rx_queue_.end()));
        rx_queue_.erase(it, rx_queue_.end());
    }
    stale_chunks_ += dropped;
    if (dropped > 0) {
        LOG_SYNC(INFO, "Session: %zu queued chunk(s) of the previous sync dropped", dropped);
    }

    machine_.reset(reason);
    flow_.resetCounter();
}

void SyncSession::onNotification(const Bytes& value) {
    chunks_in_++;
    RxItem item;
    item.kind = RxItem::Kind::CHUNK;
    item.data = value;
    postRx(std::move(item));
}

void SyncSession::onLinkLost(const std::string& reason) {
    LOG_LINK(WARN, "Session: Link lost: %s", reason.c_str());
    state_ = SessionState::LINK_LOST;

    RxItem item;
    item.kind = RxItem::Kind::LINK_LOST;
    item.reason = reason;
    postRx(std::move(item));
}

void SyncSession::rxLoop() {
    while (true) {
        RxItem item;
        {
            std::unique_lock<std::mutex> lock(rx_mutex_);
            rx_cv_.wait(lock, [this] { return !rx_running_ || !rx_queue_.empty(); });
            if (!rx_running_) break;
            item = std::move(rx_queue_.front());
            rx_queue_.pop_front();
        }
        processRxItem(item);
    }
}

void SyncSession::processRxItem(const RxItem& item) {
    std::lock_guard<std::mutex> lock(engine_mutex_);

    switch (item.kind) {
        case RxItem::Kind::CHUNK: {
            bool stale = false;
            {
                std::lock_guard<std::mutex> rx_lock(rx_mutex_);
                stale = item.generation != rx_generation_;
            }
            if (stale) {
                // Taken off the queue just before a sync restart
                stale_chunks_++;
                LOG_PROTO(DEBUG, "Session: stale chunk (%zu bytes) ignored", item.data.size());
                break;
            }
            protocol::Frame frame = protocol::classify(item.data);
            if (frame.isControl()) {
                LOG_PROTO(DEBUG, "Session: RX control '%s'", frame.control.describe().c_str());
            } else {
                LOG_PROTO(TRACE, "Session: RX payload %zu bytes", frame.payload.size());
            }
            machine_.onFrame(frame);
            break;
        }

        case RxItem::Kind::LINK_LOST:
            machine_.reset("link lost");
            reportDisconnected(item.reason);
            setStatus("Disconnected: " + item.reason);
            break;
    }
}

size_t SyncSession::processPending() {
    if (!config_.synchronous) return 0;

    size_t handled = 0;
    while (true) {
        std::optional<RxItem> item;
        {
            std::lock_guard<std::mutex> lock(rx_mutex_);
            if (rx_running_ && !rx_queue_.empty()) {
                item = std::move(rx_queue_.front());
                rx_queue_.pop_front();
            }
        }
        if (item) {
            processRxItem(*item);
            handled++;
            continue;
        }

        std::optional<protocol::CompletedFile> file;
        {
            std::lock_guard<std::mutex> lock(save_mutex_);
            if (!save_queue_.empty()) {
                file = std::move(save_queue_.front());
                save_queue_.pop_front();
            }
        }
        if (file) {
            saveFile(*file);
            handled++;
            continue;
        }
        break;
    }
    return handled;
}

// =============================================================================
// PERSISTENCE
// =============================================================================

void SyncSession::enqueueSave(protocol::CompletedFile file) {
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        save_queue_.push_back(std::move(file));
    }
    save_cv_.notify_one();
}

void SyncSession::saveLoop() {
    while (true) {
        protocol::CompletedFile file;
        {
            std::unique_lock<std::mutex> lock(save_mutex_);
            save_cv_.wait(lock, [this] { return !save_running_ || !save_queue_.empty(); });
            // Drain before exiting
            if (save_queue_.empty()) break;
            file = std::move(save_queue_.front());
            save_queue_.pop_front();
        }
        saveFile(file);
    }
}

void SyncSession::saveFile(const protocol::CompletedFile& file) {
    storage::SaveResult result = sink_.save(file.filename, file.bytes);
    if (result.ok) {
        files_saved_++;
        events_.push(SessionEvent::fileSaved(file.filename, result.path));
        setStatus("Saved: " + file.filename);
    } else {
        save_failures_++;
        LOG_STORE(ERROR, "Session: Save of %s failed: %s", file.filename.c_str(), result.error.c_str());
        events_.push(SessionEvent::fileSaveFailed(file.filename, result.error));
        setStatus("Error saving: " + result.error);
    }
}

// =============================================================================
// STATE
// =============================================================================

void SyncSession::setStatus(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_status_ = text;
    }
    LOG_SYNC(DEBUG, "Status: %s", text.c_str());
    events_.push(SessionEvent::status(text));
}

void SyncSession::reportDisconnected(const std::string& reason) {
    if (disconnect_reported_.exchange(true)) return;
    events_.push(SessionEvent::disconnected(reason));
}

std::string SyncSession::lastStatus() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_status_;
}

SessionStats SyncSession::getStats() const {
    SessionStats stats;
    {
        std::lock_guard<std::mutex> lock(engine_mutex_);
        protocol::TransferStats t = machine_.getStats();
        stats.bytes_received = t.bytes_received;
        stats.files_completed = t.files_completed;
        stats.transfers_discarded = t.transfers_discarded;
        stats.desync_drops = t.desync_drops;
        stats.overflow_bytes = t.overflow_bytes;
    }
    stats.chunks_received = chunks_in_.load();
    stats.files_saved = files_saved_.load();
    stats.save_failures = save_failures_.load();
    stats.stale_chunks = stale_chunks_.load();
    stats.events_dropped = events_.dropped();
    stats.acks_sent = flow_.getTotalAcks() - flow_.getFailedAcks();
    stats.ack_failures = flow_.getFailedAcks();
    return stats;
}

protocol::TransferState SyncSession::getTransferState() const {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    return machine_.getState();
}

std::optional<transport::DeviceInfo> SyncSession::connectedDevice() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!link_) return std::nullopt;
    return link_->device;
}

} // namespace session
} // namespace ramble
