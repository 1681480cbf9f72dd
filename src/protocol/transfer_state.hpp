#pragma once

#include "frame_classifier.hpp"
#include "ramble/types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace ramble {
namespace protocol {

enum class TransferPhase : uint8_t {
    IDLE,           // No header seen (or last file finished)
    AWAITING_DATA   // Header received, accumulating payload
};

const char* transferPhaseToString(TransferPhase phase);

// State of the one in-flight transfer. Owned and mutated only by
// TransferStateMachine. filename/expected_size are set or cleared together.
struct TransferState {
    TransferPhase phase = TransferPhase::IDLE;
    std::optional<std::string> filename;
    std::optional<uint64_t> expected_size;
    uint64_t bytes_received = 0;
    Bytes buffer;
    uint64_t ack_count = 0;     // ACKs requested for the current file (header + chunks)

    bool hasPartialData() const {
        return phase == TransferPhase::AWAITING_DATA && bytes_received > 0;
    }
};

// Produced once per fully received file, then handed off
struct CompletedFile {
    std::string filename;
    Bytes bytes;
};

struct TransferStats {
    uint64_t headers_received = 0;
    uint64_t chunks_received = 0;       // Payload chunks consumed while AWAITING_DATA
    uint64_t bytes_received = 0;
    uint64_t files_completed = 0;
    uint64_t transfers_discarded = 0;   // Partial transfers dropped (restart/truncation/link loss)
    uint64_t desync_drops = 0;          // Payload chunks with no active header
    uint64_t overflow_bytes = 0;        // Bytes beyond announced size in final chunk
};

/**
 * Transfer State Machine
 *
 *   IDLE --FILE:name,size--> AWAITING_DATA --bytes >= size--> IDLE (+CompletedFile)
 *   AWAITING_DATA --FILE:...--> AWAITING_DATA (prior partial discarded)
 *   AWAITING_DATA --SYNC_COMPLETE / reset()--> IDLE (partial discarded)
 *
 * Every header and every consumed payload chunk requests exactly one ACK.
 * Payload while IDLE is a desync: dropped, no ACK.
 *
 * Not thread-safe. The owner must serialize all calls.
 */
class TransferStateMachine {
public:
    using AckCallback = std::function<void()>;
    using FileCompleteCallback = std::function<void(CompletedFile file)>;
    using ProgressCallback = std::function<void(const std::string& filename, uint64_t received,
                                                uint64_t expected, int percent)>;
    using StatusCallback = std::function<void(const std::string& text)>;
    using SyncCompleteCallback = std::function<void()>;
    using PongCallback = std::function<void()>;
    using DiscardCallback = std::function<void(const std::string& filename, uint64_t received,
                                               uint64_t expected, const char* reason)>;

    static constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 4096;

    explicit TransferStateMachine(uint64_t progress_interval_bytes = DEFAULT_PROGRESS_INTERVAL);

    // --- Input ---

    void onFrame(const Frame& frame);
    void onControl(const ControlMessage& msg);
    void onPayload(ByteSpan data);

    // Drop any in-flight transfer and return to IDLE (sync restart, disconnect)
    void reset(const char* reason);

    // --- Callbacks ---

    void setAckCallback(AckCallback cb) { on_ack_ = std::move(cb); }
    void setFileCompleteCallback(FileCompleteCallback cb) { on_file_complete_ = std::move(cb); }
    void setProgressCallback(ProgressCallback cb) { on_progress_ = std::move(cb); }
    void setStatusCallback(StatusCallback cb) { on_status_ = std::move(cb); }
    void setSyncCompleteCallback(SyncCompleteCallback cb) { on_sync_complete_ = std::move(cb); }
    void setPongCallback(PongCallback cb) { on_pong_ = std::move(cb); }
    void setDiscardCallback(DiscardCallback cb) { on_discard_ = std::move(cb); }

    // --- State ---

    const TransferState& getState() const { return state_; }
    TransferPhase getPhase() const { return state_.phase; }
    bool isIdle() const { return state_.phase == TransferPhase::IDLE; }

    TransferStats getStats() const { return stats_; }
    void resetStats() { stats_ = TransferStats{}; }

    void setProgressInterval(uint64_t bytes) { progress_interval_ = bytes; }
    uint64_t getProgressInterval() const { return progress_interval_; }

private:
    TransferState state_;
    TransferStats stats_;
    uint64_t progress_interval_;

    AckCallback on_ack_;
    FileCompleteCallback on_file_complete_;
    ProgressCallback on_progress_;
    StatusCallback on_status_;
    SyncCompleteCallback on_sync_complete_;
    PongCallback on_pong_;
    DiscardCallback on_discard_;

    void handleFileHeader(const std::string& name, uint64_t size);
    void discardPartial(const char* reason);
    void completeTransfer();
    void clearTransfer();
    void requestAck();
    void reportProgress(uint64_t previous);
    void emitStatus(const std::string& text);
};

} // namespace protocol
} // namespace ramble
