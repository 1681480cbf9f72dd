#include "transfer_state.hpp"
#include "ramble/logging.hpp"
#include <algorithm>
#include <cmath>

namespace ramble {
namespace protocol {

const char* transferPhaseToString(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::IDLE:          return "IDLE";
        case TransferPhase::AWAITING_DATA: return "AWAITING_DATA";
        default: return "UNKNOWN";
    }
}

TransferStateMachine::TransferStateMachine(uint64_t progress_interval_bytes)
    : progress_interval_(progress_interval_bytes)
{
}

void TransferStateMachine::onFrame(const Frame& frame) {
    if (frame.isControl()) {
        onControl(frame.control);
    } else {
        onPayload(frame.payload);
    }
}

// =============================================================================
// CONTROL MESSAGES
// =============================================================================

void TransferStateMachine::onControl(const ControlMessage& msg) {
    LOG_PROTO(DEBUG, "Transfer: control %s in %s",
              controlTypeToString(msg.type), transferPhaseToString(state_.phase));

    switch (msg.type) {
        case ControlMessage::Type::SYNC_START:
            emitStatus("Starting transfer...");
            break;

        case ControlMessage::Type::SYNC_COMPLETE:
            if (state_.phase == TransferPhase::AWAITING_DATA) {
                discardPartial("sync complete before end of file");
            }
            if (on_sync_complete_) on_sync_complete_();
            break;

        case ControlMessage::Type::FILE_HEADER:
            handleFileHeader(msg.filename, msg.file_size);
            break;

        case ControlMessage::Type::PONG:
            if (on_pong_) on_pong_();
            break;

        case ControlMessage::Type::STATUS:
        case ControlMessage::Type::ERROR:
            emitStatus(msg.describe());
            break;

        case ControlMessage::Type::UNRECOGNIZED:
        default:
            if (msg.text.empty()) {
                LOG_PROTO(DEBUG, "Transfer: ignoring empty control frame");
                break;
            }
            emitStatus(msg.text);
            break;
    }
}

void TransferStateMachine::handleFileHeader(const std::string& name, uint64_t size) {
    // A new header while a file is still open means the peripheral restarted
    // its send; the old bytes can never be completed.
    if (state_.phase == TransferPhase::AWAITING_DATA) {
        discardPartial("superseded by new FILE header");
    }

    clearTransfer();
    state_.phase = TransferPhase::AWAITING_DATA;
    state_.filename = name;
    state_.expected_size = size;
    state_.buffer.reserve(static_cast<size_t>(std::min<uint64_t>(size, 16u * 1024u * 1024u)));
    stats_.headers_received++;

    LOG_PROTO(INFO, "Transfer: Ready to receive file: %s (%llu bytes)",
              name.c_str(), static_cast<unsigned long long>(size));
    emitStatus("Receiving: " + name);

    requestAck();

    if (size == 0) {
        // Nothing will follow, the header alone completes the file
        completeTransfer();
    }
}

// =============================================================================
// PAYLOAD
// =============================================================================

void TransferStateMachine::onPayload(ByteSpan data) {
    if (state_.phase != TransferPhase::AWAITING_DATA || !state_.expected_size) {
        stats_.desync_drops++;
        LOG_PROTO(WARN, "Transfer: Received %zu bytes but NO FILE CONTEXT (dropped)", data.size());
        return;
    }

    const uint64_t expected = *state_.expected_size;
    const uint64_t previous = state_.bytes_received;
    uint64_t take = data.size();

    if (previous + take > expected) {
        uint64_t excess = previous + take - expected;
        take = expected - previous;
        stats_.overflow_bytes += excess;
        LOG_PROTO(WARN, "Transfer: %s: %llu bytes beyond announced size dropped",
                  state_.filename->c_str(), static_cast<unsigned long long>(excess));
    }

    state_.buffer.insert(state_.buffer.end(), data.begin(), data.begin() + static_cast<size_t>(take));
    state_.bytes_received += take;
    stats_.chunks_received++;
    stats_.bytes_received += take;

    // ACK right away so the peripheral can release its next chunk
    requestAck();

    reportProgress(previous);

    if (state_.bytes_received >= expected) {
        completeTransfer();
    }
}

void TransferStateMachine::reportProgress(uint64_t previous) {
    if (!on_progress_ || !state_.expected_size) return;

    const uint64_t received = state_.bytes_received;
    const uint64_t expected = *state_.expected_size;
    bool crossed = true;
    if (progress_interval_ > 0) {
        crossed = (previous / progress_interval_) != (received / progress_interval_);
    }
    if (!crossed && received < expected) return;

    int percent = 100;
    if (expected > 0) {
        percent = static_cast<int>(std::lround(100.0 * static_cast<double>(received) /
                                               static_cast<double>(expected)));
    }
    LOG_PROTO(DEBUG, "Transfer: Progress %llu / %llu bytes (%d%%)",
              static_cast<unsigned long long>(received),
              static_cast<unsigned long long>(expected), percent);
    on_progress_(*state_.filename, received, expected, percent);
}

void TransferStateMachine::completeTransfer() {
    CompletedFile file;
    file.filename = *state_.filename;
    file.bytes = std::move(state_.buffer);

    LOG_PROTO(INFO, "Transfer: File complete! %s (%zu bytes, %llu ACKs)",
              file.filename.c_str(), file.bytes.size(),
              static_cast<unsigned long long>(state_.ack_count));

    clearTransfer();
    stats_.files_completed++;

    if (on_file_complete_) {
        on_file_complete_(std::move(file));
    }
}

// =============================================================================
// RESET / DISCARD
// =============================================================================

void TransferStateMachine::reset(const char* reason) {
    if (state_.phase == TransferPhase::AWAITING_DATA) {
        discardPartial(reason);
    }
    clearTransfer();
}

void TransferStateMachine::discardPartial(const char* reason) {
    const std::string name = state_.filename ? *state_.filename : std::string();
    const uint64_t received = state_.bytes_received;
    const uint64_t expected = state_.expected_size ? *state_.expected_size : 0;

    stats_.transfers_discarded++;
    LOG_PROTO(WARN, "Transfer: Discarding incomplete %s (%llu / %llu bytes): %s",
              name.c_str(), static_cast<unsigned long long>(received),
              static_cast<unsigned long long>(expected), reason ? reason : "");

    clearTransfer();

    if (on_discard_) {
        on_discard_(name, received, expected, reason ? reason : "");
    }
}

void TransferStateMachine::clearTransfer() {
    state_.phase = TransferPhase::IDLE;
    state_.filename.reset();
    state_.expected_size.reset();
    state_.bytes_received = 0;
    state_.buffer.clear();
    state_.ack_count = 0;
}

void TransferStateMachine::requestAck() {
    state_.ack_count++;
    if (on_ack_) on_ack_();
}

void TransferStateMachine::emitStatus(const std::string& text) {
    if (on_status_) on_status_(text);
}

} // namespace protocol
} // namespace ramble
