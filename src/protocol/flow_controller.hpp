#pragma once

#include "ramble/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>

namespace ramble {
namespace protocol {

/**
 * Flow Controller (stop-and-wait receiver side)
 *
 * The peripheral holds its next chunk until it sees one ACK byte (0x06) on
 * the command channel. One ACK goes out per file header and per consumed
 * payload chunk.
 *
 * ACKs are fire-and-forget: the write is queued and never awaited. A failed
 * ACK is logged and counted but never retried, since the protocol has no
 * sequence numbers and a duplicate would release an extra chunk. Recovery
 * is the peripheral's retransmit timeout.
 */
class FlowController {
public:
    // Completion is reported asynchronously (possibly from another thread)
    using WriteDone = std::function<void(bool ok)>;
    using WriteCallback = std::function<bool(const Bytes& data, WriteDone done)>;

    FlowController() = default;

    void setWriteCallback(WriteCallback cb) { write_ = std::move(cb); }

    // One payload chunk (or header) consumed: emit exactly one ACK
    void onDataReceived();

    // Start of a new sync: restart the per-sync counter
    void resetCounter();

    uint64_t getAckCount() const { return ack_count_.load(); }
    uint64_t getTotalAcks() const { return total_acks_.load(); }
    uint64_t getFailedAcks() const { return failed_acks_.load(); }

private:
    WriteCallback write_;
    std::atomic<uint64_t> ack_count_{0};     // Since last resetCounter()
    std::atomic<uint64_t> total_acks_{0};    // Lifetime of this controller
    std::atomic<uint64_t> failed_acks_{0};

    static constexpr uint64_t ACK_LOG_INTERVAL = 50;
};

} // namespace protocol
} // namespace ramble
