#include "flow_controller.hpp"
#include "ramble/logging.hpp"

namespace ramble {
namespace protocol {

void FlowController::onDataReceived() {
    uint64_t n = ++ack_count_;
    total_acks_++;

    if (n == 1 || n % ACK_LOG_INTERVAL == 0) {
        LOG_PROTO(INFO, "Flow: Sending ACK #%llu", static_cast<unsigned long long>(n));
    } else {
        LOG_PROTO(TRACE, "Flow: Sending ACK #%llu", static_cast<unsigned long long>(n));
    }

    if (!write_) {
        failed_acks_++;
        LOG_PROTO(WARN, "Flow: No command channel, ACK #%llu dropped",
                  static_cast<unsigned long long>(n));
        return;
    }

    static const Bytes ack{wire::ACK_BYTE};
    bool queued = write_(ack, [this, n](bool ok) {
        if (!ok) {
            failed_acks_++;
            LOG_PROTO(WARN, "Flow: ACK #%llu send error (not retried)",
                      static_cast<unsigned long long>(n));
        }
    });

    if (!queued) {
        failed_acks_++;
        LOG_PROTO(WARN, "Flow: ACK #%llu not queued (not retried)",
                  static_cast<unsigned long long>(n));
    }
}

void FlowController::resetCounter() {
    ack_count_ = 0;
}

} // namespace protocol
} // namespace ramble
