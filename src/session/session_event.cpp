#include "session_event.hpp"
#include "ramble/logging.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>

namespace ramble {
namespace session {

const char* sessionEventTypeToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::STATUS:             return "STATUS";
        case SessionEventType::SYNC_STARTED:       return "SYNC_STARTED";
        case SessionEventType::SYNC_COMPLETE:      return "SYNC_COMPLETE";
        case SessionEventType::PROGRESS:           return "PROGRESS";
        case SessionEventType::FILE_RECEIVED:      return "FILE_RECEIVED";
        case SessionEventType::FILE_SAVED:         return "FILE_SAVED";
        case SessionEventType::FILE_SAVE_FAILED:   return "FILE_SAVE_FAILED";
        case SessionEventType::TRANSFER_DISCARDED: return "TRANSFER_DISCARDED";
        case SessionEventType::PONG:               return "PONG";
        case SessionEventType::DISCONNECTED:       return "DISCONNECTED";
        default: return "UNKNOWN";
    }
}

SessionEvent SessionEvent::status(const std::string& text) {
    SessionEvent e;
    e.type = SessionEventType::STATUS;
    e.text = text;
    return e;
}

SessionEvent SessionEvent::syncStarted() {
    SessionEvent e;
    e.type = SessionEventType::SYNC_STARTED;
    return e;
}

SessionEvent SessionEvent::syncComplete() {
    SessionEvent e;
    e.type = SessionEventType::SYNC_COMPLETE;
    return e;
}

SessionEvent SessionEvent::progress(const std::string& filename, uint64_t received,
                                    uint64_t expected, int percent) {
    SessionEvent e;
    e.type = SessionEventType::PROGRESS;
    e.filename = filename;
    e.bytes_received = received;
    e.expected_size = expected;
    e.percent = percent;
    return e;
}

SessionEvent SessionEvent::fileReceived(const std::string& filename, uint64_t size) {
    SessionEvent e;
    e.type = SessionEventType::FILE_RECEIVED;
    e.filename = filename;
    e.bytes_received = size;
    e.expected_size = size;
    e.percent = 100;
    return e;
}

SessionEvent SessionEvent::fileSaved(const std::string& filename, const std::string& path) {
    SessionEvent e;
    e.type = SessionEventType::FILE_SAVED;
    e.filename = filename;
    e.text = path;
    return e;
}

SessionEvent SessionEvent::fileSaveFailed(const std::string& filename, const std::string& reason) {
    SessionEvent e;
    e.type = SessionEventType::FILE_SAVE_FAILED;
    e.filename = filename;
    e.text = reason;
    return e;
}

SessionEvent SessionEvent::transferDiscarded(const std::string& filename, uint64_t received,
                                             uint64_t expected, const std::string& reason) {
    SessionEvent e;
    e.type = SessionEventType::TRANSFER_DISCARDED;
    e.filename = filename;
    e.bytes_received = received;
    e.expected_size = expected;
    e.text = reason;
    return e;
}

SessionEvent SessionEvent::pong() {
    SessionEvent e;
    e.type = SessionEventType::PONG;
    return e;
}

SessionEvent SessionEvent::disconnected(const std::string& reason) {
    SessionEvent e;
    e.type = SessionEventType::DISCONNECTED;
    e.text = reason;
    return e;
}

// =============================================================================
// EVENT QUEUE
// =============================================================================

bool EventQueue::isEvictable(const SessionEvent& event) {
    return event.type == SessionEventType::STATUS || event.type == SessionEventType::PROGRESS;
}

void EventQueue::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.size() >= MAX_EVENTS) {
            auto victim = std::find_if(events_.begin(), events_.end(), isEvictable);
            if (victim != events_.end()) {
                events_.erase(victim);
                dropped_++;
                if (dropped_ == 1 || dropped_ % 1000 == 0) {
                    LOG_SYNC(WARN, "Events: queue full (%zu), %llu status/progress event(s) dropped",
                             events_.size(), static_cast<unsigned long long>(dropped_));
                }
            }
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<SessionEvent> EventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;
    SessionEvent e = std::move(events_.front());
    events_.pop_front();
    return e;
}

std::optional<SessionEvent> EventQueue::waitPop(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                      [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    SessionEvent e = std::move(events_.front());
    events_.pop_front();
    return e;
}

std::vector<SessionEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionEvent> out(std::make_move_iterator(events_.begin()),
                                  std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace session
} // namespace ramble
