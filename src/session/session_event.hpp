#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ramble {
namespace session {

enum class SessionEventType {
    STATUS,             // Human-readable status line (text)
    SYNC_STARTED,       // SYNC command issued
    SYNC_COMPLETE,      // Peripheral reported SYNC_COMPLETE
    PROGRESS,           // filename, bytes_received, expected_size, percent
    FILE_RECEIVED,      // File fully received, handed to storage (filename, expected_size)
    FILE_SAVED,         // Storage succeeded (filename, text = path)
    FILE_SAVE_FAILED,   // Storage failed (filename, text = reason)
    TRANSFER_DISCARDED, // Incomplete transfer dropped (filename, bytes_received, expected_size, text = reason)
    PONG,               // Peripheral answered PING
    DISCONNECTED        // Link closed or lost (text = reason)
};

const char* sessionEventTypeToString(SessionEventType type);

struct SessionEvent {
    SessionEventType type = SessionEventType::STATUS;
    std::string text;
    std::string filename;
    uint64_t bytes_received = 0;
    uint64_t expected_size = 0;
    int percent = 0;

    static SessionEvent status(const std::string& text);
    static SessionEvent syncStarted();
    static SessionEvent syncComplete();
    static SessionEvent progress(const std::string& filename, uint64_t received,
                                 uint64_t expected, int percent);
    static SessionEvent fileReceived(const std::string& filename, uint64_t size);
    static SessionEvent fileSaved(const std::string& filename, const std::string& path);
    static SessionEvent fileSaveFailed(const std::string& filename, const std::string& reason);
    static SessionEvent transferDiscarded(const std::string& filename, uint64_t received,
                                          uint64_t expected, const std::string& reason);
    static SessionEvent pong();
    static SessionEvent disconnected(const std::string& reason);
};

/**
 * Outbound event queue consumed by the host application.
 *
 * Producers are the session's worker threads; events come out in the order
 * they were pushed. The host polls or blocks on it from whatever thread
 * suits its UI framework.
 */
class EventQueue {
public:
    void push(SessionEvent event);

    std::optional<SessionEvent> tryPop();
    std::optional<SessionEvent> waitPop(uint32_t timeout_ms);
    std::vector<SessionEvent> drain();

    size_t size() const;
    void clear();

    // STATUS and PROGRESS events evicted because the queue was full
    uint64_t dropped() const;

    // Past this the oldest STATUS or PROGRESS event is evicted. Other events
    // are never dropped and may take the queue beyond the limit.
    static constexpr size_t MAX_EVENTS = 4096;

private:
    std::deque<SessionEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t dropped_ = 0;

    static bool isEvictable(const SessionEvent& event);
};

} // namespace session
} // namespace ramble
