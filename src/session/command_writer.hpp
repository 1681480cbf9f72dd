#pragma once

#include "ramble/types.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ramble {
namespace session {

/**
 * Command Writer
 *
 * Single queue for every write on the command characteristic (SYNC,
 * DELETE, PING, ACKs). One writer thread drains it, so writes reach the
 * peripheral in submission order and chunk processing never waits on the
 * radio.
 *
 * In synchronous mode there is no thread: submit() writes inline.
 */
class CommandWriter {
public:
    // Performs the actual link write, returns false on failure
    using WriteFunction = std::function<bool(const Bytes& data)>;
    // Called once per accepted command with the write outcome
    using DoneCallback = std::function<void(bool ok)>;

    CommandWriter(WriteFunction write_fn, bool synchronous);
    ~CommandWriter();

    CommandWriter(const CommandWriter&) = delete;
    CommandWriter& operator=(const CommandWriter&) = delete;

    void start();

    // Pending commands are dropped without completion
    void stop();

    // Returns false if the writer is stopped (done is then not called)
    bool submit(const std::string& label, Bytes data, DoneCallback done = nullptr);

    size_t pending() const;
    uint64_t getWritten() const { return written_.load(); }
    uint64_t getFailed() const { return failed_.load(); }

private:
    struct Pending {
        std::string label;
        Bytes data;
        DoneCallback done;
    };

    WriteFunction write_fn_;
    bool synchronous_;

    std::deque<Pending> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool running_ = false;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> failed_{0};

    void writerLoop();
    void execute(Pending& cmd);
};

} // namespace session
} // namespace ramble
