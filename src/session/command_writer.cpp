#include "command_writer.hpp"
#include "ramble/logging.hpp"

namespace ramble {
namespace session {

CommandWriter::CommandWriter(WriteFunction write_fn, bool synchronous)
    : write_fn_(std::move(write_fn))
    , synchronous_(synchronous)
{
}

CommandWriter::~CommandWriter() {
    stop();
}

void CommandWriter::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    running_ = true;
    if (!synchronous_) {
        thread_ = std::thread(&CommandWriter::writerLoop, this);
        LOG_LINK(DEBUG, "Writer: thread started");
    }
}

void CommandWriter::stop() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        dropped = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    if (dropped > 0) {
        LOG_LINK(INFO, "Writer: stopped, %zu pending command(s) dropped", dropped);
    } else {
        LOG_LINK(DEBUG, "Writer: stopped");
    }
}

bool CommandWriter::submit(const std::string& label, Bytes data, DoneCallback done) {
    Pending cmd{label, std::move(data), std::move(done)};

    if (synchronous_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return false;
        }
        execute(cmd);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        queue_.push_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

size_t CommandWriter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void CommandWriter::writerLoop() {
    while (true) {
        Pending cmd;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (!running_) break;
            cmd = std::move(queue_.front());
            queue_.pop_front();
        }
        // Write outside the lock: the link may call back into the session
        execute(cmd);
    }
}

void CommandWriter::execute(Pending& cmd) {
    bool ok = write_fn_ ? write_fn_(cmd.data) : false;
    if (ok) {
        written_++;
        LOG_LINK(TRACE, "Writer: %s sent (%zu bytes)", cmd.label.c_str(), cmd.data.size());
    } else {
        failed_++;
        LOG_LINK(WARN, "Writer: %s write failed", cmd.label.c_str());
    }

    if (cmd.done) cmd.done(ok);
}

} // namespace session
} // namespace ramble
