#pragma once

#include "ramble/types.hpp"
#include <string>

namespace ramble {
namespace storage {

struct SaveResult {
    bool ok = false;
    std::string path;       // Where the file ended up (ok only)
    std::string error;      // Reason (!ok only)

    static SaveResult success(const std::string& path) { return {true, path, ""}; }
    static SaveResult failure(const std::string& error) { return {false, "", error}; }
};

/**
 * Destination for completed files.
 *
 * Called at most once per completed file, always off the notification
 * thread, and only with exactly the number of bytes the peripheral
 * announced. May block.
 */
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual SaveResult save(const std::string& filename, const Bytes& bytes) = 0;
};

} // namespace storage
} // namespace ramble
