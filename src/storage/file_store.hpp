#pragma once

#include "persistence_sink.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ramble {
namespace storage {

// Metadata registered for every received note. Transcription and category
// are filled in later by the app, outside this engine.
struct NoteRecord {
    std::string filename;
    int64_t timestamp = 0;          // Unix seconds at save time
    bool transcribed = false;
    std::string audio_path;
};

/**
 * Append-only note index (one tab-separated record per line):
 *   filename \t timestamp \t transcribed(0|1) \t audio_path
 */
class NoteIndex {
public:
    explicit NoteIndex(const std::string& path);

    bool append(const NoteRecord& record, std::string& error);

    // Malformed lines are skipped
    std::vector<NoteRecord> load() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

/**
 * Persistence sink that writes each file into a receive directory and
 * registers it in the note index.
 *
 * Writes go to "<name>.part" and are renamed into place, so a failed write
 * never leaves a truncated audio file behind. An existing file with the
 * same name is replaced.
 */
class FileStore : public PersistenceSink {
public:
    // Empty index_path = "<directory>/notes.idx"
    explicit FileStore(const std::string& directory, const std::string& index_path = "");

    SaveResult save(const std::string& filename, const Bytes& bytes) override;

    const std::string& directory() const { return directory_; }
    NoteIndex& index() { return index_; }

    // Plain file name only: no separators, no "."/"..", no control chars
    static bool isSafeFilename(const std::string& name);

private:
    std::string directory_;
    NoteIndex index_;

    static std::string defaultIndexPath(const std::string& directory);
};

} // namespace storage
} // namespace ramble
