#include "file_store.hpp"
#include "ramble/logging.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ramble {
namespace storage {

// =============================================================================
// NOTE INDEX
// =============================================================================

NoteIndex::NoteIndex(const std::string& path)
    : path_(path)
{
}

bool NoteIndex::append(const NoteRecord& record, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            error = "cannot create index directory: " + ec.message();
            return false;
        }
    }

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        error = "cannot open index " + path_;
        return false;
    }

    file << record.filename << '\t'
         << record.timestamp << '\t'
         << (record.transcribed ? 1 : 0) << '\t'
         << record.audio_path << '\n';
    file.flush();

    if (!file) {
        error = "write to index " + path_ + " failed";
        return false;
    }
    return true;
}

std::vector<NoteRecord> NoteIndex::load() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<NoteRecord> records;
    std::ifstream file(path_);
    if (!file.is_open()) {
        return records;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, '\t')) {
            fields.push_back(field);
        }
        if (fields.size() != 4) continue;

        NoteRecord record;
        record.filename = fields[0];
        try {
            record.timestamp = std::stoll(fields[1]);
        } catch (const std::exception&) {
            LOG_STORE(WARN, "Index: bad timestamp for %s, record skipped", fields[0].c_str());
            continue;
        }
        record.transcribed = (fields[2] == "1");
        record.audio_path = fields[3];
        records.push_back(std::move(record));
    }
    return records;
}

// =============================================================================
// FILE STORE
// =============================================================================

FileStore::FileStore(const std::string& directory, const std::string& index_path)
    : directory_(directory)
    , index_(index_path.empty() ? defaultIndexPath(directory) : index_path)
{
}

std::string FileStore::defaultIndexPath(const std::string& directory) {
    return (fs::path(directory) / "notes.idx").string();
}

bool FileStore::isSafeFilename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 32 || uc == 127) return false;
    }
    return true;
}

SaveResult FileStore::save(const std::string& filename, const Bytes& bytes) {
    if (!isSafeFilename(filename)) {
        LOG_STORE(ERROR, "Store: Refusing unsafe filename '%s'", filename.c_str());
        return SaveResult::failure("invalid filename '" + filename + "'");
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        LOG_STORE(ERROR, "Store: Cannot create %s: %s", directory_.c_str(), ec.message().c_str());
        return SaveResult::failure("cannot create directory: " + ec.message());
    }

    fs::path final_path = fs::path(directory_) / filename;
    fs::path part_path = final_path;
    part_path += ".part";

    {
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_STORE(ERROR, "Store: Cannot open %s", part_path.string().c_str());
            return SaveResult::failure("cannot open " + part_path.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(part_path, ec);
            LOG_STORE(ERROR, "Store: Write failed for %s", part_path.string().c_str());
            return SaveResult::failure("write failed for " + filename);
        }
    }

    fs::rename(part_path, final_path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(part_path, rm_ec);
        LOG_STORE(ERROR, "Store: Rename to %s failed: %s",
                  final_path.string().c_str(), ec.message().c_str());
        return SaveResult::failure("rename failed: " + ec.message());
    }

    NoteRecord record;
    record.filename = filename;
    record.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    record.transcribed = false;
    record.audio_path = final_path.string();

    std::string index_error;
    if (!index_.append(record, index_error)) {
        // Audio is on disk but the app will not list it; report as a failure
        LOG_STORE(ERROR, "Store: Saved %s but index update failed: %s",
                  filename.c_str(), index_error.c_str());
        return SaveResult::failure(index_error);
    }

    LOG_STORE(INFO, "Store: Saved %s (%zu bytes) -> %s",
              filename.c_str(), bytes.size(), record.audio_path.c_str());
    return SaveResult::success(record.audio_path);
}

} // namespace storage
} // namespace ramble
