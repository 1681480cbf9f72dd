#pragma once

#include <cstdint>
#include <string>

namespace ramble {
namespace protocol {

/**
 * Control message received on the data channel.
 *
 * Closed set: every text frame maps to exactly one of these types.
 * Malformed input is never an error, it becomes UNRECOGNIZED so a bad
 * header cannot take down the session.
 */
struct ControlMessage {
    enum class Type : uint8_t {
        SYNC_START,     // SYNC_START
        SYNC_COMPLETE,  // SYNC_COMPLETE
        FILE_HEADER,    // FILE:<name>,<size>
        STATUS,         // STATUS:<msg>
        ERROR,          // ERROR:<msg>
        PONG,           // PONG
        UNRECOGNIZED    // anything else (text holds the trimmed input)
    };

    Type type = Type::UNRECOGNIZED;
    std::string text;           // STATUS/ERROR remainder, or raw text when unrecognized
    std::string filename;       // FILE_HEADER only
    uint64_t file_size = 0;     // FILE_HEADER only

    static ControlMessage syncStart();
    static ControlMessage syncComplete();
    static ControlMessage fileHeader(const std::string& name, uint64_t size);
    static ControlMessage status(const std::string& msg);
    static ControlMessage error(const std::string& msg);
    static ControlMessage pong();
    static ControlMessage unrecognized(const std::string& raw);

    bool isFileHeader() const { return type == Type::FILE_HEADER; }

    // Human-readable form for logs and status forwarding
    std::string describe() const;

    bool operator==(const ControlMessage& other) const;
    bool operator!=(const ControlMessage& other) const { return !(*this == other); }
};

const char* controlTypeToString(ControlMessage::Type type);

// Decode a control frame's text. Leading/trailing whitespace is ignored.
ControlMessage parseControl(const std::string& text);

} // namespace protocol
} // namespace ramble
