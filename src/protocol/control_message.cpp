#include "control_message.hpp"
#include "ramble/types.hpp"
#include "ramble/logging.hpp"

#include <cctype>
#include <cstring>

namespace ramble {
namespace protocol {

// Helper: trim whitespace the firmware may append (println adds \r\n)
static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool startsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

// Strict unsigned decimal parse: digits only, no sign, no overflow
static bool parseSize(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;

    uint64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

ControlMessage ControlMessage::syncStart() {
    ControlMessage msg;
    msg.type = Type::SYNC_START;
    return msg;
}

ControlMessage ControlMessage::syncComplete() {
    ControlMessage msg;
    msg.type = Type::SYNC_COMPLETE;
    return msg;
}

ControlMessage ControlMessage::fileHeader(const std::string& name, uint64_t size) {
    ControlMessage msg;
    msg.type = Type::FILE_HEADER;
    msg.filename = name;
    msg.file_size = size;
    return msg;
}

ControlMessage ControlMessage::status(const std::string& text) {
    ControlMessage msg;
    msg.type = Type::STATUS;
    msg.text = text;
    return msg;
}

ControlMessage ControlMessage::error(const std::string& text) {
    ControlMessage msg;
    msg.type = Type::ERROR;
    msg.text = text;
    return msg;
}

ControlMessage ControlMessage::pong() {
    ControlMessage msg;
    msg.type = Type::PONG;
    return msg;
}

ControlMessage ControlMessage::unrecognized(const std::string& raw) {
    ControlMessage msg;
    msg.type = Type::UNRECOGNIZED;
    msg.text = raw;
    return msg;
}

std::string ControlMessage::describe() const {
    switch (type) {
        case Type::SYNC_START:    return wire::MSG_SYNC_START;
        case Type::SYNC_COMPLETE: return wire::MSG_SYNC_COMPLETE;
        case Type::FILE_HEADER:
            return std::string(wire::PREFIX_FILE) + filename + "," + std::to_string(file_size);
        case Type::STATUS:        return std::string(wire::PREFIX_STATUS) + text;
        case Type::ERROR:         return std::string(wire::PREFIX_ERROR) + text;
        case Type::PONG:          return wire::MSG_PONG;
        case Type::UNRECOGNIZED:
        default:                  return text;
    }
}

bool ControlMessage::operator==(const ControlMessage& other) const {
    return type == other.type && text == other.text &&
           filename == other.filename && file_size == other.file_size;
}

const char* controlTypeToString(ControlMessage::Type type) {
    switch (type) {
        case ControlMessage::Type::SYNC_START:    return "SYNC_START";
        case ControlMessage::Type::SYNC_COMPLETE: return "SYNC_COMPLETE";
        case ControlMessage::Type::FILE_HEADER:   return "FILE_HEADER";
        case ControlMessage::Type::STATUS:        return "STATUS";
        case ControlMessage::Type::ERROR:         return "ERROR";
        case ControlMessage::Type::PONG:          return "PONG";
        case ControlMessage::Type::UNRECOGNIZED:  return "UNRECOGNIZED";
        default: return "UNKNOWN";
    }
}

ControlMessage parseControl(const std::string& raw) {
    std::string text = trim(raw);

    // Exact matches take priority over prefixes
    if (text == wire::MSG_SYNC_START) {
        return ControlMessage::syncStart();
    }
    if (text == wire::MSG_SYNC_COMPLETE) {
        return ControlMessage::syncComplete();
    }
    if (text == wire::MSG_PONG) {
        return ControlMessage::pong();
    }

    if (startsWith(text, wire::PREFIX_FILE)) {
        std::string info = text.substr(std::strlen(wire::PREFIX_FILE));
        size_t comma = info.find(',');
        if (comma == std::string::npos) {
            LOG_PROTO(WARN, "Parser: FILE header without size: '%s'", text.c_str());
            return ControlMessage::unrecognized(text);
        }

        std::string name = info.substr(0, comma);
        uint64_t size = 0;
        if (name.empty() || !parseSize(info.substr(comma + 1), size)) {
            LOG_PROTO(WARN, "Parser: Malformed FILE header: '%s'", text.c_str());
            return ControlMessage::unrecognized(text);
        }
        return ControlMessage::fileHeader(name, size);
    }

    if (startsWith(text, wire::PREFIX_ERROR)) {
        return ControlMessage::error(text.substr(std::strlen(wire::PREFIX_ERROR)));
    }
    if (startsWith(text, wire::PREFIX_STATUS)) {
        return ControlMessage::status(text.substr(std::strlen(wire::PREFIX_STATUS)));
    }

    return ControlMessage::unrecognized(text);
}

} // namespace protocol
} // namespace ramble
