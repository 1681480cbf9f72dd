#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ramble {

// Core types
using Bytes = std::vector<uint8_t>;            // Chunk / file payload
using ByteSpan = std::span<const uint8_t>;     // Zero-copy view of a chunk

// Wire constants shared with the peripheral firmware
namespace wire {

constexpr uint8_t ACK_BYTE = 0x06;             // ASCII ACK, one per header/chunk

// Control frames are always shorter than this; anything at or above is payload
constexpr size_t CONTROL_MAX_LENGTH = 100;

// Commands (phone -> peripheral)
constexpr const char* CMD_SYNC = "SYNC";
constexpr const char* CMD_DELETE = "DELETE";
constexpr const char* CMD_PING = "PING";
constexpr const char* CMD_TEST = "TEST";

// Control vocabulary (peripheral -> phone)
constexpr const char* MSG_SYNC_START = "SYNC_START";
constexpr const char* MSG_SYNC_COMPLETE = "SYNC_COMPLETE";
constexpr const char* MSG_PONG = "PONG";
constexpr const char* PREFIX_FILE = "FILE:";
constexpr const char* PREFIX_ERROR = "ERROR:";
constexpr const char* PREFIX_STATUS = "STATUS:";

// Sent by the firmware, forwarded verbatim as status
constexpr const char* MSG_LIST_COMPLETE = "LIST_COMPLETE";
constexpr const char* MSG_DELETE_COMPLETE = "DELETE_COMPLETE";

} // namespace wire

// Default GATT layout of the peripheral
namespace gatt {

constexpr const char* SERVICE_UUID = "4fafc201-1fb5-459e-8fcc-c5c9c331914b";
constexpr const char* COMMAND_CHAR_UUID = "beb5483e-36e1-4688-b7f5-ea07361b26a8";  // Write
constexpr const char* DATA_CHAR_UUID = "af0badb1-5b99-43cd-917a-a77bc549e970";     // Notify

} // namespace gatt

inline Bytes toBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline std::string toText(ByteSpan data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace ramble
