#pragma once

#include "control_message.hpp"
#include "ramble/types.hpp"

namespace ramble {
namespace protocol {

enum class FrameKind : uint8_t {
    CONTROL,    // Protocol text (SYNC_START, FILE:..., etc.)
    PAYLOAD     // Raw file bytes
};

const char* frameKindToString(FrameKind kind);

// One classified notification from the data channel
struct Frame {
    FrameKind kind = FrameKind::PAYLOAD;
    ControlMessage control;     // CONTROL only
    Bytes payload;              // PAYLOAD only

    bool isControl() const { return kind == FrameKind::CONTROL; }
    bool isPayload() const { return kind == FrameKind::PAYLOAD; }
};

/**
 * Frame Classifier
 *
 * The peripheral multiplexes protocol text and file bytes on one notify
 * characteristic with no type tag or length prefix. A chunk is treated as
 * control text iff it is shorter than wire::CONTROL_MAX_LENGTH and every
 * byte is printable ASCII (32-126) or TAB/LF/CR.
 *
 * Known limitation: a short final audio chunk that happens to be all
 * printable is misrouted as control. The firmware framing is fixed, so the
 * heuristic is kept as-is.
 */

// True if every byte is printable ASCII or TAB/LF/CR (empty -> true)
bool looksLikeText(ByteSpan chunk);

// Label only, no parsing
FrameKind classifyKind(ByteSpan chunk);

// Label and, for control frames, decode the text
Frame classify(ByteSpan chunk);

} // namespace protocol
} // namespace ramble
