#include "frame_classifier.hpp"

namespace ramble {
namespace protocol {

const char* frameKindToString(FrameKind kind) {
    switch (kind) {
        case FrameKind::CONTROL: return "CONTROL";
        case FrameKind::PAYLOAD: return "PAYLOAD";
        default: return "UNKNOWN";
    }
}

bool looksLikeText(ByteSpan chunk) {
    for (uint8_t byte : chunk) {
        if (byte == '\t' || byte == '\n' || byte == '\r') continue;
        if (byte < 32 || byte > 126) return false;
    }
    return true;
}

FrameKind classifyKind(ByteSpan chunk) {
    if (chunk.size() < wire::CONTROL_MAX_LENGTH && looksLikeText(chunk)) {
        return FrameKind::CONTROL;
    }
    return FrameKind::PAYLOAD;
}

Frame classify(ByteSpan chunk) {
    Frame frame;
    frame.kind = classifyKind(chunk);

    if (frame.kind == FrameKind::CONTROL) {
        frame.control = parseControl(toText(chunk));
    } else {
        frame.payload.assign(chunk.begin(), chunk.end());
    }
    return frame;
}

} // namespace protocol
} // namespace ramble
