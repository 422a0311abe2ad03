#pragma once
// =====================================================
// Frame Codec
// =====================================================
// Extracts '#'-delimited frames from the detection
// device byte stream:  #DETECTED:7#  #STOP#  #12,13#
//
// - A frame is the shortest "#...#" with no newline
//   inside. An opener followed by '\n' before the next
//   '#' is abandoned.
// - Bytes up to the end of each extracted frame are
//   dropped; a trailing partial frame is kept.
// - If the buffer fills up without a complete frame it
//   is discarded (desync recovery).
// =====================================================

#include <stdint.h>
#include <stddef.h>

constexpr size_t FRAME_BUFFER_MAX = 4096;

enum class FrameStatus : uint8_t {
    None,       // no complete frame buffered
    Frame,      // payload written
    Oversized,  // frame dropped, payload did not fit
    Desync,     // buffer full with no frame, discarded
};

class FrameCodec {
public:
    FrameCodec();

    // Copy as many bytes as fit. Returns the number consumed;
    // call next() until None before appending the remainder.
    size_t append(const uint8_t* data, size_t len);

    // Extract the earliest frame. The payload is trimmed of
    // surrounding whitespace and NUL-terminated.
    FrameStatus next(char* payload, size_t payloadSize);

    void clear();

    size_t buffered() const { return _len; }
    uint32_t desyncCount() const { return _desyncs; }

private:
    void consume(size_t count);

    char _buf[FRAME_BUFFER_MAX];
    size_t _len;
    uint32_t _desyncs;
};
