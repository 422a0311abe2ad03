#include "frame_codec.h"
#include <string.h>

static bool isTrimmable(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

FrameCodec::FrameCodec()
    : _len(0)
    , _desyncs(0)
{
}

size_t FrameCodec::append(const uint8_t* data, size_t len) {
    size_t room = FRAME_BUFFER_MAX - _len;
    size_t n = len < room ? len : room;
    memcpy(_buf + _len, data, n);
    _len += n;
    return n;
}

FrameStatus FrameCodec::next(char* payload, size_t payloadSize) {
    size_t i = 0;
    while (i < _len) {
        if (_buf[i] != '#') {
            i++;
            continue;
        }

        // Look for the closing '#' of the opener at i
        size_t j = i + 1;
        while (j < _len && _buf[j] != '#' && _buf[j] != '\n')
            j++;

        if (j >= _len)
            break;   // partial frame, wait for more bytes

        if (_buf[j] == '\n') {
            // Opener abandoned; the next candidate starts after the newline
            i = j + 1;
            continue;
        }

        size_t begin = i + 1;
        size_t end = j;
        while (begin < end && isTrimmable(_buf[begin])) begin++;
        while (end > begin && isTrimmable(_buf[end - 1])) end--;

        size_t n = end - begin;
        if (n + 1 > payloadSize) {
            consume(j + 1);
            return FrameStatus::Oversized;
        }

        memcpy(payload, _buf + begin, n);
        payload[n] = '\0';
        consume(j + 1);
        return FrameStatus::Frame;
    }

    if (_len >= FRAME_BUFFER_MAX) {
        _len = 0;
        _desyncs++;
        return FrameStatus::Desync;
    }
    return FrameStatus::None;
}

void FrameCodec::clear() {
    _len = 0;
}

void FrameCodec::consume(size_t count) {
    if (count >= _len) {
        _len = 0;
        return;
    }
    memmove(_buf, _buf + count, _len - count);
    _len -= count;
}
