#include "device_protocol.h"
#include "pin_map.h"
#include <stdio.h>
#include <string.h>

static const char DETECTED_PREFIX[] = "DETECTED:";

static bool equalsIgnoreCase(const char* a, const char* b) {
    while (*a && *b) {
        char ca = *a;
        char cb = *b;
        if (ca >= 'a' && ca <= 'z') ca = ca - 'a' + 'A';
        if (cb >= 'a' && cb <= 'z') cb = cb - 'a' + 'A';
        if (ca != cb)
            return false;
        ++a;
        ++b;
    }
    return *a == '\0' && *b == '\0';
}

void classifyDevicePayload(const char* payload, DeviceMessage& out) {
    out.type = DeviceMessageType::Unknown;
    out.pin = PIN_NONE;
    out.pinCount = 0;
    out.rejectedCount = 0;
    out.overflow = false;

    const size_t prefixLen = sizeof(DETECTED_PREFIX) - 1;
    if (strncmp(payload, DETECTED_PREFIX, prefixLen) == 0) {
        const char* value = payload + prefixLen;
        if (parsePinText(value, strlen(value), out.pin) == PinParseResult::Ok) {
            out.type = DeviceMessageType::Detected;
        } else {
            out.type = DeviceMessageType::InvalidDetection;
        }
        return;
    }

    if (equalsIgnoreCase(payload, "STOP")) {
        out.type = DeviceMessageType::Stop;
        return;
    }

    const char* item = payload;
    for (;;) {
        const char* comma = strchr(item, ',');
        size_t len = comma ? static_cast<size_t>(comma - item) : strlen(item);

        int32_t pin;
        if (parsePinText(item, len, pin) != PinParseResult::Ok) {
            out.rejectedCount++;
        } else if (out.pinCount < DEVICE_MAX_PIN_LIST) {
            out.pins[out.pinCount++] = pin;
        } else {
            out.overflow = true;
        }

        if (!comma)
            break;
        item = comma + 1;
    }

    if (out.pinCount > 0)
        out.type = DeviceMessageType::PinList;
}

static size_t finish(int written, size_t size) {
    if (written < 0 || static_cast<size_t>(written) >= size)
        return 0;
    return static_cast<size_t>(written);
}

size_t formatActivePinFrame(char* out, size_t size, int32_t pin) {
    return finish(snprintf(out, size, "#%ld#\n", (long)pin), size);
}

size_t formatCorrectAck(char* out, size_t size, int32_t pin) {
    return finish(snprintf(out, size, "#CORRECT:%ld#\n", (long)pin), size);
}

size_t formatFalseAck(char* out, size_t size, int32_t pin) {
    return finish(snprintf(out, size, "#FALSE:%ld#\n", (long)pin), size);
}

size_t formatInvalidDetectionAck(char* out, size_t size) {
    return finish(snprintf(out, size, "#INVALID_DETECTION#\n"), size);
}

size_t formatStopAck(char* out, size_t size) {
    return finish(snprintf(out, size, "#STOP#\n"), size);
}

size_t formatPinListAck(char* out, size_t size, const int32_t* pins, size_t count) {
    if (size < 2)
        return 0;

    size_t pos = 0;
    out[pos++] = '#';
    for (size_t i = 0; i < count; ++i) {
        int w = snprintf(out + pos, size - pos, i == 0 ? "%ld" : ",%ld", (long)pins[i]);
        if (w < 0 || static_cast<size_t>(w) >= size - pos)
            return 0;
        pos += static_cast<size_t>(w);
    }
    return finish(static_cast<int>(pos) + snprintf(out + pos, size - pos, "#\n"), size);
}
