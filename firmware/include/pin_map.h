#pragma once
// =====================================================
// Pin Map
// =====================================================
// A pin is the 1-based number of one LED across all
// strips laid end to end:
//   strip  = (pin - 1) / ledsPerStrip
//   offset = (pin - 1) % ledsPerStrip
// =====================================================

#include <stdint.h>
#include <stddef.h>

constexpr int32_t  PIN_NONE = 0;
constexpr uint8_t  PIN_MAP_MAX_STRIPS = 4;
constexpr uint16_t PIN_MAP_MAX_PINS = 512;

struct PinLocation {
    uint8_t strip;
    uint16_t offset;
};

enum class PinParseResult : uint8_t {
    Ok,
    NotANumber,
    OutOfRange,    // does not fit in int32_t
};

// Parse a decimal integer with optional sign, surrounded by optional
// whitespace (" 12 ", "+7", "-3"). len = number of chars to consider.
PinParseResult parsePinText(const char* text, size_t len, int32_t& out);

class PinMap {
public:
    // Geometry beyond PIN_MAP_MAX_* is clamped
    PinMap(uint8_t stripCount, uint16_t ledsPerStrip, uint16_t shelfLedCount);

    uint8_t stripCount() const { return _stripCount; }
    uint16_t ledsPerStrip() const { return _ledsPerStrip; }
    uint16_t shelfLedCount() const { return _shelfLedCount; }
    uint16_t totalPins() const { return _totalPins; }

    bool isValid(int32_t pin) const;
    bool resolve(int32_t pin, PinLocation& out) const;

    // LEDs of a shelf whose ids are offset by `controlled`:
    // [controlled + 1, controlled + shelfLedCount], clipped to valid pins.
    // Returns false when nothing of the range is on the strips.
    bool shelfRange(int32_t controlled, int32_t& first, int32_t& last) const;

private:
    uint8_t _stripCount;
    uint16_t _ledsPerStrip;
    uint16_t _shelfLedCount;
    uint16_t _totalPins;
};
