#include "pin_map.h"

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

PinParseResult parsePinText(const char* text, size_t len, int32_t& out) {
    size_t begin = 0;
    size_t end = len;
    while (begin < end && isSpace(text[begin])) begin++;
    while (end > begin && isSpace(text[end - 1])) end--;

    if (begin == end)
        return PinParseResult::NotANumber;

    bool negative = false;
    if (text[begin] == '+' || text[begin] == '-') {
        negative = (text[begin] == '-');
        begin++;
        if (begin == end)
            return PinParseResult::NotANumber;
    }

    int64_t value = 0;
    bool overflow = false;
    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c < '0' || c > '9')
            return PinParseResult::NotANumber;
        if (!overflow) {
            value = value * 10 + (c - '0');
            if (value > static_cast<int64_t>(INT32_MAX) + 1)
                overflow = true;
        }
    }

    if (negative)
        value = -value;
    if (overflow || value > INT32_MAX || value < INT32_MIN)
        return PinParseResult::OutOfRange;

    out = static_cast<int32_t>(value);
    return PinParseResult::Ok;
}

PinMap::PinMap(uint8_t stripCount, uint16_t ledsPerStrip, uint16_t shelfLedCount)
    : _stripCount(stripCount)
    , _ledsPerStrip(ledsPerStrip)
    , _shelfLedCount(shelfLedCount)
    , _totalPins(0)
{
    if (_stripCount > PIN_MAP_MAX_STRIPS)
        _stripCount = PIN_MAP_MAX_STRIPS;
    if (_ledsPerStrip == 0 || _stripCount == 0) {
        _ledsPerStrip = 0;
        return;
    }

    uint32_t total = static_cast<uint32_t>(_stripCount) * _ledsPerStrip;
    if (total > PIN_MAP_MAX_PINS) {
        // keep whole strips only
        _stripCount = static_cast<uint8_t>(PIN_MAP_MAX_PINS / _ledsPerStrip);
        if (_stripCount == 0) {
            _stripCount = 1;
            _ledsPerStrip = PIN_MAP_MAX_PINS;
        }
        total = static_cast<uint32_t>(_stripCount) * _ledsPerStrip;
    }
    _totalPins = static_cast<uint16_t>(total);
}

bool PinMap::isValid(int32_t pin) const {
    return pin >= 1 && pin <= static_cast<int32_t>(_totalPins);
}

bool PinMap::resolve(int32_t pin, PinLocation& out) const {
    if (!isValid(pin))
        return false;

    uint32_t index = static_cast<uint32_t>(pin - 1);
    out.strip  = static_cast<uint8_t>(index / _ledsPerStrip);
    out.offset = static_cast<uint16_t>(index % _ledsPerStrip);
    return true;
}

bool PinMap::shelfRange(int32_t controlled, int32_t& first, int32_t& last) const {
    int64_t lo = static_cast<int64_t>(controlled) + 1;
    int64_t hi = static_cast<int64_t>(controlled) + _shelfLedCount;

    if (lo < 1) lo = 1;
    if (hi > _totalPins) hi = _totalPins;
    if (_shelfLedCount == 0 || lo > hi)
        return false;

    first = static_cast<int32_t>(lo);
    last  = static_cast<int32_t>(hi);
    return true;
}
