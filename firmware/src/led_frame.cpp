#include "led_frame.h"
#include "platform_lock.h"

LedFrame::LedFrame(const PinMap& pins)
    : _pins(pins)
    , _dirtyCount(0)
{
    for (size_t i = 0; i <= PIN_MAP_MAX_PINS; ++i) {
        _colors[i] = LedColor::Off;
        _dirty[i] = false;
    }
}

bool LedFrame::set(int32_t pin, LedColor color) {
    if (!_pins.isValid(pin))
        return false;

    PlatformLockGuard guard(PlatformLock::Frame);
    _colors[pin] = color;
    if (!_dirty[pin]) {
        _dirty[pin] = true;
        _dirtyCount++;
    }
    return true;
}

void LedFrame::fill(LedColor color) {
    const int32_t total = _pins.totalPins();

    PlatformLockGuard guard(PlatformLock::Frame);
    for (int32_t pin = 1; pin <= total; ++pin) {
        _colors[pin] = color;
        _dirty[pin] = true;
    }
    _dirtyCount = static_cast<size_t>(total);
}

LedColor LedFrame::colorOf(int32_t pin) const {
    if (!_pins.isValid(pin))
        return LedColor::Off;

    PlatformLockGuard guard(PlatformLock::Frame);
    return _colors[pin];
}

bool LedFrame::hasChanges() const {
    PlatformLockGuard guard(PlatformLock::Frame);
    return _dirtyCount > 0;
}

size_t LedFrame::takeChanges(PixelChange* out, size_t maxCount) {
    const int32_t total = _pins.totalPins();
    size_t n = 0;

    PlatformLockGuard guard(PlatformLock::Frame);
    for (int32_t pin = 1; pin <= total && n < maxCount && _dirtyCount > 0; ++pin) {
        if (!_dirty[pin])
            continue;
        _dirty[pin] = false;
        _dirtyCount--;
        out[n].pin = pin;
        out[n].color = _colors[pin];
        n++;
    }
    return n;
}
