#pragma once
// =====================================================
// LED Frame
// =====================================================
// Staged pin colors shared between the engine (core 0,
// writer) and the flush worker (core 1, reader). Every
// set() marks the pin dirty; takeChanges() drains dirty
// pins for the flush worker. Guarded by PlatformLock::Frame.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "led_color.h"
#include "pin_map.h"

struct PixelChange {
    int32_t pin;
    LedColor color;
};

class LedFrame {
public:
    explicit LedFrame(const PinMap& pins);

    // Returns false when pin is outside the strips
    bool set(int32_t pin, LedColor color);

    // Set every pin on every strip
    void fill(LedColor color);

    LedColor colorOf(int32_t pin) const;

    bool hasChanges() const;

    // Move up to maxCount dirty pins into out, in pin order.
    // Returns the number written.
    size_t takeChanges(PixelChange* out, size_t maxCount);

private:
    const PinMap& _pins;
    LedColor _colors[PIN_MAP_MAX_PINS + 1];   // index 0 unused
    bool _dirty[PIN_MAP_MAX_PINS + 1];
    size_t _dirtyCount;
};
