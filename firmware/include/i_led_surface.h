#pragma once
// =====================================================
// LED Surface Interface
// =====================================================
// Hardware sink for pixel colors. set() only stages a
// pixel; flush() pushes staged pixels out to the strips
// and blocks for the duration of the transfer, so only
// the flush worker on core 1 may call it.
// =====================================================

#include <stdint.h>
#include "led_color.h"
#include "pin_map.h"

class ILedSurface {
public:
    virtual ~ILedSurface() = default;

    // Allocate and start the strips. False if any strip failed.
    virtual bool begin() = 0;

    // Stage one pixel. False if the pin's strip is unavailable.
    virtual bool set(int32_t pin, LedColor color) = 0;

    // Show every strip touched since the last flush.
    // False if any of those strips could not be shown.
    virtual bool flush() = 0;
};

// Factory function to create the surface (platform-specific)
ILedSurface* createLedSurface(const PinMap& pins);
