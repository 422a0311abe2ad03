#pragma once
#include <stdint.h>
#include "led_color.h"

// Target for the engine's pin color writes
class IPinRenderer {
public:
    virtual ~IPinRenderer() = default;
    virtual void renderPin(int32_t pin, LedColor color) = 0;
};
