#pragma once
#include <stdint.h>

// Tells the detection device which pin is armed
class IPinAnnouncer {
public:
    virtual ~IPinAnnouncer() = default;
    virtual void announceActivePin(int32_t pin) = 0;
};
