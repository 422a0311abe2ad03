// Platform timing implementation for arduino-pico
#include "platform_timing.h"
#include <Arduino.h>

void platform_timing_init() {
    // millis() runs from the RP2040 64-bit timer, nothing to set up
}

uint32_t platform_millis() {
    return millis();
}

void platform_delay_ms(uint32_t ms) {
    delay(ms);
}
