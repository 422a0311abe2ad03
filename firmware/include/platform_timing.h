#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// Millisecond clock shared by the protocol, the engine
// and its blink tasks. All deadlines are compared with
// wrap-safe subtraction: (int32_t)(deadline - now).
// =====================================================

// Once, from setup()
void platform_timing_init();

// Milliseconds since boot, wrapping at 2^32
uint32_t platform_millis();

// Blocking wait, used for the loop idle and settings writes
void platform_delay_ms(uint32_t ms);
