#pragma once
// =====================================================
// Board Configuration
// =====================================================
// Central location for LED strip geometry and pin
// assignments. Override any value via build flags:
//   build_flags = -DPICKLIGHT_LEDS_PER_STRIP=60
// =====================================================

#include <stdint.h>

#ifdef ARDUINO
#include <Arduino.h>
#endif

// =====================================================
// LED Strip Geometry
// =====================================================
// Pins are numbered 1..(STRIP_COUNT * LEDS_PER_STRIP)
// across all strips, strip 0 first.

#ifndef PICKLIGHT_STRIP_COUNT
#define PICKLIGHT_STRIP_COUNT 2
#endif

#ifndef PICKLIGHT_LEDS_PER_STRIP
#define PICKLIGHT_LEDS_PER_STRIP 69
#endif

// LEDs belonging to one shelf (flashed on block completion)
#ifndef PICKLIGHT_SHELF_LED_COUNT
#define PICKLIGHT_SHELF_LED_COUNT 69
#endif

// =====================================================
// LED Strip Data Pins
// =====================================================

#ifndef PICKLIGHT_STRIP0_PIN
#define PICKLIGHT_STRIP0_PIN 2    // GP2
#endif

#ifndef PICKLIGHT_STRIP1_PIN
#define PICKLIGHT_STRIP1_PIN 3    // GP3
#endif

#ifndef PICKLIGHT_STRIP2_PIN
#define PICKLIGHT_STRIP2_PIN 6    // GP6
#endif

#ifndef PICKLIGHT_STRIP3_PIN
#define PICKLIGHT_STRIP3_PIN 7    // GP7
#endif

// =====================================================
// Detection Device UART (Serial1)
// =====================================================

#ifndef PICKLIGHT_DEVICE_TX_PIN
#define PICKLIGHT_DEVICE_TX_PIN 4  // GP4 = UART1 TX
#endif

#ifndef PICKLIGHT_DEVICE_RX_PIN
#define PICKLIGHT_DEVICE_RX_PIN 5  // GP5 = UART1 RX
#endif

#ifndef PICKLIGHT_DEVICE_BAUD
#define PICKLIGHT_DEVICE_BAUD 9600
#endif

// =====================================================
// Host Link (USB CDC)
// =====================================================

#ifndef PICKLIGHT_HOST_BAUD
#define PICKLIGHT_HOST_BAUD 115200
#endif
