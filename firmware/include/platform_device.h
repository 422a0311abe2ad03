#pragma once
// =====================================================
// Platform Device Abstraction
// =====================================================
// Provides platform-independent access to device-specific
// hardware features like unique ID.
// =====================================================

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// RP2040 board id = 64 bits = 8 bytes (read from the QSPI flash chip)
#define PLATFORM_DEVICE_UID_SIZE 8

// =====================================================
// Device Unique ID
// =====================================================

// Read the board unique ID (8 bytes, in flash id order)
void platform_get_device_uid(uint8_t out[PLATFORM_DEVICE_UID_SIZE]);

#ifdef __cplusplus
}
#endif
