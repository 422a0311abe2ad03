#pragma once
#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

// =====================================================
// Platform Storage Abstraction
// =====================================================
// Byte-addressed non-volatile storage. On RP2040 the
// Arduino EEPROM library emulates it in the last flash
// sector: writes land in a RAM copy and reach flash
// only on platform_storage_commit().
// =====================================================

// Reserve size bytes (256..4096 on RP2040); false if out of range
bool platform_storage_begin(size_t size);

// Out-of-range reads return 0
uint8_t platform_storage_read(size_t address);

// Out-of-range writes are dropped
void platform_storage_write(size_t address, uint8_t value);

// Program the RAM copy into flash; false if the write failed
bool platform_storage_commit();
