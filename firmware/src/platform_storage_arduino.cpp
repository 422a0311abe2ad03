// Platform storage implementation for arduino-pico (flash-emulated EEPROM)
#include "platform_storage.h"
#include <EEPROM.h>
#include <cstddef>  // for size_t

static size_t g_storage_size = 0;

bool platform_storage_begin(size_t size) {
    // RP2040 EEPROM emulation accepts 256..4096 bytes
    if (size < 256 || size > 4096) {
        return false;
    }
    g_storage_size = size;
    EEPROM.begin(size);
    return true;
}

uint8_t platform_storage_read(size_t address) {
    if (address >= g_storage_size) {
        return 0;
    }
    return EEPROM.read(address);
}

void platform_storage_write(size_t address, uint8_t value) {
    if (address >= g_storage_size) {
        return;
    }
    EEPROM.write(address, value);
}

bool platform_storage_commit() {
    // Erases and reprograms the EEPROM sector; skipped by the core when nothing changed
    return EEPROM.commit();
}
