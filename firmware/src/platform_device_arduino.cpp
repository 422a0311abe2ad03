// =====================================================
// Platform Device - arduino-pico Implementation
// =====================================================
// The RP2040 has no on-die serial number; the pico SDK
// reads the 64-bit unique id of the attached QSPI flash.
// =====================================================

#include "platform_device.h"
#include <pico/unique_id.h>

static_assert(PICO_UNIQUE_BOARD_ID_SIZE_BYTES == PLATFORM_DEVICE_UID_SIZE,
              "board id size mismatch");

void platform_get_device_uid(uint8_t out[PLATFORM_DEVICE_UID_SIZE]) {
    pico_unique_board_id_t id;
    pico_get_unique_board_id(&id);

    for (size_t i = 0; i < PLATFORM_DEVICE_UID_SIZE; ++i) {
        out[i] = id.id[i];
    }
}
