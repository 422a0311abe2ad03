#pragma once
#include <stdint.h>
#include <stddef.h>
#include "platform_device.h"

// Controller id reported to the host in HELLO:
// the board UID as uppercase hex, flash id byte order
constexpr size_t DEVICE_ID_HEX_LEN = PLATFORM_DEVICE_UID_SIZE * 2;

// out must hold DEVICE_ID_HEX_LEN + 1 chars
void formatDeviceId(char out[DEVICE_ID_HEX_LEN + 1]);
