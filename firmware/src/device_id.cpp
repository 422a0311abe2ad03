#include "device_id.h"

static const char HEX_DIGITS[] = "0123456789ABCDEF";

void formatDeviceId(char out[DEVICE_ID_HEX_LEN + 1]) {
    uint8_t uid[PLATFORM_DEVICE_UID_SIZE];
    platform_get_device_uid(uid);

    char* p = out;
    for (uint8_t b : uid) {
        *p++ = HEX_DIGITS[b >> 4];
        *p++ = HEX_DIGITS[b & 0x0F];
    }
    *p = '\0';
}
