// Platform host serial implementation for arduino-pico (USB CDC)
#include "platform_serial.h"
#include <Arduino.h>

void platform_serial_begin(uint32_t baud) {
    Serial.begin(baud);
}

bool platform_serial_connected() {
    // SerialUSB reports true only while DTR is asserted by the host
    return static_cast<bool>(Serial);
}

int platform_serial_available() {
    return Serial.available();
}

int platform_serial_read() {
    if (Serial.available() > 0) {
        return Serial.read();
    }
    return -1;
}

void platform_serial_println(const char* str) {
    Serial.println(str);
}
