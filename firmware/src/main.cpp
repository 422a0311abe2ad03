#include <Arduino.h>
#include "application.h"
#include "platform_lock.h"

Application gApp;

// Set by core 0 once every component exists
static volatile bool g_core0Ready = false;

void setup() {
    platform_lock_init();
    gApp.init();
    g_core0Ready = true;
}

void loop() {
    gApp.loop();
}

void setup1() {
    while (!g_core0Ready) {
        delay(1);
    }
    gApp.initCore1();
}

void loop1() {
    gApp.loopCore1();
}
