// Platform cross-core locks for arduino-pico (pico SDK mutexes)
#include "platform_lock.h"
#include <pico/mutex.h>

static mutex_t g_locks[PLATFORM_LOCK_COUNT];

void platform_lock_init() {
    for (size_t i = 0; i < PLATFORM_LOCK_COUNT; ++i) {
        mutex_init(&g_locks[i]);
    }
}

void platform_lock_enter(PlatformLock lock) {
    mutex_enter_blocking(&g_locks[static_cast<size_t>(lock)]);
}

void platform_lock_exit(PlatformLock lock) {
    mutex_exit(&g_locks[static_cast<size_t>(lock)]);
}
