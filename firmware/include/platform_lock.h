#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Cross-Core Locks
// =====================================================
// Core 0 runs the protocol and the activation engine,
// core 1 pushes pixels to the strips. The two share the
// staged LED frame and the host serial line writer.
//
// Hold a lock only long enough to copy data in or out.
// Never log, flush a strip or wait on I/O while holding it.
// =====================================================

enum class PlatformLock : uint8_t {
    Frame = 0,   // staged LED colors (LedFrame)
    Log   = 1,   // host serial line writer
};

constexpr size_t PLATFORM_LOCK_COUNT = 2;

// Create all locks (call once on core 0 before core 1 starts)
void platform_lock_init();

void platform_lock_enter(PlatformLock lock);
void platform_lock_exit(PlatformLock lock);

// Scoped holder
class PlatformLockGuard {
public:
    explicit PlatformLockGuard(PlatformLock lock) : _lock(lock) {
        platform_lock_enter(_lock);
    }
    ~PlatformLockGuard() {
        platform_lock_exit(_lock);
    }

    PlatformLockGuard(const PlatformLockGuard&) = delete;
    PlatformLockGuard& operator=(const PlatformLockGuard&) = delete;

private:
    PlatformLock _lock;
};
