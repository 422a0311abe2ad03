#pragma once
// =====================================================
// Timeout Blinker
// =====================================================
// Blinks a set of unconfirmed pins red. A pin that is
// not confirmed within timeoutMs of being armed is
// evicted and turned off. The loop ends by itself when
// no pins remain and no block is active.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "i_pin_renderer.h"

constexpr size_t TIMEOUT_BLINK_MAX_PINS = 16;

struct TimeoutBlinkTiming {
    uint32_t intervalMs;
    uint32_t timeoutMs;
};

class TimeoutBlinker {
public:
    TimeoutBlinker();

    // Start a new loop over pins. The previous loop must have been
    // cancelled. False if count exceeds TIMEOUT_BLINK_MAX_PINS.
    bool arm(const int32_t* pins, size_t count, uint32_t nowMs);

    // Remove a confirmed pin and turn it off. False if not armed.
    bool confirm(int32_t pin, IPinRenderer& renderer);

    void poll(uint32_t nowMs, bool blockActive, const TimeoutBlinkTiming& timing, IPinRenderer& renderer);

    // Stop the loop; held pins are turned off before returning
    void cancel(IPinRenderer& renderer);

    bool isRunning() const { return _phase != Phase::Stopped; }
    bool contains(int32_t pin) const;
    size_t count() const { return _count; }
    int32_t pinAt(size_t i) const { return _entries[i].pin; }

private:
    enum class Phase : uint8_t {
        Stopped,
        Start,
        RedOn,
        RedOff,
    };

    struct Entry {
        int32_t pin;
        uint32_t armedMs;
    };

    void removeAt(size_t i);
    void stop(IPinRenderer& renderer);

    Entry _entries[TIMEOUT_BLINK_MAX_PINS];
    size_t _count;
    Phase _phase;
    uint32_t _dueMs;
};
