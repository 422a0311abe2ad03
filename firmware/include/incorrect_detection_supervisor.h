#pragma once
// =====================================================
// Incorrect Detection Supervisor
// =====================================================
// Blinks one wrongly touched pin red until the picker
// stops touching it or it becomes the expected pin.
//
//   loop: expected? -> exit
//         red, wait interval, off, wait interval
//         no detection for idleMs? -> exit
//
// Every exit, including cancel(), leaves the pin off
// (unless it is now the expected pin) and frees the slot.
// =====================================================

#include <stdint.h>
#include "i_pin_renderer.h"

struct SupervisorTiming {
    uint32_t blinkIntervalMs;
    uint32_t idleMs;
};

class IncorrectDetectionSupervisor {
public:
    IncorrectDetectionSupervisor();

    // Claim this slot for pin. Does not render; poll() right after.
    void start(int32_t pin, uint32_t nowMs);

    // Record another wrong detection of the same pin
    void touch(uint32_t nowMs);

    // Advance the blink. expectedPin is the block's current
    // expected pin (PIN_NONE if none). Returns false once finished.
    bool poll(uint32_t nowMs, int32_t expectedPin, const SupervisorTiming& timing, IPinRenderer& renderer);

    // Stop now and run the exit cleanup
    void cancel(int32_t expectedPin, IPinRenderer& renderer);

    bool isActive() const { return _phase != Phase::Idle; }
    int32_t pin() const { return _pin; }
    uint32_t lastDetectMs() const { return _lastDetectMs; }

private:
    enum class Phase : uint8_t {
        Idle,     // slot free
        Start,    // top of the loop
        RedOn,
        RedOff,
    };

    void finish(int32_t expectedPin, IPinRenderer& renderer);

    Phase _phase;
    int32_t _pin;
    uint32_t _lastDetectMs;
    uint32_t _dueMs;
};
