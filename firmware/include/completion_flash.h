#pragma once
// =====================================================
// Completion Flash
// =====================================================
// Flashes pin ranges green/off for COMPLETION_FLASH_CYCLES
// cycles once a block is complete. poll() reports when
// the last off phase has elapsed.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "i_pin_renderer.h"

constexpr uint8_t COMPLETION_FLASH_CYCLES = 3;
constexpr size_t COMPLETION_MAX_RANGES = 64;

struct PinRange {
    int32_t first;
    int32_t last;   // inclusive
};

class CompletionFlash {
public:
    CompletionFlash();

    // Overlapping ranges are allowed. False if count is 0 or too many.
    bool start(const PinRange* ranges, size_t count, uint32_t nowMs);

    // Returns true exactly once, when the sequence has finished
    bool poll(uint32_t nowMs, uint32_t intervalMs, IPinRenderer& renderer);

    // Abort without rendering; the caller resets the LEDs
    void cancel();

    bool isRunning() const { return _phase != Phase::Stopped; }
    uint8_t cycle() const { return _cycle; }

private:
    enum class Phase : uint8_t {
        Stopped,
        Start,
        GreenOn,
        GreenOff,
    };

    void renderAll(LedColor color, IPinRenderer& renderer);

    PinRange _ranges[COMPLETION_MAX_RANGES];
    size_t _count;
    Phase _phase;
    uint8_t _cycle;
    uint32_t _dueMs;
};
