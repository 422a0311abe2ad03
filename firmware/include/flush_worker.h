#pragma once
// =====================================================
// Flush Worker
// =====================================================
// Core 1 loop body. Drains staged colors from the
// LedFrame into the LED surface and shows the strips.
// The frame lock is held only while copying changes
// out; the blocking flush runs without it.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "i_led_surface.h"
#include "led_frame.h"

class FlushWorker {
public:
    FlushWorker(ILedSurface& surface, LedFrame& frame);

    bool begin();

    // One pass: apply all pending changes, then flush once.
    // Returns the number of pixels applied.
    size_t service();

    uint32_t pixelFailures() const { return _pixelFailures; }
    uint32_t flushFailures() const { return _flushFailures; }
    uint32_t flushCount() const { return _flushCount; }

private:
    static constexpr size_t BATCH_SIZE = 64;

    ILedSurface& _surface;
    LedFrame& _frame;
    PixelChange _batch[BATCH_SIZE];

    uint32_t _pixelFailures = 0;
    uint32_t _flushFailures = 0;
    uint32_t _flushCount = 0;
};
