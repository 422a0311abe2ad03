#include "flush_worker.h"
#include "event_log.h"

FlushWorker::FlushWorker(ILedSurface& surface, LedFrame& frame)
    : _surface(surface)
    , _frame(frame)
{
}

bool FlushWorker::begin() {
    if (!_surface.begin()) {
        log_error("LED surface started with unavailable strips");
        return false;
    }
    return true;
}

size_t FlushWorker::service() {
    size_t applied = 0;

    for (;;) {
        size_t n = _frame.takeChanges(_batch, BATCH_SIZE);
        if (n == 0)
            break;

        // A failed pixel must not hold back the rest of the batch
        for (size_t i = 0; i < n; ++i) {
            if (!_surface.set(_batch[i].pin, _batch[i].color)) {
                _pixelFailures++;
                log_error("LED %ld: write %s failed", (long)_batch[i].pin, ledColorName(_batch[i].color));
            }
        }
        applied += n;
    }

    if (applied == 0)
        return 0;

    _flushCount++;
    if (!_surface.flush()) {
        _flushFailures++;
        log_error("LED strip flush failed (%lu failures)", (unsigned long)_flushFailures);
    }
    return applied;
}
