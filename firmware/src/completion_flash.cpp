#include "completion_flash.h"
#include "event_log.h"

CompletionFlash::CompletionFlash()
    : _count(0)
    , _phase(Phase::Stopped)
    , _cycle(0)
    , _dueMs(0)
{
}

bool CompletionFlash::start(const PinRange* ranges, size_t count, uint32_t nowMs) {
    if (count == 0 || count > COMPLETION_MAX_RANGES)
        return false;

    for (size_t i = 0; i < count; ++i) {
        _ranges[i] = ranges[i];
    }
    _count = count;
    _cycle = 0;
    _dueMs = nowMs;
    _phase = Phase::Start;
    return true;
}

bool CompletionFlash::poll(uint32_t nowMs, uint32_t intervalMs, IPinRenderer& renderer) {
    for (;;) {
        switch (_phase) {
            case Phase::Start:
                if (_cycle >= COMPLETION_FLASH_CYCLES) {
                    _phase = Phase::Stopped;
                    return true;
                }
                log_info("Completion flash cycle %u/%u", (unsigned)(_cycle + 1), (unsigned)COMPLETION_FLASH_CYCLES);
                renderAll(LedColor::Green, renderer);
                _dueMs = nowMs + intervalMs;
                _phase = Phase::GreenOn;
                break;

            case Phase::GreenOn:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return false;
                renderAll(LedColor::Off, renderer);
                _dueMs = nowMs + intervalMs;
                _phase = Phase::GreenOff;
                break;

            case Phase::GreenOff:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return false;
                _cycle++;
                _phase = Phase::Start;
                break;

            case Phase::Stopped:
            default:
                return false;
        }
    }
}

void CompletionFlash::cancel() {
    _phase = Phase::Stopped;
    _count = 0;
}

void CompletionFlash::renderAll(LedColor color, IPinRenderer& renderer) {
    for (size_t i = 0; i < _count; ++i) {
        for (int32_t pin = _ranges[i].first; pin <= _ranges[i].last; ++pin) {
            renderer.renderPin(pin, color);
        }
    }
}
