#include "timeout_blinker.h"
#include "event_log.h"

TimeoutBlinker::TimeoutBlinker()
    : _count(0)
    , _phase(Phase::Stopped)
    , _dueMs(0)
{
}

bool TimeoutBlinker::arm(const int32_t* pins, size_t count, uint32_t nowMs) {
    if (count > TIMEOUT_BLINK_MAX_PINS)
        return false;

    _count = 0;
    for (size_t i = 0; i < count; ++i) {
        if (contains(pins[i]))
            continue;
        _entries[_count].pin = pins[i];
        _entries[_count].armedMs = nowMs;
        _count++;
        log_info("Added LED %ld to active blinking list", (long)pins[i]);
    }
    _phase = Phase::Start;
    _dueMs = nowMs;
    return true;
}

bool TimeoutBlinker::confirm(int32_t pin, IPinRenderer& renderer) {
    for (size_t i = 0; i < _count; ++i) {
        if (_entries[i].pin == pin) {
            removeAt(i);
            renderer.renderPin(pin, LedColor::Off);
            log_info("LED %ld confirmed", (long)pin);
            return true;
        }
    }
    return false;
}

void TimeoutBlinker::poll(uint32_t nowMs, bool blockActive, const TimeoutBlinkTiming& timing,
                          IPinRenderer& renderer) {
    for (;;) {
        switch (_phase) {
            case Phase::Start: {
                size_t i = 0;
                while (i < _count) {
                    if (nowMs - _entries[i].armedMs > timing.timeoutMs) {
                        int32_t pin = _entries[i].pin;
                        removeAt(i);
                        renderer.renderPin(pin, LedColor::Off);
                        log_info("LED %ld turned off due to timeout", (long)pin);
                        continue;
                    }
                    i++;
                }

                if (_count == 0 && !blockActive) {
                    log_info("No active LEDs or blocks left to blink, stopping blink loop");
                    stop(renderer);
                    return;
                }

                for (size_t k = 0; k < _count; ++k) {
                    renderer.renderPin(_entries[k].pin, LedColor::Red);
                }
                _dueMs = nowMs + timing.intervalMs;
                _phase = Phase::RedOn;
                break;
            }

            case Phase::RedOn:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return;
                for (size_t k = 0; k < _count; ++k) {
                    renderer.renderPin(_entries[k].pin, LedColor::Off);
                }
                _dueMs = nowMs + timing.intervalMs;
                _phase = Phase::RedOff;
                break;

            case Phase::RedOff:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return;
                _phase = Phase::Start;
                break;

            case Phase::Stopped:
            default:
                return;
        }
    }
}

void TimeoutBlinker::cancel(IPinRenderer& renderer) {
    if (_phase == Phase::Stopped && _count == 0)
        return;
    log_info("Blink loop cancelled");
    stop(renderer);
}

bool TimeoutBlinker::contains(int32_t pin) const {
    for (size_t i = 0; i < _count; ++i) {
        if (_entries[i].pin == pin)
            return true;
    }
    return false;
}

void TimeoutBlinker::removeAt(size_t i) {
    for (size_t k = i + 1; k < _count; ++k) {
        _entries[k - 1] = _entries[k];
    }
    _count--;
}

void TimeoutBlinker::stop(IPinRenderer& renderer) {
    for (size_t k = 0; k < _count; ++k) {
        renderer.renderPin(_entries[k].pin, LedColor::Off);
    }
    _count = 0;
    _phase = Phase::Stopped;
}
