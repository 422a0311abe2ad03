#include "incorrect_detection_supervisor.h"
#include "event_log.h"
#include "pin_map.h"

IncorrectDetectionSupervisor::IncorrectDetectionSupervisor()
    : _phase(Phase::Idle)
    , _pin(PIN_NONE)
    , _lastDetectMs(0)
    , _dueMs(0)
{
}

void IncorrectDetectionSupervisor::start(int32_t pin, uint32_t nowMs) {
    _pin = pin;
    _lastDetectMs = nowMs;
    _dueMs = nowMs;
    _phase = Phase::Start;
}

void IncorrectDetectionSupervisor::touch(uint32_t nowMs) {
    _lastDetectMs = nowMs;
}

bool IncorrectDetectionSupervisor::poll(uint32_t nowMs, int32_t expectedPin,
                                        const SupervisorTiming& timing, IPinRenderer& renderer) {
    if (_phase == Phase::Idle)
        return false;

    // Several phases may fall due in one poll after a long stall
    for (;;) {
        switch (_phase) {
            case Phase::Start:
                if (_pin == expectedPin) {
                    log_info("LED %ld has become the expected LED, stopping red blink", (long)_pin);
                    finish(expectedPin, renderer);
                    return false;
                }
                renderer.renderPin(_pin, LedColor::Red);
                _dueMs = nowMs + timing.blinkIntervalMs;
                _phase = Phase::RedOn;
                break;

            case Phase::RedOn:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return true;
                renderer.renderPin(_pin, LedColor::Off);
                _dueMs = nowMs + timing.blinkIntervalMs;
                _phase = Phase::RedOff;
                break;

            case Phase::RedOff:
                if ((int32_t)(_dueMs - nowMs) > 0)
                    return true;
                if (nowMs - _lastDetectMs > timing.idleMs) {
                    finish(expectedPin, renderer);
                    return false;
                }
                _phase = Phase::Start;
                break;

            case Phase::Idle:
            default:
                return false;
        }
    }
}

void IncorrectDetectionSupervisor::cancel(int32_t expectedPin, IPinRenderer& renderer) {
    if (_phase == Phase::Idle)
        return;
    log_debug("Red blink for LED %ld cancelled", (long)_pin);
    finish(expectedPin, renderer);
}

void IncorrectDetectionSupervisor::finish(int32_t expectedPin, IPinRenderer& renderer) {
    if (_pin != expectedPin) {
        renderer.renderPin(_pin, LedColor::Off);
    }
    log_info("Stopped handling incorrect LED %ld", (long)_pin);
    _phase = Phase::Idle;
    _pin = PIN_NONE;
}
