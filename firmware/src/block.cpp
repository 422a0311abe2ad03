#include "block.h"
#include "event_log.h"
#include "pin_map.h"

Block::Block()
    : _count(0)
    , _index(0)
    , _trackedCount(0)
    , _timing{0, 0, 0}
    , _hasAdvanced(false)
    , _lastCorrectMs(0)
{
}

bool Block::load(const BlockStep* steps, size_t count, const BlockTiming& timing) {
    clear();
    if (count == 0 || count > BLOCK_MAX_STEPS)
        return false;

    for (size_t i = 0; i < count; ++i) {
        _steps[i] = steps[i];
    }
    _count = count;
    _timing = timing;
    return true;
}

void Block::clear() {
    _count = 0;
    _index = 0;
    _trackedCount = 0;
    _hasAdvanced = false;
    _lastCorrectMs = 0;
    for (size_t i = 0; i < BLOCK_MAX_STEPS; ++i) {
        _greenCounts[i] = 0;
    }
}

void Block::begin(IBlockHost& host) {
    if (_count == 0)
        return;

    const int32_t first = _steps[0].pin;
    _greenCounts[findStep(first)] = 1;
    host.renderPin(first, LedColor::Green);
    host.announceActivePin(first);

    for (size_t i = 1; i < _count; ++i) {
        int32_t pin = _steps[i].pin;
        host.renderPin(pin, greenCount(pin) > 0 ? LedColor::Green : LedColor::Off);
    }
}

BlockDetection Block::handleDetection(int32_t pin, uint32_t nowMs, IBlockHost& host) {
    if (isComplete()) {
        log_warn("LED %ld: all LEDs in the block are already processed", (long)pin);
        return BlockDetection::AlreadyComplete;
    }

    BlockDetection result;
    int t = findTracked(pin);

    if (t >= 0 && nowMs - _tracked[t].stampMs < _timing.perLedCooldownMs) {
        log_info("LED %ld detected again within %lu ms, ignoring",
                 (long)pin, (unsigned long)(nowMs - _tracked[t].stampMs));
        result = BlockDetection::PinCooldown;
    } else if (pin == _steps[_index].pin) {
        if (_hasAdvanced && nowMs - _lastCorrectMs < _timing.blockCooldownMs) {
            log_info("LED %ld skipped, %lu ms since last correct detection",
                     (long)pin, (unsigned long)(nowMs - _lastCorrectMs));
            result = BlockDetection::BlockCooldown;
        } else {
            host.renderPin(pin, LedColor::Off);
            int slot = findStep(pin);
            if (_greenCounts[slot] > 0)
                _greenCounts[slot]--;

            stamp(pin, nowMs, t >= 0 && _tracked[t].ignored);
            _lastCorrectMs = nowMs;
            _hasAdvanced = true;

            // Adjacent detectors tend to fire on the same touch
            stamp(pin - 1, nowMs, true);
            stamp(pin + 1, nowMs, true);

            host.cancelIncorrectDetection(pin);
            log_info("LED %ld correctly detected (%u/%u)",
                     (long)pin, (unsigned)(_index + 1), (unsigned)_count);

            _index++;
            if (_index < _count) {
                int32_t next = _steps[_index].pin;
                host.cancelIncorrectDetection(next);
                _greenCounts[findStep(next)]++;
                host.renderPin(next, LedColor::Green);
                host.announceActivePin(next);
                result = BlockDetection::Advanced;
            } else {
                log_info("Block completed");
                host.onBlockComplete(*this);
                result = BlockDetection::Completed;
            }
        }
    } else if (isSuppressed(pin, nowMs)) {
        log_info("LED %ld is a neighbour of a confirmed LED, ignoring", (long)pin);
        result = BlockDetection::Suppressed;
    } else {
        if (contains(pin)) {
            log_info("Incorrect LED %ld detected, expected %ld", (long)pin, (long)_steps[_index].pin);
        } else {
            log_info("LED %ld is not part of the current block", (long)pin);
        }
        host.deferIncorrectDetection(pin);
        result = BlockDetection::Incorrect;
    }

    sweep(nowMs);
    return result;
}

bool Block::contains(int32_t pin) const {
    return findStep(pin) >= 0;
}

int32_t Block::expectedPin() const {
    return isComplete() ? PIN_NONE : _steps[_index].pin;
}

bool Block::isSuppressed(int32_t pin, uint32_t nowMs) const {
    int t = findTracked(pin);
    if (t < 0 || !_tracked[t].ignored)
        return false;
    return nowMs - _tracked[t].stampMs < _timing.suppressionWindowMs;
}

uint8_t Block::greenCount(int32_t pin) const {
    int slot = findStep(pin);
    return slot >= 0 ? _greenCounts[slot] : 0;
}

int Block::findStep(int32_t pin) const {
    for (size_t i = 0; i < _count; ++i) {
        if (_steps[i].pin == pin)
            return static_cast<int>(i);
    }
    return -1;
}

int Block::findTracked(int32_t pin) const {
    for (size_t i = 0; i < _trackedCount; ++i) {
        if (_tracked[i].pin == pin)
            return static_cast<int>(i);
    }
    return -1;
}

void Block::stamp(int32_t pin, uint32_t nowMs, bool ignored) {
    int t = findTracked(pin);
    if (t < 0) {
        if (_trackedCount < BLOCK_MAX_TRACKED) {
            t = static_cast<int>(_trackedCount++);
        } else {
            // Evict the oldest stamp
            t = 0;
            for (size_t i = 1; i < _trackedCount; ++i) {
                if (nowMs - _tracked[i].stampMs > nowMs - _tracked[t].stampMs)
                    t = static_cast<int>(i);
            }
        }
        _tracked[t].pin = pin;
    }
    _tracked[t].stampMs = nowMs;
    _tracked[t].ignored = ignored;
}

void Block::sweep(uint32_t nowMs) {
    size_t keep = 0;
    for (size_t i = 0; i < _trackedCount; ++i) {
        if (nowMs - _tracked[i].stampMs > _timing.suppressionWindowMs)
            continue;
        _tracked[keep++] = _tracked[i];
    }
    _trackedCount = keep;
}
