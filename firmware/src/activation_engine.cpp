#include "activation_engine.h"
#include "event_log.h"
#include "platform_timing.h"

// =====================================================
// Names (host link / logs)
// =====================================================

const char* engineModeName(EngineMode mode) {
    switch (mode) {
        case EngineMode::Idle:   return "idle";
        case EngineMode::Single: return "single";
        case EngineMode::Block:  return "block";
    }
    return "idle";
}

const char* activationStatusName(ActivationStatus status) {
    switch (status) {
        case ActivationStatus::Ok:               return "ok";
        case ActivationStatus::Conflict:         return "conflict";
        case ActivationStatus::InvalidPin:       return "invalid_pin";
        case ActivationStatus::Empty:            return "empty";
        case ActivationStatus::TooLong:          return "too_long";
        case ActivationStatus::CapacityExceeded: return "capacity_exceeded";
    }
    return "unknown";
}

const char* detectionOutcomeName(DetectionOutcome outcome) {
    switch (outcome) {
        case DetectionOutcome::Debounced:       return "debounced";
        case DetectionOutcome::InvalidPin:      return "invalid_pin";
        case DetectionOutcome::PinCooldown:     return "pin_cooldown";
        case DetectionOutcome::BlockCooldown:   return "block_cooldown";
        case DetectionOutcome::Advanced:        return "advanced";
        case DetectionOutcome::Completed:       return "completed";
        case DetectionOutcome::Confirmed:       return "confirmed";
        case DetectionOutcome::Suppressed:      return "suppressed";
        case DetectionOutcome::Incorrect:       return "incorrect";
        case DetectionOutcome::AlreadyComplete: return "already_complete";
        case DetectionOutcome::Orphan:          return "orphan";
    }
    return "unknown";
}

static DetectionOutcome outcomeFor(BlockDetection detection) {
    switch (detection) {
        case BlockDetection::PinCooldown:     return DetectionOutcome::PinCooldown;
        case BlockDetection::BlockCooldown:   return DetectionOutcome::BlockCooldown;
        case BlockDetection::Advanced:        return DetectionOutcome::Advanced;
        case BlockDetection::Completed:       return DetectionOutcome::Completed;
        case BlockDetection::Suppressed:      return DetectionOutcome::Suppressed;
        case BlockDetection::Incorrect:       return DetectionOutcome::Incorrect;
        case BlockDetection::AlreadyComplete: return DetectionOutcome::AlreadyComplete;
    }
    return DetectionOutcome::Orphan;
}

static bool lookupControlled(const ShelfOffset* shelves, size_t count, int32_t shelfId, int32_t& controlled) {
    for (size_t i = 0; i < count; ++i) {
        if (shelves[i].shelfId == shelfId) {
            controlled = shelves[i].controlled;
            return true;
        }
    }
    controlled = 0;
    return false;
}

// =====================================================
// Construction
// =====================================================

ActivationEngine::ActivationEngine(const PinMap& pins, LedFrame& frame, const TimingSettings& settings)
    : _pins(pins)
    , _frame(frame)
    , _settings(settings)
    , _announcer(nullptr)
    , _sink(nullptr)
    , _mode(EngineMode::Idle)
    , _blockActive(false)
    , _historyValid(false)
    , _singlePin(PIN_NONE)
    , _singleArmedMs(0)
    , _debounceCount(0)
    , _shelfCount(0)
    , _deferredIncorrect(PIN_NONE)
{
}

// =====================================================
// Activation
// =====================================================

ActivationStatus ActivationEngine::startBlock(const LedRef* refs, size_t count,
                                              const ShelfOffset* shelves, size_t shelfCount) {
    if (_blockActive) {
        log_warn("A block is already being processed, new block refused");
        return ActivationStatus::Conflict;
    }
    if (_flash.isRunning()) {
        log_warn("Previous block is still completing, new block refused");
        return ActivationStatus::Conflict;
    }
    if (count == 0)
        return ActivationStatus::Empty;
    if (count > BLOCK_MAX_STEPS) {
        log_warn("Block of %u LEDs exceeds %u", (unsigned)count, (unsigned)BLOCK_MAX_STEPS);
        return ActivationStatus::TooLong;
    }
    if (shelfCount > ENGINE_MAX_SHELVES) {
        log_warn("%u shelves exceed %u", (unsigned)shelfCount, (unsigned)ENGINE_MAX_SHELVES);
        return ActivationStatus::CapacityExceeded;
    }

    BlockStep steps[BLOCK_MAX_STEPS];
    for (size_t i = 0; i < count; ++i) {
        int32_t shelfId = refs[i].shelfId;
        int32_t controlled = 0;
        if (shelfId != SHELF_NONE && !lookupControlled(shelves, shelfCount, shelfId, controlled)) {
            // No shelf range to flash; the step flashes on its own
            log_warn("Unknown shelf_id %ld, LED %ld taken without offset",
                     (long)shelfId, (long)refs[i].ledId);
            shelfId = SHELF_NONE;
        }
        int64_t adjusted = static_cast<int64_t>(refs[i].ledId) + controlled;
        if (adjusted < 1 || adjusted > _pins.totalPins()) {
            log_warn("Shelf %ld LED %ld maps to pin %ld, out of range",
                     (long)refs[i].shelfId, (long)refs[i].ledId, (long)adjusted);
            return ActivationStatus::InvalidPin;
        }
        steps[i].pin = static_cast<int32_t>(adjusted);
        steps[i].shelfId = shelfId;
    }

    for (size_t i = 0; i < shelfCount; ++i) {
        _shelves[i] = shelves[i];
    }
    _shelfCount = shelfCount;

    if (_mode == EngineMode::Single)
        clearSingle(true);

    _historyValid = false;
    _block.load(steps, count, blockTiming());
    _blockActive = true;
    _mode = EngineMode::Block;
    _block.begin(*this);

    log_info("Added new block with %u LEDs, first LED %ld", (unsigned)count, (long)steps[0].pin);
    return ActivationStatus::Ok;
}

ActivationStatus ActivationEngine::startBlockPins(const int32_t* pins, size_t count) {
    if (count > BLOCK_MAX_STEPS) {
        log_warn("Block of %u LEDs exceeds %u", (unsigned)count, (unsigned)BLOCK_MAX_STEPS);
        return ActivationStatus::TooLong;
    }

    LedRef refs[BLOCK_MAX_STEPS];
    for (size_t i = 0; i < count; ++i) {
        refs[i].shelfId = SHELF_NONE;
        refs[i].ledId = pins[i];
    }
    return startBlock(refs, count, nullptr, 0);
}

ActivationStatus ActivationEngine::setSingleMode(int32_t pin) {
    if (!_pins.isValid(pin)) {
        log_warn("Single mode LED %ld out of range", (long)pin);
        return ActivationStatus::InvalidPin;
    }
    if (_blockActive || _flash.isRunning()) {
        log_warn("Single mode LED %ld refused, a block is being processed", (long)pin);
        return ActivationStatus::Conflict;
    }

    if (_mode == EngineMode::Single && _singlePin != pin)
        renderPin(_singlePin, LedColor::Off);

    _mode = EngineMode::Single;
    _singlePin = pin;
    _singleArmedMs = platform_millis();
    renderPin(pin, LedColor::Green);
    announceActivePin(pin);

    log_info("Single mode activated for LED %ld", (long)pin);
    return ActivationStatus::Ok;
}

ActivationStatus ActivationEngine::setActiveLeds(const int32_t* pins, size_t count) {
    if (count == 0)
        return ActivationStatus::Empty;
    if (count > TIMEOUT_BLINK_MAX_PINS) {
        log_warn("%u blinking LEDs exceed %u", (unsigned)count, (unsigned)TIMEOUT_BLINK_MAX_PINS);
        return ActivationStatus::CapacityExceeded;
    }

    int32_t valid[TIMEOUT_BLINK_MAX_PINS];
    size_t n = 0;
    for (size_t i = 0; i < count; ++i) {
        if (!_pins.isValid(pins[i])) {
            log_warn("Blinking LED %ld out of range, skipped", (long)pins[i]);
            continue;
        }
        valid[n++] = pins[i];
    }
    if (n == 0)
        return ActivationStatus::InvalidPin;

    // The old loop's cleanup must finish before new pins are armed
    _blinker.cancel(*this);

    uint32_t now = platform_millis();
    _blinker.arm(valid, n, now);
    log_info("Started blinking %u LEDs", (unsigned)n);
    _blinker.poll(now, _blockActive, timeoutBlinkTiming(), *this);
    return ActivationStatus::Ok;
}

// =====================================================
// Detections
// =====================================================

DetectionOutcome ActivationEngine::handleDetection(int32_t rawPin) {
    if (!_pins.isValid(rawPin)) {
        log_warn("Invalid detected LED %ld", (long)rawPin);
        return DetectionOutcome::InvalidPin;
    }

    uint32_t now = platform_millis();
    if (debounce(rawPin, now)) {
        log_info("Debounced detection for LED %ld", (long)rawPin);
        return DetectionOutcome::Debounced;
    }

    DetectionOutcome outcome = DetectionOutcome::Orphan;
    switch (_mode) {
        case EngineMode::Single:
            if (rawPin == _singlePin) {
                renderPin(rawPin, LedColor::Off);
                clearSingle(false);
                log_info("Single mode completed for LED %ld", (long)rawPin);
                outcome = DetectionOutcome::Confirmed;
            } else if (_blinker.confirm(rawPin, *this)) {
                outcome = DetectionOutcome::Confirmed;
            } else {
                log_info("LED %ld detected, single mode waits for LED %ld", (long)rawPin, (long)_singlePin);
            }
            break;

        case EngineMode::Block: {
            _deferredIncorrect = PIN_NONE;
            outcome = outcomeFor(_block.handleDetection(rawPin, now, *this));

            int32_t deferred = _deferredIncorrect;
            _deferredIncorrect = PIN_NONE;
            if (deferred != PIN_NONE)
                handleIncorrectDetection(deferred);
            break;
        }

        case EngineMode::Idle:
            if (_blinker.confirm(rawPin, *this)) {
                outcome = DetectionOutcome::Confirmed;
            } else if (_historyValid && _block.contains(rawPin)) {
                outcome = outcomeFor(_block.handleDetection(rawPin, now, *this));
            } else {
                log_info("Detected LED %ld is not part of any active block", (long)rawPin);
            }
            break;
    }
    return outcome;
}

void ActivationEngine::handleIncorrectDetection(int32_t pin) {
    if (!_pins.isValid(pin)) {
        log_warn("Incorrect detection of LED %ld out of range", (long)pin);
        return;
    }
    if (_flash.isRunning()) {
        log_info("LED %ld detected while the block completes, ignoring", (long)pin);
        return;
    }

    uint32_t now = platform_millis();
    if (_blockActive) {
        if (_block.isSuppressed(pin, now)) {
            log_info("LED %ld is ignored during cooldown", (long)pin);
            return;
        }
        // A confirmation may have overtaken a stale wrong-detection signal
        if (pin == _block.expectedPin()) {
            log_info("LED %ld is now the expected LED, not handling as incorrect", (long)pin);
            return;
        }
    }

    IncorrectDetectionSupervisor* supervisor = findSupervisor(pin);
    if (supervisor) {
        supervisor->touch(now);
        log_info("LED %ld is already being handled, updated last detection time", (long)pin);
        return;
    }

    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        if (_supervisors[i].isActive())
            continue;
        _supervisors[i].start(pin, now);
        log_info("Started handling incorrect LED %ld", (long)pin);
        _supervisors[i].poll(now, expectedPin(), supervisorTiming(), *this);
        return;
    }

    log_warn("No free supervisor for incorrect LED %ld (%u active)",
             (long)pin, (unsigned)ENGINE_MAX_SUPERVISORS);
}

// =====================================================
// Reset
// =====================================================

void ActivationEngine::turnOffAll() {
    _flash.cancel();
    _blinker.cancel(*this);

    _blockActive = false;
    _historyValid = false;
    _block.clear();
    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        _supervisors[i].cancel(PIN_NONE, *this);
    }

    _frame.fill(LedColor::Off);

    _mode = EngineMode::Idle;
    _singlePin = PIN_NONE;
    _debounceCount = 0;
    _shelfCount = 0;
    _deferredIncorrect = PIN_NONE;

    log_info("All LEDs turned off and blocks cleared");
}

void ActivationEngine::stopBlinking() {
    _blinker.cancel(*this);
    turnOffAll();
    log_info("Stopped blinking and turned off all LEDs");
}

void ActivationEngine::poll() {
    uint32_t now = platform_millis();

    const int32_t expected = expectedPin();
    const SupervisorTiming supTiming = supervisorTiming();
    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        if (_supervisors[i].isActive())
            _supervisors[i].poll(now, expected, supTiming, *this);
    }

    if (_blinker.isRunning())
        _blinker.poll(now, _blockActive, timeoutBlinkTiming(), *this);

    if (_mode == EngineMode::Single && now - _singleArmedMs > _settings.singleTimeoutMs) {
        log_info("Single LED %ld turned off due to timeout", (long)_singlePin);
        clearSingle(true);
    }

    if (_flash.isRunning() && _flash.poll(now, _settings.completionFlashIntervalMs, *this))
        finishCompletion();
}

// =====================================================
// Queries
// =====================================================

int32_t ActivationEngine::expectedPin() const {
    return _blockActive ? _block.expectedPin() : PIN_NONE;
}

bool ActivationEngine::isBlockMember(int32_t pin) const {
    return _blockActive && _block.contains(pin);
}

size_t ActivationEngine::supervisorCount() const {
    size_t n = 0;
    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        if (_supervisors[i].isActive())
            n++;
    }
    return n;
}

bool ActivationEngine::hasSupervisor(int32_t pin) const {
    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        if (_supervisors[i].isActive() && _supervisors[i].pin() == pin)
            return true;
    }
    return false;
}

int32_t ActivationEngine::controlledValue(int32_t shelfId) const {
    int32_t controlled;
    return lookupControlled(_shelves, _shelfCount, shelfId, controlled) ? controlled : 0;
}

// =====================================================
// IBlockHost
// =====================================================

void ActivationEngine::renderPin(int32_t pin, LedColor color) {
    if (!_frame.set(pin, color)) {
        log_warn("LED %ld out of range, %s skipped", (long)pin, ledColorName(color));
    }
}

void ActivationEngine::announceActivePin(int32_t pin) {
    if (!_announcer) {
        log_error("No detection device attached, cannot announce LED %ld", (long)pin);
        return;
    }
    _announcer->announceActivePin(pin);
}

void ActivationEngine::cancelIncorrectDetection(int32_t pin) {
    IncorrectDetectionSupervisor* supervisor = findSupervisor(pin);
    if (!supervisor)
        return;
    supervisor->cancel(expectedPin(), *this);
    log_info("Cleared incorrect detection state for LED %ld", (long)pin);
}

void ActivationEngine::deferIncorrectDetection(int32_t pin) {
    _deferredIncorrect = pin;
}

void ActivationEngine::onBlockComplete(const Block& block) {
    _blockActive = false;
    _historyValid = true;
    _mode = EngineMode::Idle;

    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        _supervisors[i].cancel(PIN_NONE, *this);
    }

    PinRange ranges[COMPLETION_MAX_RANGES];
    size_t n = completionRanges(block, ranges, COMPLETION_MAX_RANGES);

    uint32_t now = platform_millis();
    _flash.start(ranges, n, now);
    log_info("Block completed, flashing %u ranges", (unsigned)n);
    _flash.poll(now, _settings.completionFlashIntervalMs, *this);
}

// =====================================================
// Internals
// =====================================================

bool ActivationEngine::debounce(int32_t pin, uint32_t nowMs) {
    size_t slot = _debounceCount;
    for (size_t i = 0; i < _debounceCount; ++i) {
        if (_debounce[i].pin == pin) {
            if (nowMs - _debounce[i].stampMs < _settings.debounceMs)
                return true;
            slot = i;
            break;
        }
    }

    if (slot == _debounceCount) {
        if (_debounceCount < ENGINE_MAX_DEBOUNCE) {
            _debounceCount++;
        } else {
            // Replace the oldest entry
            slot = 0;
            for (size_t i = 1; i < _debounceCount; ++i) {
                if (nowMs - _debounce[i].stampMs > nowMs - _debounce[slot].stampMs)
                    slot = i;
            }
        }
    }

    _debounce[slot].pin = pin;
    _debounce[slot].stampMs = nowMs;
    return false;
}

void ActivationEngine::clearSingle(bool render) {
    if (render && _singlePin != PIN_NONE)
        renderPin(_singlePin, LedColor::Off);
    _singlePin = PIN_NONE;
    if (_mode == EngineMode::Single)
        _mode = EngineMode::Idle;
}

IncorrectDetectionSupervisor* ActivationEngine::findSupervisor(int32_t pin) {
    for (size_t i = 0; i < ENGINE_MAX_SUPERVISORS; ++i) {
        if (_supervisors[i].isActive() && _supervisors[i].pin() == pin)
            return &_supervisors[i];
    }
    return nullptr;
}

size_t ActivationEngine::completionRanges(const Block& block, PinRange* out, size_t maxCount) const {
    size_t n = 0;
    int32_t seen[ENGINE_MAX_SHELVES];
    bool seenOk[ENGINE_MAX_SHELVES];
    size_t seenCount = 0;

    // Whole shelf ranges first
    for (size_t i = 0; i < block.length(); ++i) {
        int32_t shelfId = block.step(i).shelfId;
        if (shelfId == SHELF_NONE)
            continue;

        bool known = false;
        for (size_t k = 0; k < seenCount; ++k) {
            if (seen[k] == shelfId)
                known = true;
        }
        if (known || seenCount >= ENGINE_MAX_SHELVES)
            continue;

        PinRange range;
        bool ok = _pins.shelfRange(controlledValue(shelfId), range.first, range.last);
        seen[seenCount] = shelfId;
        seenOk[seenCount] = ok;
        seenCount++;
        if (ok && n < maxCount)
            out[n++] = range;
    }

    // Steps without a usable shelf flash on their own
    for (size_t i = 0; i < block.length() && n < maxCount; ++i) {
        const BlockStep& s = block.step(i);
        bool covered = false;
        for (size_t k = 0; k < seenCount; ++k) {
            if (seen[k] == s.shelfId && seenOk[k])
                covered = true;
        }
        if (!covered) {
            out[n].first = s.pin;
            out[n].last = s.pin;
            n++;
        }
    }
    return n;
}

void ActivationEngine::finishCompletion() {
    log_info("Completion flash done, resetting program state");
    turnOffAll();

    if (!_sink) {
        log_error("No completion sink, block completion not reported");
        return;
    }
    if (!_sink->notifyBlockCompleted()) {
        log_error("Failed to notify block completion");
        return;
    }
    log_info("Block completion notified");
}

BlockTiming ActivationEngine::blockTiming() const {
    BlockTiming t;
    t.blockCooldownMs = _settings.blockCooldownMs;
    t.perLedCooldownMs = _settings.perLedCooldownMs;
    t.suppressionWindowMs = _settings.suppressionWindowMs;
    return t;
}

SupervisorTiming ActivationEngine::supervisorTiming() const {
    SupervisorTiming t;
    t.blinkIntervalMs = _settings.incorrectBlinkIntervalMs;
    t.idleMs = _settings.incorrectIdleMs;
    return t;
}

TimeoutBlinkTiming ActivationEngine::timeoutBlinkTiming() const {
    TimeoutBlinkTiming t;
    t.intervalMs = _settings.timeoutBlinkIntervalMs;
    t.timeoutMs = _settings.singleTimeoutMs;
    return t;
}
