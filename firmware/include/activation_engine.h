#pragma once
// =====================================================
// Activation Engine
// =====================================================
// Owns the pick-guidance state: current mode, the active
// block, the single-mode pin, the timeout-blink set, the
// incorrect-detection supervisors, the debounce table,
// the shelf offsets and the completion flash.
//
// Everything here runs on core 0. Each public call runs
// to completion before the next event is read, which
// serializes detections in arrival order. LED output
// goes to the LedFrame; core 1 flushes it.
//
// Usage:
//   ActivationEngine engine(pins, frame, settings);
//   engine.setAnnouncer(&link);
//   engine.setCompletionSink(&host);
//   Call engine.poll() inside loop()
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "block.h"
#include "completion_flash.h"
#include "i_completion_sink.h"
#include "i_pin_announcer.h"
#include "incorrect_detection_supervisor.h"
#include "led_frame.h"
#include "pin_map.h"
#include "timeout_blinker.h"
#include "timing_settings.h"

constexpr size_t ENGINE_MAX_SHELVES = 8;
constexpr size_t ENGINE_MAX_SUPERVISORS = 16;
constexpr size_t ENGINE_MAX_DEBOUNCE = 32;

enum class EngineMode : uint8_t {
    Idle,
    Single,
    Block,
};

enum class ActivationStatus : uint8_t {
    Ok,
    Conflict,           // a block is active or completing
    InvalidPin,
    Empty,
    TooLong,
    CapacityExceeded,
};

enum class DetectionOutcome : uint8_t {
    Debounced,
    InvalidPin,
    PinCooldown,
    BlockCooldown,
    Advanced,
    Completed,
    Confirmed,          // single or timeout-blink pin confirmed
    Suppressed,
    Incorrect,
    AlreadyComplete,
    Orphan,             // no mode claims the pin
};

struct ShelfOffset {
    int32_t shelfId;
    int32_t controlled;
};

struct LedRef {
    int32_t shelfId;    // SHELF_NONE: ledId is already a pin
    int32_t ledId;
};

const char* engineModeName(EngineMode mode);
const char* activationStatusName(ActivationStatus status);
const char* detectionOutcomeName(DetectionOutcome outcome);

class ActivationEngine : public IBlockHost {
public:
    ActivationEngine(const PinMap& pins, LedFrame& frame, const TimingSettings& settings);

    void setAnnouncer(IPinAnnouncer* announcer) { _announcer = announcer; }
    void setCompletionSink(ICompletionSink* sink) { _sink = sink; }

    // =====================================================
    // Activation
    // =====================================================

    // Ordered block; ledIds are offset by their shelf's controlled value.
    // The shelf table replaces the current one.
    ActivationStatus startBlock(const LedRef* refs, size_t count,
                                const ShelfOffset* shelves, size_t shelfCount);

    // Legacy ordered block of raw pins, no shelf offsets
    ActivationStatus startBlockPins(const int32_t* pins, size_t count);

    ActivationStatus setSingleMode(int32_t pin);

    // Replace the timeout-blink set; the previous loop is cancelled
    // (its pins turned off) before the new pins are armed
    ActivationStatus setActiveLeds(const int32_t* pins, size_t count);

    // =====================================================
    // Detections
    // =====================================================

    DetectionOutcome handleDetection(int32_t rawPin);
    void handleIncorrectDetection(int32_t pin);

    // =====================================================
    // Reset
    // =====================================================

    // Every LED off; block, single, timeout-blink, supervisors,
    // debounce and shelf state cleared
    void turnOffAll();

    // Cancel the timeout-blink loop, then turnOffAll()
    void stopBlinking();

    // Advance blink tasks; call from loop()
    void poll();

    // =====================================================
    // Queries
    // =====================================================

    EngineMode mode() const { return _mode; }
    bool blockActive() const { return _blockActive; }
    bool isCompleting() const { return _flash.isRunning(); }
    const Block* currentBlock() const { return _blockActive ? &_block : nullptr; }
    int32_t expectedPin() const;
    bool isBlockMember(int32_t pin) const;
    int32_t singlePin() const { return _singlePin; }

    size_t supervisorCount() const;
    bool hasSupervisor(int32_t pin) const;
    const TimeoutBlinker& timeoutBlinker() const { return _blinker; }

    int32_t controlledValue(int32_t shelfId) const;
    size_t shelfCount() const { return _shelfCount; }

    const PinMap& pinMap() const { return _pins; }
    const TimingSettings& settings() const { return _settings; }

    // =====================================================
    // IBlockHost
    // =====================================================

    void renderPin(int32_t pin, LedColor color) override;
    void announceActivePin(int32_t pin) override;
    void cancelIncorrectDetection(int32_t pin) override;
    void deferIncorrectDetection(int32_t pin) override;
    void onBlockComplete(const Block& block) override;

private:
    bool debounce(int32_t pin, uint32_t nowMs);
    void clearSingle(bool render);
    IncorrectDetectionSupervisor* findSupervisor(int32_t pin);
    size_t completionRanges(const Block& block, PinRange* out, size_t maxCount) const;
    void finishCompletion();

    BlockTiming blockTiming() const;
    SupervisorTiming supervisorTiming() const;
    TimeoutBlinkTiming timeoutBlinkTiming() const;

    struct DebounceEntry {
        int32_t pin;
        uint32_t stampMs;
    };

    const PinMap& _pins;
    LedFrame& _frame;
    const TimingSettings& _settings;
    IPinAnnouncer* _announcer;
    ICompletionSink* _sink;

    EngineMode _mode;

    Block _block;
    bool _blockActive;
    bool _historyValid;     // _block holds the block that just completed

    int32_t _singlePin;
    uint32_t _singleArmedMs;

    TimeoutBlinker _blinker;
    CompletionFlash _flash;
    IncorrectDetectionSupervisor _supervisors[ENGINE_MAX_SUPERVISORS];

    DebounceEntry _debounce[ENGINE_MAX_DEBOUNCE];
    size_t _debounceCount;

    ShelfOffset _shelves[ENGINE_MAX_SHELVES];
    size_t _shelfCount;

    int32_t _deferredIncorrect;
};
