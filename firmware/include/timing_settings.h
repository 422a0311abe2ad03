#pragma once
// =====================================================
// Timing Settings
// =====================================================
// Runtime-tunable durations (milliseconds). Persisted by
// SettingsStore, read by the engine at each use.
// =====================================================

#include <stdint.h>
#include <stddef.h>

struct TimingSettings {
    uint32_t debounceMs;                  // global per-pin detection debounce
    uint32_t perLedCooldownMs;            // same pin re-detection inside a block
    uint32_t blockCooldownMs;             // minimum gap between two block advances
    uint32_t suppressionWindowMs;         // neighbour ignore / tracking expiry
    uint32_t incorrectBlinkIntervalMs;    // red on/off half period
    uint32_t incorrectIdleMs;             // stop red blink after this long without detections
    uint32_t timeoutBlinkIntervalMs;      // timeout-blink half period
    uint32_t singleTimeoutMs;             // unconfirmed single / blinking pin lifetime
    uint32_t completionFlashIntervalMs;   // completion flash half period
};

struct TimingSettingKey {
    const char* name;
    uint32_t TimingSettings::*field;
    uint32_t defaultValue;
    uint32_t minValue;
    uint32_t maxValue;
};

void timingSettingsDefaults(TimingSettings& out);

// True if every field lies inside its key's range
bool timingSettingsValid(const TimingSettings& settings);

size_t timingSettingKeyCount();
const TimingSettingKey& timingSettingKeyAt(size_t index);

// Exact, case-sensitive match; nullptr if unknown
const TimingSettingKey* findTimingSettingKey(const char* name);
