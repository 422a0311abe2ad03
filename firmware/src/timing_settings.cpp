#include "timing_settings.h"
#include <string.h>

static constexpr uint32_t MAX_DURATION_MS = 600000;

static const TimingSettingKey KEYS[] = {
    { "debounce_ms",                  &TimingSettings::debounceMs,                100,   0, MAX_DURATION_MS },
    { "per_led_cooldown_ms",          &TimingSettings::perLedCooldownMs,          500,   1, MAX_DURATION_MS },
    { "block_cooldown_ms",            &TimingSettings::blockCooldownMs,           1000,  1, MAX_DURATION_MS },
    { "suppression_window_ms",        &TimingSettings::suppressionWindowMs,       2000,  1, MAX_DURATION_MS },
    { "incorrect_blink_interval_ms",  &TimingSettings::incorrectBlinkIntervalMs,  100,   1, MAX_DURATION_MS },
    { "incorrect_idle_ms",            &TimingSettings::incorrectIdleMs,           500,   1, MAX_DURATION_MS },
    { "timeout_blink_interval_ms",    &TimingSettings::timeoutBlinkIntervalMs,    500,   1, MAX_DURATION_MS },
    { "single_timeout_ms",            &TimingSettings::singleTimeoutMs,           10000, 1, MAX_DURATION_MS },
    { "completion_flash_interval_ms", &TimingSettings::completionFlashIntervalMs, 500,   1, MAX_DURATION_MS },
};

static constexpr size_t KEY_COUNT = sizeof(KEYS) / sizeof(KEYS[0]);

void timingSettingsDefaults(TimingSettings& out) {
    for (size_t i = 0; i < KEY_COUNT; ++i) {
        out.*(KEYS[i].field) = KEYS[i].defaultValue;
    }
}

bool timingSettingsValid(const TimingSettings& settings) {
    for (size_t i = 0; i < KEY_COUNT; ++i) {
        uint32_t v = settings.*(KEYS[i].field);
        if (v < KEYS[i].minValue || v > KEYS[i].maxValue)
            return false;
    }
    return true;
}

size_t timingSettingKeyCount() {
    return KEY_COUNT;
}

const TimingSettingKey& timingSettingKeyAt(size_t index) {
    return KEYS[index];
}

const TimingSettingKey* findTimingSettingKey(const char* name) {
    for (size_t i = 0; i < KEY_COUNT; ++i) {
        if (strcmp(KEYS[i].name, name) == 0)
            return &KEYS[i];
    }
    return nullptr;
}
