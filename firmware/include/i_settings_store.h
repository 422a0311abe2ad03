#pragma once
// =====================================================
// Settings Store Interface
// =====================================================
// Persisted runtime configuration: engine timings and
// the log threshold. Lets the host command handler be
// tested without EEPROM.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "event_log.h"
#include "timing_settings.h"

enum class SettingResult : uint8_t {
    Ok,
    UnknownKey,
    OutOfRange,
};

class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    // =====================================================
    // Lifecycle
    // =====================================================

    // Load from NVM or fall back to defaults
    virtual bool begin() = 0;

    // Called from main loop for delayed write handling
    virtual void loop() = 0;

    // Force immediate save to NVM
    virtual bool saveNow() = 0;

    // =====================================================
    // Values
    // =====================================================

    // Live timings; the reference stays valid for the store's lifetime
    virtual const TimingSettings& timing() const = 0;

    // Set one timing key by name (see timing_settings.h)
    virtual SettingResult set(const char* key, uint32_t value) = 0;
    virtual bool get(const char* key, uint32_t& value) const = 0;

    virtual LogLevel logLevel() const = 0;
    virtual void setLogLevel(LogLevel level) = 0;

    // Restore defaults and persist immediately
    virtual void resetDefaults() = 0;
};
