#pragma once
#include <stdint.h>
#include <string.h>
#include "i_settings_store.h"

// =====================================================
// Configuration
// =====================================================

constexpr uint32_t SETTINGS_MAGIC   = 0x504B4C54;  // "PKLT"
constexpr uint16_t SETTINGS_VERSION = 1;

constexpr size_t SETTINGS_EEPROM_SIZE = 256;
constexpr size_t SETTINGS_EEPROM_BASE = 0;

// RP2040 EEPROM emulation rewrites a whole 4 KB flash sector
// on every commit. A host tuning several keys in a row gets
// one commit once it stops for this long.
constexpr uint32_t SETTINGS_DELAYED_WRITE_MS = 5000;


// =====================================================
// Persist Structures (Version 1)
// =====================================================

struct SettingsPayloadV1 {
    TimingSettings timing;      // 36
    uint8_t  logLevel;          // 1  (LogLevel)
    uint8_t  reserved8[3];      // 3  (alignment padding)
    uint32_t reserved32[8];     // room for new keys
};

static_assert(sizeof(SettingsPayloadV1) % 4 == 0, "SettingsPayloadV1 must be 4-byte aligned");

struct SettingsHeader {
    uint32_t magic;
    uint16_t version;
    uint16_t length;
    uint32_t crc32;
};

struct SettingsImageV1 {
    SettingsHeader header;
    SettingsPayloadV1 payload;
};

static_assert(sizeof(SettingsImageV1) <= SETTINGS_EEPROM_SIZE, "settings image exceeds EEPROM area");


// =====================================================
// SettingsStore Class
// =====================================================

class SettingsStore : public ISettingsStore {
public:
    SettingsStore();

    bool begin() override;
    void loop() override;
    bool saveNow() override;

    const TimingSettings& timing() const override { return _image.payload.timing; }
    SettingResult set(const char* key, uint32_t value) override;
    bool get(const char* key, uint32_t& value) const override;

    LogLevel logLevel() const override;
    void setLogLevel(LogLevel level) override;

    void resetDefaults() override;

    bool isDirty() const { return _dirty; }

    // CRC-32 (IEEE 802.3, reflected 0xEDB88320)
    static uint32_t calcCrc32(const uint8_t* data, size_t len);

private:
    void markDirty();
    void loadDefaults();
    bool loadFromNvm();
    bool writeToNvm();

private:
    SettingsImageV1 _image{};
    bool _dirty = false;
    uint32_t _lastChangeMs = 0;
};
