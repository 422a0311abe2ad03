#include "settings_store.h"
#include "event_log.h"
#include "fw_config.h"
#include "platform_storage.h"
#include "platform_timing.h"


SettingsStore::SettingsStore() {
    loadDefaults();
}


bool SettingsStore::begin() {
    if (!platform_storage_begin(SETTINGS_EEPROM_SIZE)) {
        log_error("Settings storage unavailable, using defaults");
        loadDefaults();
        return false;
    }

    if (!loadFromNvm()) {
        // no valid data -> start from defaults and persist them
        log_warn("No valid settings in flash, writing defaults");
        loadDefaults();
        if (!saveNow())
            return false;
    } else {
        log_info("Settings loaded from flash");
    }

    log_set_level(logLevel());
    _dirty = false;
    return true;
}

// =====================================================
// Public API
// =====================================================

void SettingsStore::markDirty() {
    _dirty = true;
    _lastChangeMs = platform_millis();
}

void SettingsStore::loop() {
    if (!_dirty) return;

    // Wait until the host has been quiet for a while
    uint32_t now = platform_millis();
    if (now - _lastChangeMs >= SETTINGS_DELAYED_WRITE_MS) {
        saveNow();
    }
}

bool SettingsStore::saveNow() {
    _image.header.magic   = SETTINGS_MAGIC;
    _image.header.version = SETTINGS_VERSION;
    _image.header.length  = sizeof(SettingsPayloadV1);
    _image.header.crc32   = calcCrc32(
        reinterpret_cast<const uint8_t*>(&_image.payload),
        sizeof(SettingsPayloadV1)
    );

    bool ok = writeToNvm();
    if (ok) {
        _dirty = false;
    } else {
        // keep _dirty; loop() retries after the next delay
        _lastChangeMs = platform_millis();
        log_error("Settings commit to flash failed");
    }
    return ok;
}

SettingResult SettingsStore::set(const char* key, uint32_t value) {
    const TimingSettingKey* k = findTimingSettingKey(key);
    if (!k)
        return SettingResult::UnknownKey;
    if (value < k->minValue || value > k->maxValue)
        return SettingResult::OutOfRange;

    if (_image.payload.timing.*(k->field) != value) {
        _image.payload.timing.*(k->field) = value;
        markDirty();
    }
    return SettingResult::Ok;
}

bool SettingsStore::get(const char* key, uint32_t& value) const {
    const TimingSettingKey* k = findTimingSettingKey(key);
    if (!k)
        return false;
    value = _image.payload.timing.*(k->field);
    return true;
}

LogLevel SettingsStore::logLevel() const {
    return static_cast<LogLevel>(_image.payload.logLevel);
}

void SettingsStore::setLogLevel(LogLevel level) {
    log_set_level(level);
    if (_image.payload.logLevel != static_cast<uint8_t>(level)) {
        _image.payload.logLevel = static_cast<uint8_t>(level);
        markDirty();
    }
}

void SettingsStore::resetDefaults() {
    loadDefaults();
    log_set_level(logLevel());
    markDirty();
    // Reset is a user command, persist it right away
    saveNow();
}

void SettingsStore::loadDefaults() {
    memset(&_image, 0, sizeof(_image));
    timingSettingsDefaults(_image.payload.timing);
    _image.payload.logLevel = static_cast<uint8_t>(PICKLIGHT_LOG_LEVEL);
}

// =====================================================
// NVM I/O
// =====================================================

bool SettingsStore::loadFromNvm() {
    SettingsImageV1 temp;

    for (size_t i = 0; i < sizeof(SettingsImageV1); ++i) {
        ((uint8_t*)&temp)[i] = platform_storage_read(SETTINGS_EEPROM_BASE + i);
    }

    if (temp.header.magic != SETTINGS_MAGIC) return false;
    if (temp.header.version != SETTINGS_VERSION) return false;
    if (temp.header.length  != sizeof(SettingsPayloadV1)) return false;

    uint32_t crc = calcCrc32(
        reinterpret_cast<const uint8_t*>(&temp.payload),
        sizeof(SettingsPayloadV1)
    );
    if (crc != temp.header.crc32) return false;

    if (!timingSettingsValid(temp.payload.timing)) {
        log_warn("Stored timings out of range, ignoring them");
        return false;
    }
    if (temp.payload.logLevel > static_cast<uint8_t>(LogLevel::Error)) return false;

    _image = temp;
    return true;
}

bool SettingsStore::writeToNvm() {
    // Bytes land in the EEPROM RAM copy; commit() erases and programs the sector
    const size_t CHUNK_SIZE = 32;
    for (size_t i = 0; i < sizeof(SettingsImageV1); ++i) {
        platform_storage_write(SETTINGS_EEPROM_BASE + i, ((const uint8_t*)&_image)[i]);

        if ((i % CHUNK_SIZE) == (CHUNK_SIZE - 1)) {
            platform_delay_ms(1);
        }
    }

    return platform_storage_commit();
}


// =====================================================
// Software CRC32
// =====================================================

uint32_t SettingsStore::calcCrc32(const uint8_t* data, size_t len) {
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc ^= data[i];
        for (int b = 0; b < 8; ++b) {
            crc = (crc & 1u) ? (crc >> 1) ^ 0xEDB88320u : (crc >> 1);
        }
    }
    return ~crc;
}
