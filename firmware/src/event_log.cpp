#include "event_log.h"
#include "fw_config.h"
#include "platform_lock.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <ArduinoJson.h>
#include <stdarg.h>
#include <stdio.h>

static constexpr size_t LOG_MSG_SIZE  = 192;
static constexpr size_t LOG_LINE_SIZE = 512;   // worst case: every msg char escaped

static LogLevel g_level = static_cast<LogLevel>(PICKLIGHT_LOG_LEVEL);

void log_set_level(LogLevel level) {
    g_level = level;
}

LogLevel log_get_level() {
    return g_level;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

bool log_level_from_name(const char* name, LogLevel& out) {
    static const LogLevel LEVELS[] = {
        LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error
    };

    for (LogLevel level : LEVELS) {
        const char* a = log_level_name(level);
        const char* b = name;
        while (*a && *b) {
            char c = *b;
            if (c >= 'A' && c <= 'Z')
                c = c - 'A' + 'a';
            if (c != *a)
                break;
            ++a;
            ++b;
        }
        if (*a == '\0' && *b == '\0') {
            out = level;
            return true;
        }
    }
    return false;
}

static void log_vwrite(LogLevel level, const char* fmt, va_list args) {
    if (level < g_level)
        return;

    char msg[LOG_MSG_SIZE];
    vsnprintf(msg, sizeof(msg), fmt, args);

    JsonDocument doc;
    doc["event"] = "log";
    doc["level"] = log_level_name(level);
    doc["ms"]    = platform_millis();
    doc["msg"]   = msg;

    char line[LOG_LINE_SIZE];
    serializeJson(doc, line, sizeof(line));
    host_write_line(line);
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_vwrite(LogLevel::Error, fmt, args);
    va_end(args);
}

void host_write_line(const char* line) {
    PlatformLockGuard guard(PlatformLock::Log);
    platform_serial_println(line);
}
