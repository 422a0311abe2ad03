#pragma once
// =====================================================
// Event Log
// =====================================================
// JSON-line logging on the host serial link:
//   {"event":"log","level":"warn","ms":1234,"msg":"..."}
//
// Callable from both cores. Each line is written whole
// under PlatformLock::Log, so lines never interleave.
// =====================================================

#include <stdint.h>

enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
};

void log_set_level(LogLevel level);
LogLevel log_get_level();

const char* log_level_name(LogLevel level);

// Case-insensitive; accepts "debug", "info", "warn", "error"
bool log_level_from_name(const char* name, LogLevel& out);

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Write one complete line (newline appended) to the host link
void host_write_line(const char* line);
