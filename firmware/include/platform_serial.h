#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Host Serial Abstraction
// =====================================================
// USB CDC link to the host adapter. Carries host
// commands in and JSON event lines out.
//
// Usage:
//   - Call platform_serial_begin() once at startup
//   - Emit whole lines through host_write_line()
//     (event_log.h) so both cores stay line-atomic
// =====================================================

// Open the CDC port (the baud value only matters for a UART bridge)
void platform_serial_begin(uint32_t baud);

// True while a host has the CDC port open
bool platform_serial_connected();

// Bytes waiting in the receive buffer
int platform_serial_available();

// Next received byte, or -1 when the buffer is empty
int platform_serial_read();

// Write one line, terminated with \r\n
void platform_serial_println(const char* str);
