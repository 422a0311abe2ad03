#pragma once
// =====================================================
// Detection Device Transport
// =====================================================
// Byte stream to the optical/IR detection device.
// Implementations never block: read() returns what is
// already buffered, write() queues what fits.
//
// Implementations:
// - Serial1 UART (device_transport_arduino.cpp)
// - MockDeviceTransport (unit tests)
// =====================================================

#include <stdint.h>
#include <stddef.h>

class IDeviceTransport {
public:
    virtual ~IDeviceTransport() = default;

    // Open the link. False if the port could not be opened.
    virtual bool open(uint32_t baud) = 0;

    // True while the link can carry bytes
    virtual bool isOpen() const = 0;

    // Copy up to maxLen buffered bytes into buf
    // Returns: bytes copied (0 if none)
    virtual size_t read(uint8_t* buf, size_t maxLen) = 0;

    // Returns: bytes accepted; less than len is a write failure
    virtual size_t write(const uint8_t* data, size_t len) = 0;
};

// Factory function to create the transport (platform-specific)
IDeviceTransport* createDeviceTransport();
