#include "i_device_transport.h"
#include "board_config.h"
#include <Arduino.h>

// Detection device on UART0 (Serial1).
// Pins come from board_config.h.

class DeviceTransportArduino : public IDeviceTransport {
private:
    bool _open;

public:
    DeviceTransportArduino() : _open(false) {}

    bool open(uint32_t baud) override {
        if (!Serial1.setRX(PICKLIGHT_DEVICE_RX_PIN) || !Serial1.setTX(PICKLIGHT_DEVICE_TX_PIN)) {
            _open = false;
            return false;
        }
        Serial1.begin(baud);
        _open = true;
        return true;
    }

    bool isOpen() const override {
        return _open;
    }

    size_t read(uint8_t* buf, size_t maxLen) override {
        if (!_open)
            return 0;

        size_t n = 0;
        while (n < maxLen && Serial1.available() > 0) {
            int c = Serial1.read();
            if (c < 0)
                break;
            buf[n++] = static_cast<uint8_t>(c);
        }
        return n;
    }

    size_t write(const uint8_t* data, size_t len) override {
        if (!_open)
            return 0;
        return Serial1.write(data, len);
    }
};

// Global instance (created on first use)
static DeviceTransportArduino* g_deviceTransport = nullptr;

IDeviceTransport* createDeviceTransport() {
    if (g_deviceTransport == nullptr) {
        g_deviceTransport = new DeviceTransportArduino();
    }
    return g_deviceTransport;
}
