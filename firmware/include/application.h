#pragma once
// =====================================================
// Application Class
// =====================================================
// Wires the controller together and splits the work
// across the two RP2040 cores.
//
// Core 0: host commands, detection device link,
//         activation engine and its blink tasks
// Core 1: FlushWorker pushing the LedFrame to the strips
//
// Usage:
//   Application app;
//   setup():  app.init();       loop():  app.loop();
//   setup1(): app.initCore1();  loop1(): app.loopCore1();
//   initCore1() must not run before init() has returned.
// =====================================================

#include <stdint.h>
#include "activation_engine.h"
#include "device_link.h"
#include "flush_worker.h"
#include "host_command.h"
#include "i_device_transport.h"
#include "i_led_surface.h"
#include "led_frame.h"
#include "pin_map.h"
#include "settings_store.h"

class Application {
public:
    Application();
    ~Application();

    // Core 0: initialize all components (call once at startup)
    void init();

    // Core 0: main loop iteration (call repeatedly)
    void loop();

    // Core 1: start the LED strips
    void initCore1();

    // Core 1: one flush pass
    void loopCore1();

    // =====================================================
    // Component Access (for testing/debugging)
    // =====================================================

    ActivationEngine& getEngine() { return _engine; }
    SettingsStore& getSettings() { return _settings; }
    DeviceLink& getDeviceLink() { return _link; }

private:
    // =====================================================
    // Components
    // =====================================================

    PinMap _pins;
    SettingsStore _settings;
    LedFrame _frame;
    ActivationEngine _engine;
    DeviceLink _link;
    HostCommandHandler _host;

    IDeviceTransport* _transport;
    ILedSurface* _surface;
    FlushWorker* _flushWorker;

    // Configuration
    static constexpr uint32_t CORE0_IDLE_MS = 1;
    static constexpr uint32_t CORE1_IDLE_MS = 1;
};
