#include "application.h"
#include "board_config.h"
#include "event_log.h"
#include "fw_config.h"
#include "platform_timing.h"

Application::Application()
    : _pins(PICKLIGHT_STRIP_COUNT, PICKLIGHT_LEDS_PER_STRIP, PICKLIGHT_SHELF_LED_COUNT)
    , _frame(_pins)
    , _engine(_pins, _frame, _settings.timing())
    , _link(_engine)
    , _host(_engine, _settings, _link)
    , _transport(nullptr)
    , _surface(nullptr)
    , _flushWorker(nullptr)
{
}

Application::~Application() {
    delete _flushWorker;
    _flushWorker = nullptr;
    delete _surface;
    _surface = nullptr;
}

void Application::init() {
    // Initialize platform abstractions
    platform_timing_init();

    // Host link first so that start-up problems get logged
    _host.begin(PICKLIGHT_HOST_BAUD);

    // Timings and log level
    if (!_settings.begin())
        log_warn("Settings not persisted, running on defaults");

    _engine.setAnnouncer(&_link);
    _engine.setCompletionSink(&_host);

    // Detection device; the engine keeps running if it is absent
    _transport = createDeviceTransport();
    if (!_link.begin(_transport, PICKLIGHT_DEVICE_BAUD))
        log_warn("Running without detection device");

    // Strips are started by core 1
    _surface = createLedSurface(_pins);
    _flushWorker = new FlushWorker(*_surface, _frame);

    log_info("picklight %s ready, %ld LEDs on %u strips",
             PICKLIGHT_FW_VERSION, (long)_pins.totalPins(), (unsigned)PICKLIGHT_STRIP_COUNT);
}

void Application::loop() {
    // Process settings (delayed writes)
    _settings.loop();

    // Process host commands
    _host.poll();

    // Process detection device frames
    _link.poll();

    // Advance blink tasks
    _engine.poll();

    platform_delay_ms(CORE0_IDLE_MS);
}

void Application::initCore1() {
    if (!_flushWorker)
        return;
    if (!_flushWorker->begin())
        log_warn("Some LED strips are unavailable, their pixels will be skipped");
}

void Application::loopCore1() {
    if (!_flushWorker)
        return;

    if (_flushWorker->service() == 0)
        platform_delay_ms(CORE1_IDLE_MS);
}
