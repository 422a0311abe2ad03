// LED surface for WS2812 strips driven by Adafruit NeoPixel (RP2040 PIO backend)
#include "i_led_surface.h"
#include "board_config.h"
#include "event_log.h"
#include <Adafruit_NeoPixel.h>

static const int16_t STRIP_DATA_PINS[PIN_MAP_MAX_STRIPS] = {
    PICKLIGHT_STRIP0_PIN, PICKLIGHT_STRIP1_PIN, PICKLIGHT_STRIP2_PIN, PICKLIGHT_STRIP3_PIN
};

class NeoPixelLedSurface : public ILedSurface {
public:
    explicit NeoPixelLedSurface(const PinMap& pins)
        : _pins(pins)
    {
        for (uint8_t i = 0; i < PIN_MAP_MAX_STRIPS; ++i) {
            _strips[i] = nullptr;
            _dirty[i] = false;
        }
    }

    ~NeoPixelLedSurface() override {
        for (uint8_t i = 0; i < PIN_MAP_MAX_STRIPS; ++i) {
            delete _strips[i];
            _strips[i] = nullptr;
        }
    }

    bool begin() override {
        bool ok = true;
        for (uint8_t i = 0; i < _pins.stripCount(); ++i) {
            _strips[i] = new Adafruit_NeoPixel(_pins.ledsPerStrip(), STRIP_DATA_PINS[i], NEO_GRB + NEO_KHZ800);
            // numPixels() stays 0 when the pixel buffer could not be allocated
            if (_strips[i]->numPixels() != _pins.ledsPerStrip()) {
                log_error("strip %u: pixel buffer allocation failed", (unsigned)i);
                delete _strips[i];
                _strips[i] = nullptr;
                ok = false;
                continue;
            }
            _strips[i]->begin();
            _strips[i]->clear();
            _dirty[i] = true;
        }
        return ok;
    }

    bool set(int32_t pin, LedColor color) override {
        PinLocation loc;
        if (!_pins.resolve(pin, loc))
            return false;

        Adafruit_NeoPixel* strip = _strips[loc.strip];
        if (!strip)
            return false;

        LedRgb rgb = ledColorRgb(color);
        strip->setPixelColor(loc.offset, Adafruit_NeoPixel::Color(rgb.r, rgb.g, rgb.b));
        _dirty[loc.strip] = true;
        return true;
    }

    bool flush() override {
        bool ok = true;
        for (uint8_t i = 0; i < _pins.stripCount(); ++i) {
            if (!_dirty[i])
                continue;
            _dirty[i] = false;
            if (!_strips[i]) {
                ok = false;
                continue;
            }
            _strips[i]->show();
        }
        return ok;
    }

private:
    const PinMap& _pins;
    Adafruit_NeoPixel* _strips[PIN_MAP_MAX_STRIPS];
    bool _dirty[PIN_MAP_MAX_STRIPS];
};

ILedSurface* createLedSurface(const PinMap& pins) {
    return new NeoPixelLedSurface(pins);
}
