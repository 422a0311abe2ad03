#pragma once
#include <stdint.h>

// Colors the pick guidance uses
enum class LedColor : uint8_t {
    Off   = 0,
    Green = 1,   // pin to pick / completion flash
    Red   = 2,   // wrong pick / unconfirmed timeout pin
};

struct LedRgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline LedRgb ledColorRgb(LedColor color) {
    switch (color) {
        case LedColor::Green: return LedRgb{0, 255, 0};
        case LedColor::Red:   return LedRgb{255, 0, 0};
        case LedColor::Off:
        default:              return LedRgb{0, 0, 0};
    }
}

inline const char* ledColorName(LedColor color) {
    switch (color) {
        case LedColor::Green: return "green";
        case LedColor::Red:   return "red";
        case LedColor::Off:
        default:              return "off";
    }
}
