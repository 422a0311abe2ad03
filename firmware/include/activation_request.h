#pragma once
// =====================================================
// Activation Request (host JSON)
// =====================================================
// {"data":{
//    "init":{"shelves":{"1":{"controlled":0},"2":{"controlled":69}}},
//    "led_sequence":[{"shelf_id":1,"led_id":12},{"shelf_id":2,"led_id":3}],
//    "shelves":{"1":{"leds":{"5":{"on":true,"blinking":true}}}}
// }}
//
// - init.shelves      shelf offset table (controlled defaults to 0)
// - led_sequence      ordered block, in array order
// - shelves.*.leds    on && blinking  -> timeout-blink pin
//                     on && !blinking -> steady LED; one means single
//                     mode, several an ordered block in document order
//                     !on             -> ignored
//
// Ids may be JSON integers or numeric strings.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "activation_engine.h"

enum class RequestParseStatus : uint8_t {
    Ok,
    MalformedJson,
    MissingData,        // no "data" object
    InvalidShelf,       // non-numeric shelf id or controlled value
    InvalidLed,         // non-numeric LED id
    TooManyShelves,
    TooManyLeds,
    Empty,              // nothing to activate
};

struct ActivationRequest {
    ShelfOffset shelves[ENGINE_MAX_SHELVES];
    size_t shelfCount;

    LedRef sequence[BLOCK_MAX_STEPS];       // led_sequence
    size_t sequenceCount;

    LedRef steady[BLOCK_MAX_STEPS];         // shelves.*.leds, on && !blinking
    size_t steadyCount;

    int32_t blinkPins[TIMEOUT_BLINK_MAX_PINS];   // already offset by shelf
    size_t blinkCount;
};

RequestParseStatus parseActivationRequest(const char* json, size_t len, ActivationRequest& out);

const char* requestParseStatusName(RequestParseStatus status);
