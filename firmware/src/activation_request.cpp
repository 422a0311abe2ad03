#include "activation_request.h"
#include "pin_map.h"
#include <ArduinoJson.h>
#include <string.h>

const char* requestParseStatusName(RequestParseStatus status) {
    switch (status) {
        case RequestParseStatus::Ok:             return "ok";
        case RequestParseStatus::MalformedJson:  return "malformed_json";
        case RequestParseStatus::MissingData:    return "missing_data";
        case RequestParseStatus::InvalidShelf:   return "invalid_shelf";
        case RequestParseStatus::InvalidLed:     return "invalid_led";
        case RequestParseStatus::TooManyShelves: return "too_many_shelves";
        case RequestParseStatus::TooManyLeds:    return "too_many_leds";
        case RequestParseStatus::Empty:          return "empty";
    }
    return "unknown";
}

static bool parseIdText(const char* text, int32_t& out) {
    if (!text)
        return false;
    return parsePinText(text, strlen(text), out) == PinParseResult::Ok;
}

static bool parseId(JsonVariantConst v, int32_t& out) {
    if (v.is<int32_t>()) {
        out = v.as<int32_t>();
        return true;
    }
    if (v.is<const char*>())
        return parseIdText(v.as<const char*>(), out);
    return false;
}

static int32_t controlledOf(const ActivationRequest& req, int32_t shelfId) {
    for (size_t i = 0; i < req.shelfCount; ++i) {
        if (req.shelves[i].shelfId == shelfId)
            return req.shelves[i].controlled;
    }
    return 0;
}

static RequestParseStatus parseShelfTable(JsonObjectConst shelves, ActivationRequest& out) {
    for (JsonPairConst kv : shelves) {
        int32_t shelfId;
        if (!parseIdText(kv.key().c_str(), shelfId))
            return RequestParseStatus::InvalidShelf;

        int32_t controlled = 0;
        JsonVariantConst c = kv.value()["controlled"];
        if (!c.isNull() && !parseId(c, controlled))
            return RequestParseStatus::InvalidShelf;

        // A repeated key replaces the earlier entry
        size_t slot = out.shelfCount;
        for (size_t i = 0; i < out.shelfCount; ++i) {
            if (out.shelves[i].shelfId == shelfId)
                slot = i;
        }
        if (slot == out.shelfCount) {
            if (out.shelfCount >= ENGINE_MAX_SHELVES)
                return RequestParseStatus::TooManyShelves;
            out.shelfCount++;
        }
        out.shelves[slot].shelfId = shelfId;
        out.shelves[slot].controlled = controlled;
    }
    return RequestParseStatus::Ok;
}

static RequestParseStatus parseSequence(JsonArrayConst seq, ActivationRequest& out) {
    for (JsonVariantConst item : seq) {
        LedRef ref;
        if (!parseId(item["shelf_id"], ref.shelfId))
            return RequestParseStatus::InvalidShelf;
        if (!parseId(item["led_id"], ref.ledId))
            return RequestParseStatus::InvalidLed;

        if (out.sequenceCount >= BLOCK_MAX_STEPS)
            return RequestParseStatus::TooManyLeds;
        out.sequence[out.sequenceCount++] = ref;
    }
    return RequestParseStatus::Ok;
}

static RequestParseStatus parseLedStates(JsonObjectConst shelves, ActivationRequest& out) {
    for (JsonPairConst shelf : shelves) {
        int32_t shelfId;
        if (!parseIdText(shelf.key().c_str(), shelfId))
            return RequestParseStatus::InvalidShelf;

        JsonObjectConst leds = shelf.value()["leds"].as<JsonObjectConst>();
        for (JsonPairConst led : leds) {
            int32_t ledId;
            if (!parseIdText(led.key().c_str(), ledId))
                return RequestParseStatus::InvalidLed;

            bool on = led.value()["on"] | false;
            bool blinking = led.value()["blinking"] | false;
            if (!on)
                continue;

            if (blinking) {
                int64_t pin = static_cast<int64_t>(ledId) + controlledOf(out, shelfId);
                if (pin < INT32_MIN || pin > INT32_MAX)
                    return RequestParseStatus::InvalidLed;
                if (out.blinkCount >= TIMEOUT_BLINK_MAX_PINS)
                    return RequestParseStatus::TooManyLeds;
                out.blinkPins[out.blinkCount++] = static_cast<int32_t>(pin);
            } else {
                if (out.steadyCount >= BLOCK_MAX_STEPS)
                    return RequestParseStatus::TooManyLeds;
                out.steady[out.steadyCount].shelfId = shelfId;
                out.steady[out.steadyCount].ledId = ledId;
                out.steadyCount++;
            }
        }
    }
    return RequestParseStatus::Ok;
}

RequestParseStatus parseActivationRequest(const char* json, size_t len, ActivationRequest& out) {
    out.shelfCount = 0;
    out.sequenceCount = 0;
    out.steadyCount = 0;
    out.blinkCount = 0;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json, len);
    if (err)
        return RequestParseStatus::MalformedJson;

    JsonObjectConst data = doc["data"].as<JsonObjectConst>();
    if (data.isNull())
        return RequestParseStatus::MissingData;

    // The shelf table comes first: blinking pins are offset with it
    RequestParseStatus status = parseShelfTable(data["init"]["shelves"].as<JsonObjectConst>(), out);
    if (status != RequestParseStatus::Ok)
        return status;

    status = parseSequence(data["led_sequence"].as<JsonArrayConst>(), out);
    if (status != RequestParseStatus::Ok)
        return status;

    status = parseLedStates(data["shelves"].as<JsonObjectConst>(), out);
    if (status != RequestParseStatus::Ok)
        return status;

    if (out.sequenceCount == 0 && out.steadyCount == 0 && out.blinkCount == 0)
        return RequestParseStatus::Empty;
    return RequestParseStatus::Ok;
}
