#pragma once
// =====================================================
// Detection Device Protocol
// =====================================================
// Payload classification and outbound frame formatting.
//
// Device -> controller payloads:
//   DETECTED:<int>     a touch was seen at <int>
//   STOP               stop all blinking (any case)
//   <int>[,<int>]*     legacy activation: one pin = single
//                      mode, several = ordered block
//
// Controller -> device:
//   #<pin>#\n               pin now armed
//   #CORRECT:<n>#\n         detection accepted
//   #FALSE:<n>#\n           detection rejected
//   #INVALID_DETECTION#\n   unparseable detection
//   #STOP#\n                stop acknowledged
//   #a,b,c#\n               echo of an accepted pin list
// =====================================================

#include <stdint.h>
#include <stddef.h>

constexpr size_t DEVICE_PAYLOAD_MAX  = 256;   // incl. NUL
constexpr size_t DEVICE_MAX_PIN_LIST = 64;
constexpr size_t DEVICE_LINE_MAX     = 512;   // formatted outbound frame

enum class DeviceMessageType : uint8_t {
    Detected,
    InvalidDetection,
    Stop,
    PinList,
    Unknown,          // no usable content
};

struct DeviceMessage {
    DeviceMessageType type;
    int32_t pin;                          // Detected
    int32_t pins[DEVICE_MAX_PIN_LIST];    // PinList, in order
    size_t pinCount;
    size_t rejectedCount;                 // PinList items that were not integers
    bool overflow;                        // more valid pins than DEVICE_MAX_PIN_LIST
};

// payload must be NUL-terminated and already trimmed
void classifyDevicePayload(const char* payload, DeviceMessage& out);

// Format helpers return the frame length, 0 if it did not fit
size_t formatActivePinFrame(char* out, size_t size, int32_t pin);
size_t formatCorrectAck(char* out, size_t size, int32_t pin);
size_t formatFalseAck(char* out, size_t size, int32_t pin);
size_t formatInvalidDetectionAck(char* out, size_t size);
size_t formatStopAck(char* out, size_t size);
size_t formatPinListAck(char* out, size_t size, const int32_t* pins, size_t count);
