#pragma once
#include <stdint.h>
#include <stddef.h>
#include "activation_engine.h"
#include "device_protocol.h"
#include "frame_codec.h"
#include "i_device_transport.h"
#include "i_pin_announcer.h"

// =====================================================
// Detection Device Link
// =====================================================
//
// Inbound:  transport bytes -> FrameCodec -> payload ->
//           classifyDevicePayload() -> ActivationEngine
// Outbound: armed-pin frames and acknowledgements
//
// Acknowledgement rules:
// - DETECTED:<n> while a block is active
//     n in the block      -> engine.handleDetection, #CORRECT:n#
//     n not in the block  -> engine.handleIncorrectDetection, #FALSE:n#
// - DETECTED:<n> otherwise
//     engine.handleDetection; #CORRECT:n# if it confirmed a
//     single or blinking pin, else #FALSE:n#
// - DETECTED:<bad>  -> #INVALID_DETECTION#
// - STOP            -> engine.stopBlinking, #STOP#
// - a,b,c           -> block (or single for one pin), echo #a,b,c#
//
// Writes while the transport is closed are dropped with a
// warning; the engine keeps running.
//
// Usage:
//   DeviceLink link(engine);
//   link.begin(createDeviceTransport(), PICKLIGHT_DEVICE_BAUD);
//   engine.setAnnouncer(&link);
//   Call link.poll() inside loop()
//

class DeviceLink : public IPinAnnouncer {
public:
    explicit DeviceLink(ActivationEngine& engine);

    // Open the transport. False if it is missing or would not open;
    // the link then stays silent until begin() succeeds.
    bool begin(IDeviceTransport* transport, uint32_t baud);

    // Read what the transport has buffered and dispatch every complete frame
    void poll();

    // Send "#<pin>#\n"
    void announceActivePin(int32_t pin) override;

    bool isConnected() const;
    uint32_t desyncCount() const { return _codec.desyncCount(); }
    uint32_t framesReceived() const { return _framesReceived; }
    uint32_t framesSent() const { return _framesSent; }
    uint32_t sendFailures() const { return _sendFailures; }

private:
    static constexpr size_t READ_CHUNK = 64;
    static constexpr size_t MAX_CHUNKS_PER_POLL = 8;

    // False if the buffer was discarded as desync
    bool drainFrames();
    void handlePayload(const char* payload);
    void handleDetected(int32_t pin);
    void handlePinList(const DeviceMessage& msg);
    bool send(const char* frame, size_t len);

    ActivationEngine& _engine;
    IDeviceTransport* _transport;
    FrameCodec _codec;
    DeviceMessage _msg;

    uint32_t _framesReceived;
    uint32_t _framesSent;
    uint32_t _sendFailures;
};
