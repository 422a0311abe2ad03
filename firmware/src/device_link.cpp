#include "device_link.h"
#include "event_log.h"
#include <string.h>

DeviceLink::DeviceLink(ActivationEngine& engine)
    : _engine(engine)
    , _transport(nullptr)
    , _framesReceived(0)
    , _framesSent(0)
    , _sendFailures(0)
{
}

bool DeviceLink::begin(IDeviceTransport* transport, uint32_t baud) {
    _transport = transport;
    _codec.clear();

    if (_transport == nullptr) {
        log_error("No detection device transport");
        return false;
    }
    if (!_transport->open(baud)) {
        log_error("Failed to open detection device link at %lu baud", (unsigned long)baud);
        return false;
    }

    log_info("Detection device link opened at %lu baud", (unsigned long)baud);
    return true;
}

bool DeviceLink::isConnected() const {
    return _transport != nullptr && _transport->isOpen();
}

// =====================================================
// Inbound
// =====================================================

void DeviceLink::poll() {
    if (!isConnected())
        return;

    uint8_t chunk[READ_CHUNK];
    for (size_t c = 0; c < MAX_CHUNKS_PER_POLL; ++c) {
        size_t n = _transport->read(chunk, sizeof(chunk));
        if (n == 0)
            break;

        // A full buffer is drained before the rest is appended.
        // On desync the rest of the chunk goes with it.
        size_t offset = 0;
        do {
            offset += _codec.append(chunk + offset, n - offset);
            if (!drainFrames())
                break;
        } while (offset < n);
    }
}

bool DeviceLink::drainFrames() {
    char payload[DEVICE_PAYLOAD_MAX];

    for (;;) {
        FrameStatus status = _codec.next(payload, sizeof(payload));
        switch (status) {
            case FrameStatus::Frame:
                _framesReceived++;
                handlePayload(payload);
                break;
            case FrameStatus::Oversized:
                log_warn("Frame longer than %u bytes dropped", (unsigned)(DEVICE_PAYLOAD_MAX - 1));
                break;
            case FrameStatus::Desync:
                log_error("Buffer overflow, clearing buffer");
                return false;
            case FrameStatus::None:
                return true;
        }
    }
}

void DeviceLink::handlePayload(const char* payload) {
    log_debug("Processing command: #%s#", payload);

    classifyDevicePayload(payload, _msg);

    char frame[DEVICE_LINE_MAX];
    switch (_msg.type) {
        case DeviceMessageType::Detected:
            handleDetected(_msg.pin);
            break;

        case DeviceMessageType::InvalidDetection:
            log_error("Invalid detected LED number: %s", payload);
            send(frame, formatInvalidDetectionAck(frame, sizeof(frame)));
            break;

        case DeviceMessageType::Stop:
            _engine.stopBlinking();
            send(frame, formatStopAck(frame, sizeof(frame)));
            log_info("Processed STOP command");
            break;

        case DeviceMessageType::PinList:
            handlePinList(_msg);
            break;

        case DeviceMessageType::Unknown:
            log_warn("No valid LED numbers found in the command");
            break;
    }
}

void DeviceLink::handleDetected(int32_t pin) {
    char frame[DEVICE_LINE_MAX];

    if (!_engine.pinMap().isValid(pin)) {
        log_error("Detected LED %ld out of range", (long)pin);
        send(frame, formatInvalidDetectionAck(frame, sizeof(frame)));
        return;
    }

    log_info("Received detection confirmation for LED %ld", (long)pin);

    if (_engine.blockActive()) {
        if (_engine.isBlockMember(pin)) {
            DetectionOutcome outcome = _engine.handleDetection(pin);
            log_info("LED %ld is correct (%s)", (long)pin, detectionOutcomeName(outcome));
            send(frame, formatCorrectAck(frame, sizeof(frame), pin));
        } else {
            _engine.handleIncorrectDetection(pin);
            log_info("LED %ld is incorrect", (long)pin);
            send(frame, formatFalseAck(frame, sizeof(frame), pin));
        }
        return;
    }

    // Single and timeout-blink pins are confirmed first; anything else is a wrong pick
    DetectionOutcome outcome = _engine.handleDetection(pin);
    if (outcome == DetectionOutcome::Confirmed) {
        send(frame, formatCorrectAck(frame, sizeof(frame), pin));
    } else {
        _engine.handleIncorrectDetection(pin);
        log_info("LED %ld is incorrect (%s)", (long)pin, detectionOutcomeName(outcome));
        send(frame, formatFalseAck(frame, sizeof(frame), pin));
    }
}

void DeviceLink::handlePinList(const DeviceMessage& msg) {
    if (msg.rejectedCount > 0)
        log_error("%u invalid LED numbers received", (unsigned)msg.rejectedCount);

    // A cut-down list would start the wrong block, so nothing is started or echoed
    if (msg.overflow) {
        log_warn("LED command refused: %s (more than %u LEDs)",
                 activationStatusName(ActivationStatus::TooLong), (unsigned)DEVICE_MAX_PIN_LIST);
        return;
    }

    ActivationStatus status;
    if (msg.pinCount > 1) {
        status = _engine.startBlockPins(msg.pins, msg.pinCount);
        log_info("Processed LED block command with %u LEDs: %s",
                 (unsigned)msg.pinCount, activationStatusName(status));
    } else {
        status = _engine.setSingleMode(msg.pins[0]);
        log_info("Processed LED single command %ld: %s",
                 (long)msg.pins[0], activationStatusName(status));
    }
    if (status != ActivationStatus::Ok)
        log_warn("LED command refused: %s", activationStatusName(status));

    // The device expects the echo whether or not the engine accepted the command
    char frame[DEVICE_LINE_MAX];
    send(frame, formatPinListAck(frame, sizeof(frame), msg.pins, msg.pinCount));
}

// =====================================================
// Outbound
// =====================================================

void DeviceLink::announceActivePin(int32_t pin) {
    char frame[DEVICE_LINE_MAX];
    if (send(frame, formatActivePinFrame(frame, sizeof(frame), pin)))
        log_debug("Sent active LED %ld", (long)pin);
}

bool DeviceLink::send(const char* frame, size_t len) {
    if (len == 0) {
        log_error("Outbound frame does not fit %u bytes", (unsigned)DEVICE_LINE_MAX);
        _sendFailures++;
        return false;
    }
    if (!isConnected()) {
        log_warn("Transport is not available, cannot send message");
        _sendFailures++;
        return false;
    }

    size_t written = _transport->write(reinterpret_cast<const uint8_t*>(frame), len);
    if (written != len) {
        log_error("Short write to detection device (%u of %u bytes)", (unsigned)written, (unsigned)len);
        _sendFailures++;
        return false;
    }

    _framesSent++;
    return true;
}
