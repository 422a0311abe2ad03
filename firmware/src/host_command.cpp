#include "host_command.h"
#include "device_id.h"
#include "event_log.h"
#include "fw_config.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <stdlib.h>
#include <string.h>

// ========= util =========

static void toUpper(char* s) {
    for (char* p = s; *p; ++p) {
        if (*p >= 'a' && *p <= 'z')
            *p = *p - 'a' + 'A';
    }
}

static void toLower(char* s) {
    for (char* p = s; *p; ++p) {
        if (*p >= 'A' && *p <= 'Z')
            *p = *p - 'A' + 'a';
    }
}

static bool parseUint32(const char* text, uint32_t& out) {
    if (!text || *text < '0' || *text > '9')
        return false;
    char* end = nullptr;
    unsigned long v = strtoul(text, &end, 10);
    if (*end != '\0' || v > 0xFFFFFFFFul)
        return false;
    out = static_cast<uint32_t>(v);
    return true;
}

HostCommandHandler::HostCommandHandler(ActivationEngine& engine, ISettingsStore& settings, const DeviceLink& link)
    : _engine(engine)
    , _settings(settings)
    , _link(link)
{
    _buf[0] = '\0';
}

void HostCommandHandler::sendDoc(const JsonDocument& doc) {
    char line[RESPONSE_SIZE];
    if (measureJson(doc) >= sizeof(line)) {
        log_error("Response exceeds %u bytes", (unsigned)RESPONSE_SIZE);
        host_write_line("{\"event\":\"error\",\"msg\":\"response too long\"}");
        return;
    }
    serializeJson(doc, line, sizeof(line));
    host_write_line(line);
}

void HostCommandHandler::sendAck(const char* cmd) {
    JsonDocument doc;
    doc["event"] = "ack";
    doc["cmd"] = cmd;
    sendDoc(doc);
}

void HostCommandHandler::sendError(const char* msg) {
    JsonDocument doc;
    doc["event"] = "error";
    doc["msg"] = msg;
    sendDoc(doc);
}

void HostCommandHandler::begin(unsigned long baud)
{
    platform_serial_begin(baud);

    // Drop anything the CDC stack buffered before the host opened the port
    uint32_t flushStart = platform_millis();
    while (platform_serial_available() > 0 && (platform_millis() - flushStart < 100)) {
        platform_serial_read();
    }

    _len = 0;
    _discarding = false;
}

// Call inside loop()
void HostCommandHandler::poll()
{
    while (platform_serial_available() > 0)
    {
        int c = platform_serial_read();
        if (c < 0) break;  // No data available

        // Support \r\n / \n as line endings
        if (c == '\r')
            continue;

        if (c == '\n')
        {
            if (_discarding)
            {
                _discarding = false;
                sendError("line too long");
            }
            else
            {
                _buf[_len] = '\0';
                if (_len > 0)
                {
                    handleLine(_buf);
                }
            }
            _len = 0;
        }
        else if (!_discarding)
        {
            if (_len < CMD_BUF_SIZE - 1)
            {
                _buf[_len++] = c;
            }
            else
            {
                // Too long: drop it up to the next newline
                _len = 0;
                _discarding = true;
            }
        }
    }
}

void HostCommandHandler::handleLine(const char* line)
{
    // Skip leading whitespace
    while (*line == ' ' || *line == '\t')
        line++;
    if (*line == '\0')
        return;

    if (*line == '{')
    {
        cmdActivate(line);
        return;
    }

    strncpy(_scratch, line, CMD_BUF_SIZE - 1);
    _scratch[CMD_BUF_SIZE - 1] = '\0';

    // First token: command
    char* cmd = strtok(_scratch, " \t");
    if (!cmd)
        return;
    toUpper(cmd);

    if (strcmp(cmd, "HELLO") == 0)
    {
        cmdHello();
    }
    else if (strcmp(cmd, "GET_STATE") == 0)
    {
        cmdGetState();
    }
    else if (strcmp(cmd, "DETECT") == 0)
    {
        char* tokPin = strtok(nullptr, " \t");
        if (!tokPin)
        {
            sendError("DETECT args");
            return;
        }
        cmdDetect(tokPin);
    }
    else if (strcmp(cmd, "STOP") == 0)
    {
        cmdStop();
    }
    else if (strcmp(cmd, "OFF") == 0)
    {
        cmdOff();
    }
    else if (strcmp(cmd, "LOG_LEVEL") == 0)
    {
        char* tokLevel = strtok(nullptr, " \t");
        if (!tokLevel)
        {
            sendError("LOG_LEVEL args");
            return;
        }
        cmdLogLevel(tokLevel);
    }
    else if (strcmp(cmd, "GET_CONFIG") == 0)
    {
        cmdGetConfig();
    }
    else if (strcmp(cmd, "SET_CONFIG") == 0)
    {
        char* tokKey = strtok(nullptr, " \t");
        char* tokValue = strtok(nullptr, " \t");
        if (!tokKey || !tokValue)
        {
            sendError("SET_CONFIG args");
            return;
        }
        cmdSetConfig(tokKey, tokValue);
    }
    else if (strcmp(cmd, "RESET_CONFIG") == 0)
    {
        cmdResetConfig();
    }
    else
    {
        JsonDocument doc;
        doc["event"] = "error";
        doc["msg"] = "unknown command";
        doc["cmd"] = cmd;
        sendDoc(doc);
    }
}

bool HostCommandHandler::notifyBlockCompleted()
{
    if (!platform_serial_connected())
        return false;

    host_write_line("{\"event\":\"block_completed\"}");
    return true;
}

// ========= commands =========

void HostCommandHandler::cmdHello()
{
    char hexId[DEVICE_ID_HEX_LEN + 1];
    formatDeviceId(hexId);

    JsonDocument doc;
    doc["event"] = "hello";
    doc["device_id"] = hexId;
    doc["fw"] = PICKLIGHT_FW_VERSION;
    doc["build"] = PICKLIGHT_BUILD_STAMP;
    doc["hash"] = PICKLIGHT_BUILD_HASH;
    doc["proto"] = PICKLIGHT_HOST_PROTOCOL;
    sendDoc(doc);
}

void HostCommandHandler::cmdGetState()
{
    JsonDocument doc;
    doc["event"] = "state";
    doc["mode"] = engineModeName(_engine.mode());
    doc["completing"] = _engine.isCompleting();

    const Block* block = _engine.currentBlock();
    if (block)
    {
        JsonObject b = doc["block"].to<JsonObject>();
        b["index"] = block->currentIndex();
        b["length"] = block->length();
        b["expected"] = _engine.expectedPin();
    }
    if (_engine.mode() == EngineMode::Single)
        doc["single"] = _engine.singlePin();

    doc["supervisors"] = _engine.supervisorCount();

    JsonArray blinking = doc["blinking"].to<JsonArray>();
    const TimeoutBlinker& blinker = _engine.timeoutBlinker();
    for (size_t i = 0; i < blinker.count(); ++i)
        blinking.add(blinker.pinAt(i));

    JsonObject link = doc["device_link"].to<JsonObject>();
    link["connected"] = _link.isConnected();
    link["rx"] = _link.framesReceived();
    link["tx"] = _link.framesSent();
    link["tx_failures"] = _link.sendFailures();
    link["desyncs"] = _link.desyncCount();

    sendDoc(doc);
}

void HostCommandHandler::cmdActivate(const char* json)
{
    RequestParseStatus parsed = parseActivationRequest(json, strlen(json), _request);
    if (parsed != RequestParseStatus::Ok)
    {
        log_warn("Activation request rejected: %s", requestParseStatusName(parsed));
        JsonDocument doc;
        doc["event"] = "error";
        doc["cmd"] = "ACTIVATE";
        doc["msg"] = requestParseStatusName(parsed);
        sendDoc(doc);
        return;
    }

    const char* mode = "none";
    ActivationStatus status = ActivationStatus::Ok;

    if (_request.sequenceCount > 0)
    {
        if (_request.steadyCount > 0)
            log_warn("led_sequence given, %u steady LEDs ignored", (unsigned)_request.steadyCount);
        mode = "block";
        status = _engine.startBlock(_request.sequence, _request.sequenceCount,
                                    _request.shelves, _request.shelfCount);
    }
    else if (_request.steadyCount == 1)
    {
        mode = "single";
        const LedRef& ref = _request.steady[0];
        int64_t pin = ref.ledId;
        for (size_t i = 0; i < _request.shelfCount; ++i)
        {
            if (_request.shelves[i].shelfId == ref.shelfId)
                pin += _request.shelves[i].controlled;
        }
        if (pin < INT32_MIN || pin > INT32_MAX)
            status = ActivationStatus::InvalidPin;
        else
            status = _engine.setSingleMode(static_cast<int32_t>(pin));
    }
    else if (_request.steadyCount > 1)
    {
        mode = "block";
        status = _engine.startBlock(_request.steady, _request.steadyCount,
                                    _request.shelves, _request.shelfCount);
    }

    // Blinking pins are independent of the steady mode
    ActivationStatus blinkStatus = ActivationStatus::Ok;
    if (_request.blinkCount > 0)
        blinkStatus = _engine.setActiveLeds(_request.blinkPins, _request.blinkCount);

    JsonDocument doc;
    if (status != ActivationStatus::Ok || blinkStatus != ActivationStatus::Ok)
    {
        doc["event"] = "error";
        doc["cmd"] = "ACTIVATE";
        doc["mode"] = mode;
        doc["msg"] = activationStatusName(status != ActivationStatus::Ok ? status : blinkStatus);
    }
    else
    {
        doc["event"] = "ack";
        doc["cmd"] = "ACTIVATE";
        doc["mode"] = mode;
        doc["blinking"] = _request.blinkCount;
    }
    sendDoc(doc);
}

void HostCommandHandler::cmdDetect(const char* pinText)
{
    int32_t pin;
    if (parsePinText(pinText, strlen(pinText), pin) != PinParseResult::Ok)
    {
        sendError("invalid pin");
        return;
    }

    DetectionOutcome outcome = _engine.handleDetection(pin);

    JsonDocument doc;
    doc["event"] = "detection";
    doc["pin"] = pin;
    doc["outcome"] = detectionOutcomeName(outcome);
    sendDoc(doc);
}

void HostCommandHandler::cmdStop()
{
    _engine.stopBlinking();
    sendAck("STOP");
}

void HostCommandHandler::cmdOff()
{
    _engine.turnOffAll();
    sendAck("OFF");
}

void HostCommandHandler::cmdLogLevel(const char* name)
{
    LogLevel level;
    if (!log_level_from_name(name, level))
    {
        sendError("invalid log level");
        return;
    }
    _settings.setLogLevel(level);

    JsonDocument doc;
    doc["event"] = "ack";
    doc["cmd"] = "LOG_LEVEL";
    doc["level"] = log_level_name(level);
    sendDoc(doc);
}

void HostCommandHandler::cmdGetConfig()
{
    JsonDocument doc;
    doc["event"] = "config";
    JsonObject values = doc["values"].to<JsonObject>();
    for (size_t i = 0; i < timingSettingKeyCount(); ++i)
    {
        const TimingSettingKey& key = timingSettingKeyAt(i);
        values[key.name] = _settings.timing().*(key.field);
    }
    doc["log_level"] = log_level_name(_settings.logLevel());
    sendDoc(doc);
}

void HostCommandHandler::cmdSetConfig(const char* key, const char* valueText)
{
    char name[64];
    strncpy(name, key, sizeof(name) - 1);
    name[sizeof(name) - 1] = '\0';
    toLower(name);

    uint32_t value;
    if (!parseUint32(valueText, value))
    {
        sendError("invalid value");
        return;
    }

    SettingResult result = _settings.set(name, value);
    if (result == SettingResult::UnknownKey)
    {
        sendError("unknown key");
        return;
    }
    if (result == SettingResult::OutOfRange)
    {
        sendError("value out of range");
        return;
    }

    JsonDocument doc;
    doc["event"] = "ack";
    doc["cmd"] = "SET_CONFIG";
    doc["key"] = name;
    doc["value"] = value;
    sendDoc(doc);
}

void HostCommandHandler::cmdResetConfig()
{
    // Acknowledge before the flash commit blocks
    sendAck("RESET_CONFIG");
    _settings.resetDefaults();
}
