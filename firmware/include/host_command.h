#pragma once
#include <stdint.h>
#include <stddef.h>
#include <ArduinoJson.h>
#include "activation_engine.h"
#include "activation_request.h"
#include "device_link.h"
#include "i_completion_sink.h"
#include "i_settings_store.h"

// USB serial command handler for the host adapter
//
// Commands (case-insensitive, one per line):
//   HELLO
//   GET_STATE
//   {...}                   activation request (JSON)
//   DETECT <pin>            internally-sourced detection
//   STOP / OFF
//   LOG_LEVEL <debug|info|warn|error>
//   GET_CONFIG
//   SET_CONFIG <key> <value>
//   RESET_CONFIG
//
// Every response is one JSON line. Block completion is
// reported here as {"event":"block_completed"}.
//
// Usage:
//   HostCommandHandler host(engine, settings, link);
//   host.begin(PICKLIGHT_HOST_BAUD);
//   engine.setCompletionSink(&host);
//   Call host.poll() inside loop()
class HostCommandHandler : public ICompletionSink {
public:
    HostCommandHandler(ActivationEngine& engine, ISettingsStore& settings, const DeviceLink& link);

    // Initialize serial and drop any power-up noise
    void begin(unsigned long baud = 115200);

    // Call periodically to process input and output responses
    void poll();

    // Run one complete line (no line ending)
    void handleLine(const char* line);

    // ICompletionSink; false while no host holds the port open
    bool notifyBlockCompleted() override;

private:
    static constexpr size_t CMD_BUF_SIZE = 2048;
    static constexpr size_t RESPONSE_SIZE = 768;

    ActivationEngine& _engine;
    ISettingsStore& _settings;
    const DeviceLink& _link;

    char _buf[CMD_BUF_SIZE];
    char _scratch[CMD_BUF_SIZE];
    size_t _len = 0;
    bool _discarding = false;   // rest of an overlong line

    ActivationRequest _request;

    // commands
    void cmdHello();
    void cmdGetState();
    void cmdActivate(const char* json);
    void cmdDetect(const char* pinText);
    void cmdStop();
    void cmdOff();
    void cmdLogLevel(const char* name);
    void cmdGetConfig();
    void cmdSetConfig(const char* key, const char* valueText);
    void cmdResetConfig();

    // utils
    void sendDoc(const JsonDocument& doc);
    void sendAck(const char* cmd);
    void sendError(const char* msg);
};
