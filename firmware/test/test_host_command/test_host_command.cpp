// =====================================================
// Host Command Handler Unit Tests
// =====================================================
// Line assembly, command routing and JSON responses on
// the mock host serial port.
// Run with: ctest --test-dir build -R test_host_command
// =====================================================

#include <unity.h>
#include <string>
#include "host_command.h"
#include "platform_timing.h"
#include "../mock_platform.h"
#include "../mock_settings_store.h"

// =====================================================
// Test Fixtures
// =====================================================

PinMap pins(2, 69, 69);
MockSettingsStore settings;

LedFrame* frame = nullptr;
ActivationEngine* engine = nullptr;
DeviceLink* deviceLink = nullptr;
HostCommandHandler* host = nullptr;

void setUp() {
    mock_platform_reset();
    settings.reset();
    // Keep engine logs out of the captured responses
    log_set_level(LogLevel::Error);

    frame = new LedFrame(pins);
    engine = new ActivationEngine(pins, *frame, settings.timing());
    deviceLink = new DeviceLink(*engine);
    host = new HostCommandHandler(*engine, settings, *deviceLink);
    engine->setCompletionSink(host);
    host->begin(115200);
}

void tearDown() {
    delete host;
    delete deviceLink;
    delete engine;
    delete frame;
    host = nullptr;
    deviceLink = nullptr;
    engine = nullptr;
    frame = nullptr;
    log_set_level(LogLevel::Info);
}

static void send(const char* line) {
    mock_serial_clear_output();
    mock_serial_push_input(line);
    mock_serial_push_input("\n");
    host->poll();
}

static void assertOutput(const char* text) {
    if (!mock_serial_output_contains(text)) {
        std::string msg = "missing " + std::string(text) + " in " + mock_serial_output();
        TEST_FAIL_MESSAGE(msg.c_str());
    }
}

static const char* BLOCK_REQUEST =
    "{\"data\":{\"init\":{\"shelves\":{\"1\":{\"controlled\":0}}},"
    "\"led_sequence\":[{\"shelf_id\":1,\"led_id\":12},{\"shelf_id\":1,\"led_id\":13}]}}";

// =====================================================
// Line Handling
// =====================================================

void test_begin_drops_stale_input() {
    mock_serial_push_input("garbage");
    host->begin(115200);
    mock_serial_clear_output();

    host->poll();
    TEST_ASSERT_EQUAL_STRING("", mock_serial_output().c_str());
}

void test_hello() {
    send("HELLO");

    assertOutput("{\"event\":\"hello\",\"device_id\":\"E6605838832A4B2F\"");
    assertOutput("\"proto\":1");
}

void test_crlf_and_lowercase() {
    mock_serial_clear_output();
    mock_serial_push_input("  get_state\r\n");
    host->poll();

    assertOutput("{\"event\":\"state\",\"mode\":\"idle\",\"completing\":false");
}

void test_line_split_across_polls() {
    mock_serial_clear_output();
    mock_serial_push_input("HEL");
    host->poll();
    TEST_ASSERT_EQUAL_STRING("", mock_serial_output().c_str());

    mock_serial_push_input("LO\n");
    host->poll();
    assertOutput("\"event\":\"hello\"");
}

void test_unknown_command() {
    send("frobnicate now");

    assertOutput("{\"event\":\"error\",\"msg\":\"unknown command\",\"cmd\":\"FROBNICATE\"}");
}

void test_overlong_line_is_rejected() {
    std::string longLine(2100, 'A');
    send(longLine.c_str());

    assertOutput("{\"event\":\"error\",\"msg\":\"line too long\"}");

    send("HELLO");
    assertOutput("\"event\":\"hello\"");
}

// =====================================================
// Activation
// =====================================================

void test_activate_block() {
    send(BLOCK_REQUEST);

    assertOutput("{\"event\":\"ack\",\"cmd\":\"ACTIVATE\",\"mode\":\"block\",\"blinking\":0}");
    TEST_ASSERT_TRUE(engine->blockActive());
    TEST_ASSERT_EQUAL_INT32(12, engine->expectedPin());

    send("GET_STATE");
    assertOutput("\"block\":{\"index\":0,\"length\":2,\"expected\":12}");
    assertOutput("\"device_link\":{\"connected\":false");
}

void test_activate_single_with_shelf_offset() {
    send("{\"data\":{\"init\":{\"shelves\":{\"2\":{\"controlled\":69}}},"
         "\"shelves\":{\"2\":{\"leds\":{\"5\":{\"on\":true}}}}}}");

    assertOutput("\"mode\":\"single\"");
    TEST_ASSERT_EQUAL(EngineMode::Single, engine->mode());
    TEST_ASSERT_EQUAL_INT32(74, engine->singlePin());
}

void test_activate_blinking() {
    send("{\"data\":{\"shelves\":{\"1\":{\"leds\":{\"5\":{\"on\":true,\"blinking\":true}}}}}}");

    assertOutput("{\"event\":\"ack\",\"cmd\":\"ACTIVATE\",\"mode\":\"none\",\"blinking\":1}");
    TEST_ASSERT_TRUE(engine->timeoutBlinker().contains(5));

    send("GET_STATE");
    assertOutput("\"blinking\":[5]");
}

void test_activate_malformed() {
    send("{\"data\":");

    assertOutput("{\"event\":\"error\",\"cmd\":\"ACTIVATE\",\"msg\":\"malformed_json\"}");
}

void test_activate_conflict() {
    send(BLOCK_REQUEST);
    send(BLOCK_REQUEST);

    assertOutput("{\"event\":\"error\",\"cmd\":\"ACTIVATE\",\"mode\":\"block\",\"msg\":\"conflict\"}");
}

void test_activate_out_of_range() {
    send("{\"data\":{\"led_sequence\":[{\"shelf_id\":1,\"led_id\":500},{\"shelf_id\":1,\"led_id\":2}]}}");

    assertOutput("\"msg\":\"invalid_pin\"");
    TEST_ASSERT_FALSE(engine->blockActive());
}

// =====================================================
// Detection and Reset
// =====================================================

void test_detect() {
    send(BLOCK_REQUEST);
    send("DETECT 12");

    assertOutput("{\"event\":\"detection\",\"pin\":12,\"outcome\":\"advanced\"}");
    TEST_ASSERT_EQUAL_INT32(13, engine->expectedPin());
}

void test_detect_errors() {
    send("DETECT");
    assertOutput("{\"event\":\"error\",\"msg\":\"DETECT args\"}");

    send("DETECT twelve");
    assertOutput("{\"event\":\"error\",\"msg\":\"invalid pin\"}");

    send("DETECT 999");
    assertOutput("\"outcome\":\"invalid_pin\"");
}

void test_stop_and_off() {
    send(BLOCK_REQUEST);

    send("STOP");
    assertOutput("{\"event\":\"ack\",\"cmd\":\"STOP\"}");
    TEST_ASSERT_FALSE(engine->blockActive());

    send(BLOCK_REQUEST);
    send("off");
    assertOutput("{\"event\":\"ack\",\"cmd\":\"OFF\"}");
    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
}

void test_block_completion_reported() {
    send("{\"data\":{\"led_sequence\":[{\"shelf_id\":1,\"led_id\":12}]}}");
    send("DETECT 12");
    TEST_ASSERT_TRUE(engine->isCompleting());

    mock_serial_clear_output();
    for (uint32_t t = 0; t <= 3000; t += 100) {
        mock_time_set(t);
        engine->poll();
    }

    assertOutput("{\"event\":\"block_completed\"}");
    TEST_ASSERT_FALSE(engine->isCompleting());
}

void test_completion_not_reported_without_host() {
    mock_serial_set_connected(false);
    TEST_ASSERT_FALSE(host->notifyBlockCompleted());

    mock_serial_set_connected(true);
    TEST_ASSERT_TRUE(host->notifyBlockCompleted());
}

// =====================================================
// Configuration
// =====================================================

void test_log_level() {
    send("LOG_LEVEL WARN");
    assertOutput("{\"event\":\"ack\",\"cmd\":\"LOG_LEVEL\",\"level\":\"warn\"}");
    TEST_ASSERT_EQUAL(LogLevel::Warn, settings.logLevel());

    send("LOG_LEVEL loud");
    assertOutput("{\"event\":\"error\",\"msg\":\"invalid log level\"}");

    send("LOG_LEVEL");
    assertOutput("{\"event\":\"error\",\"msg\":\"LOG_LEVEL args\"}");
}

void test_get_config() {
    send("GET_CONFIG");

    assertOutput("{\"event\":\"config\",\"values\":{\"debounce_ms\":100,");
    assertOutput("\"completion_flash_interval_ms\":500}");
    assertOutput("\"log_level\":\"info\"");
}

void test_set_config() {
    send("SET_CONFIG DEBOUNCE_MS 250");

    assertOutput("{\"event\":\"ack\",\"cmd\":\"SET_CONFIG\",\"key\":\"debounce_ms\",\"value\":250}");
    TEST_ASSERT_EQUAL_UINT32(250, settings.timing().debounceMs);
    TEST_ASSERT_EQUAL_UINT32(250, engine->settings().debounceMs);
}

void test_set_config_errors() {
    send("SET_CONFIG no_such_key 1");
    assertOutput("\"msg\":\"unknown key\"");

    send("SET_CONFIG debounce_ms abc");
    assertOutput("\"msg\":\"invalid value\"");

    send("SET_CONFIG debounce_ms -1");
    assertOutput("\"msg\":\"invalid value\"");

    send("SET_CONFIG per_led_cooldown_ms 0");
    assertOutput("\"msg\":\"value out of range\"");

    send("SET_CONFIG debounce_ms");
    assertOutput("\"msg\":\"SET_CONFIG args\"");
}

void test_reset_config() {
    settings.set("debounce_ms", 300);

    send("RESET_CONFIG");

    assertOutput("{\"event\":\"ack\",\"cmd\":\"RESET_CONFIG\"}");
    TEST_ASSERT_EQUAL(1, settings.resetDefaultsCallCount);
    TEST_ASSERT_EQUAL_UINT32(100, settings.timing().debounceMs);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_begin_drops_stale_input);
    RUN_TEST(test_hello);
    RUN_TEST(test_crlf_and_lowercase);
    RUN_TEST(test_line_split_across_polls);
    RUN_TEST(test_unknown_command);
    RUN_TEST(test_overlong_line_is_rejected);

    RUN_TEST(test_activate_block);
    RUN_TEST(test_activate_single_with_shelf_offset);
    RUN_TEST(test_activate_blinking);
    RUN_TEST(test_activate_malformed);
    RUN_TEST(test_activate_conflict);
    RUN_TEST(test_activate_out_of_range);

    RUN_TEST(test_detect);
    RUN_TEST(test_detect_errors);
    RUN_TEST(test_stop_and_off);
    RUN_TEST(test_block_completion_reported);
    RUN_TEST(test_completion_not_reported_without_host);

    RUN_TEST(test_log_level);
    RUN_TEST(test_get_config);
    RUN_TEST(test_set_config);
    RUN_TEST(test_set_config_errors);
    RUN_TEST(test_reset_config);

    return UNITY_END();
}
