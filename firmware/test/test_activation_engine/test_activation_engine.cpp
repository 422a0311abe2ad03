// =====================================================
// Activation Engine Unit Tests
// =====================================================
// Modes, detections, supervisors, completion and reset
// against a 2 x 69 LED geometry.
// Run with: ctest --test-dir build -R test_activation_engine
// =====================================================

#include <unity.h>
#include "activation_engine.h"
#include "platform_timing.h"
#include "../mock_completion_sink.h"
#include "../mock_pin_announcer.h"
#include "../mock_platform.h"

// =====================================================
// Test Fixtures
// =====================================================

PinMap pins(2, 69, 69);
TimingSettings settings;
MockPinAnnouncer announcer;
MockCompletionSink sink;

LedFrame* frame = nullptr;
ActivationEngine* engine = nullptr;

void setUp() {
    mock_platform_reset();
    timingSettingsDefaults(settings);
    announcer.reset();
    sink.reset();

    frame = new LedFrame(pins);
    engine = new ActivationEngine(pins, *frame, settings);
    engine->setAnnouncer(&announcer);
    engine->setCompletionSink(&sink);
}

void tearDown() {
    delete engine;
    delete frame;
    engine = nullptr;
    frame = nullptr;
}

static DetectionOutcome detectAt(uint32_t ms, int32_t pin) {
    mock_time_set(ms);
    return engine->handleDetection(pin);
}

// Poll every 100 ms from now until untilMs (inclusive)
static void runUntil(uint32_t untilMs) {
    for (;;) {
        engine->poll();
        uint32_t now = platform_millis();
        if (now >= untilMs)
            break;
        mock_time_set(now + 100 > untilMs ? untilMs : now + 100);
    }
}

// =====================================================
// Block Mode
// =====================================================

void test_block_happy_path() {
    const int32_t block[] = { 12, 13, 14 };
    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlockPins(block, 3));

    TEST_ASSERT_EQUAL(EngineMode::Block, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(12));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(13));
    TEST_ASSERT_EQUAL_INT32(12, announcer.last());

    TEST_ASSERT_EQUAL(DetectionOutcome::Advanced, detectAt(0, 12));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(12));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(13));
    TEST_ASSERT_EQUAL_INT32(13, announcer.last());

    TEST_ASSERT_EQUAL(DetectionOutcome::Advanced, detectAt(1000, 13));
    TEST_ASSERT_EQUAL(DetectionOutcome::Completed, detectAt(2000, 14));

    TEST_ASSERT_FALSE(engine->blockActive());
    TEST_ASSERT_TRUE(engine->isCompleting());
    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(12));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(14));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(15));
    TEST_ASSERT_EQUAL(0, sink.callCount);

    runUntil(5000);

    TEST_ASSERT_FALSE(engine->isCompleting());
    TEST_ASSERT_EQUAL(1, sink.callCount);
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(12));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(14));
}

void test_block_cooldown_through_engine() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);

    detectAt(0, 12);
    TEST_ASSERT_EQUAL(DetectionOutcome::BlockCooldown, detectAt(600, 13));
    TEST_ASSERT_EQUAL_INT32(13, engine->expectedPin());
}

void test_block_rejects_bad_input() {
    int32_t tooMany[BLOCK_MAX_STEPS + 1];
    for (size_t i = 0; i < BLOCK_MAX_STEPS + 1; ++i) {
        tooMany[i] = static_cast<int32_t>(i + 1);
    }
    const int32_t outside[] = { 12, 139 };

    TEST_ASSERT_EQUAL(ActivationStatus::Empty, engine->startBlockPins(tooMany, 0));
    TEST_ASSERT_EQUAL(ActivationStatus::TooLong, engine->startBlockPins(tooMany, BLOCK_MAX_STEPS + 1));
    TEST_ASSERT_EQUAL(ActivationStatus::InvalidPin, engine->startBlockPins(outside, 2));
    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(12));
}

void test_second_block_refused_while_active() {
    const int32_t first[] = { 12, 13 };
    const int32_t second[] = { 40, 41 };
    engine->startBlockPins(first, 2);

    TEST_ASSERT_EQUAL(ActivationStatus::Conflict, engine->startBlockPins(second, 2));
    TEST_ASSERT_EQUAL(ActivationStatus::Conflict, engine->setSingleMode(40));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(40));
    TEST_ASSERT_EQUAL_INT32(12, engine->expectedPin());
}

void test_new_block_refused_while_completing() {
    const int32_t first[] = { 12, 13 };
    const int32_t second[] = { 40, 41 };
    engine->startBlockPins(first, 2);
    detectAt(0, 12);
    detectAt(1000, 13);
    TEST_ASSERT_TRUE(engine->isCompleting());

    TEST_ASSERT_EQUAL(ActivationStatus::Conflict, engine->startBlockPins(second, 2));

    runUntil(4000);
    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlockPins(second, 2));
}

void test_shelf_offsets_adjust_pins() {
    const ShelfOffset shelves[] = { { 1, 0 }, { 2, 69 } };
    const LedRef refs[] = { { 2, 5 }, { 1, 3 } };

    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlock(refs, 2, shelves, 2));

    TEST_ASSERT_EQUAL_INT32(74, engine->expectedPin());
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(74));
    TEST_ASSERT_EQUAL_INT32(69, engine->controlledValue(2));
    TEST_ASSERT_EQUAL(2, engine->shelfCount());
}

void test_shelf_offset_out_of_range() {
    const ShelfOffset shelves[] = { { 2, 69 } };
    const LedRef refs[] = { { 2, 70 } };

    TEST_ASSERT_EQUAL(ActivationStatus::InvalidPin, engine->startBlock(refs, 1, shelves, 1));
    TEST_ASSERT_FALSE(engine->blockActive());
}

void test_too_many_shelves() {
    ShelfOffset shelves[ENGINE_MAX_SHELVES + 1];
    for (size_t i = 0; i < ENGINE_MAX_SHELVES + 1; ++i) {
        shelves[i].shelfId = static_cast<int32_t>(i + 1);
        shelves[i].controlled = 0;
    }
    const LedRef refs[] = { { 1, 3 } };

    TEST_ASSERT_EQUAL(ActivationStatus::CapacityExceeded,
                      engine->startBlock(refs, 1, shelves, ENGINE_MAX_SHELVES + 1));
}

void test_completion_flashes_whole_shelves() {
    const ShelfOffset shelves[] = { { 1, 0 }, { 2, 69 } };
    const LedRef refs[] = { { 2, 5 } };
    engine->startBlock(refs, 1, shelves, 2);

    TEST_ASSERT_EQUAL(DetectionOutcome::Completed, detectAt(0, 74));

    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(70));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(138));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(69));
}

void test_unknown_shelf_flashes_own_pin() {
    const ShelfOffset shelves[] = { { 2, 69 } };
    const LedRef refs[] = { { 7, 3 } };
    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlock(refs, 1, shelves, 1));
    TEST_ASSERT_EQUAL_INT32(3, engine->expectedPin());

    TEST_ASSERT_EQUAL(DetectionOutcome::Completed, detectAt(0, 3));

    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(3));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(1));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(4));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(70));
}

// =====================================================
// Incorrect Detections
// =====================================================

void test_wrong_pin_blinks_red() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);

    TEST_ASSERT_EQUAL(DetectionOutcome::Incorrect, detectAt(0, 30));

    TEST_ASSERT_TRUE(engine->hasSupervisor(30));
    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(30));

    // Idle period without detections ends the blink
    runUntil(2000);
    TEST_ASSERT_FALSE(engine->hasSupervisor(30));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(30));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(12));
}

void test_repeated_wrong_pin_reuses_supervisor() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);

    detectAt(0, 30);
    detectAt(300, 30);

    TEST_ASSERT_EQUAL(1, engine->supervisorCount());
}

void test_stale_wrong_signal_for_expected_pin_ignored() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);
    detectAt(0, 12);

    engine->handleIncorrectDetection(13);

    TEST_ASSERT_EQUAL(0, engine->supervisorCount());
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(13));
}

void test_neighbour_of_confirmed_pin_ignored() {
    const int32_t block[] = { 12, 20, 30 };
    engine->startBlockPins(block, 3);
    detectAt(0, 12);

    mock_time_set(300);
    engine->handleIncorrectDetection(11);

    TEST_ASSERT_EQUAL(0, engine->supervisorCount());

    // Past the suppression window the neighbour counts as a wrong pick again
    TEST_ASSERT_EQUAL(DetectionOutcome::Incorrect, detectAt(2500, 11));
    TEST_ASSERT_TRUE(engine->hasSupervisor(11));
    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(11));
}

void test_supervisor_stops_when_pin_becomes_expected() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);

    detectAt(0, 14);
    TEST_ASSERT_TRUE(engine->hasSupervisor(14));

    detectAt(150, 12);
    TEST_ASSERT_TRUE(engine->hasSupervisor(14));

    detectAt(1200, 13);
    TEST_ASSERT_FALSE(engine->hasSupervisor(14));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(14));
}

void test_idle_orphan_is_not_blinked() {
    TEST_ASSERT_EQUAL(DetectionOutcome::Orphan, detectAt(0, 50));
    TEST_ASSERT_EQUAL(0, engine->supervisorCount());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(50));
}

void test_incorrect_detection_while_idle_blinks() {
    mock_time_set(0);
    engine->handleIncorrectDetection(50);

    TEST_ASSERT_TRUE(engine->hasSupervisor(50));
    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(50));

    runUntil(1000);
    TEST_ASSERT_FALSE(engine->hasSupervisor(50));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(50));
}

void test_detection_during_completion_reaches_finished_block() {
    const int32_t block[] = { 12, 13 };
    engine->startBlockPins(block, 2);
    detectAt(0, 12);
    detectAt(1000, 13);

    TEST_ASSERT_EQUAL(DetectionOutcome::AlreadyComplete, detectAt(1500, 13));

    engine->handleIncorrectDetection(40);
    TEST_ASSERT_EQUAL(0, engine->supervisorCount());
}

// =====================================================
// Detection Filtering
// =====================================================

void test_invalid_detection() {
    TEST_ASSERT_EQUAL(DetectionOutcome::InvalidPin, detectAt(0, 0));
    TEST_ASSERT_EQUAL(DetectionOutcome::InvalidPin, detectAt(0, 139));
    TEST_ASSERT_EQUAL(DetectionOutcome::InvalidPin, detectAt(0, -5));
}

void test_debounce_drops_repeat() {
    const int32_t block[] = { 12, 13, 14 };
    engine->startBlockPins(block, 3);

    TEST_ASSERT_EQUAL(DetectionOutcome::Advanced, detectAt(0, 12));
    TEST_ASSERT_EQUAL(DetectionOutcome::Debounced, detectAt(50, 12));
    TEST_ASSERT_EQUAL(DetectionOutcome::Incorrect, detectAt(60, 30));
    TEST_ASSERT_EQUAL(DetectionOutcome::PinCooldown, detectAt(150, 12));
}

// =====================================================
// Single Mode
// =====================================================

void test_single_mode_confirm() {
    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->setSingleMode(20));

    TEST_ASSERT_EQUAL(EngineMode::Single, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(20));
    TEST_ASSERT_EQUAL_INT32(20, announcer.last());

    TEST_ASSERT_EQUAL(DetectionOutcome::Orphan, detectAt(100, 21));
    TEST_ASSERT_EQUAL(DetectionOutcome::Confirmed, detectAt(200, 20));
    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(20));
}

void test_single_mode_replaces_previous_pin() {
    engine->setSingleMode(20);
    engine->setSingleMode(25);

    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(20));
    TEST_ASSERT_EQUAL(LedColor::Green, frame->colorOf(25));
    TEST_ASSERT_EQUAL_INT32(25, engine->singlePin());
}

void test_single_mode_times_out() {
    engine->setSingleMode(20);

    runUntil(settings.singleTimeoutMs);
    TEST_ASSERT_EQUAL(EngineMode::Single, engine->mode());

    runUntil(settings.singleTimeoutMs + 100);
    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(20));
}

void test_single_mode_invalid_pin() {
    TEST_ASSERT_EQUAL(ActivationStatus::InvalidPin, engine->setSingleMode(0));
    TEST_ASSERT_EQUAL(ActivationStatus::InvalidPin, engine->setSingleMode(139));
    TEST_ASSERT_EQUAL(0, announcer.pins.size());
}

void test_block_replaces_single_mode() {
    const int32_t block[] = { 12, 13 };
    engine->setSingleMode(20);

    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlockPins(block, 2));

    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(20));
    TEST_ASSERT_EQUAL_INT32(PIN_NONE, engine->singlePin());
}

// =====================================================
// Timeout Blinking
// =====================================================

void test_set_active_leds_blinks_valid_pins() {
    const int32_t leds[] = { 5, 6, 999 };

    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->setActiveLeds(leds, 3));

    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(5));
    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(6));
    TEST_ASSERT_EQUAL(2, engine->timeoutBlinker().count());

    TEST_ASSERT_EQUAL(DetectionOutcome::Confirmed, detectAt(100, 5));
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(5));
    TEST_ASSERT_FALSE(engine->timeoutBlinker().contains(5));
}

void test_set_active_leds_rejects_bad_input() {
    const int32_t invalid[] = { 0, 999 };

    TEST_ASSERT_EQUAL(ActivationStatus::Empty, engine->setActiveLeds(invalid, 0));
    TEST_ASSERT_EQUAL(ActivationStatus::InvalidPin, engine->setActiveLeds(invalid, 2));
    TEST_ASSERT_FALSE(engine->timeoutBlinker().isRunning());
}

void test_set_active_leds_replaces_previous_set() {
    const int32_t first[] = { 5 };
    const int32_t second[] = { 7 };
    engine->setActiveLeds(first, 1);

    engine->setActiveLeds(second, 1);

    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(5));
    TEST_ASSERT_EQUAL(LedColor::Red, frame->colorOf(7));
    TEST_ASSERT_FALSE(engine->timeoutBlinker().contains(5));
}

void test_blinking_pin_times_out() {
    const int32_t leds[] = { 5 };
    engine->setActiveLeds(leds, 1);

    runUntil(settings.singleTimeoutMs + 1000);

    TEST_ASSERT_FALSE(engine->timeoutBlinker().isRunning());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(5));
}

// =====================================================
// Reset
// =====================================================

void test_turn_off_all_clears_everything() {
    const int32_t block[] = { 12, 13, 14 };
    const int32_t leds[] = { 80 };
    engine->startBlockPins(block, 3);
    engine->setActiveLeds(leds, 1);
    detectAt(0, 30);

    engine->turnOffAll();

    TEST_ASSERT_EQUAL(EngineMode::Idle, engine->mode());
    TEST_ASSERT_FALSE(engine->blockActive());
    TEST_ASSERT_EQUAL(0, engine->supervisorCount());
    TEST_ASSERT_FALSE(engine->timeoutBlinker().isRunning());
    TEST_ASSERT_EQUAL(0, engine->shelfCount());
    for (int32_t pin = 1; pin <= pins.totalPins(); ++pin) {
        TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(pin));
    }

    // A new block starts without a conflict
    TEST_ASSERT_EQUAL(ActivationStatus::Ok, engine->startBlockPins(block, 3));
}

void test_stop_blinking_cancels_completion() {
    const int32_t block[] = { 12 };
    engine->startBlockPins(block, 1);
    detectAt(0, 12);
    TEST_ASSERT_TRUE(engine->isCompleting());

    engine->stopBlinking();

    TEST_ASSERT_FALSE(engine->isCompleting());
    runUntil(5000);
    TEST_ASSERT_EQUAL(0, sink.callCount);
}

void test_completion_without_host_still_resets() {
    const int32_t block[] = { 12 };
    sink.result = false;
    engine->startBlockPins(block, 1);
    detectAt(0, 12);

    runUntil(5000);

    TEST_ASSERT_EQUAL(1, sink.callCount);
    TEST_ASSERT_FALSE(engine->isCompleting());
    TEST_ASSERT_EQUAL(LedColor::Off, frame->colorOf(12));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_block_happy_path);
    RUN_TEST(test_block_cooldown_through_engine);
    RUN_TEST(test_block_rejects_bad_input);
    RUN_TEST(test_second_block_refused_while_active);
    RUN_TEST(test_new_block_refused_while_completing);
    RUN_TEST(test_shelf_offsets_adjust_pins);
    RUN_TEST(test_shelf_offset_out_of_range);
    RUN_TEST(test_too_many_shelves);
    RUN_TEST(test_completion_flashes_whole_shelves);
    RUN_TEST(test_unknown_shelf_flashes_own_pin);

    RUN_TEST(test_wrong_pin_blinks_red);
    RUN_TEST(test_repeated_wrong_pin_reuses_supervisor);
    RUN_TEST(test_stale_wrong_signal_for_expected_pin_ignored);
    RUN_TEST(test_neighbour_of_confirmed_pin_ignored);
    RUN_TEST(test_supervisor_stops_when_pin_becomes_expected);
    RUN_TEST(test_idle_orphan_is_not_blinked);
    RUN_TEST(test_incorrect_detection_while_idle_blinks);
    RUN_TEST(test_detection_during_completion_reaches_finished_block);

    RUN_TEST(test_invalid_detection);
    RUN_TEST(test_debounce_drops_repeat);

    RUN_TEST(test_single_mode_confirm);
    RUN_TEST(test_single_mode_replaces_previous_pin);
    RUN_TEST(test_single_mode_times_out);
    RUN_TEST(test_single_mode_invalid_pin);
    RUN_TEST(test_block_replaces_single_mode);

    RUN_TEST(test_set_active_leds_blinks_valid_pins);
    RUN_TEST(test_set_active_leds_rejects_bad_input);
    RUN_TEST(test_set_active_leds_replaces_previous_set);
    RUN_TEST(test_blinking_pin_times_out);

    RUN_TEST(test_turn_off_all_clears_everything);
    RUN_TEST(test_stop_blinking_cancels_completion);
    RUN_TEST(test_completion_without_host_still_resets);

    return UNITY_END();
}
