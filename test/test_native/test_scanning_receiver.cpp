/**
 * Scanning receiver tests
 *
 * Prefix and signal filtering, duplicate suppression, malformed token
 * accounting and leader-loss clearing.
 */

#include <unity.h>
#include <string>
#include <vector>

#include "../../src/ScanningReceiver.h"
#include "../mocks/FakeClock.h"
#include "../mocks/RecordingPixelSink.h"
#include "../mocks/ScriptedRadio.h"

static const char *FRAME_SEQ5 = "ILLO_5_2_255_0_3_128_1_0_0_2";
static const char *FRAME_SEQ6 = "ILLO_6_4_200_2_0_0_0_0_0_0";

static SyncConfig config;
static RecordingPixelSink pixels;
static ScriptedRadio radio;
static SyncLog syncLog;
static RenderReconstructor renderer(config, pixels);
static ScanningReceiver receiver(config, radio, renderer, fakeClock, syncLog);

static std::vector<std::string> names(const char *a, const char *b = nullptr, const char *c = nullptr) {
    std::vector<std::string> out;
    if (a) out.push_back(a);
    if (b) out.push_back(b);
    if (c) out.push_back(c);
    return out;
}

void setUp(void) {
    fakeNowMs = 0;
    config = SyncConfig();
    pixels.reset();
    radio.reset();
    renderer.reset();
    receiver.reset();
}

void tearDown(void) {}

//==============================================================================
// Reception
//==============================================================================

void test_burst_renders_new_frame() {
    radio.queueNames(names(FRAME_SEQ5));

    TEST_ASSERT_TRUE(receiver.burst() == RadioStatus::OK);

    const PeerSyncState &state = receiver.state();
    TEST_ASSERT_TRUE(state.hasSequence);
    TEST_ASSERT_EQUAL_UINT8(5, state.lastSequence);
    TEST_ASSERT_EQUAL_UINT32(1, state.successCount);
    TEST_ASSERT_UINT8_WITHIN(1, 230, pixels.cells[2].r);
    TEST_ASSERT_UINT8_WITHIN(1, 115, pixels.cells[3].g);
    TEST_ASSERT_TRUE(radio.lastActive);
    TEST_ASSERT_EQUAL_INT(1, radio.stopScanCalls);
}

void test_burst_stops_after_first_new_frame() {
    radio.queueNames(names(FRAME_SEQ5, FRAME_SEQ6));

    receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(1, radio.lastBurstDelivered);
    TEST_ASSERT_EQUAL_UINT8(5, receiver.state().lastSequence);
}

void test_duplicate_sequence_is_not_rendered() {
    radio.queueNames(names(FRAME_SEQ5));
    radio.queueNames(names(FRAME_SEQ5));

    receiver.burst();
    receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(1, receiver.state().successCount);
    TEST_ASSERT_EQUAL_UINT32(1, renderer.renderCount());
    // The duplicate still counts as a sighting
    TEST_ASSERT_EQUAL_UINT32(config.scanBurstMs, receiver.state().lastSeenMs);
}

void test_next_sequence_is_rendered() {
    radio.queueNames(names(FRAME_SEQ5));
    radio.queueNames(names(FRAME_SEQ5, FRAME_SEQ6));

    receiver.burst();
    receiver.burst();

    TEST_ASSERT_EQUAL_UINT8(6, receiver.state().lastSequence);
    TEST_ASSERT_EQUAL_UINT32(2, receiver.state().successCount);
    TEST_ASSERT_EQUAL_UINT32(2, radio.lastBurstDelivered);
}

void test_sequence_wrap_is_a_new_frame() {
    radio.queueNames(names("ILLO_255_1_100_0_0_0_0_0_0_0"));
    radio.queueNames(names("ILLO_0_2_100_0_0_0_0_0_0_0"));

    receiver.burst();
    receiver.burst();

    TEST_ASSERT_EQUAL_UINT8(0, receiver.state().lastSequence);
    TEST_ASSERT_EQUAL_UINT32(2, receiver.state().successCount);
}

void test_foreign_and_weak_advertisements_are_ignored() {
    ScriptedRadio::Burst burst;
    burst.push_back(std::make_pair(std::string("Headphones"), (int8_t)-40));
    burst.push_back(std::make_pair(std::string("ILLO"), (int8_t)-40));
    burst.push_back(std::make_pair(std::string(FRAME_SEQ5), (int8_t)-91));
    radio.queueBurst(burst);

    receiver.burst();

    const PeerSyncState &state = receiver.state();
    TEST_ASSERT_FALSE(state.hasPeer);
    TEST_ASSERT_EQUAL_UINT32(0, state.successCount);
    TEST_ASSERT_EQUAL_UINT32(0, state.failCount);
    TEST_ASSERT_EQUAL_UINT32(0, pixels.presentCount);
}

void test_signal_at_threshold_is_accepted() {
    radio.queueNames(names(FRAME_SEQ5), config.minimumRssi);

    receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(1, receiver.state().successCount);
}

void test_malformed_token_counts_failure_and_scan_continues() {
    radio.queueNames(names("ILLO_5_2_255", "ILLO_x_2_255_0_3_128_1_0_0_2", FRAME_SEQ6));

    receiver.burst();

    const PeerSyncState &state = receiver.state();
    TEST_ASSERT_EQUAL_UINT32(2, state.failCount);
    TEST_ASSERT_EQUAL_UINT32(1, state.successCount);
    TEST_ASSERT_EQUAL_UINT8(6, state.lastSequence);
}

void test_malformed_token_alone_keeps_previous_render() {
    radio.queueNames(names(FRAME_SEQ5));
    radio.queueNames(names("ILLO_5_2_255_0_3_128_1_0_0"));

    receiver.burst();
    uint32_t presents = pixels.presentCount;
    receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(presents, pixels.presentCount);
    TEST_ASSERT_EQUAL_UINT32(1, receiver.state().failCount);
}

void test_last_seen_age() {
    uint32_t age = 123;
    TEST_ASSERT_FALSE(receiver.lastSeenAge(1000, age));

    radio.queueNames(names(FRAME_SEQ5));
    receiver.burst();

    TEST_ASSERT_TRUE(receiver.lastSeenAge(1000, age));
    TEST_ASSERT_EQUAL_UINT32(1000, age);
}

//==============================================================================
// Leader loss
//==============================================================================

void test_loss_clears_ring_once() {
    radio.queueNames(names(FRAME_SEQ5));
    receiver.burst();  // seen at t=0, clock now 200

    // Quiet bursts up to just under the timeout
    while (fakeNowMs + config.scanBurstMs < config.lossTimeoutMs) {
        receiver.burst();
    }
    TEST_ASSERT_EQUAL_UINT32(0, receiver.lossCount());
    TEST_ASSERT_FALSE(pixels.allDark());

    receiver.burst();
    TEST_ASSERT_EQUAL_UINT32(1, receiver.lossCount());
    TEST_ASSERT_TRUE(pixels.allDark());
    TEST_ASSERT_FALSE(receiver.state().hasPeer);
    TEST_ASSERT_FALSE(receiver.state().hasSequence);

    uint32_t presents = pixels.presentCount;
    receiver.burst();
    receiver.burst();
    TEST_ASSERT_EQUAL_UINT32(1, receiver.lossCount());
    TEST_ASSERT_EQUAL_UINT32(presents, pixels.presentCount);
}

void test_loss_timing_survives_clock_wrap() {
    fakeNowMs = 0xFFFFFFFFu - 500;
    radio.queueNames(names(FRAME_SEQ5));
    receiver.burst();

    // Clock wraps past zero during these bursts
    for (int i = 0; i < 10; i++) receiver.burst();
    TEST_ASSERT_EQUAL_UINT32(0, receiver.lossCount());

    for (int i = 0; i < 5; i++) receiver.burst();
    TEST_ASSERT_EQUAL_UINT32(1, receiver.lossCount());
}

void test_no_loss_without_any_peer() {
    for (int i = 0; i < 30; i++) receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(0, receiver.lossCount());
    TEST_ASSERT_EQUAL_UINT32(0, pixels.presentCount);
}

void test_same_sequence_accepted_after_loss() {
    radio.queueNames(names(FRAME_SEQ5));
    receiver.burst();
    fakeNowMs += config.lossTimeoutMs;
    receiver.burst();
    TEST_ASSERT_EQUAL_UINT32(1, receiver.lossCount());

    radio.queueNames(names(FRAME_SEQ5));
    receiver.burst();

    TEST_ASSERT_EQUAL_UINT32(2, receiver.state().successCount);
    TEST_ASSERT_TRUE(receiver.state().hasPeer);
    // Smoothing restarted from dark
    TEST_ASSERT_UINT8_WITHIN(1, 230, pixels.cells[2].r);
}

//==============================================================================
// Radio errors
//==============================================================================

void test_out_of_memory_scan_reclaims() {
    radio.scanResult = RadioStatus::NO_MEMORY;

    TEST_ASSERT_TRUE(receiver.burst() == RadioStatus::NO_MEMORY);

    TEST_ASSERT_EQUAL_INT(1, radio.reclaimCalls);
    TEST_ASSERT_EQUAL_UINT32(1, receiver.reclaimCount());
    TEST_ASSERT_EQUAL_UINT32(1, receiver.scanErrorCount());
    TEST_ASSERT_EQUAL_INT(1, radio.stopScanCalls);
}

void test_unavailable_scan_is_returned() {
    radio.scanResult = RadioStatus::UNAVAILABLE;

    TEST_ASSERT_TRUE(receiver.burst() == RadioStatus::UNAVAILABLE);
    TEST_ASSERT_EQUAL_UINT32(1, receiver.scanErrorCount());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    RUN_TEST(test_burst_renders_new_frame);
    RUN_TEST(test_burst_stops_after_first_new_frame);
    RUN_TEST(test_duplicate_sequence_is_not_rendered);
    RUN_TEST(test_next_sequence_is_rendered);
    RUN_TEST(test_sequence_wrap_is_a_new_frame);
    RUN_TEST(test_foreign_and_weak_advertisements_are_ignored);
    RUN_TEST(test_signal_at_threshold_is_accepted);
    RUN_TEST(test_malformed_token_counts_failure_and_scan_continues);
    RUN_TEST(test_malformed_token_alone_keeps_previous_render);
    RUN_TEST(test_last_seen_age);

    RUN_TEST(test_loss_clears_ring_once);
    RUN_TEST(test_loss_timing_survives_clock_wrap);
    RUN_TEST(test_no_loss_without_any_peer);
    RUN_TEST(test_same_sequence_accepted_after_loss);

    RUN_TEST(test_out_of_memory_scan_reclaims);
    RUN_TEST(test_unavailable_scan_is_returned);

    return UNITY_END();
}
