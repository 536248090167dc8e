/*
 * File: test/test_session_cycle/test_session_cycle.cpp
 * Description: Full integration test for the interval session lifecycle.
 * Covers phase ordering, counters, wall-clock anchoring, catch-up after
 * missed ticks, and natural completion.
 */
#include <unity.h>
#include "PhaseScheduler.h"
#include "SessionConfig.h"
#include "MockCoachHAL.h"
#include "SpyObservers.h"

// --- Constants ---
// 2 intervals of 60 s brisk / 60 s easy, no warm up / cool down
const SessionConfiguration shortConfig = { 60, 60, 0, 0, 2, false, false };

// 1 interval with warm up and cool down
const SessionConfiguration fullConfig = { 60, 30, 20, 40, 1, true, true };

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// START TESTS
// ============================================================================

void test_start_without_warmup_enters_brisk_one(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    TEST_ASSERT_EQUAL(START_OK, engine.start(shortConfig));

    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_TRUE(s.isActive);
    TEST_ASSERT_FALSE(s.isPaused);
    TEST_ASSERT_EQUAL(PHASE_BRISK, s.phase);
    TEST_ASSERT_EQUAL_UINT8(1, s.currentIntervalIndex);
    TEST_ASSERT_EQUAL_UINT8(2, s.totalIntervals);
    TEST_ASSERT_EQUAL_UINT32(60000, s.remainingMs);
    TEST_ASSERT_TRUE(s.phaseEndTime == hal.currentEpochMillis + 60000ULL);

    // Initial phase is announced and mirrored
    TEST_ASSERT_EQUAL(1, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(PHASE_BRISK, notifier.phaseChanges[0].phase);
    TEST_ASSERT_EQUAL_UINT8(1, notifier.phaseChanges[0].interval);
    TEST_ASSERT_EQUAL(1, (int)mirror.pushes.size());
}

void test_start_with_warmup_enters_warmup_zero(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(fullConfig);

    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_EQUAL(PHASE_WARMUP, s.phase);
    TEST_ASSERT_EQUAL_UINT8(0, s.currentIntervalIndex);
    TEST_ASSERT_EQUAL_UINT32(20000, s.remainingMs);
    TEST_ASSERT_EQUAL(PHASE_WARMUP, notifier.phaseChanges[0].phase);
}

void test_start_assigns_new_handle_per_session(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);
    SessionHandle first = engine.getHandle();
    engine.end("Test");

    engine.start(shortConfig);
    TEST_ASSERT_NOT_EQUAL(first, engine.getHandle());
    TEST_ASSERT_NOT_EQUAL(0, engine.getHandle());
}

// ============================================================================
// LIFECYCLE TESTS
// ============================================================================

void test_two_interval_session_regular_ticks(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);

    for (int i = 0; i < 4; i++) {
        hal.advanceSeconds(60);
        engine.tick(hal.getEpochMillis());
    }

    // Brisk(1) -> Easy(1) -> Brisk(2) -> Easy(2), then Completed
    TEST_ASSERT_EQUAL(4, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(PHASE_BRISK, notifier.phaseChanges[0].phase);
    TEST_ASSERT_EQUAL(PHASE_EASY,  notifier.phaseChanges[1].phase);
    TEST_ASSERT_EQUAL_UINT8(1, notifier.phaseChanges[1].interval);
    TEST_ASSERT_EQUAL(PHASE_BRISK, notifier.phaseChanges[2].phase);
    TEST_ASSERT_EQUAL_UINT8(2, notifier.phaseChanges[2].interval);
    TEST_ASSERT_EQUAL(PHASE_EASY,  notifier.phaseChanges[3].phase);
    TEST_ASSERT_EQUAL(1, notifier.completedCount);

    SessionSummary summary;
    TEST_ASSERT_TRUE(engine.getLastSummary(summary));
    TEST_ASSERT_TRUE(summary.totalDurationMs == 240000ULL);
    TEST_ASSERT_EQUAL_UINT8(2, summary.briskIntervals);
    TEST_ASSERT_EQUAL_UINT8(2, summary.slowIntervals);
    TEST_ASSERT_TRUE(summary.completedSuccessfully);
}

void test_natural_completion_state(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);
    hal.advanceSeconds(240);
    engine.tick(hal.getEpochMillis());

    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_FALSE(s.isActive);
    TEST_ASSERT_EQUAL(PHASE_COMPLETED, s.phase);
    TEST_ASSERT_TRUE(s.phaseEndTime == 0);
    TEST_ASSERT_EQUAL_UINT32(0, s.remainingMs);

    // Summary went to persistence exactly once
    TEST_ASSERT_EQUAL(1, (int)hal.savedSummaries.size());

    // Mirror saw the final state
    TEST_ASSERT_EQUAL(PHASE_COMPLETED, mirror.last().phase);
    TEST_ASSERT_FALSE(mirror.last().isActive);
}

void test_full_sequence_with_warmup_and_cooldown(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(fullConfig);

    hal.advanceSeconds(20);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_BRISK, engine.getPhase());
    TEST_ASSERT_EQUAL_UINT8(1, engine.currentState().currentIntervalIndex);

    hal.advanceSeconds(60);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_EASY, engine.getPhase());

    hal.advanceSeconds(30);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_COOLDOWN, engine.getPhase());
    TEST_ASSERT_EQUAL_UINT8(1, engine.currentState().completedSlowIntervals);

    hal.advanceSeconds(40);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_COMPLETED, engine.getPhase());

    // Warmup, Brisk, Easy, Cooldown
    TEST_ASSERT_EQUAL(4, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(PHASE_COOLDOWN, notifier.phaseChanges[3].phase);
    TEST_ASSERT_EQUAL(1, notifier.completedCount);

    SessionSummary summary;
    engine.getLastSummary(summary);
    TEST_ASSERT_TRUE(summary.totalDurationMs == (uint64_t)SessionConfig::totalDurationSeconds(fullConfig) * 1000ULL);
}

void test_total_duration_matches_sum_of_phases(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    SessionConfiguration cfg = SessionConfig::standardWithWarmup();
    engine.start(cfg);

    // Irregular tick spacing must not change the total
    while (engine.isActive()) {
        hal.advanceTime(7300);
        engine.tick(hal.getEpochMillis());
    }

    SessionSummary summary;
    TEST_ASSERT_TRUE(engine.getLastSummary(summary));
    TEST_ASSERT_TRUE(summary.totalDurationMs == (uint64_t)SessionConfig::totalDurationSeconds(cfg) * 1000ULL);
    TEST_ASSERT_EQUAL_UINT8(5, summary.briskIntervals);
    TEST_ASSERT_EQUAL_UINT8(5, summary.slowIntervals);
}

void test_interval_complete_fires_after_each_easy_phase(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);
    for (int i = 0; i < 4; i++) {
        hal.advanceSeconds(60);
        engine.tick(hal.getEpochMillis());
    }

    TEST_ASSERT_EQUAL(2, (int)notifier.intervalsCompleted.size());
    TEST_ASSERT_EQUAL_UINT8(1, notifier.intervalsCompleted[0]);
    TEST_ASSERT_EQUAL_UINT8(2, notifier.intervalsCompleted[1]);
}

// ============================================================================
// TICK & ANCHORING TESTS
// ============================================================================

void test_tick_before_expiry_is_side_effect_free(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);
    uint32_t revision = engine.getRevision();

    for (int i = 0; i < 59; i++) {
        hal.advanceSeconds(1);
        engine.tick(hal.getEpochMillis());
    }

    TEST_ASSERT_EQUAL(PHASE_BRISK, engine.getPhase());
    TEST_ASSERT_EQUAL(1, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(1, (int)mirror.pushes.size());
    TEST_ASSERT_EQUAL_UINT32(revision, engine.getRevision());
    TEST_ASSERT_EQUAL_UINT32(1000, engine.currentState().remainingMs);
}

void test_transition_exactly_at_end_instant(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);

    hal.advanceTime(59999);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_BRISK, engine.getPhase());

    hal.advanceTime(1);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_EQUAL(PHASE_EASY, engine.getPhase());
}

void test_late_tick_does_not_drift(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    EpochMillis t0 = hal.getEpochMillis();
    engine.start(shortConfig);

    // Host tick arrives 5 s late
    hal.advanceSeconds(65);
    engine.tick(hal.getEpochMillis());

    // Easy(1) ends 60 s after Brisk(1) ended, not 60 s after the late tick
    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_EQUAL(PHASE_EASY, s.phase);
    TEST_ASSERT_TRUE(s.phaseEndTime == t0 + 120000ULL);
    TEST_ASSERT_EQUAL_UINT32(55000, s.remainingMs);
}

void test_catch_up_emits_one_notification_per_phase(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    EpochMillis t0 = hal.getEpochMillis();
    engine.start(shortConfig);

    // Host suspended for 150 s: Brisk(1) and Easy(1) both expired
    hal.advanceSeconds(150);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(3, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(PHASE_EASY,  notifier.phaseChanges[1].phase);
    TEST_ASSERT_EQUAL(PHASE_BRISK, notifier.phaseChanges[2].phase);
    TEST_ASSERT_EQUAL_UINT8(2, notifier.phaseChanges[2].interval);

    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_TRUE(s.phaseEndTime == t0 + 180000ULL);
    TEST_ASSERT_EQUAL_UINT8(1, s.completedBriskIntervals);
    TEST_ASSERT_EQUAL_UINT8(1, s.completedSlowIntervals);

    // One mirror push per transition
    TEST_ASSERT_EQUAL(3, (int)mirror.pushes.size());
}

void test_catch_up_through_completion(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    EpochMillis t0 = hal.getEpochMillis();
    engine.start(shortConfig);

    hal.advanceSeconds(3600);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(4, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(1, notifier.completedCount);

    // Completion is stamped at the scheduled instant, not the late tick
    SessionSummary summary;
    engine.getLastSummary(summary);
    TEST_ASSERT_TRUE(summary.endTime == t0 + 240000ULL);
    TEST_ASSERT_TRUE(summary.totalDurationMs == 240000ULL);
}

void test_tick_when_idle_does_nothing(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    hal.advanceSeconds(1000);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(PHASE_IDLE, engine.getPhase());
    TEST_ASSERT_EQUAL(0, (int)notifier.phaseChanges.size());
    TEST_ASSERT_EQUAL(0, (int)mirror.pushes.size());
}

void test_restart_after_completion(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(shortConfig);
    hal.advanceSeconds(240);
    engine.tick(hal.getEpochMillis());
    TEST_ASSERT_FALSE(engine.isActive());

    TEST_ASSERT_EQUAL(START_OK, engine.start(shortConfig));
    SessionStateSnapshot s = engine.currentState();
    TEST_ASSERT_EQUAL(PHASE_BRISK, s.phase);
    TEST_ASSERT_EQUAL_UINT8(0, s.completedBriskIntervals);
    TEST_ASSERT_TRUE(s.elapsedMs == 0);
}

// ============================================================================
// SCHEDULE TESTS
// ============================================================================

void test_upcoming_phases_lists_remaining_timeline(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    EpochMillis t0 = hal.getEpochMillis();
    engine.start(fullConfig);

    PhaseScheduleEntry entries[MAX_SCHEDULE_ENTRIES];
    size_t n = engine.upcomingPhases(hal.getEpochMillis(), entries, MAX_SCHEDULE_ENTRIES);

    TEST_ASSERT_EQUAL(4, (int)n);
    TEST_ASSERT_EQUAL(PHASE_WARMUP,   entries[0].phase);
    TEST_ASSERT_EQUAL(PHASE_BRISK,    entries[1].phase);
    TEST_ASSERT_EQUAL(PHASE_EASY,     entries[2].phase);
    TEST_ASSERT_EQUAL(PHASE_COOLDOWN, entries[3].phase);
    TEST_ASSERT_TRUE(entries[0].endTime == t0 + 20000ULL);
    TEST_ASSERT_TRUE(entries[1].endTime == t0 + 80000ULL);
    TEST_ASSERT_TRUE(entries[2].endTime == t0 + 110000ULL);
    TEST_ASSERT_TRUE(entries[3].endTime == t0 + 150000ULL);
}

void test_upcoming_phases_respects_capacity(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(SessionConfig::advanced());

    PhaseScheduleEntry entries[3];
    TEST_ASSERT_EQUAL(3, (int)engine.upcomingPhases(hal.getEpochMillis(), entries, 3));
    TEST_ASSERT_EQUAL(0, (int)engine.upcomingPhases(hal.getEpochMillis(), entries, 0));
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();

    // Start
    RUN_TEST(test_start_without_warmup_enters_brisk_one);
    RUN_TEST(test_start_with_warmup_enters_warmup_zero);
    RUN_TEST(test_start_assigns_new_handle_per_session);

    // Lifecycle
    RUN_TEST(test_two_interval_session_regular_ticks);
    RUN_TEST(test_natural_completion_state);
    RUN_TEST(test_full_sequence_with_warmup_and_cooldown);
    RUN_TEST(test_total_duration_matches_sum_of_phases);
    RUN_TEST(test_interval_complete_fires_after_each_easy_phase);

    // Tick & Anchoring
    RUN_TEST(test_tick_before_expiry_is_side_effect_free);
    RUN_TEST(test_transition_exactly_at_end_instant);
    RUN_TEST(test_late_tick_does_not_drift);
    RUN_TEST(test_catch_up_emits_one_notification_per_phase);
    RUN_TEST(test_catch_up_through_completion);
    RUN_TEST(test_tick_when_idle_does_nothing);
    RUN_TEST(test_restart_after_completion);

    // Schedule
    RUN_TEST(test_upcoming_phases_lists_remaining_timeline);
    RUN_TEST(test_upcoming_phases_respects_capacity);

    return UNITY_END();
}
