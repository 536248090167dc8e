/*
 * File: test/test_companion_mirror/test_companion_mirror.cpp
 * Description: Companion mirroring.
 * Verifies push ordering relative to notifications, snapshot contents,
 * resync on demand, remote commands and the revision-based replica.
 */
#include <unity.h>
#include <string.h>
#include <string>
#include <vector>
#include "PhaseScheduler.h"
#include "MockCoachHAL.h"
#include "SpyObservers.h"

const SessionConfiguration cfg = { 60, 60, 0, 0, 2, false, false };

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// PUSH TESTS
// ============================================================================

void test_push_follows_notification(void) {
    MockCoachHAL hal;
    std::vector<std::string> journal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    notifier.journal = &journal;
    mirror.journal = &journal;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);
    hal.advanceSeconds(60);
    engine.tick(hal.getEpochMillis());
    hal.advanceSeconds(60);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(7, (int)journal.size());
    TEST_ASSERT_EQUAL_STRING("phase:BRISK:1", journal[0].c_str());
    TEST_ASSERT_EQUAL_STRING("push:BRISK",    journal[1].c_str());
    TEST_ASSERT_EQUAL_STRING("phase:EASY:1",  journal[2].c_str());
    TEST_ASSERT_EQUAL_STRING("push:EASY",     journal[3].c_str());
    TEST_ASSERT_EQUAL_STRING("interval:1",    journal[4].c_str());
    TEST_ASSERT_EQUAL_STRING("phase:BRISK:2", journal[5].c_str());
    TEST_ASSERT_EQUAL_STRING("push:BRISK",    journal[6].c_str());
}

void test_completion_order(void) {
    MockCoachHAL hal;
    std::vector<std::string> journal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    SessionConfiguration one = { 60, 60, 0, 0, 1, false, false };
    engine.start(one);
    hal.advanceSeconds(60);
    engine.tick(hal.getEpochMillis());

    notifier.journal = &journal;
    mirror.journal = &journal;
    hal.advanceSeconds(60);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(3, (int)journal.size());
    TEST_ASSERT_EQUAL_STRING("interval:1",      journal[0].c_str());
    TEST_ASSERT_EQUAL_STRING("completed",       journal[1].c_str());
    TEST_ASSERT_EQUAL_STRING("push:COMPLETED",  journal[2].c_str());
}

void test_every_state_change_is_pushed_with_increasing_revision(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);                   // 1
    hal.advanceSeconds(10);
    engine.pause("Test");                // 2
    hal.advanceSeconds(10);
    engine.resume("Test");               // 3
    engine.skipToNextPhase("Test");      // 4
    engine.end("Test");                  // 5

    TEST_ASSERT_EQUAL(5, (int)mirror.pushes.size());
    for (size_t i = 1; i < mirror.pushes.size(); i++) {
        TEST_ASSERT_TRUE(mirror.pushes[i].revision > mirror.pushes[i - 1].revision);
    }
    TEST_ASSERT_EQUAL(PHASE_PAUSED, mirror.pushes[1].phase);
    TEST_ASSERT_TRUE(mirror.pushes[1].isPaused);
    TEST_ASSERT_EQUAL(PHASE_EASY, mirror.pushes[3].phase);
    TEST_ASSERT_FALSE(mirror.pushes[4].isActive);
}

void test_snapshot_is_self_describing(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    EpochMillis t0 = hal.getEpochMillis();
    engine.start(cfg);

    const SessionStateSnapshot& s = mirror.last();
    TEST_ASSERT_EQUAL(PHASE_BRISK, s.phase);
    TEST_ASSERT_EQUAL_UINT8(1, s.currentIntervalIndex);
    TEST_ASSERT_EQUAL_UINT8(2, s.totalIntervals);
    TEST_ASSERT_TRUE(s.phaseEndTime == t0 + 60000ULL);
    TEST_ASSERT_TRUE(s.plannedDurationMs == 240000ULL);
    TEST_ASSERT_FALSE(s.isPaused);
    TEST_ASSERT_EQUAL_UINT32(engine.getHandle(), s.handle);
}

// ============================================================================
// RESYNC & REMOTE COMMAND TESTS
// ============================================================================

void test_resync_sends_current_state_without_new_revision(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);
    hal.advanceSeconds(25);
    uint32_t revision = engine.getRevision();

    engine.resyncMirror();

    TEST_ASSERT_EQUAL(1, (int)mirror.resyncs.size());
    TEST_ASSERT_EQUAL(1, (int)mirror.pushes.size());
    TEST_ASSERT_EQUAL_UINT32(revision, mirror.resyncs[0].revision);
    TEST_ASSERT_EQUAL_UINT32(35000, mirror.resyncs[0].remainingMs);
    TEST_ASSERT_EQUAL_UINT32(revision, engine.getRevision());
}

void test_resync_when_idle(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.resyncMirror();

    TEST_ASSERT_EQUAL(1, (int)mirror.resyncs.size());
    TEST_ASSERT_FALSE(mirror.resyncs[0].isActive);
    TEST_ASSERT_EQUAL(PHASE_IDLE, mirror.resyncs[0].phase);
}

void test_remote_commands_use_local_paths(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);
    hal.advanceSeconds(5);

    engine.applyRemotePause();
    TEST_ASSERT_TRUE(engine.isPaused());
    TEST_ASSERT_TRUE(hal.hasLogContaining("Paused by Companion"));

    // Skip is ignored while paused, remote or not
    engine.applyRemoteSkip();
    TEST_ASSERT_EQUAL(PHASE_PAUSED, engine.getPhase());

    engine.applyRemoteResume();
    TEST_ASSERT_FALSE(engine.isPaused());

    engine.applyRemoteSkip();
    TEST_ASSERT_EQUAL(PHASE_EASY, engine.getPhase());

    TEST_ASSERT_TRUE(engine.applyRemoteEnd());
    TEST_ASSERT_FALSE(engine.isActive());
    TEST_ASSERT_FALSE(engine.applyRemoteEnd());
    TEST_ASSERT_EQUAL(1, (int)hal.savedSummaries.size());
}

// ============================================================================
// REPLICA TESTS
// ============================================================================

void test_replica_ignores_stale_and_duplicate_pushes(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);
    engine.skipToNextPhase("Test");

    MirrorReplica replica;
    TEST_ASSERT_FALSE(replica.hasState());

    TEST_ASSERT_TRUE(replica.apply(mirror.pushes[1]));
    TEST_ASSERT_FALSE(replica.apply(mirror.pushes[1]));  // duplicate
    TEST_ASSERT_FALSE(replica.apply(mirror.pushes[0]));  // out of order
    TEST_ASSERT_EQUAL(PHASE_EASY, replica.state().phase);
    TEST_ASSERT_EQUAL_UINT32(mirror.pushes[1].revision, replica.revision());
}

void test_replica_force_overrides_revision(void) {
    MirrorReplica replica;
    SessionStateSnapshot newer;
    memset(&newer, 0, sizeof(newer));
    newer.revision = 10;
    newer.phase = PHASE_EASY;

    SessionStateSnapshot older = newer;
    older.revision = 3;
    older.phase = PHASE_BRISK;

    replica.apply(newer);
    replica.force(older);
    TEST_ASSERT_EQUAL(PHASE_BRISK, replica.state().phase);
    TEST_ASSERT_EQUAL_UINT32(3, replica.revision());
}

void test_replica_countdown_uses_own_clock(void) {
    MockCoachHAL hal;
    SpyEventNotifier notifier;
    SpyCompanionMirror mirror;
    PhaseScheduler engine(hal, notifier, mirror);

    engine.start(cfg);
    MirrorReplica replica;
    replica.apply(mirror.last());

    // 20 s later on the companion, with no new push
    EpochMillis later = hal.getEpochMillis() + 20000ULL;
    TEST_ASSERT_EQUAL_UINT32(40000, replica.remainingMs(later));
    TEST_ASSERT_EQUAL_UINT32(0, replica.remainingMs(later + 100000ULL));

    // Paused snapshots report the frozen remainder
    hal.advanceSeconds(50);
    engine.pause("Test");
    replica.apply(mirror.last());
    TEST_ASSERT_EQUAL_UINT32(10000, replica.remainingMs(later + 500000ULL));
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();

    // Push
    RUN_TEST(test_push_follows_notification);
    RUN_TEST(test_completion_order);
    RUN_TEST(test_every_state_change_is_pushed_with_increasing_revision);
    RUN_TEST(test_snapshot_is_self_describing);

    // Resync & Remote
    RUN_TEST(test_resync_sends_current_state_without_new_revision);
    RUN_TEST(test_resync_when_idle);
    RUN_TEST(test_remote_commands_use_local_paths);

    // Replica
    RUN_TEST(test_replica_ignores_stale_and_duplicate_pushes);
    RUN_TEST(test_replica_force_overrides_revision);
    RUN_TEST(test_replica_countdown_uses_own_clock);

    return UNITY_END();
}
