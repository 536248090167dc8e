/*
 * File: test/test_event_notifier/test_event_notifier.cpp
 * Description: EventNotifierHub fan-out.
 * Observers receive every event, in registration order, exactly once.
 */
#include <unity.h>
#include <string>
#include <vector>
#include "EventNotifier.h"
#include "PhaseScheduler.h"
#include "MockCoachHAL.h"
#include "SpyObservers.h"

void setUp(void) {}
void tearDown(void) {}

// --- Helper ---
// Tags every event with an observer name into a shared journal.
class TaggingObserver : public IEventNotifier {
public:
    TaggingObserver(const char* tag, std::vector<std::string>& journal) : _tag(tag), _journal(journal) {}

    void onPhaseChange(PhaseKind phase, uint8_t intervalIndex) override {
        _journal.push_back(_tag + ":" + phaseToString(phase));
    }
    void onCompleted() override { _journal.push_back(_tag + ":completed"); }
    void onPaused() override { _journal.push_back(_tag + ":paused"); }

private:
    std::string _tag;
    std::vector<std::string>& _journal;
};

// ============================================================================
// REGISTRATION TESTS
// ============================================================================

void test_add_rejects_null_self_and_duplicates(void) {
    EventNotifierHub hub;
    SpyEventNotifier a;

    TEST_ASSERT_FALSE(hub.add(nullptr));
    TEST_ASSERT_FALSE(hub.add(&hub));
    TEST_ASSERT_TRUE(hub.add(&a));
    TEST_ASSERT_FALSE(hub.add(&a));
    TEST_ASSERT_EQUAL(1, (int)hub.size());
}

void test_add_respects_capacity(void) {
    EventNotifierHub hub;
    SpyEventNotifier spies[MAX_EVENT_OBSERVERS + 1];

    for (int i = 0; i < MAX_EVENT_OBSERVERS; i++) {
        TEST_ASSERT_TRUE(hub.add(&spies[i]));
    }
    TEST_ASSERT_FALSE(hub.add(&spies[MAX_EVENT_OBSERVERS]));
}

// ============================================================================
// DISPATCH TESTS
// ============================================================================

void test_events_fan_out_in_registration_order(void) {
    std::vector<std::string> journal;
    TaggingObserver haptics("haptics", journal);
    TaggingObserver ble("ble", journal);

    EventNotifierHub hub;
    hub.add(&haptics);
    hub.add(&ble);

    hub.onPhaseChange(PHASE_BRISK, 1);
    hub.onPaused();
    hub.onCompleted();

    TEST_ASSERT_EQUAL(6, (int)journal.size());
    TEST_ASSERT_EQUAL_STRING("haptics:BRISK", journal[0].c_str());
    TEST_ASSERT_EQUAL_STRING("ble:BRISK",     journal[1].c_str());
    TEST_ASSERT_EQUAL_STRING("haptics:paused", journal[2].c_str());
    TEST_ASSERT_EQUAL_STRING("ble:paused",    journal[3].c_str());
    TEST_ASSERT_EQUAL_STRING("haptics:completed", journal[4].c_str());
    TEST_ASSERT_EQUAL_STRING("ble:completed", journal[5].c_str());
}

void test_default_handlers_are_optional(void) {
    std::vector<std::string> journal;
    TaggingObserver only("x", journal);
    EventNotifierHub hub;
    hub.add(&only);

    // TaggingObserver does not override these
    hub.onIntervalComplete(1);
    hub.onResumed();
    hub.onEnded();

    TEST_ASSERT_EQUAL(0, (int)journal.size());
}

void test_scheduler_through_hub_reaches_all_observers(void) {
    MockCoachHAL hal;
    SpyEventNotifier first;
    SpyEventNotifier second;
    SpyCompanionMirror mirror;

    EventNotifierHub hub;
    hub.add(&first);
    hub.add(&second);

    PhaseScheduler engine(hal, hub, mirror);
    SessionConfiguration cfg = { 60, 60, 0, 0, 1, false, false };
    engine.start(cfg);
    hal.advanceSeconds(120);
    engine.tick(hal.getEpochMillis());

    TEST_ASSERT_EQUAL(2, (int)first.phaseChanges.size());
    TEST_ASSERT_EQUAL(2, (int)second.phaseChanges.size());
    TEST_ASSERT_EQUAL(1, first.completedCount);
    TEST_ASSERT_EQUAL(1, second.completedCount);
    TEST_ASSERT_EQUAL(1, (int)second.intervalsCompleted.size());
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_add_rejects_null_self_and_duplicates);
    RUN_TEST(test_add_respects_capacity);

    RUN_TEST(test_events_fan_out_in_registration_order);
    RUN_TEST(test_default_handlers_are_optional);
    RUN_TEST(test_scheduler_through_hub_reaches_all_observers);

    return UNITY_END();
}
