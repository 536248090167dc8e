/*
 * File: test/test_time_utils/test_time_utils.cpp
 * Description: Unit tests for the static TimeUtils class.
 * Verifies human-readable durations (h/min/s) and countdown strings.
 */

#include <unity.h>
#include "TimeUtils.h"
#include <string.h>

void setUp(void) {}
void tearDown(void) {}

// --- formatSeconds ---

void test_format_zero_seconds(void) {
    char buf[32];
    TimeUtils::formatSeconds(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0s", buf);
}

void test_format_seconds_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(45, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("45s", buf);
}

void test_format_minutes_only(void) {
    char buf[32];
    TimeUtils::formatSeconds(180, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("3min", buf);
}

void test_format_hours_minutes_seconds(void) {
    char buf[64];
    // 1h (3600) + 10min (600) + 5s = 4205
    TimeUtils::formatSeconds(4205, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 10min 5s", buf);
}

void test_format_skips_zero_minutes(void) {
    char buf[64];
    TimeUtils::formatSeconds(3605, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 5s", buf);
}

void test_format_small_buffer_does_not_overflow(void) {
    char buf[6];
    memset(buf, 'X', sizeof(buf));
    TimeUtils::formatSeconds(4205, buf, sizeof(buf));
    TEST_ASSERT_EQUAL('\0', buf[sizeof(buf) - 1]);
}

// --- formatCountdown ---

void test_countdown_minutes_seconds(void) {
    char buf[16];
    TimeUtils::formatCountdown(180000ULL, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("03:00", buf);
}

void test_countdown_rounds_partial_second_up(void) {
    char buf[16];
    TimeUtils::formatCountdown(44001ULL, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("00:45", buf);
    TimeUtils::formatCountdown(0ULL, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("00:00", buf);
}

void test_countdown_with_hours(void) {
    char buf[16];
    // 1h 2min 3s
    TimeUtils::formatCountdown(3723000ULL, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1:02:03", buf);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_format_zero_seconds);
    RUN_TEST(test_format_seconds_only);
    RUN_TEST(test_format_minutes_only);
    RUN_TEST(test_format_hours_minutes_seconds);
    RUN_TEST(test_format_skips_zero_minutes);
    RUN_TEST(test_format_small_buffer_does_not_overflow);

    RUN_TEST(test_countdown_minutes_seconds);
    RUN_TEST(test_countdown_rounds_partial_second_up);
    RUN_TEST(test_countdown_with_hours);

    return UNITY_END();
}
