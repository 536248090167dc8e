/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/SessionClock.h
 *
 * Description:
 * Converts between "time remaining" and "absolute end instant".
 * Phase timing is anchored to the wall clock instead of a decrementing counter,
 * so missed ticks or a suspended host never desynchronize the countdown.
 * Pure and stateless; usable from Firmware and Native Tests alike.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class SessionClock {
public:
    /**
     * Absolute instant at which a phase with the given remaining time ends.
     * @param now         Current wall-clock instant.
     * @param remainingMs Time left in the phase.
     */
    static EpochMillis endTime(EpochMillis now, uint64_t remainingMs) {
        return now + remainingMs;
    }

    /**
     * Time left until `end`. Never negative: an instant in the past yields 0.
     */
    static uint32_t remaining(EpochMillis end, EpochMillis now) {
        if (end <= now) return 0;
        uint64_t diff = end - now;
        if (diff > 0xFFFFFFFFULL) return 0xFFFFFFFFUL;
        return (uint32_t)diff;
    }

    // Time passed since `since`, clamped at 0 if the clock stepped backwards.
    static uint64_t elapsed(EpochMillis since, EpochMillis now) {
        return (now > since) ? (now - since) : 0;
    }

    static uint64_t secondsToMs(uint32_t seconds) {
        return (uint64_t)seconds * 1000ULL;
    }
};
