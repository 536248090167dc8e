/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/SummaryBuilder.h
 *
 * Description:
 * Builds the immutable completion record of a session from the final scheduler
 * state and externally supplied activity metrics.
 * Pure function of its inputs; reads no clock or global state.
 * =================================================================================
 */
#pragma once
#include <stdio.h>
#include <string.h>

#include "Types.h"
#include "SessionClock.h"

class SummaryBuilder {
public:
    /**
     * @param state   Final session state (elapsed time already frozen by the scheduler).
     * @param metrics Steps, distance, heart rate and calories for the session.
     * @param endTime Instant the session ended.
     */
    static SessionSummary build(const SessionState& state, const ActivityMetrics& metrics, EpochMillis endTime) {
        SessionSummary s;
        memset(&s, 0, sizeof(s));

        s.handle = state.handle;
        s.startTime = state.startTime;
        s.endTime = endTime;

        // Active time only; paused spans are excluded.
        s.totalDurationMs = state.elapsedBeforeMs;
        if (state.isActive && !state.isPaused) {
            s.totalDurationMs += SessionClock::elapsed(state.runningSince, endTime);
        }

        s.briskIntervals = state.completedBriskIntervals;
        s.slowIntervals = state.completedSlowIntervals;
        s.completedSuccessfully = (state.phase == PHASE_COMPLETED);
        s.config = state.config;

        s.steps = metrics.steps;
        s.distanceMeters = metrics.distanceMeters;
        s.hasHeartRate = metrics.hasHeartRate;
        s.averageHeartRate = metrics.hasHeartRate ? metrics.averageHeartRate : 0.0;
        s.activeCalories = metrics.activeCalories;

        s.totalIntervalMinutes = intervalMinutes(s.briskIntervals, s.slowIntervals, state.config);
        return s;
    }

    // Minutes spent in completed brisk and easy phases, rounded down.
    static uint32_t intervalMinutes(uint8_t brisk, uint8_t slow, const SessionConfiguration& config) {
        uint64_t seconds = (uint64_t)brisk * config.briskDuration + (uint64_t)slow * config.easyDuration;
        return (uint32_t)(seconds / 60);
    }

    // "MM:SS" of the active duration, minutes not wrapped at 60.
    static void formatDuration(const SessionSummary& s, char* buffer, size_t size) {
        unsigned long totalSeconds = (unsigned long)(s.totalDurationMs / 1000ULL);
        snprintf(buffer, size, "%02lu:%02lu", totalSeconds / 60, totalSeconds % 60);
    }
};
