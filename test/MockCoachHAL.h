/*
 * File: test/MockCoachHAL.h
 * Description: A "Spy" implementation of the HAL for Native Unit Tests.
 * The wall clock is fully manual: nothing moves unless the test advances it.
 */
#pragma once
#include "SessionContext.h"
#include <string>
#include <vector>
#include <stdio.h>
#include <cstring>

class MockCoachHAL : public ICoachHAL {
public:
    // --- Spy Variables ---
    std::vector<std::string> logs;
    std::vector<SessionSummary> savedSummaries;
    int metricsReads = 0;

    // Simulation Variables
    // 2026-01-01 08:00:00 UTC
    EpochMillis currentEpochMillis = 1767254400000ULL;

    // Activity Source
    bool _metricsAvailable = true;
    ActivityMetrics _metrics = { 0, 0.0, false, 0.0, 0.0 };

    // --- Helpers for Test Control ---

    void advanceTime(uint64_t ms) {
        currentEpochMillis += ms;
    }

    void advanceSeconds(uint32_t seconds) {
        currentEpochMillis += (uint64_t)seconds * 1000ULL;
    }

    void setMetrics(uint32_t steps, double distance, double avgHeartRate, double calories) {
        _metrics.steps = steps;
        _metrics.distanceMeters = distance;
        _metrics.hasHeartRate = avgHeartRate > 0.0;
        _metrics.averageHeartRate = avgHeartRate;
        _metrics.activeCalories = calories;
    }

    void setMetricsAvailable(bool available) {
        _metricsAvailable = available;
    }

    bool hasLogContaining(const char* fragment) const {
        for (size_t i = 0; i < logs.size(); i++) {
            if (logs[i].find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    // --- ICoachHAL Implementation ---

    EpochMillis getEpochMillis() override {
        return currentEpochMillis;
    }

    bool readActivityMetrics(ActivityMetrics& out) override {
        metricsReads++;
        if (!_metricsAvailable) return false;
        out = _metrics;
        return true;
    }

    void saveSummary(const SessionSummary& summary) override {
        savedSummaries.push_back(summary);
    }

    void log(const char* message) override {
        logs.push_back(std::string(message));
    }
};
