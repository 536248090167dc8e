/*
 * =================================================================================
 * File:      lib/IntervalEngine/SessionContext.h
 * Description: Abstraction layer (HAL) for Clock, Activity Data, Storage, and Logging.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ICoachHAL {
public:
    virtual ~ICoachHAL() {}

    // --- Clock ---
    // Wall-clock time in milliseconds since the Unix epoch.
    // Must keep advancing while the device sleeps.
    virtual EpochMillis getEpochMillis() = 0;

    // --- Activity Data ---
    // Fills `out` with the metrics gathered during the current session.
    // Returns false if no activity source is available (metrics are zeroed).
    virtual bool readActivityMetrics(ActivityMetrics& out) = 0;

    // --- Storage ---
    // Hands a finished session to persistence. Called once per session.
    virtual void saveSummary(const SessionSummary& summary) = 0;

    // --- Logging ---
    virtual void log(const char* message) = 0;
};
