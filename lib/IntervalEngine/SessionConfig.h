/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/SessionConfig.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Validation, built-in presets and derived values for SessionConfiguration.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class SessionConfig {
public:
    // --- Presets ---
    static SessionConfiguration standard();           // 3/3 min x5
    static SessionConfiguration standardWithWarmup(); // 3/3 min x5, 2 min warm up + cool down
    static SessionConfiguration beginner();           // 1 min brisk, 2 min easy x5
    static SessionConfiguration advanced();           // 4 min brisk, 2 min easy x6

    /**
     * Looks up a preset by its wire name ("standard", "standard_warmup",
     * "beginner", "advanced").
     * @return true if the name is known and `out` was written.
     */
    static bool presetByName(const char* name, SessionConfiguration& out);

    /**
     * Checks the configuration invariants:
     * 1 <= totalIntervals <= MAX_TOTAL_INTERVALS, brisk/easy in 1..MAX_PHASE_SECONDS,
     * enabled warm-up/cool-down in 1..MAX_PHASE_SECONDS.
     * Disabled optional phases are not checked.
     */
    static ConfigError validate(const SessionConfiguration& config);
    static bool isValid(const SessionConfiguration& config) { return validate(config) == CONFIG_OK; }

    // Planned timed duration: warmup? + N * (brisk + easy) + cooldown?
    static uint32_t totalDurationSeconds(const SessionConfiguration& config);

    // Number of timed phases the session will run through.
    static uint16_t phaseCount(const SessionConfiguration& config);
};
