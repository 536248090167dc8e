/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/SessionConfig.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "SessionConfig.h"

// =================================================================================
// SECTION: PRESETS
// =================================================================================

SessionConfiguration SessionConfig::standard() {
    SessionConfiguration c = { 180, 180, 0, 0, 5, false, false };
    return c;
}

SessionConfiguration SessionConfig::standardWithWarmup() {
    SessionConfiguration c = { 180, 180, 120, 120, 5, true, true };
    return c;
}

SessionConfiguration SessionConfig::beginner() {
    SessionConfiguration c = { 60, 120, 0, 0, 5, false, false };
    return c;
}

SessionConfiguration SessionConfig::advanced() {
    SessionConfiguration c = { 240, 120, 0, 0, 6, false, false };
    return c;
}

bool SessionConfig::presetByName(const char* name, SessionConfiguration& out) {
    if (!name) return false;

    if (strcmp(name, "standard") == 0) out = standard();
    else if (strcmp(name, "standard_warmup") == 0) out = standardWithWarmup();
    else if (strcmp(name, "beginner") == 0) out = beginner();
    else if (strcmp(name, "advanced") == 0) out = advanced();
    else return false;

    return true;
}

// =================================================================================
// SECTION: VALIDATION
// =================================================================================

ConfigError SessionConfig::validate(const SessionConfiguration& config) {
    if (config.totalIntervals < 1) return CONFIG_ERR_NO_INTERVALS;
    if (config.totalIntervals > MAX_TOTAL_INTERVALS) return CONFIG_ERR_TOO_MANY_INTERVALS;
    if (config.briskDuration == 0) return CONFIG_ERR_BRISK_DURATION;
    if (config.easyDuration == 0) return CONFIG_ERR_EASY_DURATION;

    // Optional phases only matter when enabled
    if (config.enableWarmup && config.warmupDuration == 0) return CONFIG_ERR_WARMUP_DURATION;
    if (config.enableCooldown && config.cooldownDuration == 0) return CONFIG_ERR_COOLDOWN_DURATION;

    if (config.briskDuration > MAX_PHASE_SECONDS || config.easyDuration > MAX_PHASE_SECONDS) return CONFIG_ERR_PHASE_TOO_LONG;
    if (config.enableWarmup && config.warmupDuration > MAX_PHASE_SECONDS) return CONFIG_ERR_PHASE_TOO_LONG;
    if (config.enableCooldown && config.cooldownDuration > MAX_PHASE_SECONDS) return CONFIG_ERR_PHASE_TOO_LONG;

    return CONFIG_OK;
}

// =================================================================================
// SECTION: DERIVED VALUES
// =================================================================================

uint32_t SessionConfig::totalDurationSeconds(const SessionConfiguration& config) {
    uint64_t total = (uint64_t)config.totalIntervals * ((uint64_t)config.briskDuration + config.easyDuration);
    if (config.enableWarmup) total += config.warmupDuration;
    if (config.enableCooldown) total += config.cooldownDuration;

    // Only reachable with an unvalidated configuration
    if (total > 0xFFFFFFFFULL) return 0xFFFFFFFFUL;
    return (uint32_t)total;
}

uint16_t SessionConfig::phaseCount(const SessionConfiguration& config) {
    uint16_t count = (uint16_t)(2 * config.totalIntervals);
    if (config.enableWarmup) count++;
    if (config.enableCooldown) count++;
    return count;
}
