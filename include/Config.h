/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines hardware pin mappings, system constants,
 * default settings, time sync parameters, and compiler flags.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Device Name String ---
#define DEVICE_NAME "StrideCoach"
#define DEVICE_VERSION "1.2.0"

// =================================================================================
// SECTION: HARDWARE & SYSTEM OBJECTS
// =================================================================================

#define SERIAL_BAUD_RATE 115200
#define DEFAULT_WDT_TIMEOUT 20

// System Identification
#define MAGIC_VALUE 0x57A1D000

// --- Pin Definitions ---
#define PCB_BUTTON_PIN 0 // Standard ESP32 Boot Button

#ifdef DEBUG_MODE
// Development board
#define STATUS_LED_PIN 2
#define VIBRATION_PIN 25
#else
// Production (wrist unit)
#define STATUS_LED_PIN 21
#define VIBRATION_PIN 19
#endif

// =================================================================================
// SECTION: TIME SYNC
// =================================================================================

#define NTP_SERVER "pool.ntp.org"
#define TZ_INFO "UTC0"

// Epoch ms below this means SNTP has not synced yet (2024-01-01)
#define MIN_VALID_EPOCH_MS 1704067200000ULL

// --- Defaults ---

#ifdef DEBUG_MODE
// ============================================================================
// DEBUG / DEVELOPMENT DEFAULTS
// ============================================================================
static const SystemDefaults DEFAULT_SYSTEM_DEFS = {
    2,     // longPressDuration
    1000,  // tickIntervalMs
    5,     // bootLoopThreshold
    30000, // stableBootTime
    3,     // wifiMaxRetries
    10     // mirrorRefreshInterval
};

// Short phases to walk through a session at the desk
static const SessionConfiguration DEFAULT_SESSION_CONFIG = {
    20,    // briskDuration
    20,    // easyDuration
    10,    // warmupDuration
    10,    // cooldownDuration
    2,     // totalIntervals
    false, // enableWarmup
    false  // enableCooldown
};

#else
// ============================================================================
// PRODUCTION / RELEASE DEFAULTS
// ============================================================================
static const SystemDefaults DEFAULT_SYSTEM_DEFS = {
    2,      // longPressDuration
    1000,   // tickIntervalMs
    5,      // bootLoopThreshold
    120000, // stableBootTime
    5,      // wifiMaxRetries
    30      // mirrorRefreshInterval
};

static const SessionConfiguration DEFAULT_SESSION_CONFIG = {
    180,   // briskDuration
    180,   // easyDuration
    120,   // warmupDuration
    120,   // cooldownDuration
    5,     // totalIntervals
    false, // enableWarmup
    false  // enableCooldown
};
#endif
