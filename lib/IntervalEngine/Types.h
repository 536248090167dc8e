/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum PhaseKind : uint8_t { PHASE_IDLE, PHASE_WARMUP, PHASE_BRISK, PHASE_EASY, PHASE_COOLDOWN, PHASE_PAUSED, PHASE_COMPLETED };
enum StartResult : uint8_t { START_OK, START_ERR_ALREADY_ACTIVE, START_ERR_INVALID_CONFIG };
enum ConfigError : uint8_t {
  CONFIG_OK,
  CONFIG_ERR_NO_INTERVALS,
  CONFIG_ERR_BRISK_DURATION,
  CONFIG_ERR_EASY_DURATION,
  CONFIG_ERR_WARMUP_DURATION,
  CONFIG_ERR_COOLDOWN_DURATION,
  CONFIG_ERR_TOO_MANY_INTERVALS,
  CONFIG_ERR_PHASE_TOO_LONG
};

// --- Time ---
// Wall-clock instant, milliseconds since the Unix epoch.
typedef uint64_t EpochMillis;
typedef uint32_t SessionHandle;

// --- Constants ---

// Session
#define MAX_TOTAL_INTERVALS 99
#define MAX_PHASE_SECONDS 14400 // 4 hours, keeps every ms countdown within 32 bits
#define MAX_SCHEDULE_ENTRIES (2 * MAX_TOTAL_INTERVALS + 2)
#define MAX_EVENT_OBSERVERS 4

// Logging
#define SERIAL_QUEUE_SIZE 50
#define LOG_BUFFER_SIZE 150
#define MAX_LOG_LENGTH 150

// --- Configuration Structs ---

// Durations are in seconds.
struct SessionConfiguration {
  uint32_t briskDuration;
  uint32_t easyDuration;
  uint32_t warmupDuration;
  uint32_t cooldownDuration;
  uint8_t totalIntervals;
  bool enableWarmup;
  bool enableCooldown;
};

struct SystemDefaults {
  uint32_t longPressDuration;
  uint32_t tickIntervalMs;
  uint32_t bootLoopThreshold;
  uint32_t stableBootTime;
  uint32_t wifiMaxRetries;
  uint32_t mirrorRefreshInterval; // Seconds between full-state refreshes to a connected companion
};

// --- State Structs ---

/**
 * Live session state. Owned and mutated by PhaseScheduler only.
 * phaseEndTime is meaningful only while running a timed phase,
 * remainingAtPauseMs only while paused.
 */
struct SessionState {
  SessionHandle handle;
  PhaseKind phase;
  PhaseKind resumePhase;
  uint8_t currentIntervalIndex;
  uint8_t completedBriskIntervals;
  uint8_t completedSlowIntervals;
  EpochMillis phaseEndTime;
  uint32_t remainingAtPauseMs;
  EpochMillis startTime;
  EpochMillis runningSince;
  uint64_t elapsedBeforeMs;
  bool isActive;
  bool isPaused;
  SessionConfiguration config;
};

// Immutable copy handed to readers and to the companion mirror.
struct SessionStateSnapshot {
  SessionHandle handle;
  uint32_t revision;
  PhaseKind phase;
  PhaseKind resumePhase;
  uint8_t currentIntervalIndex;
  uint8_t totalIntervals;
  uint8_t completedBriskIntervals;
  uint8_t completedSlowIntervals;
  EpochMillis phaseEndTime;   // 0 when the phase is not timed
  uint32_t remainingMs;
  uint32_t remainingAtPauseMs;
  uint64_t elapsedMs;
  uint64_t plannedDurationMs;
  EpochMillis capturedAt;
  bool isActive;
  bool isPaused;
};

struct PhaseScheduleEntry {
  PhaseKind phase;
  uint8_t intervalIndex;
  EpochMillis endTime;
};

// --- Summary Structs ---

struct ActivityMetrics {
  uint32_t steps;
  double distanceMeters;
  bool hasHeartRate;
  double averageHeartRate;
  double activeCalories;
};

struct SessionSummary {
  SessionHandle handle;
  EpochMillis startTime;
  EpochMillis endTime;
  uint64_t totalDurationMs;
  uint8_t briskIntervals;
  uint8_t slowIntervals;
  bool completedSuccessfully;
  SessionConfiguration config;
  uint32_t steps;
  double distanceMeters;
  bool hasHeartRate;
  double averageHeartRate;
  double activeCalories;
  uint32_t totalIntervalMinutes;
};

extern bool isTimedPhase(PhaseKind p);
extern const char *phaseToString(PhaseKind p);
extern const char *phaseDisplayName(PhaseKind p);
extern const char *phaseCueText(PhaseKind p);
extern const char *startResultToString(StartResult r);
extern const char *configErrorToString(ConfigError e);
