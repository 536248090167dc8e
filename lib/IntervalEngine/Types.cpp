/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      Types.cpp
 * =================================================================================
 */

#include "Types.h"

bool isTimedPhase(PhaseKind p) {
  return (p == PHASE_WARMUP || p == PHASE_BRISK || p == PHASE_EASY || p == PHASE_COOLDOWN);
}

const char *phaseToString(PhaseKind p) {
  switch (p) {
  case PHASE_WARMUP:
    return "WARMUP";
  case PHASE_BRISK:
    return "BRISK";
  case PHASE_EASY:
    return "EASY";
  case PHASE_COOLDOWN:
    return "COOLDOWN";
  case PHASE_PAUSED:
    return "PAUSED";
  case PHASE_COMPLETED:
    return "COMPLETED";
  default:
    return "IDLE";
  }
}

const char *phaseDisplayName(PhaseKind p) {
  switch (p) {
  case PHASE_WARMUP:
    return "Warm Up";
  case PHASE_BRISK:
    return "Brisk Walk";
  case PHASE_EASY:
    return "Easy Walk";
  case PHASE_COOLDOWN:
    return "Cool Down";
  case PHASE_PAUSED:
    return "Paused";
  case PHASE_COMPLETED:
    return "Complete";
  default:
    return "Ready";
  }
}

// Short cue line shown on the companion when a phase begins.
const char *phaseCueText(PhaseKind p) {
  switch (p) {
  case PHASE_WARMUP:
    return "WARM UP";
  case PHASE_BRISK:
    return "SPEED UP NOW";
  case PHASE_EASY:
    return "SLOW DOWN";
  case PHASE_COOLDOWN:
    return "COOL DOWN";
  case PHASE_COMPLETED:
    return "SESSION COMPLETE";
  default:
    return "";
  }
}

const char *startResultToString(StartResult r) {
  switch (r) {
  case START_OK:
    return "OK";
  case START_ERR_ALREADY_ACTIVE:
    return "ALREADY_ACTIVE";
  case START_ERR_INVALID_CONFIG:
    return "INVALID_CONFIG";
  default:
    return "UNKNOWN";
  }
}

const char *configErrorToString(ConfigError e) {
  switch (e) {
  case CONFIG_OK:
    return "OK";
  case CONFIG_ERR_NO_INTERVALS:
    return "totalIntervals must be at least 1";
  case CONFIG_ERR_BRISK_DURATION:
    return "briskDuration must be positive";
  case CONFIG_ERR_EASY_DURATION:
    return "easyDuration must be positive";
  case CONFIG_ERR_WARMUP_DURATION:
    return "warmupDuration must be positive when warmup is enabled";
  case CONFIG_ERR_COOLDOWN_DURATION:
    return "cooldownDuration must be positive when cooldown is enabled";
  case CONFIG_ERR_TOO_MANY_INTERVALS:
    return "totalIntervals must be at most 99";
  case CONFIG_ERR_PHASE_TOO_LONG:
    return "phase durations must be at most 14400 s";
  default:
    return "unknown";
  }
}
