/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/PhaseScheduler.cpp
 *
 * Description:
 * Core session logic.
 * - Walks the phase table: [Warmup] -> (Brisk -> Easy) x N -> [Cooldown] -> Completed.
 * - Anchors every phase to an absolute end instant; natural transitions chain
 *   from the previous end instant, manual skips from "now".
 * - Notifies IEventNotifier and pushes snapshots to ICompanionMirror after
 *   each state change, in that order.
 * - Hands the session summary to the HAL on completion or end().
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "PhaseScheduler.h"
#include "SessionClock.h"
#include "SessionConfig.h"
#include "SummaryBuilder.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

PhaseScheduler::PhaseScheduler(ICoachHAL& hal, IEventNotifier& notifier, ICompanionMirror& mirror)
    : _hal(hal),
      _notifier(notifier),
      _mirror(mirror)
{
    memset(&_state, 0, sizeof(_state));
    _state.phase = PHASE_IDLE;
    _state.resumePhase = PHASE_IDLE;

    memset(&_lastSummary, 0, sizeof(_lastSummary));
    _hasLastSummary = false;

    _nextHandle = 1;
    _revision = 0;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Utils)
// =================================================================================

void PhaseScheduler::logKeyValue(const char *key, const char *value) {
    char tempBuf[128];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void PhaseScheduler::freezeElapsed(EpochMillis now) {
    _state.elapsedBeforeMs += SessionClock::elapsed(_state.runningSince, now);
    _state.runningSince = now;
}

uint64_t PhaseScheduler::elapsedMs(EpochMillis now) const {
    uint64_t total = _state.elapsedBeforeMs;
    if (_state.isActive && !_state.isPaused) {
        total += SessionClock::elapsed(_state.runningSince, now);
    }
    return total;
}

void PhaseScheduler::printStartupDiagnostics(const SessionConfiguration& defaults) {
    char logBuf[128];
    char timeStr[32];
    const char* boolStr[] = { "NO", "YES" };

    _hal.log("==========================================================================");
    _hal.log("                       INTERVAL ENGINE DIAGNOSTICS                        ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current Phase", phaseToString(_state.phase));
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session Active", boolStr[_state.isActive]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Mirror Revision", _revision);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: DEFAULT SESSION
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ DEFAULT SESSION ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Intervals", defaults.totalIntervals);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s / %u s", "Brisk / Easy", defaults.briskDuration, defaults.easyDuration);
    _hal.log(logBuf);

    if (defaults.enableWarmup) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Warm Up", defaults.warmupDuration);
    } else {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Warm Up", "OFF");
    }
    _hal.log(logBuf);

    if (defaults.enableCooldown) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Cool Down", defaults.cooldownDuration);
    } else {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Cool Down", "OFF");
    }
    _hal.log(logBuf);

    TimeUtils::formatSeconds(SessionConfig::totalDurationSeconds(defaults), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Planned Time", timeStr);
    _hal.log(logBuf);

    // RUN VALIDATION
    ConfigError err = SessionConfig::validate(defaults);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Self-Check", err == CONFIG_OK ? "PASS" : "FAIL (INVALID CONFIG)");
    _hal.log(logBuf);

    if (err != CONFIG_OK) {
        snprintf(logBuf, sizeof(logBuf), " WARNING: %s. Default session will be rejected.", configErrorToString(err));
        _hal.log(logBuf);
    }

    // -------------------------------------------------------------------------
    // SECTION: LAST SESSION
    // -------------------------------------------------------------------------
    if (_hasLastSummary) {
        _hal.log("");
        _hal.log("[ LAST SESSION ]");

        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Completed", boolStr[_lastSummary.completedSuccessfully]);
        _hal.log(logBuf);
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u / %u", "Brisk / Easy Done", _lastSummary.briskIntervals, _lastSummary.slowIntervals);
        _hal.log(logBuf);
        TimeUtils::formatSeconds((unsigned long)(_lastSummary.totalDurationMs / 1000ULL), timeStr, sizeof(timeStr));
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Active Time", timeStr);
        _hal.log(logBuf);
    }
}

// =================================================================================
// SECTION: TRANSITION TABLE
// =================================================================================

bool PhaseScheduler::successor(const SessionConfiguration& config, PhaseKind phase, uint8_t intervalIndex,
                               PhaseKind& nextPhase, uint8_t& nextIndex) {
    switch (phase) {
    case PHASE_WARMUP:
        nextPhase = PHASE_BRISK;
        nextIndex = 1;
        return true;

    case PHASE_BRISK:
        nextPhase = PHASE_EASY;
        nextIndex = intervalIndex;
        return true;

    case PHASE_EASY:
        if (intervalIndex < config.totalIntervals) {
            nextPhase = PHASE_BRISK;
            nextIndex = intervalIndex + 1;
            return true;
        }
        if (config.enableCooldown) {
            nextPhase = PHASE_COOLDOWN;
            nextIndex = intervalIndex;
            return true;
        }
        return false;

    case PHASE_COOLDOWN:
    default:
        return false;
    }
}

uint32_t PhaseScheduler::phaseDurationSeconds(const SessionConfiguration& config, PhaseKind phase) {
    switch (phase) {
    case PHASE_WARMUP:   return config.warmupDuration;
    case PHASE_BRISK:    return config.briskDuration;
    case PHASE_EASY:     return config.easyDuration;
    case PHASE_COOLDOWN: return config.cooldownDuration;
    default:             return 0;
    }
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM (The Event Core)
// =================================================================================

/**
 * Centralized phase transition.
 * Anchors the new phase to `boundary` (the instant the previous phase ended)
 * and logs it. Callers notify and publish afterwards.
 */
void PhaseScheduler::changePhase(PhaseKind next, EpochMillis boundary) {
    _state.phase = next;
    _state.phaseEndTime = SessionClock::endTime(
        boundary, SessionClock::secondsToMs(phaseDurationSeconds(_state.config, next)));

    char durStr[16];
    TimeUtils::formatCountdown(SessionClock::secondsToMs(phaseDurationSeconds(_state.config, next)), durStr, sizeof(durStr));

    char logBuf[96];
    if (next == PHASE_BRISK || next == PHASE_EASY) {
        snprintf(logBuf, sizeof(logBuf), ">>> PHASE CHANGE: %s %u/%u (%s)",
                 phaseToString(next), _state.currentIntervalIndex, _state.config.totalIntervals, durStr);
    } else {
        snprintf(logBuf, sizeof(logBuf), ">>> PHASE CHANGE: %s (%s)", phaseToString(next), durStr);
    }
    logKeyValue("Session", logBuf);
}

/**
 * Applies one row of the transition table at `boundary`.
 * Used both for natural expiry (boundary = previous end instant) and for
 * skips (boundary = now).
 */
void PhaseScheduler::advancePhase(EpochMillis boundary, EpochMillis now) {
    PhaseKind current = _state.phase;
    uint8_t closedInterval = 0;

    // 1. Counter effects of leaving the current phase
    if (current == PHASE_BRISK) {
        _state.completedBriskIntervals++;
    } else if (current == PHASE_EASY) {
        _state.completedSlowIntervals++;
        closedInterval = _state.currentIntervalIndex;
    }

    // 2. Resolve next row
    PhaseKind next;
    uint8_t nextIndex;
    if (!successor(_state.config, current, _state.currentIntervalIndex, next, nextIndex)) {
        completeSession(boundary, now, closedInterval);
        return;
    }

    _state.currentIntervalIndex = nextIndex;
    changePhase(next, boundary);

    // 3. Notify, then mirror
    if (closedInterval > 0) _notifier.onIntervalComplete(closedInterval);
    _notifier.onPhaseChange(next, nextIndex);
    publish(now);
}

void PhaseScheduler::completeSession(EpochMillis boundary, EpochMillis now, uint8_t closedInterval) {
    freezeElapsed(boundary);

    _state.phase = PHASE_COMPLETED;
    _state.phaseEndTime = 0;
    _state.isActive = false;
    _state.isPaused = false;

    char timeStr[32];
    char logBuf[96];
    TimeUtils::formatSeconds((unsigned long)(_state.elapsedBeforeMs / 1000ULL), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), ">>> SESSION COMPLETE: %u/%u intervals in %s",
             _state.completedSlowIntervals, _state.config.totalIntervals, timeStr);
    logKeyValue("Session", logBuf);

    // Summary first: observers may start the next session from onCompleted()
    archiveSession(boundary);

    if (closedInterval > 0) _notifier.onIntervalComplete(closedInterval);
    _notifier.onCompleted();
    publish(now);
}

/**
 * Shared summary path of natural completion and end().
 * Expects elapsed time to be frozen and isActive cleared.
 */
void PhaseScheduler::archiveSession(EpochMillis endTime) {
    ActivityMetrics metrics;
    memset(&metrics, 0, sizeof(metrics));

    if (!_hal.readActivityMetrics(metrics)) {
        memset(&metrics, 0, sizeof(metrics));
        logKeyValue("Summary", "No activity data available.");
    }

    _lastSummary = SummaryBuilder::build(_state, metrics, endTime);
    _hasLastSummary = true;

    char durStr[16];
    char logBuf[96];
    SummaryBuilder::formatDuration(_lastSummary, durStr, sizeof(durStr));
    snprintf(logBuf, sizeof(logBuf), "#%u %s, %s active, %u steps",
             _lastSummary.handle, _lastSummary.completedSuccessfully ? "completed" : "ended early",
             durStr, _lastSummary.steps);
    logKeyValue("Summary", logBuf);

    _hal.saveSummary(_lastSummary);
}

void PhaseScheduler::publish(EpochMillis now) {
    _revision++;
    _mirror.push(snapshotAt(now));
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

/**
 * Called by the host periodically (1x/sec on the device).
 * Catches up on every boundary that passed since the last call, so a host that
 * was suspended still produces one notification per phase entered.
 */
void PhaseScheduler::tick(EpochMillis now) {
    while (_state.isActive && !_state.isPaused &&
           isTimedPhase(_state.phase) && _state.phaseEndTime <= now) {
        advancePhase(_state.phaseEndTime, now);
    }
}

// =================================================================================
// SECTION: ACTIONS & TRANSITIONS
// =================================================================================

StartResult PhaseScheduler::start(const SessionConfiguration& config) {
    // 1. Single session per scheduler
    if (_state.isActive) {
        logKeyValue("Session", "Start Failed: Session already active.");
        return START_ERR_ALREADY_ACTIVE;
    }

    // 2. Configuration Validation
    ConfigError err = SessionConfig::validate(config);
    if (err != CONFIG_OK) {
        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "Start Failed: Invalid Configuration (%s).", configErrorToString(err));
        logKeyValue("Session", logBuf);
        return START_ERR_INVALID_CONFIG;
    }

    // 3. Commit State
    EpochMillis now = _hal.getEpochMillis();

    memset(&_state, 0, sizeof(_state));
    _state.config = config;
    _state.handle = _nextHandle++;
    _state.startTime = now;
    _state.runningSince = now;
    _state.isActive = true;
    _state.resumePhase = PHASE_IDLE;

    PhaseKind first = config.enableWarmup ? PHASE_WARMUP : PHASE_BRISK;
    _state.currentIntervalIndex = (first == PHASE_BRISK) ? 1 : 0;

    char logBuf[128];
    char timeStr[32];
    snprintf(logBuf, sizeof(logBuf), "New Session #%u: %u x (%u s brisk / %u s easy), warm up %s, cool down %s",
             _state.handle, config.totalIntervals, config.briskDuration, config.easyDuration,
             config.enableWarmup ? "ON" : "OFF", config.enableCooldown ? "ON" : "OFF");
    logKeyValue("Session", logBuf);

    TimeUtils::formatSeconds(SessionConfig::totalDurationSeconds(config), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Planned Time: %s", timeStr);
    logKeyValue("Session", logBuf);

    // 4. Transition
    changePhase(first, now);
    _notifier.onPhaseChange(first, _state.currentIntervalIndex);
    publish(now);

    return START_OK;
}

void PhaseScheduler::pause(const char* source) {
    if (!_state.isActive || _state.isPaused) return;

    EpochMillis now = _hal.getEpochMillis();

    // Apply boundaries the host has not ticked over yet, so the pause
    // freezes the phase that is actually running at `now`
    tick(now);
    if (!_state.isActive) return;

    _state.remainingAtPauseMs = SessionClock::remaining(_state.phaseEndTime, now);
    freezeElapsed(now);
    _state.resumePhase = _state.phase;
    _state.phase = PHASE_PAUSED;
    _state.phaseEndTime = 0;
    _state.isPaused = true;

    char remStr[16];
    char logBuf[100];
    TimeUtils::formatCountdown(_state.remainingAtPauseMs, remStr, sizeof(remStr));
    snprintf(logBuf, sizeof(logBuf), "Paused by %s (%s left in %s)", source, remStr, phaseToString(_state.resumePhase));
    logKeyValue("Session", logBuf);

    _notifier.onPaused();
    publish(now);
}

void PhaseScheduler::resume(const char* source) {
    if (!_state.isActive || !_state.isPaused) return;

    EpochMillis now = _hal.getEpochMillis();

    // Re-anchor: the frozen remainder starts counting again from now
    _state.phase = _state.resumePhase;
    _state.phaseEndTime = SessionClock::endTime(now, _state.remainingAtPauseMs);
    _state.remainingAtPauseMs = 0;
    _state.runningSince = now;
    _state.isPaused = false;

    char logBuf[100];
    snprintf(logBuf, sizeof(logBuf), "Resumed by %s (%s)", source, phaseToString(_state.phase));
    logKeyValue("Session", logBuf);

    _notifier.onResumed();
    publish(now);
}

void PhaseScheduler::togglePause(const char* source) {
    if (_state.isPaused) resume(source);
    else pause(source);
}

void PhaseScheduler::skipToNextPhase(const char* source) {
    if (!_state.isActive) {
        logKeyValue("Session", "Skip ignored: no active session.");
        return;
    }
    if (_state.isPaused) {
        logKeyValue("Session", "Skip ignored: session paused.");
        return;
    }

    char logBuf[100];
    snprintf(logBuf, sizeof(logBuf), "Skip requested by %s", source);
    logKeyValue("Session", logBuf);

    EpochMillis now = _hal.getEpochMillis();
    advancePhase(now, now);
}

bool PhaseScheduler::end(const char* source, SessionSummary& outSummary) {
    if (!_state.isActive) {
        logKeyValue("Session", "End ignored: no active session.");
        return false;
    }

    EpochMillis now = _hal.getEpochMillis();

    if (!_state.isPaused) {
        // Count phases that finished before the host ticked
        tick(now);
        if (!_state.isActive) {
            logKeyValue("Session", "End: session had already completed.");
            outSummary = _lastSummary;
            return true;
        }
        freezeElapsed(now);
    }
    // Paused time was already frozen at pause()

    _state.isActive = false;
    _state.isPaused = false;
    _state.phase = PHASE_IDLE;
    _state.phaseEndTime = 0;
    _state.remainingAtPauseMs = 0;

    char timeStr[32];
    char logBuf[100];
    TimeUtils::formatSeconds((unsigned long)(_state.elapsedBeforeMs / 1000ULL), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Session ended by %s after %s", source, timeStr);
    logKeyValue("Session", logBuf);

    archiveSession(now);
    outSummary = _lastSummary;

    _notifier.onEnded();
    publish(now);
    return true;
}

bool PhaseScheduler::end(const char* source) {
    SessionSummary discarded;
    return end(source, discarded);
}

// =================================================================================
// SECTION: REMOTE COMMANDS
// =================================================================================

void PhaseScheduler::applyRemotePause() {
    pause("Companion");
}

void PhaseScheduler::applyRemoteResume() {
    resume("Companion");
}

void PhaseScheduler::applyRemoteSkip() {
    skipToNextPhase("Companion");
}

bool PhaseScheduler::applyRemoteEnd() {
    return end("Companion");
}

void PhaseScheduler::resyncMirror() {
    EpochMillis now = _hal.getEpochMillis();
    logKeyValue("Mirror", "Full state resync.");
    _mirror.resync(snapshotAt(now));
}

// =================================================================================
// SECTION: QUERIES
// =================================================================================

SessionStateSnapshot PhaseScheduler::currentState() {
    return snapshotAt(_hal.getEpochMillis());
}

SessionStateSnapshot PhaseScheduler::snapshotAt(EpochMillis now) const {
    SessionStateSnapshot s;
    memset(&s, 0, sizeof(s));

    s.handle = _state.handle;
    s.revision = _revision;
    s.phase = _state.phase;
    s.resumePhase = _state.isPaused ? _state.resumePhase : _state.phase;
    s.currentIntervalIndex = _state.currentIntervalIndex;
    s.totalIntervals = _state.config.totalIntervals;
    s.completedBriskIntervals = _state.completedBriskIntervals;
    s.completedSlowIntervals = _state.completedSlowIntervals;
    s.isActive = _state.isActive;
    s.isPaused = _state.isPaused;
    s.capturedAt = now;

    if (_state.isActive && !_state.isPaused && isTimedPhase(_state.phase)) {
        s.phaseEndTime = _state.phaseEndTime;
        s.remainingMs = SessionClock::remaining(_state.phaseEndTime, now);
    } else if (_state.isPaused) {
        s.remainingAtPauseMs = _state.remainingAtPauseMs;
        s.remainingMs = _state.remainingAtPauseMs;
    }

    s.elapsedMs = elapsedMs(now);
    s.plannedDurationMs = SessionClock::secondsToMs(SessionConfig::totalDurationSeconds(_state.config));
    return s;
}

bool PhaseScheduler::getLastSummary(SessionSummary& out) const {
    if (!_hasLastSummary) return false;
    out = _lastSummary;
    return true;
}

size_t PhaseScheduler::upcomingPhases(EpochMillis now, PhaseScheduleEntry* out, size_t maxEntries) const {
    if (!_state.isActive || !out || maxEntries == 0) return 0;

    PhaseKind phase = _state.isPaused ? _state.resumePhase : _state.phase;
    uint8_t index = _state.currentIntervalIndex;
    EpochMillis endTime = _state.isPaused
        ? SessionClock::endTime(now, _state.remainingAtPauseMs)
        : _state.phaseEndTime;

    size_t count = 0;
    while (count < maxEntries) {
        out[count].phase = phase;
        out[count].intervalIndex = index;
        out[count].endTime = endTime;
        count++;

        PhaseKind nextPhase;
        uint8_t nextIndex;
        if (!successor(_state.config, phase, index, nextPhase, nextIndex)) break;

        phase = nextPhase;
        index = nextIndex;
        endTime = SessionClock::endTime(endTime, SessionClock::secondsToMs(phaseDurationSeconds(_state.config, phase)));
    }
    return count;
}
