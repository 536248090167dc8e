/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/PhaseScheduler.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the PhaseScheduler class, the interval-walking state machine.
 *
 * DESIGN NOTES:
 * 1. Decoupled from Hardware/Clock/Storage via ICoachHAL.
 * 2. Transition events go out through IEventNotifier, state snapshots
 *    through ICompanionMirror.
 * 3. Phase timing is anchored to absolute end instants (SessionClock), so
 *    tick() may be called late or irregularly without drift.
 * 4. All phase changes go through changePhase().
 * 5. Owns no timer. The host calls tick(now) periodically.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "SessionContext.h"
#include "EventNotifier.h"
#include "CompanionMirror.h"

class PhaseScheduler {
public:
    PhaseScheduler(ICoachHAL& hal, IEventNotifier& notifier, ICompanionMirror& mirror);

    // --- Main Loop Tick ---
    // Applies every phase boundary that lies at or before `now`, one
    // transition (and one notification) per boundary. No-op otherwise.
    void tick(EpochMillis now);

    // --- Commands ---
    StartResult start(const SessionConfiguration& config);
    void pause(const char* source);
    void resume(const char* source);
    void togglePause(const char* source);
    void skipToNextPhase(const char* source);

    // Stops the active session early. Returns false if no session is active.
    // Boundaries already passed are applied first; if that completes the
    // session, the completion summary is returned instead.
    bool end(const char* source, SessionSummary& outSummary);
    bool end(const char* source);

    // --- Remote Commands (Companion) ---
    void applyRemotePause();
    void applyRemoteResume();
    void applyRemoteSkip();
    bool applyRemoteEnd();

    // --- Mirror ---
    // Pushes the full current state to the companion regardless of revision.
    void resyncMirror();

    // --- State Accessors (Read-Only) ---
    SessionStateSnapshot currentState();
    SessionStateSnapshot snapshotAt(EpochMillis now) const;

    bool isActive() const { return _state.isActive; }
    bool isPaused() const { return _state.isPaused; }
    PhaseKind getPhase() const { return _state.phase; }
    SessionHandle getHandle() const { return _state.handle; }
    uint32_t getRevision() const { return _revision; }
    const SessionConfiguration& getActiveConfig() const { return _state.config; }
    uint64_t elapsedMs(EpochMillis now) const;

    bool getLastSummary(SessionSummary& out) const;

    /**
     * Timeline of the current and all following phases with their absolute
     * end instants, computed from the current anchor. While paused the
     * timeline assumes an immediate resume at `now`.
     * @return number of entries written.
     */
    size_t upcomingPhases(EpochMillis now, PhaseScheduleEntry* out, size_t maxEntries) const;

    void printStartupDiagnostics(const SessionConfiguration& defaults);

    // --- Transition Table ---
    // Row lookup: the phase following (phase, intervalIndex).
    // Returns false when the session completes after `phase`.
    static bool successor(const SessionConfiguration& config, PhaseKind phase, uint8_t intervalIndex,
                          PhaseKind& nextPhase, uint8_t& nextIndex);
    static uint32_t phaseDurationSeconds(const SessionConfiguration& config, PhaseKind phase);

private:
    // --- Dependencies ---
    ICoachHAL& _hal;
    IEventNotifier& _notifier;
    ICompanionMirror& _mirror;

    // --- Dynamic State ---
    SessionState _state;
    SessionHandle _nextHandle;
    uint32_t _revision;

    SessionSummary _lastSummary;
    bool _hasLastSummary;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM
    // =========================================================================

    void changePhase(PhaseKind next, EpochMillis boundary);
    void advancePhase(EpochMillis boundary, EpochMillis now);
    void completeSession(EpochMillis boundary, EpochMillis now, uint8_t closedInterval);
    void archiveSession(EpochMillis endTime);
    void publish(EpochMillis now);

    // =========================================================================
    // SECTION: LOGIC HELPERS
    // =========================================================================

    void freezeElapsed(EpochMillis now);
    void logKeyValue(const char *key, const char *value);
};
