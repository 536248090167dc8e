/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/CompanionMirror.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "CompanionMirror.h"
#include "SessionClock.h"

MirrorReplica::MirrorReplica() {
    clear();
}

void MirrorReplica::clear() {
    memset(&_state, 0, sizeof(_state));
    _state.phase = PHASE_IDLE;
    _state.resumePhase = PHASE_IDLE;
    _hasState = false;
}

bool MirrorReplica::apply(const SessionStateSnapshot& snapshot) {
    // Revisions are monotonic per scheduler. Anything not newer is a replay.
    if (_hasState && snapshot.revision <= _state.revision) return false;

    _state = snapshot;
    _hasState = true;
    return true;
}

void MirrorReplica::force(const SessionStateSnapshot& snapshot) {
    _state = snapshot;
    _hasState = true;
}

uint32_t MirrorReplica::remainingMs(EpochMillis now) const {
    if (!_hasState || !_state.isActive) return 0;
    if (_state.isPaused) return _state.remainingAtPauseMs;
    if (!isTimedPhase(_state.phase)) return 0;
    return SessionClock::remaining(_state.phaseEndTime, now);
}
