/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/CompanionMirror.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * State mirroring towards a companion device.
 * - ICompanionMirror:  outbound port, pushed after every state change.
 * - MirrorReplica:     receiving-side model. Applies snapshots by revision so
 *                      duplicated or reordered pushes are harmless.
 * Snapshots carry the absolute phase end instant, never "seconds remaining",
 * so each side computes its own countdown from its own clock.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ICompanionMirror {
public:
    virtual ~ICompanionMirror() {}

    // Called after every transition (start, phase change, pause, resume, end).
    virtual void push(const SessionStateSnapshot& snapshot) = 0;

    // Full state push on demand, e.g. when the companion reconnects.
    virtual void resync(const SessionStateSnapshot& snapshot) = 0;
};

class MirrorReplica {
public:
    MirrorReplica();

    /**
     * Applies a pushed snapshot if it is newer than the held one.
     * @return true if the snapshot was applied, false if stale or duplicate.
     */
    bool apply(const SessionStateSnapshot& snapshot);

    // Unconditionally replaces the held state (resync).
    void force(const SessionStateSnapshot& snapshot);

    void clear();

    bool hasState() const { return _hasState; }
    const SessionStateSnapshot& state() const { return _state; }
    uint32_t revision() const { return _hasState ? _state.revision : 0; }

    // Countdown as seen on this side, derived from the absolute end instant.
    uint32_t remainingMs(EpochMillis now) const;

private:
    SessionStateSnapshot _state;
    bool _hasState;
};
