/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/EventNotifier.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Outbound transition events.
 * The scheduler calls these synchronously, in order, exactly once per boundary.
 * Implementations must return quickly; long work (haptic patterns, BLE notify)
 * is queued and finished from the main loop.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class IEventNotifier {
public:
    virtual ~IEventNotifier() {}

    // A timed phase was entered. intervalIndex is 0 during warm-up.
    virtual void onPhaseChange(PhaseKind phase, uint8_t intervalIndex) = 0;

    // An easy phase finished, closing brisk/easy cycle `intervalIndex`.
    virtual void onIntervalComplete(uint8_t intervalIndex) {}

    virtual void onPaused() {}
    virtual void onResumed() {}

    // The session ran through its last phase.
    virtual void onCompleted() = 0;

    // The session was stopped early by end().
    virtual void onEnded() {}
};

/**
 * Fans one scheduler out to several observers (haptics, companion events, ...).
 * Observers are called in registration order. Capacity is fixed so no heap
 * allocation happens at runtime.
 */
class EventNotifierHub : public IEventNotifier {
public:
    EventNotifierHub();

    // Returns false if the hub is full or the observer is already registered.
    bool add(IEventNotifier* observer);
    size_t size() const { return _count; }

    void onPhaseChange(PhaseKind phase, uint8_t intervalIndex) override;
    void onIntervalComplete(uint8_t intervalIndex) override;
    void onPaused() override;
    void onResumed() override;
    void onCompleted() override;
    void onEnded() override;

private:
    IEventNotifier* _observers[MAX_EVENT_OBSERVERS];
    size_t _count;
};
