/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/EventNotifier.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "EventNotifier.h"

EventNotifierHub::EventNotifierHub() : _count(0) {
    for (size_t i = 0; i < MAX_EVENT_OBSERVERS; i++) _observers[i] = nullptr;
}

bool EventNotifierHub::add(IEventNotifier* observer) {
    if (!observer || observer == this) return false;
    if (_count >= MAX_EVENT_OBSERVERS) return false;

    for (size_t i = 0; i < _count; i++) {
        if (_observers[i] == observer) return false;
    }

    _observers[_count++] = observer;
    return true;
}

void EventNotifierHub::onPhaseChange(PhaseKind phase, uint8_t intervalIndex) {
    for (size_t i = 0; i < _count; i++) _observers[i]->onPhaseChange(phase, intervalIndex);
}

void EventNotifierHub::onIntervalComplete(uint8_t intervalIndex) {
    for (size_t i = 0; i < _count; i++) _observers[i]->onIntervalComplete(intervalIndex);
}

void EventNotifierHub::onPaused() {
    for (size_t i = 0; i < _count; i++) _observers[i]->onPaused();
}

void EventNotifierHub::onResumed() {
    for (size_t i = 0; i < _count; i++) _observers[i]->onResumed();
}

void EventNotifierHub::onCompleted() {
    for (size_t i = 0; i < _count; i++) _observers[i]->onCompleted();
}

void EventNotifierHub::onEnded() {
    for (size_t i = 0; i < _count; i++) _observers[i]->onEnded();
}
