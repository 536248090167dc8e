/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      include/CompanionLink.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * BLE GATT link to the companion phone app.
 * - Outbound: state snapshots (ICompanionMirror) and transition events
 *   (IEventNotifier), serialized as JSON and notified from the main loop.
 * - Inbound: remote commands, activity metrics and Wi-Fi credentials.
 *   BLE callbacks only stage the data; tick() applies it under the state lock.
 * =================================================================================
 */
#pragma once
#include "CompanionMirror.h"
#include "EventNotifier.h"
#include "PhaseScheduler.h"
#include "Types.h"
#include "RingQueue.h"
#include "WireFormat.h"
#include <Arduino.h>

class BLEServer;
class BLECharacteristic;

#define COMPANION_PAYLOAD_SIZE 512
#define COMPANION_EVENT_SIZE 128
#define COMPANION_EVENT_QUEUE 8
#define COMPANION_COMMAND_QUEUE 8
#define COMPANION_SCHEDULE_ENTRIES 8

// One serialized event notification.
struct CompanionEvent {
  char json[COMPANION_EVENT_SIZE];
};

class CompanionLink : public ICompanionMirror, public IEventNotifier {
public:
  static CompanionLink &getInstance();

  // Starts the GATT server and advertising. Call once the engine exists.
  void begin(PhaseScheduler *engine);

  // Applies staged inbound data and flushes pending notifications.
  // Must be called from the main loop while holding the state lock.
  void tick();

  bool isConnected() const { return _connected; }
  uint32_t lastSentRevision() const { return _sent.revision(); }

  // --- ICompanionMirror ---
  void push(const SessionStateSnapshot &snapshot) override;
  void resync(const SessionStateSnapshot &snapshot) override;

  // --- IEventNotifier ---
  void onPhaseChange(PhaseKind phase, uint8_t intervalIndex) override;
  void onIntervalComplete(uint8_t intervalIndex) override;
  void onPaused() override;
  void onResumed() override;
  void onCompleted() override;
  void onEnded() override;

  // --- Inbound (BLE task) ---
  void stageCommand(RemoteCommand cmd);
  void stageMetrics(const char *payload, size_t len);
  void handleWifiPayload(const char *payload, size_t len);
  void setConnected(bool connected);

  void printStartupDiagnostics();

private:
  CompanionLink();

  // --- Dependencies ---
  PhaseScheduler *_engine;

  // --- BLE Objects ---
  BLEServer *_server;
  BLECharacteristic *_stateChar;
  BLECharacteristic *_eventChar;
  BLECharacteristic *_scheduleChar;

  // --- Connection ---
  volatile bool _connected;
  volatile bool _resyncPending;
  unsigned long _lastRefresh;

  // --- Outbound ---
  MirrorReplica _sent;
  char _statePayload[COMPANION_PAYLOAD_SIZE];
  bool _statePending;

  RingQueue<CompanionEvent, COMPANION_EVENT_QUEUE> _events;
  uint32_t _droppedEvents;

  // --- Inbound (staged) ---
  RingQueue<RemoteCommand, COMPANION_COMMAND_QUEUE> _commands;
  char _metricsPayload[COMPANION_EVENT_SIZE];
  volatile bool _metricsPending;

  // --- Helpers ---
  void stageSnapshot(const SessionStateSnapshot &snapshot);
  void enqueueEvent(const char *event, PhaseKind phase, uint8_t intervalIndex);
  void applyPendingCommands();
  void applyCommand(RemoteCommand cmd);
  void applyPendingMetrics();
  void publishSchedule();
  void flush();
  void log(const char *key, const char *value);
};
