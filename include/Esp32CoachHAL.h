/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      include/Esp32CoachHAL.h
 * Description: Header for the ESP32 implementation of ICoachHAL.
 * Encapsulates Clock, Button, Haptics, Status LED, Logging and Activity Data.
 * Also acts as the on-device observer of phase transitions (cues).
 * =================================================================================
 */
#pragma once

#include "EventNotifier.h"
#include "Globals.h"
#include "SessionContext.h"
#include "Types.h"
#include <Arduino.h>
#include <OneButton.h>
#include <jled.h>

class Esp32CoachHAL : public ICoachHAL, public IEventNotifier {
private:
  Esp32CoachHAL();

  // --- Synchronization
  SemaphoreHandle_t _stateMutex;

  // --- Input Events ---
  volatile bool _pauseActionPending;
  volatile bool _skipActionPending;
  volatile bool _endActionPending;

  // -- Button State Tracking --
  volatile bool _pcbPressed;
  unsigned long _pressStartTime;

  PhaseKind _cachedPhase;

  // --- Log State (RAM + Serial) ---
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH]; // For WebAPI
  int _logBufferIndex;
  char _serialQueue[SERIAL_QUEUE_SIZE][MAX_LOG_LENGTH]; // For Serial
  int _queueHead;
  int _queueTail;

  // --- Peripherals ---
  OneButton _pcbButton;
  JLed _statusLed;
  JLed _vibration;

  // --- Activity Data (pushed by the companion) ---
  ActivityMetrics _metrics;
  bool _hasMetrics;

  // --- Health Tracking ---
  unsigned long _lastHealthCheck;
  unsigned long _bootStartTime;
  bool _bootMarkedStable;

  // --- Helpers ---
  void updateLedPattern(PhaseKind phase);
  void checkSystemHealth();
  void checkBootLoop();
  void markBootStability();
  void processLogQueue();
  void checkPressState();

  // --- Static Callback Handlers (OneButton) ---
  static void handlePcbPressStart(); // Tracks button down
  static void handlePcbClick();      // Pause / Resume / Start
  static void handlePcbDoubleClick(); // Skip
  static void handlePcbLongStart();  // End
  static void handlePcbLongStop();   // Tracks button up

public:
  static Esp32CoachHAL &getInstance();

  void initialize();
  void tick();

  // --- Thread Safety (Mutex Wrapper) ---
  // Returns true if lock acquired, false if timeout/busy
  bool lockState(uint32_t timeoutMs = 100);
  void unlockState();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();

  // -- Accessor for WebServer
  const char *getLogLine(int index) const {
    if (index >= 0 && index < LOG_BUFFER_SIZE)
      return _logBuffer[index];
    return "";
  }
  int getLogBufferIndex() const { return _logBufferIndex; }

  bool isButtonPressed() const { return _pcbPressed; }

  // Returns duration of current press in ms. Returns 0 if not pressed.
  uint32_t getCurrentPressDurationMs() const;

  // True once SNTP delivered a plausible wall-clock time.
  bool isClockSynced();

  // --- Button Actions (consumed by the main loop) ---
  bool checkPauseAction();
  bool checkSkipAction();
  bool checkEndAction();

  // --- Activity Data ---
  void setActivityMetrics(const ActivityMetrics &metrics);
  void clearActivityMetrics();

  // --- ICoachHAL Implementation ---
  EpochMillis getEpochMillis() override;
  bool readActivityMetrics(ActivityMetrics &out) override;
  void saveSummary(const SessionSummary &summary) override;

  // --- IEventNotifier Implementation (Haptics + LED) ---
  void onPhaseChange(PhaseKind phase, uint8_t intervalIndex) override;
  void onPaused() override;
  void onResumed() override;
  void onCompleted() override;
  void onEnded() override;
};
