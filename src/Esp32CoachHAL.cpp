/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      src/Esp32CoachHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Low-level hardware abstraction layer. Provides the wall clock, button input,
 * vibration cues, LED patterns, logging and system health monitoring.
 * =================================================================================
 */
#include "Esp32CoachHAL.h"
#include <esp_task_wdt.h>
#include <sys/time.h>

#include "Config.h"
#include "Globals.h"
#include "SettingsManager.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

Esp32CoachHAL::Esp32CoachHAL()
    : _stateMutex(NULL), _pauseActionPending(false), _skipActionPending(false), _endActionPending(false), _pcbPressed(false),
      _pressStartTime(0), _cachedPhase((PhaseKind)-1), _logBufferIndex(0), _queueHead(0), _queueTail(0),
      _statusLed(JLed(STATUS_LED_PIN)), _vibration(JLed(VIBRATION_PIN)), _hasMetrics(false), _lastHealthCheck(0), _bootStartTime(0),
      _bootMarkedStable(false) {
  // OneButton Setup (Pin, ActiveLow, Pullup)
  _pcbButton = OneButton(PCB_BUTTON_PIN, true, true);

  memset(&_metrics, 0, sizeof(_metrics));

  // Clear log buffer
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    _logBuffer[i][0] = '\0';
}

Esp32CoachHAL &Esp32CoachHAL::getInstance() {
  static Esp32CoachHAL instance;
  return instance;
}

// --- Initialization ---

void Esp32CoachHAL::initialize() {

  // 1. Acquire the Mutex
  _stateMutex = xSemaphoreCreateRecursiveMutex();
  if (_stateMutex == NULL) {
    Serial.println("Critical Error: Could not create Mutex.");
    ESP.restart();
  }

  // 2. Logging Init
  logKeyValue("System", "Initializing Hardware...");

  // 3. Vibration Motor
  pinMode(VIBRATION_PIN, OUTPUT);
  digitalWrite(VIBRATION_PIN, LOW);
  _vibration.Off();

  // 4. Button Attachments
  _pcbButton.attachPress(handlePcbPressStart);        // State: DOWN
  _pcbButton.attachClick(handlePcbClick);             // State: UP + Action: Pause/Resume
  _pcbButton.attachDoubleClick(handlePcbDoubleClick); // State: UP + Action: Skip
  _pcbButton.setPressMs(g_systemDefaults.longPressDuration * 1000);
  _pcbButton.attachLongPressStart(handlePcbLongStart); // Action: End
  _pcbButton.attachLongPressStop(handlePcbLongStop);   // State: UP

  // 5. Watchdog
  logKeyValue("System", "Initializing Hardware Watchdog...");
  esp_task_wdt_init(DEFAULT_WDT_TIMEOUT, true);
  esp_task_wdt_add(NULL);

  // 6. Boot Checks
  checkBootLoop();

  // 7. Force Initial LED State
  updateLedPattern(PHASE_IDLE);
}

// --- Main Tick ---

void Esp32CoachHAL::tick() {

  if (!lockState()) {
    return;
  }

  // 1. Process Serial Logs (Internal Queue)
  processLogQueue();

  // 2. Tick Peripherals
  _pcbButton.tick();
  _statusLed.Update();
  _vibration.Update();

  // 3. Periodic Health Checks (Every 60s)
  if (millis() - _lastHealthCheck > 60000) {
    checkSystemHealth();
    _lastHealthCheck = millis();
  }

  // 4. Maintenance
  markBootStability();

  unlockState();
}

uint32_t Esp32CoachHAL::getCurrentPressDurationMs() const {
  if (!_pcbPressed || _pressStartTime == 0) {
    return 0;
  }
  return millis() - _pressStartTime;
}

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

bool Esp32CoachHAL::lockState(uint32_t timeoutMs) {
  if (_stateMutex == NULL)
    return false;
  return (xSemaphoreTakeRecursive(_stateMutex, (TickType_t)pdMS_TO_TICKS(timeoutMs)) == pdTRUE);
}

void Esp32CoachHAL::unlockState() {
  if (_stateMutex != NULL) {
    xSemaphoreGiveRecursive(_stateMutex);
  }
}

// =================================================================================
// SECTION: LOGGING SYSTEM
// =================================================================================

void Esp32CoachHAL::log(const char *message) {
  // 1. Write to RAM (WebAPI Buffer)
  strncpy(_logBuffer[_logBufferIndex], message, MAX_LOG_LENGTH);
  _logBuffer[_logBufferIndex][MAX_LOG_LENGTH - 1] = '\0';

  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
  }

  // 2. Write to Serial Queue
  int nextHead = (_queueHead + 1) % SERIAL_QUEUE_SIZE;
  if (nextHead != _queueTail) {
    strncpy(_serialQueue[_queueHead], message, MAX_LOG_LENGTH);
    _serialQueue[_queueHead][MAX_LOG_LENGTH - 1] = '\0';
    _queueHead = nextHead;
  }
  // Else: Queue full, drop message to prevent blocking
}

void Esp32CoachHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void Esp32CoachHAL::processLogQueue() {
  // Process a batch of logs to keep Serial active without blocking too long
  int maxLines = 10;
  while (_queueHead != _queueTail && maxLines > 0) {
    Serial.println(_serialQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % SERIAL_QUEUE_SIZE;
    maxLines--;
  }
}

void Esp32CoachHAL::printStartupDiagnostics() {
  char logBuf[128];

  log("==========================================================================");
  log("                            DEVICE DIAGNOSTICS                           ");
  log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: SYSTEM HEALTH
  // -------------------------------------------------------------------------
  log("[ SYSTEM HEALTH ]");

  uint32_t freeHeap = ESP.getFreeHeap();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u bytes", "Free Heap", freeHeap);
  log(logBuf);

  float temp = temperatureRead();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f C", "CPU Temp", temp);
  log(logBuf);

  int crashes = SettingsManager::getCrashCount();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Recorded Crashes", crashes);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: CLOCK
  // -------------------------------------------------------------------------
  log("");
  log("[ WALL CLOCK ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "SNTP Synced", isClockSynced() ? "YES" : "NO");
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %llu", "Epoch (ms)", (unsigned long long)getEpochMillis());
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s @ %s", "Time Source", NTP_SERVER, TZ_INFO);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: GPIO CONFIGURATION
  // -------------------------------------------------------------------------
  log("");
  log("[ GPIO & PERIPHERALS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "PCB Button", PCB_BUTTON_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "Status LED", STATUS_LED_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "Vibration Motor", VIBRATION_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Activity Data", _hasMetrics ? "RECEIVED" : "NONE");
  log(logBuf);
}

// =================================================================================
// SECTION: ICoachHAL IMPLEMENTATION
// =================================================================================

// --- Clock ---

EpochMillis Esp32CoachHAL::getEpochMillis() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  return (EpochMillis)tv.tv_sec * 1000ULL + (EpochMillis)(tv.tv_usec / 1000);
}

bool Esp32CoachHAL::isClockSynced() { return getEpochMillis() >= MIN_VALID_EPOCH_MS; }

// --- Activity Data ---

void Esp32CoachHAL::setActivityMetrics(const ActivityMetrics &metrics) {
  _metrics = metrics;
  _hasMetrics = true;
}

void Esp32CoachHAL::clearActivityMetrics() {
  memset(&_metrics, 0, sizeof(_metrics));
  _hasMetrics = false;
}

bool Esp32CoachHAL::readActivityMetrics(ActivityMetrics &out) {
  if (!_hasMetrics) {
    memset(&out, 0, sizeof(out));
    return false;
  }
  out = _metrics;
  return true;
}

// --- Storage ---

void Esp32CoachHAL::saveSummary(const SessionSummary &summary) { SettingsManager::saveLastSummary(summary); }

// --- Input Events ---

bool Esp32CoachHAL::checkPauseAction() {
  if (_pauseActionPending) {
    _pauseActionPending = false;
    return true;
  }
  return false;
}

bool Esp32CoachHAL::checkSkipAction() {
  if (_skipActionPending) {
    _skipActionPending = false;
    return true;
  }
  return false;
}

bool Esp32CoachHAL::checkEndAction() {
  if (_endActionPending) {
    _endActionPending = false;
    return true;
  }
  return false;
}

// =================================================================================
// SECTION: CUES (IEventNotifier)
// =================================================================================

void Esp32CoachHAL::onPhaseChange(PhaseKind phase, uint8_t intervalIndex) {
  switch (phase) {
  case PHASE_BRISK:
    // 3 quick pulses: speed up
    _vibration.Blink(150, 150).Repeat(3);
    break;
  case PHASE_EASY:
    // 2 slow pulses: slow down
    _vibration.Blink(500, 300).Repeat(2);
    break;
  case PHASE_WARMUP:
  case PHASE_COOLDOWN:
    _vibration.Blink(800, 0).Repeat(1);
    break;
  default:
    break;
  }
  updateLedPattern(phase);
}

void Esp32CoachHAL::onPaused() {
  _vibration.Blink(200, 0).Repeat(1);
  updateLedPattern(PHASE_PAUSED);
}

void Esp32CoachHAL::onResumed() {
  // Restore the pattern of the phase that was running
  _vibration.Blink(200, 0).Repeat(1);
  PhaseKind restore = _cachedPhase;
  _cachedPhase = (PhaseKind)-1;
  updateLedPattern(restore);
}

void Esp32CoachHAL::onCompleted() {
  // Celebration
  _vibration.Blink(600, 200).Repeat(4);
  updateLedPattern(PHASE_COMPLETED);
}

void Esp32CoachHAL::onEnded() {
  _vibration.Blink(1000, 0).Repeat(1);
  updateLedPattern(PHASE_IDLE);
}

// =================================================================================
// SECTION: INTERNAL LOGIC & HELPERS
// =================================================================================

void Esp32CoachHAL::updateLedPattern(PhaseKind phase) {
  if (phase == _cachedPhase)
    return;

  // Remember the running phase across a pause
  if (phase != PHASE_PAUSED) {
    _cachedPhase = phase;
  }

  switch (phase) {
  case PHASE_IDLE:
    _statusLed.Breathe(4000).Forever();
    break;
  case PHASE_WARMUP:
  case PHASE_COOLDOWN:
    _statusLed.FadeOn(750).FadeOff(750).Forever();
    break;
  case PHASE_BRISK:
    _statusLed.Blink(250, 250).Forever();
    break;
  case PHASE_EASY:
    _statusLed.On().Forever();
    break;
  case PHASE_PAUSED:
    _statusLed.Blink(500, 1500).Forever();
    break;
  case PHASE_COMPLETED:
    _statusLed.Blink(200, 200).Repeat(2).DelayAfter(3000).Forever();
    break;
  default:
    _statusLed.Off().Forever();
    break;
  }
}

void Esp32CoachHAL::checkBootLoop() {
  int crashes = SettingsManager::getCrashCount();

  if (crashes >= (int)g_systemDefaults.bootLoopThreshold) {
    Serial.println("CRITICAL: Boot Loop Detected! Entering Safe Mode.");
    digitalWrite(VIBRATION_PIN, LOW);

    pinMode(STATUS_LED_PIN, OUTPUT);
    digitalWrite(STATUS_LED_PIN, HIGH);

    // Erase settings so the next boot starts from defaults
    SettingsManager::wipeAll();

    for (int i = 0; i < 30; i++) {
      esp_task_wdt_reset();
      delay(1000);
    }
  }

  SettingsManager::incrementCrashCount();
  _bootStartTime = millis();
}

void Esp32CoachHAL::markBootStability() {
  if (!_bootMarkedStable && (millis() - _bootStartTime > g_systemDefaults.stableBootTime)) {
    _bootMarkedStable = true;
    SettingsManager::clearCrashCount();
    logKeyValue("System", "System stable.");
  }
}

void Esp32CoachHAL::checkSystemHealth() {
  size_t freeMem = ESP.getFreeHeap();
  if (freeMem < 10000) {
    logKeyValue("System", "CRITICAL: Low Heap! Restarting.");
    digitalWrite(VIBRATION_PIN, LOW);
    ESP.restart();
  }

  if (!isClockSynced()) {
    logKeyValue("System", "Wall clock not synced.");
  }
}

void Esp32CoachHAL::checkPressState() {
  bool wasPressed = (_pressStartTime != 0);

  if (_pcbPressed && !wasPressed) {
    _pressStartTime = millis();
  } else if (!_pcbPressed && wasPressed) {
    _pressStartTime = 0;
  }
}

// =================================================================================
// SECTION: STATIC HANDLERS (OneButton Callbacks)
// =================================================================================

void Esp32CoachHAL::handlePcbPressStart() {
  Esp32CoachHAL &inst = getInstance();
  inst._pcbPressed = true;
  inst.checkPressState();
}

void Esp32CoachHAL::handlePcbClick() {
  Esp32CoachHAL &inst = getInstance();
  inst._pcbPressed = false;
  inst.checkPressState();
  inst._pauseActionPending = true;
}

void Esp32CoachHAL::handlePcbDoubleClick() {
  Esp32CoachHAL &inst = getInstance();
  inst._pcbPressed = false;
  inst.checkPressState();
  inst._skipActionPending = true;
}

void Esp32CoachHAL::handlePcbLongStart() { getInstance()._endActionPending = true; }

void Esp32CoachHAL::handlePcbLongStop() {
  Esp32CoachHAL &inst = getInstance();
  inst._pcbPressed = false;
  inst.checkPressState();
}
