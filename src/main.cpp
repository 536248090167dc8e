/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      main.cpp
 * Description: Application entry point.
 * =================================================================================
 */

#include <Arduino.h>
#include <Ticker.h>
#include <WiFi.h>
#include <esp_task_wdt.h>

// --- Module Includes ---
#include "CompanionLink.h"
#include "Config.h"
#include "Esp32CoachHAL.h"
#include "Globals.h"
#include "Network.h"
#include "SettingsManager.h"
#include "WebManager.h"

// --- Interval Engine Includes ---
#include "EventNotifier.h"
#include "PhaseScheduler.h"

// --- Main ticker ---
Ticker masterTicker;
volatile uint32_t tickCounter = 0;
portMUX_TYPE timerMux = portMUX_INITIALIZER_UNLOCKED;

// --- Dependencies ---
Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
NetworkManager &network = NetworkManager::getInstance();
CompanionLink &companion = CompanionLink::getInstance();
WebManager &web = WebManager::getInstance();

// --- Interval Engine
EventNotifierHub notifiers;
PhaseScheduler *phaseScheduler = nullptr;

/**
 * Prints high-level firmware identity and build information.
 */
void printFirmwareDiagnostics() {
  char logBuf[128];

  hal.log("==========================================================================");
  hal.log("                       FIRMWARE IDENTITY                                  ");
  hal.log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  hal.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Firmware Version", DEVICE_VERSION);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", (long)__cplusplus);
  hal.log(logBuf);

  hal.log("==========================================================================");
}

/**
 * Applies button actions. Click starts the default session when idle and
 * toggles pause otherwise; double click skips; long press ends.
 */
void handleButtonActions() {
  if (hal.checkPauseAction()) {
    if (phaseScheduler->isActive()) {
      phaseScheduler->togglePause("Button");
    } else {
      StartResult r = phaseScheduler->start(g_defaultSession);
      if (r == START_OK) {
        hal.clearActivityMetrics();
      } else {
        hal.logKeyValue("Button", startResultToString(r));
      }
    }
  }

  if (hal.checkSkipAction()) {
    phaseScheduler->skipToNextPhase("Button");
  }

  if (hal.checkEndAction()) {
    if (!phaseScheduler->end("Button")) {
      hal.logKeyValue("Button", "Long press ignored (idle).");
    }
  }
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

void setup() {
  Serial.begin(SERIAL_BAUD_RATE);
  delay(3000);

  // 1. Initialize Hardware
  hal.initialize();
  printFirmwareDiagnostics();

  hal.tick();

  // 2. Load Default Session
  SettingsManager::loadDefaultSession(g_defaultSession, DEFAULT_SESSION_CONFIG);

  // 3. Initialize Engine (haptics first, then the companion event channel)
  notifiers.add(&hal);
  notifiers.add(&companion);
  phaseScheduler = new PhaseScheduler(hal, notifiers, companion);

  // 4. Network & Wall Clock
  network.connect();

  // 5. Companion Link
  companion.begin(phaseScheduler);

  // 6. Diagnostics
  hal.printStartupDiagnostics();
  hal.tick();

  phaseScheduler->printStartupDiagnostics(g_defaultSession);
  hal.tick();

  network.printStartupDiagnostics();
  hal.tick();

  companion.printStartupDiagnostics();
  hal.tick();

  hal.log("==========================================================================");

  // 7. Start Master Timer
  hal.logKeyValue("Session", "Attaching master ticker.");
  masterTicker.attach_ms(g_systemDefaults.tickIntervalMs, []() {
    portENTER_CRITICAL_ISR(&timerMux);
    tickCounter++;
    portEXIT_CRITICAL_ISR(&timerMux);
  });

  // 8. Start Web API
  web.begin(phaseScheduler);
}

void loop() {
  // 1. System Housekeeping
  esp_task_wdt_reset();

  // 2. Hardware Tick (Inputs, LEDs, Haptics, Logging)
  hal.tick();

  // 3. Engine Tick
  uint32_t pendingTicks = 0;
  portENTER_CRITICAL(&timerMux);
  if (tickCounter > 0) {
    pendingTicks = tickCounter;
    tickCounter = 0;
  }
  portEXIT_CRITICAL(&timerMux);

  if (hal.lockState()) {
    handleButtonActions();

    // One tick catches up on every elapsed boundary, missed ticks need no replay
    if (pendingTicks > 0) {
      phaseScheduler->tick(hal.getEpochMillis());
    }

    // 4. Companion (inbound commands, outbound notifications)
    companion.tick();

    hal.unlockState();
  }
}
