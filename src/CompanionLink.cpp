/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      src/CompanionLink.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * BLE companion link. Mirrors the session state to the phone app and accepts
 * remote commands and activity metrics from it.
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <BLE2902.h>
#include <BLEDevice.h>
#include <BLEServer.h>
#include <BLEUtils.h>

#include "CompanionLink.h"
#include "Config.h"
#include "Esp32CoachHAL.h"
#include "Globals.h"
#include "SettingsManager.h"

// =================================================================================
// SECTION: CONSTANTS & UUIDS
// =================================================================================

#define COACH_SERVICE_UUID "7e1a0000-5c2b-4f0e-9d36-2a8b51c0f3a1"

// --- Outbound ---
#define COACH_STATE_CHAR_UUID "7e1a0001-5c2b-4f0e-9d36-2a8b51c0f3a1"
#define COACH_EVENT_CHAR_UUID "7e1a0002-5c2b-4f0e-9d36-2a8b51c0f3a1"
#define COACH_SCHEDULE_CHAR_UUID "7e1a0003-5c2b-4f0e-9d36-2a8b51c0f3a1"

// --- Inbound ---
#define COACH_COMMAND_CHAR_UUID "7e1a0010-5c2b-4f0e-9d36-2a8b51c0f3a1"
#define COACH_METRICS_CHAR_UUID "7e1a0011-5c2b-4f0e-9d36-2a8b51c0f3a1"
#define COACH_WIFI_CHAR_UUID "7e1a0012-5c2b-4f0e-9d36-2a8b51c0f3a1"

// =================================================================================
// SECTION: BLE CALLBACKS (Transport Only)
// =================================================================================

class CompanionServerCallbacks : public BLEServerCallbacks {
public:
  void onConnect(BLEServer *pServer) { CompanionLink::getInstance().setConnected(true); }

  void onDisconnect(BLEServer *pServer) {
    CompanionLink::getInstance().setConnected(false);
    BLEDevice::startAdvertising();
  }
};

class CompanionWriteCallbacks : public BLECharacteristicCallbacks {
public:
  void onWrite(BLECharacteristic *pCharacteristic) {
    std::string uuid = pCharacteristic->getUUID().toString();
    uint8_t *data = pCharacteristic->getData();
    size_t len = pCharacteristic->getLength();

    if (len == 0)
      return;

    CompanionLink &link = CompanionLink::getInstance();

    if (uuid == COACH_COMMAND_CHAR_UUID) {
      std::string token(data, data + len);
      link.stageCommand(WireFormat::parseRemoteCommand(token.c_str()));
    } else if (uuid == COACH_METRICS_CHAR_UUID) {
      link.stageMetrics((const char *)data, len);
    } else if (uuid == COACH_WIFI_CHAR_UUID) {
      link.handleWifiPayload((const char *)data, len);
    }
  }
};

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

CompanionLink &CompanionLink::getInstance() {
  static CompanionLink instance;
  return instance;
}

CompanionLink::CompanionLink()
    : _engine(nullptr), _server(nullptr), _stateChar(nullptr), _eventChar(nullptr), _scheduleChar(nullptr), _connected(false),
      _resyncPending(false), _lastRefresh(0), _statePending(false), _droppedEvents(0),
      _metricsPending(false) {
  _statePayload[0] = '\0';
  _metricsPayload[0] = '\0';
}

void CompanionLink::log(const char *key, const char *value) { Esp32CoachHAL::getInstance().logKeyValue(key, value); }

void CompanionLink::begin(PhaseScheduler *engine) {
  _engine = engine;

  log("BLE", "Starting companion service...");

  BLEDevice::init(DEVICE_NAME);
  _server = BLEDevice::createServer();
  _server->setCallbacks(new CompanionServerCallbacks());

  BLEService *pService = _server->createService(BLEUUID(COACH_SERVICE_UUID), 30);
  CompanionWriteCallbacks *writeCallbacks = new CompanionWriteCallbacks();

  auto createNotifyChar = [&](const char *uuid) {
    BLECharacteristic *p =
        pService->createCharacteristic(uuid, BLECharacteristic::PROPERTY_READ | BLECharacteristic::PROPERTY_NOTIFY);
    p->addDescriptor(new BLE2902());
    return p;
  };

  auto createWriteChar = [&](const char *uuid) {
    BLECharacteristic *p = pService->createCharacteristic(uuid, BLECharacteristic::PROPERTY_WRITE);
    p->setCallbacks(writeCallbacks);
    return p;
  };

  // Outbound
  _stateChar = createNotifyChar(COACH_STATE_CHAR_UUID);
  _eventChar = createNotifyChar(COACH_EVENT_CHAR_UUID);
  _scheduleChar = pService->createCharacteristic(COACH_SCHEDULE_CHAR_UUID, BLECharacteristic::PROPERTY_READ);

  // Inbound
  createWriteChar(COACH_COMMAND_CHAR_UUID);
  createWriteChar(COACH_METRICS_CHAR_UUID);
  createWriteChar(COACH_WIFI_CHAR_UUID);

  pService->start();

  BLEAdvertising *pAdvertising = BLEDevice::getAdvertising();
  pAdvertising->addServiceUUID(COACH_SERVICE_UUID);
  pAdvertising->start();

  // Seed the readable characteristics with the idle state
  _engine->resyncMirror();

  log("BLE", "Advertising.");
}

// =================================================================================
// SECTION: MAIN LOOP
// =================================================================================

void CompanionLink::tick() {
  if (_engine == nullptr)
    return;

  // 1. Reconnect: the companion may have missed any number of pushes
  if (_resyncPending) {
    _resyncPending = false;
    log("BLE", "Companion connected. Resyncing.");
    _engine->resyncMirror();
    _lastRefresh = millis();
  }

  // 2. Inbound
  applyPendingCommands();
  applyPendingMetrics();

  // 3. Periodic refresh while a session runs
  if (_connected && _engine->isActive() && (millis() - _lastRefresh >= g_systemDefaults.mirrorRefreshInterval * 1000UL)) {
    _engine->resyncMirror();
    _lastRefresh = millis();
  }

  // 4. Outbound
  flush();
}

void CompanionLink::setConnected(bool connected) {
  _connected = connected;
  if (connected) {
    _resyncPending = true;
  }
}

// =================================================================================
// SECTION: OUTBOUND (ICompanionMirror)
// =================================================================================

void CompanionLink::push(const SessionStateSnapshot &snapshot) {
  // Revisions already sent are dropped
  if (!_sent.apply(snapshot))
    return;
  stageSnapshot(snapshot);
}

void CompanionLink::resync(const SessionStateSnapshot &snapshot) {
  _sent.force(snapshot);
  stageSnapshot(snapshot);
}

void CompanionLink::stageSnapshot(const SessionStateSnapshot &snapshot) {
  JsonDocument doc;
  WireFormat::encodeSnapshot(snapshot, doc.to<JsonObject>());
  serializeJson(doc, _statePayload, sizeof(_statePayload));
  _statePending = true;
}

void CompanionLink::publishSchedule() {
  PhaseScheduleEntry entries[COMPANION_SCHEDULE_ENTRIES];
  size_t count = _engine->upcomingPhases(Esp32CoachHAL::getInstance().getEpochMillis(), entries, COMPANION_SCHEDULE_ENTRIES);

  JsonDocument doc;
  WireFormat::encodeSchedule(entries, count, doc.to<JsonArray>());

  char payload[COMPANION_PAYLOAD_SIZE];
  size_t len = serializeJson(doc, payload, sizeof(payload));
  _scheduleChar->setValue((uint8_t *)payload, len);
}

void CompanionLink::flush() {
  if (_statePending) {
    _statePending = false;
    _stateChar->setValue((uint8_t *)_statePayload, strlen(_statePayload));
    if (_connected)
      _stateChar->notify();
    publishSchedule();
  }

  CompanionEvent ev;
  while (_events.pop(ev)) {
    if (_connected) {
      _eventChar->setValue((uint8_t *)ev.json, strlen(ev.json));
      _eventChar->notify();
    }
  }
}

// =================================================================================
// SECTION: OUTBOUND (IEventNotifier)
// =================================================================================

void CompanionLink::enqueueEvent(const char *event, PhaseKind phase, uint8_t intervalIndex) {
  JsonDocument doc;
  doc["event"] = event;
  if (phase != PHASE_IDLE) {
    doc["phase"] = phaseToString(phase);
    doc["cue"] = phaseCueText(phase);
  }
  doc["interval"] = intervalIndex;

  CompanionEvent ev;
  serializeJson(doc, ev.json, sizeof(ev.json));

  // Queue full: the oldest event goes. The next state push carries the truth.
  if (_events.pushOverwrite(ev)) {
    _droppedEvents++;
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Event queue full, oldest dropped (%u total).", _droppedEvents);
    log("BLE", logBuf);
  }
}

void CompanionLink::onPhaseChange(PhaseKind phase, uint8_t intervalIndex) { enqueueEvent("phase", phase, intervalIndex); }

void CompanionLink::onIntervalComplete(uint8_t intervalIndex) { enqueueEvent("interval", PHASE_IDLE, intervalIndex); }

void CompanionLink::onPaused() { enqueueEvent("paused", PHASE_PAUSED, 0); }

void CompanionLink::onResumed() { enqueueEvent("resumed", PHASE_IDLE, 0); }

void CompanionLink::onCompleted() { enqueueEvent("completed", PHASE_COMPLETED, 0); }

void CompanionLink::onEnded() { enqueueEvent("ended", PHASE_IDLE, 0); }

// =================================================================================
// SECTION: INBOUND
// =================================================================================

void CompanionLink::stageCommand(RemoteCommand cmd) {
  if (cmd == CMD_NONE) {
    log("BLE", "Unknown command ignored.");
    return;
  }

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    log("BLE", "Command dropped (busy).");
    return;
  }
  if (!_commands.push(cmd)) {
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Command queue full, '%s' dropped.", WireFormat::remoteCommandToString(cmd));
    log("BLE", logBuf);
  }
  hal.unlockState();
}

void CompanionLink::stageMetrics(const char *payload, size_t len) {
  if (len >= sizeof(_metricsPayload)) {
    log("BLE", "Metrics payload too large.");
    return;
  }

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    log("BLE", "Metrics dropped (busy).");
    return;
  }
  memcpy(_metricsPayload, payload, len);
  _metricsPayload[len] = '\0';
  _metricsPending = true;
  hal.unlockState();
}

// Caller holds the state lock. Commands run in arrival order.
void CompanionLink::applyPendingCommands() {
  RemoteCommand cmd;
  while (_commands.pop(cmd)) {
    applyCommand(cmd);
  }
}

void CompanionLink::applyCommand(RemoteCommand cmd) {
  switch (cmd) {
  case CMD_PAUSE:
    _engine->applyRemotePause();
    break;
  case CMD_RESUME:
    _engine->applyRemoteResume();
    break;
  case CMD_SKIP:
    _engine->applyRemoteSkip();
    break;
  case CMD_END:
    if (!_engine->applyRemoteEnd()) {
      log("BLE", "End rejected.");
    }
    break;
  case CMD_RESYNC:
    _engine->resyncMirror();
    _lastRefresh = millis();
    break;
  default:
    break;
  }
}

void CompanionLink::applyPendingMetrics() {
  if (!_metricsPending)
    return;
  _metricsPending = false;

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, _metricsPayload);
  if (error) {
    log("BLE", "Metrics: Invalid JSON.");
    return;
  }

  ActivityMetrics metrics;
  std::string err;
  if (!WireFormat::parseActivityMetrics(doc, metrics, err)) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Metrics rejected: %s", err.c_str());
    log("BLE", logBuf);
    return;
  }

  Esp32CoachHAL::getInstance().setActivityMetrics(metrics);
}

void CompanionLink::handleWifiPayload(const char *payload, size_t len) {
  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, payload, len);
  if (error) {
    log("BLE", "Wi-Fi: Invalid JSON.");
    return;
  }

  const char *ssid = doc["ssid"];
  const char *pass = doc["pass"];
  std::string err;

  if (!WireFormat::validateWifiCredentials(ssid, pass, err)) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Wi-Fi rejected: %s", err.c_str());
    log("BLE", logBuf);
    return;
  }

  SettingsManager::setWifiSSID(ssid);
  SettingsManager::setWifiPassword(pass);
  log("BLE", "Wi-Fi credentials saved. Reboot to apply.");
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void CompanionLink::printStartupDiagnostics() {
  char logBuf[128];
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();

  hal.log("==========================================================================");
  hal.log("                           COMPANION DIAGNOSTICS                          ");
  hal.log("==========================================================================");
  hal.log("[ BLE LINK ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Service UUID", COACH_SERVICE_UUID);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Connected", _connected ? "YES" : "NO");
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Last Sent Revision", _sent.revision());
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Refresh Interval", g_systemDefaults.mirrorRefreshInterval);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Dropped Events", _droppedEvents);
  hal.log(logBuf);
}
