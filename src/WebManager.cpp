/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      src/WebManager.cpp
 *
 * Description:
 * Async HTTP Server implementation. Session control, status, summary and
 * device configuration endpoints.
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <WiFi.h>
#include <esp_timer.h> // For uptime
#include <string.h>

#include "CompanionLink.h"
#include "Config.h"
#include "Esp32CoachHAL.h"
#include "Globals.h"
#include "Network.h"
#include "SessionConfig.h"
#include "SettingsManager.h"
#include "TimeUtils.h"
#include "WebManager.h"
#include "WireFormat.h"

// =================================================================================
// SECTION: SINGLETON & INIT
// =================================================================================

WebManager &WebManager::getInstance() {
  static WebManager instance;
  return instance;
}

WebManager::WebManager() : _server(80), _engine(nullptr) {}

void WebManager::begin(PhaseScheduler *engine) {
  _engine = engine;
  registerEndpoints();
  _server.begin();
  log("WebAPI", "HTTP server started.");
}

void WebManager::log(const char *key, const char *value) { Esp32CoachHAL::getInstance().logKeyValue(key, value); }

// =================================================================================
// SECTION: HELPER FUNCTIONS
// =================================================================================

void WebManager::sendJsonError(AsyncWebServerRequest *request, int code, const std::string &message) {
  JsonDocument doc;
  doc["status"] = "error";
  doc["message"] = message;
  String response;
  serializeJson(doc, response);
  request->send(code, "application/json", response);
}

void WebManager::sendJson(AsyncWebServerRequest *request, JsonDocument &doc) {
  String response;
  serializeJson(doc, response);
  request->send(200, "application/json", response);
}

// An empty body parses as an empty object
bool WebManager::parseBody(AsyncWebServerRequest *request, uint8_t *data, size_t len, JsonDocument &doc) {
  if (data == NULL || len == 0) {
    doc.to<JsonObject>();
    return true;
  }
  DeserializationError error = deserializeJson(doc, (const char *)data, len);
  if (error) {
    sendJsonError(request, 400, "Invalid JSON.");
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: ROUTE REGISTRATION
// =================================================================================

void WebManager::registerEndpoints() {
  // 1. System & Health
  _server.on("/", HTTP_GET, [this](AsyncWebServerRequest *r) { handleRoot(r); });
  _server.on("/health", HTTP_GET, [this](AsyncWebServerRequest *r) { handleHealth(r); });
  _server.on("/reboot", HTTP_POST, [this](AsyncWebServerRequest *r) { handleReboot(r); });
  _server.on("/factory-reset", HTTP_POST, [this](AsyncWebServerRequest *r) { handleFactoryReset(r); });

  // 2. Session Commands
  _server.on("/pause", HTTP_POST, [this](AsyncWebServerRequest *r) { handlePause(r); });
  _server.on("/resume", HTTP_POST, [this](AsyncWebServerRequest *r) { handleResume(r); });
  _server.on("/skip", HTTP_POST, [this](AsyncWebServerRequest *r) { handleSkip(r); });
  _server.on("/end", HTTP_POST, [this](AsyncWebServerRequest *r) { handleEnd(r); });
  _server.on("/resync", HTTP_POST, [this](AsyncWebServerRequest *r) { handleResync(r); });

  // 3. Status & Info
  _server.on("/status", HTTP_GET, [this](AsyncWebServerRequest *r) { handleStatus(r); });
  _server.on("/schedule", HTTP_GET, [this](AsyncWebServerRequest *r) { handleSchedule(r); });
  _server.on("/summary", HTTP_GET, [this](AsyncWebServerRequest *r) { handleSummary(r); });
  _server.on("/details", HTTP_GET, [this](AsyncWebServerRequest *r) { handleDetails(r); });
  _server.on("/log", HTTP_GET, [this](AsyncWebServerRequest *r) { handleLog(r); });

  // 4. Body Handlers
  // /start also accepts an empty body (default session)
  _server.on(
      "/start", HTTP_POST,
      [this](AsyncWebServerRequest *r) {
        if (r->contentLength() == 0)
          handleStart(r, NULL, 0, 0, 0);
      },
      NULL, [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) { handleStart(r, data, len, index, total); });

  _server.on(
      "/metrics", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) { handleMetrics(r, data, len, index, total); });

  _server.on(
      "/settings", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) { handleSettings(r, data, len, index, total); });

  _server.on(
      "/update-wifi", HTTP_POST, [](AsyncWebServerRequest *r) {}, NULL,
      [this](AsyncWebServerRequest *r, uint8_t *data, size_t len, size_t index, size_t total) {
        handleUpdateWifi(r, data, len, index, total);
      });
}

// =================================================================================
// SECTION: SYSTEM HANDLERS
// =================================================================================

void WebManager::handleRoot(AsyncWebServerRequest *request) {
  String html = "<html><head><title>" + String(DEVICE_NAME) + "</title></head><body>";
  html += "<h1>" + String(DEVICE_NAME) + " API</h1>";
  html += "<h2>" + String(DEVICE_VERSION) + "</h2>";
  request->send(200, "text/html", html);
}

void WebManager::handleHealth(AsyncWebServerRequest *request) {
  JsonDocument doc;
  doc["status"] = "ok";
  doc["message"] = "Device is reachable.";
  sendJson(request, doc);
}

void WebManager::handleReboot(AsyncWebServerRequest *request) {
  if (Esp32CoachHAL::getInstance().lockState()) {
    if (_engine->isActive()) {
      Esp32CoachHAL::getInstance().unlockState();
      sendJsonError(request, 403, "Reboot denied. Session active.");
      return;
    }

    log("WebAPI", "Reboot requested via API.");
    request->send(200, "application/json", "{\"status\":\"rebooting\"}");

    Esp32CoachHAL::getInstance().unlockState();
    delay(1000);
    ESP.restart();
  } else {
    sendJsonError(request, 503, "System Busy");
  }
}

void WebManager::handleFactoryReset(AsyncWebServerRequest *request) {
  if (Esp32CoachHAL::getInstance().lockState()) {
    if (_engine->isActive()) {
      Esp32CoachHAL::getInstance().unlockState();
      sendJsonError(request, 409, "Cannot reset while active.");
      return;
    }
    log("WebAPI", "Factory Reset initiated.");
    SettingsManager::wipeAll();
    request->send(200, "application/json", "{\"status\":\"resetting\"}");
    Esp32CoachHAL::getInstance().unlockState();
    delay(1000);
    ESP.restart();
  } else {
    sendJsonError(request, 503, "System Busy");
  }
}

// =================================================================================
// SECTION: SESSION CONTROL
// =================================================================================

void WebManager::handleStart(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  if (index + len != total) return;

  JsonDocument doc;
  if (!parseBody(request, data, len, doc)) return;

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  SessionConfiguration intent;
  std::string err;
  if (!WireFormat::parseSessionConfiguration(doc, g_defaultSession, intent, err)) {
    hal.unlockState();
    sendJsonError(request, 400, err);
    return;
  }

  StartResult result = _engine->start(intent);
  if (result == START_OK) {
    hal.clearActivityMetrics();
  }
  SessionStateSnapshot s = _engine->currentState();
  hal.unlockState();

  switch (result) {
  case START_OK: {
    JsonDocument resp;
    resp["status"] = "started";
    WireFormat::encodeSnapshot(s, resp["state"].to<JsonObject>());
    sendJson(request, resp);
    break;
  }
  case START_ERR_ALREADY_ACTIVE:
    sendJsonError(request, 409, "Session already active.");
    break;
  default:
    sendJsonError(request, 400, startResultToString(result));
    break;
  }
}

void WebManager::handlePause(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  // A due boundary may complete the session instead of pausing it
  bool wasPaused = _engine->isPaused();
  _engine->pause("API Request");
  bool applied = !wasPaused && _engine->isPaused();
  SessionStateSnapshot s = _engine->currentState();
  hal.unlockState();

  if (!applied) {
    sendJsonError(request, 409, "Nothing to pause.");
    return;
  }
  JsonDocument doc;
  WireFormat::encodeSnapshot(s, doc.to<JsonObject>());
  sendJson(request, doc);
}

void WebManager::handleResume(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  uint32_t before = _engine->getRevision();
  _engine->resume("API Request");
  bool applied = (_engine->getRevision() != before);
  SessionStateSnapshot s = _engine->currentState();
  hal.unlockState();

  if (!applied) {
    sendJsonError(request, 409, "Session is not paused.");
    return;
  }
  JsonDocument doc;
  WireFormat::encodeSnapshot(s, doc.to<JsonObject>());
  sendJson(request, doc);
}

void WebManager::handleSkip(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  uint32_t before = _engine->getRevision();
  _engine->skipToNextPhase("API Request");
  bool applied = (_engine->getRevision() != before);
  SessionStateSnapshot s = _engine->currentState();
  hal.unlockState();

  if (!applied) {
    sendJsonError(request, 409, "Skip ignored (no running phase).");
    return;
  }
  JsonDocument doc;
  WireFormat::encodeSnapshot(s, doc.to<JsonObject>());
  sendJson(request, doc);
}

void WebManager::handleEnd(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  SessionSummary summary;
  bool ended = _engine->end("API Request", summary);
  hal.unlockState();

  if (!ended) {
    sendJsonError(request, 409, "No active session.");
    return;
  }

  JsonDocument doc;
  doc["status"] = "ended";
  WireFormat::encodeSummary(summary, doc["summary"].to<JsonObject>());
  sendJson(request, doc);
}

void WebManager::handleResync(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  _engine->resyncMirror();
  uint32_t revision = _engine->getRevision();
  hal.unlockState();

  JsonDocument doc;
  doc["status"] = "resynced";
  doc["revision"] = revision;
  sendJson(request, doc);
}

void WebManager::handleMetrics(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  if (index + len != total) return;

  JsonDocument doc;
  if (!parseBody(request, data, len, doc)) return;

  ActivityMetrics metrics;
  std::string err;
  if (!WireFormat::parseActivityMetrics(doc, metrics, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }
  hal.setActivityMetrics(metrics);
  hal.unlockState();

  request->send(200, "application/json", "{\"status\":\"accepted\"}");
}

// =================================================================================
// SECTION: STATUS & INFO
// =================================================================================

void WebManager::handleStatus(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    request->send(503, "text/plain", "Busy");
    return;
  }

  // Snapshot Data
  SessionStateSnapshot s = _engine->currentState();
  SessionConfiguration cfg = _engine->getActiveConfig();

  // Hardware reading
  bool btnPressed = hal.isButtonPressed();
  uint32_t currentPressDurationMs = hal.getCurrentPressDurationMs();
  bool clockSynced = hal.isClockSynced();
  bool companion = CompanionLink::getInstance().isConnected();
  int rssi = WiFi.RSSI();
  uint32_t heap = ESP.getFreeHeap();
  int64_t uptime = esp_timer_get_time() / 1000; // micro to milli

  hal.unlockState();

  char countdown[16];
  TimeUtils::formatCountdown(s.isPaused ? s.remainingAtPauseMs : s.remainingMs, countdown, sizeof(countdown));

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;

  // 1. Engine State
  WireFormat::encodeSnapshot(s, doc["state"].to<JsonObject>());

  // 2. Display
  JsonObject disp = doc["display"].to<JsonObject>();
  disp["phase"] = phaseDisplayName(s.phase);
  disp["cue"] = phaseCueText(s.isPaused ? s.resumePhase : s.phase);
  disp["countdown"] = countdown;

  // 3. Config Echo
  if (s.isActive) {
    WireFormat::encodeConfiguration(cfg, doc["config"].to<JsonObject>());
  }

  // 4. Telemetry
  JsonObject tel = doc["telemetry"].to<JsonObject>();
  tel["buttonPressed"] = btnPressed;
  tel["currentPressDurationMs"] = currentPressDurationMs;
  tel["clockSynced"] = clockSynced;
  tel["companionConnected"] = companion;
  tel["rssi"] = rssi;
  tel["freeHeap"] = heap;
  tel["uptime"] = uptime;

  serializeJson(doc, *response);
  request->send(response);
}

void WebManager::handleSchedule(AsyncWebServerRequest *request) {
  // Shared buffer, only touched under the state lock
  static PhaseScheduleEntry entries[MAX_SCHEDULE_ENTRIES];

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  size_t count = _engine->upcomingPhases(hal.getEpochMillis(), entries, MAX_SCHEDULE_ENTRIES);

  AsyncResponseStream *response = request->beginResponseStream("application/json");
  JsonDocument doc;
  WireFormat::encodeSchedule(entries, count, doc.to<JsonArray>());
  hal.unlockState();

  serializeJson(doc, *response);
  request->send(response);
}

void WebManager::handleSummary(AsyncWebServerRequest *request) {
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  SessionSummary summary;
  bool found = _engine->getLastSummary(summary);
  hal.unlockState();

  // After a reboot only the stored copy exists
  if (!found) {
    found = SettingsManager::loadLastSummary(summary);
  }

  if (!found) {
    sendJsonError(request, 404, "No session recorded.");
    return;
  }

  JsonDocument doc;
  WireFormat::encodeSummary(summary, doc.to<JsonObject>());
  sendJson(request, doc);
}

// =================================================================================
// SECTION: DEVICE DETAILS
// =================================================================================

void WebManager::handleDetails(AsyncWebServerRequest *request) {
  // 1. Prepare Identification
  uint8_t macRaw[6];
  esp_efuse_mac_get_default(macRaw);
  char idBuf[32];
  snprintf(idBuf, sizeof(idBuf), "stride-coach-%02X%02X%02X", macRaw[3], macRaw[4], macRaw[5]);

  JsonDocument doc;

  // -- Root ID
  doc["id"] = idBuf;

  // -- Identity
  JsonObject identity = doc["identity"].to<JsonObject>();
  identity["name"] = DEVICE_NAME;
  identity["version"] = DEVICE_VERSION;
#ifdef DEBUG_MODE
  identity["buildType"] = "debug";
#else
  identity["buildType"] = "release";
#endif
  identity["buildDate"] = __DATE__;
  identity["buildTime"] = __TIME__;
  identity["cppStandard"] = __cplusplus;

  // -- Network
  JsonObject net = doc["network"].to<JsonObject>();
  net["ssid"] = WiFi.SSID();
  net["rssi"] = WiFi.RSSI();
  net["mac"] = WiFi.macAddress();
  net["ip"] = WiFi.localIP().toString();
  net["hostname"] = WiFi.getHostname();
  net["port"] = 80;
  net["credentials"] = NetworkManager::getInstance().hasCredentials();

  // -- Features
  JsonArray features = doc["features"].to<JsonArray>();
  features.add("haptics");
  features.add("statusLed");
  features.add("companionBle");
  features.add("sntp");

  // -- Presets
  JsonArray presets = doc["presets"].to<JsonArray>();
  presets.add("standard");
  presets.add("standard_warmup");
  presets.add("beginner");
  presets.add("advanced");

  // -- Default Session
  if (Esp32CoachHAL::getInstance().lockState()) {
    WireFormat::encodeConfiguration(g_defaultSession, doc["defaultSession"].to<JsonObject>());
    Esp32CoachHAL::getInstance().unlockState();
  } else {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  // -- System Defaults
  JsonObject def = doc["defaults"].to<JsonObject>();
  def["longPressDuration"] = g_systemDefaults.longPressDuration;
  def["tickIntervalMs"] = g_systemDefaults.tickIntervalMs;
  def["wifiMaxRetries"] = g_systemDefaults.wifiMaxRetries;
  def["mirrorRefreshInterval"] = g_systemDefaults.mirrorRefreshInterval;

  sendJson(request, doc);
}

void WebManager::handleLog(AsyncWebServerRequest *request) {
  AsyncResponseStream *response = request->beginResponseStream("text/plain");
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();

  // Oldest line first: the slot after the write index
  int start = hal.getLogBufferIndex();
  for (int n = 0; n < LOG_BUFFER_SIZE; n++) {
    int i = (start + n) % LOG_BUFFER_SIZE;
    if (hal.lockState()) {
      const char *line = hal.getLogLine(i);
      char lineBuf[MAX_LOG_LENGTH];
      strncpy(lineBuf, line, sizeof(lineBuf));
      lineBuf[sizeof(lineBuf) - 1] = '\0';
      hal.unlockState();

      if (strlen(lineBuf) > 0) {
        response->print(lineBuf);
        response->print("\n");
      }
    } else {
      response->print("[Busy]\n");
    }
  }
  request->send(response);
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

void WebManager::handleSettings(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  if (index + len != total) return;

  JsonDocument doc;
  if (!parseBody(request, data, len, doc)) return;

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  if (!hal.lockState()) {
    sendJsonError(request, 503, "System Busy");
    return;
  }

  SessionConfiguration cfg;
  std::string err;
  if (!WireFormat::parseSessionConfiguration(doc, g_defaultSession, cfg, err)) {
    hal.unlockState();
    sendJsonError(request, 400, err);
    return;
  }

  SettingsManager::saveDefaultSession(cfg);
  g_defaultSession = cfg;
  hal.unlockState();

  JsonDocument resp;
  resp["status"] = "saved";
  WireFormat::encodeConfiguration(cfg, resp["defaultSession"].to<JsonObject>());
  sendJson(request, resp);
}

void WebManager::handleUpdateWifi(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
  if (index + len != total) return;

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, (const char *)data, len);

  if (error) {
    sendJsonError(request, 400, "Invalid JSON.");
    return;
  }

  const char *ssid = doc["ssid"];
  const char *pass = doc["pass"];
  std::string err;

  if (!WireFormat::validateWifiCredentials(ssid, pass, err)) {
    sendJsonError(request, 400, err);
    return;
  }

  SettingsManager::setWifiSSID(ssid);
  SettingsManager::setWifiPassword(pass);

  request->send(200, "application/json", "{\"status\":\"saved\", \"message\":\"Reboot to apply.\"}");
}
