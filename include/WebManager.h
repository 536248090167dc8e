/*
 * =================================================================================
 * File:      include/WebManager.h
 * Description:
 * Async HTTP Server Controller.
 * - Singleton Architecture.
 * - Handles all REST endpoints for Session and Device control.
 * - Uses Dependency Injection for Engine.
 * =================================================================================
 */
#pragma once
#include "PhaseScheduler.h"
#include <ArduinoJson.h>
#include <ESPAsyncWebServer.h>
#include <string>

class WebManager {
public:
  static WebManager &getInstance();

  // Initialization (Call in setup)
  void begin(PhaseScheduler *engine);

private:
  WebManager();

  // --- Dependencies ---
  AsyncWebServer _server;
  PhaseScheduler *_engine;

  // --- Helper Functions ---
  void sendJsonError(AsyncWebServerRequest *request, int code, const std::string &message);
  void sendJson(AsyncWebServerRequest *request, JsonDocument &doc);
  bool parseBody(AsyncWebServerRequest *request, uint8_t *data, size_t len, JsonDocument &doc);
  void registerEndpoints();
  void log(const char *key, const char *value);

  // --- Route Handlers ---

  // System & Health
  void handleRoot(AsyncWebServerRequest *request);
  void handleHealth(AsyncWebServerRequest *request);
  void handleReboot(AsyncWebServerRequest *request);
  void handleFactoryReset(AsyncWebServerRequest *request);

  // Session Control
  void handleStart(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
  void handlePause(AsyncWebServerRequest *request);
  void handleResume(AsyncWebServerRequest *request);
  void handleSkip(AsyncWebServerRequest *request);
  void handleEnd(AsyncWebServerRequest *request);
  void handleResync(AsyncWebServerRequest *request);
  void handleMetrics(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);

  // Information
  void handleStatus(AsyncWebServerRequest *request);
  void handleSchedule(AsyncWebServerRequest *request);
  void handleSummary(AsyncWebServerRequest *request);
  void handleDetails(AsyncWebServerRequest *request);
  void handleLog(AsyncWebServerRequest *request);

  // Configuration
  void handleSettings(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
  void handleUpdateWifi(AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total);
};
