/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      src/Network.cpp
 *
 * Description:
 * Network management module. Handles Wi-Fi connection logic, SNTP time sync
 * and the mDNS advertiser.
 * =================================================================================
 */
#include <ESPmDNS.h>
#include <WiFi.h>
#include <esp_task_wdt.h>
#include <time.h>

#include "Config.h"
#include "Esp32CoachHAL.h"
#include "Globals.h"
#include "Network.h"
#include "SettingsManager.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

NetworkManager &NetworkManager::getInstance() {
  static NetworkManager instance;
  return instance;
}

NetworkManager::NetworkManager() : _wifiCredentialsExist(false), _timeSyncStarted(false), _wifiRetries(0), _wifiReconnectTimer(NULL) {
  memset(_wifiSSID, 0, sizeof(_wifiSSID));
  memset(_wifiPass, 0, sizeof(_wifiPass));
  memset(_hostname, 0, sizeof(_hostname));
}

void NetworkManager::log(const char *key, const char *val) { Esp32CoachHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: WIFI LOGIC
// =================================================================================

void NetworkManager::connectToWiFi() {
  if (!_wifiCredentialsExist)
    return;
  if (WiFi.status() == WL_CONNECTED)
    return;

  log("Network", "Connecting...");
  WiFi.mode(WIFI_STA);
  WiFi.begin(_wifiSSID, _wifiPass);
}

// --- Static Callbacks ---

void NetworkManager::onWiFiEvent(WiFiEvent_t event) { getInstance().handleWiFiEvent(event); }

void NetworkManager::onWifiTimer(TimerHandle_t t) { getInstance().handleWifiTimer(); }

// --- Member Handlers ---

void NetworkManager::handleWifiTimer() { connectToWiFi(); }

void NetworkManager::handleWiFiEvent(WiFiEvent_t event) {
  switch (event) {
  case ARDUINO_EVENT_WIFI_STA_GOT_IP:
    log("Network", "Connected.");
    _wifiRetries = 0;
    if (_wifiReconnectTimer != NULL)
      xTimerStop(_wifiReconnectTimer, 0);
    break;
  case ARDUINO_EVENT_WIFI_STA_DISCONNECTED:
    // The session keeps running offline; only the web API is lost.
    if (_wifiRetries >= (int)g_systemDefaults.wifiMaxRetries) {
      log("Network", "Max retries exceeded. Staying offline.");
      if (_wifiReconnectTimer != NULL)
        xTimerStop(_wifiReconnectTimer, 0);
    } else {
      _wifiRetries++;
      if (_wifiReconnectTimer != NULL)
        xTimerStart(_wifiReconnectTimer, 0);
    }
    break;
  default:
    break;
  }
}

void NetworkManager::startMDNS() {
  log("Network", "Starting mDNS advertiser...");
  uint8_t mac[6];
  esp_efuse_mac_get_default(mac);
  snprintf(_hostname, sizeof(_hostname), "stride-coach-%02X%02X%02X", mac[3], mac[4], mac[5]);

  if (!MDNS.begin(_hostname)) {
    log("Network", "Failed to set up mDNS responder!");
    return;
  }
  MDNS.addService("stride-coach", "tcp", 80);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "mDNS active: %s.local", _hostname);
  log("Network", logBuf);
}

// =================================================================================
// SECTION: TIME SYNC
// =================================================================================

void NetworkManager::startTimeSync() {
  if (_timeSyncStarted)
    return;

  // SNTP keeps adjusting the system clock in the background
  configTzTime(TZ_INFO, NTP_SERVER);
  _timeSyncStarted = true;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "SNTP started (%s).", NTP_SERVER);
  log("Clock", logBuf);

  // Wait briefly for the first sync so sessions start on a real wall clock
  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();
  unsigned long waitStart = millis();
  while (!hal.isClockSynced() && (millis() - waitStart < 10000)) {
    hal.tick();
    esp_task_wdt_reset();
    delay(100);
  }

  log("Clock", hal.isClockSynced() ? "Wall clock synced." : "Sync pending. Continuing.");
}

// =================================================================================
// SECTION: PUBLIC API IMPLEMENTATION
// =================================================================================

void NetworkManager::connect() {
  // Create Timer
  _wifiReconnectTimer = xTimerCreate("wifiTimer", pdMS_TO_TICKS(2000), pdFALSE, (void *)0, NetworkManager::onWifiTimer);

  SettingsManager::getWifiSSID(_wifiSSID, sizeof(_wifiSSID));
  SettingsManager::getWifiPassword(_wifiPass, sizeof(_wifiPass));

  if (strlen(_wifiSSID) == 0) {
    log("Network", "No Wi-Fi credentials. Provision via companion.");
    return;
  }

  log("Network", "Found Wi-Fi credentials.");
  _wifiCredentialsExist = true;
  WiFi.onEvent(NetworkManager::onWiFiEvent);
  connectToWiFi();

  // Blocking wait for initial connection
  unsigned long wifiWaitStart = millis();
  WiFi.setSleep(false);

  while (WiFi.status() != WL_CONNECTED && (millis() - wifiWaitStart < 30000)) {
    Esp32CoachHAL::getInstance().tick();
    esp_task_wdt_reset();
    delay(100);
  }

  if (WiFi.status() == WL_CONNECTED) {
    startMDNS();
    startTimeSync();
    return;
  }

  log("Network", "Startup WiFi Failed. Continuing offline.");
}

void NetworkManager::printStartupDiagnostics() {
  char logBuf[128];
  const char *boolStr[] = {"NO", "YES"};

  Esp32CoachHAL &hal = Esp32CoachHAL::getInstance();

  hal.log("==========================================================================");
  hal.log("                            NETWORK DIAGNOSTICS                           ");
  hal.log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: WI-FI STATE
  // -------------------------------------------------------------------------
  hal.log("[ WI-FI STATUS ]");

  wl_status_t status = WiFi.status();
  const char *statusStr;
  switch (status) {
  case WL_CONNECTED:      statusStr = "CONNECTED"; break;
  case WL_NO_SSID_AVAIL:  statusStr = "SSID NOT FOUND"; break;
  case WL_CONNECT_FAILED: statusStr = "FAILED"; break;
  case WL_IDLE_STATUS:    statusStr = "IDLE"; break;
  case WL_DISCONNECTED:   statusStr = "DISCONNECTED"; break;
  default:                statusStr = "UNKNOWN"; break;
  }

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Connection State", statusStr);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Target SSID", strlen(_wifiSSID) > 0 ? _wifiSSID : "-- NOT SET --");
  hal.log(logBuf);

  if (status == WL_CONNECTED) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld dBm", "Signal Strength", (long)WiFi.RSSI());
    hal.log(logBuf);
  }

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device MAC", WiFi.macAddress().c_str());
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: IP CONFIGURATION
  // -------------------------------------------------------------------------
  if (status == WL_CONNECTED) {
    hal.log("");
    hal.log("[ IP CONFIGURATION ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Local IP", WiFi.localIP().toString().c_str());
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Gateway", WiFi.gatewayIP().toString().c_str());
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s.local", "mDNS Hostname", _hostname);
    hal.log(logBuf);
  }

  // -------------------------------------------------------------------------
  // SECTION: INTERNAL FLAGS
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ LOGIC FLAGS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Credentials Loaded", boolStr[_wifiCredentialsExist]);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d / %u", "Retry Counter", (int)_wifiRetries, g_systemDefaults.wifiMaxRetries);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "SNTP Started", boolStr[_timeSyncStarted]);
  hal.log(logBuf);
}
