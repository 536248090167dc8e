/*
 * =================================================================================
 * File:      include/Network.h
 * Description: Public interface for Network Management.
 * Wi-Fi station, SNTP wall-clock sync and mDNS.
 * =================================================================================
 */
#pragma once
#include <Arduino.h>
#include <WiFi.h>
#include <freertos/timers.h>

class NetworkManager {
public:
  // Singleton Accessor
  static NetworkManager &getInstance();

  // --- Public API ---

  /**
   * Connects to WiFi using stored credentials and starts SNTP.
   * Blocks briefly on startup. Without credentials (or after the retries
   * run out) the device keeps running offline; credentials can be sent
   * over the companion link.
   */
  void connect();

  bool isConnected() const { return WiFi.status() == WL_CONNECTED; }
  bool hasCredentials() const { return _wifiCredentialsExist; }

  void printStartupDiagnostics();

private:
  NetworkManager(); // Private Constructor

  void log(const char *key, const char *value);

  // --- Internal State ---
  char _wifiSSID[33];
  char _wifiPass[65];
  char _hostname[30];
  bool _wifiCredentialsExist;
  bool _timeSyncStarted;

  volatile int _wifiRetries;
  TimerHandle_t _wifiReconnectTimer;

  // --- Helpers ---
  void connectToWiFi();
  void startMDNS();
  void startTimeSync();

  // --- Static Callbacks (Trampolines) ---
  static void onWiFiEvent(WiFiEvent_t event);
  static void onWifiTimer(TimerHandle_t t);

  // --- Member Event Handlers ---
  void handleWiFiEvent(WiFiEvent_t event);
  void handleWifiTimer();
};
