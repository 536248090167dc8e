/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for Device Configuration and Storage.
 * - Manages all NVS (Preferences) interactions.
 * - Clamps the default session against absolute limits.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <stddef.h>
#include <stdint.h>

class SettingsManager {
public:
  // --- WiFi Management ---
  static void setWifiSSID(const char *ssid);
  static void setWifiPassword(const char *pass);
  static void getWifiSSID(char *buf, size_t maxLen);
  static void getWifiPassword(char *buf, size_t maxLen);

  // --- Default Session ---
  // Loads the stored default session, falling back to `fallback` for missing keys.
  static void loadDefaultSession(SessionConfiguration &config, const SessionConfiguration &fallback);

  // Stores each value after clamping. `config` is updated with what was saved.
  static void saveDefaultSession(SessionConfiguration &config);

  // --- Session History ---
  static void saveLastSummary(const SessionSummary &summary);
  static bool loadLastSummary(SessionSummary &summary);

  // --- Boot & Crash Diagnostics ---
  static int getCrashCount();
  static void incrementCrashCount();
  static void clearCrashCount();

  // --- Factory Reset ---
  static void wipeAll();

private:
  // Internal helper to perform clamping and logging
  static uint32_t validateAndSave(const char *key, uint32_t value, uint32_t min, uint32_t max, const char *label);
  static void log(const char *key, const char *value);
};
