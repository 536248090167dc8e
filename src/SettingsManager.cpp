/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration validation and saving.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Esp32CoachHAL.h" // For logging
#include "Globals.h"
#include <Arduino.h>
#include <Preferences.h>

// --- Preferences Namespaces ---
static Preferences wifiPrefs;
static Preferences sessionPrefs;
static Preferences historyPrefs;
static Preferences bootPrefs;

// --- Absolute Limits ---
static const uint32_t ABS_MIN_PHASE = 10;
static const uint32_t ABS_MAX_PHASE = 60 * 60;
static const uint32_t ABS_MIN_INTERVALS = 1;
static const uint32_t ABS_MAX_INTERVALS = 20;

// Bumped whenever SessionSummary changes layout
static const uint8_t SUMMARY_LAYOUT_VERSION = 1;

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { Esp32CoachHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: FACTORY RESET
// =================================================================================

void SettingsManager::wipeAll() {
  log("Settings", "Performing Full Factory Wipe...");

  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.clear();
  wifiPrefs.end();
  sessionPrefs.begin("session", false);
  sessionPrefs.clear();
  sessionPrefs.end();
  historyPrefs.begin("history", false);
  historyPrefs.clear();
  historyPrefs.end();
  bootPrefs.begin("boot", false);
  bootPrefs.clear();
  bootPrefs.end();

  log("Settings", "Factory Wipe Complete.");
}

// =================================================================================
// SECTION: WIFI
// =================================================================================

void SettingsManager::setWifiSSID(const char *ssid) {
  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.putString("ssid", ssid);
  wifiPrefs.end();
  log("Settings", "SSID Updated");
}

void SettingsManager::setWifiPassword(const char *pass) {
  wifiPrefs.begin("wifi-creds", false);
  wifiPrefs.putString("pass", pass ? pass : "");
  wifiPrefs.end();
  log("Settings", "WiFi Password Updated");
}

void SettingsManager::getWifiSSID(char *buf, size_t maxLen) {
  wifiPrefs.begin("wifi-creds", true);
  String s = wifiPrefs.getString("ssid", "");
  wifiPrefs.end();
  if (maxLen > 0) {
    strncpy(buf, s.c_str(), maxLen);
    buf[maxLen - 1] = '\0';
  }
}

void SettingsManager::getWifiPassword(char *buf, size_t maxLen) {
  wifiPrefs.begin("wifi-creds", true);
  String p = wifiPrefs.getString("pass", "");
  wifiPrefs.end();
  if (maxLen > 0) {
    strncpy(buf, p.c_str(), maxLen);
    buf[maxLen - 1] = '\0';
  }
}

// =================================================================================
// SECTION: DEFAULT SESSION
// =================================================================================

void SettingsManager::loadDefaultSession(SessionConfiguration &config, const SessionConfiguration &fallback) {
  sessionPrefs.begin("session", true);

  config.briskDuration = sessionPrefs.getUInt("brisk", fallback.briskDuration);
  config.easyDuration = sessionPrefs.getUInt("easy", fallback.easyDuration);
  config.warmupDuration = sessionPrefs.getUInt("warmup", fallback.warmupDuration);
  config.cooldownDuration = sessionPrefs.getUInt("cooldown", fallback.cooldownDuration);
  config.totalIntervals = (uint8_t)sessionPrefs.getUInt("intervals", fallback.totalIntervals);
  config.enableWarmup = sessionPrefs.getBool("useWarmup", fallback.enableWarmup);
  config.enableCooldown = sessionPrefs.getBool("useCooldown", fallback.enableCooldown);

  sessionPrefs.end();
}

void SettingsManager::saveDefaultSession(SessionConfiguration &config) {
  config.briskDuration = validateAndSave("brisk", config.briskDuration, ABS_MIN_PHASE, ABS_MAX_PHASE, "Brisk Phase");
  config.easyDuration = validateAndSave("easy", config.easyDuration, ABS_MIN_PHASE, ABS_MAX_PHASE, "Easy Phase");
  config.warmupDuration = validateAndSave("warmup", config.warmupDuration, ABS_MIN_PHASE, ABS_MAX_PHASE, "Warm Up");
  config.cooldownDuration = validateAndSave("cooldown", config.cooldownDuration, ABS_MIN_PHASE, ABS_MAX_PHASE, "Cool Down");
  config.totalIntervals =
      (uint8_t)validateAndSave("intervals", config.totalIntervals, ABS_MIN_INTERVALS, ABS_MAX_INTERVALS, "Intervals");

  sessionPrefs.begin("session", false);
  sessionPrefs.putBool("useWarmup", config.enableWarmup);
  sessionPrefs.putBool("useCooldown", config.enableCooldown);
  sessionPrefs.end();

  log("Settings", config.enableWarmup ? "Warm Up: ENABLED" : "Warm Up: DISABLED");
  log("Settings", config.enableCooldown ? "Cool Down: ENABLED" : "Cool Down: DISABLED");
}

// =================================================================================
// SECTION: VALIDATED NUMERICS
// =================================================================================

uint32_t SettingsManager::validateAndSave(const char *key, uint32_t value, uint32_t min, uint32_t max, const char *label) {
  uint32_t finalValue = value;
  const char *note = "";

  if (finalValue < min) {
    finalValue = min;
    note = " (Clamped Min)";
  } else if (finalValue > max) {
    finalValue = max;
    note = " (Clamped Max)";
  }

  sessionPrefs.begin("session", false);
  sessionPrefs.putUInt(key, finalValue);
  sessionPrefs.end();

  char logBuf[128];
  if (value != finalValue) {
    snprintf(logBuf, sizeof(logBuf), "%s: %u%s (Req: %u)", label, finalValue, note, value);
  } else {
    snprintf(logBuf, sizeof(logBuf), "%s: %u", label, finalValue);
  }
  log("Settings", logBuf);

  return finalValue;
}

// =================================================================================
// SECTION: SESSION HISTORY
// =================================================================================

void SettingsManager::saveLastSummary(const SessionSummary &summary) {
  historyPrefs.begin("history", false);
  historyPrefs.putUChar("layout", SUMMARY_LAYOUT_VERSION);
  size_t written = historyPrefs.putBytes("last", &summary, sizeof(SessionSummary));
  historyPrefs.end();

  if (written != sizeof(SessionSummary)) {
    log("Settings", "Failed to store session summary.");
    return;
  }
  log("Settings", "Session summary stored.");
}

bool SettingsManager::loadLastSummary(SessionSummary &summary) {
  historyPrefs.begin("history", true);
  if (!historyPrefs.isKey("last") || historyPrefs.getUChar("layout", 0) != SUMMARY_LAYOUT_VERSION ||
      historyPrefs.getBytesLength("last") != sizeof(SessionSummary)) {
    historyPrefs.end();
    return false;
  }
  historyPrefs.getBytes("last", &summary, sizeof(SessionSummary));
  historyPrefs.end();
  return true;
}

// =================================================================================
// SECTION: BOOT DIAGNOSTICS
// =================================================================================

int SettingsManager::getCrashCount() {
  bootPrefs.begin("boot", true);
  int c = bootPrefs.getInt("crashes", 0);
  bootPrefs.end();
  return c;
}

void SettingsManager::incrementCrashCount() {
  bootPrefs.begin("boot", false);
  int c = bootPrefs.getInt("crashes", 0);
  bootPrefs.putInt("crashes", c + 1);
  bootPrefs.end();
}

void SettingsManager::clearCrashCount() {
  bootPrefs.begin("boot", false);
  bootPrefs.putInt("crashes", 0);
  bootPrefs.end();
}
