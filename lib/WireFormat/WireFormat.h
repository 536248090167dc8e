#pragma once
// Epoch milliseconds do not fit in 32 bits.
#ifndef ARDUINOJSON_USE_LONG_LONG
#define ARDUINOJSON_USE_LONG_LONG 1
#endif
#include <ArduinoJson.h>
#include <string.h>
#include <string>
#include "Types.h"

// Absolute limits for user supplied sessions
#define WIRE_MAX_PHASE_SECONDS MAX_PHASE_SECONDS
#define WIRE_MAX_INTERVALS MAX_TOTAL_INTERVALS

enum RemoteCommand : uint8_t { CMD_NONE, CMD_PAUSE, CMD_RESUME, CMD_SKIP, CMD_END, CMD_RESYNC };

class WireFormat {
public:
    // Validates WiFi credentials (length checks, empty checks)
    // Returns true if valid, false otherwise. Writes explanation to errorMsg.
    static bool validateWifiCredentials(const char* ssid, const char* pass, std::string& errorMsg);

    // Parses a session request: optional "preset" name, then per-field overrides.
    // Missing fields fall back to the preset, or to `defaults` without one.
    // Returns true if the result is a valid configuration. Populates outConfig.
    static bool parseSessionConfiguration(const JsonVariant& json, const SessionConfiguration& defaults,
                                          SessionConfiguration& outConfig, std::string& errorMsg);

    // Parses activity metrics pushed by the companion (steps, distance, heartRate, calories).
    static bool parseActivityMetrics(const JsonVariant& json, ActivityMetrics& outMetrics, std::string& errorMsg);

    // Maps a command token ("pause", "resume", "skip", "end", "resync") to a RemoteCommand.
    // Surrounding whitespace is ignored. Unknown tokens map to CMD_NONE.
    static RemoteCommand parseRemoteCommand(const char* text);
    static const char* remoteCommandToString(RemoteCommand cmd);

    static bool phaseFromString(const char* text, PhaseKind& outPhase);

    // --- Encoders ---
    static void encodeConfiguration(const SessionConfiguration& config, JsonObject out);
    static void encodeSnapshot(const SessionStateSnapshot& snapshot, JsonObject out);
    static void encodeSummary(const SessionSummary& summary, JsonObject out);
    static void encodeSchedule(const PhaseScheduleEntry* entries, size_t count, JsonArray out);

    // Mirror payload decoder (companion side and tests).
    static bool decodeSnapshot(const JsonVariant& json, SessionStateSnapshot& outSnapshot, std::string& errorMsg);
};
