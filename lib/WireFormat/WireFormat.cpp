#include "WireFormat.h"
#include "SessionConfig.h"
#include "SummaryBuilder.h"

// --- Local Helpers ---

// Reads an optional duration in seconds. Absent keys leave `target` untouched.
static bool readSeconds(const JsonVariant& json, const char* key, uint32_t& target, std::string& errorMsg) {
    JsonVariantConst v = json[key];
    if (v.isNull()) return true;

    if (!v.is<long>()) {
        errorMsg = std::string(key) + " must be an integer number of seconds.";
        return false;
    }

    long val = v.as<long>();
    if (val < 0) {
        errorMsg = std::string(key) + " cannot be negative.";
        return false;
    }
    if (val > WIRE_MAX_PHASE_SECONDS) {
        errorMsg = std::string(key) + " too long (max 14400 s).";
        return false;
    }

    target = (uint32_t)val;
    return true;
}

static bool readNonNegative(const JsonVariant& json, const char* key, double& target, std::string& errorMsg) {
    JsonVariantConst v = json[key];
    if (v.isNull()) return true;

    if (!v.is<double>()) {
        errorMsg = std::string(key) + " must be a number.";
        return false;
    }
    double val = v.as<double>();
    if (val < 0) {
        errorMsg = std::string(key) + " cannot be negative.";
        return false;
    }
    target = val;
    return true;
}

// =================================================================================
// SECTION: VALIDATORS
// =================================================================================

bool WireFormat::validateWifiCredentials(const char* ssid, const char* pass, std::string& errorMsg) {
    if (!ssid || strlen(ssid) == 0) {
        errorMsg = "SSID cannot be empty.";
        return false;
    }
    if (strlen(ssid) > 32) {
        errorMsg = "SSID too long (max 32 chars).";
        return false;
    }
    // Password can be empty for Open networks, but max length applies
    if (pass && strlen(pass) > 64) {
        errorMsg = "Password too long (max 64 chars).";
        return false;
    }
    return true;
}

bool WireFormat::parseSessionConfiguration(const JsonVariant& json, const SessionConfiguration& defaults,
                                           SessionConfiguration& outConfig, std::string& errorMsg) {
    SessionConfiguration cfg = defaults;

    // 1. Preset (optional base)
    JsonVariantConst preset = json["preset"];
    if (!preset.isNull()) {
        if (!preset.is<const char*>()) {
            errorMsg = "preset must be a string.";
            return false;
        }
        const char* name = preset.as<const char*>();
        if (!SessionConfig::presetByName(name, cfg)) {
            errorMsg = "Unknown preset: " + std::string(name);
            return false;
        }
    }

    // 2. Durations
    if (!readSeconds(json, "briskDuration", cfg.briskDuration, errorMsg)) return false;
    if (!readSeconds(json, "easyDuration", cfg.easyDuration, errorMsg)) return false;
    if (!readSeconds(json, "warmupDuration", cfg.warmupDuration, errorMsg)) return false;
    if (!readSeconds(json, "cooldownDuration", cfg.cooldownDuration, errorMsg)) return false;

    // 3. Interval count
    JsonVariantConst intervals = json["totalIntervals"];
    if (!intervals.isNull()) {
        if (!intervals.is<long>()) {
            errorMsg = "totalIntervals must be an integer.";
            return false;
        }
        long n = intervals.as<long>();
        if (n < 1 || n > WIRE_MAX_INTERVALS) {
            errorMsg = "totalIntervals out of range (1-99).";
            return false;
        }
        cfg.totalIntervals = (uint8_t)n;
    }

    // 4. Booleans
    cfg.enableWarmup = json["enableWarmup"] | cfg.enableWarmup;
    cfg.enableCooldown = json["enableCooldown"] | cfg.enableCooldown;

    // 5. Engine invariants (positive enabled durations)
    ConfigError err = SessionConfig::validate(cfg);
    if (err != CONFIG_OK) {
        errorMsg = std::string("Invalid session: ") + configErrorToString(err) + ".";
        return false;
    }

    outConfig = cfg;
    return true;
}

bool WireFormat::parseActivityMetrics(const JsonVariant& json, ActivityMetrics& outMetrics, std::string& errorMsg) {
    ActivityMetrics m;
    memset(&m, 0, sizeof(m));

    JsonVariantConst steps = json["steps"];
    if (!steps.isNull()) {
        if (!steps.is<long>() || steps.as<long>() < 0) {
            errorMsg = "steps must be a non-negative integer.";
            return false;
        }
        m.steps = (uint32_t)steps.as<long>();
    }

    if (!readNonNegative(json, "distance", m.distanceMeters, errorMsg)) return false;
    if (!readNonNegative(json, "activeCalories", m.activeCalories, errorMsg)) return false;

    // Heart rate is optional; 0 or absent means "no reading"
    double hr = 0.0;
    if (!readNonNegative(json, "averageHeartRate", hr, errorMsg)) return false;
    m.hasHeartRate = (hr > 0.0);
    m.averageHeartRate = hr;

    outMetrics = m;
    return true;
}

// =================================================================================
// SECTION: TOKENS
// =================================================================================

RemoteCommand WireFormat::parseRemoteCommand(const char* text) {
    if (!text) return CMD_NONE;

    // Trim (BLE terminals often append CR/LF)
    char token[16];
    size_t len = 0;
    while (*text == ' ' || *text == '\t' || *text == '\r' || *text == '\n') text++;
    while (text[len] && len < sizeof(token) - 1) {
        token[len] = text[len];
        len++;
    }
    token[len] = '\0';
    while (len > 0 && (token[len - 1] == ' ' || token[len - 1] == '\t' ||
                       token[len - 1] == '\r' || token[len - 1] == '\n')) {
        token[--len] = '\0';
    }

    if (strcmp(token, "pause") == 0) return CMD_PAUSE;
    if (strcmp(token, "resume") == 0) return CMD_RESUME;
    if (strcmp(token, "skip") == 0) return CMD_SKIP;
    if (strcmp(token, "end") == 0) return CMD_END;
    if (strcmp(token, "resync") == 0) return CMD_RESYNC;
    return CMD_NONE;
}

const char* WireFormat::remoteCommandToString(RemoteCommand cmd) {
    switch (cmd) {
    case CMD_PAUSE:  return "pause";
    case CMD_RESUME: return "resume";
    case CMD_SKIP:   return "skip";
    case CMD_END:    return "end";
    case CMD_RESYNC: return "resync";
    default:         return "none";
    }
}

bool WireFormat::phaseFromString(const char* text, PhaseKind& outPhase) {
    if (!text) return false;

    const PhaseKind all[] = { PHASE_IDLE, PHASE_WARMUP, PHASE_BRISK, PHASE_EASY,
                              PHASE_COOLDOWN, PHASE_PAUSED, PHASE_COMPLETED };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); i++) {
        if (strcmp(text, phaseToString(all[i])) == 0) {
            outPhase = all[i];
            return true;
        }
    }
    return false;
}

// =================================================================================
// SECTION: ENCODERS
// =================================================================================

void WireFormat::encodeConfiguration(const SessionConfiguration& config, JsonObject out) {
    out["briskDuration"] = config.briskDuration;
    out["easyDuration"] = config.easyDuration;
    out["warmupDuration"] = config.warmupDuration;
    out["cooldownDuration"] = config.cooldownDuration;
    out["totalIntervals"] = config.totalIntervals;
    out["enableWarmup"] = config.enableWarmup;
    out["enableCooldown"] = config.enableCooldown;
    out["totalDuration"] = SessionConfig::totalDurationSeconds(config);
}

void WireFormat::encodeSnapshot(const SessionStateSnapshot& s, JsonObject out) {
    out["handle"] = s.handle;
    out["revision"] = s.revision;
    out["phase"] = phaseToString(s.phase);
    out["resumePhase"] = phaseToString(s.resumePhase);
    out["interval"] = s.currentIntervalIndex;
    out["totalIntervals"] = s.totalIntervals;
    out["briskDone"] = s.completedBriskIntervals;
    out["easyDone"] = s.completedSlowIntervals;
    out["phaseEndTime"] = s.phaseEndTime;
    out["remainingMs"] = s.remainingMs;
    out["remainingAtPauseMs"] = s.remainingAtPauseMs;
    out["elapsedMs"] = s.elapsedMs;
    out["plannedMs"] = s.plannedDurationMs;
    out["capturedAt"] = s.capturedAt;
    out["isActive"] = s.isActive;
    out["isPaused"] = s.isPaused;
}

void WireFormat::encodeSummary(const SessionSummary& s, JsonObject out) {
    char durStr[16];
    SummaryBuilder::formatDuration(s, durStr, sizeof(durStr));

    out["handle"] = s.handle;
    out["startTime"] = s.startTime;
    out["endTime"] = s.endTime;
    out["totalDurationMs"] = s.totalDurationMs;
    out["formattedDuration"] = durStr;
    out["briskIntervals"] = s.briskIntervals;
    out["slowIntervals"] = s.slowIntervals;
    out["completedSuccessfully"] = s.completedSuccessfully;
    out["steps"] = s.steps;
    out["distance"] = s.distanceMeters;
    if (s.hasHeartRate) {
        out["averageHeartRate"] = s.averageHeartRate;
    } else {
        out["averageHeartRate"] = nullptr;
    }
    out["activeCalories"] = s.activeCalories;
    out["totalIntervalMinutes"] = s.totalIntervalMinutes;

    encodeConfiguration(s.config, out["config"].to<JsonObject>());
}

void WireFormat::encodeSchedule(const PhaseScheduleEntry* entries, size_t count, JsonArray out) {
    for (size_t i = 0; i < count; i++) {
        JsonObject e = out.add<JsonObject>();
        e["phase"] = phaseToString(entries[i].phase);
        e["interval"] = entries[i].intervalIndex;
        e["endTime"] = entries[i].endTime;
    }
}

// =================================================================================
// SECTION: DECODERS
// =================================================================================

bool WireFormat::decodeSnapshot(const JsonVariant& json, SessionStateSnapshot& outSnapshot, std::string& errorMsg) {
    if (!json["revision"].is<long>()) {
        errorMsg = "Snapshot missing revision.";
        return false;
    }

    SessionStateSnapshot s;
    memset(&s, 0, sizeof(s));

    const char* phaseStr = json["phase"] | "";
    if (!phaseFromString(phaseStr, s.phase)) {
        errorMsg = "Unknown phase: " + std::string(phaseStr);
        return false;
    }
    const char* resumeStr = json["resumePhase"] | phaseStr;
    if (!phaseFromString(resumeStr, s.resumePhase)) s.resumePhase = s.phase;

    s.handle = json["handle"].as<uint32_t>();
    s.revision = json["revision"].as<uint32_t>();
    s.currentIntervalIndex = json["interval"].as<uint8_t>();
    s.totalIntervals = json["totalIntervals"].as<uint8_t>();
    s.completedBriskIntervals = json["briskDone"].as<uint8_t>();
    s.completedSlowIntervals = json["easyDone"].as<uint8_t>();
    s.phaseEndTime = json["phaseEndTime"].as<uint64_t>();
    s.remainingMs = json["remainingMs"].as<uint32_t>();
    s.remainingAtPauseMs = json["remainingAtPauseMs"].as<uint32_t>();
    s.elapsedMs = json["elapsedMs"].as<uint64_t>();
    s.plannedDurationMs = json["plannedMs"].as<uint64_t>();
    s.capturedAt = json["capturedAt"].as<uint64_t>();
    s.isActive = json["isActive"] | false;
    s.isPaused = json["isPaused"] | false;

    outSnapshot = s;
    return true;
}
