/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      lib/IntervalEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for time string formatting.
 * - formatSeconds():   human-readable durations for logs ("1h 5min 3s").
 * - formatCountdown(): clock-face countdown for displays ("04:59", "1:02:03").
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>

class TimeUtils {
public:
    /**
     * Formats seconds into a human-readable string (e.g., "1h 5min 3s").
     * Units with 0 values are omitted unless the total time is 0s.
     * @param totalSeconds The duration in seconds.
     * @param buffer       The destination buffer.
     * @param size         The size of the buffer.
     */
    static void formatSeconds(unsigned long totalSeconds, char *buffer, size_t size) {
        if (totalSeconds == 0) {
            snprintf(buffer, size, "0s");
            return;
        }

        const unsigned long SECS_MIN  = 60;
        const unsigned long SECS_HOUR = 3600;

        unsigned long h = totalSeconds / SECS_HOUR;
        unsigned long rem = totalSeconds % SECS_HOUR;
        unsigned long m = rem / SECS_MIN;
        unsigned long s = rem % SECS_MIN;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                offset += snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
            }
        };

        append(h, "h");
        append(m, "min");

        if (s > 0 || offset == 0) {
            if (offset < size) {
                offset += snprintf(buffer + offset, size - offset, "%lus", s);
            }
        } else {
            // Trim trailing space
            if (offset > 0 && offset <= size && buffer[offset - 1] == ' ') {
                buffer[offset - 1] = '\0';
            }
        }
    }

    /**
     * Formats milliseconds as a countdown: "MM:SS", or "H:MM:SS" from one hour up.
     * Partial seconds round up so a countdown never shows 00:00 while time remains.
     */
    static void formatCountdown(unsigned long long totalMs, char *buffer, size_t size) {
        unsigned long long totalSeconds = (totalMs + 999ULL) / 1000ULL;
        unsigned long h = (unsigned long)(totalSeconds / 3600ULL);
        unsigned long m = (unsigned long)((totalSeconds % 3600ULL) / 60ULL);
        unsigned long s = (unsigned long)(totalSeconds % 60ULL);

        if (h > 0) {
            snprintf(buffer, size, "%lu:%02lu:%02lu", h, m, s);
        } else {
            snprintf(buffer, size, "%02lu:%02lu", m, s);
        }
    }
};
