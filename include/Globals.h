/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      Globals.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared global configuration: runtime system defaults and the default
 * session used by the button and by requests without a body.
 * =================================================================================
 */
#ifndef GLOBALS_H
#define GLOBALS_H

#include <Arduino.h>

#include "Config.h"

// =================================================================================
// SECTION: SYSTEM CONFIGURATION
// =================================================================================
extern SystemDefaults g_systemDefaults;

// =================================================================================
// SECTION: SESSION DEFAULTS
// =================================================================================
// Loaded from NVS in setup(), updated by POST /settings.
extern SessionConfiguration g_defaultSession;

#endif
