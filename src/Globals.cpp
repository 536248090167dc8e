/*
 * =================================================================================
 * Project:   Stride Coach - Interval Walking Trainer
 * File:      Globals.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Definitions of shared global configuration.
 * =================================================================================
 */
#include "Globals.h"
#include "Config.h"

// =================================================================================
// SECTION: SYSTEM CONFIGURATION
// =================================================================================

SystemDefaults g_systemDefaults = DEFAULT_SYSTEM_DEFS;

SessionConfiguration g_defaultSession = DEFAULT_SESSION_CONFIG;
