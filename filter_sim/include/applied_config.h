#pragma once

#include <stdint.h>

#include "device_state.h"

// Runtime configuration that survives a reboot. Compile-time CFG_* values are the defaults.
struct AppliedConfig
{
    FiltrationMode bootMode;
    uint32_t tickIntervalMs;
    bool noiseEnabled;
};

// Load config from NVS at boot (falling back to `defaults` per field); marks dirty=false.
void config_begin(const AppliedConfig &defaults);

// Mark configuration dirty after a successful NVS write.
void config_markDirty();

// If dirty, reload from NVS and clear dirty; returns true if reloaded.
bool config_reloadIfDirty();

// Access the cached applied config (authoritative in RAM after last reload).
const AppliedConfig &config_get();
