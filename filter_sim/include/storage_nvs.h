#pragma once

#include <stdint.h>
#include "device_state.h"

/* ---------------- Boot Lifecycle ---------------- */
bool storage_begin();
void storage_end(); // optional cleanup on shutdown/restart

/* ---------------- Simulation Configuration ---------------- */
bool storage_loadBootMode(FiltrationMode &mode);
bool storage_saveBootMode(FiltrationMode mode);
bool storage_loadTickInterval(uint32_t &intervalMs);
bool storage_saveTickInterval(uint32_t intervalMs);
bool storage_loadNoiseEnabled(bool &enabled);
bool storage_saveNoiseEnabled(bool enabled);

/* ---------------- Boot Counter ---------------- */
bool storage_loadBootCount(uint32_t &count);
bool storage_saveBootCount(uint32_t count);

/* ---------------- Debug ---------------- */
void storage_dump();
