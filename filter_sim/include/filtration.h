#pragma once
#include <stdint.h>
#include "device_state.h"

// Filtration run state machine: Idle --start--> Active --tick reaches target--> Idle.

enum class FiltrationTickResult : uint8_t
{
    ADVANCED = 0,   // volume increased, run still active
    COMPLETED,      // volume reached target; process is now idle
    IDLE,           // no active run; nothing changed
    INVARIANT_FAULT // tick aborted, nothing changed
};

// Default target volume for a mode (liters).
float filtration_defaultTarget(FiltrationMode mode);

// Put the process in Idle with the mode's default target and zero progress.
void filtration_init(FiltrationProcess &p, FiltrationMode mode);

// Begin a new run from any state. targetOverrideLiters is applied only when finite and > 0;
// pass NAN to use the mode default.
void filtration_start(FiltrationProcess &p, FiltrationMode mode, uint32_t nowMs, float targetOverrideLiters);

// Advance an active run by flowRate (L/min) over elapsedMinutes, clamped to the target.
FiltrationTickResult filtration_tick(FiltrationProcess &p, float elapsedMinutes, float flowRate);

// processedVolume / targetVolume while active, 0 otherwise.
float filtration_progressRatio(const FiltrationProcess &p);

// Wall-clock minutes since the current run started (0 when idle).
float filtration_elapsedMinutes(const FiltrationProcess &p, uint32_t nowMs);

// True when 0 <= processed <= target and target >= 0.
bool filtration_invariantsHold(const FiltrationProcess &p);
