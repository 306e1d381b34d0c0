#include "filtration.h"

#include <math.h>

float filtration_defaultTarget(FiltrationMode mode)
{
    switch (mode)
    {
    case FiltrationMode::DRINKING_WATER:
        return DRINKING_WATER_TARGET_L;
    case FiltrationMode::HOUSEHOLD_WATER:
        return HOUSEHOLD_WATER_TARGET_L;
    }
    return DRINKING_WATER_TARGET_L;
}

void filtration_init(FiltrationProcess &p, FiltrationMode mode)
{
    p = FiltrationProcess{};
    p.mode = mode;
    p.targetVolume = filtration_defaultTarget(mode);
}

void filtration_start(FiltrationProcess &p, FiltrationMode mode, uint32_t nowMs, float targetOverrideLiters)
{
    const bool useOverride = isfinite(targetOverrideLiters) && targetOverrideLiters > 0.0f;

    // All fields of the new run are written together; callers serialize against ticks.
    p.mode = mode;
    p.targetVolume = useOverride ? targetOverrideLiters : filtration_defaultTarget(mode);
    p.processedVolume = 0.0;
    p.startedAtMs = nowMs;
    p.active = true;
    p.runCount++;
}

bool filtration_invariantsHold(const FiltrationProcess &p)
{
    if (!isfinite(p.targetVolume) || !isfinite(p.processedVolume))
    {
        return false;
    }
    return p.targetVolume >= 0.0 &&
           p.processedVolume >= 0.0 &&
           p.processedVolume <= p.targetVolume;
}

FiltrationTickResult filtration_tick(FiltrationProcess &p, float elapsedMinutes, float flowRate)
{
    if (!p.active)
    {
        return FiltrationTickResult::IDLE;
    }

    // Fail fast: a bad input or an already-broken run must never be normalized away.
    if (!filtration_invariantsHold(p) ||
        !isfinite(elapsedMinutes) || elapsedMinutes < 0.0f ||
        !isfinite(flowRate) || flowRate < 0.0f)
    {
        return FiltrationTickResult::INVARIANT_FAULT;
    }

    const double next = p.processedVolume + (double)flowRate * elapsedMinutes;
    if (next >= p.targetVolume)
    {
        p.processedVolume = p.targetVolume;
        p.active = false;
        return FiltrationTickResult::COMPLETED;
    }

    p.processedVolume = next;
    return FiltrationTickResult::ADVANCED;
}

float filtration_progressRatio(const FiltrationProcess &p)
{
    if (!p.active || p.targetVolume <= 0.0)
    {
        return 0.0f;
    }
    return (float)(p.processedVolume / p.targetVolume);
}

float filtration_elapsedMinutes(const FiltrationProcess &p, uint32_t nowMs)
{
    if (!p.active)
    {
        return 0.0f;
    }
    return (float)(uint32_t)(nowMs - p.startedAtMs) / 60000.0f;
}
