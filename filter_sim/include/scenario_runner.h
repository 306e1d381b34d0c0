#pragma once
#include <stddef.h>
#include <stdint.h>

#include "device_state.h"
#include "sim_engine.h"

#ifndef CFG_SCENARIO_TICK_MS
#define CFG_SCENARIO_TICK_MS 1000u
#endif

#ifndef CFG_SCENARIO_PAUSE_MS
#define CFG_SCENARIO_PAUSE_MS 2000u
#endif

#define SCENARIO_MAX_COUNT 8

// One replay step: start a run in `mode` with `targetVolume`, tick until Idle or until
// `durationMs` has elapsed.
struct ScenarioDef
{
    const char *name;
    FiltrationMode mode;
    float targetVolume;
    uint32_t durationMs;
};

enum class ScenarioEndReason : uint8_t
{
    NONE = 0,
    COMPLETED,      // run reached its target
    BUDGET_ELAPSED, // duration budget ran out first
    STOPPED,        // runner or engine stopped
    FAULT           // tick aborted on an invariant fault
};

struct ScenarioOutcome
{
    const ScenarioDef *def;
    ScenarioEndReason reason;
    uint32_t ticks;
    double processedVolume;
    double targetVolume;
};

struct ScenarioHooks
{
    void (*onScenarioStarted)(size_t index, const ScenarioDef &def);
    void (*onScenarioFinished)(size_t index, const ScenarioOutcome &outcome);
    void (*onBatchFinished)(size_t completedCount);
};

// The fixed three-scenario replay list.
const ScenarioDef *scenario_defaults();
size_t scenario_defaultCount();

// Start a replay on the live engine. The engine must be running (sim_begin called).
// The engine tick interval is switched to CFG_SCENARIO_TICK_MS and restored when the batch ends.
// Live commands are held (pending ones dropped) for the whole batch.
bool scenario_begin(const ScenarioDef *defs, size_t count, const ScenarioHooks &hooks, uint32_t nowMs);

// Drives the engine (sim_poll) and sequences the scenarios. Call instead of sim_poll while
// scenario_isRunning().
SimPollResult scenario_poll(uint32_t nowMs);

void scenario_stop();
bool scenario_isRunning();
size_t scenario_currentIndex();
size_t scenario_outcomeCount();
const ScenarioOutcome *scenario_outcome(size_t index);

// Runs the whole batch on a virtual clock advancing stepMs per poll, without waiting.
// Returns the number of outcomes copied to `outcomes`.
size_t scenario_runOffline(const ScenarioDef *defs,
                           size_t count,
                           uint32_t startMs,
                           uint32_t stepMs,
                           ScenarioOutcome *outcomes,
                           size_t maxOutcomes);

const char *scenarioEndReasonString(ScenarioEndReason r);
