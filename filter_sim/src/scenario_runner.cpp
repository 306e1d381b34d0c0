#include "scenario_runner.h"

static const ScenarioDef kDefaultScenarios[] = {
    {"Quick Drinking Water Cycle", FiltrationMode::DRINKING_WATER, 20.0f, 3u * 60u * 1000u},
    {"Household Water Full Cycle", FiltrationMode::HOUSEHOLD_WATER, 40.0f, 5u * 60u * 1000u},
    {"High Volume Processing", FiltrationMode::DRINKING_WATER, 100.0f, 8u * 60u * 1000u},
};
static constexpr size_t kDefaultScenarioCount = sizeof(kDefaultScenarios) / sizeof(kDefaultScenarios[0]);
static_assert(kDefaultScenarioCount <= SCENARIO_MAX_COUNT, "default scenario list exceeds SCENARIO_MAX_COUNT");

enum class Phase : uint8_t
{
    IDLE = 0,
    RUNNING,
    PAUSE
};

static const ScenarioDef *s_defs = nullptr;
static size_t s_count = 0;
static ScenarioHooks s_hooks{};
static Phase s_phase = Phase::IDLE;
static size_t s_index = 0;
static uint32_t s_phaseStartMs = 0;
static uint32_t s_ticks = 0;
static uint32_t s_liveIntervalMs = 0;

static ScenarioOutcome s_outcomes[SCENARIO_MAX_COUNT];
static size_t s_outcomeCount = 0;

const ScenarioDef *scenario_defaults()
{
    return kDefaultScenarios;
}

size_t scenario_defaultCount()
{
    return kDefaultScenarioCount;
}

static void startScenario(size_t index, uint32_t nowMs)
{
    const ScenarioDef &def = s_defs[index];
    s_index = index;
    s_phase = Phase::RUNNING;
    s_phaseStartMs = nowMs;
    s_ticks = 0;
    sim_startRun(def.mode, def.targetVolume, nowMs);
    if (s_hooks.onScenarioStarted)
    {
        s_hooks.onScenarioStarted(index, def);
    }
}

static void endBatch()
{
    s_phase = Phase::IDLE;
    sim_setTickInterval(s_liveIntervalMs);
    sim_holdCommands(false);
    if (s_hooks.onBatchFinished)
    {
        s_hooks.onBatchFinished(s_outcomeCount);
    }
}

static void finishScenario(ScenarioEndReason reason)
{
    const FiltrationProcess p = sim_snapshot();
    ScenarioOutcome &o = s_outcomes[s_outcomeCount++];
    o.def = &s_defs[s_index];
    o.reason = reason;
    o.ticks = s_ticks;
    o.processedVolume = p.processedVolume;
    o.targetVolume = p.targetVolume;

    if (s_hooks.onScenarioFinished)
    {
        s_hooks.onScenarioFinished(s_index, o);
    }
}

bool scenario_begin(const ScenarioDef *defs, size_t count, const ScenarioHooks &hooks, uint32_t nowMs)
{
    if (!defs || count == 0 || count > SCENARIO_MAX_COUNT || s_phase != Phase::IDLE || !sim_isRunning())
    {
        return false;
    }

    s_defs = defs;
    s_count = count;
    s_hooks = hooks;
    s_outcomeCount = 0;
    s_liveIntervalMs = sim_tickInterval();
    sim_setTickInterval(CFG_SCENARIO_TICK_MS);
    sim_holdCommands(true);
    startScenario(0, nowMs);
    return true;
}

SimPollResult scenario_poll(uint32_t nowMs)
{
    const SimPollResult res = sim_poll(nowMs);
    if (s_phase == Phase::IDLE)
    {
        return res;
    }

    if (!sim_isRunning())
    {
        if (s_phase == Phase::RUNNING)
        {
            finishScenario(ScenarioEndReason::STOPPED);
        }
        endBatch();
        return res;
    }

    if (s_phase == Phase::RUNNING)
    {
        if (res.ticked)
        {
            s_ticks++;
        }

        ScenarioEndReason reason = ScenarioEndReason::NONE;
        if (res.faulted)
        {
            reason = ScenarioEndReason::FAULT;
        }
        else if (res.completed)
        {
            reason = ScenarioEndReason::COMPLETED;
        }
        else if ((uint32_t)(nowMs - s_phaseStartMs) >= s_defs[s_index].durationMs)
        {
            reason = ScenarioEndReason::BUDGET_ELAPSED;
        }

        if (reason != ScenarioEndReason::NONE)
        {
            finishScenario(reason);
            if (s_index + 1 >= s_count)
            {
                endBatch();
            }
            else
            {
                s_phase = Phase::PAUSE;
                s_phaseStartMs = nowMs;
            }
        }
        return res;
    }

    if ((uint32_t)(nowMs - s_phaseStartMs) >= CFG_SCENARIO_PAUSE_MS)
    {
        startScenario(s_index + 1, nowMs);
    }
    return res;
}

void scenario_stop()
{
    if (s_phase == Phase::IDLE)
    {
        return;
    }
    if (s_phase == Phase::RUNNING)
    {
        finishScenario(ScenarioEndReason::STOPPED);
    }
    endBatch();
}

bool scenario_isRunning()
{
    return s_phase != Phase::IDLE;
}

size_t scenario_currentIndex()
{
    return s_index;
}

size_t scenario_outcomeCount()
{
    return s_outcomeCount;
}

const ScenarioOutcome *scenario_outcome(size_t index)
{
    return index < s_outcomeCount ? &s_outcomes[index] : nullptr;
}

size_t scenario_runOffline(const ScenarioDef *defs,
                           size_t count,
                           uint32_t startMs,
                           uint32_t stepMs,
                           ScenarioOutcome *outcomes,
                           size_t maxOutcomes)
{
    ScenarioHooks none{};
    if (!scenario_begin(defs, count, none, startMs))
    {
        return 0;
    }

    const uint32_t step = stepMs == 0 ? 1u : stepMs;
    uint32_t now = startMs;
    while (scenario_isRunning())
    {
        now += step;
        (void)scenario_poll(now);
    }

    size_t copied = 0;
    for (; copied < s_outcomeCount && copied < maxOutcomes && outcomes; ++copied)
    {
        outcomes[copied] = s_outcomes[copied];
    }
    return copied;
}

const char *scenarioEndReasonString(ScenarioEndReason r)
{
    switch (r)
    {
    case ScenarioEndReason::NONE:
        return "none";
    case ScenarioEndReason::COMPLETED:
        return "completed";
    case ScenarioEndReason::BUDGET_ELAPSED:
        return "budget_elapsed";
    case ScenarioEndReason::STOPPED:
        return "stopped";
    case ScenarioEndReason::FAULT:
        return "fault";
    }
    return "unknown";
}
