#include "sim_engine.h"

#include <math.h>
#include "filtration.h"

static constexpr uint32_t kMinTickIntervalMs = 100;

static FiltrationProcess s_process{};
static SimEngineConfig s_cfg{};
static SimEngineHooks s_hooks{};
static SimRng s_rng{};
static SimStats s_stats{};

static bool s_ready = false;
static bool s_running = false;
static bool s_commandsHeld = false;
static SimStopReason s_stopReason = SimStopReason::NONE;
static uint32_t s_runStartMs = 0;
static uint32_t s_nextTickMs = 0;

static uint32_t clampInterval(uint32_t intervalMs)
{
    return intervalMs < kMinTickIntervalMs ? kMinTickIntervalMs : intervalMs;
}

static float clampNoise(float scale)
{
    if (!isfinite(scale) || scale < 0.0f)
    {
        return 0.0f;
    }
    return scale > 1.0f ? 1.0f : scale;
}

// Invoked by commands_poll() right after the new run has started.
static void handleModeSwitched(FiltrationMode mode)
{
    if (s_hooks.onRunStarted)
    {
        s_hooks.onRunStarted(s_process);
    }
    if (s_hooks.onModeSwitched)
    {
        s_hooks.onModeSwitched(mode);
    }
}

static bool publishResponseCounted(const CommandResponse &resp)
{
    s_stats.responses++;
    return s_hooks.publishResponse && s_hooks.publishResponse(resp);
}

bool sim_begin(const SimEngineConfig &cfg, const SimEngineHooks &hooks, uint32_t nowMs)
{
    s_cfg = cfg;
    s_cfg.tickIntervalMs = clampInterval(cfg.tickIntervalMs);
    s_cfg.model.noiseScale = clampNoise(cfg.model.noiseScale);
    s_hooks = hooks;
    s_stats = SimStats{};
    rng_seed(s_rng, cfg.seed);

    CommandsContext cmdCtx{};
    cmdCtx.process = &s_process;
    cmdCtx.settleMs = cfg.settleMs;
    cmdCtx.publishResponse = publishResponseCounted;
    cmdCtx.formatTimestamp = hooks.formatTimestamp;
    cmdCtx.onModeSwitched = handleModeSwitched;
    commands_begin(cmdCtx);

    filtration_init(s_process, cfg.bootMode);
    filtration_start(s_process, cfg.bootMode, nowMs, NAN);
    if (s_hooks.onRunStarted)
    {
        s_hooks.onRunStarted(s_process);
    }

    s_running = true;
    s_commandsHeld = false;
    s_stopReason = SimStopReason::NONE;
    s_runStartMs = nowMs;
    s_nextTickMs = nowMs; // first reading goes out immediately
    s_ready = true;
    return true;
}

static bool tickDue(uint32_t nowMs)
{
    return (int32_t)(nowMs - s_nextTickMs) >= 0;
}

static void scheduleNextTick(uint32_t nowMs)
{
    s_nextTickMs += s_cfg.tickIntervalMs;
    // Fell behind by more than one interval: skip the missed ticks instead of bursting.
    if ((int32_t)(nowMs - s_nextTickMs) >= 0)
    {
        s_nextTickMs = nowMs + s_cfg.tickIntervalMs;
    }
}

static void runTick(uint32_t nowMs, SimPollResult &res)
{
    SensorReading reading{};
    const SensorGenerateResult gr = sensor_generate(s_process, s_cfg.model, s_rng, nowMs, reading);
    if (gr == SensorGenerateResult::FAULT || !filtration_invariantsHold(s_process))
    {
        s_stats.faults++;
        res.faulted = true;
        if (s_hooks.onTickFault)
        {
            s_hooks.onTickFault(s_process);
        }
        return;
    }

    res.ticked = true;
    s_stats.readings++;
    if (!s_hooks.publishReading || !s_hooks.publishReading(reading))
    {
        s_stats.publishFailures++;
    }

    if (gr == SensorGenerateResult::COMPLETED)
    {
        res.completed = true;
        if (s_hooks.onRunCompleted)
        {
            s_hooks.onRunCompleted(s_process);
        }
    }
}

SimPollResult sim_poll(uint32_t nowMs)
{
    SimPollResult res{};
    if (!s_ready || !s_running)
    {
        return res;
    }

    if (s_cfg.runDurationMs > 0 && (uint32_t)(nowMs - s_runStartMs) >= s_cfg.runDurationMs)
    {
        sim_stop(SimStopReason::DURATION_ELAPSED);
        return res;
    }

    // Commands first: a switch whose settle delay has elapsed lands before this tick reads state.
    const CommandsPollResult cr = commands_poll(nowMs);
    s_stats.publishFailures += cr.publishFailures;
    res.switched = cr.switched;

    if (tickDue(nowMs))
    {
        scheduleNextTick(nowMs);
        runTick(nowMs, res);
    }

    return res;
}

void sim_startRun(FiltrationMode mode, float targetOverrideLiters, uint32_t nowMs)
{
    if (!s_ready)
    {
        return;
    }
    filtration_start(s_process, mode, nowMs, targetOverrideLiters);
    s_nextTickMs = nowMs;
    if (s_hooks.onRunStarted)
    {
        s_hooks.onRunStarted(s_process);
    }
}

CommandHandleResult sim_handleCommand(const uint8_t *payload, size_t len)
{
    if (!s_ready || !s_running || s_commandsHeld)
    {
        return CommandHandleResult::NOT_READY;
    }
    return commands_handle(payload, len);
}

CommandHandleResult sim_requestMode(FiltrationMode mode)
{
    if (!s_ready || !s_running || s_commandsHeld)
    {
        return CommandHandleResult::NOT_READY;
    }

    FilterCommand cmd{};
    cmd.kind = CommandKind::SET_FILTER_MODE;
    cmd.mode = mode;
    cmd.modeValid = true;
    return commands_submit(cmd);
}

void sim_stop(SimStopReason reason)
{
    if (!s_running)
    {
        return;
    }
    s_running = false;
    s_stopReason = reason;
    commands_cancelPending();
    if (s_hooks.onStopped)
    {
        s_hooks.onStopped(reason);
    }
}

void sim_holdCommands(bool held)
{
    if (held && !s_commandsHeld)
    {
        // Nothing queued before the hold may land after it.
        commands_cancelPending();
    }
    s_commandsHeld = held;
}

bool sim_commandsHeld()
{
    return s_commandsHeld;
}

void sim_resume(uint32_t nowMs)
{
    if (!s_ready || s_running)
    {
        return;
    }
    s_running = true;
    s_stopReason = SimStopReason::NONE;
    s_runStartMs = nowMs;
    s_nextTickMs = nowMs;
}

bool sim_isRunning()
{
    return s_running;
}

SimStopReason sim_lastStopReason()
{
    return s_stopReason;
}

FiltrationProcess sim_snapshot()
{
    return s_process;
}

const SimStats &sim_stats()
{
    return s_stats;
}

void sim_setTickInterval(uint32_t intervalMs)
{
    const uint32_t clamped = clampInterval(intervalMs);
    // Re-anchor the pending tick on the new interval.
    s_nextTickMs = s_nextTickMs - s_cfg.tickIntervalMs + clamped;
    s_cfg.tickIntervalMs = clamped;
}

uint32_t sim_tickInterval()
{
    return s_cfg.tickIntervalMs;
}

void sim_setNoiseScale(float scale)
{
    s_cfg.model.noiseScale = clampNoise(scale);
}

void sim_reseed(uint32_t seed)
{
    rng_seed(s_rng, seed);
}
