#pragma once
#include <stddef.h>
#include <stdint.h>

#include "device_state.h"
#include "sensor_model.h"
#include "commands.h"

// Owner of the device's single FiltrationProcess. Both the periodic tick path and the command
// path run inside sim_poll() on one task, so every read-modify-write of the process is serialized
// without locks. A mode switch that is still settling leaves the previous run fully intact.

struct SimEngineConfig
{
    FiltrationMode bootMode;
    uint32_t tickIntervalMs;
    uint32_t settleMs;
    uint32_t runDurationMs; // 0 = run until stopped
    uint32_t seed;
    SensorModelConfig model;
};

enum class SimStopReason : uint8_t
{
    NONE = 0,
    REQUESTED,
    DURATION_ELAPSED
};

struct SimEngineHooks
{
    bool (*publishReading)(const SensorReading &r);
    bool (*publishResponse)(const CommandResponse &r);
    bool (*formatTimestamp)(char *out, size_t outSize);

    // Optional observers (null allowed).
    void (*onRunStarted)(const FiltrationProcess &p);
    void (*onRunCompleted)(const FiltrationProcess &p);
    void (*onModeSwitched)(FiltrationMode mode);
    void (*onTickFault)(const FiltrationProcess &p);
    void (*onStopped)(SimStopReason reason);
};

struct SimStats
{
    uint32_t readings;
    uint32_t faults;
    uint32_t responses;
    uint32_t publishFailures;
};

struct SimPollResult
{
    bool ticked;
    bool completed;
    bool faulted;
    bool switched;
};

// Reset all state, then auto-start a run in cfg.bootMode (a real unit begins a cycle on boot).
bool sim_begin(const SimEngineConfig &cfg, const SimEngineHooks &hooks, uint32_t nowMs);

// Contract: called frequently from the main loop; must remain non-blocking.
SimPollResult sim_poll(uint32_t nowMs);

// Start a run directly (scenario replay). targetOverrideLiters: NAN for the mode default.
void sim_startRun(FiltrationMode mode, float targetOverrideLiters, uint32_t nowMs);

// Inbound command paths; both go through the command queue.
CommandHandleResult sim_handleCommand(const uint8_t *payload, size_t len);
CommandHandleResult sim_requestMode(FiltrationMode mode);

// While held, inbound commands are refused with NOT_READY. Taking the hold drops queued
// commands and any switch in flight.
void sim_holdCommands(bool held);
bool sim_commandsHeld();

// Graceful stop: queued commands and switches in flight are abandoned, no further publishes.
void sim_stop(SimStopReason reason);
void sim_resume(uint32_t nowMs);
bool sim_isRunning();
SimStopReason sim_lastStopReason();

FiltrationProcess sim_snapshot();
const SimStats &sim_stats();

void sim_setTickInterval(uint32_t intervalMs);
uint32_t sim_tickInterval();
void sim_setNoiseScale(float scale);
void sim_reseed(uint32_t seed);
