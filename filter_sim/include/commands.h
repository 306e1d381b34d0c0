#pragma once
#include <stddef.h>
#include <stdint.h>

#include "device_state.h"

#ifndef CFG_CMD_QUEUE_DEPTH
#define CFG_CMD_QUEUE_DEPTH 4u
#endif

#ifndef CFG_MODE_SETTLE_MS
#define CFG_MODE_SETTLE_MS 2000u
#endif

// Callback bundle that lets commands mutate the process and publish without globals.
struct CommandsContext
{
    FiltrationProcess *process; // owned by sim_engine
    uint32_t settleMs;          // simulated switch-over time before the new run starts

    bool (*publishResponse)(const CommandResponse &resp);
    bool (*formatTimestamp)(char *out, size_t outSize); // optional; empty timestamp when null
    void (*onModeSwitched)(FiltrationMode mode);        // optional; after the new run started
};

enum class CommandDecodeResult : uint8_t
{
    OK = 0,
    MALFORMED,      // not JSON, not an object, or a required field is missing
    UNKNOWN_COMMAND // well-formed but not a command this device understands
};

enum class CommandHandleResult : uint8_t
{
    QUEUED = 0,
    IGNORED_MALFORMED,
    IGNORED_UNKNOWN,
    QUEUE_FULL,
    NOT_READY
};

struct CommandsPollResult
{
    uint8_t published;
    uint8_t publishFailures;
    bool switched;
};

// Initialize command handling; clears the queue and any switch in flight.
void commands_begin(const CommandsContext &ctx);

// payload is raw MQTT bytes (not null terminated)
CommandDecodeResult commands_decode(const uint8_t *payload, size_t len, FilterCommand &out);

// Decode and queue. Malformed and unknown commands are dropped without a response.
CommandHandleResult commands_handle(const uint8_t *payload, size_t len);

// Queue an already-decoded command (serial console path).
CommandHandleResult commands_submit(const FilterCommand &cmd);

// Consume queued commands and complete switch-overs whose settle delay has elapsed.
// Responses of one command are always published before the next command's first response.
// Contract: called from the same task as the tick path; never blocks.
CommandsPollResult commands_poll(uint32_t nowMs);

bool commands_isSwitching();
size_t commands_pendingCount();

// Abandon queued commands and any switch in flight; the process is left as it is.
void commands_cancelPending();

const char *commandHandleResultString(CommandHandleResult r);
