#include "commands.h"

#include <ArduinoJson.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

#include "domain_strings.h"
#include "filtration.h"

static_assert(CFG_CMD_QUEUE_DEPTH > 0u, "CFG_CMD_QUEUE_DEPTH must be > 0");

static constexpr size_t kCommandDocCapacity = 384;

static CommandsContext s_ctx{};
static bool s_ready = false;

static FilterCommand s_queue[CFG_CMD_QUEUE_DEPTH];
static size_t s_head = 0;
static size_t s_count = 0;

struct SwitchInFlight
{
    bool active = false;
    FiltrationMode mode = FiltrationMode::DRINKING_WATER;
    uint32_t dueMs = 0;
};
static SwitchInFlight s_inFlight{};

static void copyStr(char *dst, size_t dstSize, const char *src)
{
    strncpy(dst, src ? src : "", dstSize);
    dst[dstSize - 1] = '\0';
}

void commands_begin(const CommandsContext &ctx)
{
    s_ctx = ctx;
    s_head = 0;
    s_count = 0;
    s_inFlight = SwitchInFlight{};
    s_ready = (ctx.process != nullptr);
}

CommandDecodeResult commands_decode(const uint8_t *payload, size_t len, FilterCommand &out)
{
    out = FilterCommand{};
    if (!payload || len == 0)
    {
        return CommandDecodeResult::MALFORMED;
    }

    StaticJsonDocument<kCommandDocCapacity> doc;
    DeserializationError err = deserializeJson(doc, payload, len);
    if (err || !doc.is<JsonObject>())
    {
        return CommandDecodeResult::MALFORMED;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonVariantConst command = root["command"];
    if (!command.is<const char *>())
    {
        return CommandDecodeResult::MALFORMED;
    }

    out.kind = domain_strings::parseCommandKind(command.as<const char *>());
    if (out.kind == CommandKind::UNKNOWN)
    {
        return CommandDecodeResult::UNKNOWN_COMMAND;
    }

    JsonVariantConst mode = root["mode"];
    if (mode.isNull())
    {
        return CommandDecodeResult::MALFORMED;
    }

    if (mode.is<const char *>())
    {
        copyStr(out.rawMode, sizeof(out.rawMode), mode.as<const char *>());
        out.modeValid = domain_strings::parse(mode.as<const char *>(), out.mode);
    }
    else
    {
        // Non-string mode (number, bool, object): keep its JSON text for the error message.
        serializeJson(mode, out.rawMode, sizeof(out.rawMode));
        out.rawMode[sizeof(out.rawMode) - 1] = '\0';
        out.modeValid = false;
    }

    return CommandDecodeResult::OK;
}

CommandHandleResult commands_submit(const FilterCommand &cmd)
{
    if (!s_ready)
    {
        return CommandHandleResult::NOT_READY;
    }
    if (cmd.kind != CommandKind::SET_FILTER_MODE)
    {
        return CommandHandleResult::IGNORED_UNKNOWN;
    }
    if (s_count >= CFG_CMD_QUEUE_DEPTH)
    {
        return CommandHandleResult::QUEUE_FULL;
    }

    const size_t tail = (s_head + s_count) % CFG_CMD_QUEUE_DEPTH;
    s_queue[tail] = cmd;
    s_count++;
    return CommandHandleResult::QUEUED;
}

CommandHandleResult commands_handle(const uint8_t *payload, size_t len)
{
    FilterCommand cmd{};
    switch (commands_decode(payload, len, cmd))
    {
    case CommandDecodeResult::OK:
        return commands_submit(cmd);
    case CommandDecodeResult::UNKNOWN_COMMAND:
        return CommandHandleResult::IGNORED_UNKNOWN;
    case CommandDecodeResult::MALFORMED:
        return CommandHandleResult::IGNORED_MALFORMED;
    }
    return CommandHandleResult::IGNORED_MALFORMED;
}

static bool dequeue(FilterCommand &out)
{
    if (s_count == 0)
    {
        return false;
    }
    out = s_queue[s_head];
    s_head = (s_head + 1) % CFG_CMD_QUEUE_DEPTH;
    s_count--;
    return true;
}

static void emit(CmdStatus status, const char *message, CommandsPollResult &res)
{
    CommandResponse resp{};
    copyStr(resp.command, sizeof(resp.command), toString(CommandKind::SET_FILTER_MODE));
    resp.status = status;
    copyStr(resp.message, sizeof(resp.message), message);
    if (!s_ctx.formatTimestamp || !s_ctx.formatTimestamp(resp.timestamp, sizeof(resp.timestamp)))
    {
        resp.timestamp[0] = '\0';
    }

    const bool ok = s_ctx.publishResponse && s_ctx.publishResponse(resp);
    if (ok)
    {
        res.published++;
    }
    else
    {
        res.publishFailures++;
    }
}

CommandsPollResult commands_poll(uint32_t nowMs)
{
    CommandsPollResult res{};
    if (!s_ready)
    {
        return res;
    }

    char msg[CMD_MESSAGE_MAX];
    for (;;)
    {
        if (s_inFlight.active)
        {
            if ((int32_t)(nowMs - s_inFlight.dueMs) < 0)
            {
                break; // still settling; ticks keep seeing the previous run
            }

            const FiltrationMode mode = s_inFlight.mode;
            filtration_start(*s_ctx.process, mode, nowMs, NAN);
            s_inFlight.active = false;
            res.switched = true;
            if (s_ctx.onModeSwitched)
            {
                s_ctx.onModeSwitched(mode);
            }

            snprintf(msg, sizeof(msg), "Successfully switched to %s mode", toString(mode));
            emit(CmdStatus::SUCCESS, msg, res);
            continue;
        }

        FilterCommand cmd{};
        if (!dequeue(cmd))
        {
            break;
        }

        if (!cmd.modeValid)
        {
            snprintf(msg, sizeof(msg), "Invalid mode: %s", cmd.rawMode);
            emit(CmdStatus::ERROR, msg, res);
            continue;
        }

        snprintf(msg, sizeof(msg), "Switching to %s mode", toString(cmd.mode));
        emit(CmdStatus::PROCESSING, msg, res);
        s_inFlight.active = true;
        s_inFlight.mode = cmd.mode;
        s_inFlight.dueMs = nowMs + s_ctx.settleMs;
    }

    return res;
}

bool commands_isSwitching()
{
    return s_inFlight.active;
}

size_t commands_pendingCount()
{
    return s_count;
}

void commands_cancelPending()
{
    s_head = 0;
    s_count = 0;
    s_inFlight = SwitchInFlight{};
}

const char *commandHandleResultString(CommandHandleResult r)
{
    switch (r)
    {
    case CommandHandleResult::QUEUED:
        return "queued";
    case CommandHandleResult::IGNORED_MALFORMED:
        return "ignored_malformed";
    case CommandHandleResult::IGNORED_UNKNOWN:
        return "ignored_unknown";
    case CommandHandleResult::QUEUE_FULL:
        return "queue_full";
    case CommandHandleResult::NOT_READY:
        return "not_ready";
    }
    return "unknown";
}
