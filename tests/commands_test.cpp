#include <cmath>
#include <cstring>
#include "commands.h"
#include "domain_strings.h"
#include "filtration.h"
#include "test_expect.h"

static FiltrationProcess s_process{};
static CommandResponse s_responses[16];
static int s_responseCount = 0;
static bool s_publishOk = true;
static int s_switchCount = 0;
static FiltrationMode s_lastSwitch = FiltrationMode::DRINKING_WATER;

static bool recordResponse(const CommandResponse &resp)
{
    if (s_responseCount < 16)
    {
        s_responses[s_responseCount] = resp;
    }
    s_responseCount++;
    return s_publishOk;
}

static bool fixedTimestamp(char *out, size_t outSize)
{
    std::snprintf(out, outSize, "%s", "2024-01-01T00:00:00.000Z");
    return true;
}

static void recordSwitch(FiltrationMode mode)
{
    s_switchCount++;
    s_lastSwitch = mode;
}

static void reset()
{
    s_process = FiltrationProcess{};
    filtration_start(s_process, FiltrationMode::DRINKING_WATER, 0, NAN);
    filtration_tick(s_process, 1.0f, 10.0f);
    s_responseCount = 0;
    s_publishOk = true;
    s_switchCount = 0;

    CommandsContext ctx{};
    ctx.process = &s_process;
    ctx.settleMs = 2000;
    ctx.publishResponse = recordResponse;
    ctx.formatTimestamp = fixedTimestamp;
    ctx.onModeSwitched = recordSwitch;
    commands_begin(ctx);
}

static CommandHandleResult send(const char *json)
{
    return commands_handle(reinterpret_cast<const uint8_t *>(json), std::strlen(json));
}

static void test_decode()
{
    FilterCommand cmd{};
    const char *ok = "{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}";
    EXPECT_EQ_INT((int)commands_decode((const uint8_t *)ok, std::strlen(ok), cmd), (int)CommandDecodeResult::OK);
    EXPECT_TRUE(cmd.kind == CommandKind::SET_FILTER_MODE);
    EXPECT_TRUE(cmd.modeValid);
    EXPECT_TRUE(cmd.mode == FiltrationMode::HOUSEHOLD_WATER);

    const char *bad[] = {
        "",
        "not json",
        "[1,2,3]",
        "{\"mode\":\"household_water\"}",
        "{\"command\":5,\"mode\":\"household_water\"}",
        "{\"command\":\"set_filter_mode\"}",
    };
    for (const char *p : bad)
    {
        EXPECT_EQ_INT((int)commands_decode((const uint8_t *)p, std::strlen(p), cmd), (int)CommandDecodeResult::MALFORMED);
    }
    EXPECT_EQ_INT((int)commands_decode(nullptr, 0, cmd), (int)CommandDecodeResult::MALFORMED);

    const char *unknown = "{\"command\":\"reboot\",\"mode\":\"drinking_water\"}";
    EXPECT_EQ_INT((int)commands_decode((const uint8_t *)unknown, std::strlen(unknown), cmd),
                  (int)CommandDecodeResult::UNKNOWN_COMMAND);

    // Case-sensitive: wire strings only.
    const char *upper = "{\"command\":\"set_filter_mode\",\"mode\":\"DRINKING_WATER\"}";
    EXPECT_EQ_INT((int)commands_decode((const uint8_t *)upper, std::strlen(upper), cmd), (int)CommandDecodeResult::OK);
    EXPECT_FALSE(cmd.modeValid);
    EXPECT_STREQ(cmd.rawMode, "DRINKING_WATER");

    const char *numeric = "{\"command\":\"set_filter_mode\",\"mode\":42}";
    EXPECT_EQ_INT((int)commands_decode((const uint8_t *)numeric, std::strlen(numeric), cmd), (int)CommandDecodeResult::OK);
    EXPECT_FALSE(cmd.modeValid);
    EXPECT_STREQ(cmd.rawMode, "42");
}

static void test_invalid_mode_single_error()
{
    reset();
    const FiltrationProcess before = s_process;

    EXPECT_EQ_INT((int)send("{\"command\":\"set_filter_mode\",\"mode\":\"industrial\"}"), (int)CommandHandleResult::QUEUED);
    const CommandsPollResult res = commands_poll(100);
    EXPECT_EQ_INT(res.published, 1);
    EXPECT_FALSE(res.switched);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_STREQ(s_responses[0].command, "set_filter_mode");
    EXPECT_TRUE(s_responses[0].status == CmdStatus::ERROR);
    EXPECT_STREQ(s_responses[0].message, "Invalid mode: industrial");
    EXPECT_STREQ(s_responses[0].timestamp, "2024-01-01T00:00:00.000Z");

    // Nothing else follows, no matter how long we wait.
    commands_poll(10000);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_FALSE(commands_isSwitching());
    EXPECT_EQ_INT(s_switchCount, 0);

    EXPECT_TRUE(s_process.mode == before.mode);
    EXPECT_TRUE(s_process.active == before.active);
    EXPECT_TRUE(s_process.processedVolume == before.processedVolume);
    EXPECT_TRUE(s_process.targetVolume == before.targetVolume);
    EXPECT_EQ_INT(s_process.runCount, before.runCount);
}

static void test_valid_switch_with_settle()
{
    reset();
    const double processedBefore = s_process.processedVolume;

    EXPECT_EQ_INT((int)send("{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}"), (int)CommandHandleResult::QUEUED);
    commands_poll(1000);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_TRUE(s_responses[0].status == CmdStatus::PROCESSING);
    EXPECT_STREQ(s_responses[0].message, "Switching to household_water mode");
    EXPECT_TRUE(commands_isSwitching());

    // Settling: the previous run is still what the process shows.
    commands_poll(2999);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_TRUE(s_process.mode == FiltrationMode::DRINKING_WATER);
    EXPECT_TRUE(s_process.processedVolume == processedBefore);

    const CommandsPollResult res = commands_poll(3000);
    EXPECT_TRUE(res.switched);
    EXPECT_EQ_INT(s_responseCount, 2);
    EXPECT_TRUE(s_responses[1].status == CmdStatus::SUCCESS);
    EXPECT_STREQ(s_responses[1].message, "Successfully switched to household_water mode");
    EXPECT_FALSE(commands_isSwitching());

    EXPECT_TRUE(s_process.mode == FiltrationMode::HOUSEHOLD_WATER);
    EXPECT_TRUE(s_process.active);
    EXPECT_NEAR(s_process.processedVolume, 0.0, 1e-9);
    EXPECT_NEAR(s_process.targetVolume, 75.0, 1e-6);
    EXPECT_EQ_INT(s_process.startedAtMs, 3000);
    EXPECT_EQ_INT(s_switchCount, 1);
    EXPECT_TRUE(s_lastSwitch == FiltrationMode::HOUSEHOLD_WATER);
}

static void test_same_mode_restarts_run()
{
    reset();
    const uint32_t runsBefore = s_process.runCount;
    send("{\"command\":\"set_filter_mode\",\"mode\":\"drinking_water\"}");
    commands_poll(0);
    commands_poll(2000);
    EXPECT_EQ_INT(s_responseCount, 2);
    EXPECT_TRUE(s_process.mode == FiltrationMode::DRINKING_WATER);
    EXPECT_NEAR(s_process.processedVolume, 0.0, 1e-9);
    EXPECT_EQ_INT(s_process.runCount, runsBefore + 1);
}

static void test_dropped_commands_publish_nothing()
{
    reset();
    EXPECT_EQ_INT((int)send("garbage"), (int)CommandHandleResult::IGNORED_MALFORMED);
    EXPECT_EQ_INT((int)send("{\"command\":\"set_filter_mode\"}"), (int)CommandHandleResult::IGNORED_MALFORMED);
    EXPECT_EQ_INT((int)send("{\"command\":\"flush\",\"mode\":\"household_water\"}"), (int)CommandHandleResult::IGNORED_UNKNOWN);
    commands_poll(5000);
    EXPECT_EQ_INT(s_responseCount, 0);
    EXPECT_EQ_INT(commands_pendingCount(), 0);
}

static void test_responses_stay_grouped_per_command()
{
    reset();
    send("{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}");
    send("{\"command\":\"set_filter_mode\",\"mode\":\"bogus\"}");
    send("{\"command\":\"set_filter_mode\",\"mode\":\"drinking_water\"}");
    EXPECT_EQ_INT(commands_pendingCount(), 3);

    // First command starts settling; the others wait behind it.
    commands_poll(0);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_EQ_INT(commands_pendingCount(), 2);

    // Success of the first, then the error of the second, then processing of the third.
    commands_poll(2000);
    EXPECT_EQ_INT(s_responseCount, 4);
    EXPECT_TRUE(s_responses[1].status == CmdStatus::SUCCESS);
    EXPECT_TRUE(s_responses[2].status == CmdStatus::ERROR);
    EXPECT_STREQ(s_responses[2].message, "Invalid mode: bogus");
    EXPECT_TRUE(s_responses[3].status == CmdStatus::PROCESSING);
    EXPECT_TRUE(s_process.mode == FiltrationMode::HOUSEHOLD_WATER);

    commands_poll(4000);
    EXPECT_EQ_INT(s_responseCount, 5);
    EXPECT_TRUE(s_responses[4].status == CmdStatus::SUCCESS);
    EXPECT_TRUE(s_process.mode == FiltrationMode::DRINKING_WATER);
    EXPECT_EQ_INT(s_switchCount, 2);
}

static void test_queue_full_and_cancel()
{
    reset();
    for (unsigned i = 0; i < CFG_CMD_QUEUE_DEPTH; ++i)
    {
        EXPECT_EQ_INT((int)send("{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}"), (int)CommandHandleResult::QUEUED);
    }
    EXPECT_EQ_INT((int)send("{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}"), (int)CommandHandleResult::QUEUE_FULL);

    commands_poll(0);
    EXPECT_TRUE(commands_isSwitching());
    const FiltrationProcess before = s_process;

    commands_cancelPending();
    EXPECT_FALSE(commands_isSwitching());
    EXPECT_EQ_INT(commands_pendingCount(), 0);
    commands_poll(10000);
    EXPECT_EQ_INT(s_responseCount, 1);
    EXPECT_TRUE(s_process.mode == before.mode);
    EXPECT_TRUE(s_process.processedVolume == before.processedVolume);
}

static void test_publish_failures_counted()
{
    reset();
    s_publishOk = false;
    send("{\"command\":\"set_filter_mode\",\"mode\":\"household_water\"}");
    CommandsPollResult res = commands_poll(0);
    EXPECT_EQ_INT(res.published, 0);
    EXPECT_EQ_INT(res.publishFailures, 1);

    // The switch still completes even if the broker never saw the processing response.
    res = commands_poll(2000);
    EXPECT_TRUE(res.switched);
    EXPECT_EQ_INT(res.publishFailures, 1);
    EXPECT_TRUE(s_process.mode == FiltrationMode::HOUSEHOLD_WATER);
}

static void test_submit_and_not_ready()
{
    reset();
    FilterCommand cmd{};
    cmd.kind = CommandKind::SET_FILTER_MODE;
    cmd.modeValid = true;
    cmd.mode = FiltrationMode::HOUSEHOLD_WATER;
    EXPECT_EQ_INT((int)commands_submit(cmd), (int)CommandHandleResult::QUEUED);

    FilterCommand unknown{};
    EXPECT_EQ_INT((int)commands_submit(unknown), (int)CommandHandleResult::IGNORED_UNKNOWN);

    CommandsContext empty{};
    commands_begin(empty);
    EXPECT_EQ_INT((int)commands_submit(cmd), (int)CommandHandleResult::NOT_READY);
    EXPECT_EQ_INT(commands_pendingCount(), 0);
    EXPECT_STREQ(commandHandleResultString(CommandHandleResult::QUEUE_FULL), "queue_full");
}

int main()
{
    test_decode();
    test_invalid_mode_single_error();
    test_valid_switch_with_settle();
    test_same_mode_restarts_run();
    test_dropped_commands_publish_nothing();
    test_responses_stay_grouped_per_command();
    test_queue_full_and_cancel();
    test_publish_failures_counted();
    test_submit_and_not_ready();
    return report("commands");
}
