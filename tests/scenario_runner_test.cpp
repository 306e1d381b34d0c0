#include <cmath>
#include <cstdio>
#include <cstring>
#include "scenario_runner.h"
#include "test_expect.h"

static int s_readingCount = 0;
static int s_started = 0;
static int s_finished = 0;
static size_t s_batchCount = 0;

static bool countReading(const SensorReading &)
{
    s_readingCount++;
    return true;
}

static int s_successCount = 0;

static bool acceptResponse(const CommandResponse &resp)
{
    if (resp.status == CmdStatus::SUCCESS)
    {
        s_successCount++;
    }
    return true;
}

static CommandHandleResult sendModeCommand(const char *mode)
{
    char json[96];
    snprintf(json, sizeof(json), "{\"command\":\"set_filter_mode\",\"mode\":\"%s\"}", mode);
    return sim_handleCommand(reinterpret_cast<const uint8_t *>(json), std::strlen(json));
}

static void onStarted(size_t, const ScenarioDef &)
{
    s_started++;
}

static void onFinished(size_t, const ScenarioOutcome &)
{
    s_finished++;
}

static void onBatch(size_t count)
{
    s_batchCount = count;
}

static void beginEngine(uint32_t tickIntervalMs, float noiseScale)
{
    s_readingCount = 0;
    s_started = 0;
    s_finished = 0;
    s_batchCount = 0;
    s_successCount = 0;

    SimEngineConfig cfg{};
    cfg.bootMode = FiltrationMode::DRINKING_WATER;
    cfg.tickIntervalMs = tickIntervalMs;
    cfg.settleMs = 2000;
    cfg.seed = 2024;
    cfg.model = sensor_defaultConfig();
    cfg.model.noiseScale = noiseScale;

    SimEngineHooks hooks{};
    hooks.publishReading = countReading;
    hooks.publishResponse = acceptResponse;
    EXPECT_TRUE(sim_begin(cfg, hooks, 0));
}

static void test_default_list()
{
    EXPECT_EQ_INT(scenario_defaultCount(), 3);
    const ScenarioDef *defs = scenario_defaults();
    EXPECT_STREQ(defs[0].name, "Quick Drinking Water Cycle");
    EXPECT_TRUE(defs[0].mode == FiltrationMode::DRINKING_WATER);
    EXPECT_NEAR(defs[0].targetVolume, 20.0, 1e-6);
    EXPECT_EQ_INT(defs[0].durationMs, 180000);
    EXPECT_TRUE(defs[1].mode == FiltrationMode::HOUSEHOLD_WATER);
    EXPECT_NEAR(defs[1].targetVolume, 40.0, 1e-6);
    EXPECT_EQ_INT(defs[1].durationMs, 300000);
    EXPECT_NEAR(defs[2].targetVolume, 100.0, 1e-6);
    EXPECT_EQ_INT(defs[2].durationMs, 480000);
}

static void test_offline_batch_completes_all()
{
    beginEngine(2000, 1.0f);
    ScenarioOutcome outcomes[SCENARIO_MAX_COUNT];
    const size_t n = scenario_runOffline(scenario_defaults(), scenario_defaultCount(), 0, 250, outcomes, SCENARIO_MAX_COUNT);
    EXPECT_EQ_INT(n, 3);
    EXPECT_FALSE(scenario_isRunning());

    const float targets[] = {20.0f, 40.0f, 100.0f};
    for (size_t i = 0; i < n; ++i)
    {
        EXPECT_TRUE(outcomes[i].reason == ScenarioEndReason::COMPLETED);
        EXPECT_TRUE(outcomes[i].def == &scenario_defaults()[i]);
        EXPECT_NEAR(outcomes[i].targetVolume, targets[i], 1e-6);
        EXPECT_TRUE(outcomes[i].processedVolume == outcomes[i].targetVolume);
        EXPECT_TRUE(outcomes[i].ticks > 0);
    }

    // The live cadence comes back once the replay is over.
    EXPECT_EQ_INT(sim_tickInterval(), 2000);
    EXPECT_TRUE(sim_isRunning());
}

static void test_quick_cycle_tick_count_without_noise()
{
    beginEngine(1000, 0.0f);
    ScenarioOutcome outcome{};
    const size_t n = scenario_runOffline(scenario_defaults(), 1, 0, 1000, &outcome, 1);
    EXPECT_EQ_INT(n, 1);
    EXPECT_TRUE(outcome.reason == ScenarioEndReason::COMPLETED);
    EXPECT_EQ_INT(outcome.ticks, 19);
    EXPECT_NEAR(outcome.processedVolume, 20.0, 1e-6);
}

static void test_budget_elapsed()
{
    static const ScenarioDef kShort[] = {
        {"Short", FiltrationMode::HOUSEHOLD_WATER, 100.0f, 5000u},
    };
    beginEngine(1000, 0.0f);
    ScenarioOutcome outcome{};
    EXPECT_EQ_INT(scenario_runOffline(kShort, 1, 0, 1000, &outcome, 1), 1);
    EXPECT_TRUE(outcome.reason == ScenarioEndReason::BUDGET_ELAPSED);
    EXPECT_EQ_INT(outcome.ticks, 5);
    EXPECT_TRUE(outcome.processedVolume < outcome.targetVolume);
    EXPECT_STREQ(scenarioEndReasonString(outcome.reason), "budget_elapsed");
}

static void test_live_replay_pause_and_hooks()
{
    static const ScenarioDef kTwo[] = {
        {"A", FiltrationMode::DRINKING_WATER, 2.0f, 60000u},
        {"B", FiltrationMode::HOUSEHOLD_WATER, 2.0f, 60000u},
    };
    beginEngine(3000, 0.0f);

    ScenarioHooks hooks{};
    hooks.onScenarioStarted = onStarted;
    hooks.onScenarioFinished = onFinished;
    hooks.onBatchFinished = onBatch;
    EXPECT_TRUE(scenario_begin(kTwo, 2, hooks, 0));
    EXPECT_TRUE(scenario_isRunning());
    EXPECT_EQ_INT(sim_tickInterval(), CFG_SCENARIO_TICK_MS);
    EXPECT_EQ_INT(s_started, 1);

    // A second replay cannot start on top of the first.
    EXPECT_FALSE(scenario_begin(kTwo, 2, hooks, 0));

    // 2 L at ~2.5 L/min per half-minute reading: done on the second tick.
    scenario_poll(0);
    scenario_poll(1000);
    EXPECT_EQ_INT(s_finished, 1);
    EXPECT_EQ_INT(scenario_currentIndex(), 0);

    // Still pausing just before the pause ends.
    scenario_poll(2999);
    EXPECT_EQ_INT(s_started, 1);
    scenario_poll(3000);
    EXPECT_EQ_INT(s_started, 2);
    EXPECT_EQ_INT(scenario_currentIndex(), 1);
    EXPECT_TRUE(sim_snapshot().mode == FiltrationMode::HOUSEHOLD_WATER);

    scenario_poll(3000);
    scenario_poll(4000);
    EXPECT_FALSE(scenario_isRunning());
    EXPECT_EQ_INT(s_finished, 2);
    EXPECT_EQ_INT(s_batchCount, 2);
    EXPECT_EQ_INT(scenario_outcomeCount(), 2);
    EXPECT_TRUE(scenario_outcome(1)->reason == ScenarioEndReason::COMPLETED);
    EXPECT_TRUE(scenario_outcome(2) == nullptr);
    EXPECT_EQ_INT(sim_tickInterval(), 3000);
}

static void test_engine_stop_ends_batch()
{
    beginEngine(1000, 0.0f);
    ScenarioHooks hooks{};
    hooks.onBatchFinished = onBatch;
    EXPECT_TRUE(scenario_begin(scenario_defaults(), scenario_defaultCount(), hooks, 0));
    scenario_poll(0);
    scenario_poll(1000);

    sim_stop(SimStopReason::REQUESTED);
    scenario_poll(2000);
    EXPECT_FALSE(scenario_isRunning());
    EXPECT_EQ_INT(scenario_outcomeCount(), 1);
    EXPECT_TRUE(scenario_outcome(0)->reason == ScenarioEndReason::STOPPED);
    EXPECT_EQ_INT(s_batchCount, 1);

    // A stopped engine refuses a new replay.
    EXPECT_FALSE(scenario_begin(scenario_defaults(), scenario_defaultCount(), hooks, 3000));
}

static void test_runner_stop()
{
    beginEngine(1000, 0.0f);
    ScenarioHooks hooks{};
    EXPECT_TRUE(scenario_begin(scenario_defaults(), scenario_defaultCount(), hooks, 0));
    scenario_poll(0);
    scenario_stop();
    EXPECT_FALSE(scenario_isRunning());
    EXPECT_TRUE(scenario_outcome(0)->reason == ScenarioEndReason::STOPPED);
    // The engine itself keeps running after the replay is cancelled.
    EXPECT_TRUE(sim_isRunning());

    EXPECT_FALSE(scenario_begin(nullptr, 1, hooks, 0));
    EXPECT_FALSE(scenario_begin(scenario_defaults(), 0, hooks, 0));
    EXPECT_FALSE(scenario_begin(scenario_defaults(), SCENARIO_MAX_COUNT + 1, hooks, 0));
}

static void test_replay_drops_settling_switch()
{
    beginEngine(1000, 0.0f);
    EXPECT_EQ_INT((int)sendModeCommand("household_water"), (int)CommandHandleResult::QUEUED);
    sim_poll(100); // "processing" goes out, switch due at 2100
    EXPECT_TRUE(commands_isSwitching());

    ScenarioHooks hooks{};
    EXPECT_TRUE(scenario_begin(scenario_defaults(), 1, hooks, 200));
    EXPECT_FALSE(commands_isSwitching());
    EXPECT_EQ_INT(commands_pendingCount(), 0);
    EXPECT_TRUE(sim_commandsHeld());

    // Live commands are refused for the whole batch.
    EXPECT_EQ_INT((int)sendModeCommand("household_water"), (int)CommandHandleResult::NOT_READY);
    EXPECT_EQ_INT((int)sim_requestMode(FiltrationMode::HOUSEHOLD_WATER), (int)CommandHandleResult::NOT_READY);

    for (uint32_t now = 200; now <= 5000; now += 100)
    {
        const SimPollResult res = scenario_poll(now);
        EXPECT_FALSE(res.switched);
    }
    const FiltrationProcess p = sim_snapshot();
    EXPECT_TRUE(p.mode == FiltrationMode::DRINKING_WATER);
    EXPECT_NEAR(p.targetVolume, 20.0, 1e-9);
    EXPECT_EQ_INT(s_successCount, 0);

    scenario_stop();
    EXPECT_NEAR(scenario_outcome(0)->targetVolume, 20.0, 1e-9);
    EXPECT_FALSE(sim_commandsHeld());

    // Once the batch is over the command path is live again.
    EXPECT_EQ_INT((int)sendModeCommand("household_water"), (int)CommandHandleResult::QUEUED);
    sim_poll(6000);
    sim_poll(8000);
    EXPECT_EQ_INT(s_successCount, 1);
    EXPECT_TRUE(sim_snapshot().mode == FiltrationMode::HOUSEHOLD_WATER);
}

int main()
{
    test_default_list();
    test_offline_batch_completes_all();
    test_quick_cycle_tick_count_without_noise();
    test_budget_elapsed();
    test_live_replay_pause_and_hooks();
    test_engine_stop_ends_batch();
    test_runner_stop();
    test_replay_drops_settling_switch();
    return report("scenario_runner");
}
