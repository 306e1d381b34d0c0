#include <Arduino.h>
#include <math.h>
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include <esp_system.h>
#include "main.h"
#include "wifi_provisioning.h"
#include "device_state.h"
#include "domain_strings.h"
#include "mqtt_transport.h"
#include "storage_nvs.h"
#include "applied_config.h"
#include "sim_engine.h"
#include "scenario_runner.h"
#include "filtration.h"
#include "logger.h"
#include "version.h"

// Optional config overrides (see config.h)
#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#if __has_include("secrets.h")
#include "secrets.h"
#endif
#endif

#ifndef CFG_TOPIC_NAMESPACE
#define CFG_TOPIC_NAMESPACE "aquasmart"
#endif
#ifndef CFG_DEVICE_ID
#define CFG_DEVICE_ID "filter_sim_esp32"
#endif
#ifndef CFG_MQTT_HOST
#define CFG_MQTT_HOST "localhost"
#endif
#ifndef CFG_MQTT_PORT
#define CFG_MQTT_PORT 1883
#endif
#ifndef CFG_TICK_INTERVAL_MS
#define CFG_TICK_INTERVAL_MS 2000u
#endif
#ifndef CFG_READING_MINUTES
#define CFG_READING_MINUTES 0.5f
#endif
#ifndef CFG_RUN_DURATION_MIN
#define CFG_RUN_DURATION_MIN 0u
#endif
#ifndef CFG_BOOT_MODE_HOUSEHOLD
#define CFG_BOOT_MODE_HOUSEHOLD 0
#endif
#ifndef CFG_BASE_FLOW
#define CFG_BASE_FLOW 2.5f
#endif
#ifndef CFG_BASE_TURBIDITY
#define CFG_BASE_TURBIDITY 1.2f
#endif
#ifndef CFG_BASE_TDS
#define CFG_BASE_TDS 280.0f
#endif
#ifndef CFG_NOISE_SCALE
#define CFG_NOISE_SCALE 1.0f
#endif
#ifndef CFG_SIM_SEED
#define CFG_SIM_SEED 0u
#endif
#ifndef CFG_SCENARIO_AUTOSTART
#define CFG_SCENARIO_AUTOSTART 0
#endif
#ifndef CFG_SERIAL_CMD_BUF
#define CFG_SERIAL_CMD_BUF 128u
#endif
#ifndef CFG_WIFI_TIMEOUT_MS
#define CFG_WIFI_TIMEOUT_MS 20000u
#endif
#ifndef CFG_LOG_HIGH_FREQ_DEFAULT
#define CFG_LOG_HIGH_FREQ_DEFAULT 0
#endif

#ifndef MQTT_USER
#define MQTT_USER ""
#endif
#ifndef MQTT_PASS
#define MQTT_PASS ""
#endif

static_assert(CFG_TICK_INTERVAL_MS > 0u, "CFG_TICK_INTERVAL_MS must be > 0");
static_assert(CFG_READING_MINUTES > 0.0f, "CFG_READING_MINUTES must be > 0");
static_assert(CFG_NOISE_SCALE >= 0.0f && CFG_NOISE_SCALE <= 1.0f, "CFG_NOISE_SCALE must be 0..1");
static_assert(CFG_SERIAL_CMD_BUF >= 16u, "CFG_SERIAL_CMD_BUF too small");
static_assert(sizeof(CFG_DEVICE_ID) <= DEVICE_ID_MAX, "CFG_DEVICE_ID too long");
static_assert(sizeof(CFG_TOPIC_NAMESPACE) <= TOPIC_NAMESPACE_MAX, "CFG_TOPIC_NAMESPACE too long");

// =============================================================================
// AquaSmart filtration unit simulator (ESP32) → MQTT
//
// 1) Connects to WiFi (saved credentials, secrets.h or captive portal)
// 2) Starts a filtration run in the persisted boot mode
// 3) Publishes a sensor reading (flow, pH, turbidity, TDS + progress) every tick
// 4) Accepts set_filter_mode commands and answers processing → success / error
// 5) Optionally replays the three reference scenarios (serial "scenario")
// =============================================================================

static const char *DEVICE_ID = CFG_DEVICE_ID;
static const char *TOPIC_NAMESPACE = CFG_TOPIC_NAMESPACE;
static const char *SERIAL_CMD_DELIMS = " \t";

static void windowSerial();
static void windowWifi();
static void windowSim();
static void windowConfig();
static void windowMqtt();

struct LoopWindow
{
  const char *name;
  uint32_t intervalMs;
  uint32_t lastMs;
  void (*fn)();
};

static void runWindow(LoopWindow &w, uint32_t now)
{
  if (w.intervalMs == 0 || (uint32_t)(now - w.lastMs) >= w.intervalMs)
  {
    w.fn();
    w.lastMs = now;
  }
}

// ----------------- Engine hooks -----------------

static bool hookFormatTimestamp(char *out, size_t outSize)
{
  return wifi_formatNowIso(out, outSize);
}

static bool hookPublishReading(const SensorReading &r)
{
  char ts[ISO_TIMESTAMP_MAX];
  if (!wifi_formatNowIso(ts, sizeof(ts)))
  {
    ts[0] = '\0';
  }
  LOG_DEBUG_EVERY("reading", 10000, LogDomain::SIM,
                  "Reading mode=%s flow=%.2f ph=%.2f turb=%.2f tds=%.1f progress=%.1f%%",
                  toString(r.mode), (double)r.flow, (double)r.ph, (double)r.turbidity, (double)r.tds,
                  r.hasProgress ? (double)r.progress.progressPercent : 0.0);
  return mqtt_publishReading(r, ts);
}

static bool hookPublishResponse(const CommandResponse &r)
{
  LOG_INFO(LogDomain::COMMAND, "Response %s status=%s message=\"%s\"", r.command, toString(r.status), r.message);
  return mqtt_publishResponse(r);
}

static void hookRunStarted(const FiltrationProcess &p)
{
  LOG_INFO(LogDomain::SIM, "Run #%lu started mode=%s target=%.1fL",
           (unsigned long)p.runCount, toString(p.mode), (double)p.targetVolume);
  mqtt_requestStatePublish();
}

static void hookRunCompleted(const FiltrationProcess &p)
{
  LOG_INFO(LogDomain::SIM, "Run #%lu completed mode=%s processed=%.2fL after %.1f min",
           (unsigned long)p.runCount, toString(p.mode), (double)p.processedVolume,
           (double)((millis() - p.startedAtMs) / 60000.0f));
  mqtt_requestStatePublish();
}

static void hookModeSwitched(FiltrationMode mode)
{
  if (storage_saveBootMode(mode))
  {
    config_markDirty();
  }
  else
  {
    LOG_WARN(LogDomain::CONFIG, "Boot mode not persisted mode=%s", toString(mode));
  }
}

static void hookTickFault(const FiltrationProcess &p)
{
  LOG_ERROR(LogDomain::SIM, "Tick aborted: invariant fault mode=%s active=%s processed=%.3f target=%.3f",
            toString(p.mode), p.active ? "true" : "false", (double)p.processedVolume, (double)p.targetVolume);
}

static void hookStopped(SimStopReason reason)
{
  LOG_INFO(LogDomain::SIM, "Simulation stopped reason=%s",
           reason == SimStopReason::DURATION_ELAPSED ? "run_duration_elapsed" : "requested");
  mqtt_requestStatePublish();
}

static void hookScenarioStarted(size_t index, const ScenarioDef &def)
{
  LOG_INFO(LogDomain::SCENARIO, "Scenario %u/%u \"%s\" mode=%s target=%.1fL budget=%lus",
           (unsigned)(index + 1), (unsigned)scenario_defaultCount(), def.name, toString(def.mode),
           (double)def.targetVolume, (unsigned long)(def.durationMs / 1000u));
}

static void hookScenarioFinished(size_t index, const ScenarioOutcome &o)
{
  LOG_INFO(LogDomain::SCENARIO, "Scenario %u \"%s\" finished reason=%s ticks=%lu processed=%.2f/%.1fL",
           (unsigned)(index + 1), o.def ? o.def->name : "?", scenarioEndReasonString(o.reason),
           (unsigned long)o.ticks, (double)o.processedVolume, (double)o.targetVolume);
}

static void hookBatchFinished(size_t completedCount)
{
  LOG_INFO(LogDomain::SCENARIO, "Scenario replay finished (%u scenarios); live interval %lums restored",
           (unsigned)completedCount, (unsigned long)sim_tickInterval());
  mqtt_requestStatePublish();
}

static void handleMqttCommand(const uint8_t *payload, size_t len)
{
  const CommandHandleResult r = sim_handleCommand(payload, len);
  switch (r)
  {
  case CommandHandleResult::QUEUED:
    LOG_DEBUG(LogDomain::COMMAND, "Command queued pending=%u", (unsigned)commands_pendingCount());
    return;
  case CommandHandleResult::IGNORED_MALFORMED:
  case CommandHandleResult::IGNORED_UNKNOWN:
    LOG_WARN(LogDomain::COMMAND, "Command dropped: %s", commandHandleResultString(r));
    return;
  case CommandHandleResult::QUEUE_FULL:
    LOG_WARN(LogDomain::COMMAND, "Command dropped: queue full depth=%u", (unsigned)CFG_CMD_QUEUE_DEPTH);
    return;
  case CommandHandleResult::NOT_READY:
    LOG_WARN(LogDomain::COMMAND, "Command dropped: %s", sim_commandsHeld() ? "scenario replay running" : "simulation stopped");
    return;
  }
}

// ----------------- Helpers -----------------

static StatusSnapshot buildStatus()
{
  const SimStats &stats = sim_stats();
  StatusSnapshot s{};
  s.deviceId = DEVICE_ID;
  s.fwVersion = fw_version::kVersion;
  s.process = sim_snapshot();
  s.running = sim_isRunning();
  s.scenarioRunning = scenario_isRunning();
  s.readings = stats.readings;
  s.faults = stats.faults;
  s.uptimeSeconds = millis() / 1000u;
  return s;
}

static float noiseScaleFor(bool enabled)
{
  return enabled ? CFG_NOISE_SCALE : 0.0f;
}

static void applyConfigFromCache(bool logValues)
{
  const AppliedConfig &cfg = config_get();
  if (!scenario_isRunning() && sim_tickInterval() != cfg.tickIntervalMs)
  {
    sim_setTickInterval(cfg.tickIntervalMs);
  }
  sim_setNoiseScale(noiseScaleFor(cfg.noiseEnabled));
  if (logValues)
  {
    LOG_INFO(LogDomain::CONFIG, "Applied config boot_mode=%s tick_ms=%lu noise=%s",
             toString(cfg.bootMode), (unsigned long)cfg.tickIntervalMs, cfg.noiseEnabled ? "on" : "off");
  }
}

static void printHelpMenu()
{
  LOG_INFO(LogDomain::SYSTEM, "Serial commands:");
  LOG_INFO(LogDomain::SYSTEM, "  status              -> print process, stats and NVS contents");
  LOG_INFO(LogDomain::SYSTEM, "  mode drinking|household -> request a mode switch (same path as MQTT)");
  LOG_INFO(LogDomain::SYSTEM, "  scenario            -> replay the three reference scenarios");
  LOG_INFO(LogDomain::SYSTEM, "  stop / start        -> stop or resume the simulation");
  LOG_INFO(LogDomain::SYSTEM, "  interval <ms>       -> set and persist the live tick interval");
  LOG_INFO(LogDomain::SYSTEM, "  noise on|off        -> enable/disable sensor noise (persisted)");
  LOG_INFO(LogDomain::SYSTEM, "  seed <n>            -> reseed the noise generator");
  LOG_INFO(LogDomain::SYSTEM, "  log hf [on|off]     -> show or set high-frequency logs");
  LOG_INFO(LogDomain::SYSTEM, "  log mqtt on|off     -> enable/disable the MQTT log sink");
  LOG_INFO(LogDomain::SYSTEM, "  log level <lvl>     -> debug|info|warn|error");
  LOG_INFO(LogDomain::SYSTEM, "  wifi                -> start WiFi captive portal (setup mode)");
  LOG_INFO(LogDomain::SYSTEM, "  reboot              -> restart the device");
  LOG_INFO(LogDomain::SYSTEM, "  help                -> show this menu");
}

static bool parseUint(const char *s, uint32_t &out)
{
  if (!s || *s == '\0' || *s == '-')
  {
    return false;
  }
  char *end = nullptr;
  const unsigned long v = strtoul(s, &end, 10);
  if (!end || *end != '\0')
  {
    return false;
  }
  out = (uint32_t)v;
  return true;
}

static bool parseOnOff(const char *s, bool &out)
{
  if (!s)
  {
    return false;
  }
  if (strcmp(s, "on") == 0)
  {
    out = true;
    return true;
  }
  if (strcmp(s, "off") == 0)
  {
    out = false;
    return true;
  }
  return false;
}

static bool readSerialLine(char *buf, size_t bufSize)
{
  if (!buf || bufSize < 2 || !Serial.available())
  {
    return false;
  }

  size_t len = Serial.readBytesUntil('\n', buf, bufSize - 1);
  buf[len] = '\0';
  while (len > 0 && isspace((unsigned char)buf[len - 1]))
  {
    buf[--len] = '\0';
  }
  for (size_t i = 0; i < len; i++)
  {
    buf[i] = (char)tolower((unsigned char)buf[i]);
  }
  return len > 0;
}

static void printStatus()
{
  const StatusSnapshot s = buildStatus();
  const SimStats &stats = sim_stats();
  LOG_INFO(LogDomain::SYSTEM, "Device %s fw=%s uptime=%lus running=%s scenario=%s",
           s.deviceId, s.fwVersion, (unsigned long)s.uptimeSeconds,
           s.running ? "yes" : "no", s.scenarioRunning ? "yes" : "no");
  LOG_INFO(LogDomain::SIM, "Process mode=%s active=%s processed=%.2f/%.1fL runs=%lu elapsed=%.1fmin",
           toString(s.process.mode), s.process.active ? "true" : "false",
           (double)s.process.processedVolume, (double)s.process.targetVolume,
           (unsigned long)s.process.runCount, (double)filtration_elapsedMinutes(s.process, millis()));
  LOG_INFO(LogDomain::SIM, "Stats readings=%lu responses=%lu faults=%lu publish_failures=%lu interval=%lums switching=%s",
           (unsigned long)stats.readings, (unsigned long)stats.responses, (unsigned long)stats.faults,
           (unsigned long)stats.publishFailures, (unsigned long)sim_tickInterval(),
           commands_isSwitching() ? "yes" : "no");
  LOG_INFO(LogDomain::SYSTEM, "WiFi=%s MQTT=%s time=%s",
           wifi_isConnected() ? "connected" : "down",
           mqtt_isConnected() ? "connected" : "down",
           wifi_timeIsValid() ? "valid" : "not_set");
  storage_dump();
}

static void handleModeCommand(const char *arg)
{
  FiltrationMode mode = FiltrationMode::DRINKING_WATER;
  if (arg && strcmp(arg, "drinking") == 0)
  {
    mode = FiltrationMode::DRINKING_WATER;
  }
  else if (arg && strcmp(arg, "household") == 0)
  {
    mode = FiltrationMode::HOUSEHOLD_WATER;
  }
  else if (!arg || !domain_strings::parse(arg, mode))
  {
    printHelpMenu();
    return;
  }

  const CommandHandleResult r = sim_requestMode(mode);
  LOG_INFO(LogDomain::COMMAND, "Serial mode request mode=%s result=%s", toString(mode), commandHandleResultString(r));
}

static void handleIntervalCommand(const char *arg)
{
  uint32_t ms = 0;
  if (!parseUint(arg, ms))
  {
    printHelpMenu();
    return;
  }
  if (scenario_isRunning())
  {
    LOG_WARN(LogDomain::CONFIG, "Interval not changed: scenario replay running");
    return;
  }
  if (storage_saveTickInterval(ms))
  {
    config_markDirty();
    LOG_INFO(LogDomain::CONFIG, "Tick interval set to %lums (saved)", (unsigned long)ms);
  }
  else
  {
    LOG_WARN(LogDomain::CONFIG, "Tick interval %lums rejected or not persisted", (unsigned long)ms);
  }
}

static void handleNoiseCommand(const char *arg)
{
  bool enabled = true;
  if (!parseOnOff(arg, enabled))
  {
    printHelpMenu();
    return;
  }
  if (storage_saveNoiseEnabled(enabled))
  {
    config_markDirty();
  }
  else
  {
    // Still apply for this session.
    sim_setNoiseScale(noiseScaleFor(enabled));
    LOG_WARN(LogDomain::CONFIG, "Noise setting not persisted");
  }
  LOG_INFO(LogDomain::CONFIG, "Sensor noise %s", enabled ? "on" : "off");
}

static bool parseLogLevel(const char *s, LogLevel &out)
{
  static const struct
  {
    const char *name;
    LogLevel level;
  } kLevels[] = {
      {"debug", LogLevel::DEBUG},
      {"info", LogLevel::INFO},
      {"warn", LogLevel::WARN},
      {"error", LogLevel::ERROR}};

  for (const auto &entry : kLevels)
  {
    if (s && strcmp(s, entry.name) == 0)
    {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// log hf [on|off] | log mqtt on|off | log level debug|info|warn|error
static void handleLogCommand(const char *what, const char *value)
{
  bool enabled = false;
  if (what && strcmp(what, "hf") == 0)
  {
    if (value && parseOnOff(value, enabled))
    {
      logger_setHighFreqEnabled(enabled);
    }
    else if (value)
    {
      printHelpMenu();
      return;
    }
    LOG_INFO(LogDomain::SYSTEM, "High-frequency logs %s", logger_isHighFreqEnabled() ? "on" : "off");
    return;
  }
  if (what && strcmp(what, "mqtt") == 0 && parseOnOff(value, enabled))
  {
    logger_setMqttEnabled(enabled);
    LOG_INFO(LogDomain::SYSTEM, "MQTT log sink %s", enabled ? "on" : "off");
    return;
  }
  LogLevel level = LogLevel::INFO;
  if (what && strcmp(what, "level") == 0 && parseLogLevel(value, level))
  {
    logger_setMinLevel(level);
    LOG_WARN(LogDomain::SYSTEM, "Log level set to %s", value);
    return;
  }
  printHelpMenu();
}

static void handleSerialCommands()
{
  char line[CFG_SERIAL_CMD_BUF];
  if (!readSerialLine(line, sizeof(line)))
  {
    return;
  }

  char *save = nullptr;
  const char *cmd = strtok_r(line, SERIAL_CMD_DELIMS, &save);
  if (!cmd)
  {
    return;
  }
  const char *arg = strtok_r(nullptr, SERIAL_CMD_DELIMS, &save);

  if (strcmp(cmd, "help") == 0)
  {
    printHelpMenu();
  }
  else if (strcmp(cmd, "status") == 0)
  {
    printStatus();
  }
  else if (strcmp(cmd, "mode") == 0)
  {
    handleModeCommand(arg);
  }
  else if (strcmp(cmd, "scenario") == 0)
  {
    ScenarioHooks hooks{hookScenarioStarted, hookScenarioFinished, hookBatchFinished};
    if (!scenario_begin(scenario_defaults(), scenario_defaultCount(), hooks, millis()))
    {
      LOG_WARN(LogDomain::SCENARIO, "Scenario replay not started (already running or simulation stopped)");
    }
  }
  else if (strcmp(cmd, "stop") == 0)
  {
    scenario_stop();
    sim_stop(SimStopReason::REQUESTED);
  }
  else if (strcmp(cmd, "start") == 0)
  {
    sim_resume(millis());
    LOG_INFO(LogDomain::SIM, "Simulation running=%s", sim_isRunning() ? "true" : "false");
    mqtt_requestStatePublish();
  }
  else if (strcmp(cmd, "interval") == 0)
  {
    handleIntervalCommand(arg);
  }
  else if (strcmp(cmd, "noise") == 0)
  {
    handleNoiseCommand(arg);
  }
  else if (strcmp(cmd, "seed") == 0)
  {
    uint32_t seed = 0;
    if (!parseUint(arg, seed))
    {
      printHelpMenu();
      return;
    }
    sim_reseed(seed);
    LOG_INFO(LogDomain::SIM, "Noise generator reseeded seed=%lu", (unsigned long)seed);
  }
  else if (strcmp(cmd, "log") == 0)
  {
    handleLogCommand(arg, strtok_r(nullptr, SERIAL_CMD_DELIMS, &save));
  }
  else if (strcmp(cmd, "wifi") == 0)
  {
    wifi_requestPortal();
  }
  else if (strcmp(cmd, "reboot") == 0)
  {
    LOG_WARN(LogDomain::SYSTEM, "REBOOTING... reason=serial");
    scenario_stop();
    sim_stop(SimStopReason::REQUESTED);
    storage_end();
    Serial.flush();
    delay(100);
    ESP.restart();
  }
  else
  {
    LOG_WARN(LogDomain::SYSTEM, "Unknown serial command '%s'", cmd);
    printHelpMenu();
  }
}

// ----------------- Loop windows -----------------

static void windowSerial()
{
  handleSerialCommands();
}

static void windowWifi()
{
  wifi_ensureConnected(CFG_WIFI_TIMEOUT_MS);
}

static void windowSim()
{
  const uint32_t now = millis();
  const SimPollResult r = scenario_isRunning() ? scenario_poll(now) : sim_poll(now);
  if (r.switched)
  {
    mqtt_requestStatePublish();
  }
}

static void windowConfig()
{
  if (config_reloadIfDirty())
  {
    applyConfigFromCache(true);
    mqtt_requestStatePublish();
  }
}

static void windowMqtt()
{
  mqtt_tick(buildStatus());
}

static LoopWindow g_windows[] = {
    {"SERIAL", 0u, 0u, windowSerial},
    {"WIFI", 250u, 0u, windowWifi},
    {"SIM", 0u, 0u, windowSim},
    {"CONFIG", 1000u, 0u, windowConfig},
    {"MQTT", 0u, 0u, windowMqtt}};

// ---------------- Arduino lifecycle ----------------

// Contract: call once after boot. Initializes subsystems, starts the first run and MQTT.
void appSetup()
{
  Serial.begin(115200);
  Serial.setTimeout(20);
  delay(1500);
  logger_begin(true, true);
  logger_setHighFreqEnabled(CFG_LOG_HIGH_FREQ_DEFAULT != 0);
  LOG_INFO(LogDomain::SYSTEM, "BOOT filter_sim %s fw=%s device=%s", fw_version::kModel, fw_version::kVersion, DEVICE_ID);

  if (!storage_begin())
  {
    LOG_WARN(LogDomain::CONFIG, "NVS unavailable; running on compile-time defaults");
  }
  {
    uint32_t bootCount = 0u;
    if (!storage_loadBootCount(bootCount))
    {
      bootCount = 0u;
    }
    bootCount++;
    if (!storage_saveBootCount(bootCount))
    {
      LOG_WARN(LogDomain::CONFIG, "Boot counter not persisted");
    }
    LOG_INFO(LogDomain::SYSTEM, "Boot count=%lu", (unsigned long)bootCount);
  }

  const AppliedConfig defaults{
      CFG_BOOT_MODE_HOUSEHOLD ? FiltrationMode::HOUSEHOLD_WATER : FiltrationMode::DRINKING_WATER,
      CFG_TICK_INTERVAL_MS,
      CFG_NOISE_SCALE > 0.0f};
  config_begin(defaults);
  const AppliedConfig &cfg = config_get();

  wifi_begin(DEVICE_ID, "FilterSim-Setup");

  SensorModelConfig model = sensor_defaultConfig();
  model.baseFlow = CFG_BASE_FLOW;
  model.baseTurbidity = CFG_BASE_TURBIDITY;
  model.baseTds = CFG_BASE_TDS;
  model.readingMinutes = CFG_READING_MINUTES;
  model.noiseScale = noiseScaleFor(cfg.noiseEnabled);

  SimEngineConfig simCfg{};
  simCfg.bootMode = cfg.bootMode;
  simCfg.tickIntervalMs = cfg.tickIntervalMs;
  simCfg.settleMs = CFG_MODE_SETTLE_MS;
  simCfg.runDurationMs = (uint32_t)CFG_RUN_DURATION_MIN * 60000u;
  simCfg.seed = (CFG_SIM_SEED != 0u) ? (uint32_t)CFG_SIM_SEED : esp_random();
  simCfg.model = model;

  SimEngineHooks hooks{};
  hooks.publishReading = hookPublishReading;
  hooks.publishResponse = hookPublishResponse;
  hooks.formatTimestamp = hookFormatTimestamp;
  hooks.onRunStarted = hookRunStarted;
  hooks.onRunCompleted = hookRunCompleted;
  hooks.onModeSwitched = hookModeSwitched;
  hooks.onTickFault = hookTickFault;
  hooks.onStopped = hookStopped;
  if (!sim_begin(simCfg, hooks, millis()))
  {
    LOG_ERROR(LogDomain::SIM, "Simulation engine failed to start");
  }
  applyConfigFromCache(true);

  MqttConfig mqttCfg{
      .host = CFG_MQTT_HOST,
      .port = CFG_MQTT_PORT,
      .clientId = DEVICE_ID,
      .user = MQTT_USER,
      .pass = MQTT_PASS,
      .topicNamespace = TOPIC_NAMESPACE,
      .deviceId = DEVICE_ID};
  mqtt_begin(mqttCfg, handleMqttCommand);

  printHelpMenu();

#if CFG_SCENARIO_AUTOSTART
  ScenarioHooks scenarioHooks{hookScenarioStarted, hookScenarioFinished, hookBatchFinished};
  if (!scenario_begin(scenario_defaults(), scenario_defaultCount(), scenarioHooks, millis()))
  {
    LOG_WARN(LogDomain::SCENARIO, "Scenario autostart failed");
  }
#endif
}

// Contract: called frequently from the Arduino loop; must remain non-blocking.
void appLoop()
{
  const uint32_t now = millis();
  for (LoopWindow &w : g_windows)
  {
    runWindow(w, now);
  }
}
