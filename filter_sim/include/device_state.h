#pragma once
#include <stdint.h>
#include <stddef.h>

// Keep schema version explicit so consumers can evolve safely
static constexpr uint8_t TELEMETRY_SCHEMA_VERSION = 1;
static constexpr size_t DEVICE_ID_MAX = 48;
static constexpr size_t TOPIC_NAMESPACE_MAX = 32;
static constexpr size_t CMD_NAME_MAX = 24;
static constexpr size_t CMD_MODE_MAX = 40;
static constexpr size_t CMD_MESSAGE_MAX = 96;
static constexpr size_t ISO_TIMESTAMP_MAX = 25;

// Default target volumes per run (liters).
static constexpr float DRINKING_WATER_TARGET_L = 50.0f;
static constexpr float HOUSEHOLD_WATER_TARGET_L = 75.0f;

// --- C++ enums (stronger than magic ints/strings) ---
enum class FiltrationMode : uint8_t
{
    DRINKING_WATER = 0,
    HOUSEHOLD_WATER = 1
};

enum class CmdStatus : uint8_t
{
    PROCESSING = 0,
    SUCCESS = 1,
    ERROR = 2
};

// Closed set of recognized command kinds; anything else decodes to UNKNOWN.
enum class CommandKind : uint8_t
{
    UNKNOWN = 0,
    SET_FILTER_MODE = 1
};

static_assert(static_cast<uint8_t>(FiltrationMode::HOUSEHOLD_WATER) == 1, "FiltrationMode values must be stable");
static_assert(static_cast<uint8_t>(CmdStatus::ERROR) == 2, "CmdStatus values must be stable");

// One simulated filtration unit. Owned by sim_engine; everything else sees copies.
struct FiltrationProcess
{
    FiltrationMode mode = FiltrationMode::DRINKING_WATER;
    bool active = false;
    uint32_t startedAtMs = 0; // set only when active transitions to true
    double targetVolume = 0.0;
    double processedVolume = 0.0;
    uint32_t runCount = 0; // number of runs started since boot
};

struct ProgressMeta
{
    double processedVolume;
    double targetVolume;
    float progressPercent;
    float elapsedMinutes;
};

// Value type produced fresh on every tick. Values are unrounded; rounding is a presentation concern.
struct SensorReading
{
    uint32_t ts = 0; // millis() at generation
    FiltrationMode mode = FiltrationMode::DRINKING_WATER;
    float flow = 0.0f;      // L/min
    float ph = 0.0f;        // pH
    float turbidity = 0.0f; // NTU
    float tds = 0.0f;       // ppm
    bool hasProgress = false;
    ProgressMeta progress{};
};

// Decoded inbound command (tagged by kind).
struct FilterCommand
{
    CommandKind kind = CommandKind::UNKNOWN;
    bool modeValid = false;
    FiltrationMode mode = FiltrationMode::DRINKING_WATER;
    char rawMode[CMD_MODE_MAX] = {0}; // mode value as received, for error messages
};

struct CommandResponse
{
    char command[CMD_NAME_MAX] = {0};
    CmdStatus status = CmdStatus::PROCESSING;
    char message[CMD_MESSAGE_MAX] = {0};
    char timestamp[ISO_TIMESTAMP_MAX] = {0};
};

// Retained device status snapshot (published on request and as heartbeat).
struct StatusSnapshot
{
    const char *deviceId;
    const char *fwVersion;
    FiltrationProcess process;
    bool running;
    bool scenarioRunning;
    uint32_t readings;
    uint32_t faults;
    uint32_t uptimeSeconds;
};
