#include <Preferences.h>

#include "storage_nvs.h"
#include "logger.h"
#include "domain_strings.h"

static Preferences prefs;
static bool s_open = false;

namespace storage
{
namespace nvs
{
static constexpr const char kNamespace[] = "filter_sim";
static constexpr const char kSchemaKey[] = "schema";
static constexpr uint32_t kSchemaVersion = 1;

static constexpr const char kKeyBootMode[] = "boot_mode";
static constexpr const char kKeyTickMs[] = "tick_ms";
static constexpr const char kKeyNoise[] = "noise";
static constexpr const char kKeyBootCount[] = "boot_count";

// Accepted range for a persisted tick interval.
static constexpr uint32_t kTickMinMs = 100;
static constexpr uint32_t kTickMaxMs = 3600000;

static constexpr uint32_t kWarnThrottleMs = 5000;
} // namespace nvs
} // namespace storage

// Policy: on schema mismatch, clear all keys in this namespace and write the new version.
bool storage_begin()
{
    s_open = prefs.begin(storage::nvs::kNamespace, false);
    if (!s_open)
    {
        LOG_ERROR(LogDomain::CONFIG, "NVS: begin failed namespace=%s", storage::nvs::kNamespace);
        return false;
    }

    const uint32_t ver = prefs.getUInt(storage::nvs::kSchemaKey, 0);
    if (ver != storage::nvs::kSchemaVersion)
    {
        LOG_WARN(LogDomain::CONFIG, "NVS: schema mismatch stored=%lu expected=%lu; clearing",
                 (unsigned long)ver, (unsigned long)storage::nvs::kSchemaVersion);
        if (!prefs.clear())
        {
            LOG_WARN(LogDomain::CONFIG, "NVS: clear failed namespace=%s", storage::nvs::kNamespace);
        }
        if (prefs.putUInt(storage::nvs::kSchemaKey, storage::nvs::kSchemaVersion) == 0)
        {
            LOG_WARN(LogDomain::CONFIG, "NVS: failed to store schema version");
        }
    }

    return true;
}

void storage_end()
{
    if (s_open)
    {
        prefs.end();
        s_open = false;
    }
}

bool storage_loadBootMode(FiltrationMode &mode)
{
    if (!s_open || !prefs.isKey(storage::nvs::kKeyBootMode))
    {
        return false;
    }

    char raw[CMD_MODE_MAX] = {0};
    prefs.getString(storage::nvs::kKeyBootMode, raw, sizeof(raw));
    if (!domain_strings::parse(raw, mode))
    {
        LOG_WARN_EVERY("nvs_mode_invalid", storage::nvs::kWarnThrottleMs, LogDomain::CONFIG,
                       "NVS: invalid boot mode '%s'", raw);
        return false;
    }
    return true;
}

bool storage_saveBootMode(FiltrationMode mode)
{
    if (!s_open)
    {
        return false;
    }
    return prefs.putString(storage::nvs::kKeyBootMode, toString(mode)) > 0;
}

bool storage_loadTickInterval(uint32_t &intervalMs)
{
    if (!s_open || !prefs.isKey(storage::nvs::kKeyTickMs))
    {
        return false;
    }

    const uint32_t raw = prefs.getUInt(storage::nvs::kKeyTickMs, 0);
    if (raw < storage::nvs::kTickMinMs || raw > storage::nvs::kTickMaxMs)
    {
        LOG_WARN_EVERY("nvs_tick_invalid", storage::nvs::kWarnThrottleMs, LogDomain::CONFIG,
                       "NVS: invalid tick interval %lu ms", (unsigned long)raw);
        return false;
    }
    intervalMs = raw;
    return true;
}

bool storage_saveTickInterval(uint32_t intervalMs)
{
    if (!s_open || intervalMs < storage::nvs::kTickMinMs || intervalMs > storage::nvs::kTickMaxMs)
    {
        return false;
    }
    return prefs.putUInt(storage::nvs::kKeyTickMs, intervalMs) > 0;
}

bool storage_loadNoiseEnabled(bool &enabled)
{
    if (!s_open || !prefs.isKey(storage::nvs::kKeyNoise))
    {
        return false;
    }
    enabled = prefs.getBool(storage::nvs::kKeyNoise, true);
    return true;
}

bool storage_saveNoiseEnabled(bool enabled)
{
    if (!s_open)
    {
        return false;
    }
    return prefs.putBool(storage::nvs::kKeyNoise, enabled) > 0;
}

bool storage_loadBootCount(uint32_t &count)
{
    count = s_open ? prefs.getUInt(storage::nvs::kKeyBootCount, 0u) : 0u;
    return s_open && prefs.isKey(storage::nvs::kKeyBootCount);
}

bool storage_saveBootCount(uint32_t count)
{
    if (!s_open)
    {
        return false;
    }
    return prefs.putUInt(storage::nvs::kKeyBootCount, count) > 0;
}

void storage_dump()
{
    if (!s_open)
    {
        LOG_INFO(LogDomain::CONFIG, "NVS: not open");
        return;
    }

    char mode[CMD_MODE_MAX] = {0};
    if (prefs.isKey(storage::nvs::kKeyBootMode))
    {
        prefs.getString(storage::nvs::kKeyBootMode, mode, sizeof(mode));
    }
    LOG_INFO(LogDomain::CONFIG, "NVS: schema=%lu boot_mode=%s tick_ms=%lu noise=%s boot_count=%lu",
             (unsigned long)prefs.getUInt(storage::nvs::kSchemaKey, 0),
             mode[0] ? mode : "(unset)",
             (unsigned long)prefs.getUInt(storage::nvs::kKeyTickMs, 0),
             prefs.isKey(storage::nvs::kKeyNoise) ? (prefs.getBool(storage::nvs::kKeyNoise, true) ? "on" : "off") : "(unset)",
             (unsigned long)prefs.getUInt(storage::nvs::kKeyBootCount, 0));
}
