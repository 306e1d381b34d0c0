#include "applied_config.h"

#include "storage_nvs.h"

static AppliedConfig g_defaults = {FiltrationMode::DRINKING_WATER, 2000u, true};
static AppliedConfig g_config = g_defaults;

static bool s_dirty = false;

static void loadFromNvs()
{
    AppliedConfig next = g_defaults;

    FiltrationMode mode = g_defaults.bootMode;
    if (storage_loadBootMode(mode))
    {
        next.bootMode = mode;
    }

    uint32_t tickMs = g_defaults.tickIntervalMs;
    if (storage_loadTickInterval(tickMs))
    {
        next.tickIntervalMs = tickMs;
    }

    bool noise = g_defaults.noiseEnabled;
    if (storage_loadNoiseEnabled(noise))
    {
        next.noiseEnabled = noise;
    }

    g_config = next;
}

void config_begin(const AppliedConfig &defaults)
{
    g_defaults = defaults;
    loadFromNvs();
    s_dirty = false;
}

void config_markDirty()
{
    s_dirty = true;
}

bool config_reloadIfDirty()
{
    if (!s_dirty)
    {
        return false;
    }

    loadFromNvs();
    s_dirty = false;
    return true;
}

const AppliedConfig &config_get()
{
    return g_config;
}
