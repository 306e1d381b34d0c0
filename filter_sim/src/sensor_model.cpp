#include "sensor_model.h"

#include <math.h>
#include "filtration.h"

static constexpr uint32_t kDefaultSeed = 0x9E3779B9u;

// Degradation at r = 1.
static constexpr float kFlowLoss = 0.3f;
static constexpr float kTurbidityGain = 0.7f;
static constexpr float kTdsGain = 0.4f;

static constexpr float kMinActiveFlow = 0.5f;
static constexpr float kIdleFlowMax = 0.1f;

static constexpr float kFlowNoise = 0.2f;
static constexpr float kPhReadNoise = 0.1f;
static constexpr float kTurbidityNoiseActive = 0.1f;
static constexpr float kTurbidityNoiseIdle = 0.2f;
static constexpr float kTdsNoiseActive = 10.0f;
static constexpr float kTdsNoiseIdle = 15.0f;

struct PhBand
{
    float center;
    float halfWidth;
};

static PhBand phBandFor(FiltrationMode mode)
{
    switch (mode)
    {
    case FiltrationMode::DRINKING_WATER:
        return {7.0f, 0.3f};
    case FiltrationMode::HOUSEHOLD_WATER:
        return {7.5f, 0.5f};
    }
    return {7.0f, 0.3f};
}

void rng_seed(SimRng &rng, uint32_t seed)
{
    // xorshift has a fixed point at zero
    rng.state = seed ? seed : kDefaultSeed;
}

uint32_t rng_next(SimRng &rng)
{
    uint32_t x = rng.state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    rng.state = x;
    return x;
}

float rng_uniform(SimRng &rng, float lo, float hi)
{
    const uint32_t bits = rng_next(rng) >> 8; // 24 bits fit a float mantissa exactly
    if (!(hi > lo))
    {
        return lo;
    }
    const float unit = (float)bits / 16777216.0f;
    return lo + (hi - lo) * unit;
}

// Symmetric noise term scaled by cfg.noiseScale. Always consumes one draw.
static float noise(SimRng &rng, const SensorModelConfig &cfg, float halfWidth)
{
    const float w = halfWidth * cfg.noiseScale;
    return rng_uniform(rng, -w, w);
}

SensorModelConfig sensor_defaultConfig()
{
    SensorModelConfig cfg{};
    cfg.baseFlow = 2.5f;
    cfg.baseTurbidity = 1.2f;
    cfg.baseTds = 280.0f;
    cfg.readingMinutes = 0.5f;
    cfg.noiseScale = 1.0f;
    return cfg;
}

SensorGenerateResult sensor_generate(FiltrationProcess &p,
                                     const SensorModelConfig &cfg,
                                     SimRng &rng,
                                     uint32_t nowMs,
                                     SensorReading &out)
{
    out = SensorReading{};
    out.ts = nowMs;

    bool completed = false;

    // Flow first: it drives the progress increment for this reading.
    if (p.active)
    {
        const float r = filtration_progressRatio(p);
        float flow = cfg.baseFlow * (1.0f - kFlowLoss * r) + noise(rng, cfg, kFlowNoise);
        if (flow < kMinActiveFlow)
        {
            flow = kMinActiveFlow;
        }

        const FiltrationTickResult tr = filtration_tick(p, cfg.readingMinutes, flow);
        if (tr == FiltrationTickResult::INVARIANT_FAULT)
        {
            return SensorGenerateResult::FAULT;
        }
        completed = (tr == FiltrationTickResult::COMPLETED);
        out.flow = flow;
    }
    else
    {
        out.flow = rng_uniform(rng, 0.0f, kIdleFlowMax * cfg.noiseScale);
    }

    // Mode is read after the tick; a tick never changes it.
    out.mode = p.mode;

    // Two independent draws: band sample, then reading noise.
    const PhBand band = phBandFor(p.mode);
    const float targetPh = band.center + noise(rng, cfg, band.halfWidth);
    out.ph = targetPh + noise(rng, cfg, kPhReadNoise);
    if (out.ph < 0.0f)
    {
        out.ph = 0.0f;
    }

    // Turbidity and TDS follow the post-tick state; a completing reading reports idle water.
    if (p.active)
    {
        const float r = filtration_progressRatio(p);
        out.turbidity = cfg.baseTurbidity * (1.0f - kTurbidityGain * r) + noise(rng, cfg, kTurbidityNoiseActive);
        out.tds = cfg.baseTds * (1.0f - kTdsGain * r) + noise(rng, cfg, kTdsNoiseActive);
    }
    else
    {
        out.turbidity = cfg.baseTurbidity + noise(rng, cfg, kTurbidityNoiseIdle);
        out.tds = cfg.baseTds + noise(rng, cfg, kTdsNoiseIdle);
    }
    if (out.turbidity < 0.0f)
    {
        out.turbidity = 0.0f;
    }
    if (out.tds < 0.0f)
    {
        out.tds = 0.0f;
    }

    if (p.active)
    {
        out.hasProgress = true;
        out.progress.processedVolume = p.processedVolume;
        out.progress.targetVolume = p.targetVolume;
        out.progress.progressPercent = filtration_progressRatio(p) * 100.0f;
        out.progress.elapsedMinutes = filtration_elapsedMinutes(p, nowMs);
    }

    return completed ? SensorGenerateResult::COMPLETED : SensorGenerateResult::OK;
}
