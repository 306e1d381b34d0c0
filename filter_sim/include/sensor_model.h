#pragma once
#include <stdint.h>
#include "device_state.h"

// Seedable pseudo-random source for sensor noise (xorshift32).
struct SimRng
{
    uint32_t state;
};

void rng_seed(SimRng &rng, uint32_t seed);
uint32_t rng_next(SimRng &rng);
// Uniform in [lo, hi); returns lo when hi <= lo.
float rng_uniform(SimRng &rng, float lo, float hi);

struct SensorModelConfig
{
    float baseFlow;       // L/min at the start of a run
    float baseTurbidity;  // NTU of unfiltered water
    float baseTds;        // ppm of unfiltered water
    float readingMinutes; // simulated minutes of flow accounted per reading
    float noiseScale;     // 1 = nominal noise bands, 0 = deterministic
};

// Reference values: 2.5 L/min, 1.2 NTU, 280 ppm, 0.5 min per reading, full noise.
SensorModelConfig sensor_defaultConfig();

enum class SensorGenerateResult : uint8_t
{
    OK = 0,    // reading produced; run (if any) still active or already idle
    COMPLETED, // reading produced and this reading completed the run
    FAULT      // tick aborted on an invariant fault; no reading
};

// Produce one reading from the current process state. While active, the sampled flow is also
// applied to the process via filtration_tick(cfg.readingMinutes, flow) before turbidity and TDS
// are derived, so the emitted flow and the progress increment always match.
// Contract: single-threaded; the caller owns p for the duration of the call.
SensorGenerateResult sensor_generate(FiltrationProcess &p,
                                     const SensorModelConfig &cfg,
                                     SimRng &rng,
                                     uint32_t nowMs,
                                     SensorReading &out);
