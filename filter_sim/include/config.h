// Optional config overrides for filter_sim.ino
// Contract: values must be sane/positive; this file should only define overrides.
#pragma once
// Uncomment any of the defines below to change the simulator defaults.

// --- Identity / broker ---
// #define CFG_TOPIC_NAMESPACE "aquasmart"
// #define CFG_DEVICE_ID "filter_sim_esp32"
#define CFG_MQTT_HOST "192.168.0.198"
// #define CFG_MQTT_PORT 1883

// --- Simulation cadence ---
// #define CFG_TICK_INTERVAL_MS 2000u     // live reading interval
// #define CFG_READING_MINUTES 0.5f       // simulated minutes of flow per reading
// #define CFG_MODE_SETTLE_MS 2000u       // mode switch-over time
// #define CFG_RUN_DURATION_MIN 0u        // stop the live simulation after N minutes (0 = never)
// #define CFG_BOOT_MODE_HOUSEHOLD 0      // default boot mode when NVS has none (0=drinking, 1=household)

// --- Sensor model ---
// #define CFG_BASE_FLOW 2.5f
// #define CFG_BASE_TURBIDITY 1.2f
// #define CFG_BASE_TDS 280.0f
// #define CFG_NOISE_SCALE 1.0f
// #define CFG_SIM_SEED 0u                // 0 = seed from the hardware RNG at boot

// --- Commands / scenarios ---
// #define CFG_CMD_QUEUE_DEPTH 4u
// #define CFG_SCENARIO_TICK_MS 1000u
// #define CFG_SCENARIO_PAUSE_MS 2000u
// #define CFG_SCENARIO_AUTOSTART 0       // replay the three scenarios right after boot

// #define CFG_SERIAL_CMD_BUF 128u
#ifndef CFG_LOG_COLOR
#define CFG_LOG_COLOR 0 // ANSI colorized Serial logs (0=off, 1=on)
#endif
#ifndef CFG_LOG_HIGH_FREQ_DEFAULT
#define CFG_LOG_HIGH_FREQ_DEFAULT 0 // per-reading DEBUG logs at boot (0=off, 1=on)
#endif

// --- Time sync (non-blocking NTP) ---
// #define CFG_TIME_SYNC_TIMEOUT_MS 20000u
// #define CFG_TIME_SYNC_RETRY_MIN_MS 5000u
// #define CFG_TIME_SYNC_RETRY_MAX_MS 300000u
