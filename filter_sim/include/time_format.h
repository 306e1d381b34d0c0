#pragma once

#include <stddef.h>
#include <stdint.h>

namespace time_format
{
// Epochs before this are treated as "clock not synced yet".
static constexpr uint32_t kMinValidEpoch = 1600000000u;

// Formats epoch seconds as YYYY-MM-DDTHH:MM:SSZ.
// Returns false and writes an empty string when formatting is not possible.
bool formatIsoUtc(uint32_t epochSeconds, char *out, size_t outSize);

// Formats epoch milliseconds as YYYY-MM-DDTHH:MM:SS.mmmZ (needs outSize >= 25).
// Pass minEpochSeconds = 0 to format unsynced clocks (uptime-based instants).
bool formatIsoUtcMs(uint64_t epochMs, char *out, size_t outSize, uint32_t minEpochSeconds = kMinValidEpoch);

// Strict validator for YYYY-MM-DDTHH:MM:SSZ and YYYY-MM-DDTHH:MM:SS.mmmZ.
// Empty strings and non-printable leading characters are treated as invalid.
bool isValidIsoUtc(const char *value);
} // namespace time_format
