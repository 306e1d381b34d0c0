#include "time_format.h"

#include <stdio.h>
#include <string.h>
#include <time.h>

namespace
{
// 'd' = digit, anything else must match literally.
static constexpr char kPatternSeconds[] = "dddd-dd-ddTdd:dd:ddZ";
static constexpr char kPatternMillis[] = "dddd-dd-ddTdd:dd:dd.dddZ";

static constexpr size_t kLenSeconds = sizeof(kPatternSeconds) - 1;
static constexpr size_t kLenMillis = sizeof(kPatternMillis) - 1;

static bool matchesPattern(const char *value, const char *pattern, size_t len)
{
    for (size_t i = 0; i < len; ++i)
    {
        const char c = value[i];
        if (pattern[i] == 'd' ? (c < '0' || c > '9') : c != pattern[i])
        {
            return false;
        }
    }
    return true;
}

// millisPart < 0 selects the seconds-only layout.
static bool formatUtc(uint64_t epochSeconds, int millisPart, char *out, size_t outSize)
{
    const time_t t = static_cast<time_t>(epochSeconds);
    struct tm tmUtc;
    memset(&tmUtc, 0, sizeof(tmUtc));
    if (!gmtime_r(&t, &tmUtc))
    {
        return false;
    }

    int written = 0;
    if (millisPart < 0)
    {
        written = snprintf(out, outSize, "%04d-%02d-%02dT%02d:%02d:%02dZ",
                           tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
                           tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec);
    }
    else
    {
        written = snprintf(out, outSize, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                           tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
                           tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, millisPart);
    }

    if (written <= 0 || static_cast<size_t>(written) >= outSize)
    {
        out[outSize - 1] = '\0';
        return false;
    }
    return true;
}
} // namespace

namespace time_format
{
bool formatIsoUtc(uint32_t epochSeconds, char *out, size_t outSize)
{
    if (!out || outSize == 0)
    {
        return false;
    }
    out[0] = '\0';
    if (outSize <= kLenSeconds || epochSeconds < kMinValidEpoch)
    {
        return false;
    }
    return formatUtc(epochSeconds, -1, out, outSize);
}

bool formatIsoUtcMs(uint64_t epochMs, char *out, size_t outSize, uint32_t minEpochSeconds)
{
    if (!out || outSize == 0)
    {
        return false;
    }
    out[0] = '\0';
    const uint64_t epochSeconds = epochMs / 1000u;
    if (outSize <= kLenMillis || epochSeconds < minEpochSeconds)
    {
        return false;
    }
    return formatUtc(epochSeconds, static_cast<int>(epochMs % 1000u), out, outSize);
}

bool isValidIsoUtc(const char *value)
{
    if (!value || value[0] == '\0')
    {
        return false;
    }

    const unsigned char first = static_cast<unsigned char>(value[0]);
    if (first < 0x20u || first > 0x7Eu)
    {
        return false;
    }

    const size_t len = strlen(value);
    if (len == kLenSeconds)
    {
        return matchesPattern(value, kPatternSeconds, len);
    }
    if (len == kLenMillis)
    {
        return matchesPattern(value, kPatternMillis, len);
    }
    return false;
}
} // namespace time_format
