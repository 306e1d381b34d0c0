#include "domain_strings.h"

#include <string.h>

#if !defined(DOMAIN_STRINGS_STRICT)
#if !defined(NDEBUG)
#define DOMAIN_STRINGS_STRICT 1
#else
#define DOMAIN_STRINGS_STRICT 0
#endif
#endif

namespace
{
#if __cplusplus >= 201703L
    constexpr domain_strings::StringView kUnknown = "unknown";
#else
    const char *kUnknown = "unknown";
#endif
    constexpr const char kDrinkingWater[] = "drinking_water";
    constexpr const char kHouseholdWater[] = "household_water";
    constexpr const char kSetFilterMode[] = "set_filter_mode";
}

namespace domain_strings
{
    StringView to_string(FiltrationMode v)
    {
        switch (v)
        {
        case FiltrationMode::DRINKING_WATER:
            return kDrinkingWater;
        case FiltrationMode::HOUSEHOLD_WATER:
            return kHouseholdWater;
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(CmdStatus v)
    {
        switch (v)
        {
        case CmdStatus::PROCESSING:
            return "processing";
        case CmdStatus::SUCCESS:
            return "success";
        case CmdStatus::ERROR:
            return "error";
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    StringView to_string(CommandKind v)
    {
        switch (v)
        {
        case CommandKind::SET_FILTER_MODE:
            return kSetFilterMode;
        case CommandKind::UNKNOWN:
            return kUnknown;
        }
#if DOMAIN_STRINGS_STRICT
        __builtin_unreachable();
#else
        return kUnknown;
#endif
    }

    bool parse(const char *s, FiltrationMode &out)
    {
        if (!s)
        {
            return false;
        }
        if (strcmp(s, kDrinkingWater) == 0)
        {
            out = FiltrationMode::DRINKING_WATER;
            return true;
        }
        if (strcmp(s, kHouseholdWater) == 0)
        {
            out = FiltrationMode::HOUSEHOLD_WATER;
            return true;
        }
        return false;
    }

    CommandKind parseCommandKind(const char *s)
    {
        if (s && strcmp(s, kSetFilterMode) == 0)
        {
            return CommandKind::SET_FILTER_MODE;
        }
        return CommandKind::UNKNOWN;
    }
}
