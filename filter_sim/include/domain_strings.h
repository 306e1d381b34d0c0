#pragma once
#include "device_state.h"

#if __cplusplus >= 201703L
#include <string_view>
#endif

// Domain enum string conversions (schema-stable strings used in MQTT payloads).
namespace domain_strings
{
#if __cplusplus >= 201703L
    using StringView = std::string_view;
#else
    using StringView = const char *;
#endif

    StringView to_string(FiltrationMode v);
    StringView to_string(CmdStatus v);
    StringView to_string(CommandKind v);

    // Exact, case-sensitive match against the wire strings above.
    bool parse(const char *s, FiltrationMode &out);
    CommandKind parseCommandKind(const char *s);

    inline const char *c_str(StringView v)
    {
#if __cplusplus >= 201703L
        return v.data();
#else
        return v;
#endif
    }
}

inline const char *toString(FiltrationMode v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(CmdStatus v) { return domain_strings::c_str(domain_strings::to_string(v)); }
inline const char *toString(CommandKind v) { return domain_strings::c_str(domain_strings::to_string(v)); }
