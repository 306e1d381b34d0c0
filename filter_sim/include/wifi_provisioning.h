#pragma once

#include <stddef.h>
#include <stdint.h>

// Open the WiFi preferences namespace; call once before wifi_ensureConnected().
void wifi_begin(const char *hostname, const char *portalSsid);

// Non-blocking: keeps the station connected with backoff and drives NTP sync.
// Opens the captive portal (blocking, bounded by its timeout) only when no credentials are stored
// or when a portal was requested.
void wifi_ensureConnected(uint32_t wifiTimeoutMs);

bool wifi_isConnected();

// Returns true once SNTP time has been synchronized.
bool wifi_timeIsValid();

// Current UTC instant as YYYY-MM-DDTHH:MM:SS.mmmZ. Before NTP sync the instant is uptime-based
// (starts at 1970-01-01) so that responses always carry a timestamp.
bool wifi_formatNowIso(char *out, size_t outSize);

// Force captive portal on next loop without wiping credentials.
void wifi_requestPortal();
