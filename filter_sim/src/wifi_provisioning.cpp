#include <WiFi.h>
#include <WiFiManager.h>
#include <Arduino.h>
#include <Preferences.h>
#include <esp_wifi.h>
#include <sys/time.h>
#include <time.h>

#include "wifi_provisioning.h"
#include "logger.h"
#include "time_format.h"

#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#if __has_include("secrets.h")
#include "secrets.h"
#endif
#endif

#ifndef CFG_TIME_SYNC_TIMEOUT_MS
#define CFG_TIME_SYNC_TIMEOUT_MS 20000u
#endif
#ifndef CFG_TIME_SYNC_RETRY_MIN_MS
#define CFG_TIME_SYNC_RETRY_MIN_MS 5000u
#endif
#ifndef CFG_TIME_SYNC_RETRY_MAX_MS
#define CFG_TIME_SYNC_RETRY_MAX_MS 300000u
#endif
#ifndef CFG_WIFI_CONNECT_RETRY_MIN_MS
#define CFG_WIFI_CONNECT_RETRY_MIN_MS 5000u
#endif
#ifndef CFG_WIFI_CONNECT_RETRY_MAX_MS
#define CFG_WIFI_CONNECT_RETRY_MAX_MS 300000u
#endif
#ifndef CFG_WIFI_PORTAL_TIMEOUT_S
#define CFG_WIFI_PORTAL_TIMEOUT_S 180
#endif

static const char *PREF_KEY_FORCE_PORTAL = "force_portal";

static Preferences wifiPrefs;
static const char *s_hostname = "filter-sim";
static const char *s_portalSsid = "FilterSim-Setup";

// One in-flight attempt with a timeout, followed by exponential backoff on failure.
struct Backoff
{
    bool inFlight;
    uint32_t startMs;
    uint32_t retryAtMs;
    uint32_t delayMs;
    uint32_t minMs;
    uint32_t maxMs;
};

static Backoff s_connect{false, 0, 0, CFG_WIFI_CONNECT_RETRY_MIN_MS, CFG_WIFI_CONNECT_RETRY_MIN_MS, CFG_WIFI_CONNECT_RETRY_MAX_MS};
static Backoff s_ntp{false, 0, 0, CFG_TIME_SYNC_RETRY_MIN_MS, CFG_TIME_SYNC_RETRY_MIN_MS, CFG_TIME_SYNC_RETRY_MAX_MS};

static bool s_timeWasValid = false;
static bool s_loggedMissingCredentials = false;
static bool s_portalRequested = false;

static void backoff_reset(Backoff &b)
{
    b.inFlight = false;
    b.startMs = 0;
    b.retryAtMs = 0;
    b.delayMs = b.minMs;
}

static void backoff_start(Backoff &b, uint32_t now)
{
    b.inFlight = true;
    b.startMs = now;
    b.retryAtMs = 0;
}

static void backoff_fail(Backoff &b, uint32_t now)
{
    b.inFlight = false;
    b.retryAtMs = now + b.delayMs;
    b.delayMs = (b.delayMs >= b.maxMs / 2u) ? b.maxMs : b.delayMs * 2u;
}

static bool backoff_waiting(const Backoff &b, uint32_t now)
{
    return b.retryAtMs != 0 && (int32_t)(now - b.retryAtMs) < 0;
}

static bool hasSavedCredentials()
{
    wifi_config_t conf{};
    if (esp_wifi_get_config(WIFI_IF_STA, &conf) != ESP_OK)
    {
        return false;
    }
    return conf.sta.ssid[0] != 0;
}

bool wifi_timeIsValid()
{
    return time(nullptr) > (time_t)time_format::kMinValidEpoch;
}

bool wifi_isConnected()
{
    return WiFi.status() == WL_CONNECTED;
}

bool wifi_formatNowIso(char *out, size_t outSize)
{
    if (wifi_timeIsValid())
    {
        struct timeval tv;
        gettimeofday(&tv, nullptr);
        const uint64_t epochMs = (uint64_t)tv.tv_sec * 1000u + (uint64_t)(tv.tv_usec / 1000);
        return time_format::formatIsoUtcMs(epochMs, out, outSize);
    }
    return time_format::formatIsoUtcMs((uint64_t)millis(), out, outSize, 0);
}

static void timeSyncTick(uint32_t now)
{
    if (wifi_timeIsValid())
    {
        if (!s_timeWasValid || s_ntp.inFlight)
        {
            LOG_INFO(LogDomain::WIFI, "System time valid epoch=%lu", (unsigned long)time(nullptr));
        }
        s_timeWasValid = true;
        backoff_reset(s_ntp);
        return;
    }
    s_timeWasValid = false;

    if (!wifi_isConnected())
    {
        if (s_ntp.inFlight)
        {
            LOG_WARN(LogDomain::WIFI, "NTP sync interrupted: wifi_disconnected");
            s_ntp.inFlight = false;
        }
        return;
    }

    if (s_ntp.inFlight)
    {
        if ((uint32_t)(now - s_ntp.startMs) >= CFG_TIME_SYNC_TIMEOUT_MS)
        {
            LOG_WARN(LogDomain::WIFI, "NTP sync timeout, retry_in_ms=%lu", (unsigned long)s_ntp.delayMs);
            backoff_fail(s_ntp, now);
        }
        return;
    }

    if (backoff_waiting(s_ntp, now))
    {
        return;
    }

    LOG_INFO(LogDomain::WIFI, "Starting NTP sync timeout_ms=%lu", (unsigned long)CFG_TIME_SYNC_TIMEOUT_MS);
    configTime(0, 0, "pool.ntp.org", "time.google.com");
    backoff_start(s_ntp, now);
}

void wifi_begin(const char *hostname, const char *portalSsid)
{
    if (hostname && hostname[0] != '\0')
    {
        s_hostname = hostname;
    }
    if (portalSsid && portalSsid[0] != '\0')
    {
        s_portalSsid = portalSsid;
    }
    if (!wifiPrefs.begin("wifi", false))
    {
        LOG_WARN(LogDomain::WIFI, "WiFi preferences unavailable; portal flag not persisted");
    }
}

static void startPortal()
{
    s_portalRequested = false;
    wifiPrefs.putBool(PREF_KEY_FORCE_PORTAL, false);

    WiFi.mode(WIFI_AP_STA);
    WiFi.setSleep(false);
    WiFi.disconnect(true, false);
    delay(200);

    WiFiManager wm;
    wm.setDebugOutput(false);
    wm.setConfigPortalTimeout(CFG_WIFI_PORTAL_TIMEOUT_S);
    wm.setConnectTimeout(20);
    wm.setConnectRetries(2);
    wm.setHostname(s_hostname);

    LOG_INFO(LogDomain::WIFI, "Starting captive portal ssid=%s timeout_s=%d", s_portalSsid, CFG_WIFI_PORTAL_TIMEOUT_S);
    const bool ok = wm.startConfigPortal(s_portalSsid);
    backoff_reset(s_connect);
    if (!ok)
    {
        LOG_WARN(LogDomain::WIFI, "Portal timed out or failed; continuing offline");
        return;
    }

    LOG_INFO(LogDomain::WIFI, "WiFi configured and connected ip=%s", WiFi.localIP().toString().c_str());
    s_loggedMissingCredentials = false;
}

void wifi_ensureConnected(uint32_t wifiTimeoutMs)
{
    const uint32_t now = millis();
    timeSyncTick(now);

    WiFi.persistent(true);
    if (WiFi.getMode() == WIFI_MODE_NULL)
    {
        WiFi.mode(WIFI_STA);
    }

    if (wifi_isConnected())
    {
        if (s_connect.inFlight)
        {
            LOG_INFO(LogDomain::WIFI, "Connected ip=%s connect_ms=%lu",
                     WiFi.localIP().toString().c_str(),
                     (unsigned long)(now - s_connect.startMs));
        }
        backoff_reset(s_connect);
        s_loggedMissingCredentials = false;
        return;
    }

    if (s_connect.inFlight)
    {
        if ((uint32_t)(now - s_connect.startMs) < (wifiTimeoutMs == 0u ? 1u : wifiTimeoutMs))
        {
            return;
        }
        LOG_WARN(LogDomain::WIFI, "WiFi connect timed out; retry_in_ms=%lu", (unsigned long)s_connect.delayMs);
        WiFi.disconnect(false, false);
        backoff_fail(s_connect, now);
        return;
    }

    if (s_portalRequested || wifiPrefs.getBool(PREF_KEY_FORCE_PORTAL, false))
    {
        startPortal();
        return;
    }

    if (backoff_waiting(s_connect, now))
    {
        return;
    }

    if (!hasSavedCredentials())
    {
#if defined(WIFI_SSID) && defined(WIFI_PASS)
        LOG_INFO(LogDomain::WIFI, "Connecting to WiFi from secrets.h ssid=%s", WIFI_SSID);
        WiFi.mode(WIFI_STA);
        WiFi.begin(WIFI_SSID, WIFI_PASS);
        backoff_start(s_connect, now);
#else
        if (!s_loggedMissingCredentials)
        {
            LOG_WARN(LogDomain::WIFI, "No saved WiFi credentials; entering captive portal");
            s_loggedMissingCredentials = true;
        }
        startPortal();
#endif
        return;
    }

    LOG_INFO(LogDomain::WIFI, "Connecting to saved WiFi");
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(s_hostname);
    WiFi.begin();
    backoff_start(s_connect, now);
}

void wifi_requestPortal()
{
    LOG_INFO(LogDomain::WIFI, "Forcing captive portal");
    s_portalRequested = true;
    WiFi.disconnect(true, false);
    backoff_reset(s_connect);
}
