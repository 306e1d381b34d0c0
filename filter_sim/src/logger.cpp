#include "logger.h"

#include <Arduino.h>
#include <ArduinoJson.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#endif

#ifndef CFG_LOG_COLOR
// ANSI escape codes on Serial; the terminal must support them.
#define CFG_LOG_COLOR 1
#endif

static constexpr size_t kThrottleSlots = 16;
static constexpr size_t kMsgBufSize = 256;
static constexpr size_t kJsonBufSize = 384;
static constexpr const char *kLogTopicSuffix = "log";
static constexpr const char *kAnsiReset = "\x1B[0m";
static constexpr const char *kAnsiTs = "\x1B[2m\x1B[90m";

struct LevelInfo
{
    const char *json;
    const char *serial;
    const char *style;
};

static constexpr LevelInfo kLevels[] = {
    {"DEBUG", "DEBUG", "\x1B[2m\x1B[36m"},
    {"INFO", "INFO", ""},
    {"WARN", "WARNING", "\x1B[1m\x1B[33m"},
    {"ERROR", "ERROR", "\x1B[1m\x1B[31m"},
};
static_assert(sizeof(kLevels) / sizeof(kLevels[0]) == (size_t)LogLevel::ERROR + 1, "kLevels out of sync with LogLevel");

struct DomainInfo
{
    const char *name;
    const char *color;
};

static constexpr DomainInfo kDomains[] = {
    {"SYSTEM", "\x1B[2m\x1B[90m"},
    {"WIFI", "\x1B[34m"},
    {"MQTT", "\x1B[35m"},
    {"SIM", "\x1B[32m"},
    {"COMMAND", "\x1B[36m"},
    {"CONFIG", "\x1B[33m"},
    {"SCENARIO", "\x1B[2m\x1B[32m"},
};
static_assert(sizeof(kDomains) / sizeof(kDomains[0]) == (size_t)LogDomain::SCENARIO + 1, "kDomains out of sync with LogDomain");

static bool s_serialEnabled = true;
static bool s_mqttEnabled = true;
static bool s_highFreqEnabled = true;
static LogLevel s_minLevel = LogLevel::DEBUG;
static LoggerMqttPublishFn s_mqttPublisher = nullptr;
static LoggerMqttConnectedFn s_mqttConnectedFn = nullptr;
static bool s_inMqttSink = false;

struct ThrottleSlot
{
    uint32_t hash;
    uint32_t lastMs;
};
static ThrottleSlot s_throttle[kThrottleSlots] = {};

static uint32_t fnv1a32(const char *s)
{
    uint32_t hash = 2166136261u;
    for (const uint8_t *p = (const uint8_t *)s; *p; ++p)
    {
        hash ^= *p;
        hash *= 16777619u;
    }
    return hash == 0 ? 1u : hash; // 0 marks a free slot
}

// Returns true when the keyed message may be emitted now.
static bool throttleAllows(const char *key, uint32_t intervalMs, uint32_t now)
{
    if (!key || key[0] == '\0' || intervalMs == 0)
    {
        return true;
    }

    const uint32_t hash = fnv1a32(key);
    ThrottleSlot *victim = &s_throttle[0];
    for (ThrottleSlot &slot : s_throttle)
    {
        if (slot.hash == hash)
        {
            if ((uint32_t)(now - slot.lastMs) < intervalMs)
            {
                return false;
            }
            slot.lastMs = now;
            return true;
        }
        if (victim->hash != 0 && (slot.hash == 0 || (uint32_t)(now - slot.lastMs) > (uint32_t)(now - victim->lastMs)))
        {
            victim = &slot;
        }
    }

    victim->hash = hash;
    victim->lastMs = now;
    return true;
}

static void formatMessage(char *out, size_t outSize, const char *fmt, va_list args)
{
    const int needed = vsnprintf(out, outSize, fmt, args);
    if (needed < 0)
    {
        out[0] = '\0';
    }
    else if ((size_t)needed >= outSize && outSize >= 4)
    {
        memcpy(out + outSize - 4, "...", 4);
    }
}

static void logToSerial(uint32_t tsSec, LogLevel lvl, LogDomain dom, const char *msg)
{
    const LevelInfo &level = kLevels[(uint8_t)lvl];
    const DomainInfo &domain = kDomains[(uint8_t)dom];
    char line[kMsgBufSize + 64];
#if CFG_LOG_COLOR
    snprintf(line, sizeof(line), "%s[%6lu]%s %s%-7s%s %s%-8s%s: %s",
             kAnsiTs, (unsigned long)tsSec, kAnsiReset,
             level.style, level.serial, kAnsiReset,
             domain.color, domain.name, kAnsiReset,
             msg);
#else
    snprintf(line, sizeof(line), "[%6lu] %-7s %-8s: %s", (unsigned long)tsSec, level.serial, domain.name, msg);
#endif
    Serial.println(line);
}

static void logToMqtt(uint32_t tsSec, LogLevel lvl, LogDomain dom, const char *msg)
{
    if (!s_mqttEnabled || !s_mqttPublisher || s_inMqttSink)
    {
        return;
    }
    if (s_mqttConnectedFn && !s_mqttConnectedFn())
    {
        return;
    }

    StaticJsonDocument<JSON_OBJECT_SIZE(4)> doc;
    doc["ts"] = tsSec;
    doc["lvl"] = kLevels[(uint8_t)lvl].json;
    doc["dom"] = kDomains[(uint8_t)dom].name;
    doc["msg"] = msg; // pointer stored; msg outlives serialization

    char buf[kJsonBufSize];
    const size_t written = serializeJson(doc, buf, sizeof(buf));
    if (written == 0 || written >= sizeof(buf))
    {
        return;
    }

    // A failing publish may log itself; do not recurse into the MQTT sink.
    s_inMqttSink = true;
    (void)s_mqttPublisher(kLogTopicSuffix, buf, false);
    s_inMqttSink = false;
}

static void emit(uint32_t nowMs, LogLevel lvl, LogDomain dom, const char *msg)
{
    const uint32_t tsSec = nowMs / 1000u;
    if (s_serialEnabled)
    {
        logToSerial(tsSec, lvl, dom, msg);
    }
    logToMqtt(tsSec, lvl, dom, msg);
}

void logger_begin(bool serialEnabled, bool mqttEnabled)
{
    s_serialEnabled = serialEnabled;
    s_mqttEnabled = mqttEnabled;
    memset(s_throttle, 0, sizeof(s_throttle));
}

void logger_setMinLevel(LogLevel lvl)
{
    s_minLevel = lvl;
}

void logger_setMqttEnabled(bool enabled)
{
    s_mqttEnabled = enabled;
}

void logger_setMqttPublisher(LoggerMqttPublishFn publishFn, LoggerMqttConnectedFn isConnectedFn)
{
    s_mqttPublisher = publishFn;
    s_mqttConnectedFn = isConnectedFn;
}

void logger_setHighFreqEnabled(bool enabled)
{
    if (s_highFreqEnabled == enabled)
    {
        return;
    }
    s_highFreqEnabled = enabled;
    logger_log(LogLevel::INFO, LogDomain::SYSTEM, "High-frequency logging %s", enabled ? "enabled" : "disabled");
}

bool logger_isHighFreqEnabled()
{
    return s_highFreqEnabled;
}

void logger_log(LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    if ((uint8_t)lvl < (uint8_t)s_minLevel)
    {
        return;
    }

    char msg[kMsgBufSize];
    va_list args;
    va_start(args, fmt);
    formatMessage(msg, sizeof(msg), fmt, args);
    va_end(args);

    emit(millis(), lvl, dom, msg);
}

void logger_logEvery(const char *key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    if (!s_highFreqEnabled || (uint8_t)lvl < (uint8_t)s_minLevel)
    {
        return;
    }

    const uint32_t now = millis();
    if (!throttleAllows(key, intervalMs, now))
    {
        return;
    }

    char msg[kMsgBufSize];
    va_list args;
    va_start(args, fmt);
    formatMessage(msg, sizeof(msg), fmt, args);
    va_end(args);

    emit(now, lvl, dom, msg);
}
