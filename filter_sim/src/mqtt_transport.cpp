#include <WiFi.h>
#include <PubSubClient.h>
#include <Arduino.h>
#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <freertos/FreeRTOS.h>

#include "mqtt_transport.h"
#include "payload_json.h"
#include "logger.h"

#ifdef __has_include
#if __has_include("config.h")
#include "config.h"
#endif
#endif

#ifndef CFG_LOG_DEV
#define CFG_LOG_DEV 0
#endif

static WiFiClient wifiClient;
static PubSubClient mqtt(wifiClient);

static MqttConfig s_cfg{};
static CommandHandlerFn s_cmdHandler = nullptr;
static bool s_initialized = false;
static bool s_statePublishRequested = true;
static portMUX_TYPE s_statePublishMux = portMUX_INITIALIZER_UNLOCKED;

struct Topics
{
    char data[96];
    char cmd[64];
    char response[96];
    char deviceBase[96];
    char avail[112];
    char status[112];
};
static Topics s_topics{};

static constexpr size_t kPayloadBufSize = 512;
static constexpr uint16_t kClientBufferSize = 1024;
static constexpr uint32_t STATE_MIN_INTERVAL_MS = 1000; // no more than once per second
static constexpr uint32_t STATE_HEARTBEAT_MS = 30000;   // periodic retained snapshot
static constexpr uint32_t RETRY_INTERVAL_MS = 5000;
static constexpr uint32_t kPublishWarnThrottleMs = 5000;

static uint32_t s_lastStatePublishMs = 0;
static uint32_t s_lastAttemptMs = 0;
static bool s_seenConnectFailure = false;
static bool s_lastConnected = false;

static const char *AVAIL_ONLINE = "online";
static const char *AVAIL_OFFLINE = "offline";

const char *mqtt_stateToString(int state)
{
    switch (state)
    {
    case -4:
        return "MQTT_CONNECTION_TIMEOUT";
    case -3:
        return "MQTT_CONNECTION_LOST";
    case -2:
        return "MQTT_CONNECT_FAILED";
    case -1:
        return "MQTT_DISCONNECTED";
    case 0:
        return "MQTT_CONNECTED";
    case 1:
        return "MQTT_CONNECT_BAD_PROTOCOL";
    case 2:
        return "MQTT_CONNECT_BAD_CLIENT_ID";
    case 3:
        return "MQTT_CONNECT_UNAVAILABLE";
    case 4:
        return "MQTT_CONNECT_BAD_CREDENTIALS";
    case 5:
        return "MQTT_CONNECT_UNAUTHORIZED";
    default:
        return "unknown";
    }
}

static void buildPayloadPreview(const uint8_t *payload, size_t len, char *out, size_t outSize)
{
    const size_t n = len < outSize - 1 ? len : outSize - 1;
    for (size_t i = 0; i < n; ++i)
    {
        const unsigned char c = payload[i];
        out[i] = (isprint(c) && c != '\n' && c != '\r') ? (char)c : '.';
    }
    out[n] = '\0';
}

static bool buildTopics()
{
    const char *ns = s_cfg.topicNamespace;
    const char *id = s_cfg.deviceId;
    bool ok = true;
    ok &= snprintf(s_topics.data, sizeof(s_topics.data), "%s/sensors/%s/data", ns, id) < (int)sizeof(s_topics.data);
    ok &= snprintf(s_topics.cmd, sizeof(s_topics.cmd), "%s/commands/filter", ns) < (int)sizeof(s_topics.cmd);
    ok &= snprintf(s_topics.response, sizeof(s_topics.response), "%s/commands/%s/response", ns, id) < (int)sizeof(s_topics.response);
    ok &= snprintf(s_topics.deviceBase, sizeof(s_topics.deviceBase), "%s/devices/%s", ns, id) < (int)sizeof(s_topics.deviceBase);
    ok &= snprintf(s_topics.avail, sizeof(s_topics.avail), "%s/availability", s_topics.deviceBase) < (int)sizeof(s_topics.avail);
    ok &= snprintf(s_topics.status, sizeof(s_topics.status), "%s/status", s_topics.deviceBase) < (int)sizeof(s_topics.status);
    return ok;
}

static void warnPublishFailed(const char *key, const char *topic, size_t bytes)
{
    const int stateCode = mqtt.state();
    logger_logEvery(key, kPublishWarnThrottleMs, LogLevel::WARN, LogDomain::MQTT,
                    "MQTT publish failed topic=%s bytes=%u state=%d (%s)",
                    topic, (unsigned)bytes, stateCode, mqtt_stateToString(stateCode));
}

static void mqttCallback(char *topic, byte *payload, unsigned int length)
{
    if (!s_cmdHandler || !topic || strcmp(topic, s_topics.cmd) != 0)
        return;

    // PubSubClient reuses its receive buffer for outgoing packets; any publish (including the
    // MQTT log sink and the command responses) would overwrite `payload`. Copy first.
    static uint8_t cmdBuf[512];
    if (length == 0 || length >= sizeof(cmdBuf))
    {
        LOG_WARN(LogDomain::COMMAND, "Command rejected: bad payload length len=%u", length);
        return;
    }
    memcpy(cmdBuf, payload, length);

    char preview[97];
    buildPayloadPreview(cmdBuf, length, preview, sizeof(preview));
    LOG_INFO(LogDomain::COMMAND, "Received command on %s (len=%u): %s", s_topics.cmd, length, preview);

    s_cmdHandler(cmdBuf, length);
}

static bool ensureConnected()
{
    if (!s_initialized)
    {
        return false;
    }

    const uint32_t now = millis();
    if (mqtt.connected())
    {
        s_lastConnected = true;
        mqtt.loop();
        return true;
    }

    if (s_lastConnected)
    {
        const int state = mqtt.state();
        LOG_WARN(LogDomain::MQTT, "MQTT disconnected state=%d (%s)", state, mqtt_stateToString(state));
        s_lastConnected = false;
    }

    if (WiFi.status() != WL_CONNECTED || (uint32_t)(now - s_lastAttemptMs) < RETRY_INTERVAL_MS)
    {
        return false;
    }
    s_lastAttemptMs = now;

    const bool hasUser = (s_cfg.user && s_cfg.user[0] != '\0');
    LOG_INFO_EVERY("mqtt_connecting", 30000, LogDomain::MQTT,
                   "MQTT connecting host=%s port=%d clientId=%s auth=%s",
                   s_cfg.host, s_cfg.port, s_cfg.clientId, hasUser ? "user" : "none");

    const bool ok = mqtt.connect(s_cfg.clientId,
                                 hasUser ? s_cfg.user : nullptr,
                                 hasUser ? s_cfg.pass : nullptr,
                                 s_topics.avail, 1, true, AVAIL_OFFLINE);
    if (!ok)
    {
        const int state = mqtt.state();
        if (!s_seenConnectFailure)
        {
            s_seenConnectFailure = true;
            LOG_WARN(LogDomain::MQTT, "MQTT connect failed state=%d (%s)", state, mqtt_stateToString(state));
        }
        LOG_WARN_EVERY("mqtt_connect_fail", 30000, LogDomain::MQTT,
                       "MQTT connect failed state=%d (%s)", state, mqtt_stateToString(state));
        if (state == 4 || state == 5)
        {
            LOG_WARN_EVERY("mqtt_connect_auth_hint", 30000, LogDomain::MQTT,
                           "Check MQTT_USER/MQTT_PASS (secrets.h) and broker ACL");
        }
        return false;
    }

    s_seenConnectFailure = false;
    s_lastConnected = true;
    if (!mqtt.publish(s_topics.avail, AVAIL_ONLINE, true))
    {
        warnPublishFailed("mqtt_publish_avail_fail", s_topics.avail, strlen(AVAIL_ONLINE));
    }
    if (mqtt.subscribe(s_topics.cmd, 1))
    {
        LOG_INFO(LogDomain::MQTT, "MQTT connected; subscribed cmdTopic=%s", s_topics.cmd);
    }
    else
    {
        LOG_WARN(LogDomain::MQTT, "MQTT subscribe failed topic=%s", s_topics.cmd);
    }
    mqtt_requestStatePublish(); // fresh retained snapshot after reconnect
    mqtt.loop();
    return true;
}

static bool publishStatus(const StatusSnapshot &status)
{
    char buf[kPayloadBufSize];
    const PayloadJsonError err = buildStatusJson(status, buf, sizeof(buf));
    if (err != PayloadJsonError::OK)
    {
        LOG_WARN_EVERY("status_build_fail", kPublishWarnThrottleMs, LogDomain::MQTT,
                       "Skipping status publish: %s", payloadJsonErrorString(err));
        return false;
    }

    const bool ok = mqtt.publish(s_topics.status, buf, true);
    if (ok)
    {
        s_lastStatePublishMs = millis();
        LOG_DEBUG_EVERY("status_publish", 5000, LogDomain::MQTT, "Publish status topic=%s bytes=%u",
                        s_topics.status, (unsigned)strlen(buf));
    }
    else
    {
        warnPublishFailed("mqtt_publish_status_fail", s_topics.status, strlen(buf));
    }
    return ok;
}

void mqtt_begin(const MqttConfig &cfg, CommandHandlerFn cmdHandler)
{
    s_cfg = cfg;
    s_cmdHandler = cmdHandler;
    if (!buildTopics())
    {
        LOG_ERROR(LogDomain::MQTT, "MQTT topic too long ns=%s id=%s; transport disabled", cfg.topicNamespace, cfg.deviceId);
        return;
    }

    mqtt.setServer(cfg.host, cfg.port);
    mqtt.setKeepAlive(30);
    mqtt.setSocketTimeout(5);
    mqtt.setBufferSize(kClientBufferSize);
    mqtt.setCallback(mqttCallback);
    s_initialized = true;

    logger_setMqttPublisher(mqtt_publishDeviceTopic, mqtt_isConnected);

    LOG_INFO(LogDomain::MQTT, "MQTT init dataTopic=%s cmdTopic=%s responseTopic=%s",
             s_topics.data, s_topics.cmd, s_topics.response);
    if (CFG_LOG_DEV == 0 && (!s_cfg.user || s_cfg.user[0] == '\0'))
    {
        LOG_WARN(LogDomain::MQTT, "MQTT credentials not set (MQTT_USER empty). Broker may reject connection.");
    }
}

void mqtt_tick(const StatusSnapshot &status)
{
    if (!ensureConnected())
        return;

    const uint32_t sinceLast = millis() - s_lastStatePublishMs;
    const bool heartbeatDue = sinceLast >= STATE_HEARTBEAT_MS;
    const bool intervalOk = sinceLast >= STATE_MIN_INTERVAL_MS;
    const bool requested = mqtt_takeStatePublishRequested();

    if ((requested || heartbeatDue) && intervalOk)
    {
        if (!publishStatus(status) && requested)
        {
            mqtt_requestStatePublish();
        }
    }
    else if (requested)
    {
        // Keep explicit requests pending until the rate limit permits sending.
        mqtt_requestStatePublish();
    }
}

void mqtt_requestStatePublish()
{
    portENTER_CRITICAL(&s_statePublishMux);
    s_statePublishRequested = true;
    portEXIT_CRITICAL(&s_statePublishMux);
}

bool mqtt_takeStatePublishRequested()
{
    portENTER_CRITICAL(&s_statePublishMux);
    const bool requested = s_statePublishRequested;
    s_statePublishRequested = false;
    portEXIT_CRITICAL(&s_statePublishMux);
    return requested;
}

bool mqtt_publishReading(const SensorReading &r, const char *timestamp)
{
    if (!mqtt.connected())
        return false;

    char buf[kPayloadBufSize];
    const PayloadJsonError err = buildReadingJson(r, s_cfg.deviceId, timestamp, buf, sizeof(buf));
    if (err != PayloadJsonError::OK)
    {
        LOG_WARN_EVERY("reading_build_fail", kPublishWarnThrottleMs, LogDomain::SIM,
                       "Skipping reading publish: %s", payloadJsonErrorString(err));
        return false;
    }

    const bool ok = mqtt.publish(s_topics.data, buf, false);
    if (!ok)
    {
        warnPublishFailed("mqtt_publish_data_fail", s_topics.data, strlen(buf));
    }
    return ok;
}

bool mqtt_publishResponse(const CommandResponse &r)
{
    if (!mqtt.connected())
        return false;

    char buf[kPayloadBufSize];
    const PayloadJsonError err = buildResponseJson(r, buf, sizeof(buf));
    if (err != PayloadJsonError::OK)
    {
        LOG_WARN(LogDomain::COMMAND, "Skipping response publish: %s", payloadJsonErrorString(err));
        return false;
    }

    const bool ok = mqtt.publish(s_topics.response, buf, false);
    if (!ok)
    {
        warnPublishFailed("mqtt_publish_response_fail", s_topics.response, strlen(buf));
    }
    return ok;
}

bool mqtt_publishDeviceTopic(const char *topicSuffix, const char *payload, bool retained)
{
    if (!mqtt.connected() || !payload)
        return false;

    char topic[128];
    const int n = (topicSuffix == nullptr || topicSuffix[0] == '\0')
                      ? snprintf(topic, sizeof(topic), "%s", s_topics.deviceBase)
                      : snprintf(topic, sizeof(topic), "%s/%s", s_topics.deviceBase, topicSuffix);
    if (n < 0 || n >= (int)sizeof(topic))
    {
        return false;
    }
    const bool ok = mqtt.publish(topic, payload, retained);
    if (!ok)
    {
        warnPublishFailed("mqtt_publish_device_fail", topic, strlen(payload));
    }
    return ok;
}

bool mqtt_isConnected()
{
    return mqtt.connected();
}
