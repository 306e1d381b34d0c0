#pragma once
#include <stdint.h>
#include <stddef.h>

#include "device_state.h"

struct MqttConfig
{
    const char *host;
    int port;
    const char *clientId;
    const char *user;
    const char *pass;
    const char *topicNamespace; // e.g. "aquasmart"
    const char *deviceId;       // used in every per-device topic
};

using CommandHandlerFn = void (*)(const uint8_t *payload, size_t len);

// Begin MQTT with explicit config and command handler.
// Topics:
//   <ns>/sensors/<id>/data              telemetry (not retained)
//   <ns>/commands/filter                inbound commands (subscribed)
//   <ns>/commands/<id>/response         command responses (not retained)
//   <ns>/devices/<id>/availability      online/offline (retained, last will)
//   <ns>/devices/<id>/status            status snapshot (retained)
//   <ns>/devices/<id>/log               log sink (not retained)
void mqtt_begin(const MqttConfig &cfg, CommandHandlerFn cmdHandler);

// Call frequently from loop(); handles reconnect, keepalive and the retained status snapshot.
// Inbound commands are dispatched from inside this call.
void mqtt_tick(const StatusSnapshot &status);

// Force re-publish of the status snapshot (after a mutation or on reconnect).
void mqtt_requestStatePublish();
bool mqtt_takeStatePublishRequested();

// Telemetry: builds the reading payload and publishes it. Returns false when not delivered.
bool mqtt_publishReading(const SensorReading &r, const char *timestamp);

// Command response for this device. Returns false when not delivered.
bool mqtt_publishResponse(const CommandResponse &r);

// Publish a raw payload under <ns>/devices/<id>/<topicSuffix>.
bool mqtt_publishDeviceTopic(const char *topicSuffix, const char *payload, bool retained = false);

bool mqtt_isConnected();

const char *mqtt_stateToString(int state);
