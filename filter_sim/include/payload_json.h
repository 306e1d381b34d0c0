#pragma once
#include <stddef.h>
#include <stdint.h>
#include "device_state.h"

enum class PayloadJsonError : uint8_t
{
    OK = 0,
    OUT_TOO_SMALL,
    DOC_OVERFLOW,
    SERIALIZE_FAILED
};

// Telemetry payload for <namespace>/sensors/<device_id>/data.
// Sensor values are rounded here (flow/ph/turbidity 2 dp, tds 1 dp); the reading itself stays unrounded.
PayloadJsonError buildReadingJson(const SensorReading &r,
                                  const char *deviceId,
                                  const char *timestamp,
                                  char *outBuf,
                                  size_t outSize);

// Command response payload for <namespace>/commands/<device_id>/response.
PayloadJsonError buildResponseJson(const CommandResponse &r, char *outBuf, size_t outSize);

// Retained status snapshot for <namespace>/devices/<device_id>/status.
PayloadJsonError buildStatusJson(const StatusSnapshot &s, char *outBuf, size_t outSize);

const char *payloadJsonErrorString(PayloadJsonError err);
