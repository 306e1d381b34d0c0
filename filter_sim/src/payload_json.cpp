#include "payload_json.h"

#include <ArduinoJson.h>
#include <math.h>
#include "domain_strings.h"

namespace
{
static double roundTo(double value, int decimals)
{
    double scale = 1.0;
    for (int i = 0; i < decimals; ++i)
    {
        scale *= 10.0;
    }
    return round(value * scale) / scale;
}

// Shared tail of every builder: size checks, then serialize into outBuf (null-terminated).
template <typename TDoc>
static PayloadJsonError finish(TDoc &doc, char *outBuf, size_t outSize)
{
    if (doc.overflowed())
    {
        outBuf[0] = '\0';
        return PayloadJsonError::DOC_OVERFLOW;
    }

    const size_t required = measureJson(doc);
    if (required >= outSize)
    {
        outBuf[0] = '\0';
        return PayloadJsonError::OUT_TOO_SMALL;
    }

    const size_t written = serializeJson(doc, outBuf, outSize);
    if (written == 0 || written >= outSize)
    {
        outBuf[0] = '\0';
        return PayloadJsonError::SERIALIZE_FAILED;
    }
    outBuf[written] = '\0';
    return PayloadJsonError::OK;
}
} // namespace

// Contract: outBuf must be non-null and outSize must allow a null-terminated JSON payload.
PayloadJsonError buildReadingJson(const SensorReading &r,
                                  const char *deviceId,
                                  const char *timestamp,
                                  char *outBuf,
                                  size_t outSize)
{
    // root: device_id, filter_mode, timestamp, flow, ph, turbidity, tds, _meta
    // _meta: filtration_active, processed_volume, target_volume, progress, elapsed_minutes
    static constexpr size_t kRootMembers = 8;
    static constexpr size_t kMetaMembers = 5;
    static constexpr size_t kCapacity = JSON_OBJECT_SIZE(kRootMembers) + JSON_OBJECT_SIZE(kMetaMembers);

    if (!outBuf || outSize == 0)
    {
        return PayloadJsonError::OUT_TOO_SMALL;
    }
    outBuf[0] = '\0';

    StaticJsonDocument<kCapacity> doc;
    doc["device_id"] = deviceId ? deviceId : "";
    doc["filter_mode"] = toString(r.mode);
    doc["timestamp"] = timestamp ? timestamp : "";
    doc["flow"] = roundTo(r.flow, 2);
    doc["ph"] = roundTo(r.ph, 2);
    doc["turbidity"] = roundTo(r.turbidity, 2);
    doc["tds"] = roundTo(r.tds, 1);

    if (r.hasProgress)
    {
        JsonObject meta = doc.createNestedObject("_meta");
        meta["filtration_active"] = true;
        meta["processed_volume"] = roundTo(r.progress.processedVolume, 2);
        meta["target_volume"] = r.progress.targetVolume;
        meta["progress"] = roundTo(r.progress.progressPercent, 1);
        meta["elapsed_minutes"] = roundTo(r.progress.elapsedMinutes, 1);
    }

    return finish(doc, outBuf, outSize);
}

PayloadJsonError buildResponseJson(const CommandResponse &r, char *outBuf, size_t outSize)
{
    if (!outBuf || outSize == 0)
    {
        return PayloadJsonError::OUT_TOO_SMALL;
    }
    outBuf[0] = '\0';

    StaticJsonDocument<JSON_OBJECT_SIZE(4)> doc;
    doc["command"] = (const char *)r.command;
    doc["status"] = toString(r.status);
    doc["message"] = (const char *)r.message;
    doc["timestamp"] = (const char *)r.timestamp;

    return finish(doc, outBuf, outSize);
}

PayloadJsonError buildStatusJson(const StatusSnapshot &s, char *outBuf, size_t outSize)
{
    static constexpr size_t kMembers = 13;

    if (!outBuf || outSize == 0)
    {
        return PayloadJsonError::OUT_TOO_SMALL;
    }
    outBuf[0] = '\0';

    StaticJsonDocument<JSON_OBJECT_SIZE(kMembers)> doc;
    doc["schema"] = TELEMETRY_SCHEMA_VERSION;
    doc["device_id"] = s.deviceId ? s.deviceId : "";
    doc["fw_version"] = s.fwVersion ? s.fwVersion : "";
    doc["mode"] = toString(s.process.mode);
    doc["active"] = s.process.active;
    doc["processed_volume"] = roundTo(s.process.processedVolume, 2);
    doc["target_volume"] = s.process.targetVolume;
    doc["runs"] = s.process.runCount;
    doc["readings"] = s.readings;
    doc["faults"] = s.faults;
    doc["running"] = s.running;
    doc["scenario"] = s.scenarioRunning;
    doc["uptime_s"] = s.uptimeSeconds;

    return finish(doc, outBuf, outSize);
}

const char *payloadJsonErrorString(PayloadJsonError err)
{
    switch (err)
    {
    case PayloadJsonError::OK:
        return "ok";
    case PayloadJsonError::OUT_TOO_SMALL:
        return "out_too_small";
    case PayloadJsonError::DOC_OVERFLOW:
        return "doc_overflow";
    case PayloadJsonError::SERIALIZE_FAILED:
        return "serialize_failed";
    }
    return "unknown";
}
