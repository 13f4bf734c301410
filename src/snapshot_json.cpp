#include "../include/snapshot_json.hpp"
#include "../include/monotonic_state.hpp"
#include <ArduinoJson.h>

// Absent values are left out.
static void writeSensors(JsonObject out, const SensorMap& sensors) {
    for (const auto& kv : sensors) {
        if (kv.second.isNumber()) {
            out[kv.first] = kv.second.number;
        } else if (kv.second.isText()) {
            out[kv.first] = kv.second.text;
        }
    }
}

static size_t capacityFor(const Snapshot& snapshot) {
    size_t cap = 2048;
    for (const auto& kv : snapshot.devices) {
        cap += 512 + kv.second.sensors.size() * 96;
        for (const auto& bat : kv.second.batteries) cap += 256 + bat.second.size() * 96;
    }
    return cap + snapshot.device_info.size() * 256;
}

Snapshot exposeSnapshot(const Snapshot& snapshot, MonotonicStateTracker& tracker) {
    Snapshot out = snapshot;
    for (auto& kv : out.devices) kv.second = tracker.exposeDevice(kv.second);
    return out;
}

std::string snapshotToJson(const Snapshot& snapshot) {
    DynamicJsonDocument doc(capacityFor(snapshot));
    doc["cycle"] = snapshot.cycle;
    doc["stale"] = snapshot.stale;

    JsonObject devices = doc.createNestedObject("devices");
    for (const auto& kv : snapshot.devices) {
        const DeviceRecord& rec = kv.second;
        JsonObject dev = devices.createNestedObject(kv.first);
        dev["type"] = deviceTypeName(rec.type);
        dev["model"] = rec.model;
        dev["firmware_version"] = rec.firmware_version;
        writeSensors(dev.createNestedObject("sensors"), rec.sensors);
        JsonObject batteries = dev.createNestedObject("batteries");
        for (const auto& bat : rec.batteries) {
            writeSensors(batteries.createNestedObject(bat.first), bat.second);
        }
        if (rec.hasError()) dev["error"] = rec.error;
    }

    if (snapshot.has_station) {
        JsonObject st = doc.createNestedObject("station");
        st["name"] = snapshot.station.name;
        st["country"] = snapshot.station.country;
        st["timezone"] = snapshot.station.timezone;
        st["address"] = snapshot.station.address;
        st["api_request_rate"] = snapshot.station.api_request_rate;
        st["api_requests_today"] = snapshot.station.api_requests_today;
    }

    JsonObject info = doc.createNestedObject("device_info");
    for (const auto& kv : snapshot.device_info) {
        JsonObject d = info.createNestedObject(kv.first);
        d["model"] = kv.second.model;
        d["transport"] = kv.second.transport;
        d["endpoint"] = kv.second.endpoint;
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}
