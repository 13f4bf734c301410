#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

// A single telemetry value: numeric, text or absent.
struct SensorValue {
    enum Kind { NONE, NUMBER, TEXT };

    Kind kind = NONE;
    double number = 0.0;
    std::string text;

    SensorValue() {}
    SensorValue(double v) : kind(NUMBER), number(v) {}
    SensorValue(int v) : kind(NUMBER), number(v) {}
    SensorValue(unsigned v) : kind(NUMBER), number(v) {}
    SensorValue(long long v) : kind(NUMBER), number(static_cast<double>(v)) {}
    SensorValue(const char* s) : kind(TEXT), text(s) {}
    SensorValue(const std::string& s) : kind(TEXT), text(s) {}

    bool isNumber() const { return kind == NUMBER; }
    bool isText() const { return kind == TEXT; }
    bool isNone() const { return kind == NONE; }

    bool operator==(const SensorValue& o) const {
        if (kind != o.kind) return false;
        if (kind == NUMBER) return number == o.number;
        if (kind == TEXT) return text == o.text;
        return true;
    }
    bool operator!=(const SensorValue& o) const { return !(*this == o); }
};

using SensorMap = std::map<std::string, SensorValue>;

enum class DeviceType { INVERTER, GRIDBOSS, PARALLEL_GROUP };

const char* deviceTypeName(DeviceType type);
bool parseDeviceType(const std::string& name, DeviceType& out);

// Which normalization table a raw payload belongs to.
enum class PayloadKind { RUNTIME, ENERGY, BATTERY_BANK, BATTERY, MIDBOX, PARALLEL_ENERGY };

// Raw fields exactly as the transport delivered them.
struct RawPayload {
    PayloadKind kind = PayloadKind::RUNTIME;
    SensorMap values;

    RawPayload() {}
    explicit RawPayload(PayloadKind k) : kind(k) {}

    bool has(const std::string& key) const { return values.find(key) != values.end(); }
    SensorValue get(const std::string& key) const {
        auto it = values.find(key);
        return it == values.end() ? SensorValue() : it->second;
    }
};

struct BatteryPayload {
    std::string battery_key;
    RawPayload payload{PayloadKind::BATTERY};
};

// Bank-level fields plus one entry per battery module.
struct BatteryReading {
    RawPayload bank{PayloadKind::BATTERY_BANK};
    std::vector<BatteryPayload> modules;
};

struct DeviceRecord {
    std::string serial;
    DeviceType type = DeviceType::INVERTER;
    std::string model;
    std::string firmware_version;
    SensorMap sensors;
    std::map<std::string, SensorMap> batteries;
    std::string error;

    bool hasError() const { return !error.empty(); }
};

struct StationRecord {
    std::string name;
    std::string country;
    std::string timezone;
    std::string address;
    double api_request_rate = 0.0;
    uint32_t api_requests_today = 0;
};

// Static description of how a device is reached.
struct RawInfo {
    std::string model;
    std::string transport;
    std::string endpoint;
};

struct Snapshot {
    std::map<std::string, DeviceRecord> devices;
    bool has_station = false;
    StationRecord station;
    std::map<std::string, RawInfo> device_info;
    uint32_t cycle = 0;
    bool stale = false;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;
