#include "../include/types.hpp"
#include "../include/exceptions.hpp"
#include "../include/device_transport.hpp"

const char* deviceTypeName(DeviceType type) {
    switch (type) {
        case DeviceType::INVERTER: return "inverter";
        case DeviceType::GRIDBOSS: return "gridboss";
        case DeviceType::PARALLEL_GROUP: return "parallel_group";
    }
    return "inverter";
}

bool parseDeviceType(const std::string& name, DeviceType& out) {
    if (name == "inverter") { out = DeviceType::INVERTER; return true; }
    if (name == "gridboss") { out = DeviceType::GRIDBOSS; return true; }
    if (name == "parallel_group") { out = DeviceType::PARALLEL_GROUP; return true; }
    return false;
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ERR_NONE: return "none";
        case ERR_AUTH: return "auth";
        case ERR_CONNECTION: return "connection";
        case ERR_TIMEOUT: return "timeout";
        case ERR_DECODING: return "decoding";
        case ERR_MODBUS_CRC: return "modbus_crc";
        case ERR_MODBUS_EXCEPTION: return "modbus_exception";
        case ERR_UNSUPPORTED: return "unsupported";
        case ERR_API: return "api";
        case ERR_VALIDATION: return "validation";
        case ERR_CONFIG: return "config";
        case ERR_UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* transportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::CLOUD: return "cloud";
        case TransportKind::MODBUS_TCP: return "modbus_tcp";
        case TransportKind::WIFI_DONGLE: return "wifi_dongle";
    }
    return "cloud";
}
