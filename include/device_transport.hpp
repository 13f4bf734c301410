#pragma once
#include <stdint.h>
#include <string>
#include "types.hpp"

enum class TransportKind { CLOUD, MODBUS_TCP, WIFI_DONGLE };

const char* transportKindName(TransportKind kind);

// Capability contract shared by the cloud, Modbus TCP and dongle drivers.
// Every call may throw a TransportException subclass (see exceptions.hpp).
class DeviceTransport {
public:
    virtual ~DeviceTransport() {}

    virtual TransportKind kind() const = 0;
    // Human readable endpoint for diagnostics (host:port or base url).
    virtual std::string endpoint() const = 0;
    // True when concurrent calls from several devices are safe.
    virtual bool isSessionSafe() const = 0;
    // True when the connection should be kept open between poll cycles.
    virtual bool keepsSession() const = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual RawPayload readRuntime(const std::string& serial) = 0;
    virtual RawPayload readEnergy(const std::string& serial) = 0;
    virtual BatteryReading readBattery(const std::string& serial) = 0;
    virtual RawPayload readMidbox(const std::string& serial) = 0;
    virtual RawPayload readParallelEnergy(const std::string& master_serial) = 0;
    virtual int readDeviceType(const std::string& serial) = 0;
    virtual std::string readFirmwareVersion(const std::string& serial) = 0;
    virtual uint16_t readParallelConfig(const std::string& serial) = 0;
};
