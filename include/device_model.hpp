#pragma once
#include <stdint.h>
#include <string>
#include "config_manager.hpp"
#include "device_transport.hpp"
#include "types.hpp"

constexpr const char* FIRMWARE_FALLBACK = "1.0.0";

// Everything one poll cycle read for a single device.
struct DeviceReadings {
    RawPayload runtime{PayloadKind::RUNTIME};
    RawPayload energy{PayloadKind::ENERGY};
    BatteryReading battery;
    RawPayload midbox{PayloadKind::MIDBOX};
    RawPayload parallel_energy{PayloadKind::PARALLEL_ENERGY};
    bool has_parallel_config = false;
    uint16_t parallel_config = 0;
};

class DeviceModel {
public:
    static DeviceRecord assemble(const DeviceConfig& config, TransportKind transport, const DeviceReadings& readings);
    // Placeholder record for a device whose poll failed; sensors stay empty.
    static DeviceRecord errored(const DeviceConfig& config, const std::string& error);

    static std::string cleanBatteryKey(const std::string& raw_key, const std::string& parent_serial);
    static bool includePhaseSensor(const DeviceConfig& config, const std::string& sensor_key);
    static std::string defaultModel(const DeviceConfig& config);

    static void addGridPower(SensorMap& sensors);
    static void addGridBossAggregates(SensorMap& sensors);
    static void dropUnusedSmartPorts(SensorMap& sensors);
    static void decodeParallelConfig(uint16_t raw, SensorMap& sensors);
};
