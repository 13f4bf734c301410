#include "../include/device_model.hpp"
#include "../include/field_mapper.hpp"
#include "../include/logger.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <set>

static const std::set<std::string>& splitPhaseOnly() {
    static const std::set<std::string> keys = {
        "eps_power_l1", "eps_power_l2", "eps_voltage_l1", "eps_voltage_l2",
        "grid_voltage_l1", "grid_voltage_l2", "output_power",
    };
    return keys;
}

static const std::set<std::string>& threePhaseOnly() {
    static const std::set<std::string> keys = {
        "grid_voltage_r", "grid_voltage_s", "grid_voltage_t",
        "grid_current_l1", "grid_current_l2", "grid_current_l3",
        "eps_voltage_r", "eps_voltage_s", "eps_voltage_t",
    };
    return keys;
}

static bool numberOf(const SensorMap& sensors, const std::string& key, double& out) {
    auto it = sensors.find(key);
    if (it == sensors.end() || !it->second.isNumber()) return false;
    out = it->second.number;
    return true;
}

// Sums key_l1 and key_l2 into target when at least one phase is present.
static void sumPhases(SensorMap& sensors, const std::string& l1, const std::string& l2, const std::string& target) {
    double a = 0.0, b = 0.0;
    bool has_a = numberOf(sensors, l1, a);
    bool has_b = numberOf(sensors, l2, b);
    if (has_a || has_b) sensors[target] = SensorValue((has_a ? a : 0.0) + (has_b ? b : 0.0));
}

static bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!isdigit((unsigned char)c)) return false;
    }
    return true;
}

std::string DeviceModel::cleanBatteryKey(const std::string& raw_key, const std::string& parent_serial) {
    if (raw_key.empty()) return "01";
    static const std::string marker = "_Battery_ID_";
    size_t pos = raw_key.find(marker);
    if (pos != std::string::npos && pos > 0) {
        return raw_key.substr(0, pos) + "-" + raw_key.substr(pos + marker.size());
    }
    static const std::string bare = "Battery_ID_";
    if (raw_key.compare(0, bare.size(), bare) == 0) {
        return parent_serial + "-" + raw_key.substr(bare.size());
    }
    if (allDigits(raw_key) && raw_key.size() <= 2) {
        char buf[8];
        snprintf(buf, sizeof(buf), "%02d", atoi(raw_key.c_str()));
        return parent_serial + "-" + buf;
    }
    std::string out = raw_key;
    for (auto& c : out) {
        if (c == '_') c = '-';
    }
    return out;
}

bool DeviceModel::includePhaseSensor(const DeviceConfig& config, const std::string& sensor_key) {
    if (config.type != DeviceType::INVERTER) return true;
    if (splitPhaseOnly().count(sensor_key)) return config.supports_split_phase != Tristate::NO;
    if (threePhaseOnly().count(sensor_key)) return config.supports_three_phase != Tristate::NO;
    return true;
}

std::string DeviceModel::defaultModel(const DeviceConfig& config) {
    if (!config.model.empty()) return config.model;
    switch (config.type) {
        case DeviceType::GRIDBOSS: return "GridBOSS";
        case DeviceType::PARALLEL_GROUP: {
            // parallel_group_a -> "Parallel Group A"
            std::string letter = "A";
            size_t us = config.serial.find_last_of('_');
            if (us != std::string::npos && us + 1 < config.serial.size()) {
                letter = config.serial.substr(us + 1);
                for (auto& c : letter) c = (char)toupper((unsigned char)c);
            }
            return "Parallel Group " + letter;
        }
        case DeviceType::INVERTER: break;
    }
    return "Inverter";
}

void DeviceModel::addGridPower(SensorMap& sensors) {
    double to_user = 0.0, to_grid = 0.0;
    if (numberOf(sensors, "grid_import_power", to_user) && numberOf(sensors, "grid_export_power", to_grid)) {
        sensors["grid_power"] = SensorValue(to_user - to_grid);
    }
}

void DeviceModel::addGridBossAggregates(SensorMap& sensors) {
    static const char* const power[] = {"grid_power", "ups_power", "load_power", "generator_power"};
    for (const char* base : power) {
        std::string b(base);
        sumPhases(sensors, b + "_l1", b + "_l2", b);
    }
    static const char* const energy[] = {"ups", "grid_export", "grid_import", "load"};
    for (const char* base : energy) {
        std::string b(base);
        sumPhases(sensors, b + "_l1", b + "_l2", b + "_today");
        sumPhases(sensors, b + "_lifetime_l1", b + "_lifetime_l2", b + "_total");
    }

    double smart_total = 0.0;
    bool any_smart = false;
    for (int port = 1; port <= 4; ++port) {
        std::string n = std::to_string(port);
        std::string sl = "smart_load" + n;
        std::string ac = "ac_couple" + n;
        sumPhases(sensors, sl + "_power_l1", sl + "_power_l2", sl + "_power");
        sumPhases(sensors, sl + "_l1", sl + "_l2", sl + "_today");
        sumPhases(sensors, sl + "_lifetime_l1", sl + "_lifetime_l2", sl + "_total");
        sumPhases(sensors, ac + "_l1", ac + "_l2", ac + "_today");
        sumPhases(sensors, ac + "_lifetime_l1", ac + "_lifetime_l2", ac + "_total");

        auto status = sensors.find("smart_port" + n + "_status");
        double port_power = 0.0;
        if (status != sensors.end() && status->second.isText() && status->second.text == "Smart Load" &&
            numberOf(sensors, sl + "_power", port_power)) {
            smart_total += port_power;
            any_smart = true;
        }
    }
    if (any_smart) sensors["smart_load_power"] = SensorValue(smart_total);
}

void DeviceModel::dropUnusedSmartPorts(SensorMap& sensors) {
    for (int port = 1; port <= 4; ++port) {
        std::string n = std::to_string(port);
        auto status = sensors.find("smart_port" + n + "_status");
        if (status == sensors.end() || !status->second.isText() || status->second.text != "Unused") continue;
        std::string sl = "smart_load" + n + "_";
        std::string ac = "ac_couple" + n + "_";
        for (auto it = sensors.begin(); it != sensors.end();) {
            if (it->first.compare(0, sl.size(), sl) == 0 || it->first.compare(0, ac.size(), ac) == 0) {
                it = sensors.erase(it);
            } else {
                ++it;
            }
        }
    }
}

void DeviceModel::decodeParallelConfig(uint16_t raw, SensorMap& sensors) {
    static const char* const roles[] = {"Standalone", "Master", "Slave", "3-Phase Master"};
    sensors["parallel_role"] = SensorValue(roles[raw & 0x03]);
    sensors["parallel_phase"] = SensorValue((int)((raw >> 2) & 0x03));
    sensors["parallel_number"] = SensorValue((int)(raw >> 8));
}

static void merge(SensorMap& into, const SensorMap& from) {
    for (const auto& kv : from) into[kv.first] = kv.second;
}

static std::string firmwareFrom(const RawPayload& payload) {
    SensorValue fw = payload.get("fwCode");
    if (fw.isText() && !fw.text.empty()) return fw.text;
    return "";
}

DeviceRecord DeviceModel::assemble(const DeviceConfig& config, TransportKind transport, const DeviceReadings& readings) {
    DeviceRecord record;
    record.serial = config.serial;
    record.type = config.type;
    record.model = defaultModel(config);

    SensorMap sensors;
    std::string firmware;
    switch (config.type) {
        case DeviceType::INVERTER: {
            merge(sensors, FieldMapper::normalize(transport, readings.runtime));
            merge(sensors, FieldMapper::normalize(transport, readings.energy));
            merge(sensors, FieldMapper::normalize(transport, readings.battery.bank));
            addGridPower(sensors);
            if (readings.has_parallel_config) decodeParallelConfig(readings.parallel_config, sensors);
            firmware = firmwareFrom(readings.runtime);

            for (const auto& module : readings.battery.modules) {
                std::string key = cleanBatteryKey(module.battery_key, config.serial);
                SensorMap bat = FieldMapper::normalize(transport, module.payload);
                double vmax = 0.0, vmin = 0.0;
                if (numberOf(bat, "battery_cell_voltage_max", vmax) && numberOf(bat, "battery_cell_voltage_min", vmin)) {
                    bat["battery_cell_voltage_delta"] = SensorValue(vmax - vmin);
                }
                if (record.batteries.count(key)) {
                    Logger::warn("[Model] %s: duplicate battery key %s", config.serial.c_str(), key.c_str());
                }
                record.batteries[key] = bat;
            }
            break;
        }
        case DeviceType::GRIDBOSS:
            merge(sensors, FieldMapper::normalize(transport, readings.midbox));
            addGridBossAggregates(sensors);
            dropUnusedSmartPorts(sensors);
            firmware = firmwareFrom(readings.midbox);
            break;
        case DeviceType::PARALLEL_GROUP:
            merge(sensors, FieldMapper::normalize(transport, readings.parallel_energy));
            break;
    }

    for (const auto& kv : sensors) {
        if (includePhaseSensor(config, kv.first)) record.sensors.insert(kv);
    }
    record.firmware_version = firmware.empty() ? FIRMWARE_FALLBACK : firmware;
    return record;
}

DeviceRecord DeviceModel::errored(const DeviceConfig& config, const std::string& error) {
    DeviceRecord record;
    record.serial = config.serial;
    record.type = config.type;
    record.model = defaultModel(config);
    record.firmware_version = FIRMWARE_FALLBACK;
    record.error = error.empty() ? "unknown error" : error;
    return record;
}
