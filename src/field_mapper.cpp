#include "../include/field_mapper.hpp"
#include <cstdlib>
#include <cmath>

namespace {

const char* const ENERGY_BASES[] = {"Yielding", "Discharging", "Charging"};
const char* const ENERGY_KEYS[] = {"yield", "discharging", "charging"};

std::vector<FieldRule> buildCloudRuntime() {
    std::vector<FieldRule> r = {
        {"status", "status_code", ScaleOp::IDENTITY},
        {"statusText", "status_text", ScaleOp::IDENTITY},
        {"pinv", "ac_power", ScaleOp::IDENTITY},
        {"ppv", "pv_total_power", ScaleOp::IDENTITY},
        {"ppv1", "pv1_power", ScaleOp::IDENTITY},
        {"ppv2", "pv2_power", ScaleOp::IDENTITY},
        {"ppv3", "pv3_power", ScaleOp::IDENTITY},
        {"pCharge", "battery_charge_power", ScaleOp::IDENTITY},
        {"pDisCharge", "battery_discharge_power", ScaleOp::IDENTITY},
        {"batPower", "battery_power", ScaleOp::IDENTITY},
        {"batStatus", "battery_status", ScaleOp::IDENTITY},
        {"consumptionPower", "consumption_power", ScaleOp::IDENTITY},
        {"pToUser", "grid_import_power", ScaleOp::IDENTITY},
        {"pToGrid", "grid_export_power", ScaleOp::IDENTITY},
        {"peps", "eps_power", ScaleOp::IDENTITY},
        {"acVoltage", "ac_voltage", ScaleOp::DIV_10},
        {"dcVoltage", "dc_voltage", ScaleOp::DIV_10},
        {"vacr", "ac_voltage", ScaleOp::DIV_10},
        {"vacs", "grid_voltage_s", ScaleOp::DIV_10},
        {"vact", "grid_voltage_t", ScaleOp::DIV_10},
        {"vepsr", "eps_voltage_r", ScaleOp::DIV_10},
        {"vepss", "eps_voltage_s", ScaleOp::DIV_10},
        {"vepst", "eps_voltage_t", ScaleOp::DIV_10},
        {"vBat", "battery_voltage", ScaleOp::DIV_10},
        {"vpv1", "pv1_voltage", ScaleOp::DIV_10},
        {"vpv2", "pv2_voltage", ScaleOp::DIV_10},
        {"vpv3", "pv3_voltage", ScaleOp::DIV_10},
        {"acCurrent", "ac_current", ScaleOp::IDENTITY},
        {"dcCurrent", "dc_current", ScaleOp::IDENTITY},
        {"soc", "state_of_charge", ScaleOp::IDENTITY},
        {"frequency", "frequency", ScaleOp::DIV_100},
        {"tinner", "internal_temperature", ScaleOp::IDENTITY},
        {"tradiator1", "radiator1_temperature", ScaleOp::IDENTITY},
        {"tradiator2", "radiator2_temperature", ScaleOp::IDENTITY},
        {"todayLoad", "consumption", ScaleOp::DIV_10},
        {"todayGridFeed", "grid_export", ScaleOp::DIV_10},
        {"todayGridConsumption", "grid_import", ScaleOp::DIV_10},
        {"totalLoad", "consumption_lifetime", ScaleOp::DIV_10},
        {"totalGridFeed", "grid_export_lifetime", ScaleOp::DIV_10},
        {"totalGridConsumption", "grid_import_lifetime", ScaleOp::DIV_10},
    };
    for (int i = 0; i < 3; ++i) {
        r.push_back({std::string("today") + ENERGY_BASES[i], ENERGY_KEYS[i], ScaleOp::DIV_10});
        r.push_back({std::string("total") + ENERGY_BASES[i], std::string(ENERGY_KEYS[i]) + "_lifetime", ScaleOp::DIV_10});
    }
    return r;
}

std::vector<FieldRule> buildCloudParallelEnergy() {
    std::vector<FieldRule> r = {
        {"todayExport", "grid_export", ScaleOp::DIV_10},
        {"todayImport", "grid_import", ScaleOp::DIV_10},
        {"todayUsage", "consumption", ScaleOp::DIV_10},
        {"totalExport", "grid_export_lifetime", ScaleOp::DIV_10},
        {"totalImport", "grid_import_lifetime", ScaleOp::DIV_10},
        {"totalUsage", "consumption_lifetime", ScaleOp::DIV_10},
        {"soc", "state_of_charge", ScaleOp::IDENTITY},
        {"powerRatingText", "inverter_power_rating", ScaleOp::IDENTITY},
        {"lost", "inverter_lost_status", ScaleOp::IDENTITY},
        {"hasRuntimeData", "inverter_has_runtime_data", ScaleOp::IDENTITY},
    };
    for (int i = 0; i < 3; ++i) {
        r.push_back({std::string("today") + ENERGY_BASES[i], ENERGY_KEYS[i], ScaleOp::DIV_10});
        r.push_back({std::string("total") + ENERGY_BASES[i], std::string(ENERGY_KEYS[i]) + "_lifetime", ScaleOp::DIV_10});
    }
    return r;
}

std::vector<FieldRule> buildCloudEnergy() {
    std::vector<FieldRule> r = buildCloudParallelEnergy();
    r.push_back({"totalEnergy", "total_energy", ScaleOp::IDENTITY});
    r.push_back({"dailyEnergy", "daily_energy", ScaleOp::IDENTITY});
    r.push_back({"monthlyEnergy", "monthly_energy", ScaleOp::IDENTITY});
    r.push_back({"yearlyEnergy", "yearly_energy", ScaleOp::IDENTITY});
    return r;
}

std::vector<FieldRule> buildCloudBatteryBank() {
    return {
        {"soc", "battery_bank_soc", ScaleOp::IDENTITY},
        {"vBat", "battery_bank_voltage", ScaleOp::DIV_10},
        {"pCharge", "battery_bank_charge_power", ScaleOp::IDENTITY},
        {"pDisCharge", "battery_bank_discharge_power", ScaleOp::IDENTITY},
        {"batPower", "battery_bank_power", ScaleOp::IDENTITY},
        {"maxBatteryCharge", "battery_bank_max_capacity", ScaleOp::IDENTITY},
        {"currentBatteryCharge", "battery_bank_current_capacity", ScaleOp::IDENTITY},
        {"totalNumber", "battery_bank_count", ScaleOp::IDENTITY},
        {"batStatus", "battery_bank_status", ScaleOp::IDENTITY},
    };
}

std::vector<FieldRule> buildCloudBattery() {
    return {
        {"totalVoltage", "battery_voltage", ScaleOp::DIV_100},
        {"current", "battery_current", ScaleOp::DIV_10},
        {"soc", "state_of_charge", ScaleOp::IDENTITY},
        {"soh", "state_of_health", ScaleOp::IDENTITY},
        {"cycleCnt", "cycle_count", ScaleOp::IDENTITY},
        {"batMaxCellVoltage", "battery_cell_voltage_max", ScaleOp::DIV_1000},
        {"batMinCellVoltage", "battery_cell_voltage_min", ScaleOp::DIV_1000},
        {"batMaxCellTemp", "battery_cell_temp_max", ScaleOp::DIV_10},
        {"batMinCellTemp", "battery_cell_temp_min", ScaleOp::DIV_10},
        {"ambientTemp", "ambient_temperature", ScaleOp::DIV_10},
        {"mosTemp", "mos_temperature", ScaleOp::DIV_10},
        {"currentRemainCapacity", "battery_remaining_capacity", ScaleOp::IDENTITY},
        {"currentFullCapacity", "battery_full_capacity", ScaleOp::IDENTITY},
        {"fwVersionText", "battery_firmware_version", ScaleOp::IDENTITY},
        {"batterySn", "battery_serial_number", ScaleOp::IDENTITY},
    };
}

std::vector<FieldRule> buildCloudMidbox() {
    std::vector<FieldRule> r = {
        {"gridFreq", "frequency", ScaleOp::DIV_100},
        {"genFreq", "generator_frequency", ScaleOp::DIV_100},
        {"phaseLockFreq", "phase_lock_frequency", ScaleOp::DIV_100},
        {"gridL1RmsVolt", "grid_voltage_l1", ScaleOp::DIV_10},
        {"gridL2RmsVolt", "grid_voltage_l2", ScaleOp::DIV_10},
        {"upsL1RmsVolt", "load_voltage_l1", ScaleOp::DIV_10},
        {"upsL2RmsVolt", "load_voltage_l2", ScaleOp::DIV_10},
        {"upsRmsVolt", "ups_voltage", ScaleOp::DIV_10},
        {"gridRmsVolt", "grid_voltage", ScaleOp::DIV_10},
        {"genRmsVolt", "generator_voltage", ScaleOp::DIV_10},
        {"eEnergyToUser", "energy_to_user", ScaleOp::DIV_10},
        {"eUpsEnergy", "ups_energy", ScaleOp::DIV_10},
        {"lost", "inverter_lost_status", ScaleOp::IDENTITY},
    };
    // Per-phase current and power channels.
    const char* const channels[][2] = {
        {"grid", "grid"}, {"load", "load"}, {"ups", "ups"}, {"gen", "generator"}};
    for (const auto& ch : channels) {
        for (int phase = 1; phase <= 2; ++phase) {
            std::string p = std::to_string(phase);
            r.push_back({std::string(ch[0]) + "L" + p + "RmsCurr", std::string(ch[1]) + "_current_l" + p, ScaleOp::DIV_10});
            r.push_back({std::string(ch[0]) + "L" + p + "ActivePower", std::string(ch[1]) + "_power_l" + p, ScaleOp::IDENTITY});
        }
    }
    // Daily and lifetime energy per phase.
    const char* const energy[][2] = {
        {"Ups", "ups"}, {"ToGrid", "grid_export"}, {"ToUser", "grid_import"}, {"Load", "load"}};
    for (const auto& e : energy) {
        for (int phase = 1; phase <= 2; ++phase) {
            std::string p = std::to_string(phase);
            r.push_back({std::string("e") + e[0] + "TodayL" + p, std::string(e[1]) + "_l" + p, ScaleOp::DIV_10});
            r.push_back({std::string("e") + e[0] + "TotalL" + p, std::string(e[1]) + "_lifetime_l" + p, ScaleOp::DIV_10});
        }
    }
    for (int port = 1; port <= 4; ++port) {
        std::string n = std::to_string(port);
        r.push_back({"smartPort" + n + "Status", "smart_port" + n + "_status", ScaleOp::SMART_PORT_STATUS});
        for (int phase = 1; phase <= 2; ++phase) {
            std::string p = std::to_string(phase);
            r.push_back({"smartLoad" + n + "L" + p + "ActivePower", "smart_load" + n + "_power_l" + p, ScaleOp::IDENTITY});
            r.push_back({"eSmartLoad" + n + "TodayL" + p, "smart_load" + n + "_l" + p, ScaleOp::DIV_10});
            r.push_back({"eSmartLoad" + n + "TotalL" + p, "smart_load" + n + "_lifetime_l" + p, ScaleOp::DIV_10});
            r.push_back({"eACcouple" + n + "TodayL" + p, "ac_couple" + n + "_l" + p, ScaleOp::DIV_10});
            r.push_back({"eACcouple" + n + "TotalL" + p, "ac_couple" + n + "_lifetime_l" + p, ScaleOp::DIV_10});
        }
    }
    return r;
}

// Local transports (Modbus TCP and dongle) share the register-level names
// produced by RegisterMap.
std::vector<FieldRule> buildLocalRuntime() {
    std::vector<FieldRule> r = {
        {"state", "status_code", ScaleOp::IDENTITY},
        {"p_pv", "pv_total_power", ScaleOp::IDENTITY},
        {"v_bat", "battery_voltage", ScaleOp::DIV_10},
        {"soc", "state_of_charge", ScaleOp::IDENTITY},
        {"p_charge", "battery_charge_power", ScaleOp::IDENTITY},
        {"p_discharge", "battery_discharge_power", ScaleOp::IDENTITY},
        {"v_ac_r", "ac_voltage", ScaleOp::DIV_10},
        {"v_ac_s", "grid_voltage_s", ScaleOp::DIV_10},
        {"v_ac_t", "grid_voltage_t", ScaleOp::DIV_10},
        {"v_grid_l1", "grid_voltage_l1", ScaleOp::DIV_10},
        {"v_grid_l2", "grid_voltage_l2", ScaleOp::DIV_10},
        {"f_ac", "frequency", ScaleOp::DIV_100},
        {"p_inv", "ac_power", ScaleOp::IDENTITY},
        {"p_rec", "rectifier_power", ScaleOp::IDENTITY},
        {"v_eps_r", "eps_voltage_r", ScaleOp::DIV_10},
        {"v_eps_s", "eps_voltage_s", ScaleOp::DIV_10},
        {"v_eps_t", "eps_voltage_t", ScaleOp::DIV_10},
        {"v_eps_l1", "eps_voltage_l1", ScaleOp::DIV_10},
        {"v_eps_l2", "eps_voltage_l2", ScaleOp::DIV_10},
        {"p_eps_l1", "eps_power_l1", ScaleOp::IDENTITY},
        {"p_eps_l2", "eps_power_l2", ScaleOp::IDENTITY},
        {"f_eps", "eps_frequency", ScaleOp::DIV_100},
        {"p_eps", "eps_power", ScaleOp::IDENTITY},
        {"p_to_grid", "grid_export_power", ScaleOp::IDENTITY},
        {"p_to_user", "grid_import_power", ScaleOp::IDENTITY},
        {"v_bus_1", "bus1_voltage", ScaleOp::DIV_10},
        {"v_bus_2", "bus2_voltage", ScaleOp::DIV_10},
        {"t_inner", "internal_temperature", ScaleOp::IDENTITY},
        {"t_rad_1", "radiator1_temperature", ScaleOp::IDENTITY},
        {"t_rad_2", "radiator2_temperature", ScaleOp::IDENTITY},
        {"t_bat", "battery_temperature", ScaleOp::IDENTITY},
    };
    for (int i = 1; i <= 3; ++i) {
        std::string n = std::to_string(i);
        r.push_back({"v_pv_" + n, "pv" + n + "_voltage", ScaleOp::DIV_10});
        r.push_back({"p_pv_" + n, "pv" + n + "_power", ScaleOp::IDENTITY});
    }
    return r;
}

std::vector<FieldRule> buildLocalEnergy() {
    return {
        {"e_pv_day", "yield", ScaleOp::DIV_10},
        {"e_chg_day", "charging", ScaleOp::DIV_10},
        {"e_dischg_day", "discharging", ScaleOp::DIV_10},
        {"e_to_grid_day", "grid_export", ScaleOp::DIV_10},
        {"e_to_user_day", "grid_import", ScaleOp::DIV_10},
        {"e_pv_all", "yield_lifetime", ScaleOp::DIV_10},
        {"e_chg_all", "charging_lifetime", ScaleOp::DIV_10},
        {"e_dischg_all", "discharging_lifetime", ScaleOp::DIV_10},
        {"e_to_grid_all", "grid_export_lifetime", ScaleOp::DIV_10},
        {"e_to_user_all", "grid_import_lifetime", ScaleOp::DIV_10},
    };
}

std::vector<FieldRule> buildLocalBatteryBank() {
    return {
        {"bat_count", "battery_bank_count", ScaleOp::IDENTITY},
        {"soc", "battery_bank_soc", ScaleOp::IDENTITY},
        {"v_bat", "battery_bank_voltage", ScaleOp::DIV_10},
        {"p_charge", "battery_bank_charge_power", ScaleOp::IDENTITY},
        {"p_discharge", "battery_bank_discharge_power", ScaleOp::IDENTITY},
    };
}

std::vector<FieldRule> buildLocalBattery() {
    return {
        {"v_bat", "battery_voltage", ScaleOp::DIV_10},
        {"bat_current", "battery_current", ScaleOp::DIV_10},
        {"soc", "state_of_charge", ScaleOp::IDENTITY},
        {"soh", "state_of_health", ScaleOp::IDENTITY},
        {"cycle_count", "cycle_count", ScaleOp::IDENTITY},
        {"max_cell_voltage", "battery_cell_voltage_max", ScaleOp::DIV_1000},
        {"min_cell_voltage", "battery_cell_voltage_min", ScaleOp::DIV_1000},
        {"max_cell_temp", "battery_cell_temp_max", ScaleOp::DIV_10},
        {"min_cell_temp", "battery_cell_temp_min", ScaleOp::DIV_10},
        {"bat_capacity", "battery_full_capacity", ScaleOp::IDENTITY},
    };
}

bool toNumber(const SensorValue& v, double& out) {
    if (v.isNumber()) {
        out = v.number;
        return true;
    }
    if (v.isText() && !v.text.empty()) {
        char* end = nullptr;
        out = strtod(v.text.c_str(), &end);
        return end && *end == '\0';
    }
    return false;
}

}  // namespace

const std::vector<FieldRule>& FieldMapper::rulesFor(TransportKind transport, PayloadKind kind) {
    static const std::vector<FieldRule> empty;
    static const std::vector<FieldRule> cloud_runtime = buildCloudRuntime();
    static const std::vector<FieldRule> cloud_energy = buildCloudEnergy();
    static const std::vector<FieldRule> cloud_parallel = buildCloudParallelEnergy();
    static const std::vector<FieldRule> cloud_bank = buildCloudBatteryBank();
    static const std::vector<FieldRule> cloud_battery = buildCloudBattery();
    static const std::vector<FieldRule> cloud_midbox = buildCloudMidbox();
    static const std::vector<FieldRule> local_runtime = buildLocalRuntime();
    static const std::vector<FieldRule> local_energy = buildLocalEnergy();
    static const std::vector<FieldRule> local_bank = buildLocalBatteryBank();
    static const std::vector<FieldRule> local_battery = buildLocalBattery();

    if (transport == TransportKind::CLOUD) {
        switch (kind) {
            case PayloadKind::RUNTIME: return cloud_runtime;
            case PayloadKind::ENERGY: return cloud_energy;
            case PayloadKind::BATTERY_BANK: return cloud_bank;
            case PayloadKind::BATTERY: return cloud_battery;
            case PayloadKind::MIDBOX: return cloud_midbox;
            case PayloadKind::PARALLEL_ENERGY: return cloud_parallel;
        }
        return empty;
    }
    switch (kind) {
        case PayloadKind::RUNTIME: return local_runtime;
        case PayloadKind::ENERGY: return local_energy;
        case PayloadKind::BATTERY_BANK: return local_bank;
        case PayloadKind::BATTERY: return local_battery;
        case PayloadKind::MIDBOX:
        case PayloadKind::PARALLEL_ENERGY:
            return empty;
    }
    return empty;
}

std::string FieldMapper::smartPortStatusText(int code) {
    switch (code) {
        case 0: return "Unused";
        case 1: return "Smart Load";
        case 2: return "AC Couple";
        default: return "Unknown (" + std::to_string(code) + ")";
    }
}

SensorValue FieldMapper::applyScale(ScaleOp op, const SensorValue& raw) {
    if (raw.isNone()) return SensorValue();
    if (op == ScaleOp::IDENTITY) return raw;
    double v = 0.0;
    if (!toNumber(raw, v)) return SensorValue();
    switch (op) {
        case ScaleOp::IDENTITY: return SensorValue(v);
        case ScaleOp::DIV_10: return SensorValue(v / 10.0);
        case ScaleOp::DIV_100: return SensorValue(v / 100.0);
        case ScaleOp::DIV_1000: return SensorValue(v / 1000.0);
        case ScaleOp::SMART_PORT_STATUS: return SensorValue(smartPortStatusText((int)std::lround(v)));
    }
    return SensorValue();
}

SensorMap FieldMapper::normalize(TransportKind transport, const RawPayload& raw) {
    SensorMap out;
    for (const auto& rule : rulesFor(transport, raw.kind)) {
        auto it = raw.values.find(rule.raw);
        if (it == raw.values.end()) continue;
        SensorValue scaled = applyScale(rule.op, it->second);
        if (scaled.isNone()) continue;
        out[rule.canonical] = scaled;
    }
    return out;
}
