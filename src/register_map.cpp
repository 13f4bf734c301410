#include "../include/register_map.hpp"

void RegisterBank::load(uint16_t start, const std::vector<uint16_t>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        regs_[(uint16_t)(start + i)] = values[i];
    }
}

bool RegisterBank::has(uint16_t reg) const {
    return regs_.find(reg) != regs_.end();
}

bool RegisterBank::hasRange(uint16_t reg, uint16_t count) const {
    for (uint16_t i = 0; i < count; ++i) {
        if (!has((uint16_t)(reg + i))) return false;
    }
    return true;
}

uint16_t RegisterBank::u16(uint16_t reg) const {
    auto it = regs_.find(reg);
    return it == regs_.end() ? 0 : it->second;
}

int16_t RegisterBank::s16(uint16_t reg) const {
    return (int16_t)u16(reg);
}

uint32_t RegisterBank::u32(uint16_t reg) const {
    return (uint32_t)u16(reg) | ((uint32_t)u16((uint16_t)(reg + 1)) << 16);
}

std::string RegisterBank::ascii(uint16_t reg, uint16_t count) const {
    std::string out;
    for (uint16_t i = 0; i < count; ++i) {
        uint16_t v = u16((uint16_t)(reg + i));
        out.push_back((char)(v & 0xFF));
        out.push_back((char)(v >> 8));
    }
    while (!out.empty() && (out.back() == '\0' || out.back() == ' ')) out.pop_back();
    size_t nul = out.find('\0');
    if (nul != std::string::npos) out.resize(nul);
    return out;
}

namespace {

struct U16Field { uint16_t reg; const char* name; bool is_signed; };

void putU16(RawPayload& p, const RegisterBank& in, const U16Field& f) {
    if (!in.has(f.reg)) return;
    if (f.is_signed) {
        p.values[f.name] = SensorValue((int)in.s16(f.reg));
    } else {
        p.values[f.name] = SensorValue((unsigned)in.u16(f.reg));
    }
}

// Sum of the three PV string values, only when all three are present.
void putPvSum(RawPayload& p, const char* target, const char* prefix) {
    double total = 0.0;
    for (int i = 1; i <= 3; ++i) {
        SensorValue v = p.get(std::string(prefix) + std::to_string(i));
        if (!v.isNumber()) return;
        total += v.number;
    }
    p.values[target] = SensorValue(total);
}

const U16Field RUNTIME_FIELDS[] = {
    {0, "state", false},
    {1, "v_pv_1", false}, {2, "v_pv_2", false}, {3, "v_pv_3", false},
    {4, "v_bat", false},
    {7, "p_pv_1", false}, {8, "p_pv_2", false}, {9, "p_pv_3", false},
    {10, "p_charge", false}, {11, "p_discharge", false},
    {12, "v_ac_r", false}, {13, "v_ac_s", false}, {14, "v_ac_t", false},
    {15, "f_ac", false},
    {16, "p_inv", false}, {17, "p_rec", false},
    {20, "v_eps_r", false}, {21, "v_eps_s", false}, {22, "v_eps_t", false},
    {23, "f_eps", false}, {24, "p_eps", false},
    {26, "p_to_grid", false}, {27, "p_to_user", false},
    {38, "v_bus_1", false}, {39, "v_bus_2", false},
    {64, "t_inner", true}, {65, "t_rad_1", true}, {66, "t_rad_2", true}, {67, "t_bat", true},
    {108, "v_eps_l1", false}, {109, "v_eps_l2", false},
    {110, "p_eps_l1", false}, {111, "p_eps_l2", false},
    {112, "v_grid_l1", false}, {113, "v_grid_l2", false},
};

const U16Field ENERGY_DAY_FIELDS[] = {
    {28, "e_pv_day_1", false}, {29, "e_pv_day_2", false}, {30, "e_pv_day_3", false},
    {31, "e_inv_day", false}, {32, "e_rec_day", false},
    {33, "e_chg_day", false}, {34, "e_dischg_day", false},
    {35, "e_eps_day", false},
    {36, "e_to_grid_day", false}, {37, "e_to_user_day", false},
};

const char* const ENERGY_ALL_FIELDS[] = {
    "e_pv_all_1", "e_pv_all_2", "e_pv_all_3", "e_inv_all", "e_rec_all",
    "e_chg_all", "e_dischg_all", "e_eps_all", "e_to_grid_all", "e_to_user_all",
};

const U16Field BATTERY_FIELDS[] = {
    {4, "v_bat", false},
    {98, "bat_current", true},
    {101, "max_cell_voltage", false}, {102, "min_cell_voltage", false},
    {103, "max_cell_temp", true}, {104, "min_cell_temp", true},
    {106, "cycle_count", false},
    {97, "bat_capacity", false},
};

}  // namespace

RawPayload RegisterMap::decodeRuntime(const RegisterBank& input) {
    RawPayload p(PayloadKind::RUNTIME);
    for (const auto& f : RUNTIME_FIELDS) putU16(p, input, f);
    if (input.has(5)) {
        p.values["soc"] = SensorValue((unsigned)(input.u16(5) & 0xFF));
        p.values["soh"] = SensorValue((unsigned)(input.u16(5) >> 8));
    }
    putPvSum(p, "p_pv", "p_pv_");
    return p;
}

RawPayload RegisterMap::decodeEnergy(const RegisterBank& input) {
    RawPayload p(PayloadKind::ENERGY);
    for (const auto& f : ENERGY_DAY_FIELDS) putU16(p, input, f);
    uint16_t reg = 40;
    for (const char* name : ENERGY_ALL_FIELDS) {
        if (input.hasRange(reg, 2)) p.values[name] = SensorValue((long long)input.u32(reg));
        reg += 2;
    }
    putPvSum(p, "e_pv_day", "e_pv_day_");
    putPvSum(p, "e_pv_all", "e_pv_all_");
    return p;
}

BatteryReading RegisterMap::decodeBattery(const RegisterBank& input) {
    BatteryReading reading;
    RawPayload& bank = reading.bank;
    if (input.has(96)) bank.values["bat_count"] = SensorValue((unsigned)input.u16(96));
    if (input.has(4)) bank.values["v_bat"] = SensorValue((unsigned)input.u16(4));
    if (input.has(5)) bank.values["soc"] = SensorValue((unsigned)(input.u16(5) & 0xFF));
    if (input.has(10)) bank.values["p_charge"] = SensorValue((unsigned)input.u16(10));
    if (input.has(11)) bank.values["p_discharge"] = SensorValue((unsigned)input.u16(11));

    // Registers describe the bank as a whole; expose it as a single module.
    if (!input.has(96) || input.u16(96) == 0) return reading;
    BatteryPayload module;
    for (const auto& f : BATTERY_FIELDS) putU16(module.payload, input, f);
    if (input.has(5)) {
        module.payload.values["soc"] = SensorValue((unsigned)(input.u16(5) & 0xFF));
        module.payload.values["soh"] = SensorValue((unsigned)(input.u16(5) >> 8));
    }
    reading.modules.push_back(module);
    return reading;
}
