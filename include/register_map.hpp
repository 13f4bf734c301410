#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

// Input register blocks read per cycle (40 registers each).
constexpr uint16_t INPUT_BLOCK_RUNTIME = 0;
constexpr uint16_t INPUT_BLOCK_ENERGY = 40;
constexpr uint16_t INPUT_BLOCK_BATTERY = 80;
constexpr uint16_t REGISTER_BLOCK_SIZE = 40;

// Holding registers used for identification.
constexpr uint16_t HOLD_FIRMWARE = 7;         // 4 registers, ASCII
constexpr uint16_t HOLD_DEVICE_TYPE = 19;
constexpr uint16_t HOLD_PARALLEL_CONFIG = 113;
constexpr uint16_t HOLD_SERIAL = 115;         // 5 registers, ASCII

/**
 * @brief Sparse view over the register blocks read so far.
 */
class RegisterBank {
public:
    void load(uint16_t start, const std::vector<uint16_t>& values);
    void clear() { regs_.clear(); }
    bool has(uint16_t reg) const;
    bool hasRange(uint16_t reg, uint16_t count) const;
    uint16_t u16(uint16_t reg) const;
    int16_t s16(uint16_t reg) const;
    // Two registers, low word first.
    uint32_t u32(uint16_t reg) const;
    // Two characters per register, low byte first; trailing NUL and spaces stripped.
    std::string ascii(uint16_t reg, uint16_t count) const;
private:
    std::map<uint16_t, uint16_t> regs_;
};

// Turns raw input registers into the register-level field names the
// field mapper knows for local transports. Fields whose registers are
// missing are left out.
class RegisterMap {
public:
    static RawPayload decodeRuntime(const RegisterBank& input);
    static RawPayload decodeEnergy(const RegisterBank& input);
    static BatteryReading decodeBattery(const RegisterBank& input);
};
