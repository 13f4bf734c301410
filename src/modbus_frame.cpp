#include "../include/modbus_frame.hpp"
#include "../include/exceptions.hpp"
#include <cstdio>

// Standard Modbus RTU CRC16 (polynomial 0xA001)
uint16_t modbus_crc16(const uint8_t *data, uint16_t length) {
    uint16_t crc = 0xFFFFu;
    for (uint16_t i = 0; i < length; ++i) {
        crc ^= (uint16_t)data[i];
        for (uint8_t j = 0; j < 8; ++j) {
            if (crc & 0x0001u) {
                crc = (uint16_t)((crc >> 1) ^ 0xA001u);
            } else {
                crc = (uint16_t)(crc >> 1);
            }
        }
    }
    return crc;
}

static void putBE16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

static void putLE16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
}

static uint16_t getBE16(const uint8_t* p) { return (uint16_t)((p[0] << 8) | p[1]); }
static uint16_t getLE16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }

static std::string exceptionText(uint8_t code) {
    char buf[48];
    snprintf(buf, sizeof(buf), "Modbus exception code 0x%02X", code);
    return buf;
}

std::vector<uint8_t> buildMbapReadRequest(uint16_t transaction_id, uint8_t unit_id, uint8_t function,
                                          uint16_t start, uint16_t count) {
    std::vector<uint8_t> frame;
    frame.reserve(12);
    putBE16(frame, transaction_id);
    putBE16(frame, 0);      // protocol id
    putBE16(frame, 6);      // unit + function + start + count
    frame.push_back(unit_id);
    frame.push_back(function);
    putBE16(frame, start);
    putBE16(frame, count);
    return frame;
}

size_t mbapRemainingLength(const uint8_t* header) {
    // The length field counts the unit id, which is already part of the header.
    uint16_t len = getBE16(header + 4);
    return len > 0 ? (size_t)(len - 1) : 0;
}

std::vector<uint16_t> parseMbapReadResponse(const uint8_t* frame, size_t len, uint16_t transaction_id,
                                            uint8_t unit_id, uint8_t function, uint16_t count) {
    if (len < MBAP_HEADER_LEN + 2) throw DecodingException("MBAP response too short");
    if (getBE16(frame) != transaction_id) throw DecodingException("MBAP transaction id mismatch");
    if (getBE16(frame + 2) != 0) throw DecodingException("MBAP protocol id is not Modbus");
    if ((size_t)getBE16(frame + 4) + 6 != len) throw DecodingException("MBAP length field mismatch");
    if (frame[6] != unit_id) throw DecodingException("MBAP unit id mismatch");

    uint8_t fn = frame[7];
    if (fn == (uint8_t)(function | 0x80)) {
        throw DecodingException(exceptionText(frame[8]), ERR_MODBUS_EXCEPTION);
    }
    if (fn != function) throw DecodingException("MBAP function code mismatch");

    uint8_t byte_count = frame[8];
    if (byte_count != count * 2 || len != MBAP_HEADER_LEN + 2 + byte_count) {
        throw DecodingException("MBAP byte count mismatch");
    }
    std::vector<uint16_t> values(count);
    for (uint16_t i = 0; i < count; ++i) {
        values[i] = getBE16(frame + 9 + i * 2);
    }
    return values;
}

static void putSerial(std::vector<uint8_t>& out, const std::string& serial) {
    for (size_t i = 0; i < DONGLE_SERIAL_LEN; ++i) {
        out.push_back(i < serial.size() ? (uint8_t)serial[i] : 0x00);
    }
}

std::vector<uint8_t> buildDongleReadRequest(const std::string& dongle_serial, const std::string& inverter_serial,
                                            uint8_t function, uint16_t start, uint16_t count) {
    // Data frame: action, function, inverter serial, start, count, CRC.
    std::vector<uint8_t> data;
    data.push_back(0x00);
    data.push_back(function);
    putSerial(data, inverter_serial);
    putLE16(data, start);
    putLE16(data, count);
    uint16_t crc = modbus_crc16(data.data(), (uint16_t)data.size());
    putLE16(data, crc);

    std::vector<uint8_t> frame;
    frame.reserve(DONGLE_HEADER_LEN + 14 + data.size());
    frame.push_back(DONGLE_PREFIX_0);
    frame.push_back(DONGLE_PREFIX_1);
    putLE16(frame, DONGLE_PROTOCOL);
    putLE16(frame, (uint16_t)(14 + data.size()));  // address + tcp function + datalog + data length + data
    frame.push_back(0x01);
    frame.push_back(DONGLE_TCP_TRANSLATED);
    putSerial(frame, dongle_serial);
    putLE16(frame, (uint16_t)data.size());
    frame.insert(frame.end(), data.begin(), data.end());
    return frame;
}

size_t dongleRemainingLength(const uint8_t* header) {
    return getLE16(header + 4);
}

std::vector<uint16_t> parseDongleReadResponse(const uint8_t* frame, size_t len, uint8_t function,
                                              uint16_t start, uint16_t count) {
    if (len < DONGLE_HEADER_LEN + 14) throw DecodingException("Dongle frame too short");
    if (frame[0] != DONGLE_PREFIX_0 || frame[1] != DONGLE_PREFIX_1) throw DecodingException("Dongle prefix mismatch");
    if (getLE16(frame + 4) + DONGLE_HEADER_LEN != len) throw DecodingException("Dongle frame length mismatch");
    if (frame[7] != DONGLE_TCP_TRANSLATED) throw DecodingException("Unexpected dongle TCP function");

    const uint8_t* data = frame + DONGLE_HEADER_LEN + 14;
    size_t data_len = getLE16(frame + DONGLE_HEADER_LEN + 12);
    if (DONGLE_HEADER_LEN + 14 + data_len != len || data_len < 16) {
        throw DecodingException("Dongle data length mismatch");
    }
    uint16_t received_crc = getLE16(data + data_len - 2);
    uint16_t calculated_crc = modbus_crc16(data, (uint16_t)(data_len - 2));
    if (received_crc != calculated_crc) {
        char buf[64];
        snprintf(buf, sizeof(buf), "Dongle CRC mismatch: got 0x%04X, expected 0x%04X", received_crc, calculated_crc);
        throw DecodingException(buf, ERR_MODBUS_CRC);
    }

    uint8_t fn = data[1];
    if (fn == (uint8_t)(function | 0x80)) {
        throw DecodingException(exceptionText(data[14]), ERR_MODBUS_EXCEPTION);
    }
    if (fn != function) throw DecodingException("Dongle function code mismatch");
    if (getLE16(data + 12) != start) throw DecodingException("Dongle start register mismatch");

    uint8_t byte_count = data[14];
    if (byte_count != count * 2 || data_len != 15u + byte_count + 2u) {
        throw DecodingException("Dongle byte count mismatch");
    }
    std::vector<uint16_t> values(count);
    for (uint16_t i = 0; i < count; ++i) {
        values[i] = getLE16(data + 15 + i * 2);
    }
    return values;
}
