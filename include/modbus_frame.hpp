#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// Standard Modbus RTU CRC16 (polynomial 0xA001)
uint16_t modbus_crc16(const uint8_t *data, uint16_t length);

constexpr uint8_t MODBUS_READ_HOLDING = 0x03;
constexpr uint8_t MODBUS_READ_INPUT = 0x04;
constexpr uint16_t MODBUS_MAX_READ_COUNT = 40;

// --- Modbus TCP (MBAP) ---
constexpr size_t MBAP_HEADER_LEN = 7;

std::vector<uint8_t> buildMbapReadRequest(uint16_t transaction_id, uint8_t unit_id, uint8_t function,
                                          uint16_t start, uint16_t count);
// Bytes that follow the 7-byte header, from its length field.
size_t mbapRemainingLength(const uint8_t* header);
// Validates a full response (header + PDU) and returns big-endian register values.
// Throws DecodingException.
std::vector<uint16_t> parseMbapReadResponse(const uint8_t* frame, size_t len, uint16_t transaction_id,
                                            uint8_t unit_id, uint8_t function, uint16_t count);

// --- WiFi dongle envelope ---
constexpr uint8_t DONGLE_PREFIX_0 = 0xA1;
constexpr uint8_t DONGLE_PREFIX_1 = 0x1A;
constexpr uint16_t DONGLE_PROTOCOL = 2;
constexpr uint8_t DONGLE_TCP_TRANSLATED = 0xC2;
constexpr size_t DONGLE_HEADER_LEN = 6;
constexpr size_t DONGLE_SERIAL_LEN = 10;

std::vector<uint8_t> buildDongleReadRequest(const std::string& dongle_serial, const std::string& inverter_serial,
                                            uint8_t function, uint16_t start, uint16_t count);
size_t dongleRemainingLength(const uint8_t* header);
// Validates envelope, CRC and echoed request fields; values are little-endian on the wire.
// Throws DecodingException.
std::vector<uint16_t> parseDongleReadResponse(const uint8_t* frame, size_t len, uint8_t function,
                                              uint16_t start, uint16_t count);
