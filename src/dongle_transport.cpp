#include "../include/local_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/modbus_frame.hpp"

// The dongle interleaves heartbeat frames (TCP function 0xC1) with replies.
static const uint8_t DONGLE_HEARTBEAT = 0xC1;
static const int MAX_SKIPPED_FRAMES = 3;

DongleTransport::DongleTransport(const LocalTransportConfig& config, SocketFactory sockets, uint32_t io_timeout_ms)
    : RegisterTransport(config, sockets, io_timeout_ms) {}

std::vector<uint16_t> DongleTransport::exchange(SocketClient& socket, uint8_t function, uint16_t start, uint16_t count) {
    std::vector<uint8_t> request = buildDongleReadRequest(config().dongle_serial, config().serial, function, start, count);
    socket.write(request.data(), request.size());

    for (int attempt = 0; attempt <= MAX_SKIPPED_FRAMES; ++attempt) {
        std::vector<uint8_t> frame(DONGLE_HEADER_LEN);
        socket.readExact(frame.data(), DONGLE_HEADER_LEN, ioTimeout());
        if (frame[0] != DONGLE_PREFIX_0 || frame[1] != DONGLE_PREFIX_1) {
            throw DecodingException("Dongle prefix mismatch");
        }
        size_t remaining = dongleRemainingLength(frame.data());
        if (remaining < 2 || remaining > 512) throw DecodingException("Dongle frame length out of range");
        frame.resize(DONGLE_HEADER_LEN + remaining);
        socket.readExact(frame.data() + DONGLE_HEADER_LEN, remaining, ioTimeout());

        if (frame[7] == DONGLE_HEARTBEAT) {
            Logger::debug("[Dongle] Skipping heartbeat from %s", config().dongle_serial.c_str());
            continue;
        }
        return parseDongleReadResponse(frame.data(), frame.size(), function, start, count);
    }
    throw DecodingException("No register reply from dongle");
}
