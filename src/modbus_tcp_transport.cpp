#include "../include/local_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/modbus_frame.hpp"

ModbusTcpTransport::ModbusTcpTransport(const LocalTransportConfig& config, SocketFactory sockets, uint32_t io_timeout_ms)
    : RegisterTransport(config, sockets, io_timeout_ms) {}

std::vector<uint16_t> ModbusTcpTransport::exchange(SocketClient& socket, uint8_t function, uint16_t start, uint16_t count) {
    uint16_t tid = ++transaction_id_;
    std::vector<uint8_t> request = buildMbapReadRequest(tid, config().unit_id, function, start, count);
    socket.write(request.data(), request.size());

    std::vector<uint8_t> frame(MBAP_HEADER_LEN);
    socket.readExact(frame.data(), MBAP_HEADER_LEN, ioTimeout());
    size_t remaining = mbapRemainingLength(frame.data());
    if (remaining == 0 || remaining > 255) throw DecodingException("MBAP length out of range");
    frame.resize(MBAP_HEADER_LEN + remaining);
    socket.readExact(frame.data() + MBAP_HEADER_LEN, remaining, ioTimeout());

    return parseMbapReadResponse(frame.data(), frame.size(), tid, config().unit_id, function, count);
}
