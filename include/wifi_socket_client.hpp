#pragma once
#include <WiFiClient.h>
#include "socket_client.hpp"

// SocketClient over the ESP32 WiFiClient.
class WiFiSocketClient : public SocketClient {
public:
    WiFiSocketClient() {}
    ~WiFiSocketClient() override { close(); }

    void open(const std::string& host, uint16_t port, uint32_t timeout_ms) override;
    void close() override;
    bool isOpen() const override;
    void write(const uint8_t* data, size_t len) override;
    void readExact(uint8_t* out, size_t len, uint32_t timeout_ms) override;

private:
    mutable WiFiClient client_;
    std::string peer_;
};
