#include "../include/wifi_socket_client.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>

void WiFiSocketClient::open(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    close();
    peer_ = host + ":" + std::to_string(port);
    if (!client_.connect(host.c_str(), port, (int32_t)timeout_ms)) {
        throw ConnectionException("connect to " + peer_ + " failed");
    }
    client_.setNoDelay(true);
    Logger::debug("[Socket] Connected to %s", peer_.c_str());
}

void WiFiSocketClient::close() {
    if (client_.connected()) {
        client_.stop();
        Logger::debug("[Socket] Closed %s", peer_.c_str());
    }
}

bool WiFiSocketClient::isOpen() const {
    return client_.connected();
}

void WiFiSocketClient::write(const uint8_t* data, size_t len) {
    if (!client_.connected()) {
        throw ConnectionException("write on closed socket " + peer_);
    }
    size_t sent = client_.write(data, len);
    if (sent != len) {
        throw ConnectionException("short write to " + peer_);
    }
}

void WiFiSocketClient::readExact(uint8_t* out, size_t len, uint32_t timeout_ms) {
    size_t got = 0;
    uint32_t start = millis();
    while (got < len) {
        int avail = client_.available();
        if (avail > 0) {
            size_t want = len - got;
            if ((size_t)avail < want) want = (size_t)avail;
            int n = client_.read(out + got, want);
            if (n > 0) {
                got += (size_t)n;
                continue;
            }
        } else if (!client_.connected()) {
            throw ConnectionException("connection closed by " + peer_);
        }
        if (millis() - start >= timeout_ms) {
            throw ConnectionException("read timeout from " + peer_, ERR_TIMEOUT);
        }
        delay(1);
    }
}
