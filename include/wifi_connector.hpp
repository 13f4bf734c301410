#pragma once
#include <string>
#include <cstdint>

// Station-mode WiFi link for the ESP32 build. Local transports and the cloud
// client both need it up before the first poll.
class WiFiConnector {
public:
    WiFiConnector(const std::string& ssid, const std::string& password,
                  uint32_t reconnect_interval_ms = 10000);
    ~WiFiConnector();

    void begin();
    // Non-blocking; retries every reconnect interval while the link is down
    void loop();
    bool isConnected() const;
    // Blocks until connected or timeout_ms elapses
    bool waitConnected(uint32_t timeout_ms);

private:
    std::string ssid_;
    std::string password_;
    uint32_t lastAttemptMs_ = 0;
    uint32_t reconnectIntervalMs_;
    bool wasConnected_ = false;
};
