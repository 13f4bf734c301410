#include "../include/wifi_connector.hpp"
#include "../include/logger.hpp"

#include <Arduino.h>
#include <WiFi.h>

WiFiConnector::WiFiConnector(const std::string& ssid, const std::string& password,
                             uint32_t reconnect_interval_ms)
    : ssid_(ssid), password_(password), reconnectIntervalMs_(reconnect_interval_ms) {}

WiFiConnector::~WiFiConnector() {}

void WiFiConnector::begin() {
    if (ssid_.empty()) {
        Logger::warn("[WiFi] No SSID configured; local transports will not connect");
        return;
    }
    Logger::info("[WiFi] Connecting to SSID: %s", ssid_.c_str());
    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.begin(ssid_.c_str(), password_.c_str());
    lastAttemptMs_ = millis();
}

void WiFiConnector::loop() {
    if (ssid_.empty()) return;
    bool connected = WiFi.status() == WL_CONNECTED;
    if (connected != wasConnected_) {
        if (connected) {
            Logger::info("[WiFi] Connected, IP %s", WiFi.localIP().toString().c_str());
        } else {
            Logger::warn("[WiFi] Link lost");
        }
        wasConnected_ = connected;
    }
    if (connected) return;
    uint32_t now = millis();
    if (now - lastAttemptMs_ >= reconnectIntervalMs_) {
        Logger::info("[WiFi] Attempting reconnect to %s", ssid_.c_str());
        WiFi.disconnect();
        WiFi.begin(ssid_.c_str(), password_.c_str());
        lastAttemptMs_ = now;
    }
}

bool WiFiConnector::isConnected() const {
    return WiFi.status() == WL_CONNECTED;
}

bool WiFiConnector::waitConnected(uint32_t timeout_ms) {
    uint32_t start = millis();
    while (!isConnected()) {
        if (millis() - start >= timeout_ms) return false;
        delay(100);
    }
    wasConnected_ = true;
    Logger::info("[WiFi] Connected, IP %s", WiFi.localIP().toString().c_str());
    return true;
}
