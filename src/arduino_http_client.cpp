#include "../include/arduino_http_client.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <HTTPClient.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>

ArduinoHttpClient::ArduinoHttpClient(uint32_t timeout_ms, const char* root_ca)
    : timeout_ms_(timeout_ms), root_ca_(root_ca) {
    if (!root_ca_) {
        Logger::warn("[HTTP] No root CA configured; TLS peer will not be verified");
    }
}

HttpResponse ArduinoHttpClient::post(const std::string& url, const std::string& body,
                                     const HttpHeaders& headers) {
    HttpResponse response;
    bool secure = url.compare(0, 8, "https://") == 0;

    WiFiClientSecure tls;
    WiFiClient plain;
    HTTPClient http;
    http.setTimeout((uint16_t)(timeout_ms_ > 65535 ? 65535 : timeout_ms_));

    bool begun;
    if (secure) {
        if (root_ca_) tls.setCACert(root_ca_);
        else tls.setInsecure();
        begun = http.begin(tls, url.c_str());
    } else {
        begun = http.begin(plain, url.c_str());
    }
    if (!begun) {
        Logger::error("[HTTP] Could not start request to %s", url.c_str());
        response.status_code = -1;
        return response;
    }

    const char* collect[] = {"Set-Cookie"};
    http.collectHeaders(collect, 1);
    for (const auto& h : headers) {
        http.addHeader(h.first.c_str(), h.second.c_str());
    }

    int code = http.POST((uint8_t*)body.data(), body.size());
    response.status_code = code;
    if (code > 0) {
        response.body = http.getString().c_str();
        if (http.hasHeader("Set-Cookie")) {
            response.headers["Set-Cookie"] = http.header("Set-Cookie").c_str();
        }
    } else {
        Logger::warn("[HTTP] POST %s failed: %s", url.c_str(), http.errorToString(code).c_str());
    }
    http.end();
    return response;
}
