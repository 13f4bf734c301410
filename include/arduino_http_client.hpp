#pragma once
#include <stdint.h>
#include "http_client.hpp"

// HttpClient over the ESP32 core's HTTPClient. With no root CA the TLS
// peer is not verified.
class ArduinoHttpClient : public HttpClient {
public:
    explicit ArduinoHttpClient(uint32_t timeout_ms = 15000, const char* root_ca = nullptr);
    ~ArduinoHttpClient() override {}

    HttpResponse post(const std::string& url, const std::string& body,
                      const HttpHeaders& headers) override;

private:
    uint32_t timeout_ms_;
    const char* root_ca_;
};
