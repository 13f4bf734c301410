#pragma once
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "config_manager.hpp"
#include "device_transport.hpp"
#include "http_client.hpp"

constexpr std::time_t CLOUD_SESSION_LIFETIME_S = 2 * 60 * 60;

/**
 * @brief Cloud monitoring API driver.
 *
 * Form-encoded POSTs against the vendor web API. The JSESSIONID cookie
 * from /WManage/api/login is attached to every call and renewed once it
 * is older than two hours.
 *
 * Error mapping: HTTP 401 or a login/auth failure message raise
 * AuthException; other non-2xx raise ConnectionException; any other
 * success:false raises ApiException; unparsable bodies raise
 * DecodingException.
 */
class CloudApiClient : public DeviceTransport {
public:
    using Clock = std::function<std::time_t()>;

    CloudApiClient(const CloudCredentials& credentials, std::shared_ptr<HttpClient> http, Clock clock = Clock());

    TransportKind kind() const override { return TransportKind::CLOUD; }
    std::string endpoint() const override { return base_url_; }
    bool isSessionSafe() const override { return true; }
    bool keepsSession() const override { return true; }

    // Logs in (again). Throws AuthException when the credentials are rejected.
    void connect() override;
    void disconnect() override;

    RawPayload readRuntime(const std::string& serial) override;
    RawPayload readEnergy(const std::string& serial) override;
    BatteryReading readBattery(const std::string& serial) override;
    RawPayload readMidbox(const std::string& serial) override;
    RawPayload readParallelEnergy(const std::string& master_serial) override;
    int readDeviceType(const std::string& serial) override;
    std::string readFirmwareVersion(const std::string& serial) override;
    uint16_t readParallelConfig(const std::string& serial) override;

    bool hasSession() const;

private:
    std::string request(const std::string& path, const std::map<std::string, std::string>& form, bool authenticated);
    void loginLocked();
    void ensureSession();
    std::time_t now() const;

    CloudCredentials credentials_;
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    Clock clock_;
    std::string session_id_;
    std::time_t session_expires_ = 0;
    mutable std::mutex session_mutex_;
};
