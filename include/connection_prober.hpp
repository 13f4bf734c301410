#pragma once
#include <string>
#include "config_manager.hpp"

class TransportFactory;

struct ProbeResult {
    bool ok = false;
    // Form error key: modbus_not_installed, modbus_timeout, modbus_connection_failed,
    // dongle_timeout, dongle_connection_failed or unknown.
    std::string error;
    std::string message;
    int device_type = -1;
    std::string firmware_version;
};

// One-shot connectivity checks for settings entered by the operator.
class ConnectionProber {
public:
    explicit ConnectionProber(TransportFactory* factory);
    virtual ~ConnectionProber() {}
    virtual ProbeResult probe(const LocalTransportConfig& config);
    // Logs in with the credentials; error is invalid_auth, cannot_connect or unknown.
    virtual ProbeResult probeCloud(const CloudCredentials& credentials);

private:
    TransportFactory* factory_;
};
