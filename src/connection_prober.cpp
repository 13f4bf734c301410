#include "../include/connection_prober.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/transport_factory.hpp"

ConnectionProber::ConnectionProber(TransportFactory* factory) : factory_(factory) {}

static std::string prefixFor(LocalTransportType type) {
    return type == LocalTransportType::WIFI_DONGLE ? "dongle" : "modbus";
}

ProbeResult ConnectionProber::probe(const LocalTransportConfig& config) {
    ProbeResult result;
    std::string prefix = prefixFor(config.type);

    std::shared_ptr<DeviceTransport> transport = factory_ ? factory_->createLocal(config) : nullptr;
    if (!transport) {
        // Only the Modbus driver is optional; a missing dongle driver is unexpected.
        result.error = config.type == LocalTransportType::MODBUS_TCP ? "modbus_not_installed" : "unknown";
        result.message = "Local transport driver is not available";
        Logger::warn("[Probe] %s driver not available", prefix.c_str());
        return result;
    }

    try {
        transport->connect();
        result.device_type = transport->readDeviceType(config.serial);
        result.firmware_version = transport->readFirmwareVersion(config.serial);
        result.ok = true;
        Logger::info("[Probe] %s at %s:%u ok (device type %d, firmware %s)", prefix.c_str(),
                     config.host.c_str(), (unsigned)config.port, result.device_type,
                     result.firmware_version.c_str());
    } catch (const ConnectionException& e) {
        result.error = prefix + (e.isTimeout() ? "_timeout" : "_connection_failed");
        result.message = e.what();
    } catch (const TransportException& e) {
        result.error = "unknown";
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = "unknown";
        result.message = e.what();
    }
    if (!result.ok) {
        Logger::warn("[Probe] %s at %s:%u failed: %s (%s)", prefix.c_str(), config.host.c_str(),
                     (unsigned)config.port, result.error.c_str(), result.message.c_str());
    }

    try {
        transport->disconnect();
    } catch (const std::exception& e) {
        Logger::debug("[Probe] Disconnect after probe failed: %s", e.what());
    }
    return result;
}

ProbeResult ConnectionProber::probeCloud(const CloudCredentials& credentials) {
    ProbeResult result;
    std::shared_ptr<DeviceTransport> transport = factory_ ? factory_->createCloud(credentials) : nullptr;
    if (!transport) {
        result.error = "cannot_connect";
        result.message = "No HTTP stack available";
        Logger::warn("[Probe] Cloud login not possible: no HTTP stack");
        return result;
    }

    try {
        transport->connect();
        result.ok = true;
        Logger::info("[Probe] Cloud login for %s ok", credentials.username.c_str());
    } catch (const AuthException& e) {
        result.error = "invalid_auth";
        result.message = e.what();
    } catch (const ConnectionException& e) {
        result.error = "cannot_connect";
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = "unknown";
        result.message = e.what();
    }
    if (!result.ok) {
        Logger::warn("[Probe] Cloud login for %s failed: %s (%s)", credentials.username.c_str(),
                     result.error.c_str(), result.message.c_str());
    }

    try {
        transport->disconnect();
    } catch (const std::exception& e) {
        Logger::debug("[Probe] Disconnect after cloud login failed: %s", e.what());
    }
    return result;
}
