#pragma once
#include <stdint.h>
#include <memory>
#include "config_manager.hpp"
#include "device_transport.hpp"
#include "http_client.hpp"
#include "local_transport.hpp"

// Builds transport drivers for a fleet entry.
class TransportFactory {
public:
    virtual ~TransportFactory() {}
    // nullptr when no HTTP stack is available.
    virtual std::shared_ptr<DeviceTransport> createCloud(const CloudCredentials& credentials) = 0;
    // nullptr when the transport kind is not available in this build.
    virtual std::shared_ptr<DeviceTransport> createLocal(const LocalTransportConfig& config) = 0;
};

class DefaultTransportFactory : public TransportFactory {
public:
    DefaultTransportFactory(std::shared_ptr<HttpClient> http, SocketFactory sockets,
                            uint32_t io_timeout_ms = DEFAULT_LOCAL_IO_TIMEOUT_MS);

    std::shared_ptr<DeviceTransport> createCloud(const CloudCredentials& credentials) override;
    std::shared_ptr<DeviceTransport> createLocal(const LocalTransportConfig& config) override;

private:
    std::shared_ptr<HttpClient> http_;
    SocketFactory sockets_;
    uint32_t io_timeout_ms_;
};
