#include "../include/transport_factory.hpp"
#include "../include/cloud_api_client.hpp"

DefaultTransportFactory::DefaultTransportFactory(std::shared_ptr<HttpClient> http, SocketFactory sockets,
                                                 uint32_t io_timeout_ms)
    : http_(http), sockets_(sockets), io_timeout_ms_(io_timeout_ms) {}

std::shared_ptr<DeviceTransport> DefaultTransportFactory::createCloud(const CloudCredentials& credentials) {
    if (!http_) return nullptr;
    return std::make_shared<CloudApiClient>(credentials, http_);
}

std::shared_ptr<DeviceTransport> DefaultTransportFactory::createLocal(const LocalTransportConfig& config) {
    if (!sockets_) return nullptr;
    switch (config.type) {
        case LocalTransportType::MODBUS_TCP:
            return std::make_shared<ModbusTcpTransport>(config, sockets_, io_timeout_ms_);
        case LocalTransportType::WIFI_DONGLE:
            return std::make_shared<DongleTransport>(config, sockets_, io_timeout_ms_);
    }
    return nullptr;
}
