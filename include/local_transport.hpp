#pragma once
#include <stdint.h>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "device_transport.hpp"
#include "register_map.hpp"
#include "socket_client.hpp"

using SocketFactory = std::function<std::unique_ptr<SocketClient>()>;

constexpr uint32_t DEFAULT_LOCAL_IO_TIMEOUT_MS = 5000;

/**
 * @brief Shared register-reading logic for the Modbus TCP and dongle drivers.
 *
 * Register blocks are cached for the lifetime of one connection, so a poll
 * cycle reads each block once. Any I/O or framing failure drops the
 * connection; the next call reconnects.
 */
class RegisterTransport : public DeviceTransport {
public:
    RegisterTransport(const LocalTransportConfig& config, SocketFactory sockets, uint32_t io_timeout_ms);
    ~RegisterTransport() override;

    std::string endpoint() const override;
    // One TCP stream per inverter: calls must not interleave.
    bool isSessionSafe() const override { return false; }
    bool keepsSession() const override { return false; }

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

    const LocalTransportConfig& config() const { return config_; }

protected:
    // One request/response round trip; returns the register values.
    virtual std::vector<uint16_t> exchange(SocketClient& socket, uint8_t function, uint16_t start, uint16_t count) = 0;
    uint32_t ioTimeout() const { return io_timeout_ms_; }

private:
    void checkSerial(const std::string& serial) const;
    void openLocked();
    void closeLocked();
    void clearCacheLocked();
    void ensureInput(uint16_t start);
    void ensureHolding(uint16_t start);
    std::string firmwareLocked();

    LocalTransportConfig config_;
    SocketFactory sockets_;
    uint32_t io_timeout_ms_;
    std::unique_ptr<SocketClient> socket_;
    RegisterBank input_;
    RegisterBank holding_;
    std::set<uint16_t> input_loaded_;
    std::set<uint16_t> holding_loaded_;
    std::mutex mutex_;
};

// Direct Modbus TCP (MBAP framing) to an RS485 adapter or the inverter itself.
class ModbusTcpTransport : public RegisterTransport {
public:
    ModbusTcpTransport(const LocalTransportConfig& config, SocketFactory sockets,
                       uint32_t io_timeout_ms = DEFAULT_LOCAL_IO_TIMEOUT_MS);
    TransportKind kind() const override { return TransportKind::MODBUS_TCP; }

protected:
    std::vector<uint16_t> exchange(SocketClient& socket, uint8_t function, uint16_t start, uint16_t count) override;

private:
    uint16_t transaction_id_ = 0;
};

// Vendor WiFi dongle protocol on port 8000.
class DongleTransport : public RegisterTransport {
public:
    DongleTransport(const LocalTransportConfig& config, SocketFactory sockets,
                    uint32_t io_timeout_ms = DEFAULT_LOCAL_IO_TIMEOUT_MS);
    TransportKind kind() const override { return TransportKind::WIFI_DONGLE; }

protected:
    std::vector<uint16_t> exchange(SocketClient& socket, uint8_t function, uint16_t start, uint16_t count) override;
};
