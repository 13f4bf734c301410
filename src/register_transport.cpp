#include "../include/local_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/modbus_frame.hpp"

RegisterTransport::RegisterTransport(const LocalTransportConfig& config, SocketFactory sockets, uint32_t io_timeout_ms)
    : config_(config), sockets_(sockets), io_timeout_ms_(io_timeout_ms) {}

RegisterTransport::~RegisterTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

std::string RegisterTransport::endpoint() const {
    return config_.host + ":" + std::to_string(config_.port);
}

// Every connect starts a fresh read set, also when the socket survived the last cycle.
void RegisterTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    clearCacheLocked();
    openLocked();
}

void RegisterTransport::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void RegisterTransport::openLocked() {
    if (socket_ && socket_->isOpen()) return;
    if (!socket_) {
        if (!sockets_) throw ConnectionException("No socket factory configured");
        socket_ = sockets_();
        if (!socket_) throw ConnectionException("Socket factory returned no client");
    }
    clearCacheLocked();
    Logger::debug("[Local] Connecting to %s", endpoint().c_str());
    socket_->open(config_.host, config_.port, io_timeout_ms_);
}

void RegisterTransport::closeLocked() {
    if (socket_ && socket_->isOpen()) {
        socket_->close();
        Logger::debug("[Local] Disconnected from %s", endpoint().c_str());
    }
    clearCacheLocked();
}

void RegisterTransport::clearCacheLocked() {
    input_.clear();
    holding_.clear();
    input_loaded_.clear();
    holding_loaded_.clear();
}

void RegisterTransport::checkSerial(const std::string& serial) const {
    if (!config_.serial.empty() && serial != config_.serial) {
        throw UnsupportedException("Local transport at " + endpoint() + " does not serve " + serial);
    }
}

void RegisterTransport::ensureInput(uint16_t start) {
    if (input_loaded_.count(start)) return;
    openLocked();
    try {
        input_.load(start, exchange(*socket_, MODBUS_READ_INPUT, start, REGISTER_BLOCK_SIZE));
    } catch (const TransportException& e) {
        Logger::warn("[Local] %s input block %u failed: %s", endpoint().c_str(), (unsigned)start, e.what());
        closeLocked();
        throw;
    }
    input_loaded_.insert(start);
}

void RegisterTransport::ensureHolding(uint16_t start) {
    if (holding_loaded_.count(start)) return;
    openLocked();
    try {
        holding_.load(start, exchange(*socket_, MODBUS_READ_HOLDING, start, REGISTER_BLOCK_SIZE));
    } catch (const TransportException& e) {
        Logger::warn("[Local] %s holding block %u failed: %s", endpoint().c_str(), (unsigned)start, e.what());
        closeLocked();
        throw;
    }
    holding_loaded_.insert(start);
}

std::string RegisterTransport::firmwareLocked() {
    ensureHolding(0);
    return holding_.ascii(HOLD_FIRMWARE, 4);
}

RawPayload RegisterTransport::readRuntime(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureInput(INPUT_BLOCK_RUNTIME);
    ensureInput(INPUT_BLOCK_ENERGY);
    ensureInput(INPUT_BLOCK_BATTERY);
    RawPayload payload = RegisterMap::decodeRuntime(input_);
    std::string fw = firmwareLocked();
    if (!fw.empty()) payload.values["fwCode"] = SensorValue(fw);
    return payload;
}

RawPayload RegisterTransport::readEnergy(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureInput(INPUT_BLOCK_RUNTIME);
    ensureInput(INPUT_BLOCK_ENERGY);
    return RegisterMap::decodeEnergy(input_);
}

BatteryReading RegisterTransport::readBattery(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureInput(INPUT_BLOCK_RUNTIME);
    ensureInput(INPUT_BLOCK_BATTERY);
    return RegisterMap::decodeBattery(input_);
}

RawPayload RegisterTransport::readMidbox(const std::string& serial) {
    (void)serial;
    throw UnsupportedException("GridBOSS data is only available from the cloud");
}

RawPayload RegisterTransport::readParallelEnergy(const std::string& master_serial) {
    (void)master_serial;
    throw UnsupportedException("Parallel group energy is only available from the cloud");
}

int RegisterTransport::readDeviceType(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureHolding(0);
    return holding_.u16(HOLD_DEVICE_TYPE);
}

std::string RegisterTransport::readFirmwareVersion(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    return firmwareLocked();
}

uint16_t RegisterTransport::readParallelConfig(const std::string& serial) {
    checkSerial(serial);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureHolding(INPUT_BLOCK_BATTERY);
    return holding_.u16(HOLD_PARALLEL_CONFIG);
}
