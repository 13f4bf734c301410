#pragma once
#include <stdint.h>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "types.hpp"

class ConfigStorage;

enum class ConnectionType { HTTP, MODBUS, DONGLE, HYBRID, LOCAL };
enum class LocalTransportType { MODBUS_TCP, WIFI_DONGLE };
// Feature flags are tri-state: an absent flag is not the same as false.
enum class Tristate { UNSET, YES, NO };

const char* connectionTypeName(ConnectionType type);
bool parseConnectionType(const std::string& name, ConnectionType& out);
const char* localTransportTypeName(LocalTransportType type);
bool parseLocalTransportType(const std::string& name, LocalTransportType& out);
// "modbus" / "dongle", the short form used for hybrid_local_type and transition names.
const char* localTransportShortName(LocalTransportType type);

struct LoggingConfig {
    std::string log_level;
};

struct PollingConfig {
    uint32_t cloud_interval_s;
    uint32_t local_interval_s;
    uint32_t min_interval_s;
    uint32_t max_interval_s;
    uint32_t device_timeout_ms;
};

struct CloudCredentials {
    std::string username;
    std::string password;
    std::string base_url;
    bool verify_ssl = true;
    std::string plant_id;
    std::string plant_name;

    bool isSet() const { return !username.empty() && !password.empty(); }
};

struct LocalTransportConfig {
    std::string serial;
    LocalTransportType type = LocalTransportType::MODBUS_TCP;
    std::string host;
    uint16_t port = 502;
    uint8_t unit_id = 1;
    std::string dongle_serial;
    std::string inverter_family;
};

struct DeviceConfig {
    std::string serial;
    DeviceType type = DeviceType::INVERTER;
    std::string model;
    std::string master_serial;
    Tristate supports_split_phase = Tristate::UNSET;
    Tristate supports_three_phase = Tristate::UNSET;
};

struct StationConfig {
    std::string name;
    std::string country;
    std::string timezone;
    std::string address;
};

struct FleetEntry {
    std::string entry_id;
    std::string title;
    ConnectionType connection_type = ConnectionType::HTTP;
    CloudCredentials cloud;
    std::string hybrid_local_type;
    std::vector<LocalTransportConfig> local_transports;
    std::vector<DeviceConfig> devices;
    StationConfig station;

    bool usesCloud() const {
        return connection_type == ConnectionType::HTTP || connection_type == ConnectionType::HYBRID;
    }
    bool hasLocalTransports() const { return !local_transports.empty(); }
    const LocalTransportConfig* localTransportFor(const std::string& serial) const;
};

constexpr uint16_t DEFAULT_MODBUS_PORT = 502;
constexpr uint16_t DEFAULT_DONGLE_PORT = 8000;
constexpr uint8_t DEFAULT_MODBUS_UNIT_ID = 1;
constexpr const char* DEFAULT_CLOUD_BASE_URL = "https://monitor.eg4electronics.com";
constexpr const char* DEFAULT_INVERTER_FAMILY = "PV_SERIES";
constexpr const char* BRAND_NAME = "EG4 Electronics";

std::string formatEntryTitle(ConnectionType mode, const std::string& name);

class ConfigManager {
public:
    using EntryChangedCallback = std::function<void(const FleetEntry&)>;

    ConfigManager(ConfigStorage* storage, const char* config_file = "/config/gridlink.json");
    ~ConfigManager();

    // Loads the persisted document, falling back to defaults.
    bool begin();

    LoggingConfig getLoggingConfig() const;
    PollingConfig getPollingConfig() const;
    std::vector<FleetEntry> getEntries() const;
    bool getEntry(const std::string& entry_id, FleetEntry& out) const;
    uint32_t pollIntervalFor(const FleetEntry& entry) const;

    bool validatePollingInterval(uint32_t interval_s, std::string& reason) const;
    bool validateLocalTransport(const LocalTransportConfig& transport, std::string& reason) const;
    bool validateEntry(const FleetEntry& entry, std::string& reason) const;

    bool addEntry(const FleetEntry& entry, std::string& reason);
    // Validates, swaps and persists in one step; the previous record is kept on failure.
    bool replaceEntry(const FleetEntry& entry, std::string& reason);
    bool setPollingIntervals(uint32_t cloud_s, uint32_t local_s, std::string& reason);
    void setEntryChangedCallback(EntryChangedCallback cb);

    bool loadFromJson(const std::string& json, std::string& reason);
    std::string toJson() const;
    bool save();

private:
    ConfigStorage* storage_ = nullptr;
    std::string config_file_;
    LoggingConfig logging_config_;
    PollingConfig polling_config_;
    std::vector<FleetEntry> entries_;
    EntryChangedCallback on_entry_changed_;
    mutable std::mutex mutex_;

    void initializeDefaults();
    bool persistLocked();
    std::string toJsonLocked() const;
};
