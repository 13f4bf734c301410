#include "../include/config_manager.hpp"
#include "../include/config_storage.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <set>

const char* connectionTypeName(ConnectionType type) {
    switch (type) {
        case ConnectionType::HTTP: return "http";
        case ConnectionType::MODBUS: return "modbus";
        case ConnectionType::DONGLE: return "dongle";
        case ConnectionType::HYBRID: return "hybrid";
        case ConnectionType::LOCAL: return "local";
    }
    return "http";
}

bool parseConnectionType(const std::string& name, ConnectionType& out) {
    if (name == "http") { out = ConnectionType::HTTP; return true; }
    if (name == "modbus") { out = ConnectionType::MODBUS; return true; }
    if (name == "dongle") { out = ConnectionType::DONGLE; return true; }
    if (name == "hybrid") { out = ConnectionType::HYBRID; return true; }
    if (name == "local") { out = ConnectionType::LOCAL; return true; }
    return false;
}

const char* localTransportTypeName(LocalTransportType type) {
    return type == LocalTransportType::WIFI_DONGLE ? "wifi_dongle" : "modbus_tcp";
}

bool parseLocalTransportType(const std::string& name, LocalTransportType& out) {
    if (name == "modbus_tcp" || name == "modbus") { out = LocalTransportType::MODBUS_TCP; return true; }
    if (name == "wifi_dongle" || name == "dongle") { out = LocalTransportType::WIFI_DONGLE; return true; }
    return false;
}

const char* localTransportShortName(LocalTransportType type) {
    return type == LocalTransportType::WIFI_DONGLE ? "dongle" : "modbus";
}

const LocalTransportConfig* FleetEntry::localTransportFor(const std::string& serial) const {
    for (const auto& lt : local_transports) {
        if (lt.serial == serial) return &lt;
    }
    return nullptr;
}

std::string formatEntryTitle(ConnectionType mode, const std::string& name) {
    const char* mode_display = "Web Monitor";
    switch (mode) {
        case ConnectionType::HTTP: mode_display = "Web Monitor"; break;
        case ConnectionType::MODBUS: mode_display = "Modbus"; break;
        case ConnectionType::DONGLE: mode_display = "Dongle"; break;
        case ConnectionType::HYBRID: mode_display = "Hybrid"; break;
        case ConnectionType::LOCAL: mode_display = "Local"; break;
    }
    return std::string(BRAND_NAME) + " " + mode_display + " - " + name;
}

static Tristate readTristate(JsonVariantConst v) {
    if (v.isNull()) return Tristate::UNSET;
    return v.as<bool>() ? Tristate::YES : Tristate::NO;
}

static void writeEntry(JsonObject obj, const FleetEntry& entry) {
    obj["entry_id"] = entry.entry_id;
    obj["title"] = entry.title;
    obj["connection_type"] = connectionTypeName(entry.connection_type);
    if (!entry.cloud.username.empty()) {
        JsonObject cloud = obj.createNestedObject("cloud");
        cloud["username"] = entry.cloud.username;
        cloud["password"] = entry.cloud.password;
        cloud["base_url"] = entry.cloud.base_url;
        cloud["verify_ssl"] = entry.cloud.verify_ssl;
        cloud["plant_id"] = entry.cloud.plant_id;
        cloud["plant_name"] = entry.cloud.plant_name;
    }
    if (!entry.hybrid_local_type.empty()) obj["hybrid_local_type"] = entry.hybrid_local_type;
    if (!entry.local_transports.empty()) {
        JsonArray arr = obj.createNestedArray("local_transports");
        for (const auto& lt : entry.local_transports) {
            JsonObject t = arr.createNestedObject();
            t["serial"] = lt.serial;
            t["transport_type"] = localTransportTypeName(lt.type);
            t["host"] = lt.host;
            t["port"] = lt.port;
            t["unit_id"] = lt.unit_id;
            if (!lt.dongle_serial.empty()) t["dongle_serial"] = lt.dongle_serial;
            t["inverter_family"] = lt.inverter_family;
        }
    }
    JsonArray devices = obj.createNestedArray("devices");
    for (const auto& d : entry.devices) {
        JsonObject dev = devices.createNestedObject();
        dev["serial"] = d.serial;
        dev["type"] = deviceTypeName(d.type);
        dev["model"] = d.model;
        if (!d.master_serial.empty()) dev["master_serial"] = d.master_serial;
        if (d.supports_split_phase != Tristate::UNSET || d.supports_three_phase != Tristate::UNSET) {
            JsonObject features = dev.createNestedObject("features");
            if (d.supports_split_phase != Tristate::UNSET)
                features["supports_split_phase"] = d.supports_split_phase == Tristate::YES;
            if (d.supports_three_phase != Tristate::UNSET)
                features["supports_three_phase"] = d.supports_three_phase == Tristate::YES;
        }
    }
    JsonObject station = obj.createNestedObject("station");
    station["name"] = entry.station.name;
    station["country"] = entry.station.country;
    station["timezone"] = entry.station.timezone;
    station["address"] = entry.station.address;
}

static bool readEntry(JsonObjectConst obj, FleetEntry& entry, std::string& reason) {
    entry.entry_id = obj["entry_id"] | "";
    entry.title = obj["title"] | "";
    std::string conn = obj["connection_type"] | "http";
    if (!parseConnectionType(conn, entry.connection_type)) {
        reason = "Unknown connection_type: " + conn;
        return false;
    }
    JsonObjectConst cloud = obj["cloud"].as<JsonObjectConst>();
    if (!cloud.isNull()) {
        entry.cloud.username = cloud["username"] | "";
        entry.cloud.password = cloud["password"] | "";
        entry.cloud.base_url = cloud["base_url"] | DEFAULT_CLOUD_BASE_URL;
        entry.cloud.verify_ssl = cloud["verify_ssl"] | true;
        entry.cloud.plant_id = cloud["plant_id"] | "";
        entry.cloud.plant_name = cloud["plant_name"] | "";
    }
    entry.hybrid_local_type = obj["hybrid_local_type"] | "";
    for (JsonVariantConst item : obj["local_transports"].as<JsonArrayConst>()) {
        JsonObjectConst t = item.as<JsonObjectConst>();
        LocalTransportConfig lt;
        lt.serial = t["serial"] | "";
        std::string type = t["transport_type"] | "modbus_tcp";
        if (!parseLocalTransportType(type, lt.type)) {
            reason = "Unknown transport_type: " + type;
            return false;
        }
        lt.host = t["host"] | "";
        uint16_t default_port = lt.type == LocalTransportType::WIFI_DONGLE ? DEFAULT_DONGLE_PORT : DEFAULT_MODBUS_PORT;
        lt.port = t["port"] | default_port;
        lt.unit_id = t["unit_id"] | DEFAULT_MODBUS_UNIT_ID;
        lt.dongle_serial = t["dongle_serial"] | "";
        lt.inverter_family = t["inverter_family"] | DEFAULT_INVERTER_FAMILY;
        entry.local_transports.push_back(lt);
    }
    for (JsonVariantConst item : obj["devices"].as<JsonArrayConst>()) {
        JsonObjectConst dev = item.as<JsonObjectConst>();
        DeviceConfig d;
        d.serial = dev["serial"] | "";
        std::string type = dev["type"] | "inverter";
        if (!parseDeviceType(type, d.type)) {
            reason = "Unknown device type: " + type;
            return false;
        }
        d.model = dev["model"] | "";
        d.master_serial = dev["master_serial"] | "";
        JsonObjectConst features = dev["features"].as<JsonObjectConst>();
        if (!features.isNull()) {
            d.supports_split_phase = readTristate(features["supports_split_phase"]);
            d.supports_three_phase = readTristate(features["supports_three_phase"]);
        }
        entry.devices.push_back(d);
    }
    JsonObjectConst station = obj["station"].as<JsonObjectConst>();
    entry.station.name = station["name"] | "";
    entry.station.country = station["country"] | "";
    entry.station.timezone = station["timezone"] | "";
    entry.station.address = station["address"] | "";
    return true;
}

ConfigManager::ConfigManager(ConfigStorage* storage, const char* config_file)
    : storage_(storage), config_file_(config_file ? config_file : "/config/gridlink.json") {
    initializeDefaults();
}

ConfigManager::~ConfigManager() {}

void ConfigManager::initializeDefaults() {
    logging_config_.log_level = "INFO";

    polling_config_.cloud_interval_s = 30;
    polling_config_.local_interval_s = 5;
    polling_config_.min_interval_s = 5;
    polling_config_.max_interval_s = 300;
    polling_config_.device_timeout_ms = 20000;

    entries_.clear();
}

bool ConfigManager::begin() {
    std::string raw;
    if (!storage_ || !storage_->read(config_file_, raw) || raw.empty()) {
        Logger::info("[ConfigMgr] No configuration at %s, using defaults", config_file_.c_str());
        return false;
    }
    std::string reason;
    if (!loadFromJson(raw, reason)) {
        Logger::error("[ConfigMgr] Failed to load %s: %s", config_file_.c_str(), reason.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        initializeDefaults();
        return false;
    }
    Logger::info("[ConfigMgr] Loaded %u fleet entries", (unsigned)getEntries().size());
    return true;
}

bool ConfigManager::loadFromJson(const std::string& json, std::string& reason) {
    DynamicJsonDocument doc(json.size() * 2 + 1024);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        reason = std::string("JSON parse error: ") + err.c_str();
        return false;
    }

    LoggingConfig logging;
    logging.log_level = doc["logging"]["log_level"] | "INFO";

    PollingConfig polling;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        polling = polling_config_;
    }
    JsonObjectConst p = doc["polling"].as<JsonObjectConst>();
    polling.cloud_interval_s = p["cloud_interval_s"] | polling.cloud_interval_s;
    polling.local_interval_s = p["local_interval_s"] | polling.local_interval_s;
    polling.device_timeout_ms = p["device_timeout_ms"] | polling.device_timeout_ms;
    if (!validatePollingInterval(polling.cloud_interval_s, reason)) return false;
    if (!validatePollingInterval(polling.local_interval_s, reason)) return false;

    std::vector<FleetEntry> entries;
    std::set<std::string> ids;
    for (JsonVariantConst item : doc["entries"].as<JsonArrayConst>()) {
        FleetEntry entry;
        if (!readEntry(item.as<JsonObjectConst>(), entry, reason)) return false;
        if (!validateEntry(entry, reason)) return false;
        if (!ids.insert(entry.entry_id).second) {
            reason = "Duplicate entry_id: " + entry.entry_id;
            return false;
        }
        entries.push_back(entry);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    logging_config_ = logging;
    polling_config_ = polling;
    entries_ = entries;
    return true;
}

std::string ConfigManager::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return toJsonLocked();
}

std::string ConfigManager::toJsonLocked() const {
    DynamicJsonDocument doc(4096 + entries_.size() * 4096);
    doc["logging"]["log_level"] = logging_config_.log_level;
    JsonObject polling = doc.createNestedObject("polling");
    polling["cloud_interval_s"] = polling_config_.cloud_interval_s;
    polling["local_interval_s"] = polling_config_.local_interval_s;
    polling["device_timeout_ms"] = polling_config_.device_timeout_ms;
    JsonArray arr = doc.createNestedArray("entries");
    for (const auto& entry : entries_) {
        writeEntry(arr.createNestedObject(), entry);
    }
    std::string out;
    serializeJson(doc, out);
    return out;
}

bool ConfigManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    return persistLocked();
}

bool ConfigManager::persistLocked() {
    if (!storage_) return false;
    if (!storage_->write(config_file_, toJsonLocked())) {
        Logger::error("[ConfigMgr] Failed to write %s", config_file_.c_str());
        return false;
    }
    return true;
}

LoggingConfig ConfigManager::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logging_config_;
}

PollingConfig ConfigManager::getPollingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polling_config_;
}

std::vector<FleetEntry> ConfigManager::getEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool ConfigManager::getEntry(const std::string& entry_id, FleetEntry& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.entry_id == entry_id) {
            out = e;
            return true;
        }
    }
    return false;
}

uint32_t ConfigManager::pollIntervalFor(const FleetEntry& entry) const {
    PollingConfig p = getPollingConfig();
    return entry.hasLocalTransports() ? p.local_interval_s : p.cloud_interval_s;
}

bool ConfigManager::validatePollingInterval(uint32_t interval_s, std::string& reason) const {
    if (interval_s < polling_config_.min_interval_s) {
        reason = "Polling interval too low (min: " + std::to_string(polling_config_.min_interval_s) + " s)";
        return false;
    }
    if (interval_s > polling_config_.max_interval_s) {
        reason = "Polling interval too high (max: " + std::to_string(polling_config_.max_interval_s) + " s)";
        return false;
    }
    return true;
}

bool ConfigManager::validateLocalTransport(const LocalTransportConfig& transport, std::string& reason) const {
    if (transport.host.empty()) {
        reason = "Local transport for " + transport.serial + " has no host";
        return false;
    }
    if (transport.port == 0) {
        reason = "Local transport for " + transport.serial + " has invalid port 0";
        return false;
    }
    if (transport.type == LocalTransportType::WIFI_DONGLE && transport.dongle_serial.size() != 10) {
        reason = "Dongle serial must be 10 characters";
        return false;
    }
    if (transport.serial.size() != 10) {
        reason = "Inverter serial must be 10 characters";
        return false;
    }
    return true;
}

bool ConfigManager::validateEntry(const FleetEntry& entry, std::string& reason) const {
    if (entry.entry_id.empty()) {
        reason = "Entry id is empty";
        return false;
    }
    if (entry.usesCloud() && !entry.cloud.isSet()) {
        reason = "Entry " + entry.entry_id + " needs cloud credentials";
        return false;
    }
    switch (entry.connection_type) {
        case ConnectionType::HTTP:
            if (entry.hasLocalTransports()) {
                reason = "Cloud-only entry " + entry.entry_id + " must not carry local transports";
                return false;
            }
            break;
        case ConnectionType::MODBUS:
        case ConnectionType::DONGLE: {
            LocalTransportType expected = entry.connection_type == ConnectionType::MODBUS
                ? LocalTransportType::MODBUS_TCP : LocalTransportType::WIFI_DONGLE;
            if (entry.local_transports.size() != 1 || entry.local_transports[0].type != expected) {
                reason = std::string("Entry ") + entry.entry_id + " needs exactly one " +
                         localTransportTypeName(expected) + " transport";
                return false;
            }
            break;
        }
        case ConnectionType::HYBRID:
        case ConnectionType::LOCAL:
            if (!entry.hasLocalTransports()) {
                reason = "Entry " + entry.entry_id + " needs at least one local transport";
                return false;
            }
            break;
    }
    for (const auto& lt : entry.local_transports) {
        if (!validateLocalTransport(lt, reason)) return false;
    }
    std::set<std::string> serials;
    for (const auto& d : entry.devices) {
        if (d.serial.empty()) {
            reason = "Device with empty serial in entry " + entry.entry_id;
            return false;
        }
        if (!serials.insert(d.serial).second) {
            reason = "Duplicate device serial: " + d.serial;
            return false;
        }
        if (d.type == DeviceType::PARALLEL_GROUP && d.master_serial.empty()) {
            reason = "Parallel group " + d.serial + " has no master_serial";
            return false;
        }
    }
    return true;
}

bool ConfigManager::addEntry(const FleetEntry& entry, std::string& reason) {
    if (!validateEntry(entry, reason)) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : entries_) {
            if (e.entry_id == entry.entry_id) {
                reason = "Duplicate entry_id: " + entry.entry_id;
                return false;
            }
        }
        entries_.push_back(entry);
        if (!persistLocked()) {
            entries_.pop_back();
            reason = "Failed to persist configuration";
            return false;
        }
    }
    Logger::info("[ConfigMgr] Added entry %s (%s)", entry.entry_id.c_str(), connectionTypeName(entry.connection_type));
    return true;
}

bool ConfigManager::replaceEntry(const FleetEntry& entry, std::string& reason) {
    if (!validateEntry(entry, reason)) {
        Logger::warn("[ConfigMgr] Rejected update for %s: %s", entry.entry_id.c_str(), reason.c_str());
        return false;
    }
    EntryChangedCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        FleetEntry* target = nullptr;
        for (auto& e : entries_) {
            if (e.entry_id == entry.entry_id) {
                target = &e;
                break;
            }
        }
        if (!target) {
            reason = "Unknown entry: " + entry.entry_id;
            return false;
        }
        FleetEntry previous = *target;
        *target = entry;
        if (!persistLocked()) {
            *target = previous;
            reason = "Failed to persist configuration";
            return false;
        }
        cb = on_entry_changed_;
    }
    Logger::info("[ConfigMgr] Entry %s updated (%s)", entry.entry_id.c_str(), connectionTypeName(entry.connection_type));
    if (cb) cb(entry);
    return true;
}

bool ConfigManager::setPollingIntervals(uint32_t cloud_s, uint32_t local_s, std::string& reason) {
    if (!validatePollingInterval(cloud_s, reason)) return false;
    if (!validatePollingInterval(local_s, reason)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    PollingConfig previous = polling_config_;
    polling_config_.cloud_interval_s = cloud_s;
    polling_config_.local_interval_s = local_s;
    if (!persistLocked()) {
        polling_config_ = previous;
        reason = "Failed to persist configuration";
        return false;
    }
    return true;
}

void ConfigManager::setEntryChangedCallback(EntryChangedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_entry_changed_ = cb;
}
