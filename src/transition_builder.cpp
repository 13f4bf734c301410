#include "../include/transition.hpp"
#include "../include/transitions.hpp"
#include "../include/connection_prober.hpp"
#include "../include/logger.hpp"
#include <cstdlib>

const char* transitionTypeName(TransitionType type) {
    switch (type) {
        case TransitionType::HTTP_TO_HYBRID: return "http_to_hybrid";
        case TransitionType::HYBRID_TO_HTTP: return "hybrid_to_http";
        case TransitionType::MODBUS_TO_DONGLE: return "modbus_to_dongle";
        case TransitionType::DONGLE_TO_MODBUS: return "dongle_to_modbus";
        case TransitionType::REAUTH: return "reauth";
    }
    return "http_to_hybrid";
}

bool parseTransitionType(const std::string& name, TransitionType& out) {
    if (name == "http_to_hybrid") { out = TransitionType::HTTP_TO_HYBRID; return true; }
    if (name == "hybrid_to_http") { out = TransitionType::HYBRID_TO_HTTP; return true; }
    if (name == "modbus_to_dongle") { out = TransitionType::MODBUS_TO_DONGLE; return true; }
    if (name == "dongle_to_modbus") { out = TransitionType::DONGLE_TO_MODBUS; return true; }
    if (name == "reauth") { out = TransitionType::REAUTH; return true; }
    return false;
}

TransitionResult TransitionResult::form(const std::string& step_id) {
    TransitionResult r;
    r.kind = FORM;
    r.step_id = step_id;
    r.placeholders["brand_name"] = BRAND_NAME;
    return r;
}

TransitionResult TransitionResult::abort(const std::string& reason) {
    TransitionResult r;
    r.kind = ABORT;
    r.reason = reason;
    r.placeholders["brand_name"] = BRAND_NAME;
    return r;
}

TransitionBuilder::TransitionBuilder(const TransitionRequest& request, ConfigManager* config) : config_(config) {
    context_.request = request;
}

void TransitionBuilder::addWarning(const std::string& warning) {
    for (const auto& w : context_.warnings) {
        if (w == warning) return;
    }
    context_.warnings.push_back(warning);
}

TransitionResult TransitionBuilder::confirmForm(const std::string& step_id,
                                                std::map<std::string, std::string> placeholders) {
    TransitionResult r = TransitionResult::form(step_id);
    std::string text;
    for (const auto& w : context_.warnings) {
        if (!text.empty()) text += "\n";
        text += "- " + w;
    }
    placeholders["warnings"] = text.empty() ? "No warnings." : text;
    for (const auto& kv : placeholders) r.placeholders[kv.first] = kv.second;
    context_.warnings_shown = true;
    return r;
}

TransitionResult TransitionBuilder::commit(FleetEntry updated, const std::string& new_type_display) {
    if (!context_.warnings_shown) {
        Logger::warn("[Transition] %s for %s refused: warnings not confirmed", transitionTypeName(type()),
                     entry().entry_id.c_str());
        return TransitionResult::abort("confirmation_required");
    }
    std::string reason;
    if (!config_ || !config_->replaceEntry(updated, reason)) {
        Logger::error("[Transition] %s for %s failed: %s", transitionTypeName(type()), entry().entry_id.c_str(),
                      reason.c_str());
        TransitionResult r = TransitionResult::abort("update_failed");
        r.placeholders["error"] = reason;
        return r;
    }
    Logger::info("[Transition] %s -> %s completed for entry %s", context_.request.source_type.c_str(),
                 context_.request.target_type.c_str(), entry().entry_id.c_str());
    TransitionResult r;
    r.kind = TransitionResult::SUCCESS;
    r.reason = REASON_TRANSITION_SUCCESSFUL;
    r.placeholders["brand_name"] = BRAND_NAME;
    r.placeholders["new_type"] = new_type_display;
    return r;
}

std::string TransitionBuilder::displayName() const {
    const FleetEntry& e = entry();
    if (!e.cloud.plant_name.empty()) return e.cloud.plant_name;
    if (!e.station.name.empty()) return e.station.name;
    if (!e.local_transports.empty() && !e.local_transports.front().serial.empty()) {
        return e.local_transports.front().serial;
    }
    return e.entry_id;
}

std::string TransitionBuilder::currentPlant() const {
    return entry().cloud.plant_name.empty() ? "Unknown" : entry().cloud.plant_name;
}

void TransitionBuilder::logStart() const {
    Logger::info("[Transition] Starting %s -> %s for entry %s", context_.request.source_type.c_str(),
                 context_.request.target_type.c_str(), entry().entry_id.c_str());
}

// --- Local transport steps ---

static std::string fieldOr(const FormInput& input, const char* key, const std::string& fallback) {
    auto it = input.find(key);
    return it == input.end() || it->second.empty() ? fallback : it->second;
}

static bool parseNumber(const std::string& text, long min, long max, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long v = strtol(text.c_str(), &end, 10);
    if (!end || *end != '\0' || v < min || v > max) return false;
    out = v;
    return true;
}

LocalTransportStepBuilder::LocalTransportStepBuilder(const TransitionRequest& request, ConfigManager* config,
                                                     ConnectionProber* prober)
    : TransitionBuilder(request, config), prober_(prober) {}

FormInput LocalTransportStepBuilder::transportDefaults(LocalTransportType type) const {
    FormInput d;
    d["port"] = std::to_string(type == LocalTransportType::WIFI_DONGLE ? DEFAULT_DONGLE_PORT : DEFAULT_MODBUS_PORT);
    if (type == LocalTransportType::MODBUS_TCP) d["unit_id"] = std::to_string(DEFAULT_MODBUS_UNIT_ID);
    d["inverter_serial"] = defaultInverterSerial();
    d["inverter_family"] = DEFAULT_INVERTER_FAMILY;
    return d;
}

std::string LocalTransportStepBuilder::defaultInverterSerial() const {
    std::string serial;
    for (const auto& dev : entry().devices) {
        if (dev.type != DeviceType::INVERTER) continue;
        if (!serial.empty()) return "";  // ambiguous
        serial = dev.serial;
    }
    return serial;
}

TransitionResult LocalTransportStepBuilder::handleModbus(const FormInput* input) {
    current_step_ = STEP_MODBUS;
    if (!input) {
        TransitionResult r = TransitionResult::form(STEP_MODBUS);
        r.defaults = transportDefaults(LocalTransportType::MODBUS_TCP);
        return r;
    }

    TransitionResult r = TransitionResult::form(STEP_MODBUS);
    LocalTransportConfig cfg;
    cfg.type = LocalTransportType::MODBUS_TCP;
    cfg.host = fieldOr(*input, "host", "");
    cfg.serial = fieldOr(*input, "inverter_serial", defaultInverterSerial());
    cfg.inverter_family = fieldOr(*input, "inverter_family", DEFAULT_INVERTER_FAMILY);
    long port = 0, unit = 0;
    if (cfg.host.empty()) r.errors["host"] = "host_required";
    if (!parseNumber(fieldOr(*input, "port", std::to_string(DEFAULT_MODBUS_PORT)), 1, 65535, port)) {
        r.errors["port"] = "invalid_port";
    }
    if (!parseNumber(fieldOr(*input, "unit_id", std::to_string(DEFAULT_MODBUS_UNIT_ID)), 1, 247, unit)) {
        r.errors["unit_id"] = "invalid_unit_id";
    }
    if (cfg.serial.size() != 10) r.errors["inverter_serial"] = "invalid_inverter_serial";
    if (!r.errors.empty()) {
        r.defaults = *input;
        return r;
    }
    cfg.port = (uint16_t)port;
    cfg.unit_id = (uint8_t)unit;
    return probeAndContinue(STEP_MODBUS, cfg, *input);
}

TransitionResult LocalTransportStepBuilder::handleDongle(const FormInput* input) {
    current_step_ = STEP_DONGLE;
    if (!input) {
        TransitionResult r = TransitionResult::form(STEP_DONGLE);
        r.defaults = transportDefaults(LocalTransportType::WIFI_DONGLE);
        return r;
    }

    TransitionResult r = TransitionResult::form(STEP_DONGLE);
    LocalTransportConfig cfg;
    cfg.type = LocalTransportType::WIFI_DONGLE;
    cfg.host = fieldOr(*input, "host", "");
    cfg.dongle_serial = fieldOr(*input, "dongle_serial", "");
    cfg.serial = fieldOr(*input, "inverter_serial", defaultInverterSerial());
    cfg.inverter_family = fieldOr(*input, "inverter_family", DEFAULT_INVERTER_FAMILY);
    long port = 0;
    if (cfg.host.empty()) r.errors["host"] = "host_required";
    if (!parseNumber(fieldOr(*input, "port", std::to_string(DEFAULT_DONGLE_PORT)), 1, 65535, port)) {
        r.errors["port"] = "invalid_port";
    }
    if (cfg.dongle_serial.size() != 10) r.errors["dongle_serial"] = "invalid_dongle_serial";
    if (cfg.serial.size() != 10) r.errors["inverter_serial"] = "invalid_inverter_serial";
    if (!r.errors.empty()) {
        r.defaults = *input;
        return r;
    }
    cfg.port = (uint16_t)port;
    return probeAndContinue(STEP_DONGLE, cfg, *input);
}

TransitionResult LocalTransportStepBuilder::probeAndContinue(const std::string& step_id,
                                                             const LocalTransportConfig& cfg,
                                                             const FormInput& input) {
    ProbeResult probe;
    if (prober_) {
        probe = prober_->probe(cfg);
    } else {
        probe.error = "unknown";
        probe.message = "No connection prober configured";
    }
    if (!probe.ok) {
        TransitionResult r = TransitionResult::form(step_id);
        r.errors["base"] = probe.error.empty() ? "unknown" : probe.error;
        r.placeholders["error_detail"] = probe.message;
        r.defaults = input;
        return r;
    }

    context_.local_transport_config = cfg;
    context_.has_local_transport = true;
    context_.test_results["device_type"] = std::to_string(probe.device_type);
    context_.test_results["firmware_version"] = probe.firmware_version;
    return onLocalTransportReady();
}
