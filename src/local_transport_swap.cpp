#include "../include/transitions.hpp"
#include "../include/logger.hpp"

static const char* transportDisplay(LocalTransportType type) {
    return type == LocalTransportType::WIFI_DONGLE ? "WiFi Dongle" : "Modbus TCP";
}

LocalSwapTransition::LocalSwapTransition(const TransitionRequest& request, ConfigManager* config,
                                         ConnectionProber* prober)
    : LocalTransportStepBuilder(request, config, prober) {}

LocalTransportType LocalSwapTransition::sourceType() const {
    return type() == TransitionType::MODBUS_TO_DONGLE ? LocalTransportType::MODBUS_TCP : LocalTransportType::WIFI_DONGLE;
}

LocalTransportType LocalSwapTransition::targetType() const {
    return type() == TransitionType::MODBUS_TO_DONGLE ? LocalTransportType::WIFI_DONGLE : LocalTransportType::MODBUS_TCP;
}

std::string LocalSwapTransition::firstStep() const {
    return targetType() == LocalTransportType::WIFI_DONGLE ? STEP_DONGLE : STEP_MODBUS;
}

bool LocalSwapTransition::validate() {
    const FleetEntry& e = entry();
    std::string source_short = localTransportShortName(sourceType());
    bool mode_ok = false;
    if (e.connection_type == ConnectionType::HYBRID) {
        mode_ok = e.hybrid_local_type == source_short;
    } else if (sourceType() == LocalTransportType::MODBUS_TCP) {
        mode_ok = e.connection_type == ConnectionType::MODBUS;
    } else {
        mode_ok = e.connection_type == ConnectionType::DONGLE;
    }
    if (!mode_ok) {
        Logger::warn("[Transition] Entry %s does not use %s", e.entry_id.c_str(), transportDisplay(sourceType()));
        return false;
    }
    for (size_t i = 0; i < e.local_transports.size(); ++i) {
        if (e.local_transports[i].type == sourceType()) {
            replaced_index_ = (int)i;
            break;
        }
    }
    if (replaced_index_ < 0) {
        Logger::warn("[Transition] Entry %s has no %s transport to replace", e.entry_id.c_str(),
                     transportDisplay(sourceType()));
        return false;
    }
    if (e.usesCloud()) context_.validated_credentials = e.cloud;
    logStart();
    return true;
}

std::string LocalSwapTransition::defaultInverterSerial() const {
    if (replaced_index_ >= 0) return entry().local_transports[replaced_index_].serial;
    return LocalTransportStepBuilder::defaultInverterSerial();
}

FormInput LocalSwapTransition::transportDefaults(LocalTransportType type) const {
    FormInput d = LocalTransportStepBuilder::transportDefaults(type);
    if (replaced_index_ >= 0) {
        const LocalTransportConfig& old = entry().local_transports[replaced_index_];
        d["host"] = old.host;
        if (!old.inverter_family.empty()) d["inverter_family"] = old.inverter_family;
    }
    return d;
}

TransitionResult LocalSwapTransition::collectInput(const std::string& step_id, const FormInput* input) {
    if (step_id == STEP_CONFIRM && context_.has_local_transport) {
        current_step_ = STEP_CONFIRM;
        if (input) return execute();
        return onLocalTransportReady();
    }
    if (targetType() == LocalTransportType::WIFI_DONGLE) return handleDongle(step_id == STEP_DONGLE ? input : nullptr);
    return handleModbus(step_id == STEP_MODBUS ? input : nullptr);
}

TransitionResult LocalSwapTransition::onLocalTransportReady() {
    current_step_ = STEP_CONFIRM;
    const LocalTransportConfig& cfg = context_.local_transport_config;
    addWarning("Local transport for " + cfg.serial + " will change from " + transportDisplay(sourceType()) + " to " +
               transportDisplay(targetType()));
    return confirmForm(STEP_CONFIRM, {
        {"current_plant", currentPlant()},
        {"local_type", transportDisplay(targetType())},
        {"local_host", cfg.host + ":" + std::to_string(cfg.port)},
    });
}

TransitionResult LocalSwapTransition::execute() {
    if (!context_.has_local_transport || replaced_index_ < 0) return TransitionResult::abort("local_transport_required");
    FleetEntry updated = entry();
    updated.local_transports[replaced_index_] = context_.local_transport_config;
    if (updated.connection_type == ConnectionType::HYBRID) {
        updated.cloud = context_.validated_credentials;
        updated.hybrid_local_type = localTransportShortName(targetType());
        updated.title = formatEntryTitle(ConnectionType::HYBRID, displayName());
    } else {
        updated.connection_type =
            targetType() == LocalTransportType::WIFI_DONGLE ? ConnectionType::DONGLE : ConnectionType::MODBUS;
        updated.title = formatEntryTitle(updated.connection_type, displayName());
    }
    return commit(updated, transportDisplay(targetType()));
}
