#include "../include/transitions.hpp"
#include "../include/logger.hpp"

static const char* localTypeDisplay(const std::string& short_name) {
    if (short_name == "modbus") return "Modbus TCP (RS485 adapter - fastest)";
    if (short_name == "dongle") return "WiFi Dongle (no extra hardware)";
    return "Unknown";
}

HttpToHybridTransition::HttpToHybridTransition(const TransitionRequest& request, ConfigManager* config,
                                               ConnectionProber* prober)
    : LocalTransportStepBuilder(request, config, prober) {}

bool HttpToHybridTransition::validate() {
    const FleetEntry& e = entry();
    if (e.connection_type != ConnectionType::HTTP) {
        Logger::warn("[Transition] Cannot move non-HTTP entry %s to hybrid", e.entry_id.c_str());
        return false;
    }
    if (!e.cloud.isSet() || e.cloud.plant_id.empty()) {
        Logger::warn("[Transition] Entry %s is missing cloud credentials", e.entry_id.c_str());
        return false;
    }
    context_.validated_credentials = e.cloud;
    logStart();
    return true;
}

TransitionResult HttpToHybridTransition::collectInput(const std::string& step_id, const FormInput* input) {
    if (step_id == STEP_SELECT_LOCAL_TYPE) return handleSelectLocalType(input);
    if (step_id == STEP_MODBUS) return handleModbus(input);
    if (step_id == STEP_DONGLE) return handleDongle(input);
    if (step_id == STEP_CONFIRM) return handleConfirm(input);
    return handleSelectLocalType(nullptr);
}

TransitionResult HttpToHybridTransition::handleSelectLocalType(const FormInput* input) {
    current_step_ = STEP_SELECT_LOCAL_TYPE;
    TransitionResult r = TransitionResult::form(STEP_SELECT_LOCAL_TYPE);
    r.options = {"modbus", "dongle"};
    r.placeholders["current_plant"] = currentPlant();
    if (input) {
        auto it = input->find("local_type");
        std::string choice = it == input->end() ? "" : it->second;
        if (choice == "modbus") {
            local_type_ = choice;
            return handleModbus(nullptr);
        }
        if (choice == "dongle") {
            local_type_ = choice;
            return handleDongle(nullptr);
        }
        r.errors["local_type"] = "invalid_local_type";
    }
    return r;
}

TransitionResult HttpToHybridTransition::onLocalTransportReady() {
    local_type_ = localTransportShortName(context_.local_transport_config.type);
    uint32_t cloud_s = 30, local_s = 5;
    if (config_) {
        PollingConfig p = config_->getPollingConfig();
        cloud_s = p.cloud_interval_s;
        local_s = p.local_interval_s;
    }
    addWarning("Polling interval will change from " + std::to_string(cloud_s) + "s to " + std::to_string(local_s) +
               "s. Local transport gives faster updates but adds local network traffic.");
    return handleConfirm(nullptr);
}

TransitionResult HttpToHybridTransition::handleConfirm(const FormInput* input) {
    if (!context_.has_local_transport) {
        // Confirmation is only reachable after a successful probe.
        return handleSelectLocalType(nullptr);
    }
    current_step_ = STEP_CONFIRM;
    if (input) return execute();
    const LocalTransportConfig& cfg = context_.local_transport_config;
    return confirmForm(STEP_CONFIRM, {
        {"current_plant", currentPlant()},
        {"local_type", localTypeDisplay(local_type_)},
        {"local_host", cfg.host + ":" + std::to_string(cfg.port)},
    });
}

TransitionResult HttpToHybridTransition::execute() {
    if (!context_.has_local_transport) return TransitionResult::abort("local_transport_required");
    FleetEntry updated = entry();
    updated.connection_type = ConnectionType::HYBRID;
    updated.cloud = context_.validated_credentials;
    updated.hybrid_local_type = localTransportShortName(context_.local_transport_config.type);
    updated.local_transports.clear();
    updated.local_transports.push_back(context_.local_transport_config);
    updated.title = formatEntryTitle(ConnectionType::HYBRID, displayName());
    return commit(updated, "Hybrid (Cloud + Local)");
}
