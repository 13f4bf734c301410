#include "../include/transitions.hpp"
#include "../include/logger.hpp"

static const char* removalDisplay(const std::string& hybrid_local_type) {
    if (hybrid_local_type == "modbus") return "Modbus TCP";
    if (hybrid_local_type == "dongle") return "WiFi Dongle";
    return "local transport";
}

HybridToHttpTransition::HybridToHttpTransition(const TransitionRequest& request, ConfigManager* config)
    : TransitionBuilder(request, config) {}

bool HybridToHttpTransition::validate() {
    const FleetEntry& e = entry();
    if (e.connection_type != ConnectionType::HYBRID) {
        Logger::warn("[Transition] Cannot move non-hybrid entry %s to HTTP", e.entry_id.c_str());
        return false;
    }
    if (!e.cloud.isSet()) {
        Logger::warn("[Transition] Entry %s has no cloud credentials to fall back to", e.entry_id.c_str());
        return false;
    }
    context_.validated_credentials = e.cloud;
    logStart();

    uint32_t cloud_s = config_ ? config_->getPollingConfig().cloud_interval_s : 30;
    addWarning(std::string("Removing ") + removalDisplay(e.hybrid_local_type) +
               " will switch to cloud-only polling (" + std::to_string(cloud_s) + "s intervals).");
    addWarning("You can re-add local transport later by transitioning back to Hybrid mode.");
    return true;
}

TransitionResult HybridToHttpTransition::collectInput(const std::string& step_id, const FormInput* input) {
    (void)step_id;
    current_step_ = STEP_CONFIRM_REMOVAL;
    if (input && context_.warnings_shown) return execute();

    const FleetEntry& e = entry();
    std::string host = "N/A";
    if (!e.local_transports.empty()) {
        host = e.local_transports.front().host + ":" + std::to_string(e.local_transports.front().port);
    }
    std::string display = removalDisplay(e.hybrid_local_type);
    return confirmForm(STEP_CONFIRM_REMOVAL, {
        {"current_plant", currentPlant()},
        {"local_type", display == "local transport" ? "Unknown" : display},
        {"local_host", host},
    });
}

TransitionResult HybridToHttpTransition::execute() {
    FleetEntry updated = entry();
    updated.connection_type = ConnectionType::HTTP;
    updated.cloud = context_.validated_credentials;
    updated.hybrid_local_type.clear();
    updated.local_transports.clear();
    updated.title = formatEntryTitle(ConnectionType::HTTP, displayName());
    return commit(updated, "Cloud API (HTTP)");
}
