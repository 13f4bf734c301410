#include "../include/transition_router.hpp"
#include "../include/transitions.hpp"
#include "../include/logger.hpp"

TransitionRouter::TransitionRouter(ConfigManager* config, ConnectionProber* prober)
    : config_(config), prober_(prober) {}

TransitionRouter::~TransitionRouter() {}

std::vector<TransitionType> TransitionRouter::availableFor(const FleetEntry& entry) {
    switch (entry.connection_type) {
        case ConnectionType::HTTP:
            return {TransitionType::HTTP_TO_HYBRID};
        case ConnectionType::HYBRID: {
            std::vector<TransitionType> out = {TransitionType::HYBRID_TO_HTTP};
            if (entry.hybrid_local_type == "modbus") out.push_back(TransitionType::MODBUS_TO_DONGLE);
            if (entry.hybrid_local_type == "dongle") out.push_back(TransitionType::DONGLE_TO_MODBUS);
            return out;
        }
        case ConnectionType::MODBUS:
            return {TransitionType::MODBUS_TO_DONGLE};
        case ConnectionType::DONGLE:
            return {TransitionType::DONGLE_TO_MODBUS};
        case ConnectionType::LOCAL:
            break;
    }
    return {};
}

std::vector<TransitionType> TransitionRouter::offeredFor(const FleetEntry& entry) const {
    std::vector<TransitionType> out;
    bool has_cloud = entry.connection_type == ConnectionType::HTTP || entry.connection_type == ConnectionType::HYBRID;
    if (has_cloud && reauth_check_ && reauth_check_(entry.entry_id)) out.push_back(TransitionType::REAUTH);
    for (TransitionType t : availableFor(entry)) out.push_back(t);
    return out;
}

static const char* targetTypeName(TransitionType type, const FleetEntry& entry) {
    switch (type) {
        case TransitionType::HTTP_TO_HYBRID: return "hybrid";
        case TransitionType::HYBRID_TO_HTTP: return "http";
        case TransitionType::MODBUS_TO_DONGLE:
            return entry.connection_type == ConnectionType::HYBRID ? "hybrid" : "dongle";
        case TransitionType::DONGLE_TO_MODBUS:
            return entry.connection_type == ConnectionType::HYBRID ? "hybrid" : "modbus";
        case TransitionType::REAUTH:
            return connectionTypeName(entry.connection_type);
    }
    return "http";
}

std::unique_ptr<TransitionBuilder> TransitionRouter::create(TransitionType type, const FleetEntry& entry) {
    TransitionRequest request;
    request.type = type;
    request.source_type = connectionTypeName(entry.connection_type);
    request.target_type = targetTypeName(type, entry);
    request.entry = entry;
    switch (type) {
        case TransitionType::HTTP_TO_HYBRID:
            return std::unique_ptr<TransitionBuilder>(new HttpToHybridTransition(request, config_, prober_));
        case TransitionType::HYBRID_TO_HTTP:
            return std::unique_ptr<TransitionBuilder>(new HybridToHttpTransition(request, config_));
        case TransitionType::MODBUS_TO_DONGLE:
        case TransitionType::DONGLE_TO_MODBUS:
            return std::unique_ptr<TransitionBuilder>(new LocalSwapTransition(request, config_, prober_));
        case TransitionType::REAUTH:
            return std::unique_ptr<TransitionBuilder>(new ReauthTransition(request, config_, prober_));
    }
    return nullptr;
}

TransitionResult TransitionRouter::selectForm(const FleetEntry& entry) {
    TransitionResult r = TransitionResult::form(STEP_SELECT);
    for (TransitionType t : offeredFor(entry)) r.options.push_back(transitionTypeName(t));
    r.options.push_back("no_change");
    r.placeholders["current_type"] = connectionTypeName(entry.connection_type);
    r.placeholders["entry_title"] = entry.title;
    return r;
}

TransitionResult TransitionRouter::track(const TransitionResult& result) {
    if (result.finished()) {
        if (builder_) {
            Logger::info("[Transition] Flow for %s ended: %s", entry_id_.c_str(), result.reason.c_str());
        }
        builder_.reset();
        entry_id_.clear();
        current_step_.clear();
    } else {
        current_step_ = result.step_id;
    }
    return result;
}

TransitionResult TransitionRouter::begin(const std::string& entry_id) {
    abandon();
    FleetEntry entry;
    if (!config_ || !config_->getEntry(entry_id, entry)) return TransitionResult::abort("entry_not_found");
    if (offeredFor(entry).empty()) return TransitionResult::abort("no_transitions_available");
    entry_id_ = entry_id;
    return track(selectForm(entry));
}

TransitionResult TransitionRouter::begin(const std::string& entry_id, TransitionType type) {
    abandon();
    FleetEntry entry;
    if (!config_ || !config_->getEntry(entry_id, entry)) return TransitionResult::abort("entry_not_found");

    bool offered = false;
    for (TransitionType t : offeredFor(entry)) offered = offered || t == type;
    std::unique_ptr<TransitionBuilder> builder;
    if (offered) builder = create(type, entry);
    if (!builder || !builder->validate()) {
        Logger::warn("[Transition] %s is not possible for entry %s", transitionTypeName(type), entry_id.c_str());
        return TransitionResult::abort("invalid_transition");
    }
    entry_id_ = entry_id;
    builder_ = std::move(builder);
    return track(builder_->collectInput(builder_->firstStep(), nullptr));
}

TransitionResult TransitionRouter::step(const std::string& step_id, const FormInput* input) {
    if (!active()) return TransitionResult::abort("no_active_transition");

    if (!builder_) {
        // Still at the selection step.
        FleetEntry entry;
        if (!config_->getEntry(entry_id_, entry)) return track(TransitionResult::abort("entry_not_found"));
        if (step_id != STEP_SELECT || !input) return track(selectForm(entry));
        auto it = input->find("transition");
        std::string choice = it == input->end() ? "" : it->second;
        if (choice == "no_change") return track(TransitionResult::abort("no_change"));
        TransitionType type;
        if (!parseTransitionType(choice, type)) {
            TransitionResult r = selectForm(entry);
            r.errors["transition"] = "invalid_transition";
            return track(r);
        }
        std::string id = entry_id_;
        return begin(id, type);
    }
    return track(builder_->collectInput(step_id, input));
}

void TransitionRouter::abandon() {
    if (builder_ || !entry_id_.empty()) {
        Logger::info("[Transition] Flow for %s abandoned", entry_id_.c_str());
    }
    builder_.reset();
    entry_id_.clear();
    current_step_.clear();
}
