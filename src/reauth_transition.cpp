#include "../include/transitions.hpp"
#include "../include/connection_prober.hpp"
#include "../include/logger.hpp"

ReauthTransition::ReauthTransition(const TransitionRequest& request, ConfigManager* config, ConnectionProber* prober)
    : TransitionBuilder(request, config), prober_(prober) {}

bool ReauthTransition::validate() {
    const FleetEntry& e = entry();
    if (e.connection_type != ConnectionType::HTTP && e.connection_type != ConnectionType::HYBRID) {
        Logger::warn("[Transition] Entry %s has no cloud session to renew", e.entry_id.c_str());
        return false;
    }
    if (e.cloud.username.empty()) {
        Logger::warn("[Transition] Entry %s is missing a cloud username", e.entry_id.c_str());
        return false;
    }
    logStart();
    return true;
}

TransitionResult ReauthTransition::passwordForm() const {
    TransitionResult r = TransitionResult::form(STEP_REAUTH_CONFIRM);
    r.placeholders["username"] = entry().cloud.username;
    r.placeholders["entry_title"] = entry().title;
    return r;
}

TransitionResult ReauthTransition::collectInput(const std::string& step_id, const FormInput* input) {
    current_step_ = STEP_REAUTH_CONFIRM;
    if (step_id != STEP_REAUTH_CONFIRM || !input) return passwordForm();

    auto it = input->find("password");
    std::string password = it == input->end() ? "" : it->second;
    TransitionResult r = passwordForm();
    if (password.empty()) {
        r.errors["password"] = "password_required";
        return r;
    }

    CloudCredentials creds = entry().cloud;
    creds.password = password;
    ProbeResult probe;
    if (prober_) {
        probe = prober_->probeCloud(creds);
    } else {
        probe.error = "unknown";
        probe.message = "No connection prober configured";
    }
    if (!probe.ok) {
        r.errors["base"] = probe.error.empty() ? "unknown" : probe.error;
        r.placeholders["error_detail"] = probe.message;
        return r;
    }

    context_.validated_credentials = creds;
    login_ok_ = true;
    // The password form is the only confirmation this flow has.
    context_.warnings_shown = true;
    return execute();
}

TransitionResult ReauthTransition::execute() {
    if (!login_ok_) return TransitionResult::abort("login_required");
    FleetEntry updated = entry();
    updated.cloud = context_.validated_credentials;
    TransitionResult r = commit(updated, connectionTypeName(updated.connection_type));
    if (r.isSuccess()) {
        r.reason = REASON_REAUTH_SUCCESSFUL;
        Logger::info("[Transition] Cloud credentials renewed for entry %s", entry().entry_id.c_str());
    }
    return r;
}
