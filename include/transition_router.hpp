#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "transition.hpp"

class ConnectionProber;

/**
 * @brief Offers the transitions available for an entry and drives one at a time.
 *
 * begin() starts at transition_select (or directly at a chosen transition);
 * every step() result that is not a form ends the flow. abandon() drops the
 * flow without touching the configuration. reauth is offered, ahead of the
 * mode changes, only while the reauth check reports a rejected cloud session.
 */
class TransitionRouter {
public:
    using ReauthCheck = std::function<bool(const std::string& entry_id)>;

    TransitionRouter(ConfigManager* config, ConnectionProber* prober);
    ~TransitionRouter();

    // Mode changes for the entry's connection type.
    static std::vector<TransitionType> availableFor(const FleetEntry& entry);
    // Mode changes plus reauth when the entry needs it.
    std::vector<TransitionType> offeredFor(const FleetEntry& entry) const;
    void setReauthCheck(ReauthCheck check) { reauth_check_ = check; }

    TransitionResult begin(const std::string& entry_id);
    TransitionResult begin(const std::string& entry_id, TransitionType type);
    TransitionResult step(const std::string& step_id, const FormInput* input);
    void abandon();

    bool active() const { return !entry_id_.empty(); }
    const std::string& entryId() const { return entry_id_; }
    const std::string& currentStep() const { return current_step_; }
    const TransitionBuilder* builder() const { return builder_.get(); }

private:
    TransitionResult selectForm(const FleetEntry& entry);
    TransitionResult track(const TransitionResult& result);
    std::unique_ptr<TransitionBuilder> create(TransitionType type, const FleetEntry& entry);

    ConfigManager* config_;
    ConnectionProber* prober_;
    ReauthCheck reauth_check_;
    std::string entry_id_;
    std::string current_step_;
    std::unique_ptr<TransitionBuilder> builder_;
};
