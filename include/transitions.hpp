#pragma once
#include <string>
#include "transition.hpp"

class ConnectionProber;

// Shared Modbus / dongle configuration steps with the connectivity probe.
class LocalTransportStepBuilder : public TransitionBuilder {
public:
    LocalTransportStepBuilder(const TransitionRequest& request, ConfigManager* config, ConnectionProber* prober);

protected:
    TransitionResult handleModbus(const FormInput* input);
    TransitionResult handleDongle(const FormInput* input);
    // Called once the probe succeeded; returns the confirmation form.
    virtual TransitionResult onLocalTransportReady() = 0;
    // Pre-filled values for a transport form.
    virtual FormInput transportDefaults(LocalTransportType type) const;
    // Serial used when the operator leaves the inverter serial empty.
    virtual std::string defaultInverterSerial() const;

    ConnectionProber* prober_;

private:
    TransitionResult probeAndContinue(const std::string& step_id, const LocalTransportConfig& cfg,
                                      const FormInput& input);
};

// Adds a local transport to a cloud-only entry; cloud credentials are kept.
class HttpToHybridTransition : public LocalTransportStepBuilder {
public:
    HttpToHybridTransition(const TransitionRequest& request, ConfigManager* config, ConnectionProber* prober);

    bool validate() override;
    std::string firstStep() const override { return STEP_SELECT_LOCAL_TYPE; }
    TransitionResult collectInput(const std::string& step_id, const FormInput* input) override;
    TransitionResult execute() override;

protected:
    TransitionResult onLocalTransportReady() override;

private:
    TransitionResult handleSelectLocalType(const FormInput* input);
    TransitionResult handleConfirm(const FormInput* input);

    std::string local_type_;
};

// Drops every local transport from a hybrid entry; cloud credentials are kept.
class HybridToHttpTransition : public TransitionBuilder {
public:
    HybridToHttpTransition(const TransitionRequest& request, ConfigManager* config);

    bool validate() override;
    std::string firstStep() const override { return STEP_CONFIRM_REMOVAL; }
    TransitionResult collectInput(const std::string& step_id, const FormInput* input) override;
    TransitionResult execute() override;
};

// Replaces a Modbus TCP transport with a WiFi dongle, or the reverse.
// Works on single-transport local entries and on hybrid entries.
class LocalSwapTransition : public LocalTransportStepBuilder {
public:
    LocalSwapTransition(const TransitionRequest& request, ConfigManager* config, ConnectionProber* prober);

    bool validate() override;
    std::string firstStep() const override;
    TransitionResult collectInput(const std::string& step_id, const FormInput* input) override;
    TransitionResult execute() override;

protected:
    TransitionResult onLocalTransportReady() override;
    FormInput transportDefaults(LocalTransportType type) const override;
    std::string defaultInverterSerial() const override;

private:
    LocalTransportType sourceType() const;
    LocalTransportType targetType() const;

    int replaced_index_ = -1;
};

// Replaces the cloud password after the session was rejected. The new
// password is logged in once before it is stored; the entry keeps its mode.
class ReauthTransition : public TransitionBuilder {
public:
    ReauthTransition(const TransitionRequest& request, ConfigManager* config, ConnectionProber* prober);

    bool validate() override;
    std::string firstStep() const override { return STEP_REAUTH_CONFIRM; }
    TransitionResult collectInput(const std::string& step_id, const FormInput* input) override;
    TransitionResult execute() override;

private:
    TransitionResult passwordForm() const;

    ConnectionProber* prober_;
    bool login_ok_ = false;
};
