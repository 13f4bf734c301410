#pragma once
#include <map>
#include <string>
#include <vector>
#include "config_manager.hpp"

enum class TransitionType { HTTP_TO_HYBRID, HYBRID_TO_HTTP, MODBUS_TO_DONGLE, DONGLE_TO_MODBUS, REAUTH };

const char* transitionTypeName(TransitionType type);
bool parseTransitionType(const std::string& name, TransitionType& out);

// Field values submitted for one step, keyed by field name.
using FormInput = std::map<std::string, std::string>;

// Step identifiers shared by all transitions.
constexpr const char* STEP_SELECT = "transition_select";
constexpr const char* STEP_SELECT_LOCAL_TYPE = "transition_select_local_type";
constexpr const char* STEP_MODBUS = "transition_modbus";
constexpr const char* STEP_DONGLE = "transition_dongle";
constexpr const char* STEP_CONFIRM = "transition_confirm";
constexpr const char* STEP_CONFIRM_REMOVAL = "transition_confirm_removal";
constexpr const char* STEP_REAUTH_CONFIRM = "reauth_confirm";

constexpr const char* REASON_TRANSITION_SUCCESSFUL = "transition_successful";
constexpr const char* REASON_REAUTH_SUCCESSFUL = "reauth_successful";

struct TransitionRequest {
    TransitionType type = TransitionType::HTTP_TO_HYBRID;
    std::string source_type;
    std::string target_type;
    FleetEntry entry;
};

// Everything gathered while the operator walks through the steps.
// Nothing here is persisted before execute().
struct TransitionContext {
    TransitionRequest request;
    CloudCredentials validated_credentials;
    bool has_local_transport = false;
    LocalTransportConfig local_transport_config;
    std::map<std::string, std::string> test_results;
    std::vector<std::string> warnings;
    bool warnings_shown = false;
};

struct TransitionResult {
    enum Kind { FORM, ABORT, SUCCESS };

    Kind kind = FORM;
    std::string step_id;
    // Field name to error key; probe failures use "base".
    std::map<std::string, std::string> errors;
    std::map<std::string, std::string> placeholders;
    // Values to pre-fill, so a failed submission keeps what was typed.
    FormInput defaults;
    std::vector<std::string> options;
    std::string reason;

    bool isForm() const { return kind == FORM; }
    bool isAbort() const { return kind == ABORT; }
    bool isSuccess() const { return kind == SUCCESS; }
    bool finished() const { return kind != FORM; }

    static TransitionResult form(const std::string& step_id);
    static TransitionResult abort(const std::string& reason);
};

/**
 * @brief One connection-mode transition: validate, collect input, execute.
 *
 * validate() checks the entry is in the expected source mode and never
 * throws. collectInput() is re-entrant per step: a null input renders the
 * step's form; submitted input is checked (and probed where a local
 * transport is entered) before moving on. execute() commits the new entry
 * through ConfigManager::replaceEntry, which triggers the reload.
 */
class TransitionBuilder {
public:
    TransitionBuilder(const TransitionRequest& request, ConfigManager* config);
    virtual ~TransitionBuilder() {}

    virtual bool validate() = 0;
    virtual std::string firstStep() const = 0;
    virtual TransitionResult collectInput(const std::string& step_id, const FormInput* input) = 0;
    virtual TransitionResult execute() = 0;

    TransitionType type() const { return context_.request.type; }
    const TransitionContext& context() const { return context_; }
    const FleetEntry& entry() const { return context_.request.entry; }
    const std::string& currentStep() const { return current_step_; }

protected:
    void addWarning(const std::string& warning);
    // Renders a confirmation step; warnings count as shown from here on.
    TransitionResult confirmForm(const std::string& step_id, std::map<std::string, std::string> placeholders);
    // Persists the rewritten entry. Refuses unless the warnings were shown.
    TransitionResult commit(FleetEntry updated, const std::string& new_type_display);
    std::string displayName() const;
    std::string currentPlant() const;
    void logStart() const;

    TransitionContext context_;
    ConfigManager* config_;
    std::string current_step_;
};
