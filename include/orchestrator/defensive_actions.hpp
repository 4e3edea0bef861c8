// EN: Defensive actions - Patch, Isolate, Shutdown and StatusCheck composed from the orchestrator components
// FR: Actions défensives - Patch, Isolate, Shutdown et StatusCheck composées à partir des composants

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "orchestrator/action_report.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"
#include "orchestrator/countdown.hpp"
#include "orchestrator/orchestrator_settings.hpp"
#include "orchestrator/status_tracker.hpp"
#include "orchestrator/system_probe.hpp"

namespace DAO {
namespace Orchestrator {

// EN: Everything an action may touch. Owned by the caller; outlives the action.
// FR: Tout ce qu'une action peut utiliser. Possédé par l'appelant ; survit à l'action.
struct ActionContext {
    const OrchestratorSettings& settings;
    const ArtifactLayout& layout;
    StatusTracker& status_tracker;
    ICommandRunner& runner;
    IPrivilegedCapability& capability;
    ISystemProbe& probe;
    ITicker& ticker;
    const CancellationToken& cancellation;
};

class DefensiveAction {
public:
    explicit DefensiveAction(ActionContext& context) : context_(context) {}
    virtual ~DefensiveAction() = default;

    virtual ActionKind kind() const = 0;

    // EN: Run the action's steps. Fatal steps throw FatalActionError through the recorder.
    // FR: Exécute les étapes de l'action. Les étapes fatales lèvent FatalActionError via le recorder.
    virtual void execute(StepRecorder& recorder, ActionResult& result) = 0;

protected:
    // EN: Write a report to reports/<prefix>_<ts>.txt; fatal or warning on failure depending on `required`.
    // FR: Écrit un rapport dans reports/<prefix>_<ts>.txt ; fatal ou avertissement selon `required`.
    std::string writeReport(const ActionReport& report, const std::string& prefix,
                            StepRecorder& recorder, bool required);

    ActionContext& context_;
};

class PatchAction : public DefensiveAction {
public:
    using DefensiveAction::DefensiveAction;
    ActionKind kind() const override { return ActionKind::PATCH; }
    void execute(StepRecorder& recorder, ActionResult& result) override;
};

class IsolateAction : public DefensiveAction {
public:
    using DefensiveAction::DefensiveAction;
    ActionKind kind() const override { return ActionKind::ISOLATE; }
    void execute(StepRecorder& recorder, ActionResult& result) override;

    // EN: Logged as warnings, never terminated.
    // FR: Journalisés en avertissement, jamais tués.
    static const std::vector<std::string>& suspiciousProcessNames();
};

class ShutdownAction : public DefensiveAction {
public:
    using DefensiveAction::DefensiveAction;
    ActionKind kind() const override { return ActionKind::SHUTDOWN; }
    void execute(StepRecorder& recorder, ActionResult& result) override;
};

class StatusCheckAction : public DefensiveAction {
public:
    using DefensiveAction::DefensiveAction;
    ActionKind kind() const override { return ActionKind::STATUS_CHECK; }
    void execute(StepRecorder& recorder, ActionResult& result) override;
};

std::unique_ptr<DefensiveAction> createAction(ActionKind kind, ActionContext& context);

} // namespace Orchestrator
} // namespace DAO
