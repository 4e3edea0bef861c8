// EN: Action orchestrator - runs one defensive action with its log file, lock and status state machine
// FR: Orchestrateur d'actions - exécute une action défensive avec son journal, son verrou et sa machine d'état

#pragma once

#include <string>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"
#include "orchestrator/countdown.hpp"
#include "orchestrator/orchestrator_settings.hpp"
#include "orchestrator/status_tracker.hpp"
#include "orchestrator/system_probe.hpp"

namespace DAO {
namespace Orchestrator {

// EN: Exclusive advisory lock (flock) released on destruction.
// FR: Verrou consultatif exclusif (flock) libéré à la destruction.
class ActionLock {
public:
    ActionLock() = default;
    ~ActionLock();

    ActionLock(const ActionLock&) = delete;
    ActionLock& operator=(const ActionLock&) = delete;

    // EN: Non-blocking. Returns false with a reason when the lock is held elsewhere or cannot be opened.
    // FR: Non bloquant. Retourne false avec une raison si le verrou est déjà pris ou ne peut être ouvert.
    bool acquire(const std::string& path, std::string& error);
    void release();
    bool isHeld() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

class ActionOrchestrator {
public:
    ActionOrchestrator(OrchestratorSettings settings, ICommandRunner& runner, IPrivilegedCapability& capability,
                       ISystemProbe& probe, ITicker& ticker, const CancellationToken& cancellation);

    ActionOrchestrator(const ActionOrchestrator&) = delete;
    ActionOrchestrator& operator=(const ActionOrchestrator&) = delete;

    // EN: Run one action to completion. Never throws; the outcome is in the returned result and the status token.
    // FR: Exécute une action jusqu'au bout. Ne lève jamais ; le résultat et le jeton d'état portent l'issue.
    ActionResult run(ActionKind kind);

    ActionStatus currentStatus(ActionKind kind) const;

    const ArtifactLayout& layout() const { return layout_; }
    const OrchestratorSettings& settings() const { return settings_; }

private:
    void executeLocked(ActionResult& result);

    OrchestratorSettings settings_;
    ArtifactLayout layout_;
    StatusTracker status_tracker_;
    ICommandRunner& runner_;
    IPrivilegedCapability& capability_;
    ISystemProbe& probe_;
    ITicker& ticker_;
    const CancellationToken& cancellation_;
};

} // namespace Orchestrator
} // namespace DAO
