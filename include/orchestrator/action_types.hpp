// EN: Core types shared by every defensive action - kinds, statuses, step records and results
// FR: Types communs à toutes les actions défensives - types, statuts, étapes et résultats

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace DAO {
namespace Orchestrator {

// EN: The four independently invocable actions
// FR: Les quatre actions invocables indépendamment
enum class ActionKind {
    PATCH = 0,          // EN: Apply OS package updates / FR: Appliquer les mises à jour système
    ISOLATE = 1,        // EN: Restrict inbound network traffic / FR: Restreindre le trafic réseau entrant
    SHUTDOWN = 2,       // EN: Emergency halt after a countdown / FR: Arrêt d'urgence après compte à rebours
    STATUS_CHECK = 3    // EN: Read-only diagnostic survey / FR: Diagnostic en lecture seule
};

// EN: Persisted per action kind; only the latest value is kept.
// FR: Persisté par type d'action ; seule la dernière valeur est conservée.
enum class ActionStatus {
    NOT_STARTED = 0,
    IN_PROGRESS = 1,
    COMPLETED = 2,
    FAILED = 3
};

// EN: Outcome of one sub-step
// FR: Résultat d'une sous-étape
enum class StepStatus {
    SUCCEEDED = 0,
    SKIPPED = 1,        // EN: Nothing to do, or tool not available / FR: Rien à faire, ou outil indisponible
    WARNED = 2,         // EN: Failed, action continues / FR: Échec, l'action continue
    FATAL = 3           // EN: Failed, action aborts / FR: Échec, l'action s'arrête
};

struct StepRecord {
    std::string name;
    StepStatus status = StepStatus::SUCCEEDED;
    std::string detail;
    std::chrono::system_clock::time_point timestamp;
};

// EN: Aggregated outcome returned to the dispatcher
// FR: Résultat agrégé renvoyé au dispatcheur
struct ActionResult {
    ActionKind kind = ActionKind::STATUS_CHECK;
    ActionStatus status = ActionStatus::NOT_STARTED;
    std::string cve;
    std::vector<StepRecord> steps;
    std::string report_path;
    std::string log_path;
    std::string snapshot_path;          // EN: Isolate only / FR: Isolate uniquement
    bool cancelled = false;             // EN: Shutdown countdown aborted / FR: Compte à rebours interrompu
    std::string failure_reason;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    size_t countSteps(StepStatus status) const;
    std::optional<StepRecord> findStep(const std::string& name) const;

    nlohmann::json toJson() const;
};

// EN: Raised by the step that decides the whole action must abort.
// FR: Levée par l'étape qui décide que toute l'action doit s'arrêter.
class FatalActionError : public std::runtime_error {
public:
    FatalActionError(std::string step, const std::string& message)
        : std::runtime_error(message), step_(std::move(step)) {}

    const std::string& step() const { return step_; }

private:
    std::string step_;
};

// EN: Collects step records and logs each one at the level matching its status.
// FR: Collecte les étapes et journalise chacune au niveau correspondant à son statut.
class StepRecorder {
public:
    explicit StepRecorder(std::string module);

    void succeeded(const std::string& step, const std::string& detail);
    void skipped(const std::string& step, const std::string& detail);
    void warned(const std::string& step, const std::string& detail);

    // EN: Record a FATAL step and throw FatalActionError.
    // FR: Enregistre une étape FATAL et lance FatalActionError.
    [[noreturn]] void fatal(const std::string& step, const std::string& detail);

    void record(const std::string& step, StepStatus status, const std::string& detail);

    const std::vector<StepRecord>& steps() const { return steps_; }
    std::vector<StepRecord> takeSteps();

private:
    std::string module_;
    std::vector<StepRecord> steps_;
};

// EN: Conversion helpers
// FR: Fonctions de conversion
namespace ActionUtils {
    std::string kindToString(ActionKind kind);              // EN: "patch", "isolate", ... / FR: Nom de commande
    std::optional<ActionKind> kindFromString(const std::string& value);
    std::string kindArtifactName(ActionKind kind);          // EN: "patch", "isolation", "shutdown", "status_check"
    std::string statusToToken(ActionStatus status);         // EN: "IN_PROGRESS", ... / FR: Jeton persisté
    std::optional<ActionStatus> statusFromToken(const std::string& token);
    std::string stepStatusToString(StepStatus status);
    std::vector<ActionKind> allKinds();
} // namespace ActionUtils

} // namespace Orchestrator
} // namespace DAO
