// EN: Status tracker - one persisted state token per action kind
// FR: Suivi d'état - un jeton d'état persisté par type d'action

#pragma once

#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"

namespace DAO {
namespace Orchestrator {

class StatusTracker {
public:
    explicit StatusTracker(const ArtifactLayout& layout);

    // EN: Overwrite the token for this kind. NOT_STARTED removes the file. Returns false on I/O error.
    // FR: Écrase le jeton de ce type. NOT_STARTED supprime le fichier. Retourne false en cas d'erreur d'E/S.
    bool setStatus(ActionKind kind, ActionStatus status);

    // EN: Absent file means NOT_STARTED; unreadable or unknown content is logged and also NOT_STARTED.
    // FR: Fichier absent = NOT_STARTED ; contenu illisible ou inconnu journalisé et aussi NOT_STARTED.
    ActionStatus getStatus(ActionKind kind) const;

private:
    const ArtifactLayout& layout_;
};

} // namespace Orchestrator
} // namespace DAO
