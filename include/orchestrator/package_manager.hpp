// EN: Package manager - detection, inventory backup, index refresh and upgrade of OS packages
// FR: Gestionnaire de paquets - détection, sauvegarde d'inventaire, rafraîchissement et mise à jour des paquets

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"

namespace DAO {
namespace Orchestrator {

enum class PackageManagerKind {
    NONE = 0,
    APT = 1,
    DNF = 2,
    YUM = 3,
    PACMAN = 4
};

class PackageManager {
public:
    PackageManager(ICommandRunner& runner, IPrivilegedCapability& capability, const ArtifactLayout& layout);

    // EN: First available of apt-get, dnf, yum, pacman.
    // FR: Premier disponible parmi apt-get, dnf, yum, pacman.
    PackageManagerKind detect();

    // EN: Installed-package list to backups/package_list_<ts>.txt. Best effort; returns the path on success.
    // FR: Liste des paquets installés vers backups/package_list_<ts>.txt. Au mieux ; retourne le chemin si réussi.
    std::optional<std::string> backupInventory(PackageManagerKind kind, StepRecorder& recorder);

    // EN: Refresh package indexes. Failure is a warning.
    // FR: Rafraîchit les index de paquets. Un échec est un avertissement.
    bool refresh(PackageManagerKind kind, StepRecorder& recorder);

    // EN: Apply all available updates. Failure throws FatalActionError.
    // FR: Applique toutes les mises à jour. Un échec lève FatalActionError.
    void upgrade(PackageManagerKind kind, StepRecorder& recorder);

    static std::vector<std::string> refreshCommand(PackageManagerKind kind);
    static std::vector<std::string> upgradeCommand(PackageManagerKind kind);
    static std::vector<std::string> inventoryCommand(PackageManagerKind kind);
    static std::string kindToString(PackageManagerKind kind);

private:
    ICommandRunner& runner_;
    IPrivilegedCapability& capability_;
    const ArtifactLayout& layout_;
};

} // namespace Orchestrator
} // namespace DAO
