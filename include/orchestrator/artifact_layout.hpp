// EN: Artifact layout - every path produced by an action, derived from one base directory
// FR: Organisation des artefacts - tous les chemins produits par une action, dérivés d'un répertoire de base

#pragma once

#include <string>

#include "orchestrator/action_types.hpp"

namespace DAO {
namespace Orchestrator {

class ArtifactLayout {
public:
    explicit ArtifactLayout(std::string base_dir);

    const std::string& baseDir() const { return base_dir_; }
    std::string statusDir() const;
    std::string logsDir() const;
    std::string reportsDir() const;
    std::string snapshotsDir() const;
    std::string backupsDir() const;
    std::string locksDir() const;

    // EN: Create every directory above. Returns false and fills error on the first failure.
    // FR: Crée tous les répertoires ci-dessus. Retourne false et renseigne error au premier échec.
    bool ensureDirectories(std::string& error) const;

    std::string statusFile(ActionKind kind) const;     // EN: status/<kind>_status
    std::string lockFile(ActionKind kind) const;       // EN: locks/<kind>.lock
    std::string logFile(ActionKind kind) const;        // EN: logs/<kind>_<ts>.log

    // EN: <dir>/<prefix>_<ts><extension>, suffixed _1, _2 ... when the name is already taken.
    // FR: <dir>/<prefix>_<ts><extension>, suffixé _1, _2 ... si le nom est déjà pris.
    static std::string uniqueArtifactPath(const std::string& dir, const std::string& prefix,
                                          const std::string& extension);

    // EN: Local time as YYYYmmdd_HHMMSS_mmm
    // FR: Heure locale au format YYYYmmdd_HHMMSS_mmm
    static std::string timestampTag();

private:
    std::string base_dir_;
};

} // namespace Orchestrator
} // namespace DAO
