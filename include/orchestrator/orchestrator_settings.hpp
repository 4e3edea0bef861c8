// EN: Orchestrator settings - typed view of the configuration consumed by the actions
// FR: Paramètres de l'orchestrateur - vue typée de la configuration utilisée par les actions

#pragma once

#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

namespace DAO {
namespace Orchestrator {

struct OrchestratorSettings {
    // EN: Paths
    // FR: Chemins
    std::string base_dir = "/tmp/dao";

    // EN: Logging
    // FR: Journalisation
    LogLevel log_level = LogLevel::INFO;
    LogFormat log_format = LogFormat::TEXT;
    bool console_logging = true;

    // EN: Shutdown
    // FR: Arrêt
    int shutdown_delay_seconds = 60;
    bool shutdown_enabled = true;

    // EN: Patch / isolate
    // FR: Correctifs / isolation
    std::string probe_host = "8.8.8.8";
    int management_port = 22;

    // EN: Execution
    // FR: Exécution
    bool dry_run = false;
    bool use_sudo = true;
    bool exclusive_lock = true;
    int command_timeout_seconds = 300;

    // EN: Audit context
    // FR: Contexte d'audit
    std::string cve = "Unknown";
    std::string initiated_by = "unknown";
};

namespace SettingsUtils {

    // EN: Validation rules for every key read by fromConfig().
    // FR: Règles de validation pour chaque clé lue par fromConfig().
    std::vector<ConfigManager::Rule> validationRules();

    // EN: Seed defaults without overwriting values already present.
    // FR: Pose les valeurs par défaut sans écraser les valeurs existantes.
    void applyDefaults(ConfigManager& config);

    // EN: DAO_BASE_DIR, DAO_LOG_LEVEL, DAO_SHUTDOWN_DELAY, CVE_ID ...
    // FR: DAO_BASE_DIR, DAO_LOG_LEVEL, DAO_SHUTDOWN_DELAY, CVE_ID ...
    std::vector<ConfigManager::EnvironmentBinding> environmentBindings();

    // EN: Validate and materialise the settings. Throws std::invalid_argument listing every error.
    // FR: Valide et matérialise les paramètres. Lance std::invalid_argument avec toutes les erreurs.
    OrchestratorSettings fromConfig(ConfigManager& config);

} // namespace SettingsUtils

} // namespace Orchestrator
} // namespace DAO
