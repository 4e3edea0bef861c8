// EN: Settings rules, defaults, environment bindings and materialisation
// FR: Règles, valeurs par défaut, variables d'environnement et matérialisation des paramètres

#include "orchestrator/orchestrator_settings.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace DAO {
namespace Orchestrator {
namespace SettingsUtils {

std::vector<ConfigManager::Rule> validationRules() {
    return {
        {"paths.base_dir", ConfigType::STRING, true, std::nullopt, std::nullopt, {}, "Root of every artifact"},
        {"logging.level", ConfigType::STRING, false, std::nullopt, std::nullopt,
         {"debug", "info", "warn", "warning", "error"}, "Minimum log level"},
        {"logging.format", ConfigType::STRING, false, std::nullopt, std::nullopt, {"text", "ndjson"}, "Log line format"},
        {"logging.console", ConfigType::BOOL, false, std::nullopt, std::nullopt, {}, "Echo log lines to stdout"},
        {"shutdown.delay_seconds", ConfigType::INT, false, 0.0, 3600.0, {}, "Countdown before halt"},
        {"shutdown.enabled", ConfigType::BOOL, false, std::nullopt, std::nullopt, {}, "Allow the shutdown action"},
        {"patch.probe_host", ConfigType::STRING, false, std::nullopt, std::nullopt, {}, "Host pinged after patching"},
        {"firewall.management_port", ConfigType::INT, false, 1.0, 65535.0, {}, "Port kept open by isolation"},
        {"execution.dry_run", ConfigType::BOOL, false, std::nullopt, std::nullopt, {}, "Log mutations without running them"},
        {"execution.use_sudo", ConfigType::BOOL, false, std::nullopt, std::nullopt, {}, "Prefix mutations with sudo -n"},
        {"execution.exclusive_lock", ConfigType::BOOL, false, std::nullopt, std::nullopt, {}, "flock per action kind"},
        {"execution.command_timeout_seconds", ConfigType::INT, false, 1.0, 86400.0, {}, "Per-command timeout"},
        {"action.cve", ConfigType::STRING, false, std::nullopt, std::nullopt, {}, "CVE identifier for audit correlation"},
    };
}

void applyDefaults(ConfigManager& config) {
    config.setDefault("paths", "base_dir", std::string("/tmp/dao"));
    config.setDefault("logging", "level", std::string("info"));
    config.setDefault("logging", "format", std::string("text"));
    config.setDefault("logging", "console", true);
    config.setDefault("shutdown", "delay_seconds", 60);
    config.setDefault("shutdown", "enabled", true);
    config.setDefault("patch", "probe_host", std::string("8.8.8.8"));
    config.setDefault("firewall", "management_port", 22);
    config.setDefault("execution", "dry_run", false);
    config.setDefault("execution", "use_sudo", true);
    config.setDefault("execution", "exclusive_lock", true);
    config.setDefault("execution", "command_timeout_seconds", 300);
    config.setDefault("action", "cve", std::string("Unknown"));
}

std::vector<ConfigManager::EnvironmentBinding> environmentBindings() {
    return {
        {"DAO_BASE_DIR", "paths", "base_dir", ConfigType::STRING},
        {"DAO_LOG_LEVEL", "logging", "level", ConfigType::STRING},
        {"DAO_LOG_FORMAT", "logging", "format", ConfigType::STRING},
        {"DAO_SHUTDOWN_DELAY", "shutdown", "delay_seconds", ConfigType::INT},
        {"DAO_DRY_RUN", "execution", "dry_run", ConfigType::BOOL},
        {"CVE_ID", "action", "cve", ConfigType::STRING},
    };
}

OrchestratorSettings fromConfig(ConfigManager& config) {
    config.addValidationRules(validationRules());

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::ostringstream oss;
        oss << "Invalid configuration:";
        for (const auto& error : errors) {
            oss << "\n  - " << error;
        }
        throw std::invalid_argument(oss.str());
    }

    OrchestratorSettings settings;
    settings.base_dir = config.get("paths", "base_dir").asOrDefault<std::string>(settings.base_dir);
    if (settings.base_dir.empty()) {
        throw std::invalid_argument("Invalid configuration: paths.base_dir is empty");
    }

    settings.log_level = Logger::levelFromString(
        config.get("logging", "level").asOrDefault<std::string>("info"));
    settings.log_format = Logger::formatFromString(
        config.get("logging", "format").asOrDefault<std::string>("text"));
    settings.console_logging = config.get("logging", "console").asOrDefault<bool>(true);

    settings.shutdown_delay_seconds = config.get("shutdown", "delay_seconds").asOrDefault<int>(60);
    settings.shutdown_enabled = config.get("shutdown", "enabled").asOrDefault<bool>(true);

    settings.probe_host = config.get("patch", "probe_host").asOrDefault<std::string>(settings.probe_host);
    settings.management_port = config.get("firewall", "management_port").asOrDefault<int>(22);

    settings.dry_run = config.get("execution", "dry_run").asOrDefault<bool>(false);
    settings.use_sudo = config.get("execution", "use_sudo").asOrDefault<bool>(true);
    settings.exclusive_lock = config.get("execution", "exclusive_lock").asOrDefault<bool>(true);
    settings.command_timeout_seconds = config.get("execution", "command_timeout_seconds").asOrDefault<int>(300);

    settings.cve = config.get("action", "cve").asOrDefault<std::string>("Unknown");
    if (settings.cve.empty()) {
        settings.cve = "Unknown";
    }

    const char* user = std::getenv("USER");
    if (user && *user) {
        settings.initiated_by = user;
    }
    return settings;
}

} // namespace SettingsUtils
} // namespace Orchestrator
} // namespace DAO
