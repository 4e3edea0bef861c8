// EN: daoctl entry point - parses the command line, builds the settings and runs one defensive action
// FR: Point d'entrée de daoctl - analyse la ligne de commande, construit les paramètres et exécute une action

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "infrastructure/cli/command_line_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/action_orchestrator.hpp"
#include "orchestrator/countdown.hpp"
#include "orchestrator/orchestrator_settings.hpp"
#include "orchestrator/status_tracker.hpp"
#include "orchestrator/system_probe.hpp"

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

using DAO::CLI::CliParseResult;
using DAO::CLI::CliParseStatus;
using DAO::CLI::CommandLineParser;
using namespace DAO::Orchestrator;

int usageError(const std::string& message) {
    std::cerr << "daoctl: " << message << std::endl;
    std::cerr << "Try 'daoctl --help' for more information." << std::endl;
    return kExitUsage;
}

// EN: File, then defaults, then environment, then command line; later sources win.
// FR: Fichier, puis défauts, puis environnement, puis ligne de commande ; la dernière source l'emporte.
bool loadConfiguration(const CliParseResult& parsed, DAO::ConfigManager& config, std::string& error) {
    std::string config_file;
    auto it = parsed.overrides.find("_config_file");
    if (it != parsed.overrides.end()) {
        config_file = it->second.asOrDefault<std::string>("");
    } else if (const char* env_file = std::getenv("DAO_CONFIG")) {
        config_file = env_file;
    }

    if (!config_file.empty() && !config.loadFromFile(config_file)) {
        error = "cannot load configuration file " + config_file;
        return false;
    }

    SettingsUtils::applyDefaults(config);
    config.loadEnvironmentOverrides(SettingsUtils::environmentBindings());
    CommandLineParser::applyOverrides(parsed, config);
    return true;
}

void configureLogger(const OrchestratorSettings& settings, bool json_output) {
    auto& logger = DAO::Logger::getInstance();
    logger.setLogLevel(settings.log_level);
    logger.setFormat(settings.log_format);
    // EN: stdout carries the JSON document alone
    // FR: stdout ne porte que le document JSON
    logger.setConsoleOutput(settings.console_logging && !json_output);
}

int printStatus(const OrchestratorSettings& settings, const std::string& action_name, bool json_output) {
    auto kind = ActionUtils::kindFromString(action_name);
    if (!kind) {
        return usageError("unknown action '" + action_name + "'");
    }

    ArtifactLayout layout(settings.base_dir);
    StatusTracker tracker(layout);
    const std::string token = ActionUtils::statusToToken(tracker.getStatus(*kind));
    if (json_output) {
        nlohmann::json json{{"action", ActionUtils::kindToString(*kind)}, {"status", token}};
        std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cout << token << std::endl;
    }
    return kExitCompleted;
}

int runAction(const OrchestratorSettings& settings, ActionKind kind, bool json_output) {
    DAO::SystemCommandRunner runner(std::chrono::seconds(settings.command_timeout_seconds));
    auto capability = DAO::makeCapability(runner, settings.dry_run, settings.use_sudo);
    LinuxSystemProbe probe(runner, ProbePaths{}, settings.dry_run ? nullptr : capability.get());
    SteadyTicker ticker;
    CancellationToken cancellation;

    auto& signals = DAO::SignalHandler::getInstance();
    try {
        signals.initialize();
    } catch (const std::runtime_error& e) {
        LOG_WARN("daoctl", std::string("Signal handlers not installed, countdown cannot be interrupted: ") + e.what());
    }
    signals.bindCancellationToken(&cancellation);

    ActionOrchestrator orchestrator(settings, runner, *capability, probe, ticker, cancellation);
    ActionResult result = orchestrator.run(kind);

    signals.bindCancellationToken(nullptr);
    signals.restoreDefaults();

    if (json_output) {
        std::cout << result.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cout << ActionUtils::kindToString(kind) << ": " << ActionUtils::statusToToken(result.status);
        if (!result.failure_reason.empty()) {
            std::cout << " (" << result.failure_reason << ")";
        }
        std::cout << std::endl;
        if (!result.report_path.empty()) std::cout << "Report: " << result.report_path << std::endl;
        if (!result.snapshot_path.empty()) std::cout << "Firewall snapshot: " << result.snapshot_path << std::endl;
        if (!result.log_path.empty()) std::cout << "Log: " << result.log_path << std::endl;
    }
    return result.status == ActionStatus::COMPLETED ? kExitCompleted : kExitFailed;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineParser parser("daoctl");
    parser.addStandardOptions();
    parser.addCommand("patch", "Apply OS package updates and restart critical services");
    parser.addCommand("isolate", "Snapshot the firewall, restrict inbound traffic, stop exposed services");
    parser.addCommand("shutdown", "Emergency halt after a cancellable countdown");
    parser.addCommand("status-check", "Write a read-only system and security status report");
    parser.addCommand("status <action>", "Print the last status token of an action");

    CliParseResult parsed = parser.parse(argc, argv);
    if (parsed.status == CliParseStatus::HELP_REQUESTED) {
        std::cout << parsed.help_text;
        return kExitCompleted;
    }
    if (parsed.status == CliParseStatus::VERSION_REQUESTED) {
        std::cout << parsed.version_text;
        return kExitCompleted;
    }
    if (!parsed.ok()) {
        for (const auto& error : parsed.errors) {
            std::cerr << "daoctl: " << error << std::endl;
        }
        return usageError(DAO::CLI::CommandLineUtils::cliParseStatusToString(parsed.status));
    }
    if (parsed.positional_arguments.empty()) {
        std::cerr << parser.generateHelpText();
        return kExitUsage;
    }

    auto& config = DAO::ConfigManager::getInstance();
    std::string error;
    if (!loadConfiguration(parsed, config, error)) {
        return usageError(error);
    }

    OrchestratorSettings settings;
    try {
        settings = SettingsUtils::fromConfig(config);
    } catch (const std::invalid_argument& e) {
        return usageError(e.what());
    }

    const bool json_output = parsed.has("_json");
    configureLogger(settings, json_output);

    const auto& positional = parsed.positional_arguments;
    const std::string& command = positional.front();

    if (command == "status") {
        if (positional.size() != 2) {
            return usageError("usage: daoctl status <patch|isolate|shutdown|status-check>");
        }
        return printStatus(settings, positional[1], json_output);
    }

    auto kind = ActionUtils::kindFromString(command);
    if (!kind) {
        return usageError("unknown command '" + command + "'");
    }
    if (positional.size() > 1) {
        return usageError("'" + command + "' takes no arguments");
    }

    try {
        return runAction(settings, *kind, json_output);
    } catch (const std::exception& e) {
        std::cerr << "daoctl: " << e.what() << std::endl;
        return kExitFailed;
    }
}
