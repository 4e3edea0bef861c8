// EN: Implementation of the four defensive actions
// FR: Implémentation des quatre actions défensives

#include "orchestrator/defensive_actions.hpp"
#include "orchestrator/diagnostic_collector.hpp"
#include "orchestrator/firewall_guard.hpp"
#include "orchestrator/package_manager.hpp"
#include "orchestrator/service_controller.hpp"
#include "orchestrator/shutdown_sequencer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace DAO {
namespace Orchestrator {

namespace {

std::string summarize(const ServiceBatchResult& batch, const std::string& verb) {
    return std::to_string(batch.count(ServiceOutcome::SUCCEEDED)) + " " + verb + ", " +
           std::to_string(batch.count(ServiceOutcome::SKIPPED)) + " skipped, " +
           std::to_string(batch.count(ServiceOutcome::WARNED)) + " failed";
}

void recordBatch(StepRecorder& recorder, const std::string& step, const ServiceBatchResult& batch,
                 const std::string& verb) {
    if (batch.hasWarnings()) {
        recorder.warned(step, summarize(batch, verb));
    } else {
        recorder.succeeded(step, summarize(batch, verb));
    }
}

// EN: A host query that throws (e.g. a /proc entry vanishing mid-scan) counts as unavailable.
// FR: Une requête hôte qui lève une exception (ex. entrée /proc disparue) compte comme indisponible.
template <typename Fn>
auto guardedQuery(const std::string& module, const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_WARN(module, what + " query failed: " + e.what());
        return std::nullopt;
    }
}

bool anyWarned(const StepRecorder& recorder) {
    for (const auto& step : recorder.steps()) {
        if (step.status == StepStatus::WARNED) {
            return true;
        }
    }
    return false;
}

void addServiceLines(ActionReport& report, const ServiceBatchResult& batch) {
    for (const auto& result : batch.results) {
        std::string line = "  - " + result.service + " [" + ServiceUtils::desiredStateToString(result.desired_state) +
                           "]: " + ServiceUtils::outcomeToString(result.outcome);
        if (!result.detail.empty()) {
            line += " (" + result.detail + ")";
        }
        report.addLine(line);
    }
}

} // namespace

std::string DefensiveAction::writeReport(const ActionReport& report, const std::string& prefix,
                                         StepRecorder& recorder, bool required) {
    const std::string path = ArtifactLayout::uniqueArtifactPath(context_.layout.reportsDir(), prefix, ".txt");
    std::string error;
    if (!report.writeTo(path, error)) {
        if (required) {
            recorder.fatal("report", error);
        }
        recorder.warned("report", error);
        return "";
    }
    recorder.succeeded("report", "written to " + path);
    return path;
}

// EN: Patch - detect, back up, refresh, upgrade, restart, verify, report
// FR: Patch - détection, sauvegarde, rafraîchissement, mise à jour, redémarrage, vérification, rapport
void PatchAction::execute(StepRecorder& recorder, ActionResult& result) {
    LOG_INFO("patch", "Starting emergency patching process for CVE: " + result.cve);

    PackageManager packages(context_.runner, context_.capability, context_.layout);
    const PackageManagerKind manager = packages.detect();
    if (manager == PackageManagerKind::NONE) {
        recorder.fatal("detect_package_manager", "No supported package manager found");
    }
    recorder.succeeded("detect_package_manager", PackageManager::kindToString(manager));

    auto backup = packages.backupInventory(manager, recorder);
    packages.refresh(manager, recorder);
    packages.upgrade(manager, recorder);

    ServiceController services(context_.runner, context_.capability);
    ServiceBatchResult restarts = services.apply(ServiceCatalog::patchRestarts());
    recordBatch(recorder, "restart_services", restarts, "restarted");

    const std::string& probe_host = context_.settings.probe_host;
    if (!context_.runner.isAvailable("ping")) {
        recorder.skipped("connectivity_check", "ping not available");
    } else if (context_.runner.run({"ping", "-c", "1", "-W", "5", probe_host}).succeeded()) {
        recorder.succeeded("connectivity_check", probe_host + " reachable");
    } else {
        recorder.warned("connectivity_check", "Network connectivity check failed (" + probe_host + ")");
    }

    ActionReport report("Patch Report");
    report.addHeader("Date", ActionReport::currentDate());
    report.addHeader("CVE", result.cve);
    report.addHeader("Status", anyWarned(recorder) ? "SUCCESS (with warnings)" : "SUCCESS");
    report.addHeader("Package manager", PackageManager::kindToString(manager));
    report.addHeader("Privilege", context_.capability.describe());
    report.addHeader("Log file", result.log_path.empty() ? "none" : result.log_path);
    report.addHeader("Backup location", backup.value_or("none"));
    report.addSection("SERVICES");
    addServiceLines(report, restarts);

    result.report_path = writeReport(report, "patch_report", recorder, false);
    LOG_INFO("patch", anyWarned(recorder) ? "Emergency patching completed with warnings"
                                          : "Emergency patching completed successfully");
}

const std::vector<std::string>& IsolateAction::suspiciousProcessNames() {
    static const std::vector<std::string> names = {"nc", "netcat", "wget", "curl"};
    return names;
}

// EN: Isolate - firewall, services, process scan, socket capture, report with restore procedure
// FR: Isolate - pare-feu, services, recherche de processus, capture des sockets, rapport avec restauration
void IsolateAction::execute(StepRecorder& recorder, ActionResult& result) {
    LOG_INFO("isolate", "Starting server isolation process for CVE: " + result.cve);

    FirewallGuard firewall(context_.runner, context_.capability, context_.layout,
                           context_.settings.management_port);
    IsolationOutcome isolation = firewall.isolate(recorder);
    if (isolation.snapshot) {
        result.snapshot_path = isolation.snapshot->path;
    }

    ServiceController services(context_.runner, context_.capability);
    ServiceBatchResult stops = services.apply(ServiceCatalog::isolationStops());
    recordBatch(recorder, "stop_services", stops, "changed");

    auto suspicious = guardedQuery("isolate", "process scan",
                                   [&] { return context_.probe.runningProcesses(suspiciousProcessNames()); });
    if (!suspicious) {
        recorder.skipped("suspicious_processes", "process scan not available");
    } else if (suspicious->empty()) {
        recorder.succeeded("suspicious_processes", "no suspicious processes detected");
    } else {
        for (const auto& name : *suspicious) {
            recorder.warned("suspicious_processes", "Found suspicious process: " + name + " (left running)");
        }
    }

    auto sockets = guardedQuery("isolate", "socket capture", [&] { return context_.probe.listeningSockets(); });
    if (sockets) {
        recorder.succeeded("listening_sockets", std::to_string(sockets->size()) + " line(s) captured");
    } else {
        recorder.skipped("listening_sockets", "not available");
    }

    ActionReport report("Isolation Report");
    report.addHeader("Date", ActionReport::currentDate());
    report.addHeader("CVE", result.cve);
    report.addHeader("Status", isolation.firewall_available ? "ISOLATED" : "PARTIAL (firewall not available)");
    report.addHeader("Privilege", context_.capability.describe());
    report.addHeader("Log file", result.log_path.empty() ? "none" : result.log_path);
    if (isolation.snapshot) {
        std::ostringstream crc;
        crc << std::hex << std::setw(8) << std::setfill('0') << isolation.snapshot->checksum;
        report.addHeader("Iptables backup", isolation.snapshot->path);
        report.addHeader("Backup CRC-32", crc.str());
        report.addHeader("Restore command", "sudo iptables-restore < " + isolation.snapshot->path);
    }

    report.addSection("FIREWALL RULES");
    for (const auto& rule : isolation.applied_rules) report.addLine("  applied: " + rule);
    for (const auto& rule : isolation.failed_rules) report.addLine("  FAILED: " + rule);
    if (!isolation.firewall_available) report.addLine("  iptables not available, network isolation skipped");

    report.addSection("SERVICES");
    addServiceLines(report, stops);

    report.addSection("SUSPICIOUS PROCESSES");
    if (!suspicious) {
        report.addLine("  not available");
    } else if (suspicious->empty()) {
        report.addLine("  none detected");
    } else {
        for (const auto& name : *suspicious) report.addLine("  WARNING: " + name);
    }

    report.addSection("LISTENING SOCKETS");
    if (sockets) {
        for (const auto& line : *sockets) report.addLine("  " + line);
    } else {
        report.addLine("  not available");
    }

    const auto changed = stops.changedServices();
    if (isolation.snapshot) {
        report.addSection("RESTORE INSTRUCTIONS");
        for (const auto& line : FirewallGuard::restoreInstructions(isolation.snapshot->path, changed)) {
            report.addLine(line);
            LOG_INFO("isolate", line);
        }
    }

    result.report_path = writeReport(report, "isolation_report", recorder, false);
    LOG_INFO("isolate", "Server isolation completed");
}

// EN: Shutdown - guarded by shutdown.enabled, then the full sequencer
// FR: Shutdown - protégé par shutdown.enabled, puis le séquenceur complet
void ShutdownAction::execute(StepRecorder& recorder, ActionResult& result) {
    if (!context_.settings.shutdown_enabled) {
        recorder.fatal("shutdown_enabled", "emergency shutdown disabled by configuration (shutdown.enabled)");
    }

    ServiceController services(context_.runner, context_.capability);
    ShutdownSequencer sequencer(context_.capability, services, context_.layout, context_.ticker,
                                context_.cancellation);

    ShutdownRequest request;
    request.delay_seconds = context_.settings.shutdown_delay_seconds;
    request.cve = result.cve;
    request.initiated_by = context_.settings.initiated_by;
    request.log_path = result.log_path;

    ShutdownOutcome outcome = sequencer.emergencyShutdown(request, recorder);
    result.report_path = outcome.report_path;
    result.cancelled = outcome.cancelled;
}

// EN: StatusCheck - read-only survey, the report is the deliverable
// FR: StatusCheck - relevé en lecture seule, le rapport est le livrable
void StatusCheckAction::execute(StepRecorder& recorder, ActionResult& result) {
    LOG_INFO("status_check", "Starting system status check for CVE: " + result.cve);

    DiagnosticCollector collector(context_.probe, context_.status_tracker);
    DiagnosticOutcome diagnostics = collector.collect(result.cve);
    recorder.succeeded("collect", std::to_string(diagnostics.report.sections().size()) + " sections, " +
                       std::to_string(diagnostics.unavailable_items) + " item(s) not available");
    for (const auto& line : diagnostics.recommendations) {
        LOG_INFO("status_check", "Recommendation: " + line);
    }

    result.report_path = writeReport(diagnostics.report, "system_status_report", recorder, true);
}

std::unique_ptr<DefensiveAction> createAction(ActionKind kind, ActionContext& context) {
    switch (kind) {
        case ActionKind::PATCH: return std::make_unique<PatchAction>(context);
        case ActionKind::ISOLATE: return std::make_unique<IsolateAction>(context);
        case ActionKind::SHUTDOWN: return std::make_unique<ShutdownAction>(context);
        case ActionKind::STATUS_CHECK: return std::make_unique<StatusCheckAction>(context);
        default:
            throw std::invalid_argument("Unknown action kind: " + std::to_string(static_cast<int>(kind)));
    }
}

} // namespace Orchestrator
} // namespace DAO
