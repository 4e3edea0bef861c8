// EN: Implementation of ShutdownSequencer
// FR: Implémentation de ShutdownSequencer

#include "orchestrator/shutdown_sequencer.hpp"
#include "orchestrator/action_report.hpp"
#include "infrastructure/logging/logger.hpp"

namespace DAO {
namespace Orchestrator {

ShutdownSequencer::ShutdownSequencer(IPrivilegedCapability& capability, ServiceController& services,
                                     const ArtifactLayout& layout, ITicker& ticker,
                                     const CancellationToken& cancellation)
    : capability_(capability), services_(services), layout_(layout),
      ticker_(ticker), cancellation_(cancellation) {
}

std::string ShutdownSequencer::broadcastMessage(int delay_seconds, const std::string& cve) {
    return "EMERGENCY SECURITY SHUTDOWN - System will halt in " + std::to_string(delay_seconds) +
           " seconds due to critical security vulnerability " + cve;
}

std::string ShutdownSequencer::haltMessage(const std::string& cve) {
    return "Emergency shutdown due to security vulnerability " + cve;
}

ShutdownOutcome ShutdownSequencer::emergencyShutdown(const ShutdownRequest& request, StepRecorder& recorder) {
    ShutdownOutcome outcome;
    LOG_WARN("shutdown", "EMERGENCY SHUTDOWN INITIATED for CVE: " + request.cve);

    // EN: 1. Notify interactive sessions
    // FR: 1. Notifier les sessions interactives
    CommandResult wall = capability_.execute({"wall", broadcastMessage(request.delay_seconds, request.cve)});
    if (wall.succeeded()) {
        recorder.succeeded("notify_users", "warning broadcast to logged-in users");
    } else {
        recorder.warned("notify_users", "broadcast failed: " + wall.failureReason());
    }

    // EN: 2. Stop critical services
    // FR: 2. Arrêter les services critiques
    outcome.services = services_.apply(ServiceCatalog::shutdownStops());
    const std::string service_summary =
        std::to_string(outcome.services.count(ServiceOutcome::SUCCEEDED)) + " stopped, " +
        std::to_string(outcome.services.count(ServiceOutcome::SKIPPED)) + " skipped, " +
        std::to_string(outcome.services.count(ServiceOutcome::WARNED)) + " failed";
    if (outcome.services.hasWarnings()) {
        recorder.warned("stop_services", service_summary);
    } else {
        recorder.succeeded("stop_services", service_summary);
    }

    // EN: 3. Flush filesystems; never halt on top of a failed sync
    // FR: 3. Vider les caches disque ; ne jamais arrêter après un sync échoué
    CommandResult sync = capability_.execute({"sync"});
    if (!sync.succeeded()) {
        recorder.fatal("sync", "filesystem sync failed: " + sync.failureReason());
    }
    recorder.succeeded("sync", "filesystems synced");

    // EN: 4. Emergency report
    // FR: 4. Rapport d'urgence
    ActionReport report("Emergency Shutdown Report");
    report.addHeader("Date", ActionReport::currentDate());
    report.addHeader("CVE", request.cve);
    report.addHeader("Reason", "Critical security vulnerability");
    report.addHeader("Initiated by", request.initiated_by);
    report.addHeader("Delay", std::to_string(request.delay_seconds) + " seconds");
    if (!request.log_path.empty()) {
        report.addHeader("Log file", request.log_path);
    }
    report.addSection("SERVICES");
    for (const auto& result : outcome.services.results) {
        report.addLine(result.service + ": " + ServiceUtils::outcomeToString(result.outcome) +
                       (result.detail.empty() ? "" : " (" + result.detail + ")"));
    }

    outcome.report_path = ArtifactLayout::uniqueArtifactPath(layout_.reportsDir(), "emergency_shutdown", ".txt");
    std::string error;
    if (!report.writeTo(outcome.report_path, error)) {
        recorder.fatal("emergency_report", error);
    }
    recorder.succeeded("emergency_report", "written to " + outcome.report_path);

    // EN: 5. Countdown, the only cancellation point
    // FR: 5. Compte à rebours, seul point d'annulation
    LOG_WARN("shutdown", "System will shutdown in " + std::to_string(request.delay_seconds) +
             " seconds, interrupt to abort");
    outcome.countdown = runCountdown(request.delay_seconds, ticker_, cancellation_, [](int remaining) {
        LOG_WARN("shutdown", "Shutdown in " + std::to_string(remaining) + " seconds...");
    });
    if (!outcome.countdown.completed) {
        outcome.cancelled = true;
        recorder.warned("countdown", "cancelled with " + std::to_string(outcome.countdown.remaining_seconds) +
                        " seconds remaining, halt aborted");
        return outcome;
    }
    recorder.succeeded("countdown", "elapsed");

    // EN: 6. Irreversible halt
    // FR: 6. Arrêt irréversible
    LOG_WARN("shutdown", "Initiating emergency shutdown NOW");
    CommandResult halt = capability_.execute({"shutdown", "-h", "now", haltMessage(request.cve)});
    if (!halt.succeeded()) {
        recorder.fatal("halt", "shutdown command failed: " + halt.failureReason());
    }
    outcome.halt_issued = true;
    recorder.succeeded("halt", "halt issued");
    return outcome;
}

} // namespace Orchestrator
} // namespace DAO
