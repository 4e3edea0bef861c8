// EN: Shutdown sequencer - notify, stop services, sync, report, cancellable countdown, then halt
// FR: Séquenceur d'arrêt - notification, arrêt des services, sync, rapport, compte à rebours annulable, puis arrêt

#pragma once

#include <string>

#include "infrastructure/system/privileged_capability.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"
#include "orchestrator/countdown.hpp"
#include "orchestrator/service_controller.hpp"

namespace DAO {
namespace Orchestrator {

struct ShutdownRequest {
    int delay_seconds = 60;
    std::string cve = "Unknown";
    std::string initiated_by = "unknown";
    std::string log_path;
};

struct ShutdownOutcome {
    std::string report_path;
    ServiceBatchResult services;
    CountdownResult countdown;
    bool cancelled = false;
    bool halt_issued = false;
};

class ShutdownSequencer {
public:
    ShutdownSequencer(IPrivilegedCapability& capability, ServiceController& services,
                      const ArtifactLayout& layout, ITicker& ticker, const CancellationToken& cancellation);

    // EN: Run the whole sequence. Sync, report and halt failures throw FatalActionError.
    //     A cancelled countdown returns with cancelled = true and no halt.
    // FR: Exécute toute la séquence. Les échecs de sync, rapport et arrêt lèvent FatalActionError.
    //     Un compte à rebours annulé retourne cancelled = true sans arrêt.
    ShutdownOutcome emergencyShutdown(const ShutdownRequest& request, StepRecorder& recorder);

    static std::string broadcastMessage(int delay_seconds, const std::string& cve);
    static std::string haltMessage(const std::string& cve);

private:
    IPrivilegedCapability& capability_;
    ServiceController& services_;
    const ArtifactLayout& layout_;
    ITicker& ticker_;
    const CancellationToken& cancellation_;
};

} // namespace Orchestrator
} // namespace DAO
