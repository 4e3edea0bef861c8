// EN: Diagnostic collector - builds the status-check report with fixed sections and threshold recommendations
// FR: Collecteur de diagnostic - construit le rapport d'état avec sections fixes et recommandations à seuils

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "orchestrator/action_report.hpp"
#include "orchestrator/status_tracker.hpp"
#include "orchestrator/system_probe.hpp"

namespace DAO {
namespace Orchestrator {

struct DiagnosticOutcome {
    ActionReport report{"System Status Report"};
    std::vector<std::string> recommendations;
    std::vector<std::string> suspicious_processes;
    size_t unavailable_items = 0;       // EN: "not available" lines emitted / FR: Lignes "not available" émises
};

class DiagnosticCollector {
public:
    static constexpr double kHighLoadThreshold = 2.0;
    static constexpr double kHighDiskPercent = 90.0;
    static constexpr double kHighMemoryPercent = 90.0;
    static constexpr size_t kTopProcessCount = 9;

    DiagnosticCollector(ISystemProbe& probe, const StatusTracker& status_tracker);

    // EN: Never throws; every missing source degrades to a "not available" line.
    // FR: Ne lève jamais ; chaque source manquante devient une ligne "not available".
    DiagnosticOutcome collect(const std::string& cve);

    // EN: Derived from fixed thresholds; "No critical issues detected" when nothing is flagged.
    // FR: Dérivées de seuils fixes ; "No critical issues detected" si rien n'est signalé.
    static std::vector<std::string> recommendations(const std::optional<LoadAverage>& load,
                                                    const std::optional<std::vector<FilesystemUsage>>& filesystems,
                                                    const std::optional<MemoryUsage>& memory);

    static const std::vector<std::string>& sectionTitles();
    static const std::vector<std::string>& suspiciousProcessNames();

    static std::string formatBytes(uint64_t bytes);

private:
    ISystemProbe& probe_;
    const StatusTracker& status_tracker_;
};

} // namespace Orchestrator
} // namespace DAO
