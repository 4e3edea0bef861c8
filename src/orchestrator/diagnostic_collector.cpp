// EN: Implementation of DiagnosticCollector
// FR: Implémentation de DiagnosticCollector

#include "orchestrator/diagnostic_collector.hpp"
#include "orchestrator/service_controller.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iomanip>
#include <iterator>
#include <sstream>

namespace DAO {
namespace Orchestrator {

namespace {

const std::string kNotAvailable = "not available";

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// EN: A probe that throws is treated like a missing tool.
// FR: Une sonde qui lève une exception est traitée comme un outil manquant.
template <typename Fn>
auto guardedProbe(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_WARN("diagnostics", what + " probe failed: " + e.what());
        return std::nullopt;
    }
}

} // namespace

DiagnosticCollector::DiagnosticCollector(ISystemProbe& probe, const StatusTracker& status_tracker)
    : probe_(probe), status_tracker_(status_tracker) {
}

const std::vector<std::string>& DiagnosticCollector::sectionTitles() {
    static const std::vector<std::string> titles = {
        "SYSTEM INFORMATION",
        "MEMORY USAGE",
        "DISK USAGE",
        "CRITICAL SERVICES STATUS",
        "NETWORK STATUS",
        "TOP PROCESSES (CPU)",
        "SECURITY STATUS",
        "SYSTEM UPDATES",
        "REMEDIATION STATUS",
        "RECOMMENDATIONS",
    };
    return titles;
}

const std::vector<std::string>& DiagnosticCollector::suspiciousProcessNames() {
    static const std::vector<std::string> names = {"nc", "netcat", "nmap", "masscan"};
    return names;
}

std::string DiagnosticCollector::formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return fixed(value, unit == 0 ? 0 : 1) + " " + units[unit];
}

std::vector<std::string> DiagnosticCollector::recommendations(
    const std::optional<LoadAverage>& load,
    const std::optional<std::vector<FilesystemUsage>>& filesystems,
    const std::optional<MemoryUsage>& memory) {

    std::vector<std::string> lines;
    if (load && load->one > kHighLoadThreshold) {
        lines.push_back("HIGH: System load is high (" + fixed(load->one, 2) + ")");
    }
    if (filesystems) {
        std::string critical;
        for (const auto& fs : *filesystems) {
            if (fs.used_pct >= kHighDiskPercent) {
                if (!critical.empty()) critical += ", ";
                critical += fs.mountpoint + " " + fixed(fs.used_pct, 0) + "%";
            }
        }
        if (!critical.empty()) {
            lines.push_back("HIGH: Disk usage is critical: " + critical);
        }
    }
    if (memory && memory->used_pct > kHighMemoryPercent) {
        lines.push_back("HIGH: Memory usage is high (" + fixed(memory->used_pct, 1) + "%)");
    }
    if (lines.empty()) {
        lines.push_back("No critical issues detected");
    }
    return lines;
}

DiagnosticOutcome DiagnosticCollector::collect(const std::string& cve) {
    DiagnosticOutcome outcome;
    ActionReport& report = outcome.report;
    const auto& titles = sectionTitles();

    auto notAvailable = [&outcome, &report](const std::string& what) {
        report.addLine(what + ": " + kNotAvailable);
        ++outcome.unavailable_items;
    };

    auto host = guardedProbe("hostname", [&] { return probe_.hostname(); });
    report.addHeader("Generated", ActionReport::currentDate());
    report.addHeader("CVE Context", cve);
    report.addHeader("Host", host.value_or(kNotAvailable));

    // EN: System information
    // FR: Informations système
    report.addSection(titles[0]);
    auto uptime = guardedProbe("uptime", [&] { return probe_.uptime(); });
    auto load = guardedProbe("load", [&] { return probe_.loadAverage(); });
    auto kernel = guardedProbe("kernel", [&] { return probe_.kernelVersion(); });
    if (host) report.addLine("Hostname: " + *host); else notAvailable("Hostname");
    if (uptime) report.addLine("Uptime: " + *uptime); else notAvailable("Uptime");
    if (load) {
        report.addLine("Load Average: " + fixed(load->one, 2) + " " + fixed(load->five, 2) + " " +
                       fixed(load->fifteen, 2));
    } else {
        notAvailable("Load Average");
    }
    if (kernel) report.addLine("Kernel: " + *kernel); else notAvailable("Kernel");

    // EN: Memory
    // FR: Mémoire
    report.addSection(titles[1]);
    auto memory = guardedProbe("memory", [&] { return probe_.memoryUsage(); });
    if (memory) {
        report.addLine("Total: " + formatBytes(memory->total_kb * 1024));
        report.addLine("Used: " + formatBytes(memory->used_kb * 1024) + " (" + fixed(memory->used_pct, 1) + "%)");
        report.addLine("Available: " + formatBytes(memory->available_kb * 1024));
        report.addLine("Swap: " + formatBytes(memory->swap_used_kb * 1024) + " used of " +
                       formatBytes(memory->swap_total_kb * 1024));
    } else {
        notAvailable("Memory information");
    }

    // EN: Disk
    // FR: Disque
    report.addSection(titles[2]);
    auto filesystems = guardedProbe("disk", [&] { return probe_.filesystemUsage(); });
    if (filesystems && !filesystems->empty()) {
        for (const auto& fs : *filesystems) {
            report.addLine(fs.mountpoint + " (" + fs.device + ", " + fs.fstype + "): " +
                           formatBytes(fs.used_bytes) + " used of " + formatBytes(fs.total_bytes) +
                           " (" + fixed(fs.used_pct, 0) + "%)");
        }
    } else {
        notAvailable("Disk information");
    }

    // EN: Services
    // FR: Services
    report.addSection(titles[3]);
    auto services = guardedProbe("services", [&] {
        return probe_.serviceStates(ServiceCatalog::diagnosticServices());
    });
    if (services) {
        for (const auto& state : *services) {
            report.addLine(state.name + ": " + (state.active ? "active" : "inactive") + " (" +
                           (state.enabled ? "enabled" : "disabled") + ")");
        }
    } else {
        notAvailable("Service status");
    }

    // EN: Network
    // FR: Réseau
    report.addSection(titles[4]);
    auto interfaces = guardedProbe("interfaces", [&] { return probe_.networkInterfaces(); });
    if (interfaces) {
        report.addLine("Network Interfaces:");
        for (const auto& addr : *interfaces) {
            report.addLine("  " + addr.interface_name + " " + addr.family + " " + addr.address);
        }
    } else {
        notAvailable("Network interfaces");
    }
    auto sockets = guardedProbe("sockets", [&] { return probe_.listeningSockets(); });
    if (sockets) {
        report.addLine("Listening sockets:");
        for (const auto& line : *sockets) {
            report.addLine("  " + line);
        }
    } else {
        notAvailable("Network connection info");
    }

    // EN: Processes
    // FR: Processus
    report.addSection(titles[5]);
    auto processes = guardedProbe("processes", [&] { return probe_.topProcesses(kTopProcessCount); });
    if (processes) {
        for (const auto& line : *processes) {
            report.addLine(line);
        }
    } else {
        notAvailable("Process information");
    }

    // EN: Security indicators
    // FR: Indicateurs de sécurité
    report.addSection(titles[6]);
    auto failed_logins = guardedProbe("auth log", [&] { return probe_.failedLoginCount(); });
    if (failed_logins) {
        report.addLine("Recent failed login attempts: " + std::to_string(*failed_logins));
    } else {
        notAvailable("Failed login attempts");
    }
    auto firewall = guardedProbe("firewall", [&] { return probe_.firewallSummary(); });
    if (firewall) report.addLine("Firewall: " + *firewall); else notAvailable("Firewall status");
    auto suspicious = guardedProbe("process scan", [&] {
        return probe_.runningProcesses(suspiciousProcessNames());
    });
    if (!suspicious) {
        notAvailable("Suspicious process scan");
    } else if (suspicious->empty()) {
        report.addLine("No suspicious processes detected");
    } else {
        for (const auto& name : *suspicious) {
            report.addLine("WARNING: Suspicious process found: " + name);
            LOG_WARN("diagnostics", "Suspicious process found: " + name);
        }
        outcome.suspicious_processes = *suspicious;
    }

    // EN: Updates
    // FR: Mises à jour
    report.addSection(titles[7]);
    auto updates = guardedProbe("updates", [&] { return probe_.pendingUpdates(); });
    if (updates) {
        report.addLine("Available updates (" + updates->tool + "): " + std::to_string(updates->count));
    } else {
        notAvailable("Update information");
    }

    // EN: Previous remediation state
    // FR: État des remédiations précédentes
    report.addSection(titles[8]);
    report.addLine("Last patch status: " +
                   ActionUtils::statusToToken(status_tracker_.getStatus(ActionKind::PATCH)));
    report.addLine("Isolation status: " +
                   ActionUtils::statusToToken(status_tracker_.getStatus(ActionKind::ISOLATE)));

    // EN: Recommendations
    // FR: Recommandations
    report.addSection(titles[9]);
    outcome.recommendations = recommendations(load, filesystems, memory);
    for (const auto& line : outcome.recommendations) {
        report.addLine(line);
    }

    LOG_INFO("diagnostics", "Status survey collected, " + std::to_string(outcome.unavailable_items) +
             " item(s) not available");
    return outcome;
}

} // namespace Orchestrator
} // namespace DAO
