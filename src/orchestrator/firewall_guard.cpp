// EN: Implementation of FirewallGuard
// FR: Implémentation de FirewallGuard

#include "orchestrator/firewall_guard.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace DAO {
namespace Orchestrator {

namespace {

constexpr const char* kFirewallTool = "iptables";
constexpr const char* kSnapshotTool = "iptables-save";

std::string hex32(uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

} // namespace

FirewallGuard::FirewallGuard(ICommandRunner& runner, IPrivilegedCapability& capability,
                             const ArtifactLayout& layout, int management_port)
    : runner_(runner), capability_(capability), layout_(layout), management_port_(management_port) {
}

uint32_t FirewallGuard::checksum(const std::string& content) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    return static_cast<uint32_t>(crc);
}

std::vector<FirewallRule> FirewallGuard::isolationRuleset(int management_port) {
    return {
        {"allow loopback", {"-A", "INPUT", "-i", "lo", "-j", "ACCEPT"}, false},
        {"allow established/related",
         {"-A", "INPUT", "-m", "state", "--state", "ESTABLISHED,RELATED", "-j", "ACCEPT"}, false},
        {"allow management port " + std::to_string(management_port),
         {"-A", "INPUT", "-p", "tcp", "--dport", std::to_string(management_port), "-j", "ACCEPT"}, false},
        {"default deny", {"-A", "INPUT", "-j", "DROP"}, true},
    };
}

bool FirewallGuard::validateRuleset(const std::vector<FirewallRule>& rules, std::string& error) {
    size_t deny_count = 0;
    for (const auto& rule : rules) {
        if (rule.default_deny) ++deny_count;
    }
    if (deny_count != 1) {
        error = "ruleset must contain exactly one default-deny rule, found " + std::to_string(deny_count);
        return false;
    }
    if (!rules.back().default_deny) {
        error = "default-deny rule must be the last rule";
        return false;
    }
    return true;
}

FirewallSnapshot FirewallGuard::takeSnapshot(StepRecorder& recorder) {
    CommandResult capture = capability_.execute({kSnapshotTool});
    if (!capture.succeeded()) {
        recorder.fatal("firewall_snapshot", "iptables-save failed: " + capture.failureReason());
    }
    if (capture.stdout_output.empty()) {
        recorder.fatal("firewall_snapshot", "iptables-save produced no output");
    }

    FirewallSnapshot snapshot;
    snapshot.path = ArtifactLayout::uniqueArtifactPath(layout_.snapshotsDir(), "iptables_backup", "");

    std::ofstream file(snapshot.path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        recorder.fatal("firewall_snapshot", "cannot create snapshot file " + snapshot.path);
    }
    file << capture.stdout_output;
    file.close();
    if (!file) {
        recorder.fatal("firewall_snapshot", "cannot write snapshot file " + snapshot.path);
    }

    snapshot.size_bytes = capture.stdout_output.size();
    snapshot.checksum = checksum(capture.stdout_output);
    recorder.succeeded("firewall_snapshot", "saved " + std::to_string(snapshot.size_bytes) +
                       " bytes to " + snapshot.path + " (crc32 " + hex32(snapshot.checksum) + ")");
    return snapshot;
}

IsolationOutcome FirewallGuard::isolate(StepRecorder& recorder) {
    IsolationOutcome outcome;

    if (!runner_.isAvailable(kFirewallTool)) {
        recorder.warned("firewall", "iptables not available, network isolation skipped");
        return outcome;
    }
    outcome.firewall_available = true;

    const auto rules = isolationRuleset(management_port_);
    std::string error;
    if (!validateRuleset(rules, error)) {
        recorder.fatal("firewall_rules", error);
    }

    // EN: Nothing restrictive may be applied before this returns.
    // FR: Aucune règle restrictive ne peut être appliquée avant ce retour.
    outcome.snapshot = takeSnapshot(recorder);

    for (const auto& rule : rules) {
        std::vector<std::string> argv{kFirewallTool};
        argv.insert(argv.end(), rule.arguments.begin(), rule.arguments.end());

        CommandResult applied = capability_.execute(argv);
        if (applied.succeeded()) {
            outcome.applied_rules.push_back(rule.description);
            recorder.succeeded("firewall_rule", rule.description);
            continue;
        }

        outcome.failed_rules.push_back(rule.description);
        if (rule.default_deny) {
            recorder.fatal("firewall_rule", rule.description + " failed, isolation not in effect: " +
                           applied.failureReason());
        }
        recorder.warned("firewall_rule", rule.description + " failed: " + applied.failureReason());
    }
    return outcome;
}

std::vector<std::string> FirewallGuard::restoreInstructions(const std::string& snapshot_path,
                                                            const std::vector<std::string>& services) {
    std::vector<std::string> lines;
    lines.push_back("1. Restore firewall rules:");
    lines.push_back("   sudo iptables-restore < " + snapshot_path);
    if (!services.empty()) {
        lines.push_back("2. Re-enable and restart services:");
        for (const auto& service : services) {
            lines.push_back("   sudo systemctl enable " + service);
            lines.push_back("   sudo systemctl start " + service);
        }
    }
    return lines;
}

} // namespace Orchestrator
} // namespace DAO
