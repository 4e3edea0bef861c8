// EN: Firewall guard - snapshot the iptables ruleset, then apply the isolation ruleset in a fixed order
// FR: Garde pare-feu - sauvegarde les règles iptables puis applique les règles d'isolation dans un ordre fixe

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/artifact_layout.hpp"

namespace DAO {
namespace Orchestrator {

struct FirewallRule {
    std::string description;
    std::vector<std::string> arguments;     // EN: Passed to iptables / FR: Arguments passés à iptables
    bool default_deny = false;
};

struct FirewallSnapshot {
    std::string path;
    uint32_t checksum = 0;                  // EN: zlib CRC-32 of the file content / FR: CRC-32 zlib du contenu
    size_t size_bytes = 0;
};

struct IsolationOutcome {
    bool firewall_available = false;
    std::optional<FirewallSnapshot> snapshot;
    std::vector<std::string> applied_rules;     // EN: Descriptions, in application order / FR: Descriptions, dans l'ordre
    std::vector<std::string> failed_rules;
};

class FirewallGuard {
public:
    FirewallGuard(ICommandRunner& runner, IPrivilegedCapability& capability,
                  const ArtifactLayout& layout, int management_port = 22);

    // EN: Snapshot then apply the isolation ruleset. Snapshot or default-deny failure throws FatalActionError.
    // FR: Sauvegarde puis applique les règles d'isolation. Un échec de sauvegarde ou du refus par défaut lève FatalActionError.
    IsolationOutcome isolate(StepRecorder& recorder);

    // EN: Capture iptables-save output to a new snapshot file. Fatal on any failure.
    // FR: Capture la sortie d'iptables-save dans un nouvel instantané. Fatal en cas d'échec.
    FirewallSnapshot takeSnapshot(StepRecorder& recorder);

    // EN: Allow loopback, established/related, management port, then drop everything else.
    // FR: Autorise loopback, connexions établies, port d'administration, puis rejette tout le reste.
    static std::vector<FirewallRule> isolationRuleset(int management_port);

    // EN: Exactly one default-deny rule, and it must be last.
    // FR: Exactement une règle de refus par défaut, et elle doit être la dernière.
    static bool validateRuleset(const std::vector<FirewallRule>& rules, std::string& error);

    // EN: Manual recovery procedure; never executed.
    // FR: Procédure de restauration manuelle ; jamais exécutée.
    static std::vector<std::string> restoreInstructions(const std::string& snapshot_path,
                                                        const std::vector<std::string>& services);

    static uint32_t checksum(const std::string& content);

private:
    ICommandRunner& runner_;
    IPrivilegedCapability& capability_;
    const ArtifactLayout& layout_;
    int management_port_;
};

} // namespace Orchestrator
} // namespace DAO
