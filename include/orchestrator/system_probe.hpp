// EN: System probe - read-only survey of host, memory, disks, services, network, processes and security
// FR: Sonde système - relevé en lecture seule de l'hôte, mémoire, disques, services, réseau, processus et sécurité

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"

namespace DAO {
namespace Orchestrator {

struct LoadAverage {
    double one = 0.0;
    double five = 0.0;
    double fifteen = 0.0;
};

struct MemoryUsage {
    uint64_t total_kb = 0;
    uint64_t used_kb = 0;
    uint64_t available_kb = 0;
    uint64_t swap_total_kb = 0;
    uint64_t swap_used_kb = 0;
    double used_pct = 0.0;
};

struct FilesystemUsage {
    std::string device;
    std::string mountpoint;
    std::string fstype;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t avail_bytes = 0;
    double used_pct = 0.0;
};

struct ServiceState {
    std::string name;
    bool active = false;
    bool enabled = false;
};

struct NetworkAddress {
    std::string interface_name;
    std::string family;         // EN: "inet" or "inet6" / FR: "inet" ou "inet6"
    std::string address;
};

struct UpdateSummary {
    std::string tool;
    int count = 0;
};

// EN: Every query returns nullopt when its underlying source is not available.
// FR: Chaque requête retourne nullopt si sa source sous-jacente est indisponible.
class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    virtual std::optional<std::string> hostname() = 0;
    virtual std::optional<std::string> uptime() = 0;
    virtual std::optional<LoadAverage> loadAverage() = 0;
    virtual std::optional<std::string> kernelVersion() = 0;
    virtual std::optional<MemoryUsage> memoryUsage() = 0;
    virtual std::optional<std::vector<FilesystemUsage>> filesystemUsage() = 0;
    virtual std::optional<std::vector<ServiceState>> serviceStates(const std::vector<std::string>& services) = 0;
    virtual std::optional<std::vector<NetworkAddress>> networkInterfaces() = 0;
    virtual std::optional<std::vector<std::string>> listeningSockets() = 0;
    virtual std::optional<std::vector<std::string>> topProcesses(size_t limit) = 0;
    // EN: "Failed password" entries among the most recent auth log lines.
    // FR: Entrées "Failed password" parmi les lignes les plus récentes du journal d'authentification.
    virtual std::optional<int> failedLoginCount() = 0;
    virtual std::optional<std::string> firewallSummary() = 0;

    // EN: Subset of names that match a running process (exact comm match).
    // FR: Sous-ensemble des noms correspondant à un processus en cours (comm exact).
    virtual std::optional<std::vector<std::string>> runningProcesses(const std::vector<std::string>& names) = 0;

    virtual std::optional<UpdateSummary> pendingUpdates() = 0;
};

struct ProbePaths {
    std::string proc_root = "/proc";
    std::vector<std::string> auth_logs = {"/var/log/auth.log", "/var/log/secure"};
    size_t auth_log_window = 1000;      // EN: Trailing lines scanned / FR: Dernières lignes examinées
};

// EN: Linux implementation reading procfs directly and shelling out only for tools with no procfs equivalent.
// FR: Implémentation Linux lisant procfs directement, n'appelant des outils que sans équivalent procfs.
class LinuxSystemProbe : public ISystemProbe {
public:
    // EN: `privileged`, when set, runs the firewall listings (ufw status, iptables -S), which need root.
    // EN: Without it they go through `runner` and usually fail on an unprivileged host.
    // FR: `privileged`, si fourni, exécute les listages pare-feu (ufw status, iptables -S) qui exigent root.
    // FR: Sans lui ils passent par `runner` et échouent en général sur un hôte non privilégié.
    explicit LinuxSystemProbe(ICommandRunner& runner, ProbePaths paths = {},
                              IPrivilegedCapability* privileged = nullptr);

    std::optional<std::string> hostname() override;
    std::optional<std::string> uptime() override;
    std::optional<LoadAverage> loadAverage() override;
    std::optional<std::string> kernelVersion() override;
    std::optional<MemoryUsage> memoryUsage() override;
    std::optional<std::vector<FilesystemUsage>> filesystemUsage() override;
    std::optional<std::vector<ServiceState>> serviceStates(const std::vector<std::string>& services) override;
    std::optional<std::vector<NetworkAddress>> networkInterfaces() override;
    std::optional<std::vector<std::string>> listeningSockets() override;
    std::optional<std::vector<std::string>> topProcesses(size_t limit) override;
    std::optional<int> failedLoginCount() override;
    std::optional<std::string> firewallSummary() override;
    std::optional<std::vector<std::string>> runningProcesses(const std::vector<std::string>& names) override;
    std::optional<UpdateSummary> pendingUpdates() override;

    // EN: Parsers for procfs content, exposed for tests.
    // FR: Analyseurs du contenu procfs, exposés pour les tests.
    static std::optional<MemoryUsage> parseMeminfo(const std::string& content);
    static std::optional<LoadAverage> parseLoadAverage(const std::string& content);
    static std::optional<std::string> parseUptime(const std::string& content);

private:
    std::optional<std::string> readProcFile(const std::string& relative) const;
    CommandResult runFirewallQuery(const std::vector<std::string>& argv);

    ICommandRunner& runner_;
    ProbePaths paths_;
    IPrivilegedCapability* privileged_;
};

} // namespace Orchestrator
} // namespace DAO
