// EN: Privileged capability - the explicit handle through which every system mutation is executed
// FR: Capacité privilégiée - le point de passage explicite de toute mutation du système

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"

namespace DAO {

// EN: Executes a command with elevated privileges. Components that change system state receive one explicitly.
// FR: Exécute une commande avec privilèges élevés. Les composants qui modifient le système en reçoivent une explicitement.
class IPrivilegedCapability {
public:
    virtual ~IPrivilegedCapability() = default;

    virtual CommandResult execute(const std::vector<std::string>& argv) = 0;

    // EN: Short description for logs and reports ("sudo", "direct", "dry-run").
    // FR: Description courte pour journaux et rapports ("sudo", "direct", "dry-run").
    virtual std::string describe() const = 0;
};

// EN: Prefixes every command with non-interactive sudo.
// FR: Préfixe chaque commande par sudo non interactif.
class SudoCapability : public IPrivilegedCapability {
public:
    explicit SudoCapability(ICommandRunner& runner);

    CommandResult execute(const std::vector<std::string>& argv) override;
    std::string describe() const override { return "sudo"; }

private:
    ICommandRunner& runner_;
};

// EN: Runs commands as-is, for a process that already holds the required privileges.
// FR: Exécute les commandes telles quelles, pour un processus disposant déjà des privilèges.
class DirectCapability : public IPrivilegedCapability {
public:
    explicit DirectCapability(ICommandRunner& runner);

    CommandResult execute(const std::vector<std::string>& argv) override;
    std::string describe() const override { return "direct"; }

private:
    ICommandRunner& runner_;
};

// EN: Records and logs commands without running them; every command reports success.
// FR: Enregistre et journalise les commandes sans les exécuter ; chaque commande réussit.
class DryRunCapability : public IPrivilegedCapability {
public:
    CommandResult execute(const std::vector<std::string>& argv) override;
    std::string describe() const override { return "dry-run"; }

    std::vector<std::vector<std::string>> executedCommands() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> commands_;
};

// EN: Pick the capability matching the execution settings.
// FR: Choisit la capacité correspondant aux paramètres d'exécution.
std::unique_ptr<IPrivilegedCapability> makeCapability(ICommandRunner& runner, bool dry_run, bool use_sudo);

} // namespace DAO
