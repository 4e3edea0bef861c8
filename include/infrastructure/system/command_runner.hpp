// EN: Command runner - synchronous execution of external tools without a shell
// FR: Exécuteur de commandes - exécution synchrone d'outils externes sans shell

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace DAO {

// EN: Outcome of one external command
// FR: Résultat d'une commande externe
struct CommandResult {
    bool launched = false;              // EN: Process was started (binary found, fork ok) / FR: Processus démarré
    int exit_code = -1;                 // EN: Exit status, or -1 when killed or not launched / FR: Code de sortie, -1 si tué ou non lancé
    bool timed_out = false;             // EN: Killed after exceeding the timeout / FR: Tué après dépassement du délai
    std::string stdout_output;
    std::string stderr_output;

    bool succeeded() const { return launched && !timed_out && exit_code == 0; }

    // EN: Short human-readable reason for a failure, for warnings and reports.
    // FR: Raison courte et lisible d'un échec, pour les avertissements et rapports.
    std::string failureReason() const;
};

// EN: Join argv for display ("iptables -A INPUT -j DROP").
// FR: Concatène argv pour affichage ("iptables -A INPUT -j DROP").
std::string formatCommand(const std::vector<std::string>& argv);

// EN: Read-only access to the operating system. Every mutation goes through IPrivilegedCapability instead.
// FR: Accès en lecture seule au système. Toute mutation passe par IPrivilegedCapability.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // EN: Run argv[0] with arguments, wait for it, capture its output.
    // FR: Exécute argv[0] avec ses arguments, l'attend et capture sa sortie.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;

    // EN: True when the program can be found on PATH (or the system sbin directories).
    // FR: Vrai si le programme est trouvable dans PATH (ou les répertoires sbin système).
    virtual bool isAvailable(const std::string& program) = 0;
};

// EN: fork/exec based runner with a per-command timeout.
// FR: Exécuteur basé sur fork/exec avec délai maximal par commande.
class SystemCommandRunner : public ICommandRunner {
public:
    explicit SystemCommandRunner(std::chrono::seconds timeout = std::chrono::seconds(300));

    CommandResult run(const std::vector<std::string>& argv) override;
    bool isAvailable(const std::string& program) override;

    // EN: Absolute path of the program, or empty if not found.
    // FR: Chemin absolu du programme, ou vide s'il est introuvable.
    static std::string resolveProgram(const std::string& program);

private:
    std::chrono::seconds timeout_;
};

} // namespace DAO
