// EN: Implementation of the privileged capabilities (sudo, direct, dry-run)
// FR: Implémentation des capacités privilégiées (sudo, direct, simulation)

#include "infrastructure/system/privileged_capability.hpp"
#include "infrastructure/logging/logger.hpp"

namespace DAO {

SudoCapability::SudoCapability(ICommandRunner& runner)
    : runner_(runner) {
}

CommandResult SudoCapability::execute(const std::vector<std::string>& argv) {
    std::vector<std::string> elevated;
    elevated.reserve(argv.size() + 2);
    elevated.push_back("sudo");
    elevated.push_back("-n");
    elevated.insert(elevated.end(), argv.begin(), argv.end());

    LOG_DEBUG("privilege", "sudo " + formatCommand(argv));
    return runner_.run(elevated);
}

DirectCapability::DirectCapability(ICommandRunner& runner)
    : runner_(runner) {
}

CommandResult DirectCapability::execute(const std::vector<std::string>& argv) {
    LOG_DEBUG("privilege", formatCommand(argv));
    return runner_.run(argv);
}

// EN: Output is a marker comment so snapshot files written in dry-run mode are non-empty and self-describing.
// FR: La sortie est un commentaire marqueur pour que les instantanés en simulation soient non vides et explicites.
CommandResult DryRunCapability::execute(const std::vector<std::string>& argv) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(argv);
    }
    LOG_INFO("privilege", "[dry-run] would execute: " + formatCommand(argv));

    CommandResult result;
    result.launched = true;
    result.exit_code = 0;
    result.stdout_output = "# dry-run: " + formatCommand(argv) + "\n";
    return result;
}

std::vector<std::vector<std::string>> DryRunCapability::executedCommands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
}

std::unique_ptr<IPrivilegedCapability> makeCapability(ICommandRunner& runner, bool dry_run, bool use_sudo) {
    if (dry_run) {
        return std::make_unique<DryRunCapability>();
    }
    if (use_sudo) {
        return std::make_unique<SudoCapability>(runner);
    }
    return std::make_unique<DirectCapability>(runner);
}

} // namespace DAO
