// EN: Implementation of PackageManager
// FR: Implémentation de PackageManager

#include "orchestrator/package_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fstream>

namespace DAO {
namespace Orchestrator {

namespace {

// EN: yum/dnf check-update exits 100 when updates are available.
// FR: yum/dnf check-update sort avec 100 quand des mises à jour sont disponibles.
constexpr int kCheckUpdateAvailable = 100;

bool isRpmBased(PackageManagerKind kind) {
    return kind == PackageManagerKind::DNF || kind == PackageManagerKind::YUM;
}

} // namespace

PackageManager::PackageManager(ICommandRunner& runner, IPrivilegedCapability& capability,
                               const ArtifactLayout& layout)
    : runner_(runner), capability_(capability), layout_(layout) {
}

PackageManagerKind PackageManager::detect() {
    const std::pair<const char*, PackageManagerKind> candidates[] = {
        {"apt-get", PackageManagerKind::APT},
        {"dnf", PackageManagerKind::DNF},
        {"yum", PackageManagerKind::YUM},
        {"pacman", PackageManagerKind::PACMAN},
    };
    for (const auto& [program, kind] : candidates) {
        if (runner_.isAvailable(program)) {
            LOG_DEBUG("packages", std::string("Detected package manager: ") + program);
            return kind;
        }
    }
    return PackageManagerKind::NONE;
}

std::vector<std::string> PackageManager::refreshCommand(PackageManagerKind kind) {
    switch (kind) {
        case PackageManagerKind::APT: return {"apt-get", "update", "-qq"};
        case PackageManagerKind::DNF: return {"dnf", "check-update", "-q"};
        case PackageManagerKind::YUM: return {"yum", "check-update", "-q"};
        case PackageManagerKind::PACMAN: return {"pacman", "-Sy", "--noconfirm"};
        default: return {};
    }
}

std::vector<std::string> PackageManager::upgradeCommand(PackageManagerKind kind) {
    switch (kind) {
        case PackageManagerKind::APT: return {"apt-get", "upgrade", "-y", "-qq"};
        case PackageManagerKind::DNF: return {"dnf", "update", "-y", "-q"};
        case PackageManagerKind::YUM: return {"yum", "update", "-y", "-q"};
        case PackageManagerKind::PACMAN: return {"pacman", "-Su", "--noconfirm"};
        default: return {};
    }
}

std::vector<std::string> PackageManager::inventoryCommand(PackageManagerKind kind) {
    switch (kind) {
        case PackageManagerKind::APT: return {"dpkg", "--get-selections"};
        case PackageManagerKind::DNF:
        case PackageManagerKind::YUM: return {"rpm", "-qa"};
        case PackageManagerKind::PACMAN: return {"pacman", "-Q"};
        default: return {};
    }
}

std::string PackageManager::kindToString(PackageManagerKind kind) {
    switch (kind) {
        case PackageManagerKind::APT: return "apt-get";
        case PackageManagerKind::DNF: return "dnf";
        case PackageManagerKind::YUM: return "yum";
        case PackageManagerKind::PACMAN: return "pacman";
        default: return "none";
    }
}

std::optional<std::string> PackageManager::backupInventory(PackageManagerKind kind, StepRecorder& recorder) {
    const auto command = inventoryCommand(kind);
    if (command.empty() || !runner_.isAvailable(command.front())) {
        recorder.skipped("package_backup", "package inventory tool not available");
        return std::nullopt;
    }

    CommandResult listing = runner_.run(command);
    if (!listing.succeeded()) {
        recorder.warned("package_backup", formatCommand(command) + " failed: " + listing.failureReason());
        return std::nullopt;
    }

    const std::string path = ArtifactLayout::uniqueArtifactPath(layout_.backupsDir(), "package_list", ".txt");
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        recorder.warned("package_backup", "cannot create " + path);
        return std::nullopt;
    }
    file << listing.stdout_output;
    file.close();
    if (!file) {
        recorder.warned("package_backup", "cannot write " + path);
        return std::nullopt;
    }

    recorder.succeeded("package_backup", "package list saved to " + path);
    return path;
}

bool PackageManager::refresh(PackageManagerKind kind, StepRecorder& recorder) {
    const auto command = refreshCommand(kind);
    if (command.empty()) {
        recorder.skipped("package_refresh", "no package manager");
        return false;
    }

    CommandResult result = capability_.execute(command);
    const bool ok = result.succeeded() ||
        (isRpmBased(kind) && result.launched && !result.timed_out && result.exit_code == kCheckUpdateAvailable);
    if (!ok) {
        recorder.warned("package_refresh", "failed to update " + kindToString(kind) +
                        " package list: " + result.failureReason());
        return false;
    }
    recorder.succeeded("package_refresh", kindToString(kind) + " package list updated");
    return true;
}

void PackageManager::upgrade(PackageManagerKind kind, StepRecorder& recorder) {
    const auto command = upgradeCommand(kind);
    if (command.empty()) {
        recorder.fatal("package_upgrade", "no supported package manager found");
    }

    CommandResult result = capability_.execute(command);
    if (!result.succeeded()) {
        recorder.fatal("package_upgrade", "failed to apply " + kindToString(kind) +
                       " security updates: " + result.failureReason());
    }
    recorder.succeeded("package_upgrade", kindToString(kind) + " updates applied");
}

} // namespace Orchestrator
} // namespace DAO
