// EN: Implementation of StatusTracker - tokens are written to a temporary file then renamed
// FR: Implémentation de StatusTracker - les jetons sont écrits dans un fichier temporaire puis renommés

#include "orchestrator/status_tracker.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace DAO {
namespace Orchestrator {

namespace fs = std::filesystem;

StatusTracker::StatusTracker(const ArtifactLayout& layout)
    : layout_(layout) {
}

bool StatusTracker::setStatus(ActionKind kind, ActionStatus status) {
    const std::string path = layout_.statusFile(kind);
    std::error_code ec;

    if (status == ActionStatus::NOT_STARTED) {
        fs::remove(path, ec);
        if (ec) {
            LOG_ERROR("status", "Cannot clear status file " + path + ": " + ec.message());
            return false;
        }
        return true;
    }

    fs::create_directories(layout_.statusDir(), ec);
    if (ec) {
        LOG_ERROR("status", "Cannot create status directory: " + ec.message());
        return false;
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("status", "Cannot open status file for writing: " + temp_path);
            return false;
        }
        file << ActionUtils::statusToToken(status) << '\n';
        file.flush();
        if (!file) {
            LOG_ERROR("status", "Cannot write status file: " + temp_path);
            return false;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        LOG_ERROR("status", "Cannot replace status file " + path + ": " + ec.message());
        fs::remove(temp_path, ec);
        return false;
    }

    LOG_DEBUG("status", ActionUtils::kindArtifactName(kind) + " -> " + ActionUtils::statusToToken(status));
    return true;
}

ActionStatus StatusTracker::getStatus(ActionKind kind) const {
    const std::string path = layout_.statusFile(kind);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ActionStatus::NOT_STARTED;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("status", "Cannot read status file: " + path);
        return ActionStatus::NOT_STARTED;
    }

    std::string token;
    file >> token;
    auto status = ActionUtils::statusFromToken(token);
    if (!status) {
        LOG_WARN("status", "Unrecognised status token '" + token + "' in " + path);
        return ActionStatus::NOT_STARTED;
    }
    return *status;
}

} // namespace Orchestrator
} // namespace DAO
