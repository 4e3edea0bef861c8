// EN: Implementation of ArtifactLayout
// FR: Implémentation de ArtifactLayout

#include "orchestrator/artifact_layout.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace DAO {
namespace Orchestrator {

namespace fs = std::filesystem;

ArtifactLayout::ArtifactLayout(std::string base_dir)
    : base_dir_(std::move(base_dir)) {
    while (base_dir_.size() > 1 && base_dir_.back() == '/') {
        base_dir_.pop_back();
    }
}

std::string ArtifactLayout::statusDir() const { return base_dir_ + "/status"; }
std::string ArtifactLayout::logsDir() const { return base_dir_ + "/logs"; }
std::string ArtifactLayout::reportsDir() const { return base_dir_ + "/reports"; }
std::string ArtifactLayout::snapshotsDir() const { return base_dir_ + "/snapshots"; }
std::string ArtifactLayout::backupsDir() const { return base_dir_ + "/backups"; }
std::string ArtifactLayout::locksDir() const { return base_dir_ + "/locks"; }

bool ArtifactLayout::ensureDirectories(std::string& error) const {
    for (const auto& dir : {statusDir(), logsDir(), reportsDir(), snapshotsDir(), backupsDir(), locksDir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            error = "Cannot create directory " + dir + ": " + ec.message();
            return false;
        }
    }
    return true;
}

std::string ArtifactLayout::statusFile(ActionKind kind) const {
    return statusDir() + "/" + ActionUtils::kindArtifactName(kind) + "_status";
}

std::string ArtifactLayout::lockFile(ActionKind kind) const {
    return locksDir() + "/" + ActionUtils::kindArtifactName(kind) + ".lock";
}

std::string ArtifactLayout::logFile(ActionKind kind) const {
    return uniqueArtifactPath(logsDir(), ActionUtils::kindArtifactName(kind), ".log");
}

std::string ArtifactLayout::uniqueArtifactPath(const std::string& dir, const std::string& prefix,
                                               const std::string& extension) {
    const std::string stem = dir + "/" + prefix + "_" + timestampTag();
    std::string candidate = stem + extension;
    std::error_code ec;
    for (int suffix = 1; fs::exists(candidate, ec); ++suffix) {
        candidate = stem + "_" + std::to_string(suffix) + extension;
    }
    return candidate;
}

std::string ArtifactLayout::timestampTag() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y%m%d_%H%M%S") << '_' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace Orchestrator
} // namespace DAO
