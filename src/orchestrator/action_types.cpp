// EN: Implementation of the shared action types - step recording, JSON export, conversions
// FR: Implémentation des types d'action communs - enregistrement des étapes, export JSON, conversions

#include "orchestrator/action_types.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace DAO {
namespace Orchestrator {

namespace {

std::string toIso8601(const std::chrono::system_clock::time_point& tp) {
    if (tp.time_since_epoch().count() == 0) {
        return "";
    }
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);
    std::ostringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

size_t ActionResult::countSteps(StepStatus wanted) const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [wanted](const StepRecord& step) { return step.status == wanted; }));
}

std::optional<StepRecord> ActionResult::findStep(const std::string& name) const {
    for (const auto& step : steps) {
        if (step.name == name) {
            return step;
        }
    }
    return std::nullopt;
}

nlohmann::json ActionResult::toJson() const {
    nlohmann::json json;
    json["action"] = ActionUtils::kindToString(kind);
    json["status"] = ActionUtils::statusToToken(status);
    json["cve"] = cve;
    json["cancelled"] = cancelled;
    json["started_at"] = toIso8601(started_at);
    json["finished_at"] = toIso8601(finished_at);
    if (!report_path.empty()) json["report"] = report_path;
    if (!log_path.empty()) json["log"] = log_path;
    if (!snapshot_path.empty()) json["snapshot"] = snapshot_path;
    if (!failure_reason.empty()) json["failure_reason"] = failure_reason;

    nlohmann::json steps_array = nlohmann::json::array();
    for (const auto& step : steps) {
        steps_array.push_back({
            {"name", step.name},
            {"status", ActionUtils::stepStatusToString(step.status)},
            {"detail", step.detail}
        });
    }
    json["steps"] = steps_array;

    json["summary"] = {
        {"succeeded", countSteps(StepStatus::SUCCEEDED)},
        {"skipped", countSteps(StepStatus::SKIPPED)},
        {"warned", countSteps(StepStatus::WARNED)},
        {"fatal", countSteps(StepStatus::FATAL)}
    };
    return json;
}

StepRecorder::StepRecorder(std::string module)
    : module_(std::move(module)) {
}

void StepRecorder::succeeded(const std::string& step, const std::string& detail) {
    record(step, StepStatus::SUCCEEDED, detail);
}

void StepRecorder::skipped(const std::string& step, const std::string& detail) {
    record(step, StepStatus::SKIPPED, detail);
}

void StepRecorder::warned(const std::string& step, const std::string& detail) {
    record(step, StepStatus::WARNED, detail);
}

void StepRecorder::fatal(const std::string& step, const std::string& detail) {
    record(step, StepStatus::FATAL, detail);
    throw FatalActionError(step, detail);
}

void StepRecorder::record(const std::string& step, StepStatus status, const std::string& detail) {
    steps_.push_back({step, status, detail, std::chrono::system_clock::now()});

    const std::string message = step + ": " + detail;
    switch (status) {
        case StepStatus::SUCCEEDED:
        case StepStatus::SKIPPED:
            LOG_INFO(module_, message);
            break;
        case StepStatus::WARNED:
            LOG_WARN(module_, message);
            break;
        case StepStatus::FATAL:
            LOG_ERROR(module_, message);
            break;
    }
}

std::vector<StepRecord> StepRecorder::takeSteps() {
    std::vector<StepRecord> taken = std::move(steps_);
    steps_.clear();
    return taken;
}

namespace ActionUtils {

std::string kindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::PATCH: return "patch";
        case ActionKind::ISOLATE: return "isolate";
        case ActionKind::SHUTDOWN: return "shutdown";
        case ActionKind::STATUS_CHECK: return "status-check";
        default: return "unknown";
    }
}

std::optional<ActionKind> kindFromString(const std::string& value) {
    if (value == "patch") return ActionKind::PATCH;
    if (value == "isolate" || value == "isolation") return ActionKind::ISOLATE;
    if (value == "shutdown" || value == "emergency-shutdown") return ActionKind::SHUTDOWN;
    if (value == "status-check" || value == "status_check") return ActionKind::STATUS_CHECK;
    return std::nullopt;
}

std::string kindArtifactName(ActionKind kind) {
    switch (kind) {
        case ActionKind::PATCH: return "patch";
        case ActionKind::ISOLATE: return "isolation";
        case ActionKind::SHUTDOWN: return "shutdown";
        case ActionKind::STATUS_CHECK: return "status_check";
        default: return "unknown";
    }
}

std::string statusToToken(ActionStatus status) {
    switch (status) {
        case ActionStatus::NOT_STARTED: return "NOT_STARTED";
        case ActionStatus::IN_PROGRESS: return "IN_PROGRESS";
        case ActionStatus::COMPLETED: return "COMPLETED";
        case ActionStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

std::optional<ActionStatus> statusFromToken(const std::string& token) {
    if (token == "NOT_STARTED") return ActionStatus::NOT_STARTED;
    if (token == "IN_PROGRESS") return ActionStatus::IN_PROGRESS;
    if (token == "COMPLETED") return ActionStatus::COMPLETED;
    if (token == "FAILED") return ActionStatus::FAILED;
    return std::nullopt;
}

std::string stepStatusToString(StepStatus status) {
    switch (status) {
        case StepStatus::SUCCEEDED: return "succeeded";
        case StepStatus::SKIPPED: return "skipped";
        case StepStatus::WARNED: return "warned";
        case StepStatus::FATAL: return "fatal";
        default: return "unknown";
    }
}

std::vector<ActionKind> allKinds() {
    return {ActionKind::PATCH, ActionKind::ISOLATE, ActionKind::SHUTDOWN, ActionKind::STATUS_CHECK};
}

} // namespace ActionUtils

} // namespace Orchestrator
} // namespace DAO
