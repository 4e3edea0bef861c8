// EN: Implementation of ActionOrchestrator and ActionLock
// FR: Implémentation de ActionOrchestrator et ActionLock

#include "orchestrator/action_orchestrator.hpp"
#include "orchestrator/defensive_actions.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace DAO {
namespace Orchestrator {

ActionLock::~ActionLock() {
    release();
}

bool ActionLock::acquire(const std::string& path, std::string& error) {
    release();

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open lock file " + path + ": " + std::strerror(errno);
        return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        error = (err == EWOULDBLOCK)
            ? "another invocation holds " + path
            : "flock failed on " + path + ": " + std::strerror(err);
        return false;
    }

    fd_ = fd;
    return true;
}

void ActionLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

ActionOrchestrator::ActionOrchestrator(OrchestratorSettings settings, ICommandRunner& runner,
                                       IPrivilegedCapability& capability, ISystemProbe& probe,
                                       ITicker& ticker, const CancellationToken& cancellation)
    : settings_(std::move(settings)),
      layout_(settings_.base_dir),
      status_tracker_(layout_),
      runner_(runner),
      capability_(capability),
      probe_(probe),
      ticker_(ticker),
      cancellation_(cancellation) {
}

ActionStatus ActionOrchestrator::currentStatus(ActionKind kind) const {
    return status_tracker_.getStatus(kind);
}

ActionResult ActionOrchestrator::run(ActionKind kind) {
    ActionResult result;
    result.kind = kind;
    result.cve = settings_.cve;
    result.started_at = std::chrono::system_clock::now();

    const std::string module = ActionUtils::kindArtifactName(kind);

    std::string error;
    if (!layout_.ensureDirectories(error)) {
        LOG_ERROR(module, error);
        result.status = ActionStatus::FAILED;
        result.failure_reason = error;
        result.finished_at = std::chrono::system_clock::now();
        return result;
    }

    auto& logger = Logger::getInstance();
    const std::string previous_correlation = logger.getCorrelationId();
    const std::string log_path = layout_.logFile(kind);
    if (logger.setOutputFile(log_path)) {
        result.log_path = log_path;
    }
    logger.setCorrelationId(result.cve);

    LOG_INFO_META(module, "Action started", (std::unordered_map<std::string, std::string>{
        {"action", ActionUtils::kindToString(kind)},
        {"privilege", capability_.describe()},
        {"base_dir", layout_.baseDir()}}));

    ActionLock lock;
    if (settings_.exclusive_lock && !lock.acquire(layout_.lockFile(kind), error)) {
        // EN: The running invocation owns the token; leave it alone.
        // FR: L'invocation en cours possède le jeton ; on n'y touche pas.
        LOG_ERROR(module, "Cannot start: " + error);
        result.status = ActionStatus::FAILED;
        result.failure_reason = error;
    } else {
        executeLocked(result);
    }

    result.finished_at = std::chrono::system_clock::now();
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        result.finished_at - result.started_at).count();
    const std::string summary = "Action finished: " + ActionUtils::statusToToken(result.status);
    const std::unordered_map<std::string, std::string> metadata{
        {"duration_ms", std::to_string(elapsed_ms)},
        {"warnings", std::to_string(result.countSteps(StepStatus::WARNED))}};
    if (result.status == ActionStatus::COMPLETED) {
        LOG_INFO_META(module, summary, metadata);
    } else {
        LOG_ERROR_META(module, summary + (result.failure_reason.empty() ? "" : " (" + result.failure_reason + ")"),
                       metadata);
    }

    lock.release();
    logger.closeOutputFile();
    logger.setCorrelationId(previous_correlation);
    return result;
}

void ActionOrchestrator::executeLocked(ActionResult& result) {
    const std::string module = ActionUtils::kindArtifactName(result.kind);

    if (!status_tracker_.setStatus(result.kind, ActionStatus::IN_PROGRESS)) {
        result.status = ActionStatus::FAILED;
        result.failure_reason = "cannot write status token " + layout_.statusFile(result.kind);
        return;
    }
    result.status = ActionStatus::IN_PROGRESS;

    StepRecorder recorder(module);
    ActionContext context{settings_, layout_, status_tracker_, runner_, capability_, probe_, ticker_, cancellation_};

    try {
        auto action = createAction(result.kind, context);
        action->execute(recorder, result);
        if (result.cancelled) {
            result.status = ActionStatus::FAILED;
            result.failure_reason = "cancelled before completion";
        } else {
            result.status = ActionStatus::COMPLETED;
        }
    } catch (const FatalActionError& e) {
        result.status = ActionStatus::FAILED;
        result.failure_reason = e.step() + ": " + e.what();
    } catch (const std::exception& e) {
        LOG_ERROR(module, std::string("Unexpected error: ") + e.what());
        result.status = ActionStatus::FAILED;
        result.failure_reason = std::string("unexpected error: ") + e.what();
    }

    result.steps = recorder.takeSteps();

    if (!status_tracker_.setStatus(result.kind, result.status)) {
        result.status = ActionStatus::FAILED;
        if (result.failure_reason.empty()) {
            result.failure_reason = "cannot write status token " + layout_.statusFile(result.kind);
        }
    }
}

} // namespace Orchestrator
} // namespace DAO
