// EN: Implementation of ServiceController - systemctl queries via the runner, mutations via the capability
// FR: Implémentation de ServiceController - requêtes systemctl via l'exécuteur, mutations via la capacité

#include "orchestrator/service_controller.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace DAO {
namespace Orchestrator {

namespace {
constexpr const char* kServiceManager = "systemctl";
}

size_t ServiceBatchResult::count(ServiceOutcome outcome) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [outcome](const ServiceResult& r) { return r.outcome == outcome; }));
}

std::vector<std::string> ServiceBatchResult::changedServices() const {
    std::vector<std::string> names;
    for (const auto& r : results) {
        if (r.outcome == ServiceOutcome::SUCCEEDED &&
            std::find(names.begin(), names.end(), r.service) == names.end()) {
            names.push_back(r.service);
        }
    }
    return names;
}

ServiceController::ServiceController(ICommandRunner& runner, IPrivilegedCapability& capability)
    : runner_(runner), capability_(capability) {
}

bool ServiceController::isServiceManagerAvailable() {
    return runner_.isAvailable(kServiceManager);
}

bool ServiceController::isActive(const std::string& service) {
    return runner_.run({kServiceManager, "is-active", "--quiet", service}).succeeded();
}

bool ServiceController::isEnabled(const std::string& service) {
    return runner_.run({kServiceManager, "is-enabled", "--quiet", service}).succeeded();
}

ServiceBatchResult ServiceController::apply(const std::vector<ServiceDescriptor>& descriptors) {
    ServiceBatchResult batch;
    batch.results.reserve(descriptors.size());

    if (!isServiceManagerAvailable()) {
        LOG_WARN("services", "systemctl not available, service changes skipped");
        for (const auto& descriptor : descriptors) {
            batch.results.push_back({descriptor.name, descriptor.desired_state, ServiceOutcome::SKIPPED,
                                     "not available"});
        }
        return batch;
    }

    for (const auto& descriptor : descriptors) {
        batch.results.push_back(applyOne(descriptor));
    }

    LOG_INFO_META("services", "Service batch applied", (std::unordered_map<std::string, std::string>{
        {"succeeded", std::to_string(batch.count(ServiceOutcome::SUCCEEDED))},
        {"skipped", std::to_string(batch.count(ServiceOutcome::SKIPPED))},
        {"warned", std::to_string(batch.count(ServiceOutcome::WARNED))}}));
    return batch;
}

ServiceResult ServiceController::applyOne(const ServiceDescriptor& descriptor) {
    ServiceResult result{descriptor.name, descriptor.desired_state, ServiceOutcome::SKIPPED, ""};

    std::string verb;
    bool needs_change = false;
    switch (descriptor.desired_state) {
        case DesiredState::STOPPED:
            verb = "stop";
            needs_change = isActive(descriptor.name);
            result.detail = needs_change ? "" : "not active";
            break;
        case DesiredState::DISABLED:
            verb = "disable";
            needs_change = isEnabled(descriptor.name);
            result.detail = needs_change ? "" : "not enabled";
            break;
        case DesiredState::RESTARTED:
            verb = "restart";
            needs_change = isActive(descriptor.name);
            result.detail = needs_change ? "" : "not active";
            break;
    }

    if (!needs_change) {
        LOG_DEBUG("services", descriptor.name + " " + result.detail + ", " + verb + " skipped");
        return result;
    }

    CommandResult command = capability_.execute({kServiceManager, verb, descriptor.name});
    if (command.succeeded()) {
        result.outcome = ServiceOutcome::SUCCEEDED;
        result.detail = verb + " ok";
        LOG_INFO("services", "Service " + descriptor.name + ": " + verb + " ok");
    } else {
        result.outcome = ServiceOutcome::WARNED;
        result.detail = verb + " failed: " + command.failureReason();
        LOG_WARN("services", "Failed to " + verb + " " + descriptor.name + ": " + command.failureReason());
    }
    return result;
}

namespace ServiceCatalog {

std::vector<ServiceDescriptor> patchRestarts() {
    std::vector<ServiceDescriptor> list;
    for (const char* name : {"ssh", "apache2", "nginx", "mysql", "postgresql"}) {
        list.push_back({name, DesiredState::RESTARTED});
    }
    return list;
}

std::vector<ServiceDescriptor> isolationStops() {
    const std::vector<std::string> names{"apache2", "nginx", "mysql", "postgresql", "redis", "memcached"};
    std::vector<ServiceDescriptor> list;
    for (const auto& name : names) {
        list.push_back({name, DesiredState::STOPPED});
    }
    for (const auto& name : names) {
        list.push_back({name, DesiredState::DISABLED});
    }
    return list;
}

std::vector<ServiceDescriptor> shutdownStops() {
    std::vector<ServiceDescriptor> list;
    for (const char* name : {"apache2", "nginx", "mysql", "postgresql", "redis", "docker"}) {
        list.push_back({name, DesiredState::STOPPED});
    }
    return list;
}

std::vector<std::string> diagnosticServices() {
    return {"ssh", "sshd", "apache2", "nginx", "mysql", "postgresql", "redis", "docker"};
}

} // namespace ServiceCatalog

namespace ServiceUtils {

std::string desiredStateToString(DesiredState state) {
    switch (state) {
        case DesiredState::STOPPED: return "stopped";
        case DesiredState::DISABLED: return "disabled";
        case DesiredState::RESTARTED: return "restarted";
        default: return "unknown";
    }
}

std::string outcomeToString(ServiceOutcome outcome) {
    switch (outcome) {
        case ServiceOutcome::SKIPPED: return "skipped";
        case ServiceOutcome::SUCCEEDED: return "succeeded";
        case ServiceOutcome::WARNED: return "warned";
        default: return "unknown";
    }
}

} // namespace ServiceUtils

} // namespace Orchestrator
} // namespace DAO
