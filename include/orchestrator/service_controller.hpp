// EN: Service controller - applies a desired lifecycle state to an ordered list of systemd units
// FR: Contrôleur de services - applique un état de cycle de vie à une liste ordonnée d'unités systemd

#pragma once

#include <string>
#include <vector>

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"

namespace DAO {
namespace Orchestrator {

enum class DesiredState {
    STOPPED = 0,
    DISABLED = 1,
    RESTARTED = 2
};

struct ServiceDescriptor {
    std::string name;
    DesiredState desired_state = DesiredState::STOPPED;
};

enum class ServiceOutcome {
    SKIPPED = 0,    // EN: Already in the desired state, or no service manager / FR: Déjà dans l'état voulu, ou pas de gestionnaire
    SUCCEEDED = 1,
    WARNED = 2      // EN: Command failed, batch continued / FR: Commande échouée, le lot a continué
};

struct ServiceResult {
    std::string service;
    DesiredState desired_state = DesiredState::STOPPED;
    ServiceOutcome outcome = ServiceOutcome::SKIPPED;
    std::string detail;
};

struct ServiceBatchResult {
    std::vector<ServiceResult> results;

    size_t count(ServiceOutcome outcome) const;
    bool hasWarnings() const { return count(ServiceOutcome::WARNED) > 0; }

    // EN: Names of services whose state was actually changed.
    // FR: Noms des services dont l'état a effectivement changé.
    std::vector<std::string> changedServices() const;
};

class ServiceController {
public:
    ServiceController(ICommandRunner& runner, IPrivilegedCapability& capability);

    // EN: Apply each descriptor in order. Never throws on a per-service failure.
    // FR: Applique chaque descripteur dans l'ordre. Ne lève jamais sur l'échec d'un service.
    ServiceBatchResult apply(const std::vector<ServiceDescriptor>& descriptors);

    bool isServiceManagerAvailable();
    bool isActive(const std::string& service);
    bool isEnabled(const std::string& service);

private:
    ServiceResult applyOne(const ServiceDescriptor& descriptor);

    ICommandRunner& runner_;
    IPrivilegedCapability& capability_;
};

// EN: The fixed service lists; membership and order belong to each action.
// FR: Les listes de services fixes ; leur contenu et leur ordre appartiennent à chaque action.
namespace ServiceCatalog {
    std::vector<ServiceDescriptor> patchRestarts();
    std::vector<ServiceDescriptor> isolationStops();     // EN: every stop, then every disable / FR: tous les arrêts, puis toutes les désactivations
    std::vector<ServiceDescriptor> shutdownStops();
    std::vector<std::string> diagnosticServices();
} // namespace ServiceCatalog

namespace ServiceUtils {
    std::string desiredStateToString(DesiredState state);
    std::string outcomeToString(ServiceOutcome outcome);
} // namespace ServiceUtils

} // namespace Orchestrator
} // namespace DAO
