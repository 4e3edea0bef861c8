// EN: SignalHandler implementation. sigaction install/restore and lock-free delivery to the countdown token.
// FR: Implémentation de SignalHandler. Installation/restauration par sigaction et transmission sans verrou au jeton.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace DAO {

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::~SignalHandler() {
    if (installed_.load()) {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
    }
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(install_mutex_);
    if (installed_.load()) {
        return;
    }
    if (!enabled_.load()) {
        LOG_WARN("signals", "Signal handling disabled, handlers not installed");
        return;
    }

    struct sigaction action{};
    action.sa_handler = &SignalHandler::onSignal;
    sigemptyset(&action.sa_mask);
    // EN: Restart interrupted syscalls so child commands are not disturbed
    // FR: Relance les appels système interrompus pour ne pas perturber les commandes enfants
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, &previous_int_) != 0) {
        const std::string reason = std::strerror(errno);
        LOG_ERROR("signals", "sigaction(SIGINT) failed: " + reason);
        throw std::runtime_error("cannot install SIGINT handler: " + reason);
    }
    if (sigaction(SIGTERM, &action, &previous_term_) != 0) {
        const std::string reason = std::strerror(errno);
        sigaction(SIGINT, &previous_int_, nullptr);
        LOG_ERROR("signals", "sigaction(SIGTERM) failed: " + reason);
        throw std::runtime_error("cannot install SIGTERM handler: " + reason);
    }

    installed_.store(true);
    LOG_DEBUG("signals", "SIGINT/SIGTERM now cancel the shutdown countdown");
}

void SignalHandler::restoreDefaults() {
    std::lock_guard<std::mutex> lock(install_mutex_);
    if (!installed_.exchange(false)) {
        return;
    }
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
}

void SignalHandler::bindCancellationToken(Orchestrator::CancellationToken* token) {
    token_.store(token);
    // EN: A signal that landed before the token existed still counts
    // FR: Un signal arrivé avant l'existence du jeton compte quand même
    if (token != nullptr && requested_.load()) {
        token->cancel();
        delivered_.fetch_add(1);
    }
}

void SignalHandler::triggerShutdown(int signal_number) {
    if (!enabled_.load()) {
        LOG_DEBUG("signals", "Ignoring simulated signal " + std::to_string(signal_number) + " while disabled");
        return;
    }
    LOG_INFO("signals", "Simulated delivery of signal " + std::to_string(signal_number));
    record(signal_number);
}

SignalHandlerStats SignalHandler::getStats() const {
    SignalHandlerStats stats;
    stats.signals_received = received_.load();
    stats.sigint_count = interrupts_.load();
    stats.sigterm_count = terminations_.load();
    stats.cancellations_delivered = delivered_.load();
    return stats;
}

void SignalHandler::reset() {
    requested_.store(false);
    token_.store(nullptr);
    received_.store(0);
    interrupts_.store(0);
    terminations_.store(0);
    delivered_.store(0);
}

void SignalHandler::onSignal(int signal_number) {
    SignalHandler& self = getInstance();
    if (self.enabled_.load()) {
        self.record(signal_number);
    }
}

void SignalHandler::record(int signal_number) noexcept {
    requested_.store(true);
    received_.fetch_add(1);
    if (signal_number == SIGINT) {
        interrupts_.fetch_add(1);
    } else if (signal_number == SIGTERM) {
        terminations_.fetch_add(1);
    }

    if (Orchestrator::CancellationToken* token = token_.load()) {
        token->cancel();
        delivered_.fetch_add(1);
    }
}

} // namespace DAO
