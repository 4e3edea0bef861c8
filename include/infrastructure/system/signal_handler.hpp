// EN: SIGINT/SIGTERM routing for daoctl - a signal cancels the bound countdown token
// FR: Routage de SIGINT/SIGTERM pour daoctl - un signal annule le jeton de compte à rebours lié

#pragma once

#include <atomic>
#include <csignal>
#include <cstddef>
#include <mutex>

#include "orchestrator/countdown.hpp"

namespace DAO {

struct SignalHandlerStats {
    size_t signals_received{0};
    size_t sigint_count{0};
    size_t sigterm_count{0};
    size_t cancellations_delivered{0};
};

// EN: Singleton owning the process's SIGINT and SIGTERM dispositions while installed.
// EN: The handler body only touches atomics, so it is async-signal-safe.
// FR: Singleton détenant les dispositions SIGINT et SIGTERM du processus tant qu'il est installé.
// FR: Le corps du handler ne touche que des atomiques, il est donc async-signal-safe.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    // EN: Install via sigaction, keeping the previous dispositions. Throws std::runtime_error on failure.
    // FR: Installe via sigaction en gardant les dispositions précédentes. Lance std::runtime_error en cas d'échec.
    void initialize();

    // EN: Put back whatever was installed before initialize().
    // FR: Remet ce qui était installé avant initialize().
    void restoreDefaults();

    bool isInitialized() const { return installed_.load(); }

    // EN: nullptr unbinds. The token must outlive its binding.
    // FR: nullptr délie. Le jeton doit survivre à sa liaison.
    void bindCancellationToken(Orchestrator::CancellationToken* token);

    // EN: Behave as if `signal_number` had been delivered.
    // FR: Se comporte comme si `signal_number` avait été reçu.
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return requested_.load(); }

    SignalHandlerStats getStats() const;

    void reset();
    void setEnabled(bool enabled) { enabled_.store(enabled); }

private:
    SignalHandler() = default;
    ~SignalHandler();
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    static void onSignal(int signal_number);
    void record(int signal_number) noexcept;

    std::mutex install_mutex_;
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};

    std::atomic<bool> installed_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> requested_{false};
    std::atomic<Orchestrator::CancellationToken*> token_{nullptr};

    std::atomic<size_t> received_{0};
    std::atomic<size_t> interrupts_{0};
    std::atomic<size_t> terminations_{0};
    std::atomic<size_t> delivered_{0};
};

} // namespace DAO
