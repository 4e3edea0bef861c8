// EN: Cancellable countdown primitives - cancellation token, injectable ticker, announcement schedule
// FR: Primitives de compte à rebours annulable - jeton d'annulation, horloge injectable, calendrier d'annonces

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <vector>

namespace DAO {
namespace Orchestrator {

// EN: Cancellation flag shared between the countdown and whoever may abort it (signal handler, tests).
// FR: Drapeau d'annulation partagé entre le compte à rebours et ce qui peut l'interrompre (signaux, tests).
class CancellationToken {
public:
    // EN: Lock-free store, safe to call from a signal handler.
    // FR: Écriture sans verrou, appelable depuis un gestionnaire de signal.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "cancellation must be async-signal-safe");
};

// EN: Source of one-second ticks for the countdown.
// FR: Source de battements d'une seconde pour le compte à rebours.
class ITicker {
public:
    virtual ~ITicker() = default;

    // EN: Wait for one second. Returns false if the token was cancelled while waiting.
    // FR: Attend une seconde. Retourne false si le jeton a été annulé pendant l'attente.
    virtual bool waitOneSecond(const CancellationToken& token) = 0;
};

// EN: Wall-clock ticker sleeping in short slices so cancellation is observed quickly.
// FR: Horloge réelle dormant par petites tranches pour observer rapidement l'annulation.
class SteadyTicker : public ITicker {
public:
    explicit SteadyTicker(std::chrono::milliseconds slice = std::chrono::milliseconds(100));
    bool waitOneSecond(const CancellationToken& token) override;

private:
    std::chrono::milliseconds slice_;
};

// EN: Outcome of a countdown run
// FR: Résultat d'un compte à rebours
struct CountdownResult {
    bool completed = false;             // EN: Reached zero without cancellation / FR: Atteint zéro sans annulation
    int remaining_seconds = 0;          // EN: Seconds left when cancelled / FR: Secondes restantes à l'annulation
    std::vector<int> announced;         // EN: Values that were announced, in order / FR: Valeurs annoncées, dans l'ordre
};

// EN: True for multiples of 10 and for each of the final 10 seconds.
// FR: Vrai pour les multiples de 10 et pour chacune des 10 dernières secondes.
bool shouldAnnounce(int remaining_seconds);

// EN: Count down from `seconds` to zero, announcing per shouldAnnounce(). Cancellation is checked between ticks.
// FR: Décompte de `seconds` à zéro avec annonces selon shouldAnnounce(). L'annulation est vérifiée entre les battements.
CountdownResult runCountdown(int seconds, ITicker& ticker, const CancellationToken& token,
                             const std::function<void(int)>& announce);

} // namespace Orchestrator
} // namespace DAO
