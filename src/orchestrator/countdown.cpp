// EN: Countdown implementation - sliced sleeping ticker and announcement loop
// FR: Implémentation du compte à rebours - horloge à sommeil fractionné et boucle d'annonces

#include "orchestrator/countdown.hpp"

#include <thread>

namespace DAO {
namespace Orchestrator {

SteadyTicker::SteadyTicker(std::chrono::milliseconds slice)
    : slice_(slice.count() > 0 ? slice : std::chrono::milliseconds(100)) {
}

bool SteadyTicker::waitOneSecond(const CancellationToken& token) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (std::chrono::steady_clock::now() < deadline) {
        if (token.isCancelled()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(remaining < slice_ ? remaining : slice_);
    }
    return !token.isCancelled();
}

bool shouldAnnounce(int remaining_seconds) {
    return remaining_seconds > 0 && (remaining_seconds % 10 == 0 || remaining_seconds <= 10);
}

CountdownResult runCountdown(int seconds, ITicker& ticker, const CancellationToken& token,
                             const std::function<void(int)>& announce) {
    CountdownResult result;

    for (int remaining = seconds; remaining > 0; --remaining) {
        if (token.isCancelled()) {
            result.remaining_seconds = remaining;
            return result;
        }
        if (shouldAnnounce(remaining)) {
            result.announced.push_back(remaining);
            if (announce) {
                announce(remaining);
            }
        }
        if (!ticker.waitOneSecond(token)) {
            result.remaining_seconds = remaining;
            return result;
        }
    }

    // EN: A cancellation landing on the very last tick still wins over the halt.
    // FR: Une annulation arrivant sur le dernier battement l'emporte encore sur l'arrêt.
    if (token.isCancelled()) {
        return result;
    }

    result.completed = true;
    return result;
}

} // namespace Orchestrator
} // namespace DAO
