// EN: Signal handler for acectl. Turns SIGINT/SIGTERM into a stop request polled between merges.
// FR: Gestionnaire de signaux pour acectl. Transforme SIGINT/SIGTERM en demande d'arrêt
//     interrogée entre les fusions.

#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ACE {

// EN: Callback function type for cleanup operations
// FR: Type de fonction callback pour les opérations de nettoyage
using CleanupCallback = std::function<void()>;

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t cleanup_callbacks_executed{0};
    int last_signal{0};
};

// EN: Process-wide signal handler. The C callback only touches atomics; cleanup callbacks
//     run later on the main thread through runCleanup().
// FR: Gestionnaire de signaux global. Le callback C ne touche que des atomiques ; les
//     callbacks de nettoyage s'exécutent ensuite sur le thread principal via runCleanup().
class SignalHandler {
public:
    // EN: Get the singleton instance
    // FR: Obtient l'instance singleton
    static SignalHandler& getInstance();

    // EN: Initialize signal handling (registers SIGINT, SIGTERM handlers). Throws
    //     std::runtime_error if registration fails.
    // FR: Initialise la gestion des signaux (enregistre SIGINT, SIGTERM).
    void initialize();

    // EN: Register a cleanup callback, replacing any callback with the same name
    // FR: Enregistre un callback de nettoyage, remplaçant celui de même nom
    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Request shutdown as if the signal had been received (tests, programmatic stop)
    // FR: Demande l'arrêt comme si le signal avait été reçu
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const { return shutdown_requested_.load(); }

    // EN: Run every cleanup callback once, in registration order. Returns the number run.
    // FR: Exécute chaque callback de nettoyage une fois, dans l'ordre d'enregistrement.
    size_t runCleanup();

    SignalHandlerStats getStats() const;

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    ~SignalHandler();

private:
    SignalHandler() = default;

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    // EN: Static signal handler function (C-style callback)
    // FR: Fonction gestionnaire de signaux statique (callback style C)
    static void signalCallback(int signal_number);

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, CleanupCallback>> cleanup_callbacks_;
    size_t cleanup_callbacks_executed_{0};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> cleanup_done_{false};
    std::atomic<size_t> signals_received_{0};
    std::atomic<int> last_signal_{0};

    static SignalHandler* instance_;
};

} // namespace ACE
