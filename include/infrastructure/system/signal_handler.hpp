// EN: Signal Handler for FileProof - turns SIGINT/SIGTERM into a cooperative cancellation request
// FR: Gestionnaire de signaux pour FileProof - transforme SIGINT/SIGTERM en demande d'annulation coopérative

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FP {

// EN: Callback function type for cleanup operations
// FR: Type de fonction callback pour les opérations de nettoyage
using CleanupCallback = std::function<void()>;

// EN: Signal handler statistics for monitoring
// FR: Statistiques du gestionnaire de signaux pour monitoring
struct SignalHandlerStats {
    std::chrono::system_clock::time_point created_at;
    size_t signals_received{0};
    size_t cleanup_callbacks_registered{0};
    size_t shutdowns_dispatched{0};
    int last_signal{0};
    std::unordered_map<int, size_t> signal_counts; // EN: Count per signal type / FR: Compteur par type de signal
};

// EN: The C-level handler only stores atomics. The controller polls isShutdownRequested() and calls
//     dispatchPendingShutdown(), which runs the cleanup callbacks once, on the controller thread.
// FR: Le handler C ne fait que stocker des atomiques. Le contrôleur interroge isShutdownRequested() et appelle
//     dispatchPendingShutdown(), qui exécute les callbacks de nettoyage une fois, sur le thread contrôleur.
class SignalHandler {
public:
    // EN: Get the singleton instance
    // FR: Obtient l'instance singleton
    static SignalHandler& getInstance();

    // EN: Register SIGINT and SIGTERM handlers; throws std::runtime_error if registration fails
    // FR: Enregistre les handlers SIGINT et SIGTERM ; lance std::runtime_error si l'enregistrement échoue
    void initialize();

    // EN: Register or replace a named cleanup callback
    // FR: Enregistre ou remplace un callback de nettoyage nommé
    void registerCleanupCallback(const std::string& name, CleanupCallback callback);
    void unregisterCleanupCallback(const std::string& name);

    // EN: Behave as if `signal_number` had been delivered (useful for testing)
    // FR: Se comporte comme si `signal_number` avait été reçu (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const;

    // EN: Run the cleanup callbacks if a shutdown is pending and was not dispatched yet. Returns true when they ran.
    // FR: Exécute les callbacks si un arrêt est en attente et pas encore traité. Retourne true s'ils ont été exécutés.
    bool dispatchPendingShutdown();

    SignalHandlerStats getStats() const;

    // EN: Clear requests, callbacks and counters; restores default dispositions (mainly for testing)
    // FR: Efface demandes, callbacks et compteurs ; restaure les dispositions par défaut (principalement pour les tests)
    void reset();

    // EN: When disabled, initialize() does not install handlers and delivered signals are ignored
    // FR: Désactivé, initialize() n'installe pas de handlers et les signaux reçus sont ignorés
    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_.load(); }
    bool isInitialized() const { return initialized_.load(); }

    ~SignalHandler();

private:
    SignalHandler();

    // EN: Non-copyable and non-movable
    // FR: Non-copiable et non-déplaçable
    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Static signal handler function (C-style callback), async-signal-safe
    // FR: Fonction gestionnaire de signaux statique (callback style C), async-signal-safe
    static void signalCallback(int signal_number);

    void recordSignal(int signal_number);
    void restoreDefaultHandlers();

    mutable std::mutex mutex_;                              // EN: Guards callbacks / FR: Protège les callbacks
    std::map<std::string, CleanupCallback> cleanup_callbacks_;
    std::chrono::system_clock::time_point created_at_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_dispatched_{false};
    std::atomic<int> last_signal_{0};
    std::atomic<size_t> signals_received_{0};
    std::atomic<size_t> sigint_count_{0};
    std::atomic<size_t> sigterm_count_{0};
    std::atomic<size_t> other_signal_count_{0};
    std::atomic<size_t> shutdowns_dispatched_{0};
};

} // namespace FP
