// EN: Implementation of the SignalHandler class.
// FR: Implémentation de la classe SignalHandler.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <signal.h>

#include <stdexcept>
#include <vector>

namespace FP {

// EN: Get the singleton signal handler instance.
// FR: Obtient l'instance singleton du gestionnaire de signaux.
SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() : created_at_(std::chrono::system_clock::now()) {}

// EN: Destructor - restores default dispositions if handlers were installed.
// FR: Destructeur - restaure les dispositions par défaut si des handlers ont été installés.
SignalHandler::~SignalHandler() {
    if (initialized_) {
        restoreDefaultHandlers();
    }
}

void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_WARN("signal_handler", "SignalHandler already initialized");
        return;
    }

    if (!enabled_.load()) {
        LOG_WARN("signal_handler", "SignalHandler is disabled, skipping initialization");
        return;
    }

    if (signal(SIGINT, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (signal(SIGTERM, signalCallback) == SIG_ERR) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::registerCleanupCallback(const std::string& name, CleanupCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_callbacks_[name] = std::move(callback);
    LOG_DEBUG("signal_handler", "Registered cleanup callback: " + name +
              " (total: " + std::to_string(cleanup_callbacks_.size()) + ")");
}

void SignalHandler::unregisterCleanupCallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cleanup_callbacks_.erase(name) > 0) {
        LOG_DEBUG("signal_handler", "Unregistered cleanup callback: " + name);
    }
}

void SignalHandler::triggerShutdown(int signal_number) {
    recordSignal(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return shutdown_requested_.load(std::memory_order_acquire);
}

bool SignalHandler::dispatchPendingShutdown() {
    if (!isShutdownRequested()) {
        return false;
    }
    bool expected = false;
    if (!shutdown_dispatched_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::vector<std::pair<std::string, CleanupCallback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.assign(cleanup_callbacks_.begin(), cleanup_callbacks_.end());
    }

    LOG_INFO("signal_handler", "Shutdown requested by signal " + std::to_string(last_signal_.load()) +
             ", running " + std::to_string(callbacks.size()) + " cleanup callbacks");

    // EN: One failing callback must not prevent the others from running
    // FR: Un callback en échec ne doit pas empêcher les autres de s'exécuter
    for (const auto& [name, callback] : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR("signal_handler", "Cleanup callback '" + name + "' failed: " + e.what());
        }
    }

    ++shutdowns_dispatched_;
    return true;
}

SignalHandlerStats SignalHandler::getStats() const {
    SignalHandlerStats stats;
    stats.created_at = created_at_;
    stats.signals_received = signals_received_.load();
    stats.shutdowns_dispatched = shutdowns_dispatched_.load();
    stats.last_signal = last_signal_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.cleanup_callbacks_registered = cleanup_callbacks_.size();
    }
    if (size_t count = sigint_count_.load()) {
        stats.signal_counts[SIGINT] = count;
    }
    if (size_t count = sigterm_count_.load()) {
        stats.signal_counts[SIGTERM] = count;
    }
    if (size_t count = other_signal_count_.load()) {
        stats.signal_counts[0] = count;
    }
    return stats;
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        restoreDefaultHandlers();
        initialized_ = false;
    }
    cleanup_callbacks_.clear();
    enabled_ = true;
    shutdown_requested_ = false;
    shutdown_dispatched_ = false;
    last_signal_ = 0;
    signals_received_ = 0;
    sigint_count_ = 0;
    sigterm_count_ = 0;
    other_signal_count_ = 0;
    shutdowns_dispatched_ = 0;
}

void SignalHandler::setEnabled(bool enabled) {
    enabled_ = enabled;
}

void SignalHandler::signalCallback(int signal_number) {
    getInstance().recordSignal(signal_number);
}

// EN: Only lock-free atomic stores happen here; this runs inside the signal handler.
// FR: Seules des écritures atomiques sans verrou ont lieu ici ; ceci s'exécute dans le handler de signal.
void SignalHandler::recordSignal(int signal_number) {
    if (!enabled_.load()) {
        return;
    }
    ++signals_received_;
    if (signal_number == SIGINT) {
        ++sigint_count_;
    } else if (signal_number == SIGTERM) {
        ++sigterm_count_;
    } else {
        ++other_signal_count_;
    }
    last_signal_ = signal_number;
    shutdown_requested_.store(true, std::memory_order_release);
}

void SignalHandler::restoreDefaultHandlers() {
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
}

} // namespace FP
