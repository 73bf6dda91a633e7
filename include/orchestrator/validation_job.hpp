// EN: Validation job - runs one file validation on a dedicated worker thread, observed by a controller
// FR: Tâche de validation - exécute la validation d'un fichier sur un thread dédié, observée par un contrôleur

#pragma once

#include "validation/validation_report.hpp"
#include "validation/validation_settings.hpp"
#include "validation/validation_types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace FP {
namespace Orchestrator {

// EN: Latest progress published by the worker
// FR: Dernière progression publiée par le worker
struct ProgressSnapshot {
    double percent{0.0};
    size_t rows_processed{0};
    size_t errors_so_far{0};
    size_t updates{0};                      // EN: Callbacks received so far / FR: Callbacks reçus jusqu'ici
    std::chrono::steady_clock::time_point updated_at{};
};

class ValidationJob {
public:
    // EN: Called on the worker thread for each progress update; must return quickly
    // FR: Appelé sur le thread worker à chaque progression ; doit rendre la main rapidement
    using ProgressListener = std::function<void(const ProgressSnapshot&)>;

    ValidationJob(std::string path, Validation::ValidationSettings settings);

    // EN: Cancels and joins a running worker
    // FR: Annule et attend un worker en cours
    ~ValidationJob();

    ValidationJob(const ValidationJob&) = delete;
    ValidationJob& operator=(const ValidationJob&) = delete;

    void setProgressListener(ProgressListener listener);

    // EN: Start the worker; throws std::logic_error if the job was already started
    // FR: Démarre le worker ; lance std::logic_error si la tâche a déjà été démarrée
    void start();

    // EN: One-shot cancellation request, honoured between rows
    // FR: Demande d'annulation à usage unique, prise en compte entre deux lignes
    void cancel();

    // EN: Join the worker and return the report; throws std::logic_error if never started.
    //     Rethrows anything the worker raised outside the validator's own error handling.
    // FR: Attend le worker et retourne le rapport ; lance std::logic_error si jamais démarré.
    //     Relance toute exception levée par le worker hors de la gestion d'erreurs du validateur.
    Validation::ValidationReport wait();

    bool isRunning() const { return running_.load(); }
    bool isCancelRequested() const { return cancel_flag_.load(); }
    ProgressSnapshot latestProgress() const;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    Validation::ValidationSettings settings_;
    ProgressListener listener_;

    Validation::CancellationFlag cancel_flag_{false};
    std::atomic<bool> running_{false};
    bool started_{false};

    mutable std::mutex progress_mutex_;
    ProgressSnapshot progress_;

    std::unique_ptr<std::thread> worker_;
    std::optional<Validation::ValidationReport> report_;
    std::exception_ptr failure_;

    void run();
    void publishProgress(double percent, size_t rows, size_t errors);
};

} // namespace Orchestrator
} // namespace FP
