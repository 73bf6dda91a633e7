// EN: ValidationJob implementation
// FR: Implémentation de ValidationJob

#include "orchestrator/validation_job.hpp"
#include "validation/file_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <exception>
#include <stdexcept>

namespace FP {
namespace Orchestrator {

ValidationJob::ValidationJob(std::string path, Validation::ValidationSettings settings)
    : path_(std::move(path)), settings_(std::move(settings)) {}

ValidationJob::~ValidationJob() {
    if (worker_ && worker_->joinable()) {
        cancel();
        worker_->join();
    }
}

void ValidationJob::setProgressListener(ProgressListener listener) {
    if (started_) {
        throw std::logic_error("Progress listener must be set before start()");
    }
    listener_ = std::move(listener);
}

void ValidationJob::start() {
    if (started_) {
        throw std::logic_error("ValidationJob already started: " + path_);
    }
    started_ = true;
    running_ = true;

    LOG_DEBUG("validation_job", "Starting worker for " + path_);
    worker_ = std::make_unique<std::thread>([this]() { run(); });
}

void ValidationJob::cancel() {
    bool expected = false;
    if (cancel_flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LOG_INFO("validation_job", "Cancellation requested for " + path_);
    }
}

Validation::ValidationReport ValidationJob::wait() {
    if (!started_) {
        throw std::logic_error("ValidationJob was never started: " + path_);
    }
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    if (!report_) {
        throw std::logic_error("ValidationJob produced no report: " + path_);
    }
    return *report_;
}

ProgressSnapshot ValidationJob::latestProgress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_;
}

void ValidationJob::run() {
    ScopedLogContext log_context(Logger::getInstance().generateCorrelationId(), {{"file", path_}});
    try {
        report_ = Validation::validateFile(path_, settings_, &cancel_flag_,
                                           [this](double percent, size_t rows, size_t errors) {
                                               publishProgress(percent, rows, errors);
                                           });
    } catch (const std::exception& e) {
        // EN: Validators report I/O problems in the report; anything else is handed to wait()
        // FR: Les validateurs consignent les erreurs d'I/O dans le rapport ; le reste est transmis à wait()
        LOG_ERROR("validation_job", "Worker failed for " + path_ + ": " + e.what());
        failure_ = std::current_exception();
    }
    running_ = false;
}

void ValidationJob::publishProgress(double percent, size_t rows, size_t errors) {
    ProgressSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_.percent = percent;
        progress_.rows_processed = rows;
        progress_.errors_so_far = errors;
        ++progress_.updates;
        progress_.updated_at = std::chrono::steady_clock::now();
        snapshot = progress_;
    }
    if (listener_) {
        listener_(snapshot);
    }
}

} // namespace Orchestrator
} // namespace FP
