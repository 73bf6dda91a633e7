// EN: Types shared by the validators - run states, progress and cancellation contracts
// FR: Types partagés par les validateurs - états d'exécution, contrats de progression et d'annulation

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace FP {
namespace Validation {

// EN: Validator run states. Delimited runs go SAMPLING -> DETECTING -> SCANNING -> terminal;
//     JSON runs go straight to SCANNING.
// FR: États d'exécution. Les passes délimitées vont SAMPLING -> DETECTING -> SCANNING -> terminal ;
//     les passes JSON passent directement à SCANNING.
enum class ValidatorState {
    IDLE,
    SAMPLING,
    DETECTING,
    SCANNING,
    COMPLETE,
    CANCELLED,
    FAILED
};

std::string validatorStateToString(ValidatorState state);

inline bool isTerminalState(ValidatorState state) {
    return state == ValidatorState::COMPLETE || state == ValidatorState::CANCELLED ||
           state == ValidatorState::FAILED;
}

// EN: Progress callback (percent 0-100, rows processed, errors so far). Runs on the validating thread, must not block.
// FR: Callback de progression (pourcentage 0-100, lignes traitées, erreurs). S'exécute sur le thread de validation, ne doit pas bloquer.
using ProgressCallback = std::function<void(double percent, size_t rows_processed, size_t errors_so_far)>;

// EN: One-shot cancellation flag owned by the controller; the validator only reads it, between rows.
// FR: Drapeau d'annulation à usage unique détenu par le contrôleur ; le validateur le lit seulement entre deux lignes.
using CancellationFlag = std::atomic<bool>;

inline bool cancellationRequested(const CancellationFlag* flag) {
    return flag != nullptr && flag->load(std::memory_order_acquire);
}

} // namespace Validation
} // namespace FP
