// EN: Single-pass streaming validator for delimited text files (CSV, TSV, pipe, ...)
// FR: Validateur streaming en une passe pour fichiers texte délimités (CSV, TSV, pipe, ...)

#pragma once

#include "validation/validation_report.hpp"
#include "validation/validation_types.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace FP {
namespace Validation {

// EN: Options for one delimited validation run
// FR: Options d'une passe de validation délimitée
struct DelimitedValidatorOptions {
    std::optional<char> delimiter;          // EN: Pinned delimiter, auto-detect when empty / FR: Délimiteur imposé, auto-détection si vide
    size_t max_errors{1000};                // EN: Cap per record list / FR: Plafond par liste d'enregistrements
    bool check_duplicates{false};           // EN: Group identical rows / FR: Regroupe les lignes identiques
    size_t sample_lines{50};                // EN: Lines buffered for detection / FR: Lignes mises de côté pour la détection
    size_t detection_lines{20};             // EN: Non-blank lines scored by the detector / FR: Lignes non vides évaluées par le détecteur
    size_t progress_interval{1000};         // EN: Physical rows between progress callbacks / FR: Lignes physiques entre deux callbacks
    size_t read_buffer_size{64 * 1024};     // EN: Reader buffer in bytes / FR: Buffer du lecteur en octets
};

class DelimitedValidator {
public:
    // EN: Throws std::invalid_argument when a numeric option is 0
    // FR: Lance std::invalid_argument si une option numérique vaut 0
    explicit DelimitedValidator(DelimitedValidatorOptions options = {});

    // EN: Validate `path`. Never throws for I/O problems: they become one FILE_READ_ERROR at row 0.
    // FR: Valide `path`. Ne lance jamais pour un problème d'I/O : il devient un FILE_READ_ERROR en ligne 0.
    ValidationReport validate(const std::string& path,
                              const CancellationFlag* cancel_flag = nullptr,
                              const ProgressCallback& progress = nullptr);

    ValidatorState getState() const { return state_.load(); }
    const DelimitedValidatorOptions& getOptions() const { return options_; }

    // EN: Row check against the expected width: updates counters and records findings
    // FR: Vérification d'une ligne face à la largeur attendue : met à jour les compteurs et enregistre les anomalies
    static void checkRow(ValidationReport& report, size_t row, std::string_view line,
                         char delimiter, size_t expected_columns);

private:
    DelimitedValidatorOptions options_;
    std::atomic<ValidatorState> state_{ValidatorState::IDLE};

    void transition(ValidatorState next, const std::string& path);
};

// EN: Convenience entry point with the common options
// FR: Point d'entrée pratique avec les options courantes
ValidationReport validateDelimited(const std::string& path,
                                   std::optional<char> delimiter_override = std::nullopt,
                                   size_t max_errors = 1000,
                                   bool check_duplicates = false,
                                   const CancellationFlag* cancel_flag = nullptr,
                                   const ProgressCallback& progress = nullptr);

} // namespace Validation
} // namespace FP
