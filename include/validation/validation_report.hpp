// EN: Validation report - append-only aggregate filled by one validator run, then rendered or persisted
// FR: Rapport de validation - agrégat en ajout seul rempli par une exécution de validateur, puis rendu ou persisté

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace FP {
namespace Validation {

// EN: Issue taxonomy shared by errors, warnings and duplicate records
// FR: Taxonomie des anomalies partagée par erreurs, avertissements et doublons
enum class IssueKind {
    EMPTY_FILE,             // EN: Nothing to read / FR: Rien à lire
    FILE_READ_ERROR,        // EN: Fatal I/O failure / FR: Échec I/O fatal
    COLUMN_COUNT_MISMATCH,  // EN: Row width differs from header / FR: Largeur de ligne différente de l'en-tête
    UNCLOSED_QUOTES,        // EN: Odd quote balance / FR: Équilibre de quotes impair
    JSON_PARSE_ERROR,       // EN: Document is not valid JSON / FR: Le document n'est pas du JSON valide
    TYPE_MISMATCH,          // EN: Array element is not an object / FR: Élément de tableau qui n'est pas un objet
    KEY_MISMATCH,           // EN: Object keys differ from first element / FR: Clés d'objet différentes du premier élément
    DUPLICATE_ROW           // EN: Identical trimmed content / FR: Contenu trimé identique
};

std::string issueKindToString(IssueKind kind);
std::optional<IssueKind> issueKindFromString(std::string_view name);

// EN: Where a record lives in the report
// FR: Liste du rapport où se trouve un enregistrement
enum class IssueSeverity {
    ERROR,
    WARNING,
    DUPLICATE
};

std::string issueSeverityToString(IssueSeverity severity);

// EN: One error, warning or duplicate record
// FR: Un enregistrement d'erreur, d'avertissement ou de doublon
struct ValidationIssue {
    size_t row{0};                      // EN: 1-based line or element index, 0 for file-level issues / FR: Ligne ou index base 1, 0 pour le niveau fichier
    IssueKind kind{IssueKind::FILE_READ_ERROR};
    IssueSeverity severity{IssueSeverity::ERROR};
    std::string description;
    std::string content_preview;        // EN: At most 500 code points / FR: Au plus 500 points de code
};

class ValidationReport {
public:
    static constexpr size_t kDefaultMaxEntries = 1000;
    static constexpr size_t kStoredPreviewLength = 500;
    static constexpr size_t kCsvPreviewLength = 200;
    static constexpr size_t kTextGroupLimit = 10;
    static constexpr size_t kTextDuplicateLimit = 20;

    using Clock = std::chrono::system_clock;

    // EN: Throws std::invalid_argument when `max_entries` is 0
    // FR: Lance std::invalid_argument si `max_entries` vaut 0
    explicit ValidationReport(std::string file_name = "", size_t max_entries = kDefaultMaxEntries);

    // EN: File metadata
    // FR: Métadonnées du fichier
    std::string filename;
    uint64_t file_size{0};
    std::string file_type;
    std::string delimiter;                  // EN: Printable delimiter, empty for JSON / FR: Délimiteur affichable, vide pour JSON
    bool delimiter_detected{true};
    size_t expected_columns{0};

    // EN: Counters
    // FR: Compteurs
    size_t total_rows{0};
    size_t valid_rows{0};
    size_t invalid_rows{0};

    // EN: Run timing and outcome
    // FR: Durée et issue de l'exécution
    std::optional<Clock::time_point> start_time;
    std::optional<Clock::time_point> end_time;
    bool passed{false};
    bool cancelled{false};

    // EN: Append a record; returns false once the list reached its cap. Content is truncated to 500 code points.
    // FR: Ajoute un enregistrement ; retourne false une fois la liste pleine. Le contenu est tronqué à 500 points de code.
    bool addError(size_t row, IssueKind kind, std::string description, std::string_view content = {});
    bool addWarning(size_t row, IssueKind kind, std::string description, std::string_view content = {});
    bool addDuplicate(size_t row, std::string description, std::string_view content = {});

    bool errorsFull() const { return errors_.size() >= max_entries_; }
    bool warningsFull() const { return warnings_.size() >= max_entries_; }
    bool duplicatesFull() const { return duplicates_.size() >= max_entries_; }

    const std::vector<ValidationIssue>& errors() const { return errors_; }
    const std::vector<ValidationIssue>& warnings() const { return warnings_; }
    const std::vector<ValidationIssue>& duplicates() const { return duplicates_; }
    size_t maxEntries() const { return max_entries_; }

    void markStarted();

    // EN: Stamp end time and derive `passed` from the counters; cancellation is not considered
    // FR: Horodate la fin et dérive `passed` des compteurs ; l'annulation n'est pas prise en compte
    void finalize();

    // EN: Seconds between start and end, 0 while unfinished
    // FR: Secondes entre début et fin, 0 tant que non terminé
    double durationSeconds() const;

    // EN: Navigation helpers
    // FR: Assistants de navigation
    std::vector<IssueKind> errorKinds() const;
    std::vector<ValidationIssue> errorsOfKind(IssueKind kind) const;
    std::vector<ValidationIssue> findByRow(size_t row) const;

    // EN: Grouped human-readable report
    // FR: Rapport lisible groupé par type
    std::string generateText() const;

    // EN: Full report as JSON text
    // FR: Rapport complet en texte JSON
    std::string toJson(int indent = 2) const;

    // EN: Error list as CSV (row, kind, description, 200-character preview)
    // FR: Liste des erreurs en CSV (ligne, type, description, aperçu de 200 caractères)
    void exportErrorsCsv(std::ostream& out) const;

    // EN: File writers; throw std::runtime_error when the destination cannot be written
    // FR: Écritures fichier ; lancent std::runtime_error si la destination ne peut être écrite
    void exportErrorsCsv(const std::string& path) const;
    void saveReport(const std::string& path) const;
    void saveJson(const std::string& path) const;

private:
    size_t max_entries_;
    std::vector<ValidationIssue> errors_;
    std::vector<ValidationIssue> warnings_;
    std::vector<ValidationIssue> duplicates_;

    bool append(std::vector<ValidationIssue>& list, ValidationIssue issue, std::string_view content);
};

} // namespace Validation
} // namespace FP
