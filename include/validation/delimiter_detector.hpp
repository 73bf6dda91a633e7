// EN: Field separator inference from a sample of lines
// FR: Inférence du séparateur de champs à partir d'un échantillon de lignes

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace FP {
namespace Validation {

// EN: Per-candidate occurrence counts gathered during one detection; never outlives detect()
// FR: Comptages par candidat collectés pendant une détection ; ne survit jamais à detect()
struct DelimiterProfile {
    char delimiter{','};
    std::vector<size_t> counts;     // EN: Unquoted occurrences per sample line / FR: Occurrences hors quotes par ligne
};

class DelimiterDetector {
public:
    // EN: Candidates in priority order - the first one wins ties
    // FR: Candidats par ordre de priorité - le premier l'emporte en cas d'égalité
    static constexpr std::array<char, 6> kCandidates{',', '|', '\t', '*', ';', ':'};
    static constexpr char kFallbackDelimiter = ',';
    static constexpr size_t kDefaultDetectionLines = 20;

    // EN: `detection_lines` bounds how many non-blank sample lines are scored; throws std::invalid_argument on 0
    // FR: `detection_lines` borne le nombre de lignes non vides évaluées ; lance std::invalid_argument si 0
    explicit DelimiterDetector(size_t detection_lines = kDefaultDetectionLines);

    // EN: Pick the delimiter for `sample`. A pinned override is returned unchanged.
    // FR: Choisit le délimiteur pour `sample`. Un délimiteur imposé est retourné tel quel.
    char detect(const std::vector<std::string>& sample, std::optional<char> override = std::nullopt) const;

    // EN: Occurrence counts of every candidate over the first non-blank lines (trimmed)
    // FR: Comptages de chaque candidat sur les premières lignes non vides (trimées)
    std::vector<DelimiterProfile> buildProfiles(const std::vector<std::string>& sample) const;

    // EN: Consistency score of a profile, or nullopt when the candidate is disqualified
    // FR: Score de cohérence d'un profil, ou nullopt si le candidat est disqualifié
    static std::optional<double> score(const DelimiterProfile& profile);

    // EN: Printable form of a delimiter, control characters escaped ("\t")
    // FR: Forme affichable d'un délimiteur, caractères de contrôle échappés ("\t")
    static std::string describe(char delimiter);

    size_t getDetectionLines() const { return detection_lines_; }

private:
    size_t detection_lines_;
};

} // namespace Validation
} // namespace FP
