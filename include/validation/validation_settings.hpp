// EN: Run settings resolved from configuration - validator options, logging and output destinations
// FR: Paramètres d'exécution résolus depuis la configuration - options des validateurs, logging et sorties

#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "validation/delimited_validator.hpp"
#include "validation/json_validator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FP {
namespace Validation {

// EN: Which validator handles a file
// FR: Validateur chargé d'un fichier
enum class FileKind {
    AUTO,       // EN: Decide from the file name / FR: Décidé d'après le nom du fichier
    DELIMITED,
    JSON
};

std::string fileKindToString(FileKind kind);
std::optional<FileKind> fileKindFromString(const std::string& name);

struct ValidationSettings {
    FileKind kind{FileKind::AUTO};
    DelimitedValidatorOptions delimited;
    JsonValidatorOptions json;

    std::string log_level{"info"};
    std::string log_file;               // EN: Empty = stderr / FR: Vide = stderr

    std::string report_path;            // EN: Text report destination / FR: Destination du rapport texte
    std::string errors_csv_path;        // EN: Error CSV destination / FR: Destination du CSV d'erreurs
    std::string json_report_path;       // EN: JSON report destination / FR: Destination du rapport JSON

    // EN: Settings from `config`, unset keys keep their defaults. Throws std::invalid_argument on bad values.
    // FR: Paramètres depuis `config`, les clés absentes gardent leurs valeurs par défaut. Lance std::invalid_argument si invalide.
    static ValidationSettings fromConfig(const ConfigManager& config);

    // EN: Rules describing the recognised keys, for ConfigManager::validate
    // FR: Règles décrivant les clés reconnues, pour ConfigManager::validate
    static std::vector<ConfigManager::ValidationRule> configRules();

    // EN: Single character, or an escape such as "\t"; empty or "auto" means auto-detect.
    //     Throws std::invalid_argument otherwise.
    // FR: Un seul caractère, ou un échappement comme "\t" ; vide ou "auto" signifie auto-détection.
    //     Lance std::invalid_argument sinon.
    static std::optional<char> parseDelimiter(const std::string& text);
};

} // namespace Validation
} // namespace FP
