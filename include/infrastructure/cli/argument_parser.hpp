// EN: Command line parser for FileProof - option definitions mapped onto configuration paths
// FR: Analyseur de ligne de commande pour FileProof - définitions d'options associées à des chemins de configuration

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace FP {
namespace CLI {

// EN: CLI option types
// FR: Types d'options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE           // EN: Bad value format or constraint violation / FR: Format invalide ou contrainte violée
};

std::string cliParseStatusToString(CliParseStatus status);

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--example) / FR: Nom d'option long (--exemple)
    std::optional<char> short_name;                 // EN: Short option name (-e) / FR: Nom d'option court (-e)
    CliOptionType type = CliOptionType::STRING;
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string config_path;                        // EN: "section.key" overridden by the option, empty if none / FR: "section.clé" surchargée, vide si aucune
    std::optional<std::string> default_value;       // EN: Shown in help only / FR: Affichée dans l'aide uniquement
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;              // EN: Valid enum values / FR: Valeurs d'énumération valides
    std::string category = "General";               // EN: Help category / FR: Catégorie d'aide
};

// EN: Outcome of one parse. Later occurrences of an option replace earlier ones.
// FR: Résultat d'une analyse. Les occurrences ultérieures d'une option remplacent les précédentes.
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::map<std::string, ConfigValue> values;      // EN: Keyed by long option name / FR: Indexées par nom long
    std::map<std::string, ConfigValue> overrides;   // EN: Keyed by config path / FR: Indexées par chemin de configuration
    std::vector<std::string> positional;
    std::vector<std::string> errors;

    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& long_name) const { return values.count(long_name) > 0; }
    ConfigValue get(const std::string& long_name) const;
};

class ArgumentParser {
public:
    explicit ArgumentParser(std::string program_name = "fpctl");
    ~ArgumentParser();

    ArgumentParser(const ArgumentParser&) = delete;
    ArgumentParser& operator=(const ArgumentParser&) = delete;

    // EN: Throws std::invalid_argument on an empty or already registered name
    // FR: Lance std::invalid_argument si le nom est vide ou déjà enregistré
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: Options understood by fpctl
    // FR: Options comprises par fpctl
    void addStandardOptions();

    // EN: `argv[0]` is skipped
    // FR: `argv[0]` est ignoré
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setHelpHeader(const std::string& header);
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

    bool hasOption(const std::string& name) const;
    std::optional<CliOptionDefinition> getOptionDefinition(const std::string& name) const;

    // EN: Write every override of `result` into `config`; returns the number applied
    // FR: Écrit chaque surcharge de `result` dans `config` ; retourne le nombre appliqué
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

    // EN: Help line for one option
    // FR: Ligne d'aide pour une option
    static std::string formatOptionHelp(const CliOptionDefinition& option);

private:
    class ArgumentParserImpl;
    std::unique_ptr<ArgumentParserImpl> impl_;
};

} // namespace CLI
} // namespace FP
