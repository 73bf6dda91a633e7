// EN: Configuration manager - YAML sections of typed values, environment overrides and validation rules
// FR: Gestionnaire de configuration - sections YAML de valeurs typées, surcharges d'environnement et règles de validation

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace FP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;
    ConfigValue(bool value) : value_(value) {}
    ConfigValue(int value) : value_(value) {}
    ConfigValue(double value) : value_(value) {}
    ConfigValue(const char* value) : value_(std::string(value)) {}
    ConfigValue(std::string value) : value_(std::move(value)) {}
    ConfigValue(std::vector<std::string> value) : value_(std::move(value)) {}

    // EN: Get value as specific type (throws std::runtime_error if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance std::runtime_error si vide ou type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Name of the held type ("bool", "int", "double", "string", "array" or "empty").
    // FR: Nom du type contenu ("bool", "int", "double", "string", "array" ou "empty").
    std::string typeName() const;

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

    // EN: Infer the type of a scalar written as text (YAML scalar or environment variable).
    // FR: Déduit le type d'un scalaire écrit en texte (scalaire YAML ou variable d'environnement).
    static ConfigValue fromScalar(const std::string& text);

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // EN: Get all keys in section, sorted.
    // FR: Obtient toutes les clés de la section, triées.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, environment overrides and rule-based validation.
//     Keys are addressed as section + key; "section.key" paths are accepted by the *Path helpers.
// FR: Gestionnaire de configuration avec parsing YAML, surcharges d'environnement et validation par règles.
//     Les clés sont adressées par section + clé ; les chemins "section.cle" sont acceptés par les assistants *Path.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;                    // EN: "section.key" / FR: "section.cle"
        std::string type;                   // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Process-wide instance used by the command line tool.
    // FR: Instance globale au processus utilisée par l'outil en ligne de commande.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file, merging over current values. Returns false on error.
    // FR: Charge la configuration depuis un fichier YAML, fusionnée sur les valeurs actuelles. Retourne false en cas d'erreur.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string, merging over current values.
    // FR: Charge la configuration depuis une chaîne YAML, fusionnée sur les valeurs actuelles.
    bool loadFromString(const std::string& yaml_content);

    // EN: Save current configuration to YAML file.
    // FR: Sauvegarde la configuration actuelle vers un fichier YAML.
    bool saveToFile(const std::string& filename) const;

    // EN: Apply PREFIX_SECTION_KEY environment variables (FP_VALIDATION_MAX_ERRORS -> validation.max_errors).
    //     Returns the number of overrides applied.
    // FR: Applique les variables PREFIXE_SECTION_CLE (FP_VALIDATION_MAX_ERRORS -> validation.max_errors).
    //     Retourne le nombre de surcharges appliquées.
    size_t loadEnvironmentOverrides(const std::string& prefix = "FP_");

    // EN: Same as above, over an explicit NAME=VALUE list.
    // FR: Idem, sur une liste NOM=VALEUR explicite.
    size_t applyEnvironment(const std::vector<std::string>& entries, const std::string& prefix = "FP_");

    // EN: Add validation rules for configuration values.
    // FR: Ajoute des règles de validation pour les valeurs de configuration.
    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    // EN: "section.key" addressing; a path without a dot targets the default section.
    // FR: Adressage "section.cle" ; un chemin sans point vise la section par défaut.
    ConfigValue getPath(const std::string& path) const;
    void setPath(const std::string& path, const ConfigValue& value);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data.
    // FR: Remet à zéro toutes les données de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

    // EN: Split "section.key" into its parts.
    // FR: Sépare "section.cle" en ses parties.
    static std::pair<std::string, std::string> splitPath(const std::string& path);

private:
    bool loadNode(const YAML::Node& yaml, const std::string& origin);
    ConfigValue findUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    static std::string expandVariables(const std::string& value);

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace FP
