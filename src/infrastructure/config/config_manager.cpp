// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges d'environnement et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

extern char** environ;

namespace FP {

namespace {

constexpr const char* kDefaultSection = "default";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// EN: ConfigValue template implementation for type conversion.
// FR: Implémentation de template ConfigValue pour la conversion de types.
template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    const T* held = std::get_if<T>(&*value_);
    if (held == nullptr) {
        throw std::runtime_error("ConfigValue type mismatch: holds " + typeName());
    }
    return *held;
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    const T* held = std::get_if<T>(&*value_);
    if (held == nullptr) {
        return std::nullopt;
    }
    return *held;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int>) {
            return "int";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else {
            return "array";
        }
    }, *value_);
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// EN: Scalar inference order: bool, int, double, then string.
// FR: Ordre d'inférence des scalaires : bool, int, double, puis chaîne.
ConfigValue ConfigValue::fromScalar(const std::string& text) {
    std::string lowered = toLower(text);
    if (lowered == "true" || lowered == "yes" || lowered == "on") {
        return ConfigValue(true);
    }
    if (lowered == "false" || lowered == "no" || lowered == "off") {
        return ConfigValue(false);
    }

    if (!text.empty()) {
        int int_value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, int_value);
        if (ec == std::errc() && ptr == end) {
            return ConfigValue(int_value);
        }

        char* parse_end = nullptr;
        double double_value = std::strtod(text.c_str(), &parse_end);
        if (parse_end == text.c_str() + text.size() && !std::isspace(static_cast<unsigned char>(text.front()))) {
            return ConfigValue(double_value);
        }
    }

    return ConfigValue(text);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            set(key, value);
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        return loadNode(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        return loadNode(YAML::Load(yaml_content), "string");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadNode(const YAML::Node& yaml, const std::string& origin) {
    if (yaml.IsNull()) {
        LOG_WARN("config", "Configuration is empty: " + origin);
        return true;
    }
    if (!yaml.IsMap()) {
        LOG_ERROR("config", "Configuration root must be a mapping: " + origin);
        return false;
    }

    // EN: Build the new sections first so a malformed document leaves current values untouched.
    // FR: Construit d'abord les nouvelles sections pour qu'un document malformé laisse les valeurs intactes.
    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection& config_section = loaded[section_name];

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, section] : loaded) {
        sections_[name].merge(section, true);
    }

    LOG_INFO("config", "Configuration loaded from: " + origin);
    return true;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    if (!node.IsScalar()) {
        throw YAML::RepresentationException(node.Mark(), "nested mappings are not supported");
    }

    // EN: Quoted scalars stay strings ("1000" is not an int); the tag is "!" for them.
    // FR: Les scalaires quotés restent des chaînes ("1000" n'est pas un int) ; leur tag vaut "!".
    const std::string text = node.Scalar();
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(text));
    }

    ConfigValue value = ConfigValue::fromScalar(text);
    if (auto str_value = value.tryAs<std::string>()) {
        return ConfigValue(expandVariables(*str_value));
    }
    return value;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter emitter;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> names;
        for (const auto& [name, _] : sections_) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());

        emitter << YAML::BeginMap;
        for (const auto& section_name : names) {
            const auto& section = sections_.at(section_name);
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;

            for (const std::string& key : section.keys()) {
                ConfigValue value = section.get(key);
                emitter << YAML::Key << key;
                emitter << YAML::Value;

                if (auto bool_val = value.tryAs<bool>()) {
                    emitter << *bool_val;
                } else if (auto int_val = value.tryAs<int>()) {
                    emitter << *int_val;
                } else if (auto double_val = value.tryAs<double>()) {
                    emitter << *double_val;
                } else if (auto str_val = value.tryAs<std::string>()) {
                    emitter << YAML::DoubleQuoted << *str_val;
                } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                    emitter << YAML::BeginSeq;
                    for (const auto& item : *array_val) {
                        emitter << item;
                    }
                    emitter << YAML::EndSeq;
                } else {
                    emitter << YAML::Null;
                }
            }

            emitter << YAML::EndMap;
        }
        emitter << YAML::EndMap;
    }

    if (!emitter.good()) {
        LOG_ERROR("config", "Failed to serialize configuration: " + emitter.GetLastError());
        return false;
    }

    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("config", "Cannot open configuration file for writing: " + filename);
        return false;
    }
    file << emitter.c_str() << '\n';
    if (!file) {
        LOG_ERROR("config", "Failed to write configuration file: " + filename);
        return false;
    }

    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::vector<std::string> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        entries.emplace_back(*env);
    }
    return applyEnvironment(entries, prefix);
}

size_t ConfigManager::applyEnvironment(const std::vector<std::string>& entries, const std::string& prefix) {
    size_t applied = 0;

    for (const auto& entry : entries) {
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        size_t equals = entry.find('=');
        if (equals == std::string::npos || equals <= prefix.size()) {
            continue;
        }

        // EN: FP_VALIDATION_MAX_ERRORS -> section "validation", key "max_errors"
        // FR: FP_VALIDATION_MAX_ERRORS -> section "validation", clé "max_errors"
        std::string name = toLower(entry.substr(prefix.size(), equals - prefix.size()));
        std::string raw_value = entry.substr(equals + 1);

        size_t underscore = name.find('_');
        std::string section = underscore == std::string::npos ? kDefaultSection : name.substr(0, underscore);
        std::string key = underscore == std::string::npos ? name : name.substr(underscore + 1);
        if (key.empty()) {
            continue;
        }

        set(section, key, ConfigValue::fromScalar(raw_value));
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
        ++applied;
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        auto [section_name, key_name] = splitPath(rule.key);
        ConfigValue value = findUnlocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get(kDefaultSection, key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findUnlocked(section, key);
}

ConfigValue ConfigManager::findUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set(kDefaultSection, key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has(kDefaultSection, key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& key) {
    remove(kDefaultSection, key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigValue ConfigManager::getPath(const std::string& path) const {
    auto [section, key] = splitPath(path);
    return get(section, key);
}

void ConfigManager::setPath(const std::string& path, const ConfigValue& value) {
    auto [section, key] = splitPath(path);
    set(section, key, value);
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

std::pair<std::string, std::string> ConfigManager::splitPath(const std::string& path) {
    size_t dot_pos = path.find('.');
    if (dot_pos == std::string::npos) {
        return {kDefaultSection, path};
    }
    return {path.substr(0, dot_pos), path.substr(dot_pos + 1)};
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // EN: Type validation; an int satisfies a "double" rule.
    // FR: Validation de type ; un int satisfait une règle "double".
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") && (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            std::ostringstream oss;
            oss << "Configuration " << key << " must be >= " << *rule.min_value;
            error = oss.str();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            std::ostringstream oss;
            oss << "Configuration " << key << " must be <= " << *rule.max_value;
            error = oss.str();
            return false;
        }
    }

    // Allowed values validation
    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();

    // EN: Unknown variables are left as written
    // FR: Les variables inconnues sont laissées telles quelles
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value != nullptr ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

// Explicit template instantiations
template bool ConfigValue::as<bool>() const;
template int ConfigValue::as<int>() const;
template double ConfigValue::as<double>() const;
template std::string ConfigValue::as<std::string>() const;
template std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const;

template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace FP
