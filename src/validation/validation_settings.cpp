// EN: ValidationSettings implementation
// FR: Implémentation de ValidationSettings

#include "validation/validation_settings.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace FP {
namespace Validation {

namespace {

// EN: Positive count from an int or integral double value
// FR: Compteur positif depuis une valeur int ou double entière
std::optional<size_t> readCount(const ConfigManager& config, const std::string& section, const std::string& key) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return std::nullopt;
    }

    if (auto int_value = value.tryAs<int>()) {
        if (*int_value < 1) {
            throw std::invalid_argument(section + "." + key + " must be >= 1");
        }
        return static_cast<size_t>(*int_value);
    }
    if (auto double_value = value.tryAs<double>()) {
        if (*double_value < 1.0 || std::floor(*double_value) != *double_value) {
            throw std::invalid_argument(section + "." + key + " must be a whole number >= 1");
        }
        return static_cast<size_t>(*double_value);
    }
    throw std::invalid_argument(section + "." + key + " must be an integer, got " + value.typeName());
}

std::optional<bool> readFlag(const ConfigManager& config, const std::string& section, const std::string& key) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return std::nullopt;
    }
    if (auto flag = value.tryAs<bool>()) {
        return flag;
    }
    throw std::invalid_argument(section + "." + key + " must be a boolean, got " + value.typeName());
}

std::optional<std::string> readText(const ConfigManager& config, const std::string& section, const std::string& key) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return std::nullopt;
    }
    if (auto text = value.tryAs<std::string>()) {
        return text;
    }
    // EN: Scalars such as `1` typed as int still make sense as text
    // FR: Des scalaires comme `1` typés int restent valables comme texte
    if (value.tryAs<std::vector<std::string>>()) {
        throw std::invalid_argument(section + "." + key + " must be a string, got array");
    }
    return value.toString();
}

} // namespace

std::string fileKindToString(FileKind kind) {
    switch (kind) {
        case FileKind::AUTO:      return "auto";
        case FileKind::DELIMITED: return "delimited";
        case FileKind::JSON:      return "json";
        default:                  return "unknown";
    }
}

std::optional<FileKind> fileKindFromString(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "auto") return FileKind::AUTO;
    if (lowered == "delimited" || lowered == "csv") return FileKind::DELIMITED;
    if (lowered == "json") return FileKind::JSON;
    return std::nullopt;
}

ValidationSettings ValidationSettings::fromConfig(const ConfigManager& config) {
    ValidationSettings settings;

    if (auto delimiter = readText(config, "validation", "delimiter")) {
        settings.delimited.delimiter = parseDelimiter(*delimiter);
    }
    if (auto type = readText(config, "validation", "type")) {
        auto kind = fileKindFromString(*type);
        if (!kind) {
            throw std::invalid_argument("validation.type must be one of: auto, delimited, json");
        }
        settings.kind = *kind;
    }
    if (auto max_errors = readCount(config, "validation", "max_errors")) {
        settings.delimited.max_errors = *max_errors;
        settings.json.max_errors = *max_errors;
    }
    if (auto check = readFlag(config, "validation", "check_duplicates")) {
        settings.delimited.check_duplicates = *check;
    }
    if (auto sample = readCount(config, "validation", "sample_lines")) {
        settings.delimited.sample_lines = *sample;
    }
    if (auto detection = readCount(config, "validation", "detection_lines")) {
        settings.delimited.detection_lines = *detection;
    }
    if (auto interval = readCount(config, "validation", "progress_interval")) {
        settings.delimited.progress_interval = *interval;
    }

    if (auto level = readText(config, "logging", "level")) {
        if (!Logger::levelFromString(*level)) {
            throw std::invalid_argument("logging.level must be one of: debug, info, warn, error");
        }
        settings.log_level = *level;
    }
    if (auto file = readText(config, "logging", "file")) {
        settings.log_file = *file;
    }

    if (auto report = readText(config, "output", "report")) {
        settings.report_path = *report;
    }
    if (auto errors_csv = readText(config, "output", "errors_csv")) {
        settings.errors_csv_path = *errors_csv;
    }
    if (auto json_report = readText(config, "output", "json_report")) {
        settings.json_report_path = *json_report;
    }

    return settings;
}

std::vector<ConfigManager::ValidationRule> ValidationSettings::configRules() {
    return {
        {.key = "validation.delimiter", .type = "string", .description = "Field separator, empty for auto-detection"},
        {.key = "validation.type", .type = "string", .allowed_values = {"auto", "delimited", "csv", "json"},
         .description = "Validator selection"},
        {.key = "validation.max_errors", .type = "int", .min_value = 1, .description = "Cap per record list"},
        {.key = "validation.check_duplicates", .type = "bool", .description = "Report exact duplicate rows"},
        {.key = "validation.sample_lines", .type = "int", .min_value = 1, .description = "Lines sampled for detection"},
        {.key = "validation.detection_lines", .type = "int", .min_value = 1,
         .description = "Non-blank lines scored by the delimiter detector"},
        {.key = "validation.progress_interval", .type = "int", .min_value = 1,
         .description = "Rows between progress updates"},
        {.key = "logging.level", .type = "string", .allowed_values = {"debug", "info", "warn", "error"},
         .description = "Minimum log level"},
        {.key = "logging.file", .type = "string", .description = "Log destination, empty for stderr"},
        {.key = "output.report", .type = "string", .description = "Text report path"},
        {.key = "output.errors_csv", .type = "string", .description = "Error CSV path"},
        {.key = "output.json_report", .type = "string", .description = "JSON report path"},
    };
}

std::optional<char> ValidationSettings::parseDelimiter(const std::string& text) {
    if (text.empty() || text == "auto") {
        return std::nullopt;
    }
    if (text.size() == 1) {
        return text.front();
    }
    if (text == "\\t" || text == "tab") return '\t';
    if (text == "\\\\") return '\\';
    if (text == "space") return ' ';
    throw std::invalid_argument("Delimiter must be a single character, got '" + text + "'");
}

} // namespace Validation
} // namespace FP
