// EN: Implementation of the FileProof command line parser
// FR: Implémentation de l'analyseur de ligne de commande FileProof

#include "infrastructure/cli/argument_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace FP {
namespace CLI {

namespace {

constexpr size_t kHelpColumn = 34;

bool isLongOption(const std::string& arg) {
    return arg.size() > 2 && arg[0] == '-' && arg[1] == '-';
}

bool isShortOption(const std::string& arg) {
    return arg.size() >= 2 && arg[0] == '-' && arg[1] != '-';
}

std::string joinValues(const std::set<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

} // namespace

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS:           return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED:    return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION:    return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE:     return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE:     return "INVALID_VALUE";
        default:                                return "UNKNOWN";
    }
}

ConfigValue CliParseResult::get(const std::string& long_name) const {
    auto it = values.find(long_name);
    return it != values.end() ? it->second : ConfigValue{};
}

// EN: Private implementation holding the option tables
// FR: Implémentation privée contenant les tables d'options
class ArgumentParser::ArgumentParserImpl {
public:
    explicit ArgumentParserImpl(std::string program_name)
        : program_name_(std::move(program_name)),
          help_header_("FileProof - delimited and JSON data file validator"),
          version_("1.0.0") {}

    void addOption(const CliOptionDefinition& option_def) {
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("Option long name cannot be empty");
        }
        if (options_by_long_name_.count(option_def.long_name)) {
            throw std::invalid_argument("Option already registered: --" + option_def.long_name);
        }
        if (option_def.short_name && options_by_short_name_.count(*option_def.short_name)) {
            throw std::invalid_argument(std::string("Short option already registered: -") + *option_def.short_name);
        }
        if (option_def.constraint == CliOptionConstraint::ENUM_VALUES && option_def.enum_values.empty()) {
            throw std::invalid_argument("Option --" + option_def.long_name + " has an enum constraint without values");
        }

        option_definitions_.push_back(option_def);
        options_by_long_name_[option_def.long_name] = option_definitions_.size() - 1;
        if (option_def.short_name) {
            options_by_short_name_[*option_def.short_name] = option_definitions_.size() - 1;
        }
    }

    void addStandardOptions() {
        std::vector<CliOptionDefinition> options = {
            {
                .long_name = "config",
                .short_name = 'c',
                .type = CliOptionType::STRING,
                .description = "EN: YAML configuration file / FR: Fichier de configuration YAML",
                .category = "General"
            },
            {
                .long_name = "help",
                .short_name = 'h',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: Show this help / FR: Afficher cette aide",
                .category = "General"
            },
            {
                .long_name = "version",
                .short_name = 'V',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: Show version / FR: Afficher la version",
                .category = "General"
            },
            {
                .long_name = "delimiter",
                .short_name = 'd',
                .type = CliOptionType::STRING,
                .description = "EN: Field separator, \\t for tab / FR: Séparateur de champs, \\t pour tabulation",
                .config_path = "validation.delimiter",
                .default_value = "auto",
                .category = "Validation"
            },
            {
                .long_name = "max-errors",
                .short_name = 'm',
                .type = CliOptionType::INTEGER,
                .description = "EN: Maximum records per list / FR: Nombre maximal d'entrées par liste",
                .config_path = "validation.max_errors",
                .default_value = "1000",
                .constraint = CliOptionConstraint::POSITIVE,
                .category = "Validation"
            },
            {
                .long_name = "check-duplicates",
                .short_name = 'D',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: Report exact duplicate rows / FR: Signaler les lignes dupliquées",
                .config_path = "validation.check_duplicates",
                .category = "Validation"
            },
            {
                .long_name = "type",
                .type = CliOptionType::STRING,
                .description = "EN: Validator selection / FR: Choix du validateur",
                .config_path = "validation.type",
                .default_value = "auto",
                .constraint = CliOptionConstraint::ENUM_VALUES,
                .enum_values = {"auto", "delimited", "csv", "json"},
                .category = "Validation"
            },
            {
                .long_name = "report",
                .short_name = 'r',
                .type = CliOptionType::STRING,
                .description = "EN: Write the text report to FILE / FR: Écrire le rapport texte dans FILE",
                .config_path = "output.report",
                .category = "Output"
            },
            {
                .long_name = "errors-csv",
                .short_name = 'e',
                .type = CliOptionType::STRING,
                .description = "EN: Export errors as CSV / FR: Exporter les erreurs en CSV",
                .config_path = "output.errors_csv",
                .category = "Output"
            },
            {
                .long_name = "json-report",
                .short_name = 'j',
                .type = CliOptionType::STRING,
                .description = "EN: Write the JSON report to FILE / FR: Écrire le rapport JSON dans FILE",
                .config_path = "output.json_report",
                .category = "Output"
            },
            {
                .long_name = "quiet",
                .short_name = 'q',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: No progress line / FR: Pas de ligne de progression",
                .category = "Output"
            },
            {
                .long_name = "log-level",
                .type = CliOptionType::STRING,
                .description = "EN: Minimum log level / FR: Niveau de log minimal",
                .config_path = "logging.level",
                .default_value = "info",
                .constraint = CliOptionConstraint::ENUM_VALUES,
                .enum_values = {"debug", "info", "warn", "error"},
                .category = "Logging"
            },
            {
                .long_name = "log-file",
                .type = CliOptionType::STRING,
                .description = "EN: Write logs to FILE instead of stderr / FR: Écrire les logs dans FILE au lieu de stderr",
                .config_path = "logging.file",
                .category = "Logging"
            }
        };

        for (const auto& option : options) {
            addOption(option);
        }
    }

    CliParseResult parse(const std::vector<std::string>& arguments) const {
        CliParseResult result;
        bool options_ended = false;

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];

            if (options_ended || !(isLongOption(arg) || isShortOption(arg))) {
                result.positional.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_ended = true;
                continue;
            }

            // EN: Split "--name=value" and "-xVALUE"
            // FR: Découpe "--name=value" et "-xVALUE"
            std::string name;
            std::optional<std::string> inline_value;
            const CliOptionDefinition* option_def = nullptr;

            if (isLongOption(arg)) {
                name = arg.substr(2);
                auto equals = name.find('=');
                if (equals != std::string::npos) {
                    inline_value = name.substr(equals + 1);
                    name.resize(equals);
                }
                auto it = options_by_long_name_.find(name);
                if (it != options_by_long_name_.end()) {
                    option_def = &option_definitions_[it->second];
                }
            } else {
                auto it = options_by_short_name_.find(arg[1]);
                if (it != options_by_short_name_.end()) {
                    option_def = &option_definitions_[it->second];
                    if (arg.size() > 2) {
                        inline_value = arg.substr(2);
                    }
                }
            }

            if (!option_def) {
                return fail(std::move(result), CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            }

            if (option_def->long_name == "help") {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = generateHelpText();
                return result;
            }
            if (option_def->long_name == "version") {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = generateVersionText();
                return result;
            }

            ConfigValue value;
            if (option_def->type == CliOptionType::BOOLEAN) {
                if (inline_value) {
                    return fail(std::move(result), CliParseStatus::INVALID_VALUE,
                                "Option --" + option_def->long_name + " does not take a value");
                }
                value = ConfigValue(true);
            } else {
                std::string raw;
                if (inline_value) {
                    raw = *inline_value;
                } else if (i + 1 < arguments.size()) {
                    raw = arguments[++i];
                } else {
                    return fail(std::move(result), CliParseStatus::MISSING_VALUE,
                                "Option " + arg + " requires a value");
                }

                std::string error_message;
                auto converted = convertValue(*option_def, raw, error_message);
                if (!converted) {
                    return fail(std::move(result), CliParseStatus::INVALID_VALUE,
                                "Invalid value for option --" + option_def->long_name + ": " + error_message);
                }
                value = *converted;
            }

            result.values[option_def->long_name] = value;
            if (!option_def->config_path.empty()) {
                result.overrides[option_def->config_path] = value;
            }
        }

        LOG_DEBUG("argument_parser", "Parsed " + std::to_string(result.values.size()) + " options, " +
                  std::to_string(result.positional.size()) + " positional arguments");
        return result;
    }

    std::string generateHelpText() const {
        std::ostringstream help;
        help << help_header_ << "\n\n";
        help << "Usage: " << program_name_ << " [OPTIONS] FILE\n\n";

        std::map<std::string, std::vector<const CliOptionDefinition*>> options_by_category;
        for (const auto& option : option_definitions_) {
            options_by_category[option.category].push_back(&option);
        }

        for (const auto& [category, options] : options_by_category) {
            help << category << " Options:\n";
            for (const auto* option : options) {
                help << ArgumentParser::formatOptionHelp(*option) << "\n";
            }
            help << "\n";
        }

        help << "Exit codes: 0 passed, 1 failed, 2 cancelled, 64 usage error\n";
        return help.str();
    }

    std::string generateVersionText() const {
        std::ostringstream version;
        version << "FileProof " << version_;
        if (!build_info_.empty()) {
            version << " (" << build_info_ << ")";
        }
        version << "\n";
        return version.str();
    }

    const CliOptionDefinition* find(const std::string& name) const {
        auto it = options_by_long_name_.find(name);
        if (it != options_by_long_name_.end()) {
            return &option_definitions_[it->second];
        }
        if (name.size() == 1) {
            auto short_it = options_by_short_name_.find(name[0]);
            if (short_it != options_by_short_name_.end()) {
                return &option_definitions_[short_it->second];
            }
        }
        return nullptr;
    }

    std::string program_name_;
    std::string help_header_;
    std::string version_;
    std::string build_info_;

private:
    static CliParseResult fail(CliParseResult result, CliParseStatus status, const std::string& message) {
        result.status = status;
        result.errors.push_back(message);
        LOG_DEBUG("argument_parser", message);
        return result;
    }

    static std::optional<ConfigValue> convertValue(const CliOptionDefinition& option,
                                                   const std::string& raw,
                                                   std::string& error_message) {
        if (option.type == CliOptionType::INTEGER) {
            long long number = 0;
            const char* end = raw.data() + raw.size();
            auto [ptr, ec] = std::from_chars(raw.data(), end, number);
            if (raw.empty() || ec != std::errc() || ptr != end) {
                error_message = "'" + raw + "' is not an integer";
                return std::nullopt;
            }
            if (number > std::numeric_limits<int>::max() || number < std::numeric_limits<int>::min()) {
                error_message = "'" + raw + "' is out of range";
                return std::nullopt;
            }
            if (option.constraint == CliOptionConstraint::POSITIVE && number <= 0) {
                error_message = "must be positive";
                return std::nullopt;
            }
            return ConfigValue(static_cast<int>(number));
        }

        if (option.constraint == CliOptionConstraint::ENUM_VALUES && !option.enum_values.count(raw)) {
            error_message = "'" + raw + "' is not one of: " + joinValues(option.enum_values);
            return std::nullopt;
        }
        return ConfigValue(raw);
    }

    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, size_t> options_by_long_name_;
    std::unordered_map<char, size_t> options_by_short_name_;
};

ArgumentParser::ArgumentParser(std::string program_name)
    : impl_(std::make_unique<ArgumentParserImpl>(std::move(program_name))) {}

ArgumentParser::~ArgumentParser() = default;

void ArgumentParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void ArgumentParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        impl_->addOption(option_def);
    }
}

void ArgumentParser::addStandardOptions() {
    impl_->addStandardOptions();
}

CliParseResult ArgumentParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return impl_->parse(arguments);
}

CliParseResult ArgumentParser::parse(const std::vector<std::string>& arguments) const {
    return impl_->parse(arguments);
}

std::string ArgumentParser::generateHelpText() const {
    return impl_->generateHelpText();
}

std::string ArgumentParser::generateVersionText() const {
    return impl_->generateVersionText();
}

void ArgumentParser::setHelpHeader(const std::string& header) {
    impl_->help_header_ = header;
}

void ArgumentParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    impl_->version_ = version;
    impl_->build_info_ = build_info;
}

bool ArgumentParser::hasOption(const std::string& name) const {
    return impl_->find(name) != nullptr;
}

std::optional<CliOptionDefinition> ArgumentParser::getOptionDefinition(const std::string& name) const {
    if (const auto* option = impl_->find(name)) {
        return *option;
    }
    return std::nullopt;
}

size_t ArgumentParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    for (const auto& [path, value] : result.overrides) {
        config.setPath(path, value);
    }
    return result.overrides.size();
}

std::string ArgumentParser::formatOptionHelp(const CliOptionDefinition& option) {
    std::string left = "  ";
    left += option.short_name ? std::string("-") + *option.short_name + ", " : std::string("    ");
    left += "--" + option.long_name;
    if (option.type == CliOptionType::INTEGER) {
        left += " <n>";
    } else if (option.constraint == CliOptionConstraint::ENUM_VALUES) {
        std::string choices;
        for (const auto& value : option.enum_values) {
            if (!choices.empty()) {
                choices += '|';
            }
            choices += value;
        }
        left += " <" + choices + ">";
    } else if (option.type == CliOptionType::STRING) {
        left += " <value>";
    }

    std::string line = left;
    if (line.size() < kHelpColumn) {
        line.append(kHelpColumn - line.size(), ' ');
    } else {
        line += "  ";
    }
    line += option.description;
    if (option.default_value) {
        line += " (default: " + *option.default_value + ")";
    }
    return line;
}

} // namespace CLI
} // namespace FP
