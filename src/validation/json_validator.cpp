// EN: JsonValidator implementation
// FR: Implémentation de JsonValidator

#include "validation/json_validator.hpp"
#include "infrastructure/io/line_reader.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace FP {
namespace Validation {

namespace {

constexpr const char* kModule = "json_validator";

std::set<std::string> keysOf(const nlohmann::json& object) {
    std::set<std::string> keys;
    for (const auto& item : object.items()) {
        keys.insert(item.key());
    }
    return keys;
}

std::string joinKeys(const std::vector<std::string>& keys) {
    std::string joined;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += keys[i];
    }
    return joined;
}

// EN: "Missing keys: a, b; Extra keys: c" - each part present only when non-empty, keys sorted
// FR: "Missing keys: a, b; Extra keys: c" - chaque partie présente seulement si non vide, clés triées
std::string describeKeyDrift(const std::set<std::string>& expected, const std::set<std::string>& actual) {
    std::vector<std::string> missing;
    std::vector<std::string> extra;
    std::set_difference(expected.begin(), expected.end(), actual.begin(), actual.end(),
                        std::back_inserter(missing));
    std::set_difference(actual.begin(), actual.end(), expected.begin(), expected.end(),
                        std::back_inserter(extra));

    std::string message;
    if (!missing.empty()) {
        message = "Missing keys: " + joinKeys(missing);
    }
    if (!extra.empty()) {
        if (!message.empty()) {
            message += "; ";
        }
        message += "Extra keys: " + joinKeys(extra);
    }
    return message;
}

} // namespace

JsonValidator::JsonValidator(JsonValidatorOptions options) : options_(std::move(options)) {
    if (options_.max_errors == 0) {
        throw std::invalid_argument("max_errors must be greater than zero");
    }
    if (options_.read_buffer_size == 0) {
        throw std::invalid_argument("read_buffer_size must be greater than zero");
    }
}

ValidationReport JsonValidator::validate(const std::string& path,
                                         const CancellationFlag* cancel_flag,
                                         const ProgressCallback& progress) {
    ValidationReport report(std::filesystem::path(path).filename().string(), options_.max_errors);
    report.markStarted();
    report.file_type = "JSON";

    LOG_INFO(kModule, "Starting validation of " + path);
    transition(ValidatorState::SCANNING, path);

    try {
        report.file_size = IO::LineReader::getFileSize(path);
        std::string content;
        {
            IO::LineReader reader(path, options_.read_buffer_size);
            content = reader.readAll();
        }

        if (progress) {
            progress(50.0, 0, 0);
        }

        if (cancellationRequested(cancel_flag)) {
            report.cancelled = true;
        } else {
            nlohmann::json document;
            bool parsed = true;
            try {
                document = nlohmann::json::parse(content);
            } catch (const nlohmann::json::exception& e) {
                // EN: Only parse_error carries a position; number overflow (out_of_range 406) does not
                // FR: Seul parse_error porte une position ; le dépassement numérique (out_of_range 406) non
                const auto* syntax_error = dynamic_cast<const nlohmann::json::parse_error*>(&e);
                const size_t line = syntax_error != nullptr ? lineOfByte(content, syntax_error->byte) : 1;
                parsed = false;
                report.addError(line, IssueKind::JSON_PARSE_ERROR,
                                std::string("Invalid JSON: ") + e.what());
                report.invalid_rows = 1;
                LOG_WARN(kModule, "Parse error in " + path + ": " + e.what());
            }

            if (parsed && document.is_array()) {
                report.total_rows = document.size();
                report.valid_rows = document.size();

                if (!document.empty() && document.front().is_object()) {
                    const auto expected_keys = keysOf(document.front());
                    report.expected_columns = expected_keys.size();

                    for (size_t i = 1; i < document.size(); ++i) {
                        const size_t index = i + 1;
                        if (options_.element_listener) {
                            options_.element_listener(index);
                        }
                        if (cancellationRequested(cancel_flag)) {
                            report.cancelled = true;
                            break;
                        }

                        const auto& element = document[i];
                        if (!element.is_object()) {
                            ++report.invalid_rows;
                            --report.valid_rows;
                            report.addError(index, IssueKind::TYPE_MISMATCH,
                                            std::string("Expected object, got ") + element.type_name());
                            continue;
                        }

                        const auto keys = keysOf(element);
                        if (keys != expected_keys) {
                            report.addWarning(index, IssueKind::KEY_MISMATCH, describeKeyDrift(expected_keys, keys));
                        }
                    }
                }
            } else if (parsed && document.is_object()) {
                report.total_rows = 1;
                report.valid_rows = 1;
                report.expected_columns = document.size();
            } else if (parsed) {
                report.total_rows = 1;
                report.valid_rows = 1;
            }

            if (parsed && !report.cancelled && progress) {
                progress(100.0, report.total_rows, report.errors().size());
            }
        }

        if (report.cancelled) {
            transition(ValidatorState::CANCELLED, path);
            LOG_WARN(kModule, "Validation cancelled: " + path);
        } else {
            transition(ValidatorState::COMPLETE, path);
        }
    } catch (const std::exception& e) {
        report.addError(0, IssueKind::FILE_READ_ERROR, std::string("Error reading file: ") + e.what());
        transition(ValidatorState::FAILED, path);
        LOG_ERROR(kModule, "Failed to read " + path + ": " + e.what());
    }

    report.finalize();

    std::unordered_map<std::string, std::string> summary = {
        {"file", path},
        {"state", validatorStateToString(getState())},
        {"total_rows", std::to_string(report.total_rows)},
        {"errors", std::to_string(report.errors().size())},
        {"warnings", std::to_string(report.warnings().size())},
        {"passed", report.passed ? "true" : "false"}
    };
    LOG_INFO_META(kModule, "Validation finished", summary);

    return report;
}

size_t JsonValidator::lineOfByte(const std::string& content, size_t byte) {
    // EN: `byte` counts characters read, the offending one included
    // FR: `byte` compte les caractères lus, y compris le fautif
    size_t end = std::min(content.size(), byte > 0 ? byte - 1 : 0);
    return 1 + static_cast<size_t>(std::count(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
}

void JsonValidator::transition(ValidatorState next, const std::string& path) {
    ValidatorState previous = state_.exchange(next);
    LOG_DEBUG(kModule, path + ": " + validatorStateToString(previous) + " -> " + validatorStateToString(next));
}

ValidationReport validateJson(const std::string& path,
                              size_t max_errors,
                              const CancellationFlag* cancel_flag,
                              const ProgressCallback& progress) {
    JsonValidatorOptions options;
    options.max_errors = max_errors;
    return JsonValidator(options).validate(path, cancel_flag, progress);
}

} // namespace Validation
} // namespace FP
