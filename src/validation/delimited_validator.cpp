// EN: DelimitedValidator implementation - sampling, delimiter detection, then one streaming scan
// FR: Implémentation de DelimitedValidator - échantillonnage, détection du délimiteur, puis un parcours streaming

#include "validation/delimited_validator.hpp"
#include "validation/delimiter_detector.hpp"
#include "validation/duplicate_detector.hpp"
#include "validation/quoted_line_tokenizer.hpp"
#include "infrastructure/io/line_reader.hpp"
#include "infrastructure/io/text_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace FP {
namespace Validation {

namespace {

constexpr const char* kModule = "delimited_validator";

double percentOf(uint64_t consumed, uint64_t total) {
    if (total == 0) {
        return 100.0;
    }
    return std::min(100.0, static_cast<double>(consumed) / static_cast<double>(total) * 100.0);
}

void emitDuplicates(ValidationReport& report, const DuplicateDetector& detector) {
    for (const auto& group : detector.duplicateGroups()) {
        for (size_t row : group.rows) {
            if (!report.addDuplicate(row, DuplicateDetector::describeSiblings(group.rows, row),
                                     group.content_preview)) {
                return;
            }
        }
    }
}

} // namespace

DelimitedValidator::DelimitedValidator(DelimitedValidatorOptions options) : options_(std::move(options)) {
    if (options_.max_errors == 0) {
        throw std::invalid_argument("max_errors must be greater than zero");
    }
    if (options_.sample_lines == 0) {
        throw std::invalid_argument("sample_lines must be greater than zero");
    }
    if (options_.detection_lines == 0) {
        throw std::invalid_argument("detection_lines must be greater than zero");
    }
    if (options_.progress_interval == 0) {
        throw std::invalid_argument("progress_interval must be greater than zero");
    }
    if (options_.read_buffer_size == 0) {
        throw std::invalid_argument("read_buffer_size must be greater than zero");
    }
}

ValidationReport DelimitedValidator::validate(const std::string& path,
                                              const CancellationFlag* cancel_flag,
                                              const ProgressCallback& progress) {
    ValidationReport report(std::filesystem::path(path).filename().string(), options_.max_errors);
    report.markStarted();
    report.delimiter_detected = !options_.delimiter.has_value();

    LOG_INFO(kModule, "Starting validation of " + path);

    try {
        report.file_size = IO::LineReader::getFileSize(path);
        IO::LineReader reader(path, options_.read_buffer_size);

        // EN: SAMPLING - buffer the first lines without keeping the read position
        // FR: SAMPLING - met de côté les premières lignes sans conserver la position de lecture
        transition(ValidatorState::SAMPLING, path);
        std::vector<std::string> sample;
        std::string raw;
        while (sample.size() < options_.sample_lines && reader.readLine(raw)) {
            sample.push_back(IO::TextUtils::sanitizeUtf8(raw));
        }

        if (sample.empty()) {
            report.addError(0, IssueKind::EMPTY_FILE, "File is empty");
            report.finalize();
            transition(ValidatorState::COMPLETE, path);
            LOG_WARN(kModule, "File is empty: " + path);
            return report;
        }

        // EN: DETECTING - the first sampled line defines the expected width
        // FR: DETECTING - la première ligne échantillonnée définit la largeur attendue
        transition(ValidatorState::DETECTING, path);
        DelimiterDetector detector(options_.detection_lines);
        const char delimiter = detector.detect(sample, options_.delimiter);
        const auto header = IO::TextUtils::trim(sample.front());
        const size_t expected_columns = QuotedLineTokenizer::countColumns(header, delimiter);

        report.delimiter = DelimiterDetector::describe(delimiter);
        report.expected_columns = expected_columns;
        report.file_type = "Delimited (delimiter: " + report.delimiter + ")";
        sample.clear();

        std::unordered_map<std::string, std::string> detection_meta = {
            {"file", path},
            {"delimiter", report.delimiter},
            {"detected", report.delimiter_detected ? "true" : "false"},
            {"expected_columns", std::to_string(expected_columns)}
        };
        LOG_INFO_META(kModule, "Delimiter resolved", detection_meta);

        // EN: SCANNING - full pass from the start of the file
        // FR: SCANNING - passe complète depuis le début du fichier
        transition(ValidatorState::SCANNING, path);
        reader.rewind();

        DuplicateDetector duplicates;
        size_t row = 0;

        while (true) {
            if (cancellationRequested(cancel_flag)) {
                report.cancelled = true;
                break;
            }
            if (!reader.readLine(raw)) {
                break;
            }
            ++row;

            std::string text = IO::TextUtils::sanitizeUtf8(raw);
            auto line = IO::TextUtils::trim(text);
            if (!line.empty()) {
                ++report.total_rows;
                if (options_.check_duplicates) {
                    duplicates.record(row, line);
                }
                checkRow(report, row, line, delimiter, expected_columns);
            }

            if (progress && row % options_.progress_interval == 0) {
                progress(percentOf(reader.bytesConsumed(), report.file_size), report.total_rows,
                         report.errors().size());
            }
        }

        if (report.cancelled) {
            transition(ValidatorState::CANCELLED, path);
            LOG_WARN(kModule, "Validation cancelled after " + std::to_string(row) + " lines: " + path);
        } else {
            if (options_.check_duplicates) {
                emitDuplicates(report, duplicates);
            }
            transition(ValidatorState::COMPLETE, path);
            if (progress) {
                progress(100.0, report.total_rows, report.errors().size());
            }
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
        {"invalid_rows", std::to_string(report.invalid_rows)},
        {"errors", std::to_string(report.errors().size())},
        {"passed", report.passed ? "true" : "false"}
    };
    LOG_INFO_META(kModule, "Validation finished", summary);

    return report;
}

void DelimitedValidator::checkRow(ValidationReport& report, size_t row, std::string_view line,
                                  char delimiter, size_t expected_columns) {
    const size_t actual_columns = QuotedLineTokenizer::countColumns(line, delimiter);

    if (actual_columns != expected_columns) {
        ++report.invalid_rows;
        bool recorded = report.addError(row, IssueKind::COLUMN_COUNT_MISMATCH,
                                        "Expected " + std::to_string(expected_columns) + " columns, found " +
                                            std::to_string(actual_columns),
                                        line);

        if (recorded && Logger::getInstance().getLogLevel() == LogLevel::DEBUG) {
            auto fields = QuotedLineTokenizer::splitFields(line, delimiter);
            std::string joined;
            for (size_t i = 0; i < fields.size(); ++i) {
                joined += (i == 0 ? "[" : ", [") + fields[i] + "]";
            }
            LOG_DEBUG(kModule, "Row " + std::to_string(row) + " fields: " + joined);
        }
        return;
    }

    const QuoteBalance balance = QuotedLineTokenizer::quoteBalance(line);
    if (balance.doubleQuotesUnbalanced()) {
        ++report.invalid_rows;
        report.addError(row, IssueKind::UNCLOSED_QUOTES, "Unclosed double quotes detected", line);
        return;
    }
    if (balance.singleQuotesUnbalanced()) {
        report.addWarning(row, IssueKind::UNCLOSED_QUOTES, "Unclosed single quotes detected", line);
    }
    ++report.valid_rows;
}

void DelimitedValidator::transition(ValidatorState next, const std::string& path) {
    ValidatorState previous = state_.exchange(next);
    LOG_DEBUG(kModule, path + ": " + validatorStateToString(previous) + " -> " + validatorStateToString(next));
}

ValidationReport validateDelimited(const std::string& path,
                                   std::optional<char> delimiter_override,
                                   size_t max_errors,
                                   bool check_duplicates,
                                   const CancellationFlag* cancel_flag,
                                   const ProgressCallback& progress) {
    DelimitedValidatorOptions options;
    options.delimiter = delimiter_override;
    options.max_errors = max_errors;
    options.check_duplicates = check_duplicates;
    return DelimitedValidator(options).validate(path, cancel_flag, progress);
}

} // namespace Validation
} // namespace FP
