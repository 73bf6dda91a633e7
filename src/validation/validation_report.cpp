// EN: ValidationReport implementation - bookkeeping and the text, CSV and JSON renderings
// FR: Implémentation de ValidationReport - comptabilité et rendus texte, CSV et JSON

#include "validation/validation_report.hpp"
#include "infrastructure/io/text_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

namespace FP {
namespace Validation {

namespace {

const std::string kBanner(80, '=');
const std::string kRule(80, '-');

std::string withThousands(size_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(digits[i]);
    }
    return result;
}

std::string formatLocalTime(const ValidationReport::Clock::time_point& tp) {
    std::time_t time = ValidationReport::Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string formatIsoTime(const ValidationReport::Clock::time_point& tp) {
    std::time_t time = ValidationReport::Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// EN: CSV field quoting: wrap when the field holds a comma, quote or line break; double inner quotes
// FR: Quotage CSV : entoure si le champ contient virgule, quote ou saut de ligne ; double les quotes internes
std::string csvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "\"";
    return quoted;
}

// EN: Groups records by kind, in order of first appearance
// FR: Regroupe les enregistrements par type, dans l'ordre de première apparition
std::vector<std::pair<IssueKind, std::vector<const ValidationIssue*>>>
groupByKind(const std::vector<ValidationIssue>& issues) {
    std::vector<std::pair<IssueKind, std::vector<const ValidationIssue*>>> groups;
    for (const auto& issue : issues) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == issue.kind; });
        if (it == groups.end()) {
            groups.emplace_back(issue.kind, std::vector<const ValidationIssue*>{&issue});
        } else {
            it->second.push_back(&issue);
        }
    }
    return groups;
}

void appendGroupedSection(std::ostringstream& out, const std::string& title,
                          const std::vector<ValidationIssue>& issues, const std::string& noun) {
    out << "\n" << kBanner << "\n";
    out << title << " (" << issues.size() << " found)\n";
    out << kBanner << "\n";

    for (const auto& [kind, members] : groupByKind(issues)) {
        out << "\n" << issueKindToString(kind) << " (" << members.size() << " occurrences):\n";
        out << kRule << "\n";
        size_t shown = std::min(members.size(), ValidationReport::kTextGroupLimit);
        for (size_t i = 0; i < shown; ++i) {
            out << "  Row " << members[i]->row << ": " << members[i]->description << "\n";
        }
        if (members.size() > ValidationReport::kTextGroupLimit) {
            out << "  ... and " << (members.size() - ValidationReport::kTextGroupLimit)
                << " more similar " << noun << "\n";
        }
    }
}

nlohmann::ordered_json issueToJson(const ValidationIssue& issue) {
    nlohmann::ordered_json json;
    json["row"] = issue.row;
    json["type"] = issueKindToString(issue.kind);
    json["severity"] = issueSeverityToString(issue.severity);
    json["description"] = issue.description;
    json["content"] = issue.content_preview;
    return json;
}

} // namespace

std::string issueKindToString(IssueKind kind) {
    switch (kind) {
        case IssueKind::EMPTY_FILE:            return "EMPTY_FILE";
        case IssueKind::FILE_READ_ERROR:       return "FILE_READ_ERROR";
        case IssueKind::COLUMN_COUNT_MISMATCH: return "COLUMN_COUNT_MISMATCH";
        case IssueKind::UNCLOSED_QUOTES:       return "UNCLOSED_QUOTES";
        case IssueKind::JSON_PARSE_ERROR:      return "JSON_PARSE_ERROR";
        case IssueKind::TYPE_MISMATCH:         return "TYPE_MISMATCH";
        case IssueKind::KEY_MISMATCH:          return "KEY_MISMATCH";
        case IssueKind::DUPLICATE_ROW:         return "DUPLICATE_ROW";
        default:                               return "UNKNOWN";
    }
}

std::optional<IssueKind> issueKindFromString(std::string_view name) {
    static const std::pair<std::string_view, IssueKind> kKinds[] = {
        {"EMPTY_FILE", IssueKind::EMPTY_FILE},
        {"FILE_READ_ERROR", IssueKind::FILE_READ_ERROR},
        {"COLUMN_COUNT_MISMATCH", IssueKind::COLUMN_COUNT_MISMATCH},
        {"UNCLOSED_QUOTES", IssueKind::UNCLOSED_QUOTES},
        {"JSON_PARSE_ERROR", IssueKind::JSON_PARSE_ERROR},
        {"TYPE_MISMATCH", IssueKind::TYPE_MISMATCH},
        {"KEY_MISMATCH", IssueKind::KEY_MISMATCH},
        {"DUPLICATE_ROW", IssueKind::DUPLICATE_ROW},
    };
    for (const auto& [label, kind] : kKinds) {
        if (label == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string issueSeverityToString(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::ERROR:     return "error";
        case IssueSeverity::WARNING:   return "warning";
        case IssueSeverity::DUPLICATE: return "duplicate";
        default:                       return "unknown";
    }
}

ValidationReport::ValidationReport(std::string file_name, size_t max_entries)
    : filename(std::move(file_name)), max_entries_(max_entries) {
    if (max_entries_ == 0) {
        throw std::invalid_argument("Report entry cap must be greater than zero");
    }
}

bool ValidationReport::addError(size_t row, IssueKind kind, std::string description, std::string_view content) {
    return append(errors_, ValidationIssue{row, kind, IssueSeverity::ERROR, std::move(description), {}}, content);
}

bool ValidationReport::addWarning(size_t row, IssueKind kind, std::string description, std::string_view content) {
    return append(warnings_, ValidationIssue{row, kind, IssueSeverity::WARNING, std::move(description), {}}, content);
}

bool ValidationReport::addDuplicate(size_t row, std::string description, std::string_view content) {
    return append(duplicates_,
                  ValidationIssue{row, IssueKind::DUPLICATE_ROW, IssueSeverity::DUPLICATE, std::move(description), {}},
                  content);
}

bool ValidationReport::append(std::vector<ValidationIssue>& list, ValidationIssue issue, std::string_view content) {
    if (list.size() >= max_entries_) {
        return false;
    }
    issue.content_preview = IO::TextUtils::utf8Prefix(content, kStoredPreviewLength);
    list.push_back(std::move(issue));
    return true;
}

void ValidationReport::markStarted() {
    start_time = Clock::now();
    end_time.reset();
}

void ValidationReport::finalize() {
    end_time = Clock::now();
    if (!start_time) {
        start_time = end_time;
    }
    passed = invalid_rows == 0 && errors_.empty();
}

double ValidationReport::durationSeconds() const {
    if (!start_time || !end_time) {
        return 0.0;
    }
    return std::chrono::duration<double>(*end_time - *start_time).count();
}

std::vector<IssueKind> ValidationReport::errorKinds() const {
    std::set<IssueKind> kinds;
    for (const auto& error : errors_) {
        kinds.insert(error.kind);
    }
    return {kinds.begin(), kinds.end()};
}

std::vector<ValidationIssue> ValidationReport::errorsOfKind(IssueKind kind) const {
    std::vector<ValidationIssue> filtered;
    std::copy_if(errors_.begin(), errors_.end(), std::back_inserter(filtered),
                 [kind](const ValidationIssue& issue) { return issue.kind == kind; });
    return filtered;
}

std::vector<ValidationIssue> ValidationReport::findByRow(size_t row) const {
    std::vector<ValidationIssue> found;
    for (const auto* list : {&errors_, &warnings_, &duplicates_}) {
        std::copy_if(list->begin(), list->end(), std::back_inserter(found),
                     [row](const ValidationIssue& issue) { return issue.row == row; });
    }
    return found;
}

std::string ValidationReport::generateText() const {
    std::ostringstream out;

    out << kBanner << "\n";
    out << "DATA FILE VALIDATION REPORT\n";
    out << kBanner << "\n";
    out << "\nFile: " << filename << "\n";
    out << "File Size: " << std::fixed << std::setprecision(2)
        << static_cast<double>(file_size) / (1024.0 * 1024.0) << " MB\n";
    out << "File Type: " << file_type << "\n";
    out << "Validation Time: " << std::fixed << std::setprecision(2) << durationSeconds() << " seconds\n";
    if (end_time) {
        out << "Timestamp: " << formatLocalTime(*end_time) << "\n";
    }
    out << "\n";

    out << kRule << "\n";
    if (cancelled) {
        out << "VALIDATION RESULT: ⚠ CANCELLED (partial results)\n";
    } else {
        out << "VALIDATION RESULT: " << (passed ? "✓ PASSED" : "✗ FAILED") << "\n";
    }
    out << kRule << "\n";

    out << "\nTotal Rows Processed: " << withThousands(total_rows) << "\n";
    out << "Valid Rows: " << withThousands(valid_rows) << "\n";
    out << "Invalid Rows: " << withThousands(invalid_rows) << "\n";

    if (!delimiter.empty()) {
        out << "Delimiter: '" << delimiter << "' (" << (delimiter_detected ? "detected" : "specified") << ")\n";
    }
    if (expected_columns > 0) {
        out << "Expected Columns: " << expected_columns << "\n";
    }

    if (!errors_.empty()) {
        appendGroupedSection(out, "ERRORS", errors_, "errors");
    }
    if (!warnings_.empty()) {
        appendGroupedSection(out, "WARNINGS", warnings_, "warnings");
    }

    if (!duplicates_.empty()) {
        out << "\n" << kBanner << "\n";
        out << "DUPLICATE ROWS (" << duplicates_.size() << " found)\n";
        out << kBanner << "\n";
        size_t shown = std::min(duplicates_.size(), kTextDuplicateLimit);
        for (size_t i = 0; i < shown; ++i) {
            out << "  Row " << duplicates_[i].row << ": " << duplicates_[i].description << "\n";
        }
        if (duplicates_.size() > kTextDuplicateLimit) {
            out << "  ... and " << (duplicates_.size() - kTextDuplicateLimit) << " more duplicate rows\n";
        }
    }

    if (errors_.empty() && warnings_.empty()) {
        if (cancelled) {
            out << "\nNo errors or warnings found in the part checked before cancellation.\n";
        } else {
            out << "\n✓ No errors or warnings found. File is valid!\n";
        }
    }

    out << "\n" << kBanner << "\n";
    out << "END OF REPORT\n";
    out << kBanner << "\n";

    return out.str();
}

std::string ValidationReport::toJson(int indent) const {
    nlohmann::ordered_json json;
    json["file"] = {
        {"name", filename},
        {"size_bytes", file_size},
        {"type", file_type},
    };
    json["result"] = {
        {"passed", passed},
        {"cancelled", cancelled},
    };
    json["rows"] = {
        {"total", total_rows},
        {"valid", valid_rows},
        {"invalid", invalid_rows},
    };
    json["delimiter"] = delimiter.empty() ? nlohmann::ordered_json(nullptr) : nlohmann::ordered_json(delimiter);
    json["expected_columns"] = expected_columns;
    json["timing"] = {
        {"start", start_time ? nlohmann::ordered_json(formatIsoTime(*start_time)) : nlohmann::ordered_json(nullptr)},
        {"end", end_time ? nlohmann::ordered_json(formatIsoTime(*end_time)) : nlohmann::ordered_json(nullptr)},
        {"duration_seconds", durationSeconds()},
    };

    auto render = [](const std::vector<ValidationIssue>& issues) {
        auto array = nlohmann::ordered_json::array();
        for (const auto& issue : issues) {
            array.push_back(issueToJson(issue));
        }
        return array;
    };
    json["errors"] = render(errors_);
    json["warnings"] = render(warnings_);
    json["duplicates"] = render(duplicates_);

    return json.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void ValidationReport::exportErrorsCsv(std::ostream& out) const {
    out << "Row Number,Error Type,Description,Row Content Preview\r\n";
    for (const auto& error : errors_) {
        out << error.row << ','
            << csvField(issueKindToString(error.kind)) << ','
            << csvField(error.description) << ','
            << csvField(IO::TextUtils::utf8Prefix(error.content_preview, kCsvPreviewLength)) << "\r\n";
    }
}

void ValidationReport::exportErrorsCsv(const std::string& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open error export file: " + path);
    }
    exportErrorsCsv(file);
    if (!file) {
        throw std::runtime_error("Failed to write error export file: " + path);
    }
}

void ValidationReport::saveReport(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open report file: " + path);
    }
    file << generateText();
    if (!file) {
        throw std::runtime_error("Failed to write report file: " + path);
    }
}

void ValidationReport::saveJson(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON report file: " + path);
    }
    file << toJson() << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write JSON report file: " + path);
    }
}

} // namespace Validation
} // namespace FP
