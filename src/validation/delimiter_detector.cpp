// EN: DelimiterDetector implementation - consistency scoring over the candidate set
// FR: Implémentation de DelimiterDetector - score de cohérence sur l'ensemble des candidats

#include "validation/delimiter_detector.hpp"
#include "validation/quoted_line_tokenizer.hpp"
#include "infrastructure/io/text_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <stdexcept>

namespace FP {
namespace Validation {

DelimiterDetector::DelimiterDetector(size_t detection_lines) : detection_lines_(detection_lines) {
    if (detection_lines_ == 0) {
        throw std::invalid_argument("Delimiter detection needs at least one sample line");
    }
}

char DelimiterDetector::detect(const std::vector<std::string>& sample, std::optional<char> override) const {
    if (override) {
        return *override;
    }

    char best_delimiter = kFallbackDelimiter;
    double best_score = -1.0;

    for (const auto& profile : buildProfiles(sample)) {
        auto candidate_score = score(profile);
        // EN: Strict comparison keeps the earlier candidate on ties
        // FR: La comparaison stricte garde le candidat le plus prioritaire en cas d'égalité
        if (candidate_score && *candidate_score > best_score) {
            best_score = *candidate_score;
            best_delimiter = profile.delimiter;
        }
    }

    return best_delimiter;
}

std::vector<DelimiterProfile> DelimiterDetector::buildProfiles(const std::vector<std::string>& sample) const {
    std::vector<DelimiterProfile> profiles;
    profiles.reserve(kCandidates.size());
    for (char candidate : kCandidates) {
        profiles.push_back(DelimiterProfile{candidate, {}});
    }

    size_t scored_lines = 0;
    for (const auto& raw_line : sample) {
        if (scored_lines >= detection_lines_) {
            break;
        }
        auto line = IO::TextUtils::trim(raw_line);
        if (line.empty()) {
            continue;
        }
        ++scored_lines;

        for (auto& profile : profiles) {
            profile.counts.push_back(QuotedLineTokenizer::countDelimiters(line, profile.delimiter));
        }
    }

    return profiles;
}

std::optional<double> DelimiterDetector::score(const DelimiterProfile& profile) {
    const auto& counts = profile.counts;
    if (counts.empty() || std::all_of(counts.begin(), counts.end(), [](size_t c) { return c == 0; })) {
        return std::nullopt;
    }

    std::set<size_t> distinct(counts.begin(), counts.end());

    // EN: Perfect consistency dominates any partially consistent candidate
    // FR: Une cohérence parfaite domine tout candidat partiellement cohérent
    if (distinct.size() == 1) {
        return static_cast<double>(counts.front()) * 100.0;
    }

    if (distinct.size() > 3) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t c : counts) {
        sum += static_cast<double>(c);
    }
    double avg = sum / static_cast<double>(counts.size());

    double variance = 0.0;
    for (size_t c : counts) {
        double diff = static_cast<double>(c) - avg;
        variance += diff * diff;
    }
    variance /= static_cast<double>(counts.size());

    if (avg <= 0.0) {
        return std::nullopt;
    }
    return avg / (1.0 + variance);
}

std::string DelimiterDetector::describe(char delimiter) {
    switch (delimiter) {
        case '\t': return "\\t";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\\': return "\\\\";
        default: break;
    }

    auto byte = static_cast<unsigned char>(delimiter);
    if (byte < 0x20 || byte == 0x7F) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\x%02x", byte);
        return buffer;
    }
    return std::string(1, delimiter);
}

} // namespace Validation
} // namespace FP
