// EN: QuotedLineTokenizer implementation
// FR: Implémentation de QuotedLineTokenizer

#include "validation/quoted_line_tokenizer.hpp"

namespace FP {
namespace Validation {

namespace {

// EN: Per-line scan state, threaded through a single pass and discarded afterwards
// FR: État de parcours par ligne, transmis au fil d'une passe puis abandonné
struct ScanState {
    bool in_quotes{false};
    char quote_char{'\0'};
};

bool isUnescapedQuote(std::string_view line, size_t i) {
    return QuotedLineTokenizer::isQuoteCharacter(line[i]) && (i == 0 || line[i - 1] != '\\');
}

size_t countOccurrences(std::string_view text, std::string_view needle) {
    size_t count = 0;
    size_t pos = text.find(needle);
    while (pos != std::string_view::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

} // namespace

size_t QuotedLineTokenizer::countDelimiters(std::string_view line, char delimiter) {
    ScanState state;
    size_t count = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (isUnescapedQuote(line, i)) {
            if (!state.in_quotes) {
                state.in_quotes = true;
                state.quote_char = c;
            } else if (c == state.quote_char) {
                state.in_quotes = false;
                state.quote_char = '\0';
            }
        } else if (c == delimiter && !state.in_quotes) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> QuotedLineTokenizer::splitFields(std::string_view line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    ScanState state;

    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if (isUnescapedQuote(line, i)) {
            if (!state.in_quotes) {
                state.in_quotes = true;
                state.quote_char = c;
            } else if (c == state.quote_char) {
                // EN: Doubled quote inside a span is an escaped literal
                // FR: Une quote doublée dans une zone est un littéral échappé
                if (i + 1 < line.size() && line[i + 1] == state.quote_char) {
                    current.push_back(c);
                    ++i;
                } else {
                    state.in_quotes = false;
                    state.quote_char = '\0';
                }
            } else {
                current.push_back(c);
            }
        } else if (c == delimiter && !state.in_quotes) {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
        ++i;
    }

    fields.push_back(std::move(current));
    return fields;
}

QuoteBalance QuotedLineTokenizer::quoteBalance(std::string_view line) {
    QuoteBalance balance;
    balance.double_quotes = static_cast<long>(countOccurrences(line, "\"")) -
                            static_cast<long>(countOccurrences(line, "\\\""));
    balance.single_quotes = static_cast<long>(countOccurrences(line, "'")) -
                            static_cast<long>(countOccurrences(line, "\\'"));
    return balance;
}

} // namespace Validation
} // namespace FP
