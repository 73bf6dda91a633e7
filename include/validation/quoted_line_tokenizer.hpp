// EN: Quote-aware scanning primitive for one line of delimited text
// FR: Primitive de parcours sensible aux quotes pour une ligne de texte délimité

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace FP {
namespace Validation {

// EN: Quote balance of a line, escaped quotes (preceded by a backslash) excluded
// FR: Équilibre des quotes d'une ligne, quotes échappées (précédées d'un backslash) exclues
struct QuoteBalance {
    long double_quotes{0};   // EN: Count of `"` minus count of `\"` / FR: Nombre de `"` moins nombre de `\"`
    long single_quotes{0};   // EN: Count of `'` minus count of `\'` / FR: Nombre de `'` moins nombre de `\'`

    bool doubleQuotesUnbalanced() const { return double_quotes % 2 != 0; }
    bool singleQuotesUnbalanced() const { return single_quotes % 2 != 0; }
};

// EN: Stateless tokenizer. `"` and `'` both open a quoted span; only the opening character closes it.
//     A quote preceded by a backslash never toggles the quoted state.
// FR: Tokenizer sans état. `"` et `'` ouvrent tous deux une zone quotée ; seul le caractère ouvrant la ferme.
//     Une quote précédée d'un backslash ne bascule jamais l'état quoté.
class QuotedLineTokenizer {
public:
    // EN: Count mode - number of `delimiter` occurrences outside any quoted span
    // FR: Mode comptage - nombre d'occurrences de `delimiter` hors de toute zone quotée
    static size_t countDelimiters(std::string_view line, char delimiter);

    // EN: Split mode - fields split at unquoted delimiters. A doubled closing quote is kept as one literal quote.
    // FR: Mode découpage - champs séparés aux délimiteurs non quotés. Une quote fermante doublée devient une quote littérale.
    static std::vector<std::string> splitFields(std::string_view line, char delimiter);

    // EN: Column count implied by the count mode (delimiters + 1)
    // FR: Nombre de colonnes déduit du mode comptage (délimiteurs + 1)
    static size_t countColumns(std::string_view line, char delimiter) {
        return countDelimiters(line, delimiter) + 1;
    }

    static QuoteBalance quoteBalance(std::string_view line);

    static bool isQuoteCharacter(char c) { return c == '"' || c == '\''; }
};

} // namespace Validation
} // namespace FP
