// EN: Text helpers for permissive line decoding - UTF-8 repair, code point truncation, trimming
// FR: Assistants texte pour un décodage permissif des lignes - réparation UTF-8, troncature par point de code, trim

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace FP {
namespace IO {
namespace TextUtils {

// EN: Replacement character emitted for every invalid byte sequence (U+FFFD)
// FR: Caractère de remplacement émis pour chaque séquence d'octets invalide (U+FFFD)
inline constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

// EN: Copy of `input` where each invalid UTF-8 sequence is replaced by U+FFFD
// FR: Copie de `input` où chaque séquence UTF-8 invalide est remplacée par U+FFFD
std::string sanitizeUtf8(std::string_view input);

// EN: True when `input` is already well-formed UTF-8
// FR: Vrai quand `input` est déjà de l'UTF-8 bien formé
bool isValidUtf8(std::string_view input);

// EN: Leading part of a well-formed UTF-8 string holding at most `max_code_points` code points
// FR: Début d'une chaîne UTF-8 bien formée contenant au plus `max_code_points` points de code
std::string utf8Prefix(std::string_view input, size_t max_code_points);

// EN: Number of code points in a well-formed UTF-8 string
// FR: Nombre de points de code dans une chaîne UTF-8 bien formée
size_t utf8Length(std::string_view input);

// EN: Strip space, \t, \n, \r, \f and \v from both ends
// FR: Retire espace, \t, \n, \r, \f et \v aux deux extrémités
std::string_view trim(std::string_view input);

} // namespace TextUtils
} // namespace IO
} // namespace FP
