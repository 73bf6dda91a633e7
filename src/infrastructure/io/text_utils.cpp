// EN: TextUtils implementation
// FR: Implémentation de TextUtils

#include "infrastructure/io/text_utils.hpp"

#include <cstdint>

namespace FP {
namespace IO {
namespace TextUtils {

namespace {

// EN: Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when it is invalid.
// FR: Longueur de la séquence UTF-8 bien formée commençant à `pos`, ou 0 si elle est invalide.
size_t validSequenceLength(std::string_view input, size_t pos) {
    const auto byte = [&](size_t i) { return static_cast<uint8_t>(input[i]); };
    uint8_t lead = byte(pos);
    size_t remaining = input.size() - pos;

    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    uint8_t min_second = 0x80;
    uint8_t max_second = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;   // EN: overlong / FR: surlong
        if (lead == 0xED) max_second = 0x9F;   // EN: surrogates / FR: substituts
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;
        if (lead == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }

    uint8_t second = byte(pos + 1);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        uint8_t continuation = byte(pos + i);
        if (continuation < 0x80 || continuation > 0xBF) {
            return 0;
        }
    }
    return length;
}

bool isTrimmable(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string sanitizeUtf8(std::string_view input) {
    std::string output;
    output.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        size_t length = validSequenceLength(input, pos);
        if (length == 0) {
            output.append(kReplacementCharacter);
            ++pos;
        } else {
            output.append(input.substr(pos, length));
            pos += length;
        }
    }
    return output;
}

bool isValidUtf8(std::string_view input) {
    size_t pos = 0;
    while (pos < input.size()) {
        size_t length = validSequenceLength(input, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::string utf8Prefix(std::string_view input, size_t max_code_points) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < input.size() && count < max_code_points) {
        size_t length = validSequenceLength(input, pos);
        pos += length == 0 ? 1 : length;
        ++count;
    }
    return std::string(input.substr(0, pos));
}

size_t utf8Length(std::string_view input) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < input.size()) {
        size_t length = validSequenceLength(input, pos);
        pos += length == 0 ? 1 : length;
        ++count;
    }
    return count;
}

std::string_view trim(std::string_view input) {
    size_t start = 0;
    while (start < input.size() && isTrimmable(input[start])) {
        ++start;
    }
    size_t end = input.size();
    while (end > start && isTrimmable(input[end - 1])) {
        --end;
    }
    return input.substr(start, end - start);
}

} // namespace TextUtils
} // namespace IO
} // namespace FP
