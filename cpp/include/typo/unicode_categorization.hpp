#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "typo/types.hpp"

namespace typo {

enum class CharCategory : uint8_t {
    LetterUpper,
    LetterLower,
    LetterOther,
    Mark,
    Number,
    Space,
    Punctuation,
    Symbol,
    Control,
    Format,
    Other
};

/**
 * Unicode categorization utilities
 *
 * Covers ASCII and Latin-1 exactly, and the Latin, Greek, Cyrillic,
 * Armenian, Hebrew, Arabic, Devanagari, CJK, Kana and Hangul blocks at
 * block granularity, plus the digits, punctuation and symbols of most
 * other scripts. Any other valid code point is LetterOther; noncharacters
 * and values past U+10FFFF are Other.
 */
class UnicodeCategorizer {
public:
    static CharCategory categorize(CodePoint codepoint) noexcept;

    static bool is_letter(CodePoint codepoint) noexcept;

    // White space in the broad sense: Zs/Zl/Zp plus \t \n \v \f \r and NEL
    static bool is_space(CodePoint codepoint) noexcept;

    // General category P*. '<' and '>' are math symbols, not punctuation.
    static bool is_punct(CodePoint codepoint) noexcept;

    // Simple one-to-one lower-case mapping; unmapped code points are returned unchanged
    static CodePoint to_lower(CodePoint codepoint) noexcept;

private:
    struct UnicodeBlock {
        CodePoint start;
        CodePoint end;
        CharCategory category;
    };

    struct CaseRange {
        CodePoint start;
        CodePoint end;
        int32_t delta;
        uint8_t stride;
    };

    // Sorted, non-overlapping; searched by bisection
    static const UnicodeBlock unicode_blocks[];
    static const size_t num_unicode_blocks;
    static const CaseRange lower_ranges[];
    static const size_t num_lower_ranges;
};

// Lower-case a UTF-8 string. Bytes that do not decode are copied through.
std::string to_lower_utf8(std::string_view text);

// True if any code point of the UTF-8 text is a letter
bool has_letter(std::string_view text);

} // namespace typo
