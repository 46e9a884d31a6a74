#include "typo/unicode_categorization.hpp"
#include "typo/util/utf8.hpp"

namespace typo {

using C = CharCategory;

const UnicodeCategorizer::UnicodeBlock UnicodeCategorizer::unicode_blocks[] = {
    {0x0000, 0x0008, C::Control},
    {0x0009, 0x000D, C::Space},       // \t \n \v \f \r
    {0x000E, 0x001F, C::Control},
    {0x0020, 0x0020, C::Space},
    {0x0021, 0x0023, C::Punctuation}, // ! " #
    {0x0024, 0x0024, C::Symbol},      // $
    {0x0025, 0x002A, C::Punctuation}, // % & ' ( ) *
    {0x002B, 0x002B, C::Symbol},      // +
    {0x002C, 0x002F, C::Punctuation}, // , - . /
    {0x0030, 0x0039, C::Number},
    {0x003A, 0x003B, C::Punctuation}, // : ;
    {0x003C, 0x003E, C::Symbol},      // < = >
    {0x003F, 0x0040, C::Punctuation}, // ? @
    {0x0041, 0x005A, C::LetterUpper},
    {0x005B, 0x005D, C::Punctuation}, // [ \ ]
    {0x005E, 0x005E, C::Symbol},      // ^
    {0x005F, 0x005F, C::Punctuation}, // _
    {0x0060, 0x0060, C::Symbol},      // `
    {0x0061, 0x007A, C::LetterLower},
    {0x007B, 0x007B, C::Punctuation}, // {
    {0x007C, 0x007C, C::Symbol},      // |
    {0x007D, 0x007D, C::Punctuation}, // }
    {0x007E, 0x007E, C::Symbol},      // ~
    {0x007F, 0x0084, C::Control},
    {0x0085, 0x0085, C::Space},       // NEL
    {0x0086, 0x009F, C::Control},
    {0x00A0, 0x00A0, C::Space},
    {0x00A1, 0x00A1, C::Punctuation},
    {0x00A2, 0x00A6, C::Symbol},
    {0x00A7, 0x00A7, C::Punctuation},
    {0x00A8, 0x00A9, C::Symbol},
    {0x00AA, 0x00AA, C::LetterOther},
    {0x00AB, 0x00AB, C::Punctuation},
    {0x00AC, 0x00AC, C::Symbol},
    {0x00AD, 0x00AD, C::Format},
    {0x00AE, 0x00B1, C::Symbol},
    {0x00B2, 0x00B3, C::Number},
    {0x00B4, 0x00B4, C::Symbol},
    {0x00B5, 0x00B5, C::LetterLower},
    {0x00B6, 0x00B7, C::Punctuation},
    {0x00B8, 0x00B8, C::Symbol},
    {0x00B9, 0x00B9, C::Number},
    {0x00BA, 0x00BA, C::LetterOther},
    {0x00BB, 0x00BB, C::Punctuation},
    {0x00BC, 0x00BE, C::Number},
    {0x00BF, 0x00BF, C::Punctuation},
    {0x00C0, 0x00D6, C::LetterUpper},
    {0x00D7, 0x00D7, C::Symbol},
    {0x00D8, 0x00DE, C::LetterUpper},
    {0x00DF, 0x00F6, C::LetterLower},
    {0x00F7, 0x00F7, C::Symbol},
    {0x00F8, 0x00FF, C::LetterLower},
    {0x0100, 0x02FF, C::LetterOther}, // Latin Extended-A/B, IPA, modifiers
    {0x0300, 0x036F, C::Mark},
    {0x0370, 0x0373, C::LetterOther},
    {0x0374, 0x0375, C::Symbol},
    {0x0376, 0x037D, C::LetterOther},
    {0x037E, 0x037E, C::Punctuation}, // Greek question mark
    {0x037F, 0x037F, C::LetterOther},
    {0x0384, 0x0385, C::Symbol},
    {0x0386, 0x0386, C::LetterUpper},
    {0x0387, 0x0387, C::Punctuation},
    {0x0388, 0x038A, C::LetterUpper},
    {0x038C, 0x038C, C::LetterUpper},
    {0x038E, 0x038F, C::LetterUpper},
    {0x0390, 0x0390, C::LetterLower},
    {0x0391, 0x03A1, C::LetterUpper},
    {0x03A3, 0x03AB, C::LetterUpper},
    {0x03AC, 0x03CE, C::LetterLower},
    {0x03CF, 0x03FF, C::LetterOther},
    {0x0400, 0x042F, C::LetterUpper},
    {0x0430, 0x045F, C::LetterLower},
    {0x0460, 0x0481, C::LetterOther},
    {0x0482, 0x0482, C::Symbol},
    {0x0483, 0x0489, C::Mark},
    {0x048A, 0x052F, C::LetterOther},
    {0x0531, 0x0556, C::LetterUpper},
    {0x0559, 0x0559, C::LetterOther},
    {0x055A, 0x055F, C::Punctuation},
    {0x0560, 0x0588, C::LetterLower},
    {0x0589, 0x058A, C::Punctuation},
    {0x0591, 0x05BD, C::Mark},
    {0x05BE, 0x05BE, C::Punctuation},
    {0x05BF, 0x05BF, C::Mark},
    {0x05C0, 0x05C0, C::Punctuation},
    {0x05C1, 0x05C2, C::Mark},
    {0x05C3, 0x05C3, C::Punctuation},
    {0x05C4, 0x05C5, C::Mark},
    {0x05C6, 0x05C6, C::Punctuation},
    {0x05C7, 0x05C7, C::Mark},
    {0x05D0, 0x05EA, C::LetterOther},
    {0x05EF, 0x05F2, C::LetterOther},
    {0x05F3, 0x05F4, C::Punctuation},
    {0x0609, 0x060A, C::Punctuation},
    {0x060C, 0x060D, C::Punctuation},
    {0x061B, 0x061B, C::Punctuation},
    {0x061D, 0x061F, C::Punctuation},
    {0x0620, 0x064A, C::LetterOther},
    {0x064B, 0x065F, C::Mark},
    {0x0660, 0x0669, C::Number},
    {0x066A, 0x066D, C::Punctuation},
    {0x066E, 0x066F, C::LetterOther},
    {0x0670, 0x0670, C::Mark},
    {0x0671, 0x06D3, C::LetterOther},
    {0x06D4, 0x06D4, C::Punctuation},
    {0x06D5, 0x06D5, C::LetterOther},
    {0x06F0, 0x06F9, C::Number},
    {0x0700, 0x070D, C::Punctuation},
    {0x07C0, 0x07C9, C::Number},
    {0x07F7, 0x07F9, C::Punctuation},
    {0x0830, 0x083E, C::Punctuation},
    {0x085E, 0x085E, C::Punctuation},
    {0x0900, 0x0903, C::Mark},
    {0x0904, 0x0939, C::LetterOther},
    {0x093A, 0x094F, C::Mark},
    {0x0950, 0x0950, C::LetterOther},
    {0x0951, 0x0957, C::Mark},
    {0x0958, 0x0961, C::LetterOther},
    {0x0962, 0x0963, C::Mark},
    {0x0964, 0x0965, C::Punctuation},
    {0x0966, 0x096F, C::Number},
    {0x0970, 0x0970, C::Punctuation},
    {0x09E6, 0x09EF, C::Number},      // Bengali digits
    {0x09F4, 0x09F9, C::Number},
    {0x09FD, 0x09FD, C::Punctuation},
    {0x0A66, 0x0A6F, C::Number},      // Gurmukhi digits
    {0x0A76, 0x0A76, C::Punctuation},
    {0x0AE6, 0x0AEF, C::Number},      // Gujarati digits
    {0x0AF0, 0x0AF0, C::Punctuation},
    {0x0B66, 0x0B6F, C::Number},      // Oriya digits
    {0x0B72, 0x0B77, C::Number},
    {0x0BE6, 0x0BF2, C::Number},      // Tamil digits and numbers
    {0x0BF3, 0x0BFA, C::Symbol},
    {0x0C66, 0x0C6F, C::Number},      // Telugu digits
    {0x0C77, 0x0C77, C::Punctuation},
    {0x0C78, 0x0C7E, C::Number},
    {0x0C84, 0x0C84, C::Punctuation},
    {0x0CE6, 0x0CEF, C::Number},      // Kannada digits
    {0x0D58, 0x0D5E, C::Number},
    {0x0D66, 0x0D78, C::Number},      // Malayalam digits and fractions
    {0x0DE6, 0x0DEF, C::Number},      // Sinhala digits
    {0x0DF4, 0x0DF4, C::Punctuation},
    {0x0E01, 0x0E30, C::LetterOther},
    {0x0E3F, 0x0E3F, C::Symbol},      // Baht
    {0x0E4F, 0x0E4F, C::Punctuation},
    {0x0E50, 0x0E59, C::Number},      // Thai digits
    {0x0E5A, 0x0E5B, C::Punctuation},
    {0x0ED0, 0x0ED9, C::Number},      // Lao digits
    {0x0F04, 0x0F12, C::Punctuation}, // Tibetan marks
    {0x0F14, 0x0F14, C::Punctuation},
    {0x0F20, 0x0F33, C::Number},
    {0x0F3A, 0x0F3D, C::Punctuation},
    {0x0F85, 0x0F85, C::Punctuation},
    {0x0FD0, 0x0FD4, C::Punctuation},
    {0x0FD9, 0x0FDA, C::Punctuation},
    {0x1040, 0x1049, C::Number},      // Myanmar digits
    {0x104A, 0x104F, C::Punctuation},
    {0x1090, 0x1099, C::Number},
    {0x10FB, 0x10FB, C::Punctuation}, // Georgian paragraph separator
    {0x1100, 0x11FF, C::LetterOther}, // Hangul Jamo
    {0x1360, 0x1368, C::Punctuation}, // Ethiopic wordspace, full stop, comma
    {0x1369, 0x137C, C::Number},
    {0x1400, 0x1400, C::Punctuation},
    {0x166E, 0x166E, C::Punctuation},
    {0x1680, 0x1680, C::Space},       // Ogham space mark
    {0x169B, 0x169C, C::Punctuation},
    {0x16EB, 0x16ED, C::Punctuation}, // Runic punctuation
    {0x16EE, 0x16F0, C::Number},
    {0x1735, 0x1736, C::Punctuation},
    {0x17D4, 0x17D6, C::Punctuation}, // Khmer
    {0x17D8, 0x17DA, C::Punctuation},
    {0x17E0, 0x17E9, C::Number},
    {0x17F0, 0x17F9, C::Number},
    {0x1800, 0x180A, C::Punctuation}, // Mongolian
    {0x180B, 0x180D, C::Mark},
    {0x180E, 0x180E, C::Format},
    {0x1810, 0x1819, C::Number},
    {0x1944, 0x1945, C::Punctuation},
    {0x1946, 0x194F, C::Number},
    {0x19D0, 0x19DA, C::Number},
    {0x1A1E, 0x1A1F, C::Punctuation},
    {0x1A80, 0x1A89, C::Number},
    {0x1A90, 0x1A99, C::Number},
    {0x1AA0, 0x1AA6, C::Punctuation},
    {0x1AA8, 0x1AAD, C::Punctuation},
    {0x1B50, 0x1B59, C::Number},
    {0x1B5A, 0x1B60, C::Punctuation},
    {0x1B7D, 0x1B7E, C::Punctuation},
    {0x1BB0, 0x1BB9, C::Number},
    {0x1BFC, 0x1BFF, C::Punctuation},
    {0x1C3B, 0x1C3F, C::Punctuation},
    {0x1C40, 0x1C49, C::Number},
    {0x1C50, 0x1C59, C::Number},
    {0x1C7E, 0x1C7F, C::Punctuation},
    {0x1CC0, 0x1CC7, C::Punctuation},
    {0x1CD3, 0x1CD3, C::Punctuation},
    {0x1E00, 0x1FFF, C::LetterOther}, // Latin Extended Additional, Greek Extended
    {0x2000, 0x200A, C::Space},
    {0x200B, 0x200F, C::Format},
    {0x2010, 0x2027, C::Punctuation},
    {0x2028, 0x2029, C::Space},       // Line/paragraph separators
    {0x202A, 0x202E, C::Format},
    {0x202F, 0x202F, C::Space},
    {0x2030, 0x2043, C::Punctuation},
    {0x2044, 0x2044, C::Symbol},      // Fraction slash
    {0x2045, 0x2051, C::Punctuation},
    {0x2052, 0x2052, C::Symbol},
    {0x2053, 0x205E, C::Punctuation},
    {0x205F, 0x205F, C::Space},
    {0x2060, 0x206F, C::Format},
    {0x2070, 0x2070, C::Number},      // Superscripts and subscripts
    {0x2074, 0x2079, C::Number},
    {0x207A, 0x207C, C::Symbol},
    {0x207D, 0x207E, C::Punctuation},
    {0x2080, 0x2089, C::Number},
    {0x208A, 0x208C, C::Symbol},
    {0x208D, 0x208E, C::Punctuation},
    {0x20A0, 0x20C0, C::Symbol},      // Currency
    {0x20D0, 0x20FF, C::Mark},
    {0x2150, 0x2182, C::Number},      // Fractions and Roman numerals
    {0x2185, 0x2189, C::Number},
    {0x2190, 0x23FF, C::Symbol},
    {0x2400, 0x245F, C::Symbol},
    {0x2460, 0x24FF, C::Number},
    {0x2500, 0x27BF, C::Symbol},
    {0x27C0, 0x27FF, C::Symbol},
    {0x2900, 0x2BFF, C::Symbol},
    {0x2CF9, 0x2CFC, C::Punctuation},
    {0x2CFD, 0x2CFD, C::Number},
    {0x2CFE, 0x2CFF, C::Punctuation},
    {0x2D70, 0x2D70, C::Punctuation},
    {0x2E00, 0x2E5D, C::Punctuation},
    {0x2E80, 0x2FDF, C::Symbol},      // CJK and Kangxi radicals
    {0x2FF0, 0x2FFF, C::Symbol},
    {0x3000, 0x3000, C::Space},
    {0x3001, 0x3003, C::Punctuation},
    {0x3004, 0x3004, C::Symbol},
    {0x3005, 0x3007, C::LetterOther},
    {0x3008, 0x3011, C::Punctuation},
    {0x3012, 0x3013, C::Symbol},
    {0x3014, 0x301F, C::Punctuation},
    {0x3020, 0x3020, C::Symbol},
    {0x3021, 0x3029, C::Number},      // Hangzhou numerals
    {0x302A, 0x302F, C::Mark},
    {0x3030, 0x3030, C::Punctuation},
    {0x3036, 0x3037, C::Symbol},
    {0x303D, 0x303D, C::Punctuation},
    {0x303E, 0x303F, C::Symbol},
    {0x3041, 0x3096, C::LetterOther}, // Hiragana
    {0x3099, 0x309A, C::Mark},
    {0x309D, 0x309F, C::LetterOther},
    {0x30A0, 0x30A0, C::Punctuation},
    {0x30A1, 0x30FA, C::LetterOther}, // Katakana
    {0x30FB, 0x30FB, C::Punctuation},
    {0x30FC, 0x30FF, C::LetterOther},
    {0x3190, 0x319F, C::Symbol},
    {0x31C0, 0x31E3, C::Symbol},      // CJK strokes
    {0x3200, 0x33FF, C::Symbol},      // Enclosed CJK, compatibility
    {0x3400, 0x4DBF, C::LetterOther}, // CJK Extension A
    {0x4E00, 0x9FFF, C::LetterOther}, // CJK Unified Ideographs
    {0xA490, 0xA4C6, C::Symbol},      // Yi radicals
    {0xA4FE, 0xA4FF, C::Punctuation},
    {0xA60D, 0xA60F, C::Punctuation},
    {0xA620, 0xA629, C::Number},
    {0xA673, 0xA673, C::Punctuation},
    {0xA67E, 0xA67E, C::Punctuation},
    {0xA6E6, 0xA6EF, C::Number},
    {0xA6F2, 0xA6F7, C::Punctuation},
    {0xA830, 0xA835, C::Number},
    {0xA874, 0xA877, C::Punctuation},
    {0xA8CE, 0xA8CF, C::Punctuation},
    {0xA8D0, 0xA8D9, C::Number},
    {0xA8F8, 0xA8FA, C::Punctuation},
    {0xA8FC, 0xA8FC, C::Punctuation},
    {0xA900, 0xA909, C::Number},
    {0xA92E, 0xA92F, C::Punctuation},
    {0xA95F, 0xA95F, C::Punctuation},
    {0xA9C1, 0xA9CD, C::Punctuation},
    {0xA9D0, 0xA9D9, C::Number},
    {0xA9DE, 0xA9DF, C::Punctuation},
    {0xA9F0, 0xA9F9, C::Number},
    {0xAA50, 0xAA59, C::Number},
    {0xAA5C, 0xAA5F, C::Punctuation},
    {0xAADE, 0xAADF, C::Punctuation},
    {0xAAF0, 0xAAF1, C::Punctuation},
    {0xABEB, 0xABEB, C::Punctuation},
    {0xABF0, 0xABF9, C::Number},
    {0xAC00, 0xD7A3, C::LetterOther}, // Hangul syllables
    {0xD800, 0xDFFF, C::Other},       // Surrogates
    {0xE000, 0xF8FF, C::Other},       // Private use
    {0xFD3E, 0xFD3F, C::Punctuation},
    {0xFE00, 0xFE0F, C::Mark},        // Variation selectors
    {0xFE10, 0xFE19, C::Punctuation},
    {0xFE20, 0xFE2F, C::Mark},
    {0xFE30, 0xFE4F, C::Punctuation},
    {0xFE50, 0xFE6B, C::Punctuation},
    {0xFEFF, 0xFEFF, C::Format},      // BOM / ZWNBSP
    {0xFF01, 0xFF03, C::Punctuation},
    {0xFF04, 0xFF04, C::Symbol},
    {0xFF05, 0xFF0A, C::Punctuation},
    {0xFF0B, 0xFF0B, C::Symbol},
    {0xFF0C, 0xFF0F, C::Punctuation},
    {0xFF10, 0xFF19, C::Number},
    {0xFF1A, 0xFF1B, C::Punctuation},
    {0xFF1C, 0xFF1E, C::Symbol},
    {0xFF1F, 0xFF20, C::Punctuation},
    {0xFF21, 0xFF3A, C::LetterUpper},
    {0xFF3B, 0xFF3D, C::Punctuation},
    {0xFF3E, 0xFF3E, C::Symbol},
    {0xFF3F, 0xFF3F, C::Punctuation},
    {0xFF40, 0xFF40, C::Symbol},
    {0xFF41, 0xFF5A, C::LetterLower},
    {0xFF5B, 0xFF5B, C::Punctuation},
    {0xFF5C, 0xFF5C, C::Symbol},
    {0xFF5D, 0xFF5D, C::Punctuation},
    {0xFF5E, 0xFF5E, C::Symbol},
    {0xFF5F, 0xFF65, C::Punctuation},
    {0xFF66, 0xFF9F, C::LetterOther},
    {0xFFE0, 0xFFEE, C::Symbol},
    {0xFFF9, 0xFFFB, C::Format},
    {0xFFFC, 0xFFFD, C::Symbol},
    {0x1D000, 0x1D24F, C::Symbol},    // Musical symbols
    {0x1F000, 0x1FAFF, C::Symbol},    // Game symbols, emoji and pictographs
    {0x20000, 0x2A6DF, C::LetterOther},
    {0xE0000, 0xE007F, C::Format},    // Tags
    {0xE0100, 0xE01EF, C::Mark},
    {0xF0000, 0x10FFFF, C::Other},    // Supplementary private use
};

const size_t UnicodeCategorizer::num_unicode_blocks =
    sizeof(unicode_blocks) / sizeof(unicode_blocks[0]);

// Simple lower-case mappings: {first, last, delta, stride}. A stride of 2
// covers upper/lower pairs, where only every other code point is upper case.
const UnicodeCategorizer::CaseRange UnicodeCategorizer::lower_ranges[] = {
    {0x00C0, 0x00D6, 32, 1},            // Latin-1
    {0x00D8, 0x00DE, 32, 1},
    {0x0100, 0x012E, 1, 2},             // Latin Extended-A
    {0x0130, 0x0130, -199, 1},
    {0x0132, 0x0136, 1, 2},
    {0x0139, 0x0147, 1, 2},
    {0x014A, 0x0176, 1, 2},
    {0x0178, 0x0178, -121, 1},
    {0x0179, 0x017D, 1, 2},
    {0x0181, 0x0181, 210, 1},           // Latin Extended-B
    {0x0182, 0x0184, 1, 2},
    {0x0186, 0x0186, 206, 1},
    {0x0187, 0x0187, 1, 1},
    {0x0189, 0x018A, 205, 1},
    {0x018B, 0x018B, 1, 1},
    {0x018E, 0x018E, 79, 1},
    {0x018F, 0x018F, 202, 1},
    {0x0190, 0x0190, 203, 1},
    {0x0191, 0x0191, 1, 1},
    {0x0193, 0x0193, 205, 1},
    {0x0194, 0x0194, 207, 1},
    {0x0196, 0x0196, 211, 1},
    {0x0197, 0x0197, 209, 1},
    {0x0198, 0x0198, 1, 1},
    {0x019C, 0x019C, 211, 1},
    {0x019D, 0x019D, 213, 1},
    {0x019F, 0x019F, 214, 1},
    {0x01A0, 0x01A4, 1, 2},
    {0x01A6, 0x01A6, 218, 1},
    {0x01A7, 0x01A7, 1, 1},
    {0x01A9, 0x01A9, 218, 1},
    {0x01AC, 0x01AC, 1, 1},
    {0x01AE, 0x01AE, 218, 1},
    {0x01AF, 0x01AF, 1, 1},
    {0x01B1, 0x01B2, 217, 1},
    {0x01B3, 0x01B5, 1, 2},
    {0x01B7, 0x01B7, 219, 1},
    {0x01B8, 0x01B8, 1, 1},
    {0x01BC, 0x01BC, 1, 1},
    {0x01C4, 0x01C4, 2, 1},
    {0x01C5, 0x01C5, 1, 1},
    {0x01C7, 0x01C7, 2, 1},
    {0x01C8, 0x01C8, 1, 1},
    {0x01CA, 0x01CA, 2, 1},
    {0x01CB, 0x01DB, 1, 2},
    {0x01DE, 0x01EE, 1, 2},
    {0x01F1, 0x01F1, 2, 1},
    {0x01F2, 0x01F4, 1, 2},
    {0x01F6, 0x01F6, -97, 1},
    {0x01F7, 0x01F7, -56, 1},
    {0x01F8, 0x021E, 1, 2},
    {0x0220, 0x0220, -130, 1},
    {0x0222, 0x0232, 1, 2},
    {0x023A, 0x023A, 10795, 1},
    {0x023B, 0x023B, 1, 1},
    {0x023D, 0x023D, -163, 1},
    {0x023E, 0x023E, 10792, 1},
    {0x0241, 0x0241, 1, 1},
    {0x0243, 0x0243, -195, 1},
    {0x0244, 0x0244, 69, 1},
    {0x0245, 0x0245, 71, 1},
    {0x0246, 0x024E, 1, 2},
    {0x0370, 0x0372, 1, 2},             // Greek and Coptic
    {0x0376, 0x0376, 1, 1},
    {0x037F, 0x037F, 116, 1},
    {0x0386, 0x0386, 38, 1},
    {0x0388, 0x038A, 37, 1},
    {0x038C, 0x038C, 64, 1},
    {0x038E, 0x038F, 63, 1},
    {0x0391, 0x03A1, 32, 1},
    {0x03A3, 0x03AB, 32, 1},
    {0x03CF, 0x03CF, 8, 1},
    {0x03D8, 0x03EE, 1, 2},
    {0x03F4, 0x03F4, -60, 1},
    {0x03F7, 0x03F7, 1, 1},
    {0x03F9, 0x03F9, -7, 1},
    {0x03FA, 0x03FA, 1, 1},
    {0x03FD, 0x03FF, -130, 1},
    {0x0400, 0x040F, 80, 1},            // Cyrillic
    {0x0410, 0x042F, 32, 1},
    {0x0460, 0x0480, 1, 2},
    {0x048A, 0x04BE, 1, 2},
    {0x04C0, 0x04C0, 15, 1},
    {0x04C1, 0x04CD, 1, 2},
    {0x04D0, 0x052E, 1, 2},
    {0x0531, 0x0556, 48, 1},            // Armenian
    {0x10A0, 0x10C5, 7264, 1},          // Georgian
    {0x10C7, 0x10C7, 7264, 1},
    {0x10CD, 0x10CD, 7264, 1},
    {0x13A0, 0x13EF, 38864, 1},         // Cherokee
    {0x13F0, 0x13F5, 8, 1},
    {0x1C90, 0x1CBA, -3008, 1},         // Georgian Mtavruli
    {0x1CBD, 0x1CBF, -3008, 1},
    {0x1E00, 0x1E94, 1, 2},             // Latin Extended Additional
    {0x1E9E, 0x1E9E, -7615, 1},
    {0x1EA0, 0x1EFE, 1, 2},
    {0x1F08, 0x1F0F, -8, 1},            // Greek Extended
    {0x1F18, 0x1F1D, -8, 1},
    {0x1F28, 0x1F2F, -8, 1},
    {0x1F38, 0x1F3F, -8, 1},
    {0x1F48, 0x1F4D, -8, 1},
    {0x1F59, 0x1F5F, -8, 2},
    {0x1F68, 0x1F6F, -8, 1},
    {0x1F88, 0x1F8F, -8, 1},
    {0x1F98, 0x1F9F, -8, 1},
    {0x1FA8, 0x1FAF, -8, 1},
    {0x1FB8, 0x1FB9, -8, 1},
    {0x1FBA, 0x1FBB, -74, 1},
    {0x1FBC, 0x1FBC, -9, 1},
    {0x1FC8, 0x1FCB, -86, 1},
    {0x1FCC, 0x1FCC, -9, 1},
    {0x1FD8, 0x1FD9, -8, 1},
    {0x1FDA, 0x1FDB, -100, 1},
    {0x1FE8, 0x1FE9, -8, 1},
    {0x1FEA, 0x1FEB, -112, 1},
    {0x1FEC, 0x1FEC, -7, 1},
    {0x1FF8, 0x1FF9, -128, 1},
    {0x1FFA, 0x1FFB, -126, 1},
    {0x1FFC, 0x1FFC, -9, 1},
    {0x2126, 0x2126, -7517, 1},         // Letterlike symbols
    {0x212A, 0x212A, -8383, 1},
    {0x212B, 0x212B, -8262, 1},
    {0x2132, 0x2132, 28, 1},
    {0x2160, 0x216F, 16, 1},            // Roman numerals
    {0x2183, 0x2183, 1, 1},
    {0x24B6, 0x24CF, 26, 1},            // Circled letters
    {0x2C00, 0x2C2F, 48, 1},            // Glagolitic
    {0x2C60, 0x2C60, 1, 1},             // Latin Extended-C
    {0x2C62, 0x2C62, -10743, 1},
    {0x2C63, 0x2C63, -3814, 1},
    {0x2C64, 0x2C64, -10727, 1},
    {0x2C67, 0x2C6B, 1, 2},
    {0x2C6D, 0x2C6D, -10780, 1},
    {0x2C6E, 0x2C6E, -10749, 1},
    {0x2C6F, 0x2C6F, -10783, 1},
    {0x2C70, 0x2C70, -10782, 1},
    {0x2C72, 0x2C72, 1, 1},
    {0x2C75, 0x2C75, 1, 1},
    {0x2C7E, 0x2C7F, -10815, 1},
    {0x2C80, 0x2CE2, 1, 2},             // Coptic
    {0x2CEB, 0x2CED, 1, 2},
    {0x2CF2, 0x2CF2, 1, 1},
    {0xA640, 0xA66C, 1, 2},             // Cyrillic Extended-B
    {0xA680, 0xA69A, 1, 2},
    {0xA722, 0xA72E, 1, 2},             // Latin Extended-D
    {0xA732, 0xA76E, 1, 2},
    {0xA779, 0xA77B, 1, 2},
    {0xA77D, 0xA77D, -35332, 1},
    {0xA77E, 0xA786, 1, 2},
    {0xA78B, 0xA78B, 1, 1},
    {0xA78D, 0xA78D, -42280, 1},
    {0xA790, 0xA792, 1, 2},
    {0xA796, 0xA7A8, 1, 2},
    {0xA7AA, 0xA7AA, -42308, 1},
    {0xA7AB, 0xA7AB, -42319, 1},
    {0xA7AC, 0xA7AC, -42315, 1},
    {0xA7AD, 0xA7AD, -42305, 1},
    {0xA7AE, 0xA7AE, -42308, 1},
    {0xA7B0, 0xA7B0, -42258, 1},
    {0xA7B1, 0xA7B1, -42282, 1},
    {0xA7B2, 0xA7B2, -42261, 1},
    {0xA7B3, 0xA7B3, 928, 1},
    {0xA7B4, 0xA7C2, 1, 2},
    {0xA7C4, 0xA7C4, -48, 1},
    {0xA7C5, 0xA7C5, -42307, 1},
    {0xA7C6, 0xA7C6, -35384, 1},
    {0xA7C7, 0xA7C9, 1, 2},
    {0xA7D0, 0xA7D0, 1, 1},
    {0xA7D6, 0xA7D8, 1, 2},
    {0xA7F5, 0xA7F5, 1, 1},
    {0xFF21, 0xFF3A, 32, 1},            // Fullwidth Latin
    {0x10400, 0x10427, 40, 1},          // Deseret
    {0x104B0, 0x104D3, 40, 1},          // Osage
    {0x10570, 0x1057A, 39, 1},          // Vithkuqi
    {0x1057C, 0x1058A, 39, 1},
    {0x1058C, 0x10592, 39, 1},
    {0x10594, 0x10595, 39, 1},
    {0x10C80, 0x10CB2, 64, 1},          // Old Hungarian
    {0x118A0, 0x118BF, 32, 1},          // Warang Citi
    {0x16E40, 0x16E5F, 32, 1},          // Medefaidrin
    {0x1E900, 0x1E921, 34, 1},          // Adlam
};

const size_t UnicodeCategorizer::num_lower_ranges =
    sizeof(lower_ranges) / sizeof(lower_ranges[0]);

CharCategory UnicodeCategorizer::categorize(CodePoint codepoint) noexcept
{
    if (codepoint > constants::MAX_CODEPOINT || (codepoint & 0xFFFF) >= 0xFFFE) {
        return CharCategory::Other;
    }

    size_t lo = 0, hi = num_unicode_blocks;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (codepoint > unicode_blocks[mid].end) {
            lo = mid + 1;
        } else if (codepoint < unicode_blocks[mid].start) {
            hi = mid;
        } else {
            return unicode_blocks[mid].category;
        }
    }

    // Scripts not listed above are overwhelmingly letters
    return CharCategory::LetterOther;
}

bool UnicodeCategorizer::is_letter(CodePoint codepoint) noexcept
{
    CharCategory c = categorize(codepoint);
    return c == C::LetterUpper || c == C::LetterLower || c == C::LetterOther;
}

bool UnicodeCategorizer::is_space(CodePoint codepoint) noexcept
{
    return categorize(codepoint) == C::Space;
}

bool UnicodeCategorizer::is_punct(CodePoint codepoint) noexcept
{
    return categorize(codepoint) == C::Punctuation;
}

CodePoint UnicodeCategorizer::to_lower(CodePoint cp) noexcept
{
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
    }

    size_t lo = 0, hi = num_lower_ranges;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        const CaseRange& r = lower_ranges[mid];
        if (cp > r.end) {
            lo = mid + 1;
        } else if (cp < r.start) {
            hi = mid;
        } else {
            // Alternating runs map every other code point
            if ((cp - r.start) % r.stride != 0) return cp;
            return static_cast<CodePoint>(static_cast<int32_t>(cp) + r.delta);
        }
    }
    return cp;
}

std::string to_lower_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        util::DecodedChar c = util::decode_one(text, pos);
        CodePoint lower = UnicodeCategorizer::to_lower(c.cp);
        if (lower == c.cp) {
            out.append(text.substr(pos, c.length));
        } else {
            out += util::encode_utf8(lower);
        }
        pos += c.length;
    }
    return out;
}

bool has_letter(std::string_view text)
{
    size_t pos = 0;
    while (pos < text.size()) {
        util::DecodedChar c = util::decode_one(text, pos);
        if (UnicodeCategorizer::is_letter(c.cp)) return true;
        pos += c.length;
    }
    return false;
}

} // namespace typo
