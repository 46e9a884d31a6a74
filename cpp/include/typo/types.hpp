#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace typo {

// Unicode scalar value
using CodePoint = uint32_t;

namespace constants {
    constexpr CodePoint MAX_CODEPOINT = 0x10FFFF;
    constexpr CodePoint REPLACEMENT_CHAR = 0xFFFD;

    // Word boundary markers. Both lie outside the Unicode range so they
    // never collide with a character of the text.
    constexpr CodePoint WORD_START = 0x110000;
    constexpr CodePoint WORD_END = 0x110001;
}

using Digram = std::array<CodePoint, 2>;
using Trigram = std::array<CodePoint, 3>;

struct DigramHasher {
    size_t operator()(const Digram& d) const noexcept {
        uint64_t h = (static_cast<uint64_t>(d[0]) << 32) | d[1];
        return static_cast<size_t>(h * 0x9e3779b97f4a7c15ULL);
    }
};

struct TrigramHasher {
    size_t operator()(const Trigram& t) const noexcept {
        uint64_t h1 = (static_cast<uint64_t>(t[0]) << 32) | t[1];
        uint64_t h2 = t[2];
        return static_cast<size_t>(h1 ^ (h2 * 0x9e3779b97f4a7c15ULL) ^ (h1 >> 29));
    }
};

// One token of the corpus with its source location.
struct Word {
    std::string text;    // Original UTF-8 text
    std::string lower;   // Lower-cased once at creation
    std::string file;
    int line = 0;        // 1-based
    int byte = 0;        // 1-based offset of the first retained byte in the line
    int score = 0;       // Peculiarity; 0 until scored

    // "file:line:byte"
    std::string location() const {
        return file + ":" + std::to_string(line) + ":" + std::to_string(byte);
    }
};

} // namespace typo
