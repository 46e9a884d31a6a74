#include "typo/util/utf8.hpp"

namespace typo::util {

// - No logging in hot path
// - Invalid sequences replaced with U+FFFD, one byte at a time, so byte
//   offsets of the following characters stay exact
DecodedChar decode_one(std::string_view data, size_t pos) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data()) + pos;
    const uint8_t* end = reinterpret_cast<const uint8_t*>(data.data()) + data.size();

    if (*p < 0x80) {
        // ASCII fast path
        return {*p, pos, 1};
    }

    if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
        // 2-byte sequence
        uint8_t b1 = p[0];
        uint8_t b2 = p[1];
        if ((b2 & 0xC0) == 0x80) {
            CodePoint cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
            if (cp >= 0x80) return {cp, pos, 2};
        }
    } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
        // 3-byte sequence
        uint8_t b1 = p[0];
        uint8_t b2 = p[1];
        uint8_t b3 = p[2];
        if ((b2 & 0xC0) == 0x80 && (b3 & 0xC0) == 0x80) {
            CodePoint cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
            if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) return {cp, pos, 3};
        }
    } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
        // 4-byte sequence
        uint8_t b1 = p[0];
        uint8_t b2 = p[1];
        uint8_t b3 = p[2];
        uint8_t b4 = p[3];
        if ((b2 & 0xC0) == 0x80 && (b3 & 0xC0) == 0x80 && (b4 & 0xC0) == 0x80) {
            CodePoint cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
            if (cp >= 0x10000 && cp <= constants::MAX_CODEPOINT) return {cp, pos, 4};
        }
    }

    // Invalid start byte, bad continuation, overlong form or insufficient bytes
    return {constants::REPLACEMENT_CHAR, pos, 1};
}

std::vector<CodePoint> decode_utf8(std::string_view data) {
    std::vector<CodePoint> codepoints;
    codepoints.reserve(data.size());

    size_t pos = 0;
    while (pos < data.size()) {
        DecodedChar c = decode_one(data, pos);
        codepoints.push_back(c.cp);
        pos += c.length;
    }

    return codepoints;
}

std::vector<DecodedChar> decode_utf8_indexed(std::string_view data) {
    std::vector<DecodedChar> chars;
    chars.reserve(data.size());

    size_t pos = 0;
    while (pos < data.size()) {
        DecodedChar c = decode_one(data, pos);
        chars.push_back(c);
        pos += c.length;
    }

    return chars;
}

std::string encode_utf8(CodePoint cp) {
    std::string result;
    if (cp > constants::MAX_CODEPOINT || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = constants::REPLACEMENT_CHAR;
    }
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

} // namespace typo::util
