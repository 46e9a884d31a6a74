#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "typo/types.hpp"

namespace typo::util {

// A decoded code point and the bytes it occupied in the source.
struct DecodedChar {
    CodePoint cp;
    size_t offset;   // Byte index of the first byte
    size_t length;   // Bytes consumed (1 for an invalid byte)
};

// Decode one code point starting at data[pos]. Invalid or truncated
// sequences yield U+FFFD and consume a single byte.
DecodedChar decode_one(std::string_view data, size_t pos);

// Decode UTF-8 bytes to Unicode codepoints
std::vector<CodePoint> decode_utf8(std::string_view data);

// Decode UTF-8 keeping the byte position of every code point
std::vector<DecodedChar> decode_utf8_indexed(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(CodePoint codepoint);

} // namespace typo::util
