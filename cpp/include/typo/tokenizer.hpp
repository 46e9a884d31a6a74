#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "typo/types.hpp"

namespace typo {

/**
 * Splits text into candidate words.
 *
 * Tokens are white-space separated runs. Leading and trailing punctuation
 * is trimmed and, when HTML filtering is on, so are tags glued to either
 * end ("<em>word</em>,"). Tokens without a letter are dropped. The byte
 * offset of every Word points at its first retained byte.
 */
class Tokenizer {
public:
    explicit Tokenizer(bool filter_html = false) : filter_html_(filter_html) {}

    // Tokenize a single line (no terminator). line_num is 1-based.
    void tokenize_line(std::string_view line, const std::string& file, int line_num,
                       std::vector<Word>& out) const;

    // Tokenize a whole stream. A UTF-8 byte-order mark at the very start is
    // skipped. Throws IOError if the stream fails mid-read.
    void tokenize(std::istream& in, const std::string& file, std::vector<Word>& out) const;

    std::vector<Word> tokenize(std::istream& in, const std::string& file) const {
        std::vector<Word> out;
        tokenize(in, file, out);
        return out;
    }

    // Apply trimming to one raw token. Advances byte past anything removed
    // from the front. Returns false if the token must be discarded.
    bool clean_token(std::string_view& text, int& byte) const;

    // Byte length of all tags at the start of text. A tag runs from '<'
    // to the first '>'.
    static size_t leading_html_len(std::string_view text);

    // Byte length of all tags at the end of text.
    static size_t trailing_html_len(std::string_view text);

    // Byte length of the punctuation prefix
    static size_t leading_punct_len(std::string_view text);

    // Byte length of the punctuation suffix
    static size_t trailing_punct_len(std::string_view text);

private:
    // Tokenize line starting at byte pos; offsets stay relative to the line.
    void scan_line(std::string_view line, size_t pos, const std::string& file, int line_num,
                   std::vector<Word>& out) const;

    void add_word(std::string_view text, const std::string& file, int line_num, int byte,
                  std::vector<Word>& out) const;

    bool filter_html_;
};

} // namespace typo
