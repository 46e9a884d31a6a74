#include "typo/tokenizer.hpp"
#include "typo/error.hpp"
#include "typo/unicode_categorization.hpp"
#include "typo/util/utf8.hpp"

#include <utility>

namespace typo {

size_t Tokenizer::leading_punct_len(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        util::DecodedChar c = util::decode_one(text, pos);
        if (!UnicodeCategorizer::is_punct(c.cp)) break;
        pos += c.length;
    }
    return pos;
}

size_t Tokenizer::trailing_punct_len(std::string_view text) {
    std::vector<util::DecodedChar> chars = util::decode_utf8_indexed(text);
    size_t keep = text.size();
    for (size_t i = chars.size(); i-- > 0;) {
        if (!UnicodeCategorizer::is_punct(chars[i].cp)) break;
        keep = chars[i].offset;
    }
    return text.size() - keep;
}

size_t Tokenizer::leading_html_len(std::string_view text) {
    size_t total = 0;
    while (!text.empty() && text[0] == '<') {
        size_t close = text.find('>');
        if (close == std::string_view::npos) break;
        total += close + 1;
        text.remove_prefix(close + 1);
    }
    return total;
}

size_t Tokenizer::trailing_html_len(std::string_view text) {
    size_t total = 0;
    while (!text.empty() && text.back() == '>') {
        size_t open = text.rfind('<');
        if (open == std::string_view::npos) break;
        total += text.size() - open;
        text = text.substr(0, open);
    }
    return total;
}

bool Tokenizer::clean_token(std::string_view& text, int& byte) const {
    // '<' is a symbol, not punctuation, so tags survive this first trim.
    size_t n = leading_punct_len(text);
    text.remove_prefix(n);
    byte += static_cast<int>(n);
    text.remove_suffix(trailing_punct_len(text));

    if (filter_html_) {
        // Easily defeated by spaces inside tags, but handles <code><em>foo</em></code>.
        n = leading_html_len(text);
        text.remove_prefix(n);
        byte += static_cast<int>(n);
        text.remove_suffix(trailing_html_len(text));
        if (text.empty()) {
            return false;
        }
        n = leading_punct_len(text);
        text.remove_prefix(n);
        byte += static_cast<int>(n);
        text.remove_suffix(trailing_punct_len(text));
    }

    return has_letter(text);
}

void Tokenizer::add_word(std::string_view text, const std::string& file, int line_num, int byte,
                         std::vector<Word>& out) const {
    if (!clean_token(text, byte)) {
        return;
    }

    Word word;
    word.text = std::string(text);
    word.lower = to_lower_utf8(text);
    word.file = file;
    word.line = line_num;
    word.byte = byte;
    out.push_back(std::move(word));
}

void Tokenizer::tokenize_line(std::string_view line, const std::string& file, int line_num,
                              std::vector<Word>& out) const {
    scan_line(line, 0, file, line_num, out);
}

void Tokenizer::scan_line(std::string_view line, size_t pos, const std::string& file, int line_num,
                          std::vector<Word>& out) const {
    bool in_word = false;
    size_t word_start = 0;

    while (pos < line.size()) {
        util::DecodedChar c = util::decode_one(line, pos);
        bool space = UnicodeCategorizer::is_space(c.cp);
        if (in_word && space) {
            add_word(line.substr(word_start, pos - word_start), file, line_num,
                     static_cast<int>(word_start) + 1, out);
            in_word = false;
        } else if (!in_word && !space) {
            in_word = true;
            word_start = pos;
        }
        pos += c.length;
    }
    if (in_word) {
        add_word(line.substr(word_start), file, line_num, static_cast<int>(word_start) + 1, out);
    }
}

void Tokenizer::tokenize(std::istream& in, const std::string& file, std::vector<Word>& out) const {
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        ++line_num;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Only a byte-order mark opening the stream is skipped; offsets
        // still count its bytes.
        size_t from = 0;
        if (line_num == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            from = 3;
        }
        scan_line(line, from, file, line_num, out);
    }

    if (in.bad()) {
        throw IOError(file, "read error", ErrorCode::READ_FAILED);
    }
}

} // namespace typo
