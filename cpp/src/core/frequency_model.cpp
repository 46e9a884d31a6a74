#include "typo/frequency_model.hpp"
#include "typo/util/utf8.hpp"

namespace typo {

using constants::WORD_START;
using constants::WORD_END;

std::vector<Digram> FrequencyModel::digrams_of(const std::vector<CodePoint>& runes) {
    std::vector<Digram> out;
    if (runes.empty()) return out;
    out.reserve(runes.size() + 1);

    Digram d = {WORD_START, WORD_START};
    for (CodePoint r : runes) {
        d[0] = d[1];
        d[1] = r;
        out.push_back(d);
    }
    d[0] = d[1];
    d[1] = WORD_END;
    out.push_back(d);
    return out;
}

std::vector<Trigram> FrequencyModel::trigrams_of(const std::vector<CodePoint>& runes) {
    std::vector<Trigram> out;
    if (runes.empty()) return out;
    out.reserve(runes.size() + 1);

    // Slide a window that starts as ^^ and ends with one trailing $, so a
    // one-letter word "a" yields ^^a and ^a$.
    Trigram t = {WORD_START, WORD_START, WORD_START};
    for (CodePoint r : runes) {
        t[0] = t[1];
        t[1] = t[2];
        t[2] = r;
        out.push_back(t);
    }
    t[0] = t[1];
    t[1] = t[2];
    t[2] = WORD_END;
    out.push_back(t);
    return out;
}

void FrequencyModel::add_word(std::string_view text) {
    add_word(util::decode_utf8(text));
}

void FrequencyModel::add_word(const std::vector<CodePoint>& runes) {
    if (runes.empty()) return;

    for (const Digram& d : digrams_of(runes)) {
        ++digrams_[d];
        ++total_digrams_;
    }
    for (const Trigram& t : trigrams_of(runes)) {
        ++trigrams_[t];
        ++total_trigrams_;
    }
    ++words_added_;
}

uint64_t FrequencyModel::digram_count(const Digram& d) const {
    auto it = digrams_.find(d);
    return it == digrams_.end() ? 0 : it->second;
}

uint64_t FrequencyModel::trigram_count(const Trigram& t) const {
    auto it = trigrams_.find(t);
    return it == trigrams_.end() ? 0 : it->second;
}

} // namespace typo
