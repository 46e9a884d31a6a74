#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "typo/types.hpp"

namespace typo {

/**
 * Corpus-wide digram and trigram counts.
 *
 * For "once" the digrams are ^o on nc ce e$ and the trigrams are
 * ^^o ^on onc nce ce$, where ^ and $ stand for WORD_START and WORD_END.
 * A word of length L therefore adds L+1 of each.
 *
 * Built once over every word of the corpus, known words included, then
 * only read while scoring.
 */
class FrequencyModel {
public:
    // Count the digrams and trigrams of one word. Empty words add nothing.
    void add_word(std::string_view text);
    void add_word(const std::vector<CodePoint>& runes);

    uint64_t digram_count(const Digram& d) const;
    uint64_t trigram_count(const Trigram& t) const;

    size_t distinct_digrams() const { return digrams_.size(); }
    size_t distinct_trigrams() const { return trigrams_.size(); }
    uint64_t total_digrams() const { return total_digrams_; }
    uint64_t total_trigrams() const { return total_trigrams_; }
    uint64_t words_added() const { return words_added_; }

    // Boundary-inclusive sequences for one word, in order
    static std::vector<Digram> digrams_of(const std::vector<CodePoint>& runes);
    static std::vector<Trigram> trigrams_of(const std::vector<CodePoint>& runes);

private:
    std::unordered_map<Digram, uint64_t, DigramHasher> digrams_;
    std::unordered_map<Trigram, uint64_t, TrigramHasher> trigrams_;
    uint64_t total_digrams_ = 0;
    uint64_t total_trigrams_ = 0;
    uint64_t words_added_ = 0;
};

} // namespace typo
