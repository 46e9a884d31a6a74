#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "typo/frequency_model.hpp"
#include "typo/known_words.hpp"
#include "typo/types.hpp"

namespace typo {

/**
 * Index of peculiarity (Morris & Cherry, CSTR 18, 1974).
 *
 * For each trigram T = xyz of a word the counts n(xy), n(yz) and n(xyz)
 * are taken from the corpus tables, each reduced by one to remove the
 * word's own contribution, and
 *
 *     i(T) = 1/2 [log n(xy) + log n(yz)] - log n(xyz)
 *
 * A zero count makes i(T) = 0. The paper uses -10 for log 0, but squared
 * that swamps every other trigram.
 *
 * The word score is 10 / sqrt(mean(i(T)^2)) truncated to an integer; a
 * word whose indices are all zero scores 0.
 */
class PeculiarityScorer {
public:
    explicit PeculiarityScorer(const FrequencyModel& model) : model_(model) {}

    double trigram_index(const Trigram& t) const;

    // i(T) from counts already reduced by one. Exactly 0 when any count is
    // 0 or when n(xy) * n(yz) == n(xyz)^2.
    static double index_of(uint64_t nxy, uint64_t nyz, uint64_t nxyz);

    // Unrounded score; 0.0 when every trigram index is 0
    double raw_score(const std::vector<CodePoint>& runes) const;

    int score(std::string_view text) const;

    // Set the score of every word that is not known. Known words stay at 0.
    void score_all(std::vector<Word>& words, const KnownWords& known) const;

private:
    const FrequencyModel& model_;
};

} // namespace typo
