#include "typo/peculiarity_scorer.hpp"
#include "typo/util/utf8.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>

namespace typo {

double PeculiarityScorer::index_of(uint64_t nxy, uint64_t nyz, uint64_t nxyz) {
    if (nxy == 0 || nyz == 0 || nxyz == 0) {
        return 0.0;
    }
    // The logs of an exactly neutral trigram cancel only to within a few ulps.
    constexpr uint64_t exact_limit = std::numeric_limits<uint32_t>::max();
    if (nxy <= exact_limit && nyz <= exact_limit && nxyz <= exact_limit &&
        nxy * nyz == nxyz * nxyz) {
        return 0.0;
    }
    return 0.5 * (std::log(static_cast<double>(nxy)) + std::log(static_cast<double>(nyz))) -
           std::log(static_cast<double>(nxyz));
}

double PeculiarityScorer::trigram_index(const Trigram& t) const {
    uint64_t xy = model_.digram_count({t[0], t[1]});
    uint64_t yz = model_.digram_count({t[1], t[2]});
    uint64_t xyz = model_.trigram_count(t);

    // Leave-one-out: remove this occurrence from the corpus statistics.
    // The start-start digram is never counted, so ^^x lands here too.
    if (xy <= 1 || yz <= 1 || xyz <= 1) {
        return 0.0;
    }
    return index_of(xy - 1, yz - 1, xyz - 1);
}

double PeculiarityScorer::raw_score(const std::vector<CodePoint>& runes) const {
    double sum_of_squares = 0.0;
    size_t n = 0;
    for (const Trigram& t : FrequencyModel::trigrams_of(runes)) {
        double i = trigram_index(t);
        sum_of_squares += i * i;
        ++n;
    }
    if (n == 0 || sum_of_squares == 0.0) {
        return 0.0;
    }
    return 10.0 / std::sqrt(sum_of_squares / static_cast<double>(n));
}

int PeculiarityScorer::score(std::string_view text) const {
    double s = raw_score(util::decode_utf8(text));
    if (s >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(s);
}

void PeculiarityScorer::score_all(std::vector<Word>& words, const KnownWords& known) const {
    // Equal texts always score the same.
    std::unordered_map<std::string, int> cache;
    for (Word& word : words) {
        if (known.is_known(word)) {
            continue;
        }
        auto it = cache.find(word.text);
        if (it == cache.end()) {
            it = cache.emplace(word.text, score(word.text)).first;
        }
        word.score = it->second;
    }
}

} // namespace typo
