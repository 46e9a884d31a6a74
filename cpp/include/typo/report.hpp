#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "typo/known_words.hpp"
#include "typo/types.hpp"

namespace typo {

// Output of one run: repeats in corpus order, typos by descending score.
struct Report {
    std::vector<Word> repeats;
    std::vector<Word> typos;
};

// Each word whose lower-cased form equals that of the word before it.
std::vector<Word> find_repeats(const std::vector<Word>& words);

// Sort by text and keep one entry per distinct text, dropping known words.
// The sort is stable, so the kept entry is the earliest in the corpus.
void dedup_words(std::vector<Word>& words, const KnownWords& known);

// Descending score. Stable, so equal scores keep text order.
void rank_by_score(std::vector<Word>& words);

// Leading run of ranked words with score >= threshold, at most max_results long.
std::vector<Word> select_top(const std::vector<Word>& ranked, int max_results, int threshold);

// "file:line:byte word repeats"
std::string format_repeat(const Word& word);

// "file:line:byte [score] word"
std::string format_typo(const Word& word);

void write_report(const Report& report, std::ostream& out);

} // namespace typo
