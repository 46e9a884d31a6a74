#include "typo/report.hpp"

#include <algorithm>

namespace typo {

std::vector<Word> find_repeats(const std::vector<Word>& words) {
    std::vector<Word> repeats;
    const std::string* prev = nullptr;
    for (const Word& word : words) {
        if (prev && *prev == word.lower) {
            repeats.push_back(word);
        }
        prev = &word.lower;
    }
    return repeats;
}

void dedup_words(std::vector<Word>& words, const KnownWords& known) {
    std::stable_sort(words.begin(), words.end(),
                     [](const Word& a, const Word& b) { return a.text < b.text; });

    std::vector<Word> out;
    out.reserve(words.size());
    for (Word& word : words) {
        if (!out.empty() && out.back().text == word.text) {
            continue;
        }
        if (known.is_known(word)) {
            continue;
        }
        out.push_back(std::move(word));
    }
    words = std::move(out);
}

void rank_by_score(std::vector<Word>& words) {
    std::stable_sort(words.begin(), words.end(),
                     [](const Word& a, const Word& b) { return a.score > b.score; });
}

std::vector<Word> select_top(const std::vector<Word>& ranked, int max_results, int threshold) {
    std::vector<Word> out;
    for (const Word& word : ranked) {
        if (static_cast<int>(out.size()) >= max_results) break;
        if (word.score < threshold) break;
        out.push_back(word);
    }
    return out;
}

std::string format_repeat(const Word& word) {
    return word.location() + " " + word.text + " repeats";
}

std::string format_typo(const Word& word) {
    return word.location() + " [" + std::to_string(word.score) + "] " + word.text;
}

void write_report(const Report& report, std::ostream& out) {
    for (const Word& word : report.repeats) {
        out << format_repeat(word) << '\n';
    }
    for (const Word& word : report.typos) {
        out << format_typo(word) << '\n';
    }
    out.flush();
}

} // namespace typo
