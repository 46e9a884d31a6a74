#include "typo/checker.hpp"
#include "typo/error.hpp"
#include "typo/frequency_model.hpp"
#include "typo/logging.hpp"
#include "typo/peculiarity_scorer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace typo {

TypoChecker::TypoChecker(Options options)
    : options_(std::move(options))
    , tokenizer_(options_.filter_html) {
    TYPO_CHECK_ARGUMENT(options_.max_results >= 0, "max_results must not be negative");
}

void TypoChecker::load_known_words() {
    size_t loaded = known_.load_all(options_.known_word_files, options_.search_path);
    LOG_INFO("Known words: ", known_.size(), " from ", loaded, " of ",
             options_.known_word_files.size(), " files");
}

void TypoChecker::add_stream(std::istream& in, const std::string& name) {
    size_t before = words_.size();
    tokenizer_.tokenize(in, name, words_);
    LOG_DEBUG("Tokenized ", name, ": ", words_.size() - before, " words");
}

void TypoChecker::add_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError(path, std::strerror(errno));
    }
    add_stream(in, path);
}

Report TypoChecker::run() {
    TYPO_CHECK(!ran_, ErrorCode::INTERNAL_ERROR, "TypoChecker::run() called twice");
    ran_ = true;

    Report report;
    if (!options_.suppress_repeats) {
        report.repeats = find_repeats(words_);
    }

    // Every word counts towards the statistics, known or not.
    FrequencyModel model;
    for (const Word& word : words_) {
        model.add_word(word.text);
    }
    LOG_INFO("Frequency tables: ", model.words_added(), " words, ",
             model.distinct_digrams(), " digrams, ", model.distinct_trigrams(), " trigrams");

    PeculiarityScorer scorer(model);
    scorer.score_all(words_, known_);

    dedup_words(words_, known_);
    rank_by_score(words_);
    report.typos = select_top(words_, options_.max_results, options_.threshold);

    LOG_INFO("Candidates: ", words_.size(), " distinct unknown words, ",
             report.typos.size(), " reported, ", report.repeats.size(), " repeats");
    return report;
}

} // namespace typo
