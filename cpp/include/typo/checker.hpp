#pragma once

#include <istream>
#include <string>
#include <vector>

#include "typo/config.hpp"
#include "typo/known_words.hpp"
#include "typo/report.hpp"
#include "typo/tokenizer.hpp"
#include "typo/types.hpp"

namespace typo {

/**
 * One typo run over a corpus.
 *
 * Phases, strictly in order:
 *   1. load known words        load_known_words() / known_words().add()
 *   2. tokenize all input      add_stream() / add_file()
 *   3. report repeats          \
 *   4. build frequency tables   } run()
 *   5. score every word         |
 *   6. dedup, rank, cut        /
 *
 * run() consumes the word list and may be called once.
 */
class TypoChecker {
public:
    explicit TypoChecker(Options options);

    const Options& options() const { return options_; }

    KnownWords& known_words() { return known_; }
    const KnownWords& known_words() const { return known_; }

    // Loads options().known_word_files through options().search_path.
    // Missing files only produce warnings.
    void load_known_words();

    void add_stream(std::istream& in, const std::string& name);

    // Throws IOError if the file cannot be opened or read.
    void add_file(const std::string& path);

    const std::vector<Word>& words() const { return words_; }

    Report run();

private:
    Options options_;
    Tokenizer tokenizer_;
    KnownWords known_;
    std::vector<Word> words_;
    bool ran_ = false;
};

} // namespace typo
