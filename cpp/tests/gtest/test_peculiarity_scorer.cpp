// =============================================================================
// Peculiarity Scorer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "typo/frequency_model.hpp"
#include "typo/known_words.hpp"
#include "typo/peculiarity_scorer.hpp"
#include "typo/util/utf8.hpp"
#include <cmath>
#include <string>
#include <vector>

using namespace typo;
using constants::WORD_START;
using constants::WORD_END;

class PeculiarityScorerTest : public ::testing::Test {
protected:
    void add(const std::string& word, int times = 1) {
        for (int i = 0; i < times; ++i) model.add_word(word);
    }

    static Word make_word(const std::string& text) {
        Word w;
        w.text = text;
        w.lower = text;
        w.file = "t";
        w.line = 1;
        w.byte = 1;
        return w;
    }

    FrequencyModel model;
};

// i(T) = 1/2 [ln n(xy) + ln n(yz)] - ln n(xyz), counts less one
TEST_F(PeculiarityScorerTest, TrigramIndexFormula) {
    add("ab", 3);
    add("cb", 2);
    PeculiarityScorer scorer(model);

    // n(ab)=2, n(b$)=4, n(ab$)=2
    double expected = 0.5 * (std::log(2.0) + std::log(4.0)) - std::log(2.0);
    EXPECT_NEAR(scorer.trigram_index({'a', 'b', WORD_END}), expected, 1e-12);
    EXPECT_NEAR(scorer.trigram_index({'a', 'b', WORD_END}), 0.5 * std::log(2.0), 1e-12);

    // n(cb)=1, n(b$)=4, n(cb$)=1
    EXPECT_NEAR(scorer.trigram_index({'c', 'b', WORD_END}), std::log(2.0), 1e-12);
}

// A count of one becomes zero after removing the word itself
TEST_F(PeculiarityScorerTest, LeaveOneOutTurnsSingleCountIntoZero) {
    add("ab", 3);
    add("cb", 1);
    PeculiarityScorer scorer(model);

    ASSERT_EQ(model.digram_count({'c', 'b'}), 1u);
    EXPECT_EQ(scorer.trigram_index({'c', 'b', WORD_END}), 0.0);

    // A second "cb" makes the same trigram informative
    add("cb", 1);
    PeculiarityScorer scorer2(model);
    EXPECT_GT(scorer2.trigram_index({'c', 'b', WORD_END}), 0.0);
}

// ^^x has no digram count at all; it must not produce NaN
TEST_F(PeculiarityScorerTest, LeadingBoundaryTrigramIsNeutral) {
    add("ab", 5);
    PeculiarityScorer scorer(model);
    double i = scorer.trigram_index({WORD_START, WORD_START, 'a'});
    EXPECT_EQ(i, 0.0);
    EXPECT_FALSE(std::isnan(i));
}

TEST_F(PeculiarityScorerTest, UnseenTrigramIsNeutral) {
    add("ab", 3);
    PeculiarityScorer scorer(model);
    EXPECT_EQ(scorer.trigram_index({'q', 'q', 'q'}), 0.0);
}

TEST_F(PeculiarityScorerTest, BalancedCountsGiveExactZero) {
    EXPECT_EQ(PeculiarityScorer::index_of(4, 9, 6), 0.0);
    EXPECT_EQ(PeculiarityScorer::index_of(3, 3, 3), 0.0);
    EXPECT_EQ(PeculiarityScorer::index_of(0, 9, 6), 0.0);
    EXPECT_EQ(PeculiarityScorer::index_of(4, 9, 0), 0.0);
}

// Large corpora produce real indices far below 1e-9
TEST_F(PeculiarityScorerTest, TinyIndicesSurvive) {
    double i = PeculiarityScorer::index_of(100001, 99999, 100000);
    EXPECT_LT(i, 0.0);
    EXPECT_NEAR(i, 0.5 * std::log1p(-1e-10), 1e-12);

    EXPECT_GT(PeculiarityScorer::index_of(1000000, 1000000, 999999), 0.0);
}

// Root-mean-square over all L+1 trigrams, inverted and scaled by 10
TEST_F(PeculiarityScorerTest, WordScore) {
    add("ab", 3);
    add("cb", 2);
    PeculiarityScorer scorer(model);

    // ab: indices 0, 0, ln(2)/2 -> 10 / sqrt((ln2/2)^2 / 3) = 49.97
    double half_ln2 = 0.5 * std::log(2.0);
    EXPECT_NEAR(scorer.raw_score(util::decode_utf8("ab")),
                10.0 / std::sqrt(half_ln2 * half_ln2 / 3.0), 1e-9);
    EXPECT_EQ(scorer.score("ab"), 49);

    // cb: indices 0, 0, ln 2 -> 24.99, truncated
    EXPECT_EQ(scorer.score("cb"), 24);
}

// All indices zero: score 0 without dividing by zero
TEST_F(PeculiarityScorerTest, AllZeroIndicesScoreZero) {
    add("xy");
    PeculiarityScorer scorer(model);
    EXPECT_EQ(scorer.raw_score(util::decode_utf8("xy")), 0.0);
    EXPECT_EQ(scorer.score("xy"), 0);

    // Nothing in the corpus at all
    FrequencyModel empty;
    PeculiarityScorer empty_scorer(empty);
    EXPECT_EQ(empty_scorer.score("anything"), 0);
    EXPECT_EQ(empty_scorer.score(""), 0);
}

// A word made only of the dominant pattern sits at the minimum
TEST_F(PeculiarityScorerTest, DominantPatternScoresMinimum) {
    add("the", 20);
    add("dog");
    PeculiarityScorer scorer(model);
    EXPECT_EQ(scorer.score("the"), 0);
}

// A sequence found nowhere else pushes the score above a common word's
TEST_F(PeculiarityScorerTest, UniqueSequenceScoresHigher) {
    add("ab", 3);
    add("cb", 2);
    add("zab");
    PeculiarityScorer scorer(model);

    int common = scorer.score("ab");
    int odd = scorer.score("zab");
    EXPECT_EQ(common, 53);
    EXPECT_EQ(odd, 78);
    EXPECT_GT(odd, common);
    EXPECT_EQ(scorer.score("cb"), 21);
}

TEST_F(PeculiarityScorerTest, KnownWordsAreNotScored) {
    add("ab", 3);
    add("cb", 2);
    add("zab");
    PeculiarityScorer scorer(model);

    KnownWords known;
    known.add("zab");

    std::vector<Word> words = {make_word("ab"), make_word("zab"), make_word("cb")};
    scorer.score_all(words, known);
    EXPECT_EQ(words[0].score, 53);
    EXPECT_EQ(words[1].score, 0);
    EXPECT_EQ(words[2].score, 21);
}

// Lower-cased fallback: "Zab" is known through "zab"
TEST_F(PeculiarityScorerTest, KnownWordsMatchLowerCase) {
    add("Zab");
    add("ab", 3);
    PeculiarityScorer scorer(model);

    KnownWords known;
    known.add("zab");

    Word w = make_word("Zab");
    w.lower = "zab";
    std::vector<Word> words = {w};
    scorer.score_all(words, known);
    EXPECT_EQ(words[0].score, 0);
}

TEST_F(PeculiarityScorerTest, Deterministic) {
    add("ab", 3);
    add("cb", 2);
    add("zab");
    PeculiarityScorer a(model);
    PeculiarityScorer b(model);
    for (const char* w : {"ab", "cb", "zab", "abc", "q"}) {
        EXPECT_EQ(a.raw_score(util::decode_utf8(w)), b.raw_score(util::decode_utf8(w))) << w;
    }
}
