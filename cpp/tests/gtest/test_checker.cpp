// =============================================================================
// Typo Checker Tests
// =============================================================================
//
// End-to-end runs over small in-memory corpora. Expected scores for the
// corpus "ab cb ab / zab ab cb" are:
//   zab 78, ab 53, cb 21
// =============================================================================

#include <gtest/gtest.h>
#include "typo/checker.hpp"
#include "typo/error.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace typo;
namespace fs = std::filesystem;

class TypoCheckerTest : public ::testing::Test {
protected:
    static constexpr const char* kCorpus = "ab cb ab\nzab ab cb.\n";

    static Options quiet_options() {
        Options opts;
        opts.known_word_files.clear();
        opts.threshold = 0;
        return opts;
    }

    static std::string run_to_string(const Options& opts, const std::string& text,
                                     const std::vector<std::string>& known = {}) {
        TypoChecker checker(opts);
        for (const auto& w : known) checker.known_words().add(w);
        std::istringstream in(text);
        checker.add_stream(in, "f");
        std::ostringstream out;
        write_report(checker.run(), out);
        return out.str();
    }
};

TEST_F(TypoCheckerTest, RanksWordsByPeculiarity) {
    Options opts = quiet_options();
    opts.threshold = 10;
    EXPECT_EQ(run_to_string(opts, kCorpus),
              "f:2:1 [78] zab\n"
              "f:1:1 [53] ab\n"
              "f:1:4 [21] cb\n");
}

TEST_F(TypoCheckerTest, MaxResultsAndThreshold) {
    Options opts = quiet_options();
    opts.max_results = 2;
    opts.threshold = 5;
    EXPECT_EQ(run_to_string(opts, kCorpus),
              "f:2:1 [78] zab\n"
              "f:1:1 [53] ab\n");

    opts.max_results = 50;
    opts.threshold = 60;
    EXPECT_EQ(run_to_string(opts, kCorpus), "f:2:1 [78] zab\n");

    opts.max_results = 0;
    opts.threshold = 0;
    EXPECT_EQ(run_to_string(opts, kCorpus), "");
}

// Known words still feed the statistics, so other scores do not move
TEST_F(TypoCheckerTest, KnownWordsAreNotReported) {
    EXPECT_EQ(run_to_string(quiet_options(), kCorpus, {"zab"}),
              "f:1:1 [53] ab\n"
              "f:1:4 [21] cb\n");
}

TEST_F(TypoCheckerTest, RepeatsAcrossLines) {
    Options opts = quiet_options();
    opts.threshold = 1000000;
    EXPECT_EQ(run_to_string(opts, "the dog\nsaw the\nThe cat"),
              "f:3:1 The repeats\n");
}

TEST_F(TypoCheckerTest, RepeatsCountKnownWords) {
    Options opts = quiet_options();
    opts.threshold = 1000000;
    EXPECT_EQ(run_to_string(opts, "it was the the end", {"the"}),
              "f:1:12 the repeats\n");
}

TEST_F(TypoCheckerTest, RepeatsOutsideLatinScript) {
    Options opts = quiet_options();
    opts.threshold = 1000000;
    EXPECT_EQ(run_to_string(opts, "বাংলা বাংলা\nᏣᎳᎩ ꮳꮃꭹ\n"),
              "f:1:17 বাংলা repeats\n"
              "f:2:11 ꮳꮃꭹ repeats\n");
}

TEST_F(TypoCheckerTest, SuppressRepeats) {
    Options opts = quiet_options();
    opts.threshold = 1000000;
    opts.suppress_repeats = true;
    EXPECT_EQ(run_to_string(opts, "the the"), "");
}

TEST_F(TypoCheckerTest, RepeatedRunsAreIdentical) {
    Options opts = quiet_options();
    std::string text = "Peculiar wrods in a sentance the the quick brown fox.\n"
                       "Another line with the word sentence and words.\n";
    EXPECT_EQ(run_to_string(opts, text), run_to_string(opts, text));
}

TEST_F(TypoCheckerTest, EmptyInput) {
    EXPECT_EQ(run_to_string(quiet_options(), ""), "");
    EXPECT_EQ(run_to_string(quiet_options(), "123 -- ...\n"), "");
}

TEST_F(TypoCheckerTest, HtmlFilterOption) {
    Options opts = quiet_options();
    opts.filter_html = true;
    TypoChecker checker(opts);
    std::istringstream in("<em>hello</em> <b>world</b>");
    checker.add_stream(in, "page.html");
    ASSERT_EQ(checker.words().size(), 2u);
    EXPECT_EQ(checker.words()[0].text, "hello");
    EXPECT_EQ(checker.words()[1].location(), "page.html:1:19");
}

TEST_F(TypoCheckerTest, StreamsShareStatistics) {
    Options opts = quiet_options();
    opts.threshold = 10;
    TypoChecker checker(opts);
    std::istringstream first("ab cb ab\n");
    std::istringstream second("zab ab cb.\n");
    checker.add_stream(first, "one");
    checker.add_stream(second, "two");

    std::ostringstream out;
    write_report(checker.run(), out);
    EXPECT_EQ(out.str(),
              "two:1:1 [78] zab\n"
              "one:1:1 [53] ab\n"
              "one:1:4 [21] cb\n");
}

TEST_F(TypoCheckerTest, AddFile) {
    fs::path path = fs::temp_directory_path() / "typo_checker_add_file.txt";
    {
        std::ofstream out(path);
        out << kCorpus;
    }

    TypoChecker checker(quiet_options());
    checker.add_file(path.string());
    EXPECT_EQ(checker.words().size(), 6u);
    EXPECT_EQ(checker.words()[3].file, path.string());

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_F(TypoCheckerTest, MissingFileNamesThePath) {
    TypoChecker checker(quiet_options());
    const std::string path = "/nonexistent/typo/input.txt";
    try {
        checker.add_file(path);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.path(), path);
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
        EXPECT_NE(e.message().find(path), std::string::npos);
    }
}

TEST_F(TypoCheckerTest, LoadKnownWordsFromSearchPath) {
    fs::path dir = fs::temp_directory_path() / "typo_checker_known";
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "stoplist");
        out << "zab\n";
    }

    Options opts = quiet_options();
    opts.known_word_files = {"stoplist", "typo-test-missing"};
    opts.search_path = {dir.string()};
    TypoChecker checker(opts);
    checker.load_known_words();
    EXPECT_TRUE(checker.known_words().contains("zab"));

    std::istringstream in(kCorpus);
    checker.add_stream(in, "f");
    std::ostringstream out;
    write_report(checker.run(), out);
    EXPECT_EQ(out.str(),
              "f:1:1 [53] ab\n"
              "f:1:4 [21] cb\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_F(TypoCheckerTest, RunOnlyOnce) {
    TypoChecker checker(quiet_options());
    checker.run();
    EXPECT_THROW(checker.run(), TypoException);
}

TEST_F(TypoCheckerTest, RejectsNegativeMaxResults) {
    Options opts = quiet_options();
    opts.max_results = -1;
    EXPECT_THROW(TypoChecker checker(opts), InvalidArgumentError);
}
