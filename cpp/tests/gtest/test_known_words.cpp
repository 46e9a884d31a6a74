// =============================================================================
// Known Words Tests
// =============================================================================

#include <gtest/gtest.h>
#include "typo/known_words.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace typo;
namespace fs = std::filesystem;

class KnownWordsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("typo_known_words_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        fs::path p = dir_ / name;
        std::ofstream out(p);
        out << content;
        return p.string();
    }

    static Word make_word(const std::string& text, const std::string& lower) {
        Word w;
        w.text = text;
        w.lower = lower;
        return w;
    }

    fs::path dir_;
};

TEST_F(KnownWordsTest, LoadStreamSplitsOnWhitespace) {
    KnownWords known;
    std::istringstream in("the\nof and\n\n  to\tin\r\nthe");
    EXPECT_EQ(known.load_stream(in), 6u);
    EXPECT_EQ(known.size(), 5u);
    EXPECT_TRUE(known.contains("and"));
    EXPECT_TRUE(known.contains("in"));
    EXPECT_FALSE(known.contains("in\r"));
}

TEST_F(KnownWordsTest, EmptyByDefault) {
    KnownWords known;
    EXPECT_TRUE(known.empty());
    EXPECT_FALSE(known.contains("the"));
}

TEST_F(KnownWordsTest, LoadFile) {
    std::string path = write_file("list.txt", "alpha beta\ngamma\n");
    KnownWords known;
    EXPECT_TRUE(known.load_file(path));
    EXPECT_EQ(known.size(), 3u);
    EXPECT_TRUE(known.contains("gamma"));
}

TEST_F(KnownWordsTest, MissingFileIsNotFatal) {
    KnownWords known;
    EXPECT_FALSE(known.load_file((dir_ / "does-not-exist").string()));
    EXPECT_TRUE(known.empty());
}

TEST_F(KnownWordsTest, ResolveBareNameThroughSearchPath) {
    write_file("typo-test-stoplist", "x\n");
    std::string dir = dir_.string();

    auto found = KnownWords::resolve("typo-test-stoplist", {"/nonexistent/typo", dir});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(fs::path(*found), dir_ / "typo-test-stoplist");

    EXPECT_FALSE(KnownWords::resolve("typo-test-stoplist", {}).has_value());
}

// A name with a path separator is never looked up in the search path
TEST_F(KnownWordsTest, ResolvePathNameAsGiven) {
    std::string path = write_file("mine.txt", "x\n");
    auto found = KnownWords::resolve(path, {"/nonexistent/typo"});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, path);

    EXPECT_FALSE(KnownWords::resolve("./typo-test-no-such-file", {dir_.string()}).has_value());
}

// Directories are not files
TEST_F(KnownWordsTest, ResolveSkipsDirectories) {
    fs::create_directories(dir_ / "sub");
    EXPECT_FALSE(KnownWords::resolve("sub", {dir_.string()}).has_value());
}

TEST_F(KnownWordsTest, LoadAllCountsLoadedFiles) {
    write_file("first", "one two\n");
    write_file("second", "three\n");

    KnownWords known;
    size_t loaded = known.load_all({"first", "typo-test-missing", "second"}, {dir_.string()});
    EXPECT_EQ(loaded, 2u);
    EXPECT_EQ(known.size(), 3u);
    EXPECT_TRUE(known.contains("three"));
}

TEST_F(KnownWordsTest, IsKnownTriesTextThenLowerCase) {
    KnownWords known;
    known.add("the");
    known.add("NASA");

    EXPECT_TRUE(known.is_known(make_word("the", "the")));
    EXPECT_TRUE(known.is_known(make_word("The", "the")));
    EXPECT_TRUE(known.is_known(make_word("NASA", "nasa")));
    EXPECT_FALSE(known.is_known(make_word("Nasa", "nasa")));
    EXPECT_FALSE(known.is_known(make_word("then", "then")));
}

TEST_F(KnownWordsTest, DefaultSearchDirs) {
    const auto& dirs = KnownWords::default_search_dirs();
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], "/usr/local/share/typo");
    EXPECT_EQ(dirs[1], "/usr/share/typo");
}
