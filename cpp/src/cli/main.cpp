// =============================================================================
// typo - report unusual words and repeated words in text
// =============================================================================
//
// Usage:
//   typo [options] [file ...]
//
// With no files, standard input is read. Each reported word carries its
// location as file:line:byte. Repeated words ("the the") are listed first,
// then the most peculiar words by descending score.
//
// Examples:
//   typo chapter1.txt chapter2.txt
//   typo -n 20 -t 5 notes.md
//   typo -html -w project-words.txt index.html
//
// =============================================================================

#include <iostream>

#include "typo/cli.hpp"

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    return typo::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
