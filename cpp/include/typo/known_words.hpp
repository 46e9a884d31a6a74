#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "typo/types.hpp"

namespace typo {

/**
 * Stoplist of common words that are never reported.
 *
 * Loaded once before tokenizing; read-only afterwards. Lookups try the
 * word as written first, then its lower-cased form.
 */
class KnownWords {
public:
    // Directories searched after the configured search path
    static const std::vector<std::string>& default_search_dirs();

    void add(const std::string& word) { words_.insert(word); }

    // Reads white-space separated words; returns how many were read.
    size_t load_stream(std::istream& in);

    // Missing or unreadable files are not fatal: a warning is logged and
    // false returned.
    bool load_file(const std::string& path);

    // Resolves each name (see resolve()) and loads it. Returns the number
    // of files actually loaded.
    size_t load_all(const std::vector<std::string>& names,
                    const std::vector<std::string>& search_path);

    // A name containing a path separator is used as given. A bare name is
    // looked up in search_path, then in default_search_dirs().
    static std::optional<std::string> resolve(const std::string& name,
                                              const std::vector<std::string>& search_path);

    bool contains(const std::string& word) const {
        return words_.find(word) != words_.end();
    }

    bool is_known(const Word& word) const {
        return contains(word.text) || contains(word.lower);
    }

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

private:
    std::unordered_set<std::string> words_;
};

} // namespace typo
