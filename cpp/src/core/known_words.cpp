#include "typo/known_words.hpp"
#include "typo/logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace typo {

const std::vector<std::string>& KnownWords::default_search_dirs() {
    static const std::vector<std::string> dirs = {
        "/usr/local/share/typo",
        "/usr/share/typo",
    };
    return dirs;
}

size_t KnownWords::load_stream(std::istream& in) {
    size_t n = 0;
    std::string word;
    while (in >> word) {
        words_.insert(word);
        ++n;
    }
    return n;
}

bool KnownWords::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("Cannot open known words file ", path, ": ", std::strerror(errno));
        return false;
    }

    size_t before = words_.size();
    size_t n = load_stream(in);
    if (in.bad()) {
        LOG_WARN("Error reading known words file ", path, "; kept ", n, " words read before the error");
    }
    LOG_INFO("Loaded ", n, " known words from ", path, " (", words_.size() - before, " new)");
    return !in.bad();
}

std::optional<std::string> KnownWords::resolve(const std::string& name,
                                               const std::vector<std::string>& search_path) {
    std::error_code ec;
    if (name.find('/') != std::string::npos) {
        if (fs::is_regular_file(name, ec)) return name;
        return std::nullopt;
    }

    for (const auto* dirs : {&search_path, &default_search_dirs()}) {
        for (const auto& dir : *dirs) {
            fs::path candidate = fs::path(dir) / name;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate.string();
            }
        }
    }
    return std::nullopt;
}

size_t KnownWords::load_all(const std::vector<std::string>& names,
                            const std::vector<std::string>& search_path) {
    size_t loaded = 0;
    for (const auto& name : names) {
        auto path = resolve(name, search_path);
        if (!path) {
            LOG_WARN("Can't find known words file \"", name, "\"");
            continue;
        }
        if (load_file(*path)) {
            ++loaded;
        }
    }
    return loaded;
}

} // namespace typo
