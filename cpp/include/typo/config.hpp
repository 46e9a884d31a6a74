#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <type_traits>
#include <vector>
#include "logging.hpp"

namespace typo {

// Splits a colon- or comma-separated list, dropping empty entries.
inline std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : value) {
        if (c == ':' || c == ',') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

class Config {
public:
    Config() {
        values_["max_results"] = "50";
        values_["threshold"] = "10";
        values_["suppress_repeats"] = "false";
        values_["filter_html"] = "false";
        values_["known_words"] = "words:w2006.txt";
        values_["search_path"] = "";
        values_["log.level"] = "warn";
        values_["log.file"] = "";
    }

    // Environment first, then the optional file, then validation.
    bool load(const std::string& config_file = "") {
        load_from_env();
        if (!config_file.empty() && !load_from_file(config_file)) {
            return false;
        }
        return validate();
    }

    void load_from_env() {
        set_if_env("max_results", "TYPO_MAX_RESULTS");
        set_if_env("threshold", "TYPO_THRESHOLD");
        set_if_env("suppress_repeats", "TYPO_NO_REPEATS");
        set_if_env("filter_html", "TYPO_FILTER_HTML");
        set_if_env("known_words", "TYPO_KNOWN_WORDS");
        set_if_env("search_path", "TYPO_PATH");
        set_if_env("log.level", "TYPO_LOG_LEVEL");
        set_if_env("log.file", "TYPO_LOG_FILE");
    }

    bool load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("Could not open config file: ", filename);
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            // Parse key=value
            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = trim(line.substr(0, equals_pos));
                std::string value = trim(line.substr(equals_pos + 1));
                if (!key.empty()) {
                    values_[key] = value;
                }
            } else if (!trim(line).empty()) {
                LOG_WARN("Ignoring malformed config line in ", filename, ": ", line);
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
        return true;
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t used = 0;
                int v = std::stoi(it->second, &used);
                if (used != it->second.size()) return default_value;
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void print() const {
        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    bool validate() {
        bool valid = true;

        if (!is_integer(values_["max_results"]) || get<int>("max_results", -1) < 0) {
            LOG_ERROR("Invalid max_results: '", values_["max_results"], "'");
            valid = false;
        }

        if (!is_integer(values_["threshold"])) {
            LOG_ERROR("Invalid threshold: '", values_["threshold"], "'");
            valid = false;
        }

        LogLevel level;
        if (!parse_log_level(values_["log.level"], level)) {
            LOG_WARN("Unknown log level '", values_["log.level"], "', defaulting to 'warn'");
            values_["log.level"] = "warn";
        }

        return valid;
    }

private:
    void set_if_env(const std::string& key, const char* env_var) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    static std::string trim(const std::string& s) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        auto first = std::find_if(s.begin(), s.end(), not_space);
        auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
        return first < last ? std::string(first, last) : std::string();
    }

    static bool is_integer(const std::string& s) {
        if (s.empty()) return false;
        size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        if (i == s.size()) return false;
        for (; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        return true;
    }

    // Ordered so print() is stable.
    std::map<std::string, std::string> values_;
};

// Run options resolved from configuration; command-line flags override them.
struct Options {
    int max_results = 50;
    int threshold = 10;
    bool suppress_repeats = false;
    bool filter_html = false;
    std::vector<std::string> known_word_files{"words", "w2006.txt"};
    std::vector<std::string> search_path;

    static Options from_config(const Config& config) {
        Options opts;
        opts.max_results = config.get<int>("max_results", opts.max_results);
        opts.threshold = config.get<int>("threshold", opts.threshold);
        opts.suppress_repeats = config.get<bool>("suppress_repeats", opts.suppress_repeats);
        opts.filter_html = config.get<bool>("filter_html", opts.filter_html);
        opts.known_word_files = split_list(config.get<std::string>("known_words"));
        opts.search_path = split_list(config.get<std::string>("search_path"));
        return opts;
    }
};

// Applies log.level and log.file from a loaded configuration.
inline void init_logging(const Config& config) {
    LogLevel level = LogLevel::WARN;
    if (parse_log_level(config.get<std::string>("log.level"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }
}

} // namespace typo
