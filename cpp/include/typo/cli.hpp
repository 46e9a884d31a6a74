#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "typo/config.hpp"

namespace typo::cli {

enum ExitStatus {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_IO = 2
};

// Flags as given; unset values fall back to the configuration.
struct CommandLine {
    std::string config_file;
    std::string max_results;
    std::string threshold;
    std::optional<bool> suppress_repeats;
    std::optional<bool> filter_html;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
    std::vector<std::string> known_words;
    std::vector<std::string> files;
};

void print_usage(std::ostream& out);

// Accepts 1 0 t f true false TRUE FALSE True False.
bool parse_bool(const std::string& value, bool& out);

// Throws InvalidArgumentError for unknown flags, missing flag arguments
// and malformed boolean values.
CommandLine parse_command_line(int argc, const char* const argv[]);

// Configuration overlaid with the command line. Throws InvalidArgumentError
// for malformed numbers.
Options resolve_options(const CommandLine& cl, const Config& config);

// Full program run. Input files default to in, the report goes to out,
// diagnostics to err. Returns the process exit status.
int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace typo::cli
