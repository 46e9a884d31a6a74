#include "typo/cli.hpp"
#include "typo/checker.hpp"
#include "typo/error.hpp"
#include "typo/logging.hpp"
#include "typo/report.hpp"

#define TYPO_VERSION_STRING "1.0.0"

namespace typo::cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw InvalidArgumentError("invalid value \"" + value + "\" for " + flag);
    }
    return n;
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Usage: typo [options] [file ...]\n";
    out << "\nOptions:\n";
    out << "  -n, --max-results <n>     Maximum number of words to print (default: 50)\n";
    out << "  -t, --threshold <n>       Cutoff score; smaller means more words (default: 10)\n";
    out << "  -r, --suppress-repeats    Don't report repeated words\n";
    out << "  -html, --filter-html      Strip simple HTML tags from words\n";
    out << "  -w, --known-words <file>  Additional known-words file (repeatable)\n";
    out << "  -c, --config <file>       Read key=value configuration from file\n";
    out << "  -v, --verbose             Informational logging on stderr\n";
    out << "  -q, --quiet               Log errors only\n";
    out << "  -h, --help                Show this help message\n";
    out << "      --version             Show version information\n";
    out << "\nBoolean flags also take a value: -r=false, --filter-html=true.\n";
    out << "\nEnvironment:\n";
    out << "  TYPO_PATH                 Colon-separated directories holding known-words files\n";
    out << "  TYPO_KNOWN_WORDS          Known-words file names (default: words:w2006.txt)\n";
    out << "  TYPO_LOG_LEVEL            debug, info, warn or error (default: warn)\n";
    out << "  TYPO_LOG_FILE             Append log output to this file\n";
}

bool parse_bool(const std::string& value, bool& out) {
    if (value == "1" || value == "t" || value == "T" ||
        value == "true" || value == "TRUE" || value == "True") {
        out = true;
        return true;
    }
    if (value == "0" || value == "f" || value == "F" ||
        value == "false" || value == "FALSE" || value == "False") {
        out = false;
        return true;
    }
    return false;
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw InvalidArgumentError("flag needs an argument: " + flag);
        }
        return argv[++i];
    };

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            cl.files.push_back(arg);
            continue;
        }

        // --flag=value
        std::string inline_value;
        bool has_inline = false;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline = true;
        }
        auto take = [&](const std::string& flag) {
            return has_inline ? inline_value : value_of(i, flag);
        };
        // A bare boolean flag is true; -flag=value sets it explicitly.
        auto flag_value = [&](const std::string& flag) {
            bool b = true;
            if (has_inline && !parse_bool(inline_value, b)) {
                throw InvalidArgumentError("invalid boolean value \"" + inline_value + "\" for " + flag);
            }
            return b;
        };

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-n" || arg == "--max-results") {
            cl.max_results = take(arg);
        } else if (arg == "-t" || arg == "--threshold") {
            cl.threshold = take(arg);
        } else if (arg == "-r" || arg == "--suppress-repeats") {
            cl.suppress_repeats = flag_value(arg);
        } else if (arg == "-html" || arg == "--html" || arg == "--filter-html") {
            cl.filter_html = flag_value(arg);
        } else if (arg == "-w" || arg == "--known-words") {
            cl.known_words.push_back(take(arg));
        } else if (arg == "-c" || arg == "--config") {
            cl.config_file = take(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            cl.verbose = flag_value(arg);
        } else if (arg == "-q" || arg == "--quiet") {
            cl.quiet = flag_value(arg);
        } else if (arg == "-h" || arg == "--help") {
            cl.help = flag_value(arg);
        } else if (arg == "--version") {
            cl.version = flag_value(arg);
        } else {
            throw InvalidArgumentError("unknown flag: " + arg);
        }
    }
    return cl;
}

Options resolve_options(const CommandLine& cl, const Config& config) {
    Options opts = Options::from_config(config);
    if (!cl.max_results.empty()) {
        opts.max_results = parse_int("-n", cl.max_results);
        TYPO_CHECK_ARGUMENT(opts.max_results >= 0, "-n must not be negative");
    }
    if (!cl.threshold.empty()) {
        opts.threshold = parse_int("-t", cl.threshold);
    }
    if (cl.suppress_repeats) {
        opts.suppress_repeats = *cl.suppress_repeats;
    }
    if (cl.filter_html) {
        opts.filter_html = *cl.filter_html;
    }
    for (const auto& file : cl.known_words) {
        opts.known_word_files.push_back(file);
    }
    return opts;
}

int run(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    CommandLine cl;
    try {
        cl = parse_command_line(argc, argv);
    } catch (const InvalidArgumentError& e) {
        err << "typo: " << e.message() << "\n";
        print_usage(err);
        return EXIT_USAGE;
    }

    if (cl.help) {
        print_usage(out);
        return EXIT_OK;
    }
    if (cl.version) {
        out << "typo " << TYPO_VERSION_STRING << "\n";
        return EXIT_OK;
    }

    Config config;
    if (!config.load(cl.config_file)) {
        err << "typo: invalid configuration\n";
        return EXIT_USAGE;
    }
    init_logging(config);
    if (cl.verbose) set_log_level(LogLevel::INFO);
    if (cl.quiet) set_log_level(LogLevel::ERROR);
    if (Logger::getInstance().level() <= LogLevel::DEBUG) {
        config.print();
    }

    try {
        TypoChecker checker(resolve_options(cl, config));
        checker.load_known_words();

        if (cl.files.empty()) {
            checker.add_stream(in, "<stdin>");
        }
        for (const auto& file : cl.files) {
            if (file == "-") {
                checker.add_stream(in, "<stdin>");
            } else {
                checker.add_file(file);
            }
        }

        write_report(checker.run(), out);
    } catch (const IOError& e) {
        err << "typo: " << e.message() << "\n";
        return EXIT_IO;
    } catch (const InvalidArgumentError& e) {
        err << "typo: " << e.message() << "\n";
        print_usage(err);
        return EXIT_USAGE;
    } catch (const TypoException& e) {
        err << "typo: " << e.message() << "\n";
        return EXIT_USAGE;
    }

    return EXIT_OK;
}

} // namespace typo::cli
