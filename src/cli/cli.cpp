// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат help и ошибок повторяет clap v4.
//
// ==============================================================================

#include "anirename/cli.hpp"

#include "anirename/platform.hpp"

#include <cstring>

namespace anirename::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_verbose_flag(const char* arg) {
    // -v, -vv, -vvv ...
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

/// Сообщение об ошибке парсинга в стиле clap
std::string render_usage_error(const std::string& error_msg, const char* usage) {
    std::string result = error_msg;
    result += "\n\nUsage: ";
    result += usage;
    result += "\n\nFor more information, try '--help'.\n";
    return result;
}

constexpr const char* MAIN_USAGE = "anirename [OPTIONS] <COMMAND>";
constexpr const char* RENAME_USAGE = "anirename rename [OPTIONS] [PATH]...";
constexpr const char* CLASSIFY_USAGE = "anirename classify [OPTIONS] <NAME>...";

void usage_error(ParseResult& result, const std::string& message, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error("error: " + message, usage);
}

/// Взять значение опции (следующий аргумент). false = ошибка уже записана
bool take_value(int argc, char** argv, int& i, const char* placeholder, std::string& out,
                ParseResult& result, const char* usage) {
    if (i + 1 >= argc) {
        usage_error(result,
                    std::string("a value is required for '") + argv[i] + " <" + placeholder +
                        ">' but none was supplied",
                    usage);
        return false;
    }
    ++i;
    out = argv[i];
    return true;
}

/// Глобальные флаги разрешены и после подкоманды
bool parse_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
        return true;
    }
    if (is_verbose_flag(arg)) {
        global.verbose += static_cast<int>(std::strlen(arg) - 1);
        return true;
    }
    return false;
}

void parse_rename(int argc, char** argv, int cmd_idx, ParseResult& result) {
    RenameCommand cmd;
    std::string value;

    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"rename"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-n") || str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            cmd.jsonl = true;
        } else if (str_eq(arg, "--skip-errors")) {
            cmd.skip_errors = true;
        } else if (str_eq(arg, "--reclassify")) {
            cmd.reclassify = true;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (!take_value(argc, argv, i, "OUTPUT", value, result, RENAME_USAGE)) {
                return;
            }
            cmd.output = platform::path_from_utf8(value);
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (!take_value(argc, argv, i, "CONFIG", value, result, RENAME_USAGE)) {
                return;
            }
            cmd.config = platform::path_from_utf8(value);
        } else if (str_eq(arg, "--extension")) {
            if (!take_value(argc, argv, i, "EXTENSION", value, result, RENAME_USAGE)) {
                return;
            }
            // Расширение сравнивается без точки
            if (!value.empty() && value[0] == '.') {
                value.erase(0, 1);
            }
            cmd.extensions.push_back(value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        RENAME_USAGE);
            return;
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    if (cmd.json && cmd.jsonl) {
        usage_error(result, "the argument '--json' cannot be used with '--jsonl'", RENAME_USAGE);
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_classify(int argc, char** argv, int cmd_idx, ParseResult& result) {
    ClassifyCommand cmd;
    std::string value;

    for (int i = cmd_idx + 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"classify"};
            return;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (!take_value(argc, argv, i, "CONFIG", value, result, CLASSIFY_USAGE)) {
                return;
            }
            cmd.config = platform::path_from_utf8(value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        CLASSIFY_USAGE);
            return;
        } else {
            cmd.names.emplace_back(arg);
        }
    }

    if (cmd.names.empty()) {
        usage_error(result, "the following required arguments were not provided:\n  <NAME>...",
                    CLASSIFY_USAGE);
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("anirename ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: anirename [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  rename    Rename media files in place to '{Title} - SxxEyy - {Group}.ext'\n"
               "  classify  Print how file names would be classified\n"
               "  help      Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q, --quiet      Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Preview the renames for a season folder:\n"
               "        ./anirename rename --dry-run 'Shows/Attack on Titan/'\n"
               "\n"
               "    Rename with an extended release group registry:\n"
               "        ./anirename rename -c groups.yml downloads/\n"
               "\n"
               "    Classify a single name:\n"
               "        ./anirename classify '[LoliHouse] Some Show S02 - 05 [WebRip].mp4'\n";
    } else if (*command == "rename") {
        return "Rename media files in place to '{Title} - SxxEyy - {Group}.ext'\n"
               "\n"
               "Usage: anirename rename [OPTIONS] [PATH]...\n"
               "\n"
               "Arguments:\n"
               "  [PATH]...  Files or directories to rename (prompted for when omitted)\n"
               "\n"
               "Options:\n"
               "  -n, --dry-run                Show the planned renames without renaming\n"
               "  -j, --json                   Output the report as JSON\n"
               "      --jsonl                  Output the report as JSON lines\n"
               "  -o, --output <OUTPUT>        Write the report to a file\n"
               "  -c, --config <CONFIG>        A YAML file with release groups and keywords\n"
               "      --extension <EXTENSION>  Only rename files with this extension\n"
               "      --skip-errors            Continue past unreadable directories\n"
               "      --reclassify             Also reclassify files that already have canonical names\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "classify") {
        return "Print how file names would be classified\n"
               "\n"
               "Usage: anirename classify [OPTIONS] <NAME>...\n"
               "\n"
               "Arguments:\n"
               "  <NAME>...  File names to classify (nothing is renamed)\n"
               "\n"
               "Options:\n"
               "  -j, --json             Output as JSON\n"
               "  -c, --config <CONFIG>  A YAML file with release groups and keywords\n"
               "  -h, --help             Print help\n";
    }
    return render_help(std::nullopt);
}

std::string clean_interactive_path(const std::string& line) {
    constexpr const char* WHITESPACE = " \t\r\n";
    auto begin = line.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = line.find_last_not_of(WHITESPACE);
    std::string result = line.substr(begin, end - begin + 1);

    // Пути, перетащенные в терминал, приходят в кавычках
    auto quote_begin = result.find_first_not_of("\"'");
    if (quote_begin == std::string::npos) {
        return {};
    }
    auto quote_end = result.find_last_not_of("\"'");
    return result.substr(quote_begin, quote_end - quote_begin + 1);
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: help в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        MAIN_USAGE);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "rename")) {
        parse_rename(argc, argv, cmd_idx, result);
    } else if (str_eq(cmd, "classify")) {
        parse_classify(argc, argv, cmd_idx, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        usage_error(result, std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace anirename::cli
