// ==============================================================================
// anirename/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (в стиле clap, exit code 2)
//
// ==============================================================================

#ifndef ANIRENAME_CLI_HPP
#define ANIRENAME_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace anirename::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// rename - переименование файлов на месте
struct RenameCommand {
    std::vector<std::filesystem::path> paths;     // пусто = спросить в stdin
    bool dry_run = false;                         // -n, --dry-run
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> config;  // -c, --config
    std::vector<std::string> extensions;          // --extension
    bool skip_errors = false;                     // --skip-errors
    bool reclassify = false;                      // --reclassify
};

/// classify - классификация имён без обращения к ФС
struct ClassifyCommand {
    std::vector<std::string> names;
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> config;  // -c, --config
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RenameCommand, ClassifyCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Снять пробелы и кавычки вокруг пути, введённого интерактивно
std::string clean_interactive_path(const std::string& line);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Rename anime release files to a canonical form";

}  // namespace anirename::cli

#endif  // ANIRENAME_CLI_HPP
