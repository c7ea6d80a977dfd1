// ==============================================================================
// anirename/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветные строки результатов (ANSI, только на TTY)
// - JSON отчёт (RapidJSON)
// - Таблица классификации (Unicode box-drawing)
// - Отчёт в файл (--output)
//
// Диагностика всегда уходит в stderr, отчёт - в stdout или файл.
//
// ==============================================================================

#ifndef ANIRENAME_OUTPUT_HPP
#define ANIRENAME_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace anirename::output {

enum class Stream { Stdout, Stderr };

/// Формат отчёта rename
enum class Format {
    Std,   // Текст
    Json,  // JSON массив
    Jsonl  // JSON Lines (один объект на строку)
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

/// Уровень диагностического сообщения
enum class Level {
    Error,  // [x] всегда
    Warn,   // [!] кроме -q
    Info,   // [+] кроме -q
    Debug,  // [*] при -v
    Trace   // [~] при -vv
};

enum class JsonStyle {
    Compact,  // одна строка без перевода строки
    Line,     // одна строка + '\n' (JSONL)
    Pretty    // отступ 2 пробела, без завершающего '\n'
};

struct OutputConfig {
    bool quiet = false;      // -q
    int verbose = 0;         // -v, -vv
    bool no_banner = false;  // --no-banner
    Format format = Format::Std;

    /// --output: stdout отчёта перенаправляется в файл
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    /// Открывает output_path, если он задан (см. has_output_file())
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Сообщение уровня level в stderr (с учётом -q / -v)
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    /// Строка отчёта в stdout; цвет только на TTY и не в файл
    void colored_line(Color color, std::string_view message);

    void write_json(const rapidjson::Value& value, JsonStyle style = JsonStyle::Compact);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const;
    };

    bool enabled(Level level) const;

    std::FILE* target(Stream s) const;

    OutputConfig config_;
    std::unique_ptr<std::FILE, FileCloser> output_file_;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(std::vector<std::string> headers) { headers_ = std::move(headers); }

    void add_row(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    /// Таблица целиком, каждая строка завершается '\n'
    std::string to_string() const;

    void print(Writer& w) const { w.write(Stream::Stdout, to_string()); }

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

/// Ширина строки на экране (кодовые точки UTF-8)
size_t display_width(std::string_view s);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace anirename::output

#endif  // ANIRENAME_OUTPUT_HPP
