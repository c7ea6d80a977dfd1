// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется.
//
// ==============================================================================

#include "anirename/output.hpp"

#include "anirename/platform.hpp"

#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace anirename::output {

namespace {

constexpr std::string_view RESET = "\x1b[0m";

std::string_view sgr(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return {};
}

struct LevelStyle {
    std::string_view prefix;
    Color color;
};

LevelStyle style_of(Level level) {
    switch (level) {
    case Level::Error:
        return {"[x] ", Color::Red};
    case Level::Warn:
        return {"[!] ", Color::Yellow};
    case Level::Info:
        return {"[+] ", Color::Green};
    case Level::Debug:
        return {"[*] ", Color::Cyan};
    case Level::Trace:
        break;
    }
    return {"[~] ", Color::Magenta};
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

void Writer::FileCloser::operator()(std::FILE* f) const {
    if (f != nullptr) {
        std::fclose(f);
    }
}

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (!config_.output_path) {
        return;
    }
#ifdef _WIN32
    output_file_.reset(_wfopen(config_.output_path->c_str(), L"wb"));
#else
    output_file_.reset(std::fopen(config_.output_path->c_str(), "wb"));
#endif
}

Writer::~Writer() {
    flush();
}

std::FILE* Writer::target(Stream s) const {
    if (s == Stream::Stderr) {
        return stderr;
    }
    return output_file_ ? output_file_.get() : stdout;
}

void Writer::write(Stream s, std::string_view bytes) {
    if (!bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), target(s));
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warn:
    case Level::Info:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose >= 1;
    case Level::Trace:
        return config_.verbose >= 2;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    LevelStyle style = style_of(level);
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, sgr(style.color));
        write(Stream::Stderr, style.prefix);
        write(Stream::Stderr, RESET);
    } else {
        write(Stream::Stderr, style.prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::colored_line(Color color, std::string_view message) {
    // В файл отчёта ANSI коды не попадают
    bool colored = color != Color::Default && !output_file_ && supports_color(Stream::Stdout);
    if (colored) {
        write(Stream::Stdout, sgr(color));
        write(Stream::Stdout, message);
        write(Stream::Stdout, RESET);
    } else {
        write(Stream::Stdout, message);
    }
    write(Stream::Stdout, "\n");
}

void Writer::write_json(const rapidjson::Value& value, JsonStyle style) {
    rapidjson::StringBuffer buffer;
    if (style == JsonStyle::Pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> json(buffer);
        json.SetIndent(' ', 2);
        value.Accept(json);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> json(buffer);
        value.Accept(json);
    }

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    if (style == JsonStyle::Line) {
        write(Stream::Stdout, "\n");
    }
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_) {
        std::fflush(output_file_.get());
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

std::string Table::to_string() const {
    // Box-drawing (UTF-8)
    constexpr std::string_view V = "\xe2\x94\x82";  // │
    constexpr std::string_view H = "\xe2\x94\x80";  // ─

    size_t columns = headers_.size();
    for (const auto& row : rows_) {
        columns = std::max(columns, row.size());
    }

    std::vector<size_t> widths(columns, 0);
    auto widen = [&widths](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    widen(headers_);
    for (const auto& row : rows_) {
        widen(row);
    }

    std::string out;
    auto rule = [&](std::string_view left, std::string_view joint, std::string_view right) {
        out += left;
        for (size_t i = 0; i < columns; ++i) {
            for (size_t j = 0; j < widths[i] + 2; ++j) {
                out += H;
            }
            out += (i + 1 < columns) ? joint : right;
        }
        if (columns == 0) {
            out += right;
        }
        out += '\n';
    };
    auto cells = [&](const std::vector<std::string>& row) {
        out += V;
        for (size_t i = 0; i < columns; ++i) {
            std::string_view cell = i < row.size() ? std::string_view(row[i]) : std::string_view();
            out += ' ';
            out += cell;
            out.append(widths[i] - display_width(cell) + 1, ' ');
            out += V;
        }
        out += '\n';
    };

    rule("\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90");  // ┌ ┬ ┐
    if (!headers_.empty()) {
        cells(headers_);
        rule("\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4");  // ├ ┼ ┤
    }
    for (const auto& row : rows_) {
        cells(row);
    }
    rule("\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98");  // └ ┴ ┘
    return out;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

size_t display_width(std::string_view s) {
    // Байты продолжения UTF-8 (10xxxxxx) не занимают позиции
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

bool supports_color(Stream s) {
    return (s == Stream::Stdout) ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace anirename::output
