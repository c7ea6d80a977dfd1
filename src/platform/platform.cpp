// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Имена файлов релизов часто содержат CJK символы, поэтому все пути
// проходят через явные UTF-8 преобразования (u8path / u8string).
//
// ==============================================================================

#include "anirename/platform.hpp"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace anirename::platform {

namespace {

bool is_tty(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // На Windows u8path перекодирует в UTF-16, на POSIX байты сохраняются
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    // C++17: u8string() возвращает std::string
    return p.u8string();
}

bool is_tty_stdout() {
    return is_tty(stdout);
}

bool is_tty_stderr() {
    return is_tty(stderr);
}

std::string os_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace anirename::platform
