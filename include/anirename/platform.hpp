// ==============================================================================
// anirename/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Имя платформы для отладочного вывода
//
// Платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef ANIRENAME_PLATFORM_HPP
#define ANIRENAME_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace anirename::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, YAML, stdin)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для вывода и ключей кэша)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

}  // namespace anirename::platform

#endif  // ANIRENAME_PLATFORM_HPP
