// ==============================================================================
// anirename/normalize.hpp - Нормализация и токенизация имён файлов
// ==============================================================================
//
// Назначение:
// - normalize(): удаление хэша релиза [XXXXXXXX], технических меток,
//   схлопывание пустых скобок и пробелов
// - tokenize(): замена разделителей на '|' и разбиение на сегменты
// - ASCII case-insensitive утилиты, общие для классификатора
//
// ==============================================================================

#ifndef ANIRENAME_NORMALIZE_HPP
#define ANIRENAME_NORMALIZE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace anirename::classify {

/// Символ, на который заменяются все разделители
constexpr char SEGMENT_SEPARATOR = '|';

/// Класс разделителей сегментов
constexpr std::string_view DELIMITERS = ".-_[]()&/";

// ----------------------------------------------------------------------------
// Tokens - результат токенизации
// ----------------------------------------------------------------------------

struct Tokens {
    /// Очищенное имя с разделителями, заменёнными на SEGMENT_SEPARATOR
    std::string display;
    /// Непустые, обрезанные, не чисто технические сегменты (порядок сохранён)
    std::vector<std::string> segments;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Очистить имя файла (без расширения).
/// Ключевые слова удаляются как подстроки, без границ слов: соседние
/// символы могут пострадать ("Webster" -> "ster").
std::string normalize(std::string_view raw, const std::vector<std::string>& keywords);

/// Разбить очищенное имя на сегменты
Tokens tokenize(std::string_view cleaned, const std::vector<std::string>& keywords);

// ----------------------------------------------------------------------------
// Строковые утилиты (ASCII)
// ----------------------------------------------------------------------------

std::string to_lower_ascii(std::string_view s);

/// Обрезать пробельные символы по краям
std::string trim(std::string_view s);

/// Содержит ли haystack подстроку needle без учёта регистра
bool contains_icase(std::string_view haystack, std::string_view needle);

/// Удалить все вхождения needle без учёта регистра (один проход слева направо)
std::string erase_all_icase(std::string_view text, std::string_view needle);

}  // namespace anirename::classify

#endif  // ANIRENAME_NORMALIZE_HPP
