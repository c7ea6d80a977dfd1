// ==============================================================================
// anirename/identify.hpp - Эвристики идентификации
// ==============================================================================
//
// Назначение:
// - identify_group(): группа релиза (реестр -> "sub"/"studio" -> первый сегмент)
// - identify_season(): номер сезона, "01" по умолчанию
// - identify_episode(): номер эпизода, каскад шаблонов, "01" по умолчанию
// - identify_title(): название (самый длинный сегмент после очистки)
//
// Все функции чистые и тотальные: любой вход даёт определённый результат,
// исключения не выбрасываются.
//
// ==============================================================================

#ifndef ANIRENAME_IDENTIFY_HPP
#define ANIRENAME_IDENTIFY_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace anirename::classify {

// ----------------------------------------------------------------------------
// Каскад шаблонов эпизода
// ----------------------------------------------------------------------------

/// Шаблон эпизода: регулярное выражение + номер группы с числом
struct EpisodePattern {
    std::string name;
    std::regex pattern;
    std::size_t group = 1;

    /// Совпадение не должно примыкать к буквам и цифрам (включая иероглифы)
    bool standalone = false;
};

/// Шаблоны в порядке приоритета: E/Ep, 第NN话, диапазон NN-NN, голое число
const std::vector<EpisodePattern>& episode_patterns();

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

std::string identify_group(std::string_view cleaned, const std::vector<std::string>& segments,
                           const std::vector<std::string>& registry);

/// Всегда две цифры
std::string identify_season(std::string_view cleaned);

/// Всегда две цифры
std::string identify_episode(std::string_view cleaned);

std::string identify_title(const std::vector<std::string>& segments,
                           const std::vector<std::string>& registry);

/// Дополнить число нулями слева до двух цифр
std::string pad2(std::string_view digits);

}  // namespace anirename::classify

#endif  // ANIRENAME_IDENTIFY_HPP
