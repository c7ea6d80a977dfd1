// ==============================================================================
// anirename/vocabulary.hpp - Словари классификатора
// ==============================================================================
//
// Назначение:
// - TechnicalKeywordSet: метки качества/кодеков/контейнеров
// - ReleaseGroupRegistry: известные группы релизов
// - Встроенные значения по умолчанию
//
// Словари передаются в классификатор явно (значением или const&),
// глобального изменяемого состояния нет.
//
// ==============================================================================

#ifndef ANIRENAME_VOCABULARY_HPP
#define ANIRENAME_VOCABULARY_HPP

#include <string>
#include <vector>

namespace anirename::classify {

// ----------------------------------------------------------------------------
// Vocabulary - неизменяемая конфигурация классификатора
// ----------------------------------------------------------------------------

struct Vocabulary {
    /// Порядок значим: ключевые слова удаляются последовательно
    /// ("web-dl" и "webrip" раньше "web")
    std::vector<std::string> technical_keywords;

    /// Порядок значим: при нескольких совпадениях группы склеиваются через '&'
    /// в порядке реестра
    std::vector<std::string> release_groups;
};

/// Встроенный словарь
const Vocabulary& default_vocabulary();

/// Удалить повторы (точное сравнение), сохранив первое вхождение
std::vector<std::string> dedupe_preserving_order(const std::vector<std::string>& items);

// ----------------------------------------------------------------------------
// Значения по умолчанию при деградации классификации
// ----------------------------------------------------------------------------

constexpr const char* UNKNOWN_GROUP = "UNKnownSub";
constexpr const char* UNKNOWN_TITLE = "UnknownAnime";
constexpr const char* DEFAULT_SEASON = "01";
constexpr const char* DEFAULT_EPISODE = "01";

}  // namespace anirename::classify

#endif  // ANIRENAME_VOCABULARY_HPP
