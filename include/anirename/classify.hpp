// ==============================================================================
// anirename/classify.hpp - Полный конвейер классификации
// ==============================================================================

#ifndef ANIRENAME_CLASSIFY_HPP
#define ANIRENAME_CLASSIFY_HPP

#include "anirename/vocabulary.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace anirename::classify {

struct Classification {
    std::string title;
    std::string season;         // две цифры
    std::string release_group;
    std::string episode;        // две цифры
};

/// Классифицировать базовое имя файла (без расширения), без кэша
Classification classify_name(std::string_view base_name, const Vocabulary& vocabulary);

/// "{title} - S{season}E{episode} - {release_group}{extension}"
std::string canonical_name(const Classification& c, std::string_view extension);

/// Разобрать имя, уже приведённое к канонической форме (без расширения).
/// nullopt, если base_name не имеет вида "{title} - SxxEyy - {group}"
std::optional<Classification> parse_canonical_name(std::string_view base_name);

}  // namespace anirename::classify

#endif  // ANIRENAME_CLASSIFY_HPP
