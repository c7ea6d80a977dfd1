// ==============================================================================
// anirename/cache.hpp - Кэш классификации по директориям
// ==============================================================================
//
// Назначение:
// - Мемоизация {title, season, release_group} для файлов одной директории
// - Эпизод не кэшируется: он свой у каждого файла
//
// Время жизни записи: от первого файла директории до входа обходчика в
// следующую директорию (clear()). Между запусками не сохраняется.
// Потокобезопасности нет: обход строго последовательный.
//
// ==============================================================================

#ifndef ANIRENAME_CACHE_HPP
#define ANIRENAME_CACHE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace anirename::rename {

/// Часть классификации, общая для директории
struct CachedClassification {
    std::string title;
    std::string season;
    std::string release_group;
};

class ClassificationCache {
public:
    /// Найти запись для директории (ключ - путь директории в UTF-8)
    std::optional<CachedClassification> get(const std::string& directory) const;

    void put(const std::string& directory, CachedClassification entry);

    void clear() { entries_.clear(); }

    std::size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, CachedClassification> entries_;
};

}  // namespace anirename::rename

#endif  // ANIRENAME_CACHE_HPP
