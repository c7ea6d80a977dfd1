// ==============================================================================
// cache.cpp - Кэш классификации по директориям
// ==============================================================================

#include "anirename/cache.hpp"

namespace anirename::rename {

std::optional<CachedClassification> ClassificationCache::get(const std::string& directory) const {
    auto it = entries_.find(directory);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ClassificationCache::put(const std::string& directory, CachedClassification entry) {
    entries_[directory] = std::move(entry);
}

}  // namespace anirename::rename
