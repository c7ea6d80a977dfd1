// ==============================================================================
// anirename/discovery.hpp - Обход директорий
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход дерева с группировкой файлов по директориям
// - Фильтрация по расширениям (без точки, case-sensitive)
// - Детерминированный порядок (сортировка по пути)
// - Режим skip_errors: ошибки чтения директорий становятся предупреждениями
//
// Список файлов строится целиком до начала переименования, поэтому
// переименование не влияет на обход.
//
// ==============================================================================

#ifndef ANIRENAME_DISCOVERY_HPP
#define ANIRENAME_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace anirename::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры обхода
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Допустимые расширения БЕЗ точки ("mkv", не ".mkv").
    /// nullopt означает все файлы
    std::optional<std::unordered_set<std::string>> extensions;

    /// true = ошибки чтения директорий становятся предупреждениями
    bool skip_errors = false;
};

// ----------------------------------------------------------------------------
// DirectoryBatch - файлы одной директории
// ----------------------------------------------------------------------------

struct DirectoryBatch {
    std::filesystem::path directory;
    std::vector<std::filesystem::path> files;  // отсортированы
};

struct WalkResult {
    /// Директории в pre-order: родитель раньше поддиректорий.
    /// Директории без подходящих файлов не попадают в результат
    std::vector<DirectoryBatch> batches;

    /// Предупреждения (только при skip_errors)
    std::vector<std::string> warnings;

    std::size_t file_count() const;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Проверить расширение файла по набору (nullopt = любой файл)
bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions);

/// Обойти директорию root рекурсивно.
/// Символические ссылки на директории не обходятся.
///
/// @throws std::runtime_error при ошибке чтения (если skip_errors=false)
WalkResult walk_directories(const std::filesystem::path& root, const DiscoveryOptions& opt);

}  // namespace anirename::io

#endif  // ANIRENAME_DISCOVERY_HPP
