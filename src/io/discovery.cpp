// ==============================================================================
// discovery.cpp - Обход директорий
// ==============================================================================

#include "anirename/discovery.hpp"

#include "anirename/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace anirename::io {

namespace {

/// Сообщить об ошибке: предупреждение при skip_errors, иначе исключение.
/// Возвращает управление только в режиме skip_errors
void report_failure(const std::string& message, bool skip_errors, WalkResult& result) {
    if (!skip_errors) {
        throw std::runtime_error(message);
    }
    result.warnings.push_back(message);
}

/// Рекурсивно обходит директорию (pre-order)
void walk_recursive(const std::filesystem::path& dir, const DiscoveryOptions& opt,
                    WalkResult& result) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(dir, ec);
    if (ec) {
        report_failure("failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                           ec.message(),
                       opt.skip_errors, result);
        return;
    }

    DirectoryBatch batch;
    batch.directory = dir;
    std::vector<std::filesystem::path> subdirs;

    const std::filesystem::directory_iterator end;
    for (auto it = dir_iter; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;

        std::error_code entry_ec;
        bool is_link = entry.is_symlink(entry_ec);
        bool is_dir = !entry_ec && entry.is_directory(entry_ec);
        bool is_file = !entry_ec && !is_dir && entry.is_regular_file(entry_ec);
        if (entry_ec) {
            report_failure("failed to get metadata for '" + platform::path_to_utf8(entry.path()) +
                               "' - " + entry_ec.message(),
                           opt.skip_errors, result);
            continue;
        }

        if (is_dir) {
            // Ссылки на директории не обходим: защита от циклов
            if (!is_link) {
                subdirs.push_back(entry.path());
            }
        } else if (is_file && matches_extensions(entry.path(), opt.extensions)) {
            batch.files.push_back(entry.path());
        }
        // Прочие специальные файлы игнорируются
    }

    if (ec) {
        report_failure("failed to enter directory '" + platform::path_to_utf8(dir) + "' - " +
                           ec.message(),
                       opt.skip_errors, result);
    }

    std::sort(batch.files.begin(), batch.files.end());
    std::sort(subdirs.begin(), subdirs.end());

    if (!batch.files.empty()) {
        result.batches.push_back(std::move(batch));
    }

    for (const auto& sub : subdirs) {
        walk_recursive(sub, opt, result);
    }
}

}  // namespace

std::size_t WalkResult::file_count() const {
    std::size_t total = 0;
    for (const auto& batch : batches) {
        total += batch.files.size();
    }
    return total;
}

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    // extension() возвращает расширение с точкой (".mkv")
    std::string ext = platform::path_to_utf8(file_path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return extensions->count(ext) > 0;
}

WalkResult walk_directories(const std::filesystem::path& root, const DiscoveryOptions& opt) {
    WalkResult result;

    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(root, ec);
    if (ec || !is_dir) {
        report_failure("not a directory - " + platform::path_to_utf8(root), opt.skip_errors,
                       result);
        return result;
    }

    walk_recursive(root, opt, result);
    return result;
}

}  // namespace anirename::io
