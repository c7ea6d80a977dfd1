// ==============================================================================
// config.cpp - Конфигурация (YAML)
// ==============================================================================

#include "anirename/config.hpp"

#include "anirename/platform.hpp"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace anirename::config {

namespace {

/// Прочитать последовательность строк по ключу.
/// Отсутствующий ключ - не ошибка (nullopt); не-последовательность - ошибка
bool read_string_list(const YAML::Node& root, const char* key,
                      std::optional<std::vector<std::string>>& out, std::string& error) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return true;
    }
    if (!node.IsSequence()) {
        error = std::string("'") + key + "' must be a list of strings";
        return false;
    }

    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            error = std::string("'") + key + "' must be a list of strings";
            return false;
        }
        auto value = item.as<std::string>();
        if (!value.empty()) {
            values.push_back(std::move(value));
        }
    }
    out = std::move(values);
    return true;
}

ConfigResult parse_root(const YAML::Node& root) {
    ConfigResult result;

    // Пустой файл - пустая конфигурация
    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = "configuration root must be a mapping";
        return result;
    }

    std::optional<std::vector<std::string>> extra_groups;
    std::optional<std::vector<std::string>> extra_keywords;
    std::optional<std::vector<std::string>> extensions;

    if (!read_string_list(root, "release_groups", result.config.release_groups, result.error) ||
        !read_string_list(root, "extra_release_groups", extra_groups, result.error) ||
        !read_string_list(root, "technical_keywords", result.config.technical_keywords,
                          result.error) ||
        !read_string_list(root, "extra_technical_keywords", extra_keywords, result.error) ||
        !read_string_list(root, "extensions", extensions, result.error)) {
        return result;
    }

    result.config.extra_release_groups = extra_groups.value_or(std::vector<std::string>{});
    result.config.extra_technical_keywords = extra_keywords.value_or(std::vector<std::string>{});

    // Расширения хранятся без точки
    for (auto ext : extensions.value_or(std::vector<std::string>{})) {
        if (ext.front() == '.') {
            ext.erase(0, 1);
        }
        if (!ext.empty()) {
            result.config.extensions.push_back(std::move(ext));
        }
    }

    result.ok = true;
    return result;
}

}  // namespace

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open config file: " + platform::path_to_utf8(path);
            return result;
        }

        result = parse_root(YAML::Load(file));
        if (!result.ok) {
            result.error = platform::path_to_utf8(path) + ": " + result.error;
        }
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult parse_config(const std::string& yaml_text) {
    try {
        return parse_root(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

classify::Vocabulary apply_config(const Config& config, const classify::Vocabulary& base) {
    classify::Vocabulary vocabulary = base;

    if (config.release_groups) {
        vocabulary.release_groups = *config.release_groups;
    }
    vocabulary.release_groups.insert(vocabulary.release_groups.end(),
                                     config.extra_release_groups.begin(),
                                     config.extra_release_groups.end());

    if (config.technical_keywords) {
        vocabulary.technical_keywords = *config.technical_keywords;
    }
    vocabulary.technical_keywords.insert(vocabulary.technical_keywords.end(),
                                         config.extra_technical_keywords.begin(),
                                         config.extra_technical_keywords.end());

    vocabulary.release_groups = classify::dedupe_preserving_order(vocabulary.release_groups);
    vocabulary.technical_keywords =
        classify::dedupe_preserving_order(vocabulary.technical_keywords);
    return vocabulary;
}

}  // namespace anirename::config
