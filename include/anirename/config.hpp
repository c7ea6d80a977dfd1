// ==============================================================================
// anirename/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка YAML-файла конфигурации (--config)
// - Применение к встроенному словарю
//
// Формат:
//   release_groups: [...]            # заменяет встроенный реестр
//   extra_release_groups: [...]      # дополняет реестр
//   technical_keywords: [...]        # заменяет встроенные метки
//   extra_technical_keywords: [...]  # дополняет метки
//   extensions: [mkv, mp4]           # фильтр расширений по умолчанию
//
// Неизвестные ключи игнорируются.
//
// ==============================================================================

#ifndef ANIRENAME_CONFIG_HPP
#define ANIRENAME_CONFIG_HPP

#include "anirename/vocabulary.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace anirename::config {

struct Config {
    std::optional<std::vector<std::string>> release_groups;
    std::vector<std::string> extra_release_groups;
    std::optional<std::vector<std::string>> technical_keywords;
    std::vector<std::string> extra_technical_keywords;
    std::vector<std::string> extensions;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML-текста
ConfigResult parse_config(const std::string& yaml_text);

/// Построить словарь: base + замены/дополнения из config (без повторов)
classify::Vocabulary apply_config(const Config& config, const classify::Vocabulary& base);

}  // namespace anirename::config

#endif  // ANIRENAME_CONFIG_HPP
