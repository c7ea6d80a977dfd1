// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "anirename/classify.hpp"
#include "anirename/cli.hpp"
#include "anirename/config.hpp"
#include "anirename/output.hpp"
#include "anirename/platform.hpp"
#include "anirename/rename.hpp"
#include "anirename/report.hpp"
#include "anirename/vocabulary.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <unordered_set>

namespace {

constexpr const char* BANNER = R"(
  +-+-+-+-+-+-+-+-+-+
  |a|n|i|r|e|n|a|m|e|
  +-+-+-+-+-+-+-+-+-+
)";

void print_banner(anirename::output::Writer& writer) {
    const auto& cfg = writer.config();
    if (cfg.no_banner || cfg.quiet) {
        return;
    }
    writer.write(anirename::output::Stream::Stderr, BANNER);
    writer.write_line(anirename::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Словарь: встроенный + --config
// ----------------------------------------------------------------------------

/// Загрузить словарь; nullopt - ошибка уже выведена
std::optional<anirename::classify::Vocabulary> load_vocabulary(
    const std::optional<std::filesystem::path>& config_path, anirename::output::Writer& writer,
    std::vector<std::string>* extensions) {
    using namespace anirename;

    if (!config_path.has_value()) {
        return classify::default_vocabulary();
    }

    config::ConfigResult loaded = config::load_config(*config_path);
    if (!loaded.ok) {
        writer.error(loaded.error);
        return std::nullopt;
    }

    classify::Vocabulary vocabulary =
        config::apply_config(loaded.config, classify::default_vocabulary());
    writer.debug("Loaded config " + platform::path_to_utf8(*config_path) + ": " +
                 std::to_string(vocabulary.release_groups.size()) + " release groups, " +
                 std::to_string(vocabulary.technical_keywords.size()) + " technical keywords");

    if (extensions != nullptr) {
        *extensions = loaded.config.extensions;
    }
    return vocabulary;
}

// ----------------------------------------------------------------------------
// rename
// ----------------------------------------------------------------------------

int run_rename(anirename::cli::RenameCommand cmd, anirename::output::Writer& writer) {
    using namespace anirename;

    std::vector<std::string> config_extensions;
    auto vocabulary = load_vocabulary(cmd.config, writer, &config_extensions);
    if (!vocabulary) {
        return 1;
    }

    // Путь не передан - спрашиваем интерактивно
    if (cmd.paths.empty()) {
        writer.write(output::Stream::Stderr, "Enter a file or folder path: ");
        writer.flush();
        std::string line;
        if (!std::getline(std::cin, line)) {
            writer.error("No path provided");
            return 1;
        }
        std::string cleaned = cli::clean_interactive_path(line);
        if (cleaned.empty()) {
            writer.error("No path provided");
            return 1;
        }
        cmd.paths.push_back(platform::path_from_utf8(cleaned));
    }

    rename::RenameOptions options;
    options.dry_run = cmd.dry_run;
    options.skip_canonical = !cmd.reclassify;
    options.discovery.skip_errors = cmd.skip_errors;
    // Расширения из командной строки важнее конфигурации
    const auto& extensions = cmd.extensions.empty() ? config_extensions : cmd.extensions;
    if (!extensions.empty()) {
        options.discovery.extensions =
            std::unordered_set<std::string>(extensions.begin(), extensions.end());
    }

    // Отчёт в файл - отдельный Writer
    output::OutputConfig out_cfg = writer.config();
    out_cfg.format = cmd.json ? output::Format::Json
                              : (cmd.jsonl ? output::Format::Jsonl : output::Format::Std);
    out_cfg.output_path = cmd.output;
    output::Writer report_writer(out_cfg);
    if (cmd.output.has_value() && !report_writer.has_output_file()) {
        writer.error("Unable to write to specified output file - " +
                     platform::path_to_utf8(*cmd.output));
        return 1;
    }

    std::string paths_str;
    for (size_t i = 0; i < cmd.paths.size(); ++i) {
        if (i > 0) {
            paths_str += ", ";
        }
        paths_str += platform::path_to_utf8(cmd.paths[i]);
    }
    writer.info(std::string(cmd.dry_run ? "Planning renames for: " : "Renaming files in: ") +
                paths_str);
    writer.debug("Platform: " + platform::os_name());

    rename::FilesystemMover mover;
    rename::RenameOrchestrator orchestrator(std::move(*vocabulary), mover, options);

    report::ConsoleReporter reporter(report_writer);
    reporter.begin();
    rename::RunSummary summary = orchestrator.run(cmd.paths, reporter);
    reporter.finish(summary);

    // Ни один входной путь не удалось обработать - ошибка
    if (summary.invalid_inputs + summary.unreadable_inputs == cmd.paths.size()) {
        return 1;
    }
    return 0;
}

// ----------------------------------------------------------------------------
// classify
// ----------------------------------------------------------------------------

int run_classify(const anirename::cli::ClassifyCommand& cmd, anirename::output::Writer& writer) {
    using namespace anirename;

    auto vocabulary = load_vocabulary(cmd.config, writer, nullptr);
    if (!vocabulary) {
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& name : cmd.names) {
            std::filesystem::path p = platform::path_from_utf8(name);
            auto c = classify::classify_name(platform::path_to_utf8(p.stem()), *vocabulary);

            rapidjson::Value item;
            report::classification_to_json(c, item, alloc);
            std::string canonical =
                classify::canonical_name(c, platform::path_to_utf8(p.extension()));
            item.AddMember("input", rapidjson::Value(name.c_str(), alloc).Move(), alloc);
            item.AddMember("canonical", rapidjson::Value(canonical.c_str(), alloc).Move(), alloc);
            doc.PushBack(item, alloc);
        }
        writer.write_json(doc, output::JsonStyle::Pretty);
        writer.write(output::Stream::Stdout, "\n");
        return 0;
    }

    output::Table table;
    table.set_headers({"Input", "Title", "Season", "Episode", "Release group", "Canonical name"});
    for (const auto& name : cmd.names) {
        std::filesystem::path p = platform::path_from_utf8(name);
        auto c = classify::classify_name(platform::path_to_utf8(p.stem()), *vocabulary);
        table.add_row({name, c.title, c.season, c.episode, c.release_group,
                       classify::canonical_name(c, platform::path_to_utf8(p.extension()))});
    }
    table.print(writer);
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace anirename;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RenameCommand>) {
                print_banner(writer);
                return run_rename(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::ClassifyCommand>) {
                return run_classify(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
