// ==============================================================================
// anirename/report.hpp - Отчёт о переименовании
// ==============================================================================
//
// Назначение:
// - ConsoleReporter: rename::Reporter поверх output::Writer
//   (текст, JSON массив или JSONL)
// - Сериализация результатов и классификаций в JSON (RapidJSON)
//
// ==============================================================================

#ifndef ANIRENAME_REPORT_HPP
#define ANIRENAME_REPORT_HPP

#include "anirename/classify.hpp"
#include "anirename/output.hpp"
#include "anirename/rename.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace anirename::report {

using JsonAllocator = rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>;

/// {"title", "season", "episode", "release_group"} в объект out
void classification_to_json(const classify::Classification& c, rapidjson::Value& out,
                            JsonAllocator& alloc);

/// {"source", "target", "status", "cache_hit", "classification", "error"?}
void outcome_to_json(const rename::RenameOutcome& outcome, rapidjson::Value& out,
                     JsonAllocator& alloc);

/// Текстовая строка результата: "old -> new" / "old -> new - cause"
std::string format_outcome(const rename::RenameOutcome& outcome);

// ----------------------------------------------------------------------------
// ConsoleReporter
// ----------------------------------------------------------------------------

class ConsoleReporter : public rename::Reporter {
public:
    explicit ConsoleReporter(output::Writer& writer);

    /// Открыть отчёт ("[" для JSON)
    void begin();

    /// Закрыть отчёт и вывести итог
    void finish(const rename::RunSummary& summary);

    void on_directory(const io::DirectoryBatch& batch) override;
    void on_outcome(const rename::RenameOutcome& outcome) override;
    void on_invalid_input(const std::filesystem::path& input) override;
    void on_warning(std::string_view message) override;
    void on_walk_error(const std::filesystem::path& input, std::string_view message) override;

private:
    output::Writer& writer_;
    output::Format format_;
    std::size_t json_items_ = 0;
};

}  // namespace anirename::report

#endif  // ANIRENAME_REPORT_HPP
