// ==============================================================================
// anirename/rename.hpp - Оркестрация переименования
// ==============================================================================
//
// Назначение:
// - FileMover: внешний исполнитель переименования (ФС или тестовый двойник)
// - RenameOrchestrator: классификация файла с учётом кэша директории,
//   построение канонического имени, делегирование переименования
// - run(): обход входных путей, очистка кэша при входе в каждую директорию,
//   отчёт по каждому файлу через Reporter
//
// Ошибка одного файла никогда не прерывает пакет.
//
// ==============================================================================

#ifndef ANIRENAME_RENAME_HPP
#define ANIRENAME_RENAME_HPP

#include "anirename/cache.hpp"
#include "anirename/classify.hpp"
#include "anirename/discovery.hpp"
#include "anirename/vocabulary.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace anirename::rename {

// ----------------------------------------------------------------------------
// FileMover - физическое переименование
// ----------------------------------------------------------------------------

struct MoveResult {
    bool ok = false;
    std::string error;  // причина при ok == false
};

class FileMover {
public:
    virtual ~FileMover() = default;

    /// Переименовать from -> to. Не перезаписывает существующий файл.
    virtual MoveResult move(const std::filesystem::path& from,
                            const std::filesystem::path& to) = 0;
};

/// Переименование через std::filesystem (std::error_code, без исключений)
class FilesystemMover : public FileMover {
public:
    MoveResult move(const std::filesystem::path& from, const std::filesystem::path& to) override;
};

// ----------------------------------------------------------------------------
// RenameOutcome - результат обработки одного файла
// ----------------------------------------------------------------------------

enum class Status {
    Renamed,    // файл переименован
    Unchanged,  // имя уже каноническое
    Planned,    // --dry-run: переименование только запланировано
    Failed      // переименование не удалось
};

/// "renamed", "unchanged", "planned", "failed"
const char* status_name(Status status);

struct RenameOutcome {
    std::filesystem::path source;
    std::filesystem::path target;
    classify::Classification classification;
    Status status = Status::Failed;
    std::string error;
    bool cache_hit = false;  // title/season/group взяты из кэша директории
};

// ----------------------------------------------------------------------------
// Reporter - получатель событий прогона
// ----------------------------------------------------------------------------

class Reporter {
public:
    virtual ~Reporter() = default;

    /// Вход в директорию (кэш уже очищен)
    virtual void on_directory(const io::DirectoryBatch& batch) { (void)batch; }

    /// Результат по файлу; вызывается сразу после обработки
    virtual void on_outcome(const RenameOutcome& outcome) = 0;

    /// Путь не является ни файлом, ни директорией
    virtual void on_invalid_input(const std::filesystem::path& input) = 0;

    /// Нефатальные проблемы обхода (skip_errors)
    virtual void on_warning(std::string_view message) { (void)message; }

    /// Обход входной директории прерван ошибкой чтения; прогон продолжается
    virtual void on_walk_error(const std::filesystem::path& input, std::string_view message) {
        (void)input;
        (void)message;
    }
};

// ----------------------------------------------------------------------------
// RunSummary
// ----------------------------------------------------------------------------

struct RunSummary {
    std::size_t renamed = 0;
    std::size_t unchanged = 0;
    std::size_t planned = 0;
    std::size_t failed = 0;
    std::size_t invalid_inputs = 0;
    std::size_t unreadable_inputs = 0;  // обход директории прерван ошибкой

    void add(const RenameOutcome& outcome);

    /// Количество обработанных файлов
    std::size_t total() const { return renamed + unchanged + planned + failed; }
};

// ----------------------------------------------------------------------------
// RenameOrchestrator
// ----------------------------------------------------------------------------

struct RenameOptions {
    bool dry_run = false;
    /// Не переклассифицировать файлы, уже имеющие каноническое имя
    bool skip_canonical = true;
    io::DiscoveryOptions discovery;
};

class RenameOrchestrator {
public:
    RenameOrchestrator(classify::Vocabulary vocabulary, FileMover& mover,
                       RenameOptions options = {});
    virtual ~RenameOrchestrator() = default;

    /// Обработать один файл. Эпизод вычисляется всегда, остальное берётся
    /// из кэша директории файла или вычисляется и кладётся в кэш.
    RenameOutcome process(const std::filesystem::path& file, ClassificationCache& cache);

    /// Обработать входные пути по очереди.
    /// Файл получает пустой кэш; директория обходится рекурсивно с очисткой
    /// кэша при входе в каждую директорию.
    ///
    /// Ошибка чтения директории (без skip_errors) отменяет переименования
    /// только этого входного пути: on_walk_error, затем следующий путь.
    RunSummary run(const std::vector<std::filesystem::path>& inputs, Reporter& reporter);

    const classify::Vocabulary& vocabulary() const { return vocabulary_; }
    const RenameOptions& options() const { return options_; }

protected:
    /// Обход директории; @throws std::runtime_error (см. io::walk_directories)
    virtual io::WalkResult walk(const std::filesystem::path& root) const;

private:
    void process_batch(const io::DirectoryBatch& batch, ClassificationCache& cache,
                       Reporter& reporter, RunSummary& summary);

    classify::Vocabulary vocabulary_;
    FileMover& mover_;
    RenameOptions options_;
};

}  // namespace anirename::rename

#endif  // ANIRENAME_RENAME_HPP
