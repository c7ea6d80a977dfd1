// ==============================================================================
// rename.cpp - Оркестрация переименования
// ==============================================================================

#include "anirename/rename.hpp"

#include "anirename/identify.hpp"
#include "anirename/normalize.hpp"
#include "anirename/platform.hpp"

#include <stdexcept>
#include <system_error>

namespace anirename::rename {

// ----------------------------------------------------------------------------
// FilesystemMover
// ----------------------------------------------------------------------------

MoveResult FilesystemMover::move(const std::filesystem::path& from,
                                 const std::filesystem::path& to) {
    MoveResult result;
    std::error_code ec;

    // POSIX rename() молча перезаписывает цель - проверяем заранее.
    // На case-insensitive ФС цель может быть тем же файлом.
    if (std::filesystem::exists(to, ec) && !std::filesystem::equivalent(from, to, ec)) {
        result.error = "target already exists";
        return result;
    }
    if (ec) {
        result.error = ec.message();
        return result;
    }

    std::filesystem::rename(from, to, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Status / RunSummary
// ----------------------------------------------------------------------------

const char* status_name(Status status) {
    switch (status) {
    case Status::Renamed:
        return "renamed";
    case Status::Unchanged:
        return "unchanged";
    case Status::Planned:
        return "planned";
    case Status::Failed:
    default:
        return "failed";
    }
}

void RunSummary::add(const RenameOutcome& outcome) {
    switch (outcome.status) {
    case Status::Renamed:
        ++renamed;
        break;
    case Status::Unchanged:
        ++unchanged;
        break;
    case Status::Planned:
        ++planned;
        break;
    case Status::Failed:
        ++failed;
        break;
    }
}

// ----------------------------------------------------------------------------
// RenameOrchestrator
// ----------------------------------------------------------------------------

RenameOrchestrator::RenameOrchestrator(classify::Vocabulary vocabulary, FileMover& mover,
                                       RenameOptions options)
    : vocabulary_(std::move(vocabulary)), mover_(mover), options_(std::move(options)) {}

RenameOutcome RenameOrchestrator::process(const std::filesystem::path& file,
                                          ClassificationCache& cache) {
    using namespace classify;

    RenameOutcome outcome;
    outcome.source = file;

    const std::filesystem::path directory = file.parent_path();
    const std::string dir_key = platform::path_to_utf8(directory);
    const std::string base = platform::path_to_utf8(file.stem());
    // Расширение (с точкой) не участвует в нормализации
    const std::string extension = platform::path_to_utf8(file.extension());

    // Повторный запуск по уже переименованной папке ничего не меняет
    if (options_.skip_canonical) {
        if (auto parsed = parse_canonical_name(base)) {
            outcome.classification = std::move(*parsed);
            outcome.target = file;
            outcome.status = Status::Unchanged;
            return outcome;
        }
    }

    const std::string cleaned = normalize(base, vocabulary_.technical_keywords);

    Classification& c = outcome.classification;
    if (auto cached = cache.get(dir_key)) {
        c.title = std::move(cached->title);
        c.season = std::move(cached->season);
        c.release_group = std::move(cached->release_group);
        outcome.cache_hit = true;
    } else {
        Tokens tokens = tokenize(cleaned, vocabulary_.technical_keywords);
        c.release_group = identify_group(cleaned, tokens.segments, vocabulary_.release_groups);
        c.season = identify_season(cleaned);
        c.title = identify_title(tokens.segments, vocabulary_.release_groups);
        cache.put(dir_key, CachedClassification{c.title, c.season, c.release_group});
    }
    c.episode = identify_episode(cleaned);

    outcome.target = directory / platform::path_from_utf8(canonical_name(c, extension));

    if (outcome.target.filename() == file.filename()) {
        outcome.status = Status::Unchanged;
        return outcome;
    }
    if (options_.dry_run) {
        outcome.status = Status::Planned;
        return outcome;
    }

    MoveResult moved = mover_.move(file, outcome.target);
    if (moved.ok) {
        outcome.status = Status::Renamed;
    } else {
        outcome.status = Status::Failed;
        outcome.error = std::move(moved.error);
    }
    return outcome;
}

void RenameOrchestrator::process_batch(const io::DirectoryBatch& batch, ClassificationCache& cache,
                                       Reporter& reporter, RunSummary& summary) {
    cache.clear();
    reporter.on_directory(batch);
    for (const auto& file : batch.files) {
        RenameOutcome outcome = process(file, cache);
        summary.add(outcome);
        reporter.on_outcome(outcome);
    }
}

io::WalkResult RenameOrchestrator::walk(const std::filesystem::path& root) const {
    return io::walk_directories(root, options_.discovery);
}

RunSummary RenameOrchestrator::run(const std::vector<std::filesystem::path>& inputs,
                                   Reporter& reporter) {
    RunSummary summary;

    for (const auto& input : inputs) {
        std::error_code ec;
        auto status = std::filesystem::status(input, ec);

        if (!ec && std::filesystem::is_regular_file(status)) {
            if (!io::matches_extensions(input, options_.discovery.extensions)) {
                continue;
            }
            // Одиночный файл: всегда свежий кэш
            ClassificationCache cache;
            RenameOutcome outcome = process(input, cache);
            summary.add(outcome);
            reporter.on_outcome(outcome);
        } else if (!ec && std::filesystem::is_directory(status)) {
            io::WalkResult listing;
            try {
                listing = walk(input);
            } catch (const std::runtime_error& e) {
                // Дерево прочитано не полностью: ничего в нём не переименовываем
                ++summary.unreadable_inputs;
                reporter.on_walk_error(input, e.what());
                continue;
            }
            for (const auto& warning : listing.warnings) {
                reporter.on_warning(warning);
            }

            ClassificationCache cache;
            for (const auto& batch : listing.batches) {
                process_batch(batch, cache, reporter, summary);
            }
        } else {
            ++summary.invalid_inputs;
            reporter.on_invalid_input(input);
        }
    }

    return summary;
}

}  // namespace anirename::rename
