// ==============================================================================
// test_rename_gtest.cpp - Тесты оркестрации переименования (GoogleTest)
// ==============================================================================

#include "anirename/rename.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace anirename::rename::test {

namespace {

// ==============================================================================
// Тестовые двойники
// ==============================================================================

/// Запоминает запрошенные переименования, ФС не трогает
class RecordingMover : public FileMover {
public:
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> moves;
    std::unordered_set<std::string> failing;  // имена файлов-источников

    MoveResult move(const std::filesystem::path& from, const std::filesystem::path& to) override {
        moves.emplace_back(from, to);
        MoveResult result;
        if (failing.count(from.filename().string()) > 0) {
            result.error = "permission denied";
        } else {
            result.ok = true;
        }
        return result;
    }
};

class CollectingReporter : public Reporter {
public:
    std::vector<std::filesystem::path> directories;
    std::vector<RenameOutcome> outcomes;
    std::vector<std::filesystem::path> invalid;
    std::vector<std::string> warnings;
    std::vector<std::pair<std::filesystem::path, std::string>> walk_errors;

    void on_directory(const io::DirectoryBatch& batch) override {
        directories.push_back(batch.directory);
    }
    void on_outcome(const RenameOutcome& outcome) override { outcomes.push_back(outcome); }
    void on_invalid_input(const std::filesystem::path& input) override {
        invalid.push_back(input);
    }
    void on_warning(std::string_view message) override { warnings.emplace_back(message); }
    void on_walk_error(const std::filesystem::path& input, std::string_view message) override {
        walk_errors.emplace_back(input, std::string(message));
    }
};

/// Обход указанной директории завершается ошибкой чтения
class FailingWalkOrchestrator : public RenameOrchestrator {
public:
    FailingWalkOrchestrator(FileMover& mover, std::filesystem::path unreadable)
        : RenameOrchestrator(classify::default_vocabulary(), mover),
          unreadable_(std::move(unreadable)) {}

protected:
    io::WalkResult walk(const std::filesystem::path& root) const override {
        if (root == unreadable_) {
            throw std::runtime_error("failed to read directory - Permission denied");
        }
        return RenameOrchestrator::walk(root);
    }

private:
    std::filesystem::path unreadable_;
};

const std::filesystem::path SHOW_DIR = std::filesystem::path("anime") / "Show";

}  // namespace

// ==============================================================================
// process(): один файл
// ==============================================================================

TEST(RenameProcessTest, ComputesTargetAndDelegatesMove) {
    // Arrange
    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    // Act
    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "[DMG] Show - 01.mkv", cache);

    // Assert
    EXPECT_EQ(outcome.status, Status::Renamed);
    EXPECT_EQ(outcome.target, SHOW_DIR / "Show - S01E01 - DMG.mkv");
    EXPECT_FALSE(outcome.cache_hit);
    ASSERT_EQ(mover.moves.size(), 1u);
    EXPECT_EQ(mover.moves[0].first, SHOW_DIR / "[DMG] Show - 01.mkv");
    EXPECT_EQ(mover.moves[0].second, SHOW_DIR / "Show - S01E01 - DMG.mkv");
}

TEST(RenameProcessTest, SameDirectoryReusesCachedMetadata) {
    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    RenameOutcome first = orchestrator.process(SHOW_DIR / "[DMG] Show - 01.mkv", cache);
    // Другое соглашение об именах в той же директории
    RenameOutcome second = orchestrator.process(SHOW_DIR / "Show.E02.mkv", cache);

    EXPECT_FALSE(first.cache_hit);
    EXPECT_TRUE(second.cache_hit);
    EXPECT_EQ(second.classification.title, "Show");
    EXPECT_EQ(second.classification.release_group, "DMG");
    EXPECT_EQ(second.classification.episode, "02");
    EXPECT_EQ(second.target, SHOW_DIR / "Show - S01E02 - DMG.mkv");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RenameProcessTest, EpisodeIsNeverCached) {
    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    orchestrator.process(SHOW_DIR / "[DMG] Show - 01.mkv", cache);
    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "[DMG] Show - 07.mkv", cache);

    EXPECT_EQ(outcome.classification.episode, "07");
}

TEST(RenameProcessTest, DryRun_PlansWithoutMoving) {
    RecordingMover mover;
    RenameOptions options;
    options.dry_run = true;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover, options);
    ClassificationCache cache;

    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "[DMG] Show - 03.mp4", cache);

    EXPECT_EQ(outcome.status, Status::Planned);
    EXPECT_EQ(outcome.target, SHOW_DIR / "Show - S01E03 - DMG.mp4");
    EXPECT_TRUE(mover.moves.empty());
}

TEST(RenameProcessTest, CanonicalName_IsLeftUnchanged) {
    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "Show - S01E04 - DMG.mkv", cache);

    EXPECT_EQ(outcome.status, Status::Unchanged);
    EXPECT_EQ(outcome.target, outcome.source);
    EXPECT_EQ(outcome.classification.episode, "04");
    EXPECT_TRUE(mover.moves.empty());
}

TEST(RenameProcessTest, Reclassify_ProcessesCanonicalNamesAgain) {
    RecordingMover mover;
    RenameOptions options;
    options.skip_canonical = false;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover, options);
    ClassificationCache cache;

    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "Show - S01E04 - DMG.mkv", cache);

    EXPECT_NE(outcome.status, Status::Unchanged);
    EXPECT_EQ(mover.moves.size(), 1u);
}

TEST(RenameProcessTest, MoverFailure_ReportedAsFailed) {
    RecordingMover mover;
    mover.failing.insert("[DMG] Show - 01.mkv");
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "[DMG] Show - 01.mkv", cache);

    EXPECT_EQ(outcome.status, Status::Failed);
    EXPECT_EQ(outcome.error, "permission denied");
}

TEST(RenameProcessTest, FileWithoutExtension) {
    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    ClassificationCache cache;

    RenameOutcome outcome = orchestrator.process(SHOW_DIR / "randomfile", cache);

    EXPECT_EQ(outcome.target, SHOW_DIR / "randomfile - S01E01 - randomfile");
}

// ==============================================================================
// Status / RunSummary
// ==============================================================================

TEST(RunSummaryTest, CountsByStatus) {
    RunSummary summary;
    RenameOutcome outcome;

    outcome.status = Status::Renamed;
    summary.add(outcome);
    summary.add(outcome);
    outcome.status = Status::Failed;
    summary.add(outcome);
    outcome.status = Status::Unchanged;
    summary.add(outcome);

    EXPECT_EQ(summary.renamed, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.unchanged, 1u);
    EXPECT_EQ(summary.planned, 0u);
    EXPECT_EQ(summary.total(), 4u);
}

TEST(StatusNameTest, Names) {
    EXPECT_STREQ(status_name(Status::Renamed), "renamed");
    EXPECT_STREQ(status_name(Status::Unchanged), "unchanged");
    EXPECT_STREQ(status_name(Status::Planned), "planned");
    EXPECT_STREQ(status_name(Status::Failed), "failed");
}

// ==============================================================================
// run(): прогон по реальному дереву
// ==============================================================================

class RenameRunTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("anirename_rename_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << "video";
    }
};

TEST_F(RenameRunTest, CacheIsClearedAtDirectoryBoundary) {
    // Arrange
    create_file(test_dir_ / "A" / "[DMG] Show - 01.mkv");
    create_file(test_dir_ / "A" / "[DMG] Show - 02.mkv");
    create_file(test_dir_ / "B" / "[LoliHouse] Other S02 - 05.mkv");

    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    CollectingReporter reporter;

    // Act
    RunSummary summary = orchestrator.run({test_dir_}, reporter);

    // Assert
    ASSERT_EQ(reporter.outcomes.size(), 3u);
    EXPECT_EQ(summary.renamed, 3u);

    ASSERT_EQ(reporter.directories.size(), 2u);
    EXPECT_EQ(reporter.directories[0], test_dir_ / "A");
    EXPECT_EQ(reporter.directories[1], test_dir_ / "B");

    EXPECT_FALSE(reporter.outcomes[0].cache_hit);
    EXPECT_TRUE(reporter.outcomes[1].cache_hit);
    EXPECT_FALSE(reporter.outcomes[2].cache_hit);

    EXPECT_EQ(reporter.outcomes[1].classification.episode, "02");
    EXPECT_EQ(reporter.outcomes[2].classification.title, "Other");
    EXPECT_EQ(reporter.outcomes[2].classification.season, "02");
    EXPECT_EQ(reporter.outcomes[2].classification.release_group, "LoliHouse");
}

TEST_F(RenameRunTest, InvalidInput_IsCountedAndRunContinues) {
    create_file(test_dir_ / "[DMG] Show - 01.mkv");

    RecordingMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    CollectingReporter reporter;

    RunSummary summary =
        orchestrator.run({test_dir_ / "missing", test_dir_ / "[DMG] Show - 01.mkv"}, reporter);

    EXPECT_EQ(summary.invalid_inputs, 1u);
    ASSERT_EQ(reporter.invalid.size(), 1u);
    EXPECT_EQ(reporter.invalid[0], test_dir_ / "missing");
    EXPECT_EQ(summary.renamed, 1u);
}

TEST_F(RenameRunTest, UnreadableDirectory_IsReportedAndRunContinues) {
    // Arrange
    create_file(test_dir_ / "locked" / "[DMG] Show - 01.mkv");
    create_file(test_dir_ / "open" / "[DMG] Other - 02.mkv");

    RecordingMover mover;
    FailingWalkOrchestrator orchestrator(mover, test_dir_ / "locked");
    CollectingReporter reporter;

    // Act
    RunSummary summary = orchestrator.run({test_dir_ / "locked", test_dir_ / "open"}, reporter);

    // Assert
    EXPECT_EQ(summary.unreadable_inputs, 1u);
    EXPECT_EQ(summary.invalid_inputs, 0u);
    ASSERT_EQ(reporter.walk_errors.size(), 1u);
    EXPECT_EQ(reporter.walk_errors[0].first, test_dir_ / "locked");
    EXPECT_NE(reporter.walk_errors[0].second.find("Permission denied"), std::string::npos);

    // Ничего из недочитанного дерева не переименовано
    ASSERT_EQ(mover.moves.size(), 1u);
    EXPECT_EQ(mover.moves[0].first.filename(), "[DMG] Other - 02.mkv");
    EXPECT_EQ(summary.renamed, 1u);
}

TEST_F(RenameRunTest, FailedFile_DoesNotAbortBatch) {
    create_file(test_dir_ / "[DMG] Show - 01.mkv");
    create_file(test_dir_ / "[DMG] Show - 02.mkv");

    RecordingMover mover;
    mover.failing.insert("[DMG] Show - 01.mkv");
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);
    CollectingReporter reporter;

    RunSummary summary = orchestrator.run({test_dir_}, reporter);

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.renamed, 1u);
    EXPECT_EQ(mover.moves.size(), 2u);
}

TEST_F(RenameRunTest, ExtensionFilter_AppliesToFilesAndDirectories) {
    create_file(test_dir_ / "dir" / "[DMG] Show - 01.mkv");
    create_file(test_dir_ / "dir" / "[DMG] Show - 01.ass");
    create_file(test_dir_ / "notes.txt");

    RecordingMover mover;
    RenameOptions options;
    options.discovery.extensions = std::unordered_set<std::string>{"mkv"};
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover, options);
    CollectingReporter reporter;

    RunSummary summary = orchestrator.run({test_dir_ / "dir", test_dir_ / "notes.txt"}, reporter);

    EXPECT_EQ(summary.total(), 1u);
    EXPECT_EQ(summary.invalid_inputs, 0u);
    ASSERT_EQ(reporter.outcomes.size(), 1u);
    EXPECT_EQ(reporter.outcomes[0].source.filename(), "[DMG] Show - 01.mkv");
}

TEST_F(RenameRunTest, FilesystemRun_RenamesAndIsStableOnRerun) {
    create_file(test_dir_ / "[DMG] Show - 01.mkv");
    create_file(test_dir_ / "[DMG] Show - 02.mkv");

    FilesystemMover mover;
    RenameOrchestrator orchestrator(classify::default_vocabulary(), mover);

    CollectingReporter first_reporter;
    RunSummary first = orchestrator.run({test_dir_}, first_reporter);

    EXPECT_EQ(first.renamed, 2u);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "Show - S01E01 - DMG.mkv"));
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "Show - S01E02 - DMG.mkv"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "[DMG] Show - 01.mkv"));

    CollectingReporter second_reporter;
    RunSummary second = orchestrator.run({test_dir_}, second_reporter);

    EXPECT_EQ(second.unchanged, 2u);
    EXPECT_EQ(second.renamed, 0u);
}

// ==============================================================================
// FilesystemMover
// ==============================================================================

TEST_F(RenameRunTest, FilesystemMover_Renames) {
    create_file(test_dir_ / "a.mkv");

    FilesystemMover mover;
    MoveResult result = mover.move(test_dir_ / "a.mkv", test_dir_ / "b.mkv");

    EXPECT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "a.mkv"));
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "b.mkv"));
}

TEST_F(RenameRunTest, FilesystemMover_RefusesToOverwrite) {
    create_file(test_dir_ / "a.mkv");
    create_file(test_dir_ / "b.mkv");

    FilesystemMover mover;
    MoveResult result = mover.move(test_dir_ / "a.mkv", test_dir_ / "b.mkv");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "target already exists");
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "a.mkv"));
}

TEST_F(RenameRunTest, FilesystemMover_MissingSource) {
    FilesystemMover mover;
    MoveResult result = mover.move(test_dir_ / "none.mkv", test_dir_ / "b.mkv");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
}

}  // namespace anirename::rename::test
