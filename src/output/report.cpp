// ==============================================================================
// report.cpp - Отчёт о переименовании
// ==============================================================================

#include "anirename/report.hpp"

#include "anirename/platform.hpp"

#include <rapidjson/document.h>

namespace anirename::report {

namespace {

void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                JsonAllocator& alloc) {
    obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(value.c_str(), alloc).Move(), alloc);
}

}  // namespace

void classification_to_json(const classify::Classification& c, rapidjson::Value& out,
                            JsonAllocator& alloc) {
    out.SetObject();
    add_string(out, "title", c.title, alloc);
    add_string(out, "season", c.season, alloc);
    add_string(out, "episode", c.episode, alloc);
    add_string(out, "release_group", c.release_group, alloc);
}

void outcome_to_json(const rename::RenameOutcome& outcome, rapidjson::Value& out,
                     JsonAllocator& alloc) {
    out.SetObject();
    add_string(out, "source", platform::path_to_utf8(outcome.source), alloc);
    add_string(out, "target", platform::path_to_utf8(outcome.target), alloc);
    out.AddMember("status", rapidjson::StringRef(rename::status_name(outcome.status)), alloc);
    out.AddMember("cache_hit", outcome.cache_hit, alloc);

    rapidjson::Value classification;
    classification_to_json(outcome.classification, classification, alloc);
    out.AddMember("classification", classification, alloc);

    if (outcome.status == rename::Status::Failed) {
        add_string(out, "error", outcome.error, alloc);
    }
}

std::string format_outcome(const rename::RenameOutcome& outcome) {
    std::string line = platform::path_to_utf8(outcome.source);
    line += " -> ";
    line += platform::path_to_utf8(outcome.target);
    if (outcome.status == rename::Status::Failed) {
        line += " - ";
        line += outcome.error;
    }
    return line;
}

// ----------------------------------------------------------------------------
// ConsoleReporter
// ----------------------------------------------------------------------------

ConsoleReporter::ConsoleReporter(output::Writer& writer)
    : writer_(writer), format_(writer.config().format) {}

void ConsoleReporter::begin() {
    json_items_ = 0;
    if (format_ == output::Format::Json) {
        writer_.write(output::Stream::Stdout, "[");
    }
}

void ConsoleReporter::finish(const rename::RunSummary& summary) {
    if (format_ == output::Format::Json) {
        writer_.write_line(output::Stream::Stdout, json_items_ > 0 ? "\n]" : "]");
    }

    std::string line = "Processed " + std::to_string(summary.total()) + " files: " +
                       std::to_string(summary.renamed) + " renamed, " +
                       std::to_string(summary.unchanged) + " unchanged, " +
                       std::to_string(summary.failed) + " failed";
    if (summary.planned > 0) {
        line += ", " + std::to_string(summary.planned) + " planned (dry run)";
    }
    if (summary.invalid_inputs > 0) {
        line += ", " + std::to_string(summary.invalid_inputs) + " invalid paths";
    }
    if (summary.unreadable_inputs > 0) {
        line += ", " + std::to_string(summary.unreadable_inputs) + " unreadable paths";
    }
    writer_.info(line);
    writer_.flush();
}

void ConsoleReporter::on_directory(const io::DirectoryBatch& batch) {
    writer_.debug("Entering " + platform::path_to_utf8(batch.directory) + " (" +
                  std::to_string(batch.files.size()) + " files)");
}

void ConsoleReporter::on_outcome(const rename::RenameOutcome& outcome) {
    const auto& c = outcome.classification;
    writer_.trace("title='" + c.title + "' season=" + c.season + " episode=" + c.episode +
                  " group='" + c.release_group + "'" + (outcome.cache_hit ? " (cached)" : ""));

    if (format_ != output::Format::Std) {
        rapidjson::Document doc;
        outcome_to_json(outcome, doc, doc.GetAllocator());
        if (format_ == output::Format::Jsonl) {
            writer_.write_json(doc, output::JsonStyle::Line);
        } else {
            writer_.write(output::Stream::Stdout, json_items_ == 0 ? "\n" : ",\n");
            writer_.write_json(doc, output::JsonStyle::Pretty);
        }
        ++json_items_;

        if (outcome.status == rename::Status::Failed) {
            writer_.error("Rename failed: " + format_outcome(outcome));
        }
        return;
    }

    switch (outcome.status) {
    case rename::Status::Renamed:
        writer_.colored_line(output::Color::Green, "Renamed: " + format_outcome(outcome));
        break;
    case rename::Status::Planned:
        writer_.colored_line(output::Color::Yellow,
                             "Would rename: " + format_outcome(outcome));
        break;
    case rename::Status::Unchanged:
        writer_.write_line(output::Stream::Stdout,
                           "Unchanged: " + platform::path_to_utf8(outcome.source));
        break;
    case rename::Status::Failed:
        writer_.error("Rename failed: " + format_outcome(outcome));
        break;
    }
}

void ConsoleReporter::on_invalid_input(const std::filesystem::path& input) {
    writer_.error("Invalid path: " + platform::path_to_utf8(input));
}

void ConsoleReporter::on_warning(std::string_view message) {
    writer_.warn(message);
}

void ConsoleReporter::on_walk_error(const std::filesystem::path& input,
                                    std::string_view message) {
    writer_.error("Skipped " + platform::path_to_utf8(input) + ": " + std::string(message));
}

}  // namespace anirename::report
