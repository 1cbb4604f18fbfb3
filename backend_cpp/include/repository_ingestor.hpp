#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "PrefixTrie.hpp"
#include "cancellation_token.hpp"
#include "extraction_engine.hpp"

namespace code_extraction {

enum class FileStatus { Completed, TimedOut, Cancelled, Failed, Skipped };

const char* to_string(FileStatus status);

struct FileOutcome {
    std::string path;
    FileStatus status = FileStatus::Completed;
    std::optional<ExtractionResult> result;
    std::string error;

    nlohmann::json to_json() const;
};

struct BatchBudget {
    size_t max_concurrency = 4;
    std::chrono::milliseconds time_budget{0}; // 0 = unlimited
};

struct RepositoryBatch {
    std::vector<std::pair<std::string, std::string>> files; // (relative path, raw bytes)
    BatchBudget budget;
    std::shared_ptr<CancellationToken> token;                // optional, shared with the caller
    std::function<void(const FileOutcome&)> on_file_done;    // called from worker threads, serialized
};

struct BatchAggregate {
    size_t files_total = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t skipped = 0;
    size_t timed_out = 0;
    size_t cancelled = 0;
    ExtractionStats stats;

    nlohmann::json to_json() const;
};

struct BatchResult {
    std::vector<FileOutcome> files; // input order
    BatchAggregate aggregate;
    bool timed_out = false;
    bool cancelled = false;

    nlohmann::json to_json() const;
};

// Runs the engine over many files with a bounded worker pool and one shared
// cancellation token. Files finished before the token fires keep their results.
class RepositoryIngestor {
public:
    explicit RepositoryIngestor(EngineConfig config = EngineConfig{});

    BatchResult ingest(const RepositoryBatch& batch) const;

    // Anything under .git/, or under an ignored prefix not re-included.
    bool should_skip(const std::string& relative_path) const;

    // Regular files below `root` as (relative path, bytes); .git is never descended.
    static std::vector<std::pair<std::string, std::string>> collect_files(const std::string& root);

    const ExtractionEngine& engine() const { return engine_; }

private:
    ExtractionEngine engine_;
    PrefixTrie filters_;
};

} // namespace code_extraction
