#include "repository_ingestor.hpp"
#include "ThreadPool.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <mutex>
#include <spdlog/spdlog.h>

namespace code_extraction {

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Completed: return "completed";
        case FileStatus::TimedOut: return "timed_out";
        case FileStatus::Cancelled: return "cancelled";
        case FileStatus::Failed: return "failed";
        case FileStatus::Skipped: return "skipped";
    }
    return "failed";
}

json FileOutcome::to_json() const {
    json j = {{"path", path}, {"status", to_string(status)}};
    if (result) j["result"] = result->to_json();
    if (!error.empty()) j["error"] = error;
    return j;
}

json BatchAggregate::to_json() const {
    return json{
        {"files_total", files_total},
        {"completed", completed},
        {"failed", failed},
        {"skipped", skipped},
        {"timed_out", timed_out},
        {"cancelled", cancelled},
        {"stats", stats.to_json()}
    };
}

json BatchResult::to_json() const {
    json j_files = json::array();
    for (const auto& f : files) j_files.push_back(f.to_json());
    return json{
        {"files", j_files},
        {"aggregate", aggregate.to_json()},
        {"timed_out", timed_out},
        {"cancelled", cancelled}
    };
}

RepositoryIngestor::RepositoryIngestor(EngineConfig config) : engine_(std::move(config)) {
    for (const auto& ign : engine_.config().ignored_paths) filters_.insert(ign, PathFlag::IGNORE);
    for (const auto& inc : engine_.config().included_paths) filters_.insert(inc, PathFlag::INCLUDE);
}

bool RepositoryIngestor::should_skip(const std::string& relative_path) const {
    fs::path rel = fs::path(relative_path).lexically_normal();
    for (const auto& part : rel) {
        if (part == ".git") return true;
    }
    return filters_.ignored(rel);
}

std::vector<std::pair<std::string, std::string>> RepositoryIngestor::collect_files(const std::string& root) {
    std::vector<std::pair<std::string, std::string>> files;
    fs::path base(root);

    std::error_code ec;
    auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(base, options, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec) && entry.path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(type_ec)) continue;

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            spdlog::warn("⚠️  Cannot read {}", entry.path().string());
            continue;
        }
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        files.emplace_back(fs::relative(entry.path(), base).generic_string(), std::move(bytes));
    }
    if (ec) spdlog::error("❌ Scan of {} stopped: {}", root, ec.message());

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return files;
}

BatchResult RepositoryIngestor::ingest(const RepositoryBatch& batch) const {
    auto token = batch.token ? batch.token : std::make_shared<CancellationToken>();
    if (batch.budget.time_budget.count() > 0) token->set_budget(batch.budget.time_budget);

    BatchResult result;
    result.files.resize(batch.files.size());
    std::mutex callback_mutex;

    auto report = [&](const FileOutcome& outcome) {
        if (!batch.on_file_done) return;
        std::lock_guard<std::mutex> lock(callback_mutex);
        batch.on_file_done(outcome);
    };

    size_t workers = std::max<size_t>(1, std::min(batch.budget.max_concurrency, batch.files.size()));
    spdlog::info("📦 Batch of {} file(s) on {} worker(s)", batch.files.size(), workers);

    std::vector<std::future<void>> pending;
    {
        ThreadPool pool(workers);
        for (size_t i = 0; i < batch.files.size(); ++i) {
            FileOutcome& outcome = result.files[i];
            outcome.path = batch.files[i].first;

            if (should_skip(outcome.path)) {
                outcome.status = FileStatus::Skipped;
                report(outcome);
                continue;
            }

            pending.push_back(pool.enqueue([this, &batch, &outcome, &report, token, i] {
                if (token->stop_requested()) {
                    outcome.status = token->cancelled() ? FileStatus::Cancelled : FileStatus::TimedOut;
                    outcome.error = "not started before the batch stopped";
                    report(outcome);
                    return;
                }

                IngestionInput input;
                input.filename = batch.files[i].first;
                input.raw_bytes = batch.files[i].second;
                try {
                    outcome.result = engine_.extract(input, token.get());
                    outcome.status = FileStatus::Completed;
                } catch (const RunCancelled& e) {
                    outcome.status = e.timed_out() ? FileStatus::TimedOut : FileStatus::Cancelled;
                    outcome.error = e.what();
                } catch (const std::exception& e) {
                    outcome.status = FileStatus::Failed;
                    outcome.error = e.what();
                }
                report(outcome);
            }));
        }
        for (auto& f : pending) f.get();
    }

    auto& agg = result.aggregate;
    agg.files_total = result.files.size();
    for (const auto& f : result.files) {
        switch (f.status) {
            case FileStatus::Completed: ++agg.completed; break;
            case FileStatus::TimedOut: ++agg.timed_out; break;
            case FileStatus::Cancelled: ++agg.cancelled; break;
            case FileStatus::Failed: ++agg.failed; break;
            case FileStatus::Skipped: ++agg.skipped; break;
        }
        if (f.result) {
            agg.stats.ast_parsed_count += f.result->stats.ast_parsed_count;
            agg.stats.fallback_extracted_count += f.result->stats.fallback_extracted_count;
            agg.stats.total_extracted_count += f.result->stats.total_extracted_count;
        }
    }
    result.timed_out = agg.timed_out > 0;
    result.cancelled = agg.cancelled > 0;

    spdlog::info("📦 Batch done: {} completed, {} failed, {} skipped, {} timed out, {} cancelled",
                 agg.completed, agg.failed, agg.skipped, agg.timed_out, agg.cancelled);
    return result;
}

} // namespace code_extraction
