#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace code_extraction {

struct RunRecord {
    long long timestamp;
    std::string source_file_id;
    std::string mode;          // whole_file | mixed_content
    std::string outcome;       // completed | failed | cancelled | timed_out
    size_t region_count = 0;
    size_t ast_blocks = 0;
    size_t fallback_blocks = 0;
    size_t warning_count = 0;
    double duration_ms = 0.0;
};

// Telemetry of the most recent extraction runs, process-wide.
class RunJournal {
public:
    static RunJournal& instance() {
        static RunJournal instance;
        return instance;
    }

    void add_run(const RunRecord& run) {
        std::lock_guard<std::mutex> lock(mtx_);
        runs_.push_back(run);
        if (runs_.size() > kCapacity) runs_.pop_front();
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return runs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        runs_.clear();
    }

    // Newest first.
    nlohmann::json get_runs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"source_file_id", it->source_file_id},
                {"mode", it->mode},
                {"outcome", it->outcome},
                {"regions", it->region_count},
                {"ast_blocks", it->ast_blocks},
                {"fallback_blocks", it->fallback_blocks},
                {"warnings", it->warning_count},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    static constexpr size_t kCapacity = 50;

private:
    RunJournal() {}
    std::deque<RunRecord> runs_;
    std::mutex mtx_;
};

} // namespace code_extraction
