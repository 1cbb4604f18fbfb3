#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "RunJournal.hpp"
#include "engine_config.hpp"
#include "extraction_engine.hpp"
#include "repository_ingestor.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct CliOptions {
    std::vector<std::string> inputs;
    std::string config_path;
    std::string language;
    std::string log_level;
    bool repo = false;
    bool journal = false;
};

void print_usage() {
    std::cerr << "usage: block_extractor [--config <file.json>] [--language <id>] [--log-level <level>]\n"
                 "                       [--repo] [--journal] <path>...\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        if (arg == "--config") { if (!next(opts.config_path)) return false; }
        else if (arg == "--language") { if (!next(opts.language)) return false; }
        else if (arg == "--log-level") { if (!next(opts.log_level)) return false; }
        else if (arg == "--repo") opts.repo = true;
        else if (arg == "--journal") opts.journal = true;
        else if (arg == "-h" || arg == "--help") return false;
        else if (!arg.empty() && arg[0] == '-') { std::cerr << "unknown option " << arg << "\n"; return false; }
        else opts.inputs.push_back(arg);
    }
    return !opts.inputs.empty() || opts.journal;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

class ExtractorCli {
public:
    ExtractorCli(code_extraction::EngineConfig config, CliOptions opts)
        : config_(std::move(config)), opts_(std::move(opts)) {}

    int run() {
        json out;
        int status = opts_.repo ? run_batch(out) : run_files(out);
        if (opts_.journal) out["journal"] = code_extraction::RunJournal::instance().get_runs_json();
        std::cout << out.dump(2) << std::endl;
        return status;
    }

private:
    int run_files(json& out) {
        code_extraction::ExtractionEngine engine(config_);
        json results = json::array();
        int status = 0;

        for (const auto& path : opts_.inputs) {
            code_extraction::IngestionInput input;
            input.filename = path;
            if (!opts_.language.empty()) input.declared_language = opts_.language;
            if (!read_file(path, input.raw_bytes)) {
                spdlog::error("❌ Cannot read {}", path);
                results.push_back({{"source_file_id", path}, {"error", "cannot read file"}});
                status = 1;
                continue;
            }
            try {
                results.push_back(engine.extract(input).to_json());
            } catch (const code_extraction::ExtractionError& e) {
                results.push_back({{"source_file_id", path}, {"error", e.what()}});
                status = 1;
            }
        }
        out["results"] = results;
        return status;
    }

    int run_batch(json& out) {
        code_extraction::RepositoryIngestor ingestor(config_);
        code_extraction::RepositoryBatch batch;
        batch.budget.max_concurrency = config_.max_concurrency;
        batch.budget.time_budget = std::chrono::milliseconds(config_.time_budget_ms);

        for (const auto& path : opts_.inputs) {
            std::error_code ec;
            if (fs::is_directory(path, ec)) {
                for (auto& [rel, bytes] : code_extraction::RepositoryIngestor::collect_files(path)) {
                    batch.files.emplace_back(rel, std::move(bytes));
                }
                continue;
            }
            std::string bytes;
            if (!read_file(path, bytes)) {
                spdlog::error("❌ Cannot read {}", path);
                continue;
            }
            batch.files.emplace_back(path, std::move(bytes));
        }

        code_extraction::BatchResult result = ingestor.ingest(batch);
        out["batch"] = result.to_json();
        return (result.aggregate.failed > 0 || result.timed_out || result.cancelled) ? 1 : 0;
    }

    code_extraction::EngineConfig config_;
    CliOptions opts_;
};

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries the JSON report, so logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("block_extractor"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    code_extraction::EngineConfig config;
    try {
        if (!opts.config_path.empty()) config = code_extraction::EngineConfig::load(opts.config_path);
    } catch (const code_extraction::ConfigError& e) {
        spdlog::critical("⚙️  {}", e.what());
        return 2;
    }
    spdlog::set_level(spdlog::level::from_str(opts.log_level.empty() ? config.log_level : opts.log_level));

    ExtractorCli cli(std::move(config), std::move(opts));
    try {
        return cli.run();
    } catch (const code_extraction::ConfigError& e) {
        spdlog::critical("⚙️  {}", e.what());
        return 2;
    }
}
