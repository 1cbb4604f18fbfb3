#include "engine_config.hpp"
#include "extraction_errors.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_extraction {

using json = nlohmann::json;
namespace fs = std::filesystem;

void ScoringWeights::from_json(const json& j) {
    ast_base = j.value("ast_base", ast_base);
    fallback_base = j.value("fallback_base", fallback_base);
    unknown_base = j.value("unknown_base", unknown_base);
    ast_node_bonus_max = j.value("ast_node_bonus_max", ast_node_bonus_max);
    ast_nodes_for_max_bonus = j.value("ast_nodes_for_max_bonus", ast_nodes_for_max_bonus);
    ast_density_weight = j.value("ast_density_weight", ast_density_weight);
    fallback_density_weight = j.value("fallback_density_weight", fallback_density_weight);
    fallback_balance_bonus = j.value("fallback_balance_bonus", fallback_balance_bonus);
    declared_language_bonus = j.value("declared_language_bonus", declared_language_bonus);
    short_region_lines = j.value("short_region_lines", short_region_lines);
    short_region_penalty = j.value("short_region_penalty", short_region_penalty);
    large_region_fraction = j.value("large_region_fraction", large_region_fraction);
    large_region_min_lines = j.value("large_region_min_lines", large_region_min_lines);
    large_region_penalty = j.value("large_region_penalty", large_region_penalty);
    ast_floor = j.value("ast_floor", ast_floor);
    fallback_ceiling = j.value("fallback_ceiling", fallback_ceiling);
    unknown_ceiling = j.value("unknown_ceiling", unknown_ceiling);
}

json ScoringWeights::to_json() const {
    return json{
        {"ast_base", ast_base},
        {"fallback_base", fallback_base},
        {"unknown_base", unknown_base},
        {"ast_node_bonus_max", ast_node_bonus_max},
        {"ast_nodes_for_max_bonus", ast_nodes_for_max_bonus},
        {"ast_density_weight", ast_density_weight},
        {"fallback_density_weight", fallback_density_weight},
        {"fallback_balance_bonus", fallback_balance_bonus},
        {"declared_language_bonus", declared_language_bonus},
        {"short_region_lines", short_region_lines},
        {"short_region_penalty", short_region_penalty},
        {"large_region_fraction", large_region_fraction},
        {"large_region_min_lines", large_region_min_lines},
        {"large_region_penalty", large_region_penalty},
        {"ast_floor", ast_floor},
        {"fallback_ceiling", fallback_ceiling},
        {"unknown_ceiling", unknown_ceiling}
    };
}

void EngineConfig::validate() const {
    const auto& s = scoring;
    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };

    if (!in_unit(s.ast_floor) || !in_unit(s.fallback_ceiling) || !in_unit(s.unknown_ceiling)) {
        throw ConfigError("Confidence bands must lie within [0, 1]");
    }
    if (!(s.unknown_ceiling <= s.fallback_ceiling && s.fallback_ceiling <= s.ast_floor)) {
        throw ConfigError("Confidence bands must satisfy unknown_ceiling <= fallback_ceiling <= ast_floor");
    }
    if (s.ast_nodes_for_max_bonus <= 0.0) throw ConfigError("ast_nodes_for_max_bonus must be positive");
    if (s.large_region_fraction <= 0.0 || s.large_region_fraction > 1.0) {
        throw ConfigError("large_region_fraction must be in (0, 1]");
    }
    if (max_container_text_bytes == 0) throw ConfigError("max_container_text_bytes must be positive");
    if (min_block_lines == 0) throw ConfigError("min_block_lines must be at least 1");
    if (density_window == 0) throw ConfigError("density_window must be at least 1");
    if (max_concurrency == 0) throw ConfigError("max_concurrency must be at least 1");
    if (guess_top_k == 0) throw ConfigError("guess_top_k must be at least 1");
    if (min_fallback_density < 0.0 || min_fallback_density > 1.0) {
        throw ConfigError("min_fallback_density must be in [0, 1]");
    }
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (j.contains("normalizer")) {
        const auto& n = j["normalizer"];
        cfg.max_container_text_bytes = n.value("max_container_text_bytes", cfg.max_container_text_bytes);
    }
    if (j.contains("segmenter")) {
        const auto& s = j["segmenter"];
        cfg.min_block_lines = s.value("min_block_lines", cfg.min_block_lines);
        cfg.density_threshold = s.value("density_threshold", cfg.density_threshold);
        cfg.density_window = s.value("density_window", cfg.density_window);
    }
    if (j.contains("ast")) {
        const auto& a = j["ast"];
        cfg.region_timeout_ms = a.value("region_timeout_ms", cfg.region_timeout_ms);
        cfg.max_ast_region_bytes = a.value("max_region_bytes", cfg.max_ast_region_bytes);
        cfg.max_nesting_depth = a.value("max_nesting_depth", cfg.max_nesting_depth);
        cfg.guess_top_k = a.value("guess_top_k", cfg.guess_top_k);
    }
    if (j.contains("fallback")) {
        const auto& f = j["fallback"];
        cfg.min_fallback_density = f.value("min_density", cfg.min_fallback_density);
        cfg.max_rule_lines = f.value("max_rule_lines", cfg.max_rule_lines);
    }
    if (j.contains("batch")) {
        const auto& b = j["batch"];
        cfg.max_concurrency = b.value("max_concurrency", cfg.max_concurrency);
        cfg.time_budget_ms = b.value("time_budget_ms", cfg.time_budget_ms);
        cfg.ignored_paths = b.value("ignored_paths", std::vector<std::string>{});
        cfg.included_paths = b.value("included_paths", std::vector<std::string>{});
    }
    if (j.contains("scoring")) cfg.scoring.from_json(j["scoring"]);

    cfg.validate();
    return cfg;
}

json EngineConfig::to_json() const {
    return json{
        {"log_level", log_level},
        {"normalizer", {
            {"max_container_text_bytes", max_container_text_bytes}
        }},
        {"segmenter", {
            {"min_block_lines", min_block_lines},
            {"density_threshold", density_threshold},
            {"density_window", density_window}
        }},
        {"ast", {
            {"region_timeout_ms", region_timeout_ms},
            {"max_region_bytes", max_ast_region_bytes},
            {"max_nesting_depth", max_nesting_depth},
            {"guess_top_k", guess_top_k}
        }},
        {"fallback", {
            {"min_density", min_fallback_density},
            {"max_rule_lines", max_rule_lines}
        }},
        {"batch", {
            {"max_concurrency", max_concurrency},
            {"time_budget_ms", time_budget_ms},
            {"ignored_paths", ignored_paths},
            {"included_paths", included_paths}
        }},
        {"scoring", scoring.to_json()}
    };
}

EngineConfig EngineConfig::load(const std::string& path) {
    if (!fs::exists(path)) {
        spdlog::warn("⚙️  No config at {}, using defaults", path);
        return EngineConfig{};
    }

    json j;
    try {
        std::ifstream f(path);
        j = json::parse(f);
    } catch (const json::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}", path, e.what());
        return EngineConfig{};
    }

    EngineConfig cfg;
    try {
        cfg = from_json(j);
    } catch (const json::exception& e) {
        // Wrong value types are a configuration error, not a parse error.
        throw ConfigError("Invalid config at " + path + ": " + e.what());
    }
    spdlog::info("⚙️  Config loaded from {}: {} ignores, {} exceptions", path,
                 cfg.ignored_paths.size(), cfg.included_paths.size());
    return cfg;
}

} // namespace code_extraction
