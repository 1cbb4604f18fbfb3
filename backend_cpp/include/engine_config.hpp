#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_extraction {

// Scoring knobs. All of them are plain parameters; none is a fixed assumption.
struct ScoringWeights {
    double ast_base = 0.80;
    double fallback_base = 0.45;
    double unknown_base = 0.10;

    double ast_node_bonus_max = 0.10;
    double ast_nodes_for_max_bonus = 200.0;
    double ast_density_weight = 0.10;

    double fallback_density_weight = 0.15;
    double fallback_balance_bonus = 0.05;
    double declared_language_bonus = 0.05;

    size_t short_region_lines = 2;
    double short_region_penalty = 0.15;
    double large_region_fraction = 0.90;
    size_t large_region_min_lines = 40;
    double large_region_penalty = 0.10;

    double ast_floor = 0.70;
    double fallback_ceiling = 0.69;
    double unknown_ceiling = 0.25;

    void from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct EngineConfig {
    std::string log_level = "info";

    // Normalizer: cap on bytes inflated out of DOCX parts and PDF streams.
    size_t max_container_text_bytes = size_t(64) << 20;

    // Segmenter
    size_t min_block_lines = 2;
    double density_threshold = 0.15;
    size_t density_window = 5;

    // AST path
    size_t region_timeout_ms = 2000;
    size_t max_ast_region_bytes = 1 << 20;
    size_t max_nesting_depth = 256;
    size_t guess_top_k = 3;

    // Fallback path
    double min_fallback_density = 0.20;
    size_t max_rule_lines = 2000;

    // Batches
    size_t max_concurrency = 4;
    size_t time_budget_ms = 0; // 0 = no deadline
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;

    ScoringWeights scoring;

    // Throws ConfigError on values the engine cannot honour.
    void validate() const;

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Missing file -> defaults. Malformed JSON -> logged, defaults. Invalid values -> ConfigError.
    static EngineConfig load(const std::string& path);
};

} // namespace code_extraction
