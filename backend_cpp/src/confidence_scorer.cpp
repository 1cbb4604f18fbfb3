#include "confidence_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace code_extraction {

namespace {

double clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

// Four decimals keep serialized scores stable across platforms.
double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

} // namespace

double ConfidenceScorer::structural_bonus(const ScoreInputs& in) const {
    double density = clamp01(in.density);
    if (in.block_type == BlockType::Ast) {
        double nodes = static_cast<double>(in.node_count) / w_.ast_nodes_for_max_bonus;
        return std::min(w_.ast_node_bonus_max, w_.ast_node_bonus_max * nodes) + density * w_.ast_density_weight;
    }
    return density * w_.fallback_density_weight +
           (in.balanced ? w_.fallback_balance_bonus : 0.0) +
           (in.declared ? w_.declared_language_bonus : 0.0);
}

double ConfidenceScorer::size_penalty(const ScoreInputs& in) const {
    double penalty = 0.0;
    if (in.region_lines < w_.short_region_lines) penalty += w_.short_region_penalty;

    // Mixed content only: a whole-file region spans its document by construction.
    if (in.mode == SegmentationMode::MixedContent && in.document_lines >= w_.large_region_min_lines &&
        static_cast<double>(in.region_lines) > w_.large_region_fraction * static_cast<double>(in.document_lines)) {
        penalty += w_.large_region_penalty;
    }
    return penalty;
}

double ConfidenceScorer::score(const ScoreInputs& in) const {
    double base;
    double low = 0.0;
    double high;
    if (in.block_type == BlockType::Ast) {
        base = w_.ast_base;
        low = w_.ast_floor;
        high = 1.0;
    } else if (in.unknown) {
        base = w_.unknown_base;
        high = w_.unknown_ceiling;
    } else {
        base = w_.fallback_base;
        high = w_.fallback_ceiling;
    }

    double raw = round4(base + structural_bonus(in) - size_penalty(in));
    return std::max(low, std::min(high, raw));
}

} // namespace code_extraction
