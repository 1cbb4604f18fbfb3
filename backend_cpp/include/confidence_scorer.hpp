#pragma once
#include <cstddef>
#include "engine_config.hpp"
#include "extraction_types.hpp"

namespace code_extraction {

struct ScoreInputs {
    BlockType block_type = BlockType::Fallback;
    bool unknown = false;
    size_t node_count = 0;       // named syntax nodes (ast only)
    double density = 0.0;        // token density for ast, rule density for fallback
    bool balanced = false;
    bool declared = false;
    size_t region_lines = 0;
    size_t document_lines = 0;
    SegmentationMode mode = SegmentationMode::WholeFile;
};

// confidence = band(base + structural bonus - size penalty). Pure and deterministic.
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const ScoringWeights& weights) : w_(weights) {}

    double score(const ScoreInputs& in) const;

    double structural_bonus(const ScoreInputs& in) const;
    double size_penalty(const ScoreInputs& in) const;

private:
    ScoringWeights w_;
};

} // namespace code_extraction
