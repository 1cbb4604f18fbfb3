#pragma once
#include <optional>
#include <string>
#include "block_assembler.hpp"
#include "cancellation_token.hpp"
#include "confidence_scorer.hpp"
#include "document_normalizer.hpp"
#include "engine_config.hpp"
#include "extraction_types.hpp"
#include "fallback_extractor.hpp"
#include "language_registry.hpp"
#include "segmenter.hpp"

namespace code_extraction {

class AstValidator;

enum class RunStage { Ingested, Segmented, Validated, Scored, Assembled };

const char* to_string(RunStage stage);

struct IngestionInput {
    std::string raw_bytes;
    std::string filename;                        // name or repository-relative path
    std::optional<std::string> declared_language;
    std::optional<std::string> source_file_id;   // defaults to `filename`
    std::optional<SegmentationMode> mode;        // defaults to the path-based choice
};

// One extraction run per call. Safe to call concurrently: per-run state lives on
// the stack and each validation worker owns its own parser.
class ExtractionEngine {
public:
    explicit ExtractionEngine(EngineConfig config = EngineConfig{},
                              const LanguageRegistry& registry = LanguageRegistry::instance());

    // Throws DecodeFailure when nothing is readable and RunCancelled when `token` fires.
    ExtractionResult extract(const IngestionInput& input, const CancellationToken* token = nullptr) const;

    const EngineConfig& config() const { return config_; }

private:
    RegionOutcome process_region(const SourceDocument& doc, const CandidateRegion& region, SegmentationMode mode,
                                 bool infer, AstValidator& validator,
                                 std::vector<Diagnostic>& diagnostics) const;

    EngineConfig config_;
    const LanguageRegistry& registry_;
    DocumentNormalizer normalizer_;
    Segmenter segmenter_;
    FallbackExtractor fallback_;
    ConfidenceScorer scorer_;
    BlockAssembler assembler_;
};

} // namespace code_extraction
