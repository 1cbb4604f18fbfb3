#include "extraction_engine.hpp"
#include "RunJournal.hpp"
#include "ast_validator.hpp"
#include "text_utils.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace code_extraction {

const char* to_string(RunStage stage) {
    switch (stage) {
        case RunStage::Ingested: return "ingested";
        case RunStage::Segmented: return "segmented";
        case RunStage::Validated: return "validated";
        case RunStage::Scored: return "scored";
        case RunStage::Assembled: return "assembled";
    }
    return "ingested";
}

namespace {

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string lines_label(const SourceDocument& doc, const CandidateRegion& region) {
    size_t first = doc.line_at(region.start_offset);
    size_t last = doc.line_at(region.end_offset - 1);
    return "lines " + std::to_string(first) + "-" + std::to_string(last);
}

void check(const CancellationToken* token, const std::string& where) {
    if (token) token->throw_if_stopped(where);
}

} // namespace

ExtractionEngine::ExtractionEngine(EngineConfig config, const LanguageRegistry& registry)
    : config_(std::move(config)),
      registry_(registry),
      normalizer_(config_),
      segmenter_(config_, registry_),
      fallback_(config_, registry_),
      scorer_(config_.scoring) {
    config_.validate();
}

RegionOutcome ExtractionEngine::process_region(const SourceDocument& doc, const CandidateRegion& region,
                                               SegmentationMode mode, bool infer, AstValidator& validator,
                                               std::vector<Diagnostic>& diagnostics) const {
    std::string_view text = doc.slice(region.start_offset, region.end_offset);
    std::string where = lines_label(doc, region);

    RegionOutcome outcome;
    outcome.region = region;

    ScoreInputs in;
    in.region_lines = doc.line_at(region.end_offset - 1) - doc.line_at(region.start_offset) + 1;
    in.document_lines = doc.line_count();
    in.mode = mode;

    const auto& label = region.declared_language;
    const LanguageProfile* declared = label ? registry_.find(*label) : nullptr;
    bool unregistered_label = label && !declared;

    if (!unregistered_label && (declared || infer)) {
        AstVerdict verdict = validator.validate(text, declared, region.unterminated, where);
        diagnostics.insert(diagnostics.end(), verdict.diagnostics.begin(), verdict.diagnostics.end());
        if (verdict.accepted) {
            outcome.language = verdict.profile->id;
            outcome.block_type = BlockType::Ast;
            outcome.validation_method = verdict.validation_method;

            in.block_type = BlockType::Ast;
            in.node_count = verdict.node_count;
            in.density = technical_density(text);
            in.declared = declared != nullptr;
            outcome.confidence = scorer_.score(in);
            return outcome;
        }
    }

    FallbackVerdict fb = fallback_.classify(text, label, infer, where);
    diagnostics.insert(diagnostics.end(), fb.diagnostics.begin(), fb.diagnostics.end());

    outcome.language = fb.language;
    outcome.block_type = BlockType::Fallback;
    outcome.validation_method = fb.validation_method;

    in.block_type = BlockType::Fallback;
    in.unknown = fb.unknown;
    in.density = fb.rule_density;
    in.balanced = fb.balanced;
    in.declared = fb.declared;
    outcome.confidence = scorer_.score(in);
    return outcome;
}

ExtractionResult ExtractionEngine::extract(const IngestionInput& input, const CancellationToken* token) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    const std::string source_file_id = input.source_file_id.value_or(input.filename);

    RunRecord record{now_ms(), source_file_id, "", "completed"};
    auto finish = [&](const std::string& outcome) {
        record.outcome = outcome;
        record.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        RunJournal::instance().add_run(record);
    };

    try {
        check(token, "ingest");
        NormalizedDocument normalized = normalizer_.normalize(input.raw_bytes, input.filename);
        const SourceDocument& doc = normalized.document;
        std::vector<Diagnostic> warnings = std::move(normalized.diagnostics);
        spdlog::debug("🔁 {} -> {}", source_file_id, to_string(RunStage::Ingested));

        SegmentationMode mode = input.mode.value_or(segmenter_.choose_mode(input.filename));
        // Extension-less scripts ("bin/deploy") look like documents until the shebang is read.
        if (!input.mode && mode == SegmentationMode::MixedContent &&
            std::filesystem::path(input.filename).extension().empty() && registry_.from_shebang(doc.text())) {
            mode = SegmentationMode::WholeFile;
        }
        record.mode = to_string(mode);

        // Declared language: the caller's hint, else what the path or shebang implies.
        std::optional<std::string> declared = input.declared_language;
        if (!declared && mode == SegmentationMode::WholeFile) {
            const LanguageProfile* implied = registry_.from_path(input.filename);
            if (!implied) implied = registry_.from_shebang(doc.text());
            if (implied) declared = implied->id;
        }
        // A source file whose type nothing identifies is kept whole as `unknown`.
        bool infer = mode == SegmentationMode::MixedContent || declared.has_value();

        check(token, "segment");
        std::vector<CandidateRegion> regions = segmenter_.segment(doc, mode, declared);
        record.region_count = regions.size();
        spdlog::debug("🔁 {} -> {} ({} regions)", source_file_id, to_string(RunStage::Segmented), regions.size());

        std::vector<RegionOutcome> outcomes(regions.size());
        std::vector<std::vector<Diagnostic>> region_diagnostics(regions.size());
        std::atomic<bool> stopped{false};
        const int count = static_cast<int>(regions.size());

        #pragma omp parallel if (count > 1)
        {
            AstValidator validator(config_, registry_);

            #pragma omp for schedule(dynamic)
            for (int i = 0; i < count; ++i) {
                if (stopped.load()) continue;
                if (token && token->stop_requested()) {
                    stopped.store(true);
                    continue;
                }
                try {
                    outcomes[i] = process_region(doc, regions[i], mode, infer, validator, region_diagnostics[i]);
                } catch (const std::exception& e) {
                    // Exceptions may not leave the parallel region; the region degrades to `unknown`.
                    region_diagnostics[i].push_back({DiagnosticKind::ParseFailure,
                                                     lines_label(doc, regions[i]) + ": " + e.what()});
                    ScoreInputs in;
                    in.unknown = true;
                    in.mode = mode;
                    outcomes[i].region = regions[i];
                    outcomes[i].language = kUnknownLanguage;
                    outcomes[i].block_type = BlockType::Fallback;
                    outcomes[i].validation_method = "none";
                    outcomes[i].confidence = scorer_.score(in);
                }
            }
        }
        if (stopped.load()) check(token, "validate");
        spdlog::debug("🔁 {} -> {} / {}", source_file_id, to_string(RunStage::Validated), to_string(RunStage::Scored));

        for (auto& diags : region_diagnostics) {
            warnings.insert(warnings.end(), diags.begin(), diags.end());
        }

        check(token, "assemble");
        ExtractionResult result = assembler_.assemble(doc, source_file_id, std::move(outcomes), std::move(warnings));
        result.mode = mode;
        spdlog::debug("🔁 {} -> {}", source_file_id, to_string(RunStage::Assembled));

        record.ast_blocks = result.stats.ast_parsed_count;
        record.fallback_blocks = result.stats.fallback_extracted_count;
        record.warning_count = result.warnings.size();
        finish("completed");

        spdlog::info("✅ Extracted {}: {} block(s) ({} ast, {} fallback), {} warning(s) in {:.1f} ms",
                     source_file_id, result.stats.total_extracted_count, result.stats.ast_parsed_count,
                     result.stats.fallback_extracted_count, result.warnings.size(), record.duration_ms);
        return result;
    } catch (const RunCancelled& e) {
        finish(e.timed_out() ? "timed_out" : "cancelled");
        spdlog::warn("🛑 {}: {}", source_file_id, e.what());
        throw;
    } catch (const DecodeFailure& e) {
        finish("failed");
        spdlog::error("❌ {}: {}", source_file_id, e.what());
        throw;
    }
}

} // namespace code_extraction
