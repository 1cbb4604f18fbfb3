#include "block_assembler.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_extraction {

namespace {

std::string span_label(size_t start, size_t end) {
    return "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
}

} // namespace

std::string BlockAssembler::block_id(const std::string& source_file_id, size_t start, size_t end,
                                     std::string_view content) {
    std::string key = std::to_string(start) + ":" + std::to_string(end) + ":";
    key.append(content.data(), content.size());
    return source_file_id + "#" + fnv1a_hex(key);
}

std::vector<FillerSpan> BlockAssembler::complement(const std::vector<ExtractedBlock>& blocks, size_t size) {
    std::vector<FillerSpan> filler;
    size_t cursor = 0;
    for (const auto& block : blocks) {
        if (block.start_offset > cursor) filler.push_back({cursor, block.start_offset});
        cursor = std::max(cursor, block.end_offset);
    }
    if (cursor < size) filler.push_back({cursor, size});
    return filler;
}

ExtractionResult BlockAssembler::assemble(const SourceDocument& doc, const std::string& source_file_id,
                                          std::vector<RegionOutcome> outcomes,
                                          std::vector<Diagnostic> warnings) const {
    // Start offset; ties go to the longer region, then the more confident one.
    std::stable_sort(outcomes.begin(), outcomes.end(), [](const RegionOutcome& a, const RegionOutcome& b) {
        if (a.region.start_offset != b.region.start_offset) return a.region.start_offset < b.region.start_offset;
        if (a.region.length() != b.region.length()) return a.region.length() > b.region.length();
        return a.confidence > b.confidence;
    });

    std::vector<RegionOutcome> kept;
    for (auto& candidate : outcomes) {
        if (candidate.region.length() == 0) continue;
        if (kept.empty() || candidate.region.start_offset >= kept.back().region.end_offset) {
            kept.push_back(std::move(candidate));
            continue;
        }

        // Sorted and disjoint so far: only the last kept region can overlap.
        RegionOutcome& incumbent = kept.back();
        bool candidate_wins = candidate.confidence > incumbent.confidence;
        const RegionOutcome& winner = candidate_wins ? candidate : incumbent;
        const RegionOutcome& loser = candidate_wins ? incumbent : candidate;

        if (loser.region.start_offset < winner.region.start_offset ||
            loser.region.end_offset > winner.region.end_offset) {
            warnings.push_back({DiagnosticKind::CoverageWarning,
                                "Overlap resolved: " + span_label(loser.region.start_offset, loser.region.end_offset) +
                                " dropped in favour of " +
                                span_label(winner.region.start_offset, winner.region.end_offset) +
                                ", uncovered bytes returned to filler"});
        }
        if (candidate_wins) incumbent = std::move(candidate);
    }

    ExtractionResult result;
    result.source_file_id = source_file_id;
    result.document_size = doc.size();

    for (const auto& outcome : kept) {
        const auto& r = outcome.region;
        ExtractedBlock block;
        block.source_file_id = source_file_id;
        block.language = outcome.language;
        block.block_type = outcome.block_type;
        block.content = std::string(doc.slice(r.start_offset, r.end_offset));
        block.start_offset = r.start_offset;
        block.end_offset = r.end_offset;
        block.start_line = doc.line_at(r.start_offset);
        block.end_line = doc.line_at(r.end_offset - 1);
        block.confidence_score = outcome.confidence;
        block.status = BlockStatus::Pending;
        block.detection_method = r.detection_method;
        block.validation_method = outcome.validation_method;
        block.block_id = block_id(source_file_id, r.start_offset, r.end_offset, block.content);

        if (block.block_type == BlockType::Ast) ++result.stats.ast_parsed_count;
        else ++result.stats.fallback_extracted_count;
        result.blocks.push_back(std::move(block));
    }
    result.stats.total_extracted_count = result.blocks.size();
    result.filler = complement(result.blocks, doc.size());
    result.warnings = std::move(warnings);

    spdlog::debug("🧩 Assembled {}: {} block(s), {} filler span(s)", source_file_id, result.blocks.size(),
                  result.filler.size());
    return result;
}

} // namespace code_extraction
