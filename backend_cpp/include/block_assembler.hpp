#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "extraction_types.hpp"
#include "source_document.hpp"

namespace code_extraction {

// A region after validation and scoring, before it becomes a block.
struct RegionOutcome {
    CandidateRegion region;
    std::string language;
    BlockType block_type = BlockType::Fallback;
    double confidence = 0.0;
    std::string validation_method;
};

class BlockAssembler {
public:
    // Orders outcomes, resolves overlaps, assigns ids and derives filler and stats.
    // Blocks and filler together cover [0, doc.size()) exactly once.
    ExtractionResult assemble(const SourceDocument& doc, const std::string& source_file_id,
                              std::vector<RegionOutcome> outcomes, std::vector<Diagnostic> warnings) const;

    // "<source_file_id>#<fnv1a of offsets and content>"; identical input gives identical ids.
    static std::string block_id(const std::string& source_file_id, size_t start, size_t end,
                                std::string_view content);

    static std::vector<FillerSpan> complement(const std::vector<ExtractedBlock>& blocks, size_t size);
};

} // namespace code_extraction
