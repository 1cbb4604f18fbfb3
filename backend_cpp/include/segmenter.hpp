#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "engine_config.hpp"
#include "extraction_types.hpp"
#include "language_registry.hpp"
#include "source_document.hpp"

namespace code_extraction {

// Proposes candidate code regions. Everything it does not propose is filler.
class Segmenter {
public:
    explicit Segmenter(const EngineConfig& config,
                       const LanguageRegistry& registry = LanguageRegistry::instance());

    // Documents (.md, .txt, .docx, ...) are mixed content; anything else is one source file.
    SegmentationMode choose_mode(const std::string& path) const;

    // Regions are whole lines, non-overlapping and sorted by start offset.
    std::vector<CandidateRegion> segment(const SourceDocument& doc, SegmentationMode mode,
                                         const std::optional<std::string>& declared_language) const;

    // Natural-language indicators: stop-word ratio above 20% or more than two sentence breaks.
    static bool looks_like_prose(std::string_view text);

    // One line, or up to three lines, that are all bare `name = value` assignments.
    static bool is_inline_assignment(std::string_view text);

private:
    struct Line {
        size_t start;
        size_t end;             // one past the '\n'
        std::string_view text;  // without the '\n'
    };

    std::vector<Line> lines_of(const SourceDocument& doc) const;
    void find_fences(const std::vector<Line>& lines, size_t doc_size, std::vector<bool>& marked,
                     std::vector<CandidateRegion>& out) const;
    void find_indented(const std::vector<Line>& lines, std::vector<bool>& marked,
                       std::vector<CandidateRegion>& out) const;
    void find_dense(const std::vector<Line>& lines, std::vector<bool>& marked,
                    std::vector<CandidateRegion>& out) const;

    std::string join(const std::vector<Line>& lines, size_t first, size_t last) const;

    const EngineConfig& config_;
    const LanguageRegistry& registry_;
};

} // namespace code_extraction
