#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "extraction_errors.hpp"

namespace code_extraction {

inline constexpr const char* kUnknownLanguage = "unknown";

enum class DetectionMethod { Fence, Indentation, Density, WholeFile };
enum class BlockType { Ast, Fallback };
enum class BlockStatus { Pending, Accepted, Rejected };
enum class SegmentationMode { WholeFile, MixedContent };

const char* to_string(DetectionMethod method);
const char* to_string(BlockType type);
const char* to_string(BlockStatus status);
const char* to_string(SegmentationMode mode);

// A span proposed by the segmenter, not yet validated.
struct CandidateRegion {
    size_t start_offset = 0;
    size_t end_offset = 0;
    std::optional<std::string> declared_language;
    DetectionMethod detection_method = DetectionMethod::WholeFile;
    bool unterminated = false; // fence opened but never closed

    size_t length() const { return end_offset - start_offset; }
};

struct FillerSpan {
    size_t start_offset = 0;
    size_t end_offset = 0;
};

struct ExtractedBlock {
    std::string block_id;
    std::string source_file_id;
    std::string language;
    BlockType block_type = BlockType::Fallback;
    std::string content;
    size_t start_line = 0;
    size_t end_line = 0;
    size_t start_offset = 0;
    size_t end_offset = 0;
    double confidence_score = 0.0;
    BlockStatus status = BlockStatus::Pending;
    DetectionMethod detection_method = DetectionMethod::WholeFile;
    std::string validation_method;

    nlohmann::json to_json() const;
};

struct ExtractionStats {
    size_t ast_parsed_count = 0;
    size_t fallback_extracted_count = 0;
    size_t total_extracted_count = 0;

    nlohmann::json to_json() const;
};

struct ExtractionResult {
    std::string source_file_id;
    std::vector<ExtractedBlock> blocks;
    std::vector<FillerSpan> filler;
    ExtractionStats stats;
    std::vector<Diagnostic> warnings;
    size_t document_size = 0;
    SegmentationMode mode = SegmentationMode::WholeFile;

    nlohmann::json to_json() const;
};

} // namespace code_extraction
