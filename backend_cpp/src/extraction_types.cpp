#include "extraction_types.hpp"

namespace code_extraction {

using json = nlohmann::json;

const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DecodeWarning: return "decode_warning";
        case DiagnosticKind::ParseFailure: return "parse_failure";
        case DiagnosticKind::ParseTimeout: return "parse_timeout";
        case DiagnosticKind::UnsupportedLanguage: return "unsupported_language";
        case DiagnosticKind::MalformedContainerWarning: return "malformed_container";
        case DiagnosticKind::CoverageWarning: return "coverage_warning";
    }
    return "unknown";
}

const char* to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::Fence: return "fence";
        case DetectionMethod::Indentation: return "indentation";
        case DetectionMethod::Density: return "density";
        case DetectionMethod::WholeFile: return "whole_file";
    }
    return "unknown";
}

const char* to_string(BlockType type) {
    return type == BlockType::Ast ? "ast" : "fallback";
}

const char* to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::Pending: return "pending";
        case BlockStatus::Accepted: return "accepted";
        case BlockStatus::Rejected: return "rejected";
    }
    return "pending";
}

const char* to_string(SegmentationMode mode) {
    return mode == SegmentationMode::WholeFile ? "whole_file" : "mixed_content";
}

json ExtractedBlock::to_json() const {
    return json{
        {"block_id", block_id},
        {"source_file_id", source_file_id},
        {"language", language},
        {"block_type", to_string(block_type)},
        {"content", content},
        {"start_line", start_line},
        {"end_line", end_line},
        {"start_offset", start_offset},
        {"end_offset", end_offset},
        {"confidence_score", confidence_score},
        {"status", to_string(status)},
        {"detection_method", to_string(detection_method)},
        {"validation_method", validation_method}
    };
}

json ExtractionStats::to_json() const {
    return json{
        {"ast_parsed", ast_parsed_count},
        {"fallback_extracted", fallback_extracted_count},
        {"total_extracted", total_extracted_count}
    };
}

json ExtractionResult::to_json() const {
    json j_blocks = json::array();
    for (const auto& block : blocks) j_blocks.push_back(block.to_json());

    json j_filler = json::array();
    for (const auto& span : filler) {
        j_filler.push_back({{"start_offset", span.start_offset}, {"end_offset", span.end_offset}});
    }

    json j_warnings = json::array();
    for (const auto& w : warnings) {
        j_warnings.push_back(std::string(to_string(w.kind)) + ": " + w.message);
    }

    return json{
        {"source_file_id", source_file_id},
        {"blocks", j_blocks},
        {"filler", j_filler},
        {"stats", stats.to_json()},
        {"warnings", j_warnings},
        {"document_size", document_size},
        {"mode", to_string(mode)}
    };
}

} // namespace code_extraction
