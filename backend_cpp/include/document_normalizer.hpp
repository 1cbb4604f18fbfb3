#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "container_readers.hpp"
#include "engine_config.hpp"
#include "extraction_errors.hpp"
#include "source_document.hpp"

namespace code_extraction {

struct NormalizedDocument {
    SourceDocument document;
    std::vector<Diagnostic> diagnostics;
    ContainerKind container = ContainerKind::Plain;
};

// Raw bytes -> UTF-8 text with '\n' line endings.
class DocumentNormalizer {
public:
    DocumentNormalizer() = default;
    explicit DocumentNormalizer(const EngineConfig& config)
        : max_container_text_bytes_(config.max_container_text_bytes) {}

    // Throws DecodeFailure when non-empty input yields nothing readable.
    NormalizedDocument normalize(const std::string& raw_bytes, const std::string& filename) const;

    // BOM handling, UTF-16 transcoding and U+FFFD replacement. Appends at most one
    // DecodeWarning. `recovered_codepoints` receives the count of valid code points.
    static std::string decode_text(std::string_view bytes, std::vector<Diagnostic>& diagnostics,
                                   size_t* recovered_codepoints = nullptr);

    static std::string normalize_line_endings(std::string_view text);

private:
    size_t max_container_text_bytes_ = EngineConfig{}.max_container_text_bytes;
};

} // namespace code_extraction
