#pragma once
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "extraction_errors.hpp"
#include "extraction_types.hpp"

namespace code_extraction::test_support {

// In-memory .docx with the given word/document.xml and optional extra parts.
std::string make_docx(const std::string& document_xml,
                      const std::vector<std::pair<std::string, std::string>>& extra_parts = {});

// <w:document> wrapping one <w:p><w:r><w:t> per paragraph.
std::string docx_body(const std::vector<std::string>& paragraphs);

struct PdfStream {
    std::string content;
    bool deflate = false;
    bool image = false;
};

// Minimal PDF: one object per stream, each with an explicit /Length.
std::string make_pdf(const std::vector<PdfStream>& streams);

size_t count_kind(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind);

// Blocks and filler sorted together must tile [0, size) with no gap or overlap.
::testing::AssertionResult covers_exactly(const ExtractionResult& result, const std::string& text);

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    void write(const std::string& relative, const std::string& bytes) const;

private:
    std::filesystem::path path_;
};

} // namespace code_extraction::test_support
