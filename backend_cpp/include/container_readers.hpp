#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "extraction_errors.hpp"

namespace code_extraction {

enum class ContainerKind { Plain, Docx, Pdf };

const char* to_string(ContainerKind kind);

// Magic bytes first, then the file extension.
ContainerKind sniff_container(std::string_view bytes, const std::string& filename);

struct ContainerText {
    std::string text;
    std::vector<Diagnostic> diagnostics;
};

namespace containers {

// Paragraph text of word/document.xml. Paragraphs become lines, table cells are
// tab-separated. Embedded media is dropped with a MalformedContainerWarning.
// A main part inflating past `max_bytes` is never extracted.
// Throws DecodeFailure when the archive or its main part is unreadable, oversize or holds no text.
ContainerText read_docx(const std::string& bytes, size_t max_bytes);

// Text-showing operators inside BT..ET of every content stream. FlateDecode streams
// are inflated; images and other filters are dropped with a warning. Streams that
// would take the decoded total past `max_bytes` are dropped with a warning too.
// Throws DecodeFailure when no text layer is found.
ContainerText read_pdf(const std::string& bytes, size_t max_bytes);

} // namespace containers

} // namespace code_extraction
