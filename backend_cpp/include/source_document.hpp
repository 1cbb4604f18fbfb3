#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace code_extraction {

// Normalized UTF-8 text with '\n' line endings and a line-start index.
// Built once per ingested file and never modified afterwards.
class SourceDocument {
public:
    SourceDocument() : SourceDocument(std::string{}) {}
    explicit SourceDocument(std::string text);

    const std::string& text() const { return text_; }
    size_t size() const { return text_.size(); }
    bool empty() const { return text_.empty(); }

    // 1-based line containing `offset`. Offsets at or past the end map to the last line.
    size_t line_at(size_t offset) const;

    // Byte offset of the first character of 1-based `line`.
    size_t line_start(size_t line) const;

    // Offset one past the '\n' that ends `line` (or size() for the last line).
    size_t line_end(size_t line) const;

    size_t line_count() const { return line_starts_.size(); }

    std::string_view slice(size_t begin, size_t end) const;

private:
    std::string text_;
    std::vector<size_t> line_starts_;
};

} // namespace code_extraction
