#include "source_document.hpp"
#include <algorithm>
#include <stdexcept>

namespace code_extraction {

SourceDocument::SourceDocument(std::string text) : text_(std::move(text)) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        // A trailing '\n' does not open a new (empty) line.
        if (text_[i] == '\n' && i + 1 < text_.size()) {
            line_starts_.push_back(i + 1);
        }
    }
}

size_t SourceDocument::line_at(size_t offset) const {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    return static_cast<size_t>(it - line_starts_.begin());
}

size_t SourceDocument::line_start(size_t line) const {
    if (line == 0 || line > line_starts_.size()) {
        throw std::out_of_range("line " + std::to_string(line) + " outside document");
    }
    return line_starts_[line - 1];
}

size_t SourceDocument::line_end(size_t line) const {
    if (line == 0 || line > line_starts_.size()) {
        throw std::out_of_range("line " + std::to_string(line) + " outside document");
    }
    return line < line_starts_.size() ? line_starts_[line] : text_.size();
}

std::string_view SourceDocument::slice(size_t begin, size_t end) const {
    if (begin > end || end > text_.size()) {
        throw std::out_of_range("slice [" + std::to_string(begin) + ", " + std::to_string(end) + ") outside document");
    }
    return std::string_view(text_).substr(begin, end - begin);
}

} // namespace code_extraction
