#include "segmenter.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_extraction {

namespace {

const std::unordered_set<std::string> kProseIndicators = {
    "the", "a", "an", "is", "are", "was", "were", "and", "or",
    "but", "however", "therefore", "this", "that", "these", "those"
};

// `name = value` on one trimmed line. A plain scan, so line length never matters.
bool assignment_line(std::string_view line) {
    size_t i = 0;
    while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_')) ++i;
    if (i == 0) return false;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i >= line.size() || line[i] != '=') return false;
    return i + 1 < line.size();
}

struct Fence {
    char marker = 0;
    size_t length = 0;
    std::string info;
};

// ``` or ~~~ (three or more) after optional indentation.
bool parse_fence(std::string_view line, Fence& fence) {
    std::string_view t = trim(line);
    if (t.size() < 3 || (t[0] != '`' && t[0] != '~')) return false;
    size_t n = 0;
    while (n < t.size() && t[n] == t[0]) ++n;
    if (n < 3) return false;
    fence.marker = t[0];
    fence.length = n;
    fence.info = std::string(trim(t.substr(n)));
    return true;
}

// "{.python}", "python title=x.py", "c++" -> first token, lower-case.
std::optional<std::string> fence_label(const std::string& info) {
    std::string_view t = info;
    while (!t.empty() && (t.front() == '{' || t.front() == '.')) t.remove_prefix(1);
    size_t end = 0;
    while (end < t.size() && !std::isspace(static_cast<unsigned char>(t[end])) && t[end] != '}' && t[end] != ',') ++end;
    if (end == 0) return std::nullopt;
    return to_lower(t.substr(0, end));
}

bool overlaps(const CandidateRegion& a, const CandidateRegion& b) {
    return a.start_offset < b.end_offset && b.start_offset < a.end_offset;
}

} // namespace

Segmenter::Segmenter(const EngineConfig& config, const LanguageRegistry& registry)
    : config_(config), registry_(registry) {}

SegmentationMode Segmenter::choose_mode(const std::string& path) const {
    return registry_.is_document_path(path) ? SegmentationMode::MixedContent : SegmentationMode::WholeFile;
}

bool Segmenter::looks_like_prose(std::string_view text) {
    size_t words = 0;
    size_t prose_words = 0;
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        if (!(std::isalnum(c) || c == '_')) { ++i; continue; }
        size_t start = i;
        while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) ++i;
        ++words;
        if (kProseIndicators.count(to_lower(text.substr(start, i - start)))) ++prose_words;
    }
    if (words == 0) return false;
    if (static_cast<double>(prose_words) / static_cast<double>(words) > 0.20) return true;

    size_t sentences = 0;
    for (size_t k = 0; k + 1 < text.size(); ++k) {
        if (text[k] != '.') continue;
        size_t j = k + 1;
        if (j >= text.size() || !std::isspace(static_cast<unsigned char>(text[j]))) continue;
        while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
        if (j < text.size() && std::isupper(static_cast<unsigned char>(text[j]))) ++sentences;
    }
    return sentences > 2;
}

bool Segmenter::is_inline_assignment(std::string_view text) {
    std::vector<std::string> lines;
    for (auto line : split_lines(text)) {
        if (!is_blank(line)) lines.emplace_back(trim(line));
    }
    if (lines.empty() || lines.size() > 3) return false;
    return std::all_of(lines.begin(), lines.end(),
                       [](const std::string& l) { return assignment_line(l); });
}

std::vector<Segmenter::Line> Segmenter::lines_of(const SourceDocument& doc) const {
    std::vector<Line> lines;
    lines.reserve(doc.line_count());
    for (size_t n = 1; n <= doc.line_count(); ++n) {
        size_t start = doc.line_start(n);
        size_t end = doc.line_end(n);
        size_t text_end = (end > start && doc.text()[end - 1] == '\n') ? end - 1 : end;
        lines.push_back({start, end, doc.slice(start, text_end)});
    }
    return lines;
}

std::string Segmenter::join(const std::vector<Line>& lines, size_t first, size_t last) const {
    std::string out;
    for (size_t i = first; i <= last; ++i) {
        if (i > first) out += '\n';
        out += lines[i].text;
    }
    return out;
}

void Segmenter::find_fences(const std::vector<Line>& lines, size_t doc_size, std::vector<bool>& marked,
                            std::vector<CandidateRegion>& out) const {
    size_t i = 0;
    while (i < lines.size()) {
        Fence open;
        if (!parse_fence(lines[i].text, open)) { ++i; continue; }

        size_t close = i + 1;
        Fence candidate;
        while (close < lines.size()) {
            if (parse_fence(lines[close].text, candidate) && candidate.marker == open.marker &&
                candidate.length >= open.length && candidate.info.empty()) {
                break;
            }
            ++close;
        }
        bool unterminated = close >= lines.size();

        CandidateRegion region;
        region.start_offset = i + 1 < lines.size() ? lines[i + 1].start : doc_size;
        region.end_offset = unterminated ? doc_size : lines[close].start;
        region.declared_language = fence_label(open.info);
        region.detection_method = DetectionMethod::Fence;
        region.unterminated = unterminated;

        size_t last = unterminated ? lines.size() - 1 : close;
        for (size_t k = i; k <= last; ++k) marked[k] = true;

        bool has_content = false;
        for (size_t k = i + 1; k < lines.size() && k < close; ++k) {
            if (!is_blank(lines[k].text)) { has_content = true; break; }
        }
        if (region.length() > 0 && has_content) out.push_back(region);

        i = last + 1;
    }
}

void Segmenter::find_indented(const std::vector<Line>& lines, std::vector<bool>& marked,
                              std::vector<CandidateRegion>& out) const {
    auto is_indented = [&](size_t k) {
        const auto& t = lines[k].text;
        return !marked[k] && !is_blank(t) && (indent_width(t) >= 4 || (!t.empty() && t[0] == '\t'));
    };

    size_t i = 0;
    while (i < lines.size()) {
        if (!is_indented(i)) { ++i; continue; }

        size_t first = i;
        size_t last = i;
        size_t nonblank = 1;
        size_t k = i + 1;
        while (k < lines.size() && !marked[k]) {
            if (is_indented(k)) {
                last = k;
                ++nonblank;
                ++k;
            } else if (is_blank(lines[k].text)) {
                ++k; // blank lines stay inside the run only when indentation resumes
            } else {
                break;
            }
        }
        i = last + 1;

        if (nonblank < config_.min_block_lines) continue;
        std::string text = join(lines, first, last);
        if (technical_density(text) > config_.density_threshold || block_complexity(text) >= 2) {
            CandidateRegion region;
            region.start_offset = lines[first].start;
            region.end_offset = lines[last].end;
            region.detection_method = DetectionMethod::Indentation;
            out.push_back(region);
            for (size_t m = first; m <= last; ++m) marked[m] = true;
        }
    }
}

void Segmenter::find_dense(const std::vector<Line>& lines, std::vector<bool>& marked,
                           std::vector<CandidateRegion>& out) const {
    const size_t window = config_.density_window;
    const double threshold = config_.density_threshold;

    size_t i = 0;
    while (i + window <= lines.size()) {
        bool clear = true;
        for (size_t k = i; k < i + window; ++k) {
            if (marked[k]) { clear = false; break; }
        }
        if (!clear) { ++i; continue; }

        double density = technical_density(join(lines, i, i + window - 1));
        if (density <= threshold) { ++i; continue; }

        size_t start = i;
        size_t end = i + window; // exclusive
        while (end < lines.size() && !marked[end] && technical_density(lines[end].text) > threshold * 0.8) ++end;

        // The window may have pulled in blank or prose lines at its edges.
        const double edge = threshold * 0.8;
        size_t first = start;
        size_t last = end - 1;
        while (first < last && technical_density(lines[first].text) <= edge) ++first;
        while (last > first && technical_density(lines[last].text) <= edge) --last;

        if (last - first + 1 >= config_.min_block_lines) {
            std::string text = join(lines, first, last);
            if (block_complexity(text) >= 3 || density > 0.30) {
                CandidateRegion region;
                region.start_offset = lines[first].start;
                region.end_offset = lines[last].end;
                region.detection_method = DetectionMethod::Density;
                out.push_back(region);
                for (size_t m = first; m <= last; ++m) marked[m] = true;
            }
        }
        i = end;
    }
}

std::vector<CandidateRegion> Segmenter::segment(const SourceDocument& doc, SegmentationMode mode,
                                                const std::optional<std::string>& declared_language) const {
    std::vector<CandidateRegion> regions;
    if (is_blank(doc.text())) return regions;

    if (mode == SegmentationMode::WholeFile) {
        CandidateRegion region;
        region.start_offset = 0;
        region.end_offset = doc.size();
        region.declared_language = declared_language;
        region.detection_method = DetectionMethod::WholeFile;
        regions.push_back(region);
        return regions;
    }

    auto lines = lines_of(doc);
    std::vector<bool> marked(lines.size(), false);

    std::vector<CandidateRegion> fences;
    find_fences(lines, doc.size(), marked, fences);

    std::vector<CandidateRegion> heuristic;
    find_indented(lines, marked, heuristic);
    find_dense(lines, marked, heuristic);

    size_t discarded = 0;
    for (auto& region : heuristic) {
        std::string_view text = doc.slice(region.start_offset, region.end_offset);
        if (looks_like_prose(text) || is_inline_assignment(text)) {
            ++discarded;
            continue;
        }
        region.declared_language = declared_language;
        fences.push_back(region);
    }

    // Longer region wins on overlap.
    std::stable_sort(fences.begin(), fences.end(), [](const CandidateRegion& a, const CandidateRegion& b) {
        return a.length() > b.length();
    });
    for (const auto& candidate : fences) {
        if (is_blank(doc.slice(candidate.start_offset, candidate.end_offset))) continue;
        bool clash = std::any_of(regions.begin(), regions.end(),
                                 [&](const CandidateRegion& kept) { return overlaps(kept, candidate); });
        if (!clash) regions.push_back(candidate);
    }
    std::sort(regions.begin(), regions.end(), [](const CandidateRegion& a, const CandidateRegion& b) {
        return a.start_offset < b.start_offset;
    });

    spdlog::debug("✂️  Segmented {} lines into {} region(s), {} discarded as prose", lines.size(),
                  regions.size(), discarded);
    return regions;
}

} // namespace code_extraction
