#include "document_normalizer.hpp"
#include <cstdint>
#include <spdlog/spdlog.h>

namespace code_extraction {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Control characters other than tab, newline, carriage return and form feed.
bool is_stray_control(uint32_t cp) {
    if (cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f') return false;
    return cp < 0x20 || cp == 0x7F;
}

struct DecodeCounts {
    size_t valid = 0;
    size_t replaced = 0;
};

void emit(std::string& out, uint32_t cp, DecodeCounts& counts) {
    if (is_stray_control(cp)) {
        out += kReplacement;
        ++counts.replaced;
        return;
    }
    append_utf8(out, cp);
    ++counts.valid;
}

std::string decode_utf16(std::string_view bytes, bool little_endian, DecodeCounts& counts) {
    std::string out;
    out.reserve(bytes.size());
    auto unit_at = [&](size_t i) -> uint32_t {
        auto b0 = static_cast<unsigned char>(bytes[i]);
        auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        return little_endian ? (b0 | (b1 << 8)) : ((b0 << 8) | b1);
    };

    size_t i = 0;
    while (i + 1 < bytes.size()) {
        uint32_t unit = unit_at(i);
        i += 2;
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < bytes.size()) {
                uint32_t low = unit_at(i);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    i += 2;
                    emit(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00), counts);
                    continue;
                }
            }
            out += kReplacement;
            ++counts.replaced;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            out += kReplacement;
            ++counts.replaced;
        } else {
            emit(out, unit, counts);
        }
    }
    if (i < bytes.size()) { // odd trailing byte
        out += kReplacement;
        ++counts.replaced;
    }
    return out;
}

std::string decode_utf8(std::string_view bytes, DecodeCounts& counts) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            emit(out, c, counts);
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }

        bool ok = len > 0 && i + len <= bytes.size();
        for (size_t k = 1; ok && k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        if (ok && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) ok = false;

        if (!ok) {
            out += kReplacement;
            ++counts.replaced;
            ++i;
            continue;
        }
        if (cp == 0xFEFF && i == 0) { // BOM
            i += len;
            continue;
        }
        emit(out, cp, counts);
        i += len;
    }
    return out;
}

} // namespace

std::string DocumentNormalizer::decode_text(std::string_view bytes, std::vector<Diagnostic>& diagnostics,
                                            size_t* recovered_codepoints) {
    DecodeCounts counts;
    std::string text;
    std::string encoding = "utf-8";

    if (bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0xFF && static_cast<unsigned char>(bytes[1]) == 0xFE) {
        text = decode_utf16(bytes.substr(2), true, counts);
        encoding = "utf-16le";
    } else if (bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0xFE && static_cast<unsigned char>(bytes[1]) == 0xFF) {
        text = decode_utf16(bytes.substr(2), false, counts);
        encoding = "utf-16be";
    } else {
        text = decode_utf8(bytes, counts);
    }

    if (counts.replaced > 0) {
        diagnostics.push_back({DiagnosticKind::DecodeWarning,
                               "Replaced " + std::to_string(counts.replaced) +
                               " invalid " + encoding + " sequence(s) with U+FFFD"});
    }
    if (recovered_codepoints) *recovered_codepoints = counts.valid;
    return text;
}

std::string DocumentNormalizer::normalize_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

NormalizedDocument DocumentNormalizer::normalize(const std::string& raw_bytes, const std::string& filename) const {
    NormalizedDocument result;
    if (raw_bytes.empty()) return result;

    result.container = sniff_container(raw_bytes, filename);

    std::string payload;
    switch (result.container) {
        case ContainerKind::Docx: {
            ContainerText ct = containers::read_docx(raw_bytes, max_container_text_bytes_);
            payload = std::move(ct.text);
            result.diagnostics = std::move(ct.diagnostics);
            break;
        }
        case ContainerKind::Pdf: {
            ContainerText ct = containers::read_pdf(raw_bytes, max_container_text_bytes_);
            payload = std::move(ct.text);
            result.diagnostics = std::move(ct.diagnostics);
            break;
        }
        case ContainerKind::Plain:
            payload = raw_bytes;
            break;
    }

    size_t recovered = 0;
    std::string text = decode_text(payload, result.diagnostics, &recovered);
    // A bare BOM decodes to nothing and is an empty document, not a failure.
    if (recovered == 0 && !text.empty()) {
        throw DecodeFailure("No recoverable text in '" + filename + "' (" +
                            std::to_string(raw_bytes.size()) + " bytes)");
    }

    result.document = SourceDocument(normalize_line_endings(text));
    spdlog::debug("🧹 Normalized {} ({}): {} bytes -> {} bytes, {} diagnostic(s)", filename,
                  to_string(result.container), raw_bytes.size(), result.document.size(), result.diagnostics.size());
    return result;
}

} // namespace code_extraction
