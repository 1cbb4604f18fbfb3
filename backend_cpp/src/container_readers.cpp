#include "container_readers.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <miniz.h>
#include <tinyxml2.h>
#include <spdlog/spdlog.h>

namespace code_extraction {

const char* to_string(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::Plain: return "plain";
        case ContainerKind::Docx: return "docx";
        case ContainerKind::Pdf: return "pdf";
    }
    return "plain";
}

ContainerKind sniff_container(std::string_view bytes, const std::string& filename) {
    if (bytes.substr(0, 5) == "%PDF-") return ContainerKind::Pdf;
    std::string ext = to_lower(std::filesystem::path(filename).extension().string());
    if (bytes.substr(0, 4) == std::string_view("PK\x03\x04", 4) && ext != ".zip") return ContainerKind::Docx;
    if (ext == ".docx") return ContainerKind::Docx;
    if (ext == ".pdf") return ContainerKind::Pdf;
    return ContainerKind::Plain;
}

namespace containers {

// --- DOCX ---

namespace {

// Owns an in-memory zip reader over a borrowed buffer.
class ZipReader {
public:
    explicit ZipReader(const std::string& bytes) {
        std::memset(&archive_, 0, sizeof(archive_));
        open_ = mz_zip_reader_init_mem(&archive_, bytes.data(), bytes.size(), 0) != 0;
    }
    ~ZipReader() {
        if (open_) mz_zip_reader_end(&archive_);
    }
    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    bool is_open() const { return open_; }

    // -1 when the part is missing.
    long long uncompressed_size(const std::string& name) {
        int index = mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0);
        if (index < 0) return -1;
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&archive_, static_cast<mz_uint>(index), &stat)) return -1;
        return static_cast<long long>(stat.m_uncomp_size);
    }

    // miniz sizes the output from the central directory and rejects entries that inflate past it.
    bool file_content(const std::string& name, std::string& out) {
        int index = mz_zip_reader_locate_file(&archive_, name.c_str(), nullptr, 0);
        if (index < 0) return false;
        size_t out_size = 0;
        void* ptr = mz_zip_reader_extract_to_heap(&archive_, static_cast<mz_uint>(index), &out_size, 0);
        if (!ptr) return false;
        out.assign(static_cast<const char*>(ptr), out_size);
        mz_free(ptr);
        return true;
    }

    std::vector<std::string> files_with_prefix(const std::string& prefix) {
        std::vector<std::string> names;
        mz_uint count = mz_zip_reader_get_num_files(&archive_);
        for (mz_uint i = 0; i < count; ++i) {
            mz_zip_archive_file_stat stat;
            if (!mz_zip_reader_file_stat(&archive_, i, &stat)) continue;
            std::string name = stat.m_filename;
            if (name.compare(0, prefix.size(), prefix) == 0) names.push_back(name);
        }
        return names;
    }

private:
    mz_zip_archive archive_;
    bool open_ = false;
};

const tinyxml2::XMLElement* find_child(const tinyxml2::XMLElement* parent, const char* name) {
    for (auto el = parent ? parent->FirstChildElement() : nullptr; el; el = el->NextSiblingElement()) {
        if (std::strcmp(el->Name(), name) == 0) return el;
    }
    return nullptr;
}

void collect_run_text(const tinyxml2::XMLElement* node, std::string& out) {
    const char* name = node->Name();
    if (std::strcmp(name, "w:t") == 0) {
        if (const char* text = node->GetText()) out += text;
        return;
    }
    if (std::strcmp(name, "w:tab") == 0) {
        out.push_back('\t');
        return;
    }
    if (std::strcmp(name, "w:br") == 0 || std::strcmp(name, "w:cr") == 0) {
        out.push_back('\n');
        return;
    }
    for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
        collect_run_text(child, out);
    }
}

void collect_body(const tinyxml2::XMLElement* parent, std::vector<std::string>& lines);

void collect_table(const tinyxml2::XMLElement* tbl, std::vector<std::string>& lines) {
    for (auto row = tbl->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
        std::string line;
        bool first = true;
        for (auto cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
            std::vector<std::string> cell_lines;
            collect_body(cell, cell_lines);
            std::string cell_text;
            for (size_t i = 0; i < cell_lines.size(); ++i) {
                if (i) cell_text += ' ';
                cell_text += cell_lines[i];
            }
            if (!first) line += '\t';
            line += cell_text;
            first = false;
        }
        lines.push_back(line);
    }
}

void collect_body(const tinyxml2::XMLElement* parent, std::vector<std::string>& lines) {
    for (auto node = parent->FirstChildElement(); node; node = node->NextSiblingElement()) {
        const char* name = node->Name();
        if (std::strcmp(name, "w:p") == 0) {
            std::string text;
            collect_run_text(node, text);
            lines.push_back(text);
        } else if (std::strcmp(name, "w:tbl") == 0) {
            collect_table(node, lines);
        } else if (std::strcmp(name, "w:sdt") == 0) {
            if (auto content = find_child(node, "w:sdtContent")) collect_body(content, lines);
        }
    }
}

} // namespace

ContainerText read_docx(const std::string& bytes, size_t max_bytes) {
    ZipReader zip(bytes);
    if (!zip.is_open()) throw DecodeFailure("DOCX container is not a readable zip archive");

    long long main_size = zip.uncompressed_size("word/document.xml");
    if (main_size > static_cast<long long>(max_bytes)) {
        spdlog::warn("⚠️  DOCX main part inflates to {} bytes, limit is {}", main_size, max_bytes);
        throw DecodeFailure("DOCX main part inflates to " + std::to_string(main_size) +
                            " bytes, over the " + std::to_string(max_bytes) + " byte limit");
    }

    std::string xml;
    if (main_size < 0 || !zip.file_content("word/document.xml", xml)) {
        throw DecodeFailure("DOCX container has no word/document.xml part");
    }

    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw DecodeFailure(std::string("DOCX main part is not well-formed XML: ") + doc.ErrorStr());
    }
    const auto* body = find_child(doc.RootElement(), "w:body");
    if (!body) throw DecodeFailure("DOCX main part has no w:body");

    std::vector<std::string> lines;
    collect_body(body, lines);

    ContainerText out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.text += '\n';
        out.text += lines[i];
    }
    if (is_blank(out.text)) throw DecodeFailure("DOCX container holds no text layer");

    size_t dropped = zip.files_with_prefix("word/media/").size() + zip.files_with_prefix("word/embeddings/").size();
    if (dropped > 0) {
        out.diagnostics.push_back({DiagnosticKind::MalformedContainerWarning,
                                   "Dropped " + std::to_string(dropped) + " embedded media object(s) from DOCX"});
    }
    spdlog::debug("📄 DOCX text layer: {} lines, {} media dropped", lines.size(), dropped);
    return out;
}

// --- PDF ---

namespace {

void skip_whitespace(const std::string& data, size_t& pos) {
    while (pos < data.size() && std::isspace(static_cast<unsigned char>(data[pos]))) ++pos;
}

std::string parse_literal_string(const std::string& data, size_t& pos) {
    std::string out;
    int depth = 0;
    ++pos; // opening '('
    while (pos < data.size()) {
        char c = data[pos++];
        if (c == '\\' && pos < data.size()) {
            char e = data[pos++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case '\n': break; // line continuation
                default:
                    if (e >= '0' && e <= '7') {
                        int value = e - '0';
                        for (int k = 0; k < 2 && pos < data.size() && data[pos] >= '0' && data[pos] <= '7'; ++k) {
                            value = value * 8 + (data[pos++] - '0');
                        }
                        out.push_back(static_cast<char>(value & 0xFF));
                    } else {
                        out.push_back(e);
                    }
            }
            continue;
        }
        if (c == '(') ++depth;
        if (c == ')') {
            if (depth == 0) break;
            --depth;
        }
        out.push_back(c);
    }
    return out;
}

std::string parse_hex_string(const std::string& data, size_t& pos) {
    std::string digits;
    ++pos; // '<'
    while (pos < data.size() && data[pos] != '>') {
        if (std::isxdigit(static_cast<unsigned char>(data[pos]))) digits.push_back(data[pos]);
        ++pos;
    }
    if (pos < data.size()) ++pos;
    if (digits.size() % 2) digits.push_back('0');

    std::string out;
    for (size_t i = 0; i + 1 < digits.size(); i += 2) {
        out.push_back(static_cast<char>(std::stoi(digits.substr(i, 2), nullptr, 16)));
    }
    return out;
}

double parse_number(const std::string& data, size_t& pos) {
    size_t start = pos;
    while (pos < data.size() && (std::isdigit(static_cast<unsigned char>(data[pos])) ||
                                 data[pos] == '+' || data[pos] == '-' || data[pos] == '.')) {
        ++pos;
    }
    std::string token = data.substr(start, pos - start);
    if (token.empty() || token == "+" || token == "-" || token == ".") return 0.0;
    return std::strtod(token.c_str(), nullptr);
}

void flush_line(std::vector<std::string>& lines, std::string& current) {
    while (!current.empty() && std::isspace(static_cast<unsigned char>(current.back()))) current.pop_back();
    if (!current.empty()) lines.push_back(current);
    current.clear();
}

// Tj, TJ, ', ", T* and the positioning operators inside BT..ET.
std::string parse_text_stream(const std::string& data) {
    bool in_text = false;
    std::string current;
    std::vector<std::string> lines;
    size_t pos = 0;

    while (pos < data.size()) {
        skip_whitespace(data, pos);
        if (pos >= data.size()) break;
        char ch = data[pos];

        if (ch == '%') {
            while (pos < data.size() && data[pos] != '\n' && data[pos] != '\r') ++pos;
            continue;
        }
        if (ch == '(') {
            std::string s = parse_literal_string(data, pos);
            if (in_text) current += s;
            continue;
        }
        if (ch == '<' && pos + 1 < data.size() && data[pos + 1] == '<') {
            pos += 2;
            continue;
        }
        if (ch == '<') {
            std::string s = parse_hex_string(data, pos);
            if (in_text) current += s;
            continue;
        }
        if (ch == '[') {
            ++pos;
            while (pos < data.size() && data[pos] != ']') {
                skip_whitespace(data, pos);
                if (pos >= data.size() || data[pos] == ']') break;
                if (data[pos] == '(') {
                    std::string s = parse_literal_string(data, pos);
                    if (in_text) current += s;
                } else if (data[pos] == '<') {
                    std::string s = parse_hex_string(data, pos);
                    if (in_text) current += s;
                } else if (std::isdigit(static_cast<unsigned char>(data[pos])) || data[pos] == '-' ||
                           data[pos] == '+' || data[pos] == '.') {
                    // Large negative kerning is a word gap.
                    if (parse_number(data, pos) < -200.0 && in_text) current.push_back(' ');
                } else {
                    ++pos;
                }
            }
            if (pos < data.size()) ++pos;
            continue;
        }
        if ((ch == '\'' || ch == '"') && in_text) {
            ++pos;
            flush_line(lines, current);
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '*') {
            size_t start = pos;
            while (pos < data.size() && (std::isalpha(static_cast<unsigned char>(data[pos])) || data[pos] == '*')) ++pos;
            std::string op = data.substr(start, pos - start);
            if (op == "BT") {
                in_text = true;
            } else if (op == "ET") {
                flush_line(lines, current);
                in_text = false;
            } else if (in_text && (op == "T*" || op == "Td" || op == "TD" || op == "Tm")) {
                flush_line(lines, current);
            }
            continue;
        }
        if (ch == '/') {
            ++pos;
            while (pos < data.size() && !std::isspace(static_cast<unsigned char>(data[pos])) &&
                   std::strchr("/[]()<>{}%", data[pos]) == nullptr) {
                ++pos;
            }
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '-' || ch == '+' || ch == '.') {
            parse_number(data, pos);
            continue;
        }
        ++pos;
    }
    flush_line(lines, current);

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

size_t declared_length(const std::string& dict) {
    size_t pos = dict.find("/Length");
    if (pos == std::string::npos) return 0;
    pos += 7;
    while (pos < dict.size() && std::isspace(static_cast<unsigned char>(dict[pos]))) ++pos;
    size_t start = pos;
    while (pos < dict.size() && std::isdigit(static_cast<unsigned char>(dict[pos]))) ++pos;
    if (start == pos || pos - start > 12) return 0;
    // "/Length 12 0 R" is an indirect reference, not a length.
    size_t after = pos;
    while (after < dict.size() && std::isspace(static_cast<unsigned char>(dict[after]))) ++after;
    if (after < dict.size() && std::isdigit(static_cast<unsigned char>(dict[after]))) return 0;
    return static_cast<size_t>(std::stoull(dict.substr(start, pos - start)));
}

enum class InflateStatus { Ok, Corrupt, Oversize };

// zlib stream into a buffer that doubles up to `limit` bytes and never past it.
InflateStatus inflate(const std::string& raw, size_t limit, std::string& out) {
    if (limit == 0) return InflateStatus::Oversize;
    tinfl_decompressor inflator;
    tinfl_init(&inflator);

    std::string buffer(std::min(limit, std::max<size_t>(raw.size() * 4, 4096)), '\0');
    const auto* in = reinterpret_cast<const mz_uint8*>(raw.data());
    size_t in_pos = 0;
    size_t out_len = 0;
    for (;;) {
        size_t in_bytes = raw.size() - in_pos;
        size_t out_bytes = buffer.size() - out_len;
        auto* base = reinterpret_cast<mz_uint8*>(&buffer[0]);
        tinfl_status status = tinfl_decompress(&inflator, in + in_pos, &in_bytes, base, base + out_len, &out_bytes,
                                               TINFL_FLAG_PARSE_ZLIB_HEADER | TINFL_FLAG_USING_NON_WRAPPING_OUTPUT_BUF);
        in_pos += in_bytes;
        out_len += out_bytes;
        if (status == TINFL_STATUS_DONE) {
            buffer.resize(out_len);
            out = std::move(buffer);
            return InflateStatus::Ok;
        }
        if (status != TINFL_STATUS_HAS_MORE_OUTPUT) return InflateStatus::Corrupt;
        if (buffer.size() >= limit) return InflateStatus::Oversize;
        buffer.resize(std::min(limit, buffer.size() * 2));
    }
}

bool is_image_dict(const std::string& dict) {
    return dict.find("/Subtype/Image") != std::string::npos || dict.find("/Subtype /Image") != std::string::npos;
}

} // namespace

ContainerText read_pdf(const std::string& bytes, size_t max_bytes) {
    ContainerText out;
    size_t images = 0;
    size_t unsupported = 0;
    size_t corrupt = 0;
    size_t oversize = 0;
    size_t decoded_total = 0;
    std::vector<std::string> blocks;

    size_t search = 0;
    while (true) {
        size_t stream_pos = bytes.find("stream", search);
        if (stream_pos == std::string::npos) break;
        // "endstream" also contains the keyword.
        if (stream_pos >= 3 && bytes.compare(stream_pos - 3, 3, "end") == 0) {
            search = stream_pos + 6;
            continue;
        }
        size_t dict_start = bytes.rfind("<<", stream_pos);
        size_t dict_end = dict_start == std::string::npos ? std::string::npos : bytes.rfind(">>", stream_pos);
        if (dict_start == std::string::npos || dict_end == std::string::npos || dict_end < dict_start) {
            search = stream_pos + 6;
            continue;
        }
        std::string dict = bytes.substr(dict_start, dict_end - dict_start + 2);

        size_t data_start = stream_pos + 6;
        if (data_start < bytes.size() && bytes[data_start] == '\r') ++data_start;
        if (data_start < bytes.size() && bytes[data_start] == '\n') ++data_start;

        size_t length = declared_length(dict);
        size_t data_end;
        size_t end_pos;
        if (length > 0 && data_start + length <= bytes.size()) {
            data_end = data_start + length;
            end_pos = bytes.find("endstream", data_end);
        } else {
            end_pos = bytes.find("endstream", data_start);
            data_end = end_pos;
        }
        if (end_pos == std::string::npos) {
            ++corrupt;
            break;
        }
        search = end_pos + 9;

        if (is_image_dict(dict)) {
            ++images;
            continue;
        }

        std::string raw = bytes.substr(data_start, data_end - data_start);
        std::string decoded;
        const size_t remaining = max_bytes - decoded_total;
        if (dict.find("/Filter") == std::string::npos) {
            if (raw.size() > remaining) {
                ++oversize;
                continue;
            }
            decoded = raw;
        } else if (dict.find("/FlateDecode") != std::string::npos &&
                   dict.find("/DCTDecode") == std::string::npos &&
                   dict.find("/ASCII85Decode") == std::string::npos &&
                   dict.find("/LZWDecode") == std::string::npos) {
            InflateStatus status = inflate(raw, remaining, decoded);
            if (status == InflateStatus::Oversize) {
                ++oversize;
                continue;
            }
            if (status == InflateStatus::Corrupt) {
                ++corrupt;
                continue;
            }
        } else {
            ++unsupported;
            continue;
        }

        decoded_total += decoded.size();
        std::string text = parse_text_stream(decoded);
        if (!is_blank(text)) blocks.push_back(text);
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i) out.text += "\n\n";
        out.text += blocks[i];
    }

    if (images > 0) {
        out.diagnostics.push_back({DiagnosticKind::MalformedContainerWarning,
                                   "Dropped " + std::to_string(images) + " image stream(s) from PDF"});
    }
    if (unsupported > 0) {
        out.diagnostics.push_back({DiagnosticKind::MalformedContainerWarning,
                                   "Dropped " + std::to_string(unsupported) + " PDF stream(s) with unsupported filters"});
    }
    if (corrupt > 0) {
        out.diagnostics.push_back({DiagnosticKind::MalformedContainerWarning,
                                   "Skipped " + std::to_string(corrupt) + " corrupt PDF stream(s)"});
    }

    if (oversize > 0) {
        out.diagnostics.push_back({DiagnosticKind::MalformedContainerWarning,
                                   "Dropped " + std::to_string(oversize) + " PDF stream(s) over the " +
                                   std::to_string(max_bytes) + " byte decode limit"});
    }

    if (out.text.empty()) throw DecodeFailure("PDF container holds no text layer");
    spdlog::debug("📄 PDF text layer: {} block(s), {} image(s) dropped", blocks.size(), images);
    return out;
}

} // namespace containers

} // namespace code_extraction
