#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <unordered_set>

namespace code_extraction {

namespace {

const std::string_view kTechnicalChars = "{}[]()<>;:=+-*/%&|!~^#@$";

const std::unordered_set<std::string> kKeywords = {
    "def", "class", "function", "var", "let", "const", "import", "export",
    "if", "else", "for", "while", "return", "void", "int", "string",
    "public", "private", "static", "async", "await", "try", "catch"
};

const std::unordered_set<std::string> kDefinitionWords = {"def", "function", "public", "private"};
const std::unordered_set<std::string> kControlWords = {"if", "for", "while", "switch"};
const std::unordered_set<std::string> kTypeWords = {"class", "interface", "struct"};

bool is_ident_start(unsigned char c) { return std::isalpha(c) || c == '_'; }
bool is_ident_char(unsigned char c) { return std::isalnum(c) || c == '_'; }

} // namespace

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string_view trim(std::string_view text) {
    size_t b = 0;
    while (b < text.size() && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    size_t e = text.size();
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    return text.substr(b, e - b);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

size_t indent_width(std::string_view line) {
    size_t width = 0;
    for (char c : line) {
        if (c == ' ') width += 1;
        else if (c == '\t') width += 4;
        else break;
    }
    return width;
}

double technical_density(std::string_view text) {
    if (is_blank(text)) return 0.0;

    size_t tech_count = 0;
    for (char c : text) {
        if (kTechnicalChars.find(c) != std::string_view::npos) ++tech_count;
    }

    size_t words = 0;
    size_t keyword_count = 0;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= text.size()) break;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        ++words;
        if (kKeywords.count(to_lower(text.substr(start, i - start)))) ++keyword_count;
    }

    double char_density = static_cast<double>(tech_count) / static_cast<double>(std::max<size_t>(text.size(), 1));
    double keyword_density = static_cast<double>(keyword_count) / static_cast<double>(std::max<size_t>(words, 1));
    return char_density * 0.7 + keyword_density * 0.3;
}

int block_complexity(std::string_view text) {
    int score = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_ident_start(static_cast<unsigned char>(text[i]))) { ++i; continue; }
        size_t start = i;
        while (i < text.size() && is_ident_char(static_cast<unsigned char>(text[i]))) ++i;
        std::string word(text.substr(start, i - start));
        if (kDefinitionWords.count(word) || kControlWords.count(word) || kTypeWords.count(word)) ++score;
    }
    if (text.find('{') != std::string_view::npos && text.find('}') != std::string_view::npos) ++score;
    if (text.find('(') != std::string_view::npos && text.find(')') != std::string_view::npos) ++score;
    return score;
}

bool brackets_balanced(std::string_view text) {
    std::vector<char> stack;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\') { ++i; continue; }
            // An unclosed ' or " ends with the line (apostrophes in prose and comments).
            if (c == '\n' && quote != '`') { quote = 0; continue; }
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') { quote = c; continue; }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            size_t nl = text.find('\n', i);
            if (nl == std::string_view::npos) break;
            i = nl;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            stack.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            char open = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back() != open) return false;
            stack.pop_back();
        }
    }
    return stack.empty();
}

std::string fnv1a_hex(std::string_view data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

} // namespace code_extraction
