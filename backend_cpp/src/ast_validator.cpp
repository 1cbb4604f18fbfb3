#include "ast_validator.hpp"
#include <algorithm>
#include <stack>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include <tinyxml2.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace code_extraction {

using json = nlohmann::json;

namespace {

// Counts values and tracks depth; aborts the parse past `max_depth`.
struct JsonShapeCounter {
    size_t max_depth;
    size_t depth = 0;
    size_t deepest = 0;
    size_t nodes = 0;
    bool container_root = false;
    bool too_deep = false;
    std::string error;

    bool value() {
        if (nodes == 0) return reject_scalar_root();
        ++nodes;
        return true;
    }
    bool reject_scalar_root() {
        error = "top-level value is not an object or array";
        return false;
    }
    bool open() {
        if (nodes == 0) container_root = true;
        ++nodes;
        ++depth;
        deepest = std::max(deepest, depth);
        if (depth > max_depth) {
            too_deep = true;
            return false;
        }
        return true;
    }

    bool null() { return value(); }
    bool boolean(bool) { return value(); }
    bool number_integer(json::number_integer_t) { return value(); }
    bool number_unsigned(json::number_unsigned_t) { return value(); }
    bool number_float(json::number_float_t, const json::string_t&) { return value(); }
    bool string(json::string_t&) { return value(); }
    bool binary(json::binary_t&) { return value(); }
    bool start_object(std::size_t) { return open(); }
    bool key(json::string_t&) { return true; }
    bool end_object() { --depth; return true; }
    bool start_array(std::size_t) { return open(); }
    bool end_array() { --depth; return true; }
    bool parse_error(std::size_t position, const std::string&, const json::exception& ex) {
        error = "byte " + std::to_string(position) + ": " + ex.what();
        return false;
    }
};

} // namespace

size_t bracket_depth(std::string_view text) {
    size_t depth = 0;
    size_t deepest = 0;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\') { ++i; continue; }
            if (c == quote || c == '\n') quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') { quote = c; continue; }
        if (c == '(' || c == '[' || c == '{') deepest = std::max(deepest, ++depth);
        else if ((c == ')' || c == ']' || c == '}') && depth > 0) --depth;
    }
    return deepest;
}

AstValidator::AstValidator(const EngineConfig& config, const LanguageRegistry& registry)
    : config_(config), registry_(registry), parser_(ts_parser_new()) {
    ts_parser_set_timeout_micros(parser_, static_cast<uint64_t>(config_.region_timeout_ms) * 1000);
}

AstValidator::~AstValidator() {
    if (parser_) ts_parser_delete(parser_);
}

std::string AstValidator::method_name(const LanguageProfile& profile) {
    if (std::holds_alternative<TreeSitterGrammar>(profile.grammar)) return "tree-sitter:" + profile.id;
    if (std::holds_alternative<JsonGrammar>(profile.grammar)) return "json";
    if (std::holds_alternative<XmlGrammar>(profile.grammar)) return "xml";
    if (std::holds_alternative<YamlGrammar>(profile.grammar)) return "yaml";
    return "none";
}

ParseAttempt AstValidator::parse_tree_sitter(const TSLanguage* language, std::string_view text) {
    ParseAttempt attempt;
    if (!ts_parser_set_language(parser_, language)) {
        attempt.detail = "grammar ABI is incompatible with the tree-sitter runtime";
        return attempt;
    }

    TSTree* tree = ts_parser_parse_string(parser_, nullptr, text.data(), static_cast<uint32_t>(text.size()));
    if (!tree) {
        // A NULL tree means the timeout fired; the parser must be reset before reuse.
        ts_parser_reset(parser_);
        attempt.timed_out = true;
        attempt.detail = "parser timed out after " + std::to_string(config_.region_timeout_ms) + " ms";
        return attempt;
    }

    TSNode root = ts_tree_root_node(tree);
    bool has_error = ts_node_has_error(root);

    // Non-recursive walk: named-node count and depth.
    std::stack<std::pair<TSNode, size_t>> stack;
    stack.push({root, 1});
    while (!stack.empty()) {
        auto [node, depth] = stack.top();
        stack.pop();
        if (ts_node_is_named(node)) ++attempt.node_count;
        attempt.depth = std::max(attempt.depth, depth);

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) stack.push({ts_node_child(node, i), depth + 1});
    }
    ts_tree_delete(tree);

    if (has_error) {
        attempt.detail = "syntax tree contains ERROR or MISSING nodes";
    } else if (attempt.depth > config_.max_nesting_depth) {
        attempt.detail = "syntax tree depth " + std::to_string(attempt.depth) + " exceeds limit";
    } else {
        attempt.clean = true;
    }
    return attempt;
}

ParseAttempt AstValidator::parse_json(std::string_view text) const {
    ParseAttempt attempt;
    JsonShapeCounter counter{config_.max_nesting_depth};
    bool ok = json::sax_parse(text.begin(), text.end(), &counter);

    attempt.node_count = counter.nodes;
    attempt.depth = counter.deepest;
    if (counter.too_deep) {
        attempt.detail = "JSON nesting exceeds limit";
    } else if (!ok || !counter.container_root) {
        attempt.detail = counter.error.empty() ? "not a JSON document" : counter.error;
    } else {
        attempt.clean = true;
    }
    return attempt;
}

ParseAttempt AstValidator::parse_xml(std::string_view text) const {
    ParseAttempt attempt;
    tinyxml2::XMLDocument doc;
    if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
        attempt.detail = std::string("XML: ") + doc.ErrorStr();
        return attempt;
    }
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root) {
        attempt.detail = "XML document has no root element";
        return attempt;
    }

    std::stack<std::pair<const tinyxml2::XMLElement*, size_t>> stack;
    stack.push({root, 1});
    while (!stack.empty()) {
        auto [el, depth] = stack.top();
        stack.pop();
        ++attempt.node_count;
        attempt.depth = std::max(attempt.depth, depth);
        for (auto child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            stack.push({child, depth + 1});
        }
    }

    if (attempt.depth > config_.max_nesting_depth) {
        attempt.detail = "XML nesting exceeds limit";
    } else {
        attempt.clean = true;
    }
    return attempt;
}

ParseAttempt AstValidator::parse_yaml(std::string_view text) const {
    ParseAttempt attempt;
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(std::string(text));
    } catch (const YAML::Exception& e) {
        attempt.detail = std::string("YAML: ") + e.what();
        return attempt;
    }
    if (documents.empty()) {
        attempt.detail = "no YAML document";
        return attempt;
    }

    // Any line of prose is a valid YAML scalar, so only mappings and sequences count.
    std::stack<std::pair<YAML::Node, size_t>> stack;
    for (const auto& doc : documents) {
        if (!doc.IsMap() && !doc.IsSequence()) {
            attempt.detail = "top-level YAML value is not a mapping or sequence";
            return attempt;
        }
        stack.push({doc, 1});
    }

    while (!stack.empty()) {
        auto [node, depth] = stack.top();
        stack.pop();
        ++attempt.node_count;
        attempt.depth = std::max(attempt.depth, depth);
        // Aliases share nodes; a walk that outgrows the text is expanding them.
        if (attempt.node_count > text.size()) {
            attempt.detail = "YAML aliases expand past the region size";
            return attempt;
        }
        if (node.IsMap()) {
            for (const auto& entry : node) stack.push({entry.second, depth + 1});
        } else if (node.IsSequence()) {
            for (const auto& item : node) stack.push({YAML::Node(item), depth + 1});
        }
    }

    if (attempt.depth > config_.max_nesting_depth) {
        attempt.detail = "YAML nesting exceeds limit";
    } else {
        attempt.clean = true;
    }
    return attempt;
}

ParseAttempt AstValidator::try_parse(const LanguageProfile& profile, std::string_view text) {
    if (auto ts = std::get_if<TreeSitterGrammar>(&profile.grammar)) return parse_tree_sitter(ts->factory(), text);
    if (std::holds_alternative<JsonGrammar>(profile.grammar)) return parse_json(text);
    if (std::holds_alternative<XmlGrammar>(profile.grammar)) return parse_xml(text);
    if (std::holds_alternative<YamlGrammar>(profile.grammar)) return parse_yaml(text);

    ParseAttempt none;
    none.detail = "no grammar for " + profile.id;
    return none;
}

AstVerdict AstValidator::validate(std::string_view text, const LanguageProfile* declared, bool unterminated,
                                  const std::string& where) {
    AstVerdict verdict;

    if (unterminated) {
        verdict.diagnostics.push_back({DiagnosticKind::ParseFailure,
                                       where + ": unterminated fence, syntax validation skipped"});
        return verdict;
    }
    if (text.size() > config_.max_ast_region_bytes) {
        verdict.diagnostics.push_back({DiagnosticKind::ParseFailure,
                                       where + ": " + std::to_string(text.size()) +
                                       " bytes exceeds the syntax validation limit"});
        return verdict;
    }
    if (bracket_depth(text) > config_.max_nesting_depth) {
        verdict.diagnostics.push_back({DiagnosticKind::ParseFailure,
                                       where + ": bracket nesting exceeds the syntax validation limit"});
        return verdict;
    }

    std::vector<const LanguageProfile*> candidates;
    if (declared) {
        if (!declared->has_grammar()) return verdict; // fallback-only language
        candidates.push_back(declared);
    } else {
        for (const auto& ranked : registry_.rank_by_signature(text, true)) {
            if (candidates.size() >= config_.guess_top_k) break;
            candidates.push_back(ranked.profile);
        }
    }
    if (candidates.empty()) return verdict;

    std::string failures;
    for (const auto* profile : candidates) {
        ParseAttempt attempt = try_parse(*profile, text);
        if (attempt.clean) {
            verdict.accepted = true;
            verdict.profile = profile;
            verdict.node_count = attempt.node_count;
            verdict.validation_method = method_name(*profile);
            spdlog::debug("🛡️  {} parsed clean as {} ({} nodes)", where, profile->id, attempt.node_count);
            return verdict;
        }
        if (attempt.timed_out) {
            verdict.diagnostics.push_back({DiagnosticKind::ParseTimeout, where + ": " + profile->id + " " + attempt.detail});
            spdlog::warn("⏱️  {}: {} parse timed out", where, profile->id);
        } else {
            if (!failures.empty()) failures += "; ";
            failures += profile->id + " (" + attempt.detail + ")";
        }
    }

    if (!failures.empty()) {
        verdict.diagnostics.push_back({DiagnosticKind::ParseFailure, where + ": no clean parse: " + failures});
    }
    return verdict;
}

} // namespace code_extraction
