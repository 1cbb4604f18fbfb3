#pragma once
#include <tree_sitter/api.h>
#include <string>
#include <string_view>
#include <vector>
#include "engine_config.hpp"
#include "extraction_errors.hpp"
#include "language_registry.hpp"

namespace code_extraction {

struct ParseAttempt {
    bool clean = false;
    bool timed_out = false;
    size_t node_count = 0;
    size_t depth = 0;
    std::string detail;
};

struct AstVerdict {
    bool accepted = false;
    const LanguageProfile* profile = nullptr;
    size_t node_count = 0;
    std::string validation_method;   // "tree-sitter:python", "json", "xml", "yaml"
    std::vector<Diagnostic> diagnostics;
};

// Syntax gate for one region. Only a clean parse is accepted; everything else is
// reported and left to the fallback path. Owns one tree-sitter parser, so an
// instance must not be shared between threads.
class AstValidator {
public:
    explicit AstValidator(const EngineConfig& config,
                          const LanguageRegistry& registry = LanguageRegistry::instance());
    ~AstValidator();

    AstValidator(const AstValidator&) = delete;
    AstValidator& operator=(const AstValidator&) = delete;

    // `declared` is the resolved profile of a declared language, or nullptr to guess.
    AstVerdict validate(std::string_view text, const LanguageProfile* declared, bool unterminated,
                        const std::string& where);

    // One grammar, no gating.
    ParseAttempt try_parse(const LanguageProfile& profile, std::string_view text);

    static std::string method_name(const LanguageProfile& profile);

private:
    ParseAttempt parse_tree_sitter(const TSLanguage* language, std::string_view text);
    ParseAttempt parse_json(std::string_view text) const;
    ParseAttempt parse_xml(std::string_view text) const;
    ParseAttempt parse_yaml(std::string_view text) const;

    const EngineConfig& config_;
    const LanguageRegistry& registry_;
    TSParser* parser_;
};

// Deepest ()[]{} nesting, ignoring quoted strings.
size_t bracket_depth(std::string_view text);

} // namespace code_extraction
