#pragma once
#include <tree_sitter/api.h>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace code_extraction {

enum class LanguageFamily { CLike, Scripting, Markup, Data, Config, Log };

const char* to_string(LanguageFamily family);

// One weighted line pattern. `regex` is compiled when the registry is built.
struct HeuristicRule {
    std::string pattern;
    double weight = 1.0;
    bool icase = false;
    std::regex regex;
};

// Ordered rules a region is scored against when no clean parse is available.
struct FallbackRuleset {
    LanguageFamily family = LanguageFamily::CLike;
    std::vector<HeuristicRule> rules;
};

// Grammar adapters. Each profile carries exactly one alternative.
struct NoGrammar {};
struct TreeSitterGrammar {
    const TSLanguage* (*factory)();
};
struct JsonGrammar {};
struct XmlGrammar {};
struct YamlGrammar {};

using GrammarAdapter = std::variant<NoGrammar, TreeSitterGrammar, JsonGrammar, XmlGrammar, YamlGrammar>;

struct LanguageProfile {
    std::string id;
    std::string display_name;
    LanguageFamily family = LanguageFamily::CLike;
    std::vector<std::string> extensions;    // lowercase, with the dot
    std::vector<std::string> filenames;     // exact basenames, e.g. "Makefile"
    std::vector<std::string> shebangs;      // interpreter names after #!
    std::vector<std::string> fence_aliases; // info-string spellings besides the id
    std::vector<HeuristicRule> signatures;
    GrammarAdapter grammar = NoGrammar{};
    FallbackRuleset fallback;

    bool has_grammar() const { return !std::holds_alternative<NoGrammar>(grammar); }
};

struct SignatureScore {
    const LanguageProfile* profile = nullptr;
    double score = 0.0;
};

struct RuleDensity {
    double density = 0.0;    // mean saturated line score over non-blank lines
    size_t matched_lines = 0;
    size_t scored_lines = 0;
};

// Lines longer than this are counted but never run through a regex.
inline constexpr size_t kMaxRuleLineLength = 4096;

RuleDensity match_density(const std::vector<const std::vector<HeuristicRule>*>& rule_sets,
                          std::string_view text, size_t max_lines = 0);

// The closed, process-wide profile table. Validated once and never mutated.
class LanguageRegistry {
public:
    static const LanguageRegistry& instance();

    // Compiles every rule and rejects duplicate ids or keys (throws ConfigError).
    explicit LanguageRegistry(std::vector<LanguageProfile> profiles);

    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;

    // Id or fence alias, case-insensitive.
    const LanguageProfile* find(std::string_view name) const;

    // By basename first, then extension.
    const LanguageProfile* from_path(const std::string& path) const;

    // "#!/usr/bin/env python3" style first line.
    const LanguageProfile* from_shebang(std::string_view text) const;

    // Documents are segmented as mixed content rather than as one source file.
    bool is_document_path(const std::string& path) const;

    double signature_score(const LanguageProfile& profile, std::string_view text) const;

    // Profiles with a positive score, best first; ties keep table order.
    std::vector<SignatureScore> rank_by_signature(std::string_view text, bool grammar_only) const;

    const std::vector<LanguageProfile>& profiles() const { return profiles_; }

private:
    std::vector<LanguageProfile> profiles_;
    std::unordered_map<std::string, size_t> by_name_;
    std::unordered_map<std::string, size_t> by_extension_;
    std::unordered_map<std::string, size_t> by_filename_;
    std::unordered_map<std::string, size_t> by_shebang_;
};

std::vector<LanguageProfile> default_language_profiles();

} // namespace code_extraction
