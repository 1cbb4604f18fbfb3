#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "engine_config.hpp"
#include "extraction_errors.hpp"
#include "language_registry.hpp"

namespace code_extraction {

struct FallbackVerdict {
    std::string language;               // profile id, declared label, or "unknown"
    const LanguageProfile* profile = nullptr;
    bool declared = false;
    bool unknown = false;
    double rule_density = 0.0;
    double token_density = 0.0;
    bool balanced = false;
    std::string validation_method;      // "rules:<family>" or "none"
    std::vector<Diagnostic> diagnostics;
};

// Rule-based labelling for regions without a clean parse. Never fails: a region
// nothing matches becomes `unknown`.
class FallbackExtractor {
public:
    explicit FallbackExtractor(const EngineConfig& config,
                               const LanguageRegistry& registry = LanguageRegistry::instance());

    // With `infer` false and no declared label the region is `unknown` outright.
    FallbackVerdict classify(std::string_view text, const std::optional<std::string>& declared_label,
                             bool infer, const std::string& where) const;

    // Best profile by rule density over its fallback ruleset; nullptr below the minimum.
    const LanguageProfile* infer_language(std::string_view text, double* density = nullptr) const;

private:
    const EngineConfig& config_;
    const LanguageRegistry& registry_;
};

} // namespace code_extraction
