#include "fallback_extractor.hpp"
#include "extraction_types.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_extraction {

FallbackExtractor::FallbackExtractor(const EngineConfig& config, const LanguageRegistry& registry)
    : config_(config), registry_(registry) {}

const LanguageProfile* FallbackExtractor::infer_language(std::string_view text, double* density) const {
    const LanguageProfile* best = nullptr;
    double best_density = 0.0;
    double best_signature = 0.0;

    for (const auto& profile : registry_.profiles()) {
        double d = match_density({&profile.fallback.rules}, text, config_.max_rule_lines).density;
        if (d < best_density) continue;
        // Family rules are shared, so equal densities are split on the profile's own signatures.
        double sig = match_density({&profile.signatures}, text, config_.max_rule_lines).density;
        if (d > best_density || sig > best_signature) {
            best = &profile;
            best_density = d;
            best_signature = sig;
        }
    }

    if (density) *density = best_density;
    if (!best || best_density < config_.min_fallback_density) return nullptr;
    return best;
}

FallbackVerdict FallbackExtractor::classify(std::string_view text, const std::optional<std::string>& declared_label,
                                            bool infer, const std::string& where) const {
    FallbackVerdict verdict;
    verdict.token_density = std::min(1.0, technical_density(text));
    verdict.balanced = brackets_balanced(text);

    if (declared_label && !trim(*declared_label).empty()) {
        verdict.declared = true;
        if (const auto* profile = registry_.find(*declared_label)) {
            verdict.profile = profile;
            verdict.language = profile->id;
            verdict.rule_density = match_density({&profile->fallback.rules}, text, config_.max_rule_lines).density;
            verdict.validation_method = std::string("rules:") + to_string(profile->family);
            return verdict;
        }

        // Unregistered label: keep it, score against whatever rules fit best.
        verdict.language = to_lower(trim(*declared_label));
        verdict.diagnostics.push_back({DiagnosticKind::UnsupportedLanguage,
                                       where + ": no profile for declared language '" + verdict.language + "'"});
        double density = 0.0;
        const auto* nearest = infer_language(text, &density);
        verdict.rule_density = density;
        verdict.validation_method = nearest ? std::string("rules:") + to_string(nearest->family) : "none";
        return verdict;
    }

    if (infer) {
        double density = 0.0;
        if (const auto* profile = infer_language(text, &density)) {
            verdict.profile = profile;
            verdict.language = profile->id;
            verdict.rule_density = density;
            verdict.validation_method = std::string("rules:") + to_string(profile->family);
            return verdict;
        }
        verdict.rule_density = density;
    }

    verdict.unknown = true;
    verdict.language = kUnknownLanguage;
    verdict.validation_method = "none";
    spdlog::debug("❓ {}: no language inferred, emitting as {}", where, kUnknownLanguage);
    return verdict;
}

} // namespace code_extraction
