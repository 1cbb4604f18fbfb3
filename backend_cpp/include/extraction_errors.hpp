#pragma once
#include <stdexcept>
#include <string>

namespace code_extraction {

// Recovered conditions. They never abort a run; they travel with the result.
enum class DiagnosticKind {
    DecodeWarning,
    ParseFailure,
    ParseTimeout,
    UnsupportedLanguage,
    MalformedContainerWarning,
    CoverageWarning
};

struct Diagnostic {
    DiagnosticKind kind;
    std::string message;
};

const char* to_string(DiagnosticKind kind);

// Base for the conditions that do abort: nothing readable, batch deadline, bad config.
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {}
};

class DecodeFailure : public ExtractionError {
public:
    explicit DecodeFailure(const std::string& what) : ExtractionError(what) {}
};

class RunCancelled : public ExtractionError {
public:
    RunCancelled(const std::string& what, bool timed_out)
        : ExtractionError(what), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

class ConfigError : public ExtractionError {
public:
    explicit ConfigError(const std::string& what) : ExtractionError(what) {}
};

} // namespace code_extraction
